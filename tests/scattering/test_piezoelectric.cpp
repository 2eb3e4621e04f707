/**
 * @file test_piezoelectric.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-17
 *
 *
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <array>
#include <cmath>

#include "physical_constants.hpp"
#include "piezoelectric.hpp"
#include "scattering_errors.hpp"
#include "scattering_test_helpers.hpp"

using namespace elrates::scattering;
using namespace elrates::scattering::test;
using namespace elrates::constants;

TEST_SUITE("[PIE] prefactor") {
    TEST_CASE("closed form per Kelvin") {
        const TransportState          state = make_semiconductor_state();
        NullReporter                  reporter;
        const PiezoelectricScattering pie(make_full_properties(), state, reporter);

        const double expected = (1e9 / q_e) * q_e * q_e * k_b_eV * 0.16 * 0.16 / (4.0 * pi * pi * h_bar_eV * eps_0 * 12.18);
        CHECK_EQ(pie.get_base_prefactor(), doctest::Approx(expected));
    }

    TEST_CASE("linear in temperature, constant over dopings and bands") {
        const TransportState          state = make_semiconductor_state();
        NullReporter                  reporter;
        const PiezoelectricScattering pie(make_full_properties(), state, reporter);

        const DopingTemperatureArray prefactor = pie.prefactor(Spin::up, 2);
        REQUIRE_EQ(prefactor.rows(), 2);
        REQUIRE_EQ(prefactor.cols(), 3);
        for (Eigen::Index n = 0; n < 2; ++n) {
            CHECK_EQ(prefactor(n, 2) / prefactor(n, 0), doctest::Approx(state.temperatures(2) / state.temperatures(0)));
            CHECK_EQ(prefactor(n, 1) / prefactor(n, 0), doctest::Approx(state.temperatures(1) / state.temperatures(0)));
            CHECK_EQ(prefactor(n, 1), doctest::Approx(prefactor(0, 1)));
        }
        CHECK((pie.prefactor(Spin::up, 0) == prefactor).all());
    }

    TEST_CASE("zero dielectric constant is not guarded") {
        const TransportState state      = make_semiconductor_state();
        MaterialProperties   properties = make_full_properties();
        properties.set("static_dielectric", 0.0);
        NullReporter                  reporter;
        const PiezoelectricScattering pie(properties, state, reporter);

        CHECK(std::isinf(pie.get_base_prefactor()));
        CHECK(std::isinf(pie.prefactor(Spin::up, 0)(0, 0)));
    }

    TEST_CASE("missing piezoelectric coefficient") {
        const TransportState state = make_semiconductor_state();
        MaterialProperties   properties;
        properties.set("static_dielectric", 10.0);
        NullReporter reporter;
        CHECK_THROWS_AS(PiezoelectricScattering(properties, state, reporter), MissingPropertyError);
    }
}

TEST_SUITE("[PIE] form factor") {
    TEST_CASE("inverse of the momentum transfer tiled over doping and temperature") {
        const TransportState          state = make_semiconductor_state();
        NullReporter                  reporter;
        const PiezoelectricScattering pie(make_full_properties(), state, reporter);

        Eigen::ArrayXd k_diff_sq(3);
        k_diff_sq << 0.5, 2.0, 4.0;
        const FormFactor form_factor = pie.factor(k_diff_sq);
        const std::array<std::size_t, 3> expected_shape = {2, 3, 3};
        CHECK(form_factor.shape() == expected_shape);
        CHECK_EQ(form_factor(0, 0, 0), doctest::Approx(2.0));
        CHECK_EQ(form_factor(1, 2, 1), doctest::Approx(0.5));
        CHECK_EQ(form_factor(1, 0, 2), doctest::Approx(0.25));
    }

    TEST_CASE("zero momentum transfer diverges") {
        const TransportState          state = make_semiconductor_state();
        NullReporter                  reporter;
        const PiezoelectricScattering pie(make_full_properties(), state, reporter);

        Eigen::ArrayXd k_diff_sq(2);
        k_diff_sq << 0.0, 1.0;
        const FormFactor form_factor = pie.factor(k_diff_sq);
        CHECK(std::isinf(form_factor(0, 0, 0)));
        CHECK_EQ(form_factor(0, 0, 1), doctest::Approx(1.0));
    }
}
