/**
 * @file test_screening.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-17
 *
 *
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>

#include "integrals.hpp"
#include "physical_constants.hpp"
#include "physical_functions.hpp"
#include "scattering_errors.hpp"
#include "scattering_test_helpers.hpp"
#include "screening.hpp"

using namespace elrates::scattering;
using namespace elrates::scattering::test;

TEST_SUITE("[Screening] Fermi-Dirac helpers") {
    TEST_CASE("occupation limits and symmetry") {
        const double kT = 0.001;
        CHECK_EQ(elrates::physics::fermi_dirac_occupation(0.0, 0.0, kT), doctest::Approx(0.5));
        CHECK_EQ(elrates::physics::fermi_dirac_occupation(1.0, 0.0, kT), 0.0);
        CHECK_EQ(elrates::physics::fermi_dirac_occupation(-1.0, 0.0, kT), 1.0);
        const double f_plus  = elrates::physics::fermi_dirac_occupation(0.002, 0.0, kT);
        const double f_minus = elrates::physics::fermi_dirac_occupation(-0.002, 0.0, kT);
        CHECK_EQ(f_plus + f_minus, doctest::Approx(1.0));
        CHECK_EQ(elrates::physics::fermi_dirac_window(0.0, 0.0, kT), doctest::Approx(0.25));
    }

    TEST_CASE("trapezoidal rule is exact for a linear function") {
        const Eigen::ArrayXd x = elrates::numerical::linspace(0.0, 2.0, 11);
        const Eigen::ArrayXd y = 3.0 * x + 1.0;
        CHECK_EQ(elrates::integrate::trapz(x, y), doctest::Approx(8.0));
    }
}

TEST_SUITE("[Screening] inverse screening length") {
    TEST_CASE("flat DOS gives 4 pi D / (eps V) for every pair") {
        // integral f (1 - f) dE = kT over a window much wider than kT.
        const TransportState   state             = make_semiconductor_state();
        const double           static_dielectric = 12.0;
        const DopingTemperatureArray beta_sq      = calculate_inverse_screening_length_sq(state, static_dielectric);

        REQUIRE_EQ(beta_sq.rows(), 2);
        REQUIRE_EQ(beta_sq.cols(), 3);
        const double expected = 4.0 * elrates::constants::pi * test_dos_value / (static_dielectric * state.structure.volume());
        for (Eigen::Index n = 0; n < beta_sq.rows(); ++n) {
            for (Eigen::Index t = 0; t < beta_sq.cols(); ++t) {
                CHECK(beta_sq(n, t) >= 0.0);
                CHECK_EQ(beta_sq(n, t), doctest::Approx(expected).epsilon(1e-6));
            }
        }
    }

    TEST_CASE("scales as the inverse of the static dielectric constant") {
        const TransportState         state   = make_semiconductor_state();
        const DopingTemperatureArray beta_1  = calculate_inverse_screening_length_sq(state, 5.0);
        const DopingTemperatureArray beta_2  = calculate_inverse_screening_length_sq(state, 10.0);
        CHECK_EQ(beta_1(1, 2) / beta_2(1, 2), doctest::Approx(2.0));
    }

    TEST_CASE("Fermi level far from the DOS window gives no screening") {
        TransportState state = make_semiconductor_state();
        state.fermi_levels.setConstant(1.0);
        const DopingTemperatureArray beta_sq = calculate_inverse_screening_length_sq(state, 10.0);
        CHECK_EQ(beta_sq(0, 0), doctest::Approx(0.0));
    }

    TEST_CASE("zero temperature is not guarded") {
        TransportState state = make_semiconductor_state();
        state.temperatures(0)                = 0.0;
        const DopingTemperatureArray beta_sq = calculate_inverse_screening_length_sq(state, 10.0);
        CHECK(std::isnan(beta_sq(0, 0)));
        CHECK(std::isfinite(beta_sq(0, 1)));
    }

    TEST_CASE("temperature axis mismatch") {
        TransportState state = make_semiconductor_state();
        state.temperatures   = Eigen::ArrayXd::Constant(2, 300.0);
        CHECK_THROWS_AS(calculate_inverse_screening_length_sq(state, 10.0), ShapeMismatchError);
    }

    TEST_CASE("doping axis mismatch") {
        TransportState state = make_semiconductor_state();
        state.doping         = Eigen::ArrayXd::Constant(3, 1e-8);
        CHECK_THROWS_AS(calculate_inverse_screening_length_sq(state, 10.0), ShapeMismatchError);
    }
}
