/**
 * @file test_elastic_scattering.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-17
 *
 *
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <array>
#include <string>

#include "elastic_scattering.hpp"
#include "scattering_errors.hpp"
#include "scattering_test_helpers.hpp"

using namespace elrates::scattering;
using namespace elrates::scattering::test;

TEST_SUITE("[ElasticScattering] selection") {
    TEST_CASE("names round trip") {
        for (ElasticMechanismType type : all_mechanism_types()) {
            CHECK(mechanism_type_from_name(mechanism_name(type)) == type);
        }
        CHECK(mechanism_name(ElasticMechanismType::acoustic_deformation_potential) == "ADP");
        CHECK(mechanism_name(ElasticMechanismType::ionized_impurity) == "IMP");
        CHECK(mechanism_name(ElasticMechanismType::piezoelectric) == "PIE");
        CHECK_THROWS_AS(mechanism_type_from_name("POP"), std::invalid_argument);
    }

    TEST_CASE("available mechanisms follow the material properties") {
        MaterialProperties properties;
        CHECK(available_mechanisms(properties).empty());

        properties.set("deformation_potential", 2.0);
        properties.set("elastic_constant", 150.0);
        auto types = available_mechanisms(properties);
        REQUIRE_EQ(types.size(), std::size_t{1});
        CHECK(types[0] == ElasticMechanismType::acoustic_deformation_potential);

        properties.set("static_dielectric", 10.0);
        properties.set("piezoelectric_coefficient", 0.1);
        types = available_mechanisms(properties);
        REQUIRE_EQ(types.size(), std::size_t{2});
        CHECK(types[1] == ElasticMechanismType::piezoelectric);

        CHECK_EQ(available_mechanisms(make_full_properties()).size(), std::size_t{3});
    }

    TEST_CASE("building every available mechanism") {
        const TransportState state = make_semiconductor_state();
        RecordingReporter    reporter;
        const auto           list_mechanisms = make_available_elastic_scatterings(make_full_properties(), state, reporter);
        REQUIRE_EQ(list_mechanisms.size(), std::size_t{3});
        CHECK(mechanism_name(list_mechanisms[0]) == "ADP");
        CHECK(mechanism_name(list_mechanisms[1]) == "IMP");
        CHECK(mechanism_name(list_mechanisms[2]) == "PIE");
        CHECK(mechanism_type(list_mechanisms[1]) == ElasticMechanismType::ionized_impurity);
        CHECK_EQ(reporter.count(LogLevel::info), std::size_t{3});
    }

    TEST_CASE("mechanisms keep the axes of the transport state") {
        const TransportState            state = make_semiconductor_state();
        NullReporter                    reporter;
        const IonizedImpurityScattering imp(make_full_properties(), state, reporter);
        CHECK((imp.get_doping() == state.doping).all());
        CHECK((imp.get_temperatures() == state.temperatures).all());
        CHECK(imp.get_spins() == state.spins);
        CHECK_EQ(imp.get_nb_dopings(), std::size_t{2});
        CHECK_EQ(imp.get_nb_temperatures(), std::size_t{3});
        CHECK_EQ(imp.get_nb_bands(Spin::up), std::size_t{4});
        CHECK_EQ(imp.get_properties().size(), std::size_t{3});
    }

    TEST_CASE("missing property is fatal for an explicitly requested mechanism") {
        const TransportState state = make_semiconductor_state();
        MaterialProperties   properties;
        properties.set("static_dielectric", 10.0);
        NullReporter reporter;
        CHECK_THROWS_AS(make_elastic_scattering(ElasticMechanismType::ionized_impurity, properties, state, reporter), MissingPropertyError);
    }
}

TEST_SUITE("[ElasticScattering] dispatch") {
    TEST_CASE("factor shape is (ndoping, ntemperature, nk) for every mechanism") {
        const TransportState state = make_semiconductor_state();
        NullReporter         reporter;
        Eigen::ArrayXd       q_sq(5);
        q_sq << 0.01, 0.02, 0.1, 0.5, 1.0;
        const std::array<std::size_t, 3> expected_shape = {2, 3, 5};

        for (ElasticMechanismType type : all_mechanism_types()) {
            const ElasticScattering mechanism = make_elastic_scattering(type, make_full_properties(), state, reporter);
            CHECK(factor(mechanism, q_sq).shape() == expected_shape);
            const DopingTemperatureArray pref = prefactor(mechanism, Spin::up, 2);
            CHECK_EQ(pref.rows(), 2);
            CHECK_EQ(pref.cols(), 3);
        }
    }

    TEST_CASE("rate contribution is prefactor times factor") {
        const TransportState    state = make_semiconductor_state();
        NullReporter            reporter;
        const ElasticScattering mechanism =
            make_elastic_scattering(ElasticMechanismType::ionized_impurity, make_full_properties(), state, reporter);
        Eigen::ArrayXd q_sq(2);
        q_sq << 0.05, 0.3;

        const FormFactor             contribution = compute_rate_contribution(mechanism, Spin::up, 1, q_sq);
        const FormFactor             form_factor  = factor(mechanism, q_sq);
        const DopingTemperatureArray pref         = prefactor(mechanism, Spin::up, 1);
        for (std::size_t n = 0; n < 2; ++n) {
            for (std::size_t t = 0; t < 3; ++t) {
                for (std::size_t k = 0; k < 2; ++k) {
                    const double expected = pref(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(t)) * form_factor(n, t, k);
                    CHECK_EQ(contribution(n, t, k), doctest::Approx(expected));
                }
            }
        }
    }

    TEST_CASE("ADP contribution equals its prefactor") {
        const TransportState    state = make_semiconductor_state();
        NullReporter            reporter;
        const ElasticScattering mechanism =
            make_elastic_scattering(ElasticMechanismType::acoustic_deformation_potential, make_full_properties(), state, reporter);
        Eigen::ArrayXd q_sq = Eigen::ArrayXd::Constant(3, 0.2);

        const FormFactor             contribution = compute_rate_contribution(mechanism, Spin::up, 3, q_sq);
        const DopingTemperatureArray pref         = prefactor(mechanism, Spin::up, 3);
        CHECK_EQ(contribution(1, 2, 0), doctest::Approx(pref(1, 2)));
        CHECK_EQ(contribution(0, 1, 2), doctest::Approx(pref(0, 1)));
    }

    TEST_CASE("invalid band index propagates through dispatch") {
        const TransportState    state = make_semiconductor_state();
        NullReporter            reporter;
        const ElasticScattering mechanism =
            make_elastic_scattering(ElasticMechanismType::piezoelectric, make_full_properties(), state, reporter);
        CHECK_THROWS_AS(prefactor(mechanism, Spin::up, 10), ShapeMismatchError);
    }
}

TEST_SUITE("[FormFactor] container") {
    TEST_CASE("scale checks the prefactor shape") {
        FormFactor form_factor(2, 3, 4, 2.0);
        CHECK_EQ(form_factor.nb_dopings(), std::size_t{2});
        CHECK_EQ(form_factor.nb_temperatures(), std::size_t{3});
        CHECK_EQ(form_factor.nb_points(), std::size_t{4});

        DopingTemperatureArray prefactor(2, 3);
        prefactor << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;
        form_factor.scale(prefactor);
        CHECK_EQ(form_factor(0, 0, 0), doctest::Approx(2.0));
        CHECK_EQ(form_factor(1, 2, 3), doctest::Approx(12.0));
        CHECK_EQ(form_factor(1, 0, 1), doctest::Approx(8.0));

        CHECK_THROWS_AS(form_factor.scale(DopingTemperatureArray::Ones(3, 2)), ShapeMismatchError);
    }
}
