/**
 * @file elastic_scattering.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-16
 *
 *
 */

#include "elastic_scattering.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <type_traits>

namespace elrates::scattering {

std::string_view mechanism_name(ElasticMechanismType type) noexcept {
    switch (type) {
        case ElasticMechanismType::acoustic_deformation_potential:
            return AcousticDeformationPotentialScattering::name;
        case ElasticMechanismType::ionized_impurity:
            return IonizedImpurityScattering::name;
        case ElasticMechanismType::piezoelectric:
            return PiezoelectricScattering::name;
    }
    return "invalid";
}

ElasticMechanismType mechanism_type_from_name(std::string_view name) {
    for (ElasticMechanismType type : all_mechanism_types()) {
        if (mechanism_name(type) == name) {
            return type;
        }
    }
    throw std::invalid_argument(fmt::format("Unknown elastic scattering mechanism: {}", name));
}

const std::vector<ElasticMechanismType>& all_mechanism_types() {
    static const std::vector<ElasticMechanismType> types = {ElasticMechanismType::acoustic_deformation_potential,
                                                            ElasticMechanismType::ionized_impurity,
                                                            ElasticMechanismType::piezoelectric};
    return types;
}

template <typename Range>
static std::vector<std::string> to_strings(const Range& names) {
    std::vector<std::string> result;
    for (const auto& name : names) {
        result.emplace_back(name);
    }
    return result;
}

std::vector<std::string> required_properties(ElasticMechanismType type) {
    switch (type) {
        case ElasticMechanismType::acoustic_deformation_potential:
            return to_strings(AcousticDeformationPotentialScattering::required_properties);
        case ElasticMechanismType::ionized_impurity:
            return to_strings(IonizedImpurityScattering::required_properties);
        case ElasticMechanismType::piezoelectric:
            return to_strings(PiezoelectricScattering::required_properties);
    }
    throw std::invalid_argument("required_properties: invalid mechanism type");
}

std::vector<ElasticMechanismType> available_mechanisms(const MaterialProperties& properties) {
    std::vector<ElasticMechanismType> list_available;
    for (ElasticMechanismType type : all_mechanism_types()) {
        bool all_present = true;
        for (const auto& property : required_properties(type)) {
            all_present = all_present && properties.contains(property);
        }
        if (all_present) {
            list_available.push_back(type);
        }
    }
    return list_available;
}

ElasticScattering make_elastic_scattering(ElasticMechanismType      type,
                                          const MaterialProperties& materials_properties,
                                          const TransportState&     state,
                                          ScatteringReporter&       reporter) {
    switch (type) {
        case ElasticMechanismType::acoustic_deformation_potential:
            return AcousticDeformationPotentialScattering(materials_properties, state, reporter);
        case ElasticMechanismType::ionized_impurity:
            return IonizedImpurityScattering(materials_properties, state, reporter);
        case ElasticMechanismType::piezoelectric:
            return PiezoelectricScattering(materials_properties, state, reporter);
    }
    throw std::invalid_argument("make_elastic_scattering: invalid mechanism type");
}

std::vector<ElasticScattering> make_available_elastic_scatterings(const MaterialProperties& materials_properties,
                                                                  const TransportState&     state,
                                                                  ScatteringReporter&       reporter) {
    std::vector<ElasticScattering> list_mechanisms;
    for (ElasticMechanismType type : available_mechanisms(materials_properties)) {
        reporter.info(fmt::format("Enabling {} scattering", mechanism_name(type)));
        list_mechanisms.push_back(make_elastic_scattering(type, materials_properties, state, reporter));
    }
    if (list_mechanisms.empty()) {
        reporter.warning("No elastic scattering mechanism can be built from the given material properties.");
    }
    return list_mechanisms;
}

std::string_view mechanism_name(const ElasticScattering& mechanism) {
    return std::visit([](const auto& m) -> std::string_view { return std::decay_t<decltype(m)>::name; }, mechanism);
}

ElasticMechanismType mechanism_type(const ElasticScattering& mechanism) {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::type; }, mechanism);
}

DopingTemperatureArray prefactor(const ElasticScattering& mechanism, Spin spin, std::size_t idx_band) {
    return std::visit([&](const auto& m) { return m.prefactor(spin, idx_band); }, mechanism);
}

FormFactor factor(const ElasticScattering& mechanism, const Eigen::ArrayXd& norm_q_sq) {
    return std::visit([&](const auto& m) { return m.factor(norm_q_sq); }, mechanism);
}

FormFactor compute_rate_contribution(const ElasticScattering& mechanism, Spin spin, std::size_t idx_band, const Eigen::ArrayXd& norm_q_sq) {
    FormFactor contribution = factor(mechanism, norm_q_sq);
    contribution.scale(prefactor(mechanism, spin, idx_band));
    return contribution;
}

}  // namespace elrates::scattering
