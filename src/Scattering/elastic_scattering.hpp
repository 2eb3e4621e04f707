/**
 * @file elastic_scattering.hpp
 * @brief Closed set of elastic scattering mechanisms and the operations dispatched on them.
 * @version 0.1
 * @date 2026-10-16
 *
 * The rate assembler enables the mechanisms for which the material properties are available, then for every
 * (spin, band) combines prefactor(spin, band)[n, t] * factor(q^2)[n, t, k] into a rate contribution.
 *
 */

#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "acoustic_deformation_potential.hpp"
#include "ionized_impurity.hpp"
#include "piezoelectric.hpp"

namespace elrates::scattering {

using ElasticScattering = std::variant<AcousticDeformationPotentialScattering, IonizedImpurityScattering, PiezoelectricScattering>;

std::string_view     mechanism_name(ElasticMechanismType type) noexcept;
ElasticMechanismType mechanism_type_from_name(std::string_view name);

const std::vector<ElasticMechanismType>& all_mechanism_types();

/**
 * @brief Names of the material properties a mechanism needs.
 *
 */
std::vector<std::string> required_properties(ElasticMechanismType type);

/**
 * @brief Mechanisms whose required properties are all present, in ADP, IMP, PIE order.
 *
 */
std::vector<ElasticMechanismType> available_mechanisms(const MaterialProperties& properties);

ElasticScattering make_elastic_scattering(ElasticMechanismType      type,
                                          const MaterialProperties& materials_properties,
                                          const TransportState&     state,
                                          ScatteringReporter&       reporter);

/**
 * @brief Build every mechanism allowed by the material properties.
 *
 */
std::vector<ElasticScattering> make_available_elastic_scatterings(const MaterialProperties& materials_properties,
                                                                  const TransportState&     state,
                                                                  ScatteringReporter&       reporter);

std::string_view       mechanism_name(const ElasticScattering& mechanism);
ElasticMechanismType   mechanism_type(const ElasticScattering& mechanism);
DopingTemperatureArray prefactor(const ElasticScattering& mechanism, Spin spin, std::size_t idx_band);
FormFactor             factor(const ElasticScattering& mechanism, const Eigen::ArrayXd& norm_q_sq);

/**
 * @brief prefactor(spin, band)[n, t] * factor(q^2)[n, t, k].
 *
 */
FormFactor compute_rate_contribution(const ElasticScattering& mechanism, Spin spin, std::size_t idx_band, const Eigen::ArrayXd& norm_q_sq);

}  // namespace elrates::scattering
