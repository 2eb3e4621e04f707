/**
 * @file acoustic_deformation_potential.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#include "acoustic_deformation_potential.hpp"

#include <fmt/format.h>

#include "physical_constants.hpp"
#include "scattering_errors.hpp"

namespace elrates::scattering {

AcousticDeformationPotentialConfig AcousticDeformationPotentialConfig::from_properties(const MaterialProperties& properties) {
    AcousticDeformationPotentialConfig config;
    config.deformation_potential_eV = properties.at("deformation_potential");
    config.elastic_constant_GPa     = properties.get_scalar("elastic_constant");
    return config;
}

AcousticDeformationPotentialScattering::AcousticDeformationPotentialScattering(const MaterialProperties& materials_properties,
                                                                               const TransportState&     state,
                                                                               ScatteringReporter&       reporter)
    : ElasticScatteringBase(materials_properties, required_properties, state),
      m_is_metal(state.is_metal),
      m_vb_idx(state.vb_idx) {
    using namespace elrates::constants;
    const auto config = AcousticDeformationPotentialConfig::from_properties(m_properties);

    m_prefactor = k_b_Hartree * second_to_au / (4.0 * pi * pi * config.elastic_constant_GPa * GPa_to_au);

    const PropertyPair* pair = std::get_if<PropertyPair>(&config.deformation_potential_eV);
    if (m_is_metal && pair != nullptr) {
        reporter.warning(
            "System is metallic but deformation potentials for both the valence and conduction bands have been set... "
            "using the valence band potential for all bands");
        m_deformation_potential = {pair->first * eV_to_Hartree, pair->first * eV_to_Hartree};
    } else if (m_is_metal) {
        const double value      = std::get<double>(config.deformation_potential_eV) * eV_to_Hartree;
        m_deformation_potential = {value, value};
    } else if (pair == nullptr) {
        reporter.warning(
            "System is semiconducting but only one deformation potential has been set... using this potential for all bands.");
        const double value      = std::get<double>(config.deformation_potential_eV) * eV_to_Hartree;
        m_deformation_potential = {value, value};
    } else {
        m_deformation_potential = {pair->first * eV_to_Hartree, pair->second * eV_to_Hartree};
    }
}

DopingTemperatureArray AcousticDeformationPotentialScattering::prefactor(Spin spin, std::size_t idx_band) const {
    check_band_index(spin, idx_band);
    DopingTemperatureArray prefactor = linear_in_temperature(m_prefactor);

    if (m_is_metal) {
        prefactor *= m_deformation_potential.first * m_deformation_potential.first;
        return prefactor;
    }

    auto it_vb = m_vb_idx.find(spin);
    if (it_vb == m_vb_idx.end()) {
        throw ShapeMismatchError(fmt::format("ADP: no valence band index for spin {}", spin_name(spin)));
    }
    const bool   is_conduction = static_cast<long long>(idx_band) > static_cast<long long>(it_vb->second);
    const double defpot        = is_conduction ? m_deformation_potential.second : m_deformation_potential.first;
    prefactor *= defpot * defpot;
    return prefactor;
}

FormFactor AcousticDeformationPotentialScattering::factor(const Eigen::ArrayXd& norm_q_sq) const {
    return FormFactor(get_nb_dopings(), get_nb_temperatures(), static_cast<std::size_t>(norm_q_sq.size()), 1.0);
}

}  // namespace elrates::scattering
