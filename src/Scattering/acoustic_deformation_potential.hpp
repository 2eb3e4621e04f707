/**
 * @file acoustic_deformation_potential.hpp
 * @brief Elastic scattering by acoustic phonons through the deformation potential (ADP).
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#pragma once

#include <array>
#include <map>
#include <string_view>

#include "elastic_scattering_base.hpp"
#include "scattering_reporter.hpp"

namespace elrates::scattering {

struct AcousticDeformationPotentialConfig {
    static constexpr std::array<std::string_view, 2> required_properties = {"deformation_potential", "elastic_constant"};

    /**
     * @brief Deformation potential in eV: a single value or (valence, conduction).
     *
     */
    PropertyValue deformation_potential_eV = 0.0;

    double elastic_constant_GPa = 0.0;

    static AcousticDeformationPotentialConfig from_properties(const MaterialProperties& properties);
};

class AcousticDeformationPotentialScattering : public ElasticScatteringBase {
 public:
    static constexpr std::string_view     name                = "ADP";
    static constexpr ElasticMechanismType type                = ElasticMechanismType::acoustic_deformation_potential;
    static constexpr auto                 required_properties = AcousticDeformationPotentialConfig::required_properties;

 private:
    bool                m_is_metal = false;
    std::map<Spin, int> m_vb_idx;

    /**
     * @brief k_B * s / (4 pi^2 C), per Kelvin, in atomic units.
     *
     */
    double m_prefactor = 0.0;

    /**
     * @brief (valence, conduction) deformation potentials in Hartree. Both equal for metals.
     *
     */
    PropertyPair m_deformation_potential{0.0, 0.0};

 public:
    /**
     * @brief Build the mechanism.
     *
     * Deformation potential policy:
     *  - metal + pair            : the valence value is used for all bands (warning).
     *  - metal + scalar          : used for all bands.
     *  - semiconductor + scalar  : used for valence and conduction bands (warning).
     *  - semiconductor + pair    : (valence, conduction).
     *
     * @throw MissingPropertyError, InvalidPropertyError, ShapeMismatchError
     */
    AcousticDeformationPotentialScattering(const MaterialProperties& materials_properties,
                                           const TransportState&     state,
                                           ScatteringReporter&       reporter);

    /**
     * @brief Prefactor (ndoping, ntemperature): k_B s T D^2 / (4 pi^2 C).
     *
     * For semiconductors D is the valence potential if idx_band <= vb_idx[spin], the conduction one otherwise.
     */
    DopingTemperatureArray prefactor(Spin spin, std::size_t idx_band) const;

    /**
     * @brief Ones of shape (ndoping, ntemperature, nk).
     *
     */
    FormFactor factor(const Eigen::ArrayXd& norm_q_sq) const;

    bool                is_metal() const noexcept { return m_is_metal; }
    double              get_base_prefactor() const noexcept { return m_prefactor; }
    const PropertyPair& get_deformation_potential() const noexcept { return m_deformation_potential; }
};

}  // namespace elrates::scattering
