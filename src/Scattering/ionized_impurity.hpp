/**
 * @file ionized_impurity.hpp
 * @brief Elastic scattering by screened ionized impurities (Brooks-Herring).
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#pragma once

#include <array>
#include <string_view>

#include "elastic_scattering_base.hpp"
#include "scattering_reporter.hpp"

namespace elrates::scattering {

struct IonizedImpurityConfig {
    static constexpr std::array<std::string_view, 3> required_properties = {"acceptor_charge", "donor_charge", "static_dielectric"};

    double acceptor_charge   = 0.0;
    double donor_charge      = 0.0;
    double static_dielectric = 0.0;

    static IonizedImpurityConfig from_properties(const MaterialProperties& properties);
};

class IonizedImpurityScattering : public ElasticScatteringBase {
 public:
    static constexpr std::string_view     name                = "IMP";
    static constexpr ElasticMechanismType type                = ElasticMechanismType::ionized_impurity;
    static constexpr auto                 required_properties = IonizedImpurityConfig::required_properties;

 private:
    DopingTemperatureArray m_inverse_screening_length_sq;  // bohr^-2
    DopingTemperatureArray m_impurity_concentration;       // bohr^-3
    DopingTemperatureArray m_prefactor;

 public:
    /**
     * @brief Build the mechanism: screening lengths, impurity concentrations
     * N_ii = |n| Z_d^2 + |p| Z_a^2 and prefactor N_ii (4 pi)^2 s / eps_s^2.
     *
     * One debug line per (doping, temperature) is sent to the reporter.
     */
    IonizedImpurityScattering(const MaterialProperties& materials_properties, const TransportState& state, ScatteringReporter& reporter);

    /**
     * @brief Band and spin independent prefactor (ndoping, ntemperature).
     *
     */
    DopingTemperatureArray prefactor(Spin spin, std::size_t idx_band) const;

    /**
     * @brief 1 / (q^2 + beta^2[n, t])^2 of shape (ndoping, ntemperature, nk).
     *
     */
    FormFactor factor(const Eigen::ArrayXd& norm_q_sq) const;

    const DopingTemperatureArray& get_inverse_screening_length_sq() const noexcept { return m_inverse_screening_length_sq; }
    const DopingTemperatureArray& get_impurity_concentration() const noexcept { return m_impurity_concentration; }
    const DopingTemperatureArray& get_prefactor() const noexcept { return m_prefactor; }
};

}  // namespace elrates::scattering
