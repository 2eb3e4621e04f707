/**
 * @file piezoelectric.hpp
 * @brief Elastic scattering by the piezoelectric polarization of acoustic phonons (PIE).
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

struct PiezoelectricConfig {
    static constexpr std::array<std::string_view, 2> required_properties = {"piezoelectric_coefficient", "static_dielectric"};

    double piezoelectric_coefficient = 0.0;  // C/m^2
    double static_dielectric         = 0.0;

    static PiezoelectricConfig from_properties(const MaterialProperties& properties);
};

class PiezoelectricScattering : public ElasticScatteringBase {
 public:
    static constexpr std::string_view     name                = "PIE";
    static constexpr ElasticMechanismType type                = ElasticMechanismType::piezoelectric;
    static constexpr auto                 required_properties = PiezoelectricConfig::required_properties;

 private:
    double m_prefactor = 0.0;  // per Kelvin

 public:
    PiezoelectricScattering(const MaterialProperties& materials_properties, const TransportState& state, ScatteringReporter& reporter);

    /**
     * @brief Prefactor (ndoping, ntemperature), linear in temperature, band and spin independent.
     *
     */
    DopingTemperatureArray prefactor(Spin spin, std::size_t idx_band) const;

    /**
     * @brief 1 / |k - k'|^2 tiled to (ndoping, ntemperature, nk). Zeros give infinities.
     *
     */
    FormFactor factor(const Eigen::ArrayXd& k_diff_sq) const;

    double get_base_prefactor() const noexcept { return m_prefactor; }
};

}  // namespace elrates::scattering
