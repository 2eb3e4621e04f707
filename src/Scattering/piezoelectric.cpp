/**
 * @file piezoelectric.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#include "piezoelectric.hpp"

#include <fmt/format.h>

#include "physical_constants.hpp"

namespace elrates::scattering {

PiezoelectricConfig PiezoelectricConfig::from_properties(const MaterialProperties& properties) {
    PiezoelectricConfig config;
    config.piezoelectric_coefficient = properties.get_scalar("piezoelectric_coefficient");
    config.static_dielectric         = properties.get_scalar("static_dielectric");
    return config;
}

PiezoelectricScattering::PiezoelectricScattering(const MaterialProperties& materials_properties,
                                                 const TransportState&     state,
                                                 ScatteringReporter&       reporter)
    : ElasticScatteringBase(materials_properties, required_properties, state) {
    using namespace elrates::constants;
    const auto config = PiezoelectricConfig::from_properties(m_properties);

    const double unit_conversion = 1e9 / q_e;
    const double coefficient     = config.piezoelectric_coefficient;
    m_prefactor                  = unit_conversion * q_e * q_e * k_b_eV * coefficient * coefficient /
                  (4.0 * pi * pi * h_bar_eV * eps_0 * config.static_dielectric);

    reporter.debug(fmt::format("Initializing PIE scattering: prefactor = {:4.3e} per K", m_prefactor));
}

DopingTemperatureArray PiezoelectricScattering::prefactor(Spin spin, std::size_t idx_band) const {
    check_band_index(spin, idx_band);
    return linear_in_temperature(m_prefactor);
}

FormFactor PiezoelectricScattering::factor(const Eigen::ArrayXd& k_diff_sq) const {
    FormFactor           result(get_nb_dopings(), get_nb_temperatures(), static_cast<std::size_t>(k_diff_sq.size()));
    const Eigen::ArrayXd inverse = k_diff_sq.inverse();
    for (std::size_t idx_doping = 0; idx_doping < get_nb_dopings(); ++idx_doping) {
        for (std::size_t idx_temperature = 0; idx_temperature < get_nb_temperatures(); ++idx_temperature) {
            result.slice(idx_doping, idx_temperature) = inverse.transpose();
        }
    }
    return result;
}

}  // namespace elrates::scattering
