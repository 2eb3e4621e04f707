/**
 * @file ionized_impurity.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#include "ionized_impurity.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

#include "physical_constants.hpp"
#include "screening.hpp"

namespace elrates::scattering {

IonizedImpurityConfig IonizedImpurityConfig::from_properties(const MaterialProperties& properties) {
    IonizedImpurityConfig config;
    config.acceptor_charge   = properties.get_scalar("acceptor_charge");
    config.donor_charge      = properties.get_scalar("donor_charge");
    config.static_dielectric = properties.get_scalar("static_dielectric");
    return config;
}

IonizedImpurityScattering::IonizedImpurityScattering(const MaterialProperties& materials_properties,
                                                     const TransportState&     state,
                                                     ScatteringReporter&       reporter)
    : ElasticScatteringBase(materials_properties, required_properties, state) {
    using namespace elrates::constants;
    const auto config = IonizedImpurityConfig::from_properties(m_properties);

    reporter.debug("Initializing IMP scattering");

    m_inverse_screening_length_sq = calculate_inverse_screening_length_sq(state, config.static_dielectric);
    m_impurity_concentration =
        state.electron_conc.abs() * config.donor_charge * config.donor_charge + state.hole_conc.abs() * config.acceptor_charge * config.acceptor_charge;

    std::vector<std::string> imp_info;
    imp_info.reserve(static_cast<std::size_t>(m_impurity_concentration.size()));
    for (Eigen::Index idx_doping = 0; idx_doping < m_impurity_concentration.rows(); ++idx_doping) {
        for (Eigen::Index idx_temperature = 0; idx_temperature < m_impurity_concentration.cols(); ++idx_temperature) {
            imp_info.push_back(fmt::format("{:3.2e} cm⁻³ & {} K: β² = {:4.3e} a₀⁻², Nᵢᵢ = {:4.3e} cm⁻³",
                                           state.doping(idx_doping) * per_bohr3_to_per_cm3,
                                           state.temperatures(idx_temperature),
                                           m_inverse_screening_length_sq(idx_doping, idx_temperature),
                                           m_impurity_concentration(idx_doping, idx_temperature) * per_bohr3_to_per_cm3));
        }
    }
    reporter.report_list(LogLevel::debug, "Inverse screening length (β) and impurity concentration (Nᵢᵢ):", imp_info);

    m_prefactor = m_impurity_concentration * (4.0 * pi) * (4.0 * pi) * second_to_au / (config.static_dielectric * config.static_dielectric);
}

DopingTemperatureArray IonizedImpurityScattering::prefactor(Spin spin, std::size_t idx_band) const {
    check_band_index(spin, idx_band);
    return m_prefactor;
}

FormFactor IonizedImpurityScattering::factor(const Eigen::ArrayXd& norm_q_sq) const {
    FormFactor result(get_nb_dopings(), get_nb_temperatures(), static_cast<std::size_t>(norm_q_sq.size()));
    for (std::size_t idx_doping = 0; idx_doping < get_nb_dopings(); ++idx_doping) {
        for (std::size_t idx_temperature = 0; idx_temperature < get_nb_temperatures(); ++idx_temperature) {
            const double beta_sq = m_inverse_screening_length_sq(static_cast<Eigen::Index>(idx_doping), static_cast<Eigen::Index>(idx_temperature));
            result.slice(idx_doping, idx_temperature) = (norm_q_sq + beta_sq).square().inverse().transpose();
        }
    }
    return result;
}

}  // namespace elrates::scattering
