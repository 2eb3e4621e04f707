/**
 * @file form_factor.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#include "form_factor.hpp"

#include <fmt/format.h>

#include "scattering_errors.hpp"

namespace elrates::scattering {

FormFactor::FormFactor(std::size_t nb_dopings, std::size_t nb_temperatures, std::size_t nb_points, double fill_value)
    : m_nb_dopings(nb_dopings),
      m_nb_temperatures(nb_temperatures),
      m_values(Storage::Constant(static_cast<Eigen::Index>(nb_dopings * nb_temperatures), static_cast<Eigen::Index>(nb_points), fill_value)) {}

FormFactor& FormFactor::scale(const DopingTemperatureArray& prefactor) {
    if (static_cast<std::size_t>(prefactor.rows()) != m_nb_dopings || static_cast<std::size_t>(prefactor.cols()) != m_nb_temperatures) {
        throw ShapeMismatchError(fmt::format("FormFactor::scale: prefactor shape ({}, {}) does not match ({}, {})",
                                             prefactor.rows(),
                                             prefactor.cols(),
                                             m_nb_dopings,
                                             m_nb_temperatures));
    }
    for (std::size_t idx_doping = 0; idx_doping < m_nb_dopings; ++idx_doping) {
        for (std::size_t idx_temperature = 0; idx_temperature < m_nb_temperatures; ++idx_temperature) {
            slice(idx_doping, idx_temperature) *= prefactor(static_cast<Eigen::Index>(idx_doping), static_cast<Eigen::Index>(idx_temperature));
        }
    }
    return *this;
}

}  // namespace elrates::scattering
