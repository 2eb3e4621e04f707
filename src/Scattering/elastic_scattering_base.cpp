/**
 * @file elastic_scattering_base.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#include "elastic_scattering_base.hpp"

#include <fmt/format.h>

#include "scattering_errors.hpp"

namespace elrates::scattering {

std::size_t ElasticScatteringBase::get_nb_bands(Spin spin) const {
    auto it = m_nb_bands.find(spin);
    if (it == m_nb_bands.end()) {
        throw ShapeMismatchError(fmt::format("Spin {} is not part of the transport state", spin_name(spin)));
    }
    return it->second;
}

void ElasticScatteringBase::check_band_index(Spin spin, std::size_t idx_band) const {
    const std::size_t nb_bands = get_nb_bands(spin);
    if (idx_band >= nb_bands) {
        throw ShapeMismatchError(fmt::format("Band index {} out of range for spin {} ({} bands)", idx_band, spin_name(spin), nb_bands));
    }
}

DopingTemperatureArray ElasticScatteringBase::linear_in_temperature(double value_per_kelvin) const {
    return (value_per_kelvin * m_temperatures.transpose()).replicate(m_doping.size(), 1);
}

}  // namespace elrates::scattering
