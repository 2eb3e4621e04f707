/**
 * @file elastic_scattering_base.hpp
 * @brief State shared by every elastic scattering mechanism.
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#pragma once

#include <Eigen/Core>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string_view>
#include <vector>

#include "form_factor.hpp"
#include "material_properties.hpp"
#include "transport_state.hpp"

namespace elrates::scattering {

enum class ElasticMechanismType : uint8_t { acoustic_deformation_potential = 0, ionized_impurity = 1, piezoelectric = 2 };

/**
 * @brief Common data of the mechanisms: the required-property subset and the doping/temperature/band axes.
 *
 * Not polymorphic: the mechanisms are held by value in a std::variant.
 */
class ElasticScatteringBase {
 protected:
    MaterialProperties         m_properties;
    Eigen::ArrayXd             m_doping;
    Eigen::ArrayXd             m_temperatures;
    std::map<Spin, std::size_t> m_nb_bands;
    std::vector<Spin>          m_spins;

    template <typename Range>
    ElasticScatteringBase(const MaterialProperties& materials_properties, const Range& required_properties, const TransportState& state)
        : m_properties(materials_properties.subset(required_properties)),
          m_doping(state.doping),
          m_temperatures(state.temperatures),
          m_spins(state.spins) {
        state.validate();
        for (Spin spin : m_spins) {
            m_nb_bands[spin] = state.nb_bands(spin);
        }
    }

    /**
     * @brief Throw a ShapeMismatchError if the spin is unknown or the band index out of range.
     *
     */
    void check_band_index(Spin spin, std::size_t idx_band) const;

    /**
     * @brief Array (ndoping, ntemperature) equal to value_per_kelvin * T, tiled over the doping axis.
     *
     */
    DopingTemperatureArray linear_in_temperature(double value_per_kelvin) const;

 public:
    const MaterialProperties& get_properties() const noexcept { return m_properties; }
    const Eigen::ArrayXd&     get_doping() const noexcept { return m_doping; }
    const Eigen::ArrayXd&     get_temperatures() const noexcept { return m_temperatures; }
    const std::vector<Spin>&  get_spins() const noexcept { return m_spins; }
    std::size_t               get_nb_dopings() const noexcept { return static_cast<std::size_t>(m_doping.size()); }
    std::size_t               get_nb_temperatures() const noexcept { return static_cast<std::size_t>(m_temperatures.size()); }
    std::size_t               get_nb_bands(Spin spin) const;
};

}  // namespace elrates::scattering
