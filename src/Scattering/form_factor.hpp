/**
 * @file form_factor.hpp
 * @brief Fixed-rank containers for (doping, temperature[, k-point]) scattering arrays.
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#pragma once

#include <Eigen/Core>
#include <array>
#include <cstddef>

namespace elrates::scattering {

/**
 * @brief Array indexed by [doping, temperature].
 *
 */
using DopingTemperatureArray = Eigen::ArrayXXd;

/**
 * @brief Momentum-transfer-dependent array of shape (ndoping, ntemperature, nk).
 *
 * Storage is row-major: one row per (doping, temperature) pair, the k-points along the row.
 */
class FormFactor {
 public:
    using Storage = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

 private:
    std::size_t m_nb_dopings      = 0;
    std::size_t m_nb_temperatures = 0;
    Storage     m_values;

    Eigen::Index row_index(std::size_t idx_doping, std::size_t idx_temperature) const noexcept {
        return static_cast<Eigen::Index>(idx_doping * m_nb_temperatures + idx_temperature);
    }

 public:
    FormFactor() = default;
    FormFactor(std::size_t nb_dopings, std::size_t nb_temperatures, std::size_t nb_points, double fill_value = 0.0);

    std::size_t nb_dopings() const noexcept { return m_nb_dopings; }
    std::size_t nb_temperatures() const noexcept { return m_nb_temperatures; }
    std::size_t nb_points() const noexcept { return static_cast<std::size_t>(m_values.cols()); }

    std::array<std::size_t, 3> shape() const noexcept { return {m_nb_dopings, m_nb_temperatures, nb_points()}; }

    double& operator()(std::size_t idx_doping, std::size_t idx_temperature, std::size_t idx_point) {
        return m_values(row_index(idx_doping, idx_temperature), static_cast<Eigen::Index>(idx_point));
    }
    const double& operator()(std::size_t idx_doping, std::size_t idx_temperature, std::size_t idx_point) const {
        return m_values(row_index(idx_doping, idx_temperature), static_cast<Eigen::Index>(idx_point));
    }

    /**
     * @brief Values over the k-point axis for one (doping, temperature) pair.
     *
     */
    auto slice(std::size_t idx_doping, std::size_t idx_temperature) { return m_values.row(row_index(idx_doping, idx_temperature)); }
    auto slice(std::size_t idx_doping, std::size_t idx_temperature) const {
        return m_values.row(row_index(idx_doping, idx_temperature));
    }

    const Storage& values() const noexcept { return m_values; }

    /**
     * @brief Multiply every (doping, temperature) slice by prefactor(doping, temperature).
     *
     * @throw ShapeMismatchError if the prefactor is not (ndoping, ntemperature).
     */
    FormFactor& scale(const DopingTemperatureArray& prefactor);
};

}  // namespace elrates::scattering
