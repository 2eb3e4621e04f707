/**
 * @file numerical_helper.hpp
 *
 * @brief Numerical helper functions for sampling grids.
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#pragma once

#include <cmath>
#include <cstddef>

#include <Eigen/Core>

namespace elrates::numerical {

/**
 * @brief Generate linearly spaced points between start and end (both included).
 *
 * @param start Starting value.
 * @param end Ending value.
 * @param num_points Number of points to generate.
 * @return Eigen::ArrayXd
 */
inline Eigen::ArrayXd linspace(double start, double end, std::size_t num_points) {
    if (num_points == 0) {
        return Eigen::ArrayXd();
    }
    if (num_points == 1) {
        return Eigen::ArrayXd::Constant(1, start);
    }
    return Eigen::ArrayXd::LinSpaced(static_cast<Eigen::Index>(num_points), start, end);
}

/**
 * @brief Generate logarithmically spaced points between start and end (both > 0).
 *
 * @param start
 * @param end
 * @param num_points
 * @return Eigen::ArrayXd
 */
inline Eigen::ArrayXd logspace(double start, double end, std::size_t num_points) {
    Eigen::ArrayXd exponents = linspace(std::log10(start), std::log10(end), num_points);
    return (exponents * std::log(10.0)).exp();
}

}  // namespace elrates::numerical
