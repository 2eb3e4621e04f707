/**
 * @file integrals.hpp
 * @brief Numerical integration utilities.
 * @version 0.1
 * @date 2026-10-12
 *
 *
 */

#pragma once
#include <cassert>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>
#include <vector>

#include <Eigen/Core>

namespace elrates::integrate {

template <typename T>
concept Real = std::is_floating_point_v<T>;

template <Real T>
inline bool is_strictly_increasing(std::span<const T> x) noexcept {
    for (std::size_t i = 1; i < x.size(); ++i) {
        if (!(x[i] > x[i - 1])) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Compute the trapezoidal integral of a function given its samples.
 *
 * @tparam T
 * @param x
 * @param y
 * @return T
 */
template <Real T>
inline T trapz(std::span<const T> x, std::span<const T> y) {
    assert(x.size() == y.size());
    const std::size_t n = x.size();
    if (n < 2) {
        return T(0);
    }

    T s = T(0);
    for (std::size_t i = 1; i < n; ++i) {
        const T dx = x[i] - x[i - 1];
        s += dx * (y[i] + y[i - 1]) / T(2);
    }
    return s;
}

template <Real T>
inline T trapz(const std::vector<T>& x, const std::vector<T>& y) {
    return trapz<T>(std::span<const T>(x), std::span<const T>(y));
}

inline double trapz(const Eigen::ArrayXd& x, const Eigen::ArrayXd& y) {
    return trapz<double>(std::span<const double>(x.data(), static_cast<std::size_t>(x.size())),
                         std::span<const double>(y.data(), static_cast<std::size_t>(y.size())));
}

}  // namespace elrates::integrate
