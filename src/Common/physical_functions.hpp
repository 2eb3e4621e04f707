/**
 * @file physical_functions.hpp
 * @brief
 * @version 0.1
 * @date 2026-10-12
 *
 *
 */

#pragma once

#include <cmath>

#include "physical_constants.hpp"

namespace elrates {

namespace physics {

/**
 * @brief Fermi-Dirac occupation with all energies in the same unit (Hartree in the scattering code).
 *
 * kT = 0 is not treated as a step function: the division produces +-inf (or NaN exactly at the
 * Fermi level) and the result follows IEEE arithmetic, so degenerate inputs stay visible downstream.
 *
 * @param energy
 * @param fermi_level
 * @param kT
 * @return double
 */
inline double fermi_dirac_occupation(double energy, double fermi_level, double kT) {
    const double x = (energy - fermi_level) / kT;

    // In double precision, |x| >= 40 puts f within ~1e-17 of 0 or 1.
    constexpr double X_CUTOFF = 40.0;
    if (x >= X_CUTOFF) {
        return 0.0;
    }
    if (x <= -X_CUTOFF) {
        return 1.0;
    }

    // Stable logistic: avoid large exp(x) when x > 0.
    if (x > 0.0) {
        const double emx = std::exp(-x);
        return emx / (1.0 + emx);
    } else {
        const double ex = std::exp(x);
        return 1.0 / (1.0 + ex);
    }
}

/**
 * @brief Thermal broadening weight f * (1 - f) = -kT df/dE.
 *
 * @param energy
 * @param fermi_level
 * @param kT
 * @return double
 */
inline double fermi_dirac_window(double energy, double fermi_level, double kT) {
    const double f = fermi_dirac_occupation(energy, fermi_level, kT);
    return f * (1.0 - f);
}

}  // namespace physics

}  // namespace elrates
