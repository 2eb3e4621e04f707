/**
 * @file screening.hpp
 * @brief Free-carrier screening of the ionized impurity potential.
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#pragma once

#include "form_factor.hpp"
#include "transport_state.hpp"

namespace elrates::scattering {

/**
 * @brief Compute the inverse screening length squared beta^2 (bohr^-2) for every (doping, temperature) pair.
 *
 *  beta^2[n, t] = 4 pi / (eps_s k_B T V) * integral( dos(E) f(E) (1 - f(E)) dE )
 *
 * with f the Fermi-Dirac occupation at the Fermi level fermi_levels[n, t] and temperature T = temperatures[t],
 * V the cell volume. The integral uses the trapezoidal rule on the DOS energy grid.
 * At T = 0 the result is NaN: it is not guarded.
 *
 * @param state
 * @param static_dielectric
 * @return DopingTemperatureArray (ndoping, ntemperature)
 * @throw ShapeMismatchError if fermi_levels does not match the doping and temperature axes or the DOS arrays differ in size.
 */
DopingTemperatureArray calculate_inverse_screening_length_sq(const TransportState& state, double static_dielectric);

}  // namespace elrates::scattering
