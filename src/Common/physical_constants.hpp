/**
 * @file physical_constants.hpp
 * @brief  Physical constants and atomic-unit conversions used in the project.
 * @version 0.1
 * @date 2026-10-12
 *
 * Internal quantities are in Hartree atomic units (energy in Hartree, length in bohr,
 * time in hbar / Hartree).
 *
 */

#pragma once

#include <cmath>
#include <numbers>

namespace elrates {

namespace constants {

constexpr double h   = 6.62607015e-34;   // J·s (exact)
constexpr double k_B = 1.380649e-23;     // J/K (exact)
constexpr double q_e = 1.602176634e-19;  // C = J/eV (exact)

// === Derived fundamentals ===
constexpr double pi       = std::numbers::pi_v<double>;
constexpr double h_bar    = h / (2.0 * pi);   // J·s
constexpr double eV_to_J  = q_e;              // J/eV
constexpr double h_bar_eV = h_bar / eV_to_J;  // eV·s
constexpr double k_b_eV   = k_B / eV_to_J;    // eV/K

constexpr double eps_0 = 8.8541878128e-12;  // F/m

constexpr double bohr_radius   = 5.29177210903e-11;    // m
constexpr double Hartree_to_J  = 4.3597447222071e-18;  // J
constexpr double Hartree_to_eV = Hartree_to_J / eV_to_J;

// === Atomic units ===
constexpr double k_b_Hartree     = k_B / Hartree_to_J;             // Hartree/K
constexpr double atomic_time     = h_bar / Hartree_to_J;           // s
constexpr double second_to_au    = 1.0 / atomic_time;              // atomic time units per second
constexpr double GPa_to_au       = 1.0e9 * bohr_radius * bohr_radius * bohr_radius / Hartree_to_J;  // Hartree/bohr^3 per GPa
constexpr double bohr_to_cm      = bohr_radius * 1.0e2;            // cm
constexpr double angstrom_to_m   = 1e-10;                          // m/Å
constexpr double angstrom_to_bohr = angstrom_to_m / bohr_radius;

// Back-conversions
constexpr double eV_to_Hartree = 1.0 / Hartree_to_eV;

// Densities: per bohr^3 <-> per cm^3
constexpr double per_bohr3_to_per_cm3 = 1.0 / (bohr_to_cm * bohr_to_cm * bohr_to_cm);
constexpr double per_cm3_to_per_bohr3 = bohr_to_cm * bohr_to_cm * bohr_to_cm;

}  // namespace constants
}  // namespace elrates
