/**
 * @file screening.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-15
 *
 *
 */

#include "screening.hpp"

#include <fmt/format.h>

#include "integrals.hpp"
#include "physical_constants.hpp"
#include "physical_functions.hpp"
#include "scattering_errors.hpp"

namespace elrates::scattering {

DopingTemperatureArray calculate_inverse_screening_length_sq(const TransportState& state, double static_dielectric) {
    const Eigen::Index nb_dopings      = state.fermi_levels.rows();
    const Eigen::Index nb_temperatures = state.fermi_levels.cols();
    if (nb_dopings != state.doping.size()) {
        throw ShapeMismatchError(
            fmt::format("calculate_inverse_screening_length_sq: {} doping rows for {} dopings", nb_dopings, state.doping.size()));
    }
    if (nb_temperatures != state.temperatures.size()) {
        throw ShapeMismatchError(fmt::format("calculate_inverse_screening_length_sq: {} temperature columns for {} temperatures",
                                             nb_temperatures,
                                             state.temperatures.size()));
    }
    if (state.dos.energies.size() != state.dos.total.size()) {
        throw ShapeMismatchError("calculate_inverse_screening_length_sq: DOS energies and values differ in size");
    }

    const Eigen::ArrayXd& energies = state.dos.energies;
    const Eigen::ArrayXd& tdos     = state.dos.total;
    const double          volume   = state.structure.volume();

    DopingTemperatureArray inverse_screening_length_sq = DopingTemperatureArray::Zero(nb_dopings, nb_temperatures);

    // Each (doping, temperature) pair is independent.
#pragma omp parallel for collapse(2) schedule(static)
    for (Eigen::Index idx_doping = 0; idx_doping < nb_dopings; ++idx_doping) {
        for (Eigen::Index idx_temperature = 0; idx_temperature < nb_temperatures; ++idx_temperature) {
            const double ef   = state.fermi_levels(idx_doping, idx_temperature);
            const double temp = state.temperatures(idx_temperature);
            const double kT   = temp * constants::k_b_Hartree;

            Eigen::ArrayXd integrand(energies.size());
            for (Eigen::Index idx_energy = 0; idx_energy < energies.size(); ++idx_energy) {
                integrand(idx_energy) = tdos(idx_energy) * physics::fermi_dirac_window(energies(idx_energy), ef, kT);
            }
            const double integral = integrate::trapz(energies, integrand);

            inverse_screening_length_sq(idx_doping, idx_temperature) =
                integral * 4.0 * constants::pi / (static_dielectric * constants::k_b_Hartree * temp * volume);
        }
    }
    return inverse_screening_length_sq;
}

}  // namespace elrates::scattering
