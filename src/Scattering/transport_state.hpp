/**
 * @file transport_state.hpp
 * @brief Read-only snapshot of the transport calculation consumed by the elastic scattering mechanisms.
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "yaml-cpp/yaml.h"

namespace elrates::scattering {

enum class Spin : int8_t { up = 1, down = -1 };

std::string_view spin_name(Spin spin) noexcept;

/**
 * @brief Total density of states. Energies in Hartree, DOS in states / Hartree / unit cell.
 *
 */
struct DensityOfStates {
    Eigen::ArrayXd energies;
    Eigen::ArrayXd total;
};

/**
 * @brief Crystal structure. Lattice vectors (rows) in bohr.
 *
 */
struct CrystalStructure {
    Eigen::Matrix3d lattice = Eigen::Matrix3d::Identity();

    double volume() const { return std::abs(lattice.determinant()); }
};

/**
 * @brief Transport state in atomic units.
 *
 * Array layouts:
 *  - energies[spin]                      : (nbands, nkpoints), Hartree
 *  - fermi_levels, electron/hole_conc    : (ndoping, ntemperature), Hartree and bohr^-3
 *  - doping                              : (ndoping), bohr^-3
 *  - temperatures                        : (ntemperature), Kelvin
 */
struct TransportState {
    std::vector<Spin>              spins;
    std::map<Spin, Eigen::ArrayXXd> energies;
    std::map<Spin, int>            vb_idx;

    Eigen::ArrayXd  doping;
    Eigen::ArrayXd  temperatures;
    Eigen::ArrayXXd fermi_levels;
    Eigen::ArrayXXd electron_conc;
    Eigen::ArrayXXd hole_conc;

    DensityOfStates  dos;
    CrystalStructure structure;
    bool             is_metal = false;

    std::size_t nb_dopings() const noexcept { return static_cast<std::size_t>(doping.size()); }
    std::size_t nb_temperatures() const noexcept { return static_cast<std::size_t>(temperatures.size()); }
    bool        has_spin(Spin spin) const;

    /**
     * @brief Number of bands for a spin channel.
     *
     * @throw ShapeMismatchError if the spin is not part of the state.
     */
    std::size_t nb_bands(Spin spin) const;

    /**
     * @brief Check that every array agrees with the doping and temperature axes.
     *
     * @throw ShapeMismatchError on the first inconsistency.
     */
    void validate() const;
};

/**
 * @brief Load a transport state from a YAML file given in physical units and convert it to atomic units.
 *
 * Expected keys: doping (cm^-3), temperatures (K), fermi_levels (eV), electron_conc and hole_conc (cm^-3),
 * is_metal, lattice (Angstrom), dos: {energies (eV), total (states/eV/cell)},
 * bands: [{spin: up|down, vb_idx, energies (eV, nbands x nkpoints)}].
 *
 * @param filename
 * @return TransportState
 */
TransportState load_transport_state(const std::string& filename);

/**
 * @brief Same as load_transport_state, from an already parsed YAML node.
 *
 * @throw ShapeMismatchError for inconsistent shapes or repeated spin channels, std::runtime_error for missing sections.
 */
TransportState transport_state_from_yaml(const YAML::Node& config);

}  // namespace elrates::scattering
