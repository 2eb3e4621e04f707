/**
 * @file transport_state.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#include "transport_state.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <span>
#include <stdexcept>

#include "integrals.hpp"
#include "physical_constants.hpp"
#include "scattering_errors.hpp"
#include "yaml-cpp/yaml.h"

namespace elrates::scattering {

std::string_view spin_name(Spin spin) noexcept { return spin == Spin::up ? "up" : "down"; }

bool TransportState::has_spin(Spin spin) const { return std::find(spins.begin(), spins.end(), spin) != spins.end(); }

std::size_t TransportState::nb_bands(Spin spin) const {
    auto it = energies.find(spin);
    if (!has_spin(spin) || it == energies.end()) {
        throw ShapeMismatchError(fmt::format("Spin {} is not part of the transport state", spin_name(spin)));
    }
    return static_cast<std::size_t>(it->second.rows());
}

static void check_doping_temperature_shape(const Eigen::ArrayXXd& array, const char* name, const TransportState& state) {
    if (static_cast<std::size_t>(array.rows()) != state.nb_dopings() || static_cast<std::size_t>(array.cols()) != state.nb_temperatures()) {
        throw ShapeMismatchError(fmt::format("TransportState: {} has shape ({}, {}), expected (ndoping={}, ntemperature={})",
                                             name,
                                             array.rows(),
                                             array.cols(),
                                             state.nb_dopings(),
                                             state.nb_temperatures()));
    }
}

void TransportState::validate() const {
    check_doping_temperature_shape(fermi_levels, "fermi_levels", *this);
    check_doping_temperature_shape(electron_conc, "electron_conc", *this);
    check_doping_temperature_shape(hole_conc, "hole_conc", *this);

    if (dos.energies.size() != dos.total.size()) {
        throw ShapeMismatchError(fmt::format("TransportState: DOS energy grid has {} points but total DOS has {}",
                                             dos.energies.size(),
                                             dos.total.size()));
    }
    if (!integrate::is_strictly_increasing(std::span<const double>(dos.energies.data(), static_cast<std::size_t>(dos.energies.size())))) {
        throw ShapeMismatchError("TransportState: DOS energy grid is not strictly increasing");
    }
    if (spins.empty()) {
        throw ShapeMismatchError("TransportState: no spin channel");
    }
    for (std::size_t idx_spin = 0; idx_spin < spins.size(); ++idx_spin) {
        const Spin spin = spins[idx_spin];
        if (std::count(spins.begin(), spins.begin() + static_cast<std::ptrdiff_t>(idx_spin), spin) != 0) {
            throw ShapeMismatchError(fmt::format("TransportState: spin {} listed twice", spin_name(spin)));
        }
        if (energies.find(spin) == energies.end()) {
            throw ShapeMismatchError(fmt::format("TransportState: no band energies for spin {}", spin_name(spin)));
        }
        if (!is_metal && vb_idx.find(spin) == vb_idx.end()) {
            throw ShapeMismatchError(fmt::format("TransportState: no valence band index for spin {}", spin_name(spin)));
        }
    }
}

static Eigen::ArrayXd read_vector(const YAML::Node& node, const char* name) {
    if (!node || !node.IsSequence()) {
        throw std::runtime_error(fmt::format("Transport state: \"{}\" must be a list", name));
    }
    Eigen::ArrayXd values(static_cast<Eigen::Index>(node.size()));
    for (std::size_t i = 0; i < node.size(); ++i) {
        values(static_cast<Eigen::Index>(i)) = node[i].as<double>();
    }
    return values;
}

static Eigen::ArrayXXd read_matrix(const YAML::Node& node, const char* name) {
    if (!node || !node.IsSequence()) {
        throw std::runtime_error(fmt::format("Transport state: \"{}\" must be a list of rows", name));
    }
    const std::size_t nb_rows = node.size();
    const std::size_t nb_cols = nb_rows == 0 ? 0 : node[0].size();
    Eigen::ArrayXXd   values(static_cast<Eigen::Index>(nb_rows), static_cast<Eigen::Index>(nb_cols));
    for (std::size_t i = 0; i < nb_rows; ++i) {
        if (!node[i].IsSequence() || node[i].size() != nb_cols) {
            throw ShapeMismatchError(fmt::format("Transport state: \"{}\" row {} does not have {} columns", name, i, nb_cols));
        }
        for (std::size_t j = 0; j < nb_cols; ++j) {
            values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = node[i][j].as<double>();
        }
    }
    return values;
}

TransportState load_transport_state(const std::string& filename) {
    YAML::Node config = YAML::LoadFile(filename);
    if (config.IsNull()) {
        throw std::runtime_error("File " + filename + " is empty");
    }
    return transport_state_from_yaml(config);
}

TransportState transport_state_from_yaml(const YAML::Node& config) {
    using namespace elrates::constants;

    TransportState state;
    state.doping        = read_vector(config["doping"], "doping") * per_cm3_to_per_bohr3;
    state.temperatures  = read_vector(config["temperatures"], "temperatures");
    state.fermi_levels  = read_matrix(config["fermi_levels"], "fermi_levels") * eV_to_Hartree;
    state.electron_conc = read_matrix(config["electron_conc"], "electron_conc") * per_cm3_to_per_bohr3;
    state.hole_conc     = read_matrix(config["hole_conc"], "hole_conc") * per_cm3_to_per_bohr3;
    state.is_metal      = config["is_metal"] ? config["is_metal"].as<bool>() : false;

    const Eigen::ArrayXXd lattice = read_matrix(config["lattice"], "lattice");
    if (lattice.rows() != 3 || lattice.cols() != 3) {
        throw ShapeMismatchError("Transport state: lattice must be 3x3");
    }
    state.structure.lattice = lattice.matrix() * angstrom_to_bohr;

    auto node_dos = config["dos"];
    if (!node_dos) {
        throw std::runtime_error("Transport state has no \"dos\" section");
    }
    state.dos.energies = read_vector(node_dos["energies"], "dos.energies") * eV_to_Hartree;
    state.dos.total    = read_vector(node_dos["total"], "dos.total") * Hartree_to_eV;

    auto list_bands = config["bands"];
    if (!list_bands || !list_bands.IsSequence()) {
        throw std::runtime_error("Transport state has no \"bands\" list");
    }
    for (const auto& band_node : list_bands) {
        const std::string spin_str = band_node["spin"] ? band_node["spin"].as<std::string>() : std::string("up");
        if (spin_str != "up" && spin_str != "down") {
            throw std::runtime_error("Transport state: unknown spin " + spin_str);
        }
        const Spin spin = spin_str == "up" ? Spin::up : Spin::down;
        if (state.has_spin(spin)) {
            throw ShapeMismatchError("Transport state: bands given twice for spin " + spin_str);
        }
        state.spins.push_back(spin);
        state.energies[spin] = read_matrix(band_node["energies"], "bands.energies") * eV_to_Hartree;
        if (band_node["vb_idx"]) {
            state.vb_idx[spin] = band_node["vb_idx"].as<int>();
        }
    }

    state.validate();
    return state;
}

}  // namespace elrates::scattering
