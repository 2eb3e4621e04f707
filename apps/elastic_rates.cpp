/**
 * @file elastic_rates.cpp
 * @brief Evaluate the elastic scattering prefactors and rate contributions of a material.
 * @version 0.1
 * @date 2026-10-17
 *
 *
 */

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <tclap/CmdLine.h>

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "elastic_scattering.hpp"
#include "material_properties.hpp"
#include "numerical_helper.hpp"
#include "physical_constants.hpp"
#include "scattering_errors.hpp"
#include "transport_state.hpp"

using namespace elrates::scattering;

static std::vector<ElasticMechanismType> parse_mechanism_list(const std::string& list, const MaterialProperties& properties) {
    if (list.empty() || list == "auto") {
        return available_mechanisms(properties);
    }
    std::vector<ElasticMechanismType> types;
    std::stringstream                 stream(list);
    std::string                       token;
    while (std::getline(stream, token, ',')) {
        if (!token.empty()) {
            types.push_back(mechanism_type_from_name(token));
        }
    }
    return types;
}

int main(int argc, char const* argv[]) {
    fmt::print("Starting ElasticRates calculation ... \n\n");

    TCLAP::CmdLine               cmd("ELASTIC RATES. COMPUTE ELASTIC SCATTERING PREFACTORS AND FORM FACTORS.", ' ', "1.0");
    TCLAP::ValueArg<std::string> arg_material_file("M",
                                                   "materialfile",
                                                   "YAML file with the material properties.",
                                                   false,
                                                   std::string(PROJECT_SRC_DIR) + "/parameter_files/materials.yaml",
                                                   "string");
    TCLAP::ValueArg<std::string> arg_material("m", "material", "Name of the material to use (GaAs, Si, ...)", true, "GaAs", "string");
    TCLAP::ValueArg<std::string> arg_state_file("s", "statefile", "YAML file with the transport state.", true, "state.yaml", "string");
    TCLAP::ValueArg<std::string> arg_mechanisms("x", "mechanisms", "Comma separated mechanisms (ADP,IMP,PIE) or auto.", false, "auto", "string");
    TCLAP::ValueArg<int>         arg_band("b", "band", "Band index.", false, 0, "int");
    TCLAP::ValueArg<std::string> arg_spin("S", "spin", "Spin channel (up or down).", false, "up", "string");
    TCLAP::ValueArg<double>      arg_q_min("q", "qmin", "Smallest |q| in 1/bohr.", false, 1e-3, "double");
    TCLAP::ValueArg<double>      arg_q_max("Q", "qmax", "Largest |q| in 1/bohr.", false, 1.0, "double");
    TCLAP::ValueArg<int>         arg_nb_q("n", "nq", "Number of |q| values.", false, 5, "int");
    TCLAP::SwitchArg             arg_verbose("v", "verbose", "Print debug diagnostics.", false);
    cmd.add(arg_material_file);
    cmd.add(arg_material);
    cmd.add(arg_state_file);
    cmd.add(arg_mechanisms);
    cmd.add(arg_band);
    cmd.add(arg_spin);
    cmd.add(arg_q_min);
    cmd.add(arg_q_max);
    cmd.add(arg_nb_q);
    cmd.add(arg_verbose);
    cmd.parse(argc, argv);

    auto start = std::chrono::high_resolution_clock::now();

    ConsoleReporter reporter(arg_verbose.getValue() ? LogLevel::debug : LogLevel::info);

    try {
        MaterialLibrary library;
        library.load_material_parameters(arg_material_file.getValue());
        if (library.materials.find(arg_material.getValue()) == library.materials.end()) {
            fmt::print(std::cerr, "Error: material {} not found in {}. Available materials:\n", arg_material.getValue(), arg_material_file.getValue());
            library.print_materials_list();
            return 1;
        }
        const MaterialProperties& properties = library.get_material(arg_material.getValue());

        const TransportState state = load_transport_state(arg_state_file.getValue());
        fmt::print("Transport state: {} dopings, {} temperatures, {} spin channel(s), {}\n",
                   state.nb_dopings(),
                   state.nb_temperatures(),
                   state.spins.size(),
                   state.is_metal ? "metal" : "semiconductor");

        if (arg_spin.getValue() != "up" && arg_spin.getValue() != "down") {
            fmt::print(std::cerr, "Error: unknown spin {}\n", arg_spin.getValue());
            return 1;
        }
        const Spin        spin     = arg_spin.getValue() == "up" ? Spin::up : Spin::down;
        const std::size_t idx_band = static_cast<std::size_t>(arg_band.getValue());

        const Eigen::ArrayXd q_norm = elrates::numerical::logspace(arg_q_min.getValue(), arg_q_max.getValue(), static_cast<std::size_t>(arg_nb_q.getValue()));
        const Eigen::ArrayXd q_sq   = q_norm.square();

        for (ElasticMechanismType type : parse_mechanism_list(arg_mechanisms.getValue(), properties)) {
            const ElasticScattering mechanism    = make_elastic_scattering(type, properties, state, reporter);
            const auto              prefactors   = prefactor(mechanism, spin, idx_band);
            const FormFactor        contribution = compute_rate_contribution(mechanism, spin, idx_band, q_sq);

            fmt::print("\n=== {} scattering (spin {}, band {}) ===\n", mechanism_name(mechanism), spin_name(spin), idx_band);
            for (std::size_t idx_doping = 0; idx_doping < state.nb_dopings(); ++idx_doping) {
                for (std::size_t idx_temperature = 0; idx_temperature < state.nb_temperatures(); ++idx_temperature) {
                    const auto n = static_cast<Eigen::Index>(idx_doping);
                    const auto t = static_cast<Eigen::Index>(idx_temperature);
                    fmt::print("doping = {:.3e} cm^-3, T = {:.1f} K, prefactor = {:.6e}\n",
                               state.doping(n) * elrates::constants::per_bohr3_to_per_cm3,
                               state.temperatures(t),
                               prefactors(n, t));
                    for (Eigen::Index idx_q = 0; idx_q < q_norm.size(); ++idx_q) {
                        fmt::print("    |q| = {:.4e} 1/bohr : {:.6e}\n",
                                   q_norm(idx_q),
                                   contribution(idx_doping, idx_temperature, static_cast<std::size_t>(idx_q)));
                    }
                }
            }
        }
    } catch (const ElasticScatteringError& error) {
        fmt::print(std::cerr, "Error: {}\n", error.what());
        return 1;
    } catch (const YAML::Exception& error) {
        fmt::print(std::cerr, "Error while reading YAML input: {}\n", error.what());
        return 1;
    } catch (const std::exception& error) {
        fmt::print(std::cerr, "Error: {}\n", error.what());
        return 1;
    }

    auto stop     = std::chrono::high_resolution_clock::now();
    auto duration = stop - start;
    fmt::print("\nTotal time : {:.2f} seconds\n\n", std::chrono::duration<double>(duration).count());
    return 0;
}
