/**
 * @file material_properties.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#include "material_properties.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <stdexcept>

#include "scattering_errors.hpp"

namespace elrates::scattering {

const std::vector<std::string>& known_property_names() {
    static const std::vector<std::string> names = {"deformation_potential",
                                                   "elastic_constant",
                                                   "acceptor_charge",
                                                   "donor_charge",
                                                   "static_dielectric",
                                                   "piezoelectric_coefficient"};
    return names;
}

bool is_known_property(std::string_view name) {
    const auto& names = known_property_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

const PropertyValue& MaterialProperties::at(const std::string& name) const {
    auto it = m_properties.find(name);
    if (it == m_properties.end()) {
        throw MissingPropertyError(name);
    }
    return it->second;
}

double MaterialProperties::get_scalar(const std::string& name) const {
    const PropertyValue& value = at(name);
    if (const double* scalar = std::get_if<double>(&value)) {
        return *scalar;
    }
    throw InvalidPropertyError(fmt::format("Material property {} must be a single value, not a pair", name));
}

std::vector<std::string> MaterialProperties::keys() const {
    std::vector<std::string> list_keys;
    list_keys.reserve(m_properties.size());
    for (const auto& [name, value] : m_properties) {
        list_keys.push_back(name);
    }
    return list_keys;
}

MaterialProperties MaterialProperties::from_yaml(const YAML::Node& node, const std::vector<std::string>& ignored_keys) {
    if (!node.IsMap()) {
        throw InvalidPropertyError("Material properties must be given as a YAML map");
    }
    MaterialProperties properties;
    for (const auto& item : node) {
        const std::string name = item.first.as<std::string>();
        if (std::find(ignored_keys.begin(), ignored_keys.end(), name) != ignored_keys.end()) {
            continue;
        }
        if (!is_known_property(name)) {
            throw InvalidPropertyError(fmt::format("Unknown material property: {}", name));
        }
        const YAML::Node& value = item.second;
        if (value.IsScalar()) {
            properties.set(name, value.as<double>());
        } else if (value.IsSequence() && value.size() == 1) {
            properties.set(name, value[0].as<double>());
        } else if (value.IsSequence() && value.size() == 2) {
            properties.set(name, value[0].as<double>(), value[1].as<double>());
        } else {
            throw InvalidPropertyError(fmt::format("Material property {} must be a number or a [valence, conduction] pair", name));
        }
    }
    return properties;
}

/**
 * @brief Load material parameters from the passed filename.
 * The file is a YAML file with a "materials" list, each entry has a "name" and the material properties.
 *
 * @param filename
 */
void MaterialLibrary::load_material_parameters(const std::string& filename) {
    YAML::Node config = YAML::LoadFile(filename);
    if (config.IsNull()) {
        throw std::runtime_error("File " + filename + " is empty");
    }
    auto list_materials = config["materials"];
    if (!list_materials || !list_materials.IsSequence()) {
        throw InvalidPropertyError("File " + filename + " has no \"materials\" list");
    }
    for (const auto& material : list_materials) {
        if (!material["name"]) {
            throw InvalidPropertyError("File " + filename + ": material entry without name");
        }
        const std::string name = material["name"].as<std::string>();
        materials[name]        = MaterialProperties::from_yaml(material, {"name"});
    }
}

const MaterialProperties& MaterialLibrary::get_material(const std::string& name) const {
    auto it = materials.find(name);
    if (it == materials.end()) {
        throw std::invalid_argument("Material " + name + " not found");
    }
    return it->second;
}

void MaterialLibrary::print_materials_list() const {
    for (const auto& [name, properties] : materials) {
        fmt::print("{}: {}\n", name, fmt::join(properties.keys(), ", "));
    }
}

}  // namespace elrates::scattering
