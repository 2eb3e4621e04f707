/**
 * @file material_properties.hpp
 * @brief Material properties consumed by the elastic scattering mechanisms.
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "yaml-cpp/yaml.h"

namespace elrates::scattering {

/**
 * @brief Either a single value or a (valence, conduction) pair.
 *
 */
using PropertyPair  = std::pair<double, double>;
using PropertyValue = std::variant<double, PropertyPair>;

/**
 * @brief Names of all the properties understood by the elastic mechanisms.
 *
 * Units of the values, as given by the user:
 *  - deformation_potential      : eV (scalar or [valence, conduction])
 *  - elastic_constant           : GPa
 *  - acceptor_charge            : elementary charges
 *  - donor_charge               : elementary charges
 *  - static_dielectric          : relative permittivity
 *  - piezoelectric_coefficient  : C/m^2
 */
const std::vector<std::string>& known_property_names();

bool is_known_property(std::string_view name);

class MaterialProperties {
 private:
    std::map<std::string, PropertyValue> m_properties;

 public:
    MaterialProperties() = default;

    void set(const std::string& name, double value) { m_properties[name] = value; }
    void set(const std::string& name, double valence_value, double conduction_value) {
        m_properties[name] = PropertyPair{valence_value, conduction_value};
    }

    bool        contains(const std::string& name) const { return m_properties.find(name) != m_properties.end(); }
    std::size_t size() const noexcept { return m_properties.size(); }

    /**
     * @brief Get a property.
     *
     * @throw MissingPropertyError if the property is absent.
     */
    const PropertyValue& at(const std::string& name) const;

    /**
     * @brief Get a property that must be a single value.
     *
     * @throw MissingPropertyError if the property is absent.
     * @throw InvalidPropertyError if the property is a pair.
     */
    double get_scalar(const std::string& name) const;

    /**
     * @brief Copy of the properties restricted to the given keys.
     *
     * @throw MissingPropertyError on the first absent key.
     */
    template <typename Range>
    MaterialProperties subset(const Range& required) const {
        MaterialProperties result;
        for (const auto& key : required) {
            const std::string name(key);
            result.m_properties[name] = at(name);
        }
        return result;
    }

    std::vector<std::string> keys() const;

    /**
     * @brief Parse the property keys of a YAML node (scalars or two-element sequences).
     *
     * Keys listed in @p ignored_keys are skipped, every other key must be a known property.
     *
     * @throw InvalidPropertyError for unknown keys or malformed values.
     */
    static MaterialProperties from_yaml(const YAML::Node& node, const std::vector<std::string>& ignored_keys = {});
};

class MaterialLibrary {
 public:
    MaterialLibrary() = default;
    void load_material_parameters(const std::string& filename);

    std::map<std::string, MaterialProperties> materials;

    const MaterialProperties& get_material(const std::string& name) const;
    void                      print_materials_list() const;
};

}  // namespace elrates::scattering
