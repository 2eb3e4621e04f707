/**
 * @file scattering_errors.hpp
 * @brief Exceptions raised while building or evaluating elastic scattering mechanisms.
 * @version 0.1
 * @date 2026-10-14
 *
 * Numerical degeneracies (T = 0, q = 0, zero dielectric constant) are not exceptions:
 * infinities and NaNs are propagated in the returned arrays.
 *
 */

#pragma once

#include <stdexcept>
#include <string>

namespace elrates::scattering {

class ElasticScatteringError : public std::runtime_error {
 public:
    explicit ElasticScatteringError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A material property required by a mechanism is absent.
 *
 */
class MissingPropertyError : public ElasticScatteringError {
 private:
    std::string m_property_name;

 public:
    explicit MissingPropertyError(const std::string& property_name)
        : ElasticScatteringError("Missing material property: " + property_name),
          m_property_name(property_name) {}

    const std::string& property_name() const noexcept { return m_property_name; }
};

/**
 * @brief A material property is present but unknown or of the wrong kind (pair vs scalar).
 *
 */
class InvalidPropertyError : public ElasticScatteringError {
 public:
    explicit InvalidPropertyError(const std::string& message) : ElasticScatteringError(message) {}
};

/**
 * @brief Doping / temperature / band / spin dimensions disagree with the transport state.
 *
 */
class ShapeMismatchError : public ElasticScatteringError {
 public:
    explicit ShapeMismatchError(const std::string& message) : ElasticScatteringError(message) {}
};

}  // namespace elrates::scattering
