#pragma once

#include <stdexcept>
#include <string>

namespace pem {

/**
 * @brief Thrown when a caller supplies a malformed identifier or window
 *
 * Raised synchronously by the event manager before anything is scheduled.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @brief Thrown when the process configuration cannot be loaded
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace pem
