#pragma once

#include <string>

namespace pem {
namespace utils {

/**
 * @brief Generate a lowercase random UUID string
 */
std::string generateUniqueId();

/**
 * @brief Check whether an identifier is usable as an event key
 *
 * Identifiers name a directory under the downloads root, so only
 * [A-Za-z0-9._-] is allowed, 1 to 128 characters, and "." / ".." are rejected.
 */
bool isValidIdentifier(const std::string& identifier);

} // namespace utils
} // namespace pem
