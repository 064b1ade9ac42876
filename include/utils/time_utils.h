#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace pem {
namespace utils {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Make a timezone the process-wide zone for local time conversions
 *
 * Sets TZ and calls tzset(). Names without a zoneinfo entry fall back to UTC.
 *
 * @param name IANA zone name, e.g. "Europe/Berlin"; empty means UTC
 * @return std::string The zone actually applied
 */
std::string applyTimezone(const std::string& name);

/**
 * @brief Format a timestamp as "YYYY-MM-DD HH:MM:SS+zzzz" in the process timezone
 */
std::string formatTimestamp(Timestamp tp);

/**
 * @brief Format a timestamp in compact form "YYYYMMDDTHHMMSS+zzzz"
 *
 * This is the form used in recording segment file names.
 */
std::string formatCompactTimestamp(Timestamp tp);

/**
 * @brief Parse a compact timestamp ("YYYYMMDDTHHMMSS+zzzz" or "...Z")
 *
 * @return std::nullopt if the text is not a valid compact timestamp
 */
std::optional<Timestamp> parseCompactTimestamp(const std::string& text);

/// Longest window accepted for a start request or a default (one hundred years)
constexpr double kMaxWindowMinutes = 525600.0 * 100;

/**
 * @brief Convert (possibly fractional) minutes to a system clock duration
 * @throws std::out_of_range when minutes is negative, not finite or above kMaxWindowMinutes
 */
std::chrono::system_clock::duration minutesToDuration(double minutes);

/**
 * @brief Seconds between two timestamps as a double
 */
double secondsBetween(Timestamp from, Timestamp to);

} // namespace utils
} // namespace pem
