#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <optional>
#include "common/types.hpp"

namespace betarb {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);

/**
 * Parse ISO 8601 string to timestamp.
 * Accepts "Z", "+HH:MM"/"-HH:MM" offsets, or no offset (treated as UTC).
 * Returns nullopt when the string is not a timestamp.
 */
std::optional<WallClock> parse_iso8601(const std::string& s);

/**
 * Get current timestamp as ISO 8601.
 */
std::string now_iso8601();

/**
 * Broken-down local time (thread-safe).
 */
std::tm local_tm(WallClock t);

/**
 * Format a number of seconds as "1h 30m" / "5m 10s" / "42s".
 */
std::string format_duration_seconds(int64_t seconds);

} // namespace time_utils
} // namespace betarb
