#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace crossarb {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);

/**
 * Parse ISO 8601 string to timestamp. Throws std::invalid_argument on garbage.
 */
WallClock from_iso8601(const std::string& s);

/**
 * UTC calendar date of a timestamp, formatted YYYY-MM-DD.
 * Daily risk counters are keyed by this value.
 */
std::string utc_date(WallClock t);

/**
 * Hours elapsed from `since` to `until` (negative if until precedes since).
 */
double hours_between(WallClock since, WallClock until);

} // namespace time_utils
} // namespace crossarb
