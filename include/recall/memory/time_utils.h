#pragma once

#include <recall/core/types.h>

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>

namespace recall::memory {

/**
 * @brief Parse a payload timestamp.
 *
 * Accepted forms:
 *  - ISO 8601 "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds, "Z" or +HH:MM offset
 *  - date only "YYYY-MM-DD" (midnight UTC)
 *  - unix time in seconds or milliseconds (string of digits)
 */
std::optional<TimePoint> parseTimestamp(const std::string& text);

/**
 * @brief Parse a timestamp held in a JSON value (string or number of unix seconds/millis)
 */
std::optional<TimePoint> parseTimestamp(const nlohmann::json& value);

/**
 * @brief Elapsed days between @p ts and @p now, clamped at 0 (future timestamps count as now)
 */
double ageInDays(const std::optional<TimePoint>& ts, TimePoint now);

} // namespace recall::memory
