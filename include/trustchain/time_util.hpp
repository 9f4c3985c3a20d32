/**
 * @file time_util.hpp
 * @brief RFC 3339 timestamps
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace trustchain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Format as UTC RFC 3339 with millisecond precision,
 * e.g. "2025-03-01T12:00:00.123Z"
 */
std::string formatRfc3339(TimePoint tp);

/**
 * @brief Parse RFC 3339 / ISO 8601 date-time ("Z" or "+hh:mm" offsets,
 * optional fractional seconds). A bare date ("2025-03-01") is midnight UTC.
 * @return std::nullopt if the text is not a valid timestamp
 */
std::optional<TimePoint> parseRfc3339(std::string_view text);

}  // namespace trustchain
