#pragma once

#include <chrono>
#include <string>

namespace sdb {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Format a timestamp as ISO-8601 UTC ("2025-01-31T12:00:00Z")
 */
std::string to_iso8601(Timestamp t);

/**
 * @brief Parse an ISO-8601 UTC timestamp produced by to_iso8601
 *
 * Fractional seconds and a trailing "Z" are accepted and ignored.
 * @throws std::invalid_argument on malformed input
 */
Timestamp from_iso8601(const std::string& text);

/**
 * @brief Whole days elapsed from `from` to `to` (negative if `to` is earlier)
 */
long days_between(Timestamp from, Timestamp to);

/**
 * @brief Random lowercase hex string of the given length
 */
std::string random_hex(size_t length);

} // namespace sdb
