/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * UTC formatting helpers for artifact headers and build reports.
 *
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace guardrails {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 string (UTC)
 *
 * @param tp std::chrono time_point
 * @return ISO 8601 string with second precision (e.g., "2026-02-02T12:34:56Z"),
 *         or empty string if the time cannot be represented
 */
std::string formatIso8601(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Get current time as time_point
 *
 * @return Current system time
 */
inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Convert Unix timestamp (seconds since epoch) to time_point
 *
 * @param timestamp Unix timestamp
 * @return std::chrono time_point
 */
std::chrono::system_clock::time_point fromUnixTimestamp(int64_t timestamp);

} // namespace utils
} // namespace guardrails
