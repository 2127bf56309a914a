/**
 * @file time_utils.cpp
 * @brief Time formatting utilities implementation
 */

#include "guardrails/utils/time_utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace guardrails {
namespace utils {

std::string formatIso8601(const std::chrono::system_clock::time_point& tp) {
    std::time_t time_t_value = std::chrono::system_clock::to_time_t(tp);

    // Convert to tm struct (UTC)
    struct tm tm_time;
    if (!gmtime_r(&time_t_value, &tm_time)) {
        return "";
    }

    // Format as ISO8601: YYYY-MM-DDTHH:MM:SSZ
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tm_time.tm_year + 1900) << '-'
        << std::setw(2) << (tm_time.tm_mon + 1) << '-'
        << std::setw(2) << tm_time.tm_mday << 'T'
        << std::setw(2) << tm_time.tm_hour << ':'
        << std::setw(2) << tm_time.tm_min << ':'
        << std::setw(2) << tm_time.tm_sec << 'Z';

    return oss.str();
}

std::chrono::system_clock::time_point fromUnixTimestamp(int64_t timestamp) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(timestamp));
}

} // namespace utils
} // namespace guardrails
