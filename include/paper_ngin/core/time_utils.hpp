#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of safe_gmtime (tm in UTC to time_t)
 */
inline std::time_t safe_timegm(std::tm* time_info) {
#ifdef _WIN32
    return _mkgmtime(time_info);
#else
    return timegm(time_info);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as "YYYY-MM-DDTHH:MM:SSZ" (UTC, second precision)
 */
inline std::string to_iso8601(const Timestamp& ts) {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_c, &time_info);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &time_info);
    return std::string(buffer);
}

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS" with an optional trailing "Z" or "+00:00"
 * @return std::nullopt if the string is not a valid timestamp
 */
inline std::optional<Timestamp> from_iso8601(const std::string& value) {
    std::tm time_info = {};
    std::istringstream ss(value);
    ss >> std::get_time(&time_info, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::time_t time_c = safe_timegm(&time_info);
    if (time_c == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time_c);
}

}  // namespace core
}  // namespace paper_ngin
