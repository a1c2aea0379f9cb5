// include/barsim/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include "barsim/core/types.hpp"

namespace barsim {
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
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
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
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
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
 * @brief Format a bar timestamp in UTC
 * @param ts Timestamp to format
 * @param format strftime format, defaults to ISO date and time
 */
inline std::string format_timestamp(const Timestamp& ts,
                                    const char* format = "%Y-%m-%d %H:%M:%S") {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    safe_gmtime(&time_c, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

/**
 * @brief Seconds since the Unix epoch for a timestamp
 */
inline int64_t to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

/**
 * @brief Timestamp from seconds since the Unix epoch
 */
inline Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

}  // namespace core
}  // namespace barsim
