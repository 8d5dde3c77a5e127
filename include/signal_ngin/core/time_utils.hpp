#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <string>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
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
 * @brief Format a timestamp with a strftime format string
 *
 * @param ts Timestamp to format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string format_timestamp(Timestamp ts, const char* format,
                                    bool use_local_time = true) {
    auto ts_c = std::chrono::system_clock::to_time_t(ts);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&ts_c, &result);
    } else {
        safe_gmtime(&ts_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Get current time as a string with specified format
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    return format_timestamp(std::chrono::system_clock::now(), format, use_local_time);
}

// Unix epoch milliseconds, the wire format used by candle sources
inline int64_t to_unix_millis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

}  // namespace core
}  // namespace signal_ngin
