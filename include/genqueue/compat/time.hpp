/**
 * @file time.hpp
 * @brief Compatibility header for cross-platform UTC time conversion
 *
 * POSIX and Windows disagree on both the names and the argument order of the
 * thread-safe broken-down time functions. These wrappers hide the difference.
 */

#pragma once

#include <ctime>

namespace genqueue::compat {

/**
 * @brief Thread-safe UTC conversion (gmtime_r / gmtime_s)
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of gmtime_safe (timegm / _mkgmtime)
 * @param tm Broken-down UTC time
 * @return Seconds since the epoch, or -1 if the value cannot be represented
 */
inline std::time_t timegm_safe(std::tm* tm) {
#if defined(_WIN32) || defined(_WIN64)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

}  // namespace genqueue::compat
