/**
 * @file timestamp.cpp
 * @brief ISO-8601 timestamp conversion
 */

#include <genqueue/core/timestamp.hpp>
#include <genqueue/compat/time.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace genqueue::core {

auto to_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto micros = std::chrono::floor<std::chrono::microseconds>(tp);
    auto secs = std::chrono::floor<std::chrono::seconds>(micros);
    auto fraction = (micros - secs).count();

    auto time = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(secs));
    std::tm tm{};
    if (compat::gmtime_safe(&time, &tm) == nullptr) {
        return {};
    }

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%06lldZ", date,
                  static_cast<long long>(fraction));
    return buf;
}

auto from_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point> {
    // Minimum: "YYYY-MM-DDTHH:MM:SS"
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::string head(text.substr(0, 19));
    std::tm tm{};
    char sep = 0;
    if (std::sscanf(head.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &sep,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != ' ') {
        return std::nullopt;
    }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    long long micros = 0;
    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos]))) {
            // Digits beyond microseconds are dropped
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    auto seconds = compat::timegm_safe(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(
               std::chrono::microseconds(micros));
}

}  // namespace genqueue::core
