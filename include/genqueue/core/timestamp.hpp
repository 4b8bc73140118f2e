/**
 * @file timestamp.hpp
 * @brief ISO-8601 timestamp conversion with microsecond precision
 *
 * Job timestamps are persisted as fixed-width UTC strings
 * ("2026-10-18T09:30:00.123456Z") so that lexicographic order equals
 * chronological order, both in the JSON document and in SQL comparisons.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace genqueue::core {

/**
 * @brief Truncate a time point to whole microseconds
 *
 * Every timestamp the queue stores goes through this so that a value read
 * back from storage compares equal to the value that was written.
 */
[[nodiscard]] inline std::chrono::system_clock::time_point truncate_to_micros(
    std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::floor<std::chrono::microseconds>(tp));
}

/**
 * @brief Format a time point as ISO-8601 UTC with microseconds
 */
[[nodiscard]] auto to_iso8601(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Parse an ISO-8601 UTC timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff][Z]" and the space-separated form.
 *
 * @return Parsed time point, or std::nullopt if the text is malformed
 */
[[nodiscard]] auto from_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point>;

}  // namespace genqueue::core
