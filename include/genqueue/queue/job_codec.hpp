/**
 * @file job_codec.hpp
 * @brief JSON encoding of job records and queue statistics
 *
 * One object shape serves both the local store document and the worker RPC
 * wire format. Decoding never throws: malformed input is reported through
 * Result so a single corrupt record cannot take down a whole store.
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/queue/job_types.hpp>

#include <nlohmann/json.hpp>

#include <optional>

namespace genqueue::queue {

/**
 * @brief Read a JSON integer that fits in int
 * @return The value, or std::nullopt for floats, non-numbers and integers
 *         outside the int range
 */
[[nodiscard]] auto to_checked_int(const nlohmann::json& value) -> std::optional<int>;

/**
 * @brief Encode a job record as a JSON object
 *
 * Absent optionals are written as null; timestamps as ISO-8601 UTC with
 * microseconds.
 */
[[nodiscard]] auto encode_job(const job_record& record) -> nlohmann::json;

/**
 * @brief Decode a job record
 *
 * Requires job_id, status and created_at; every other field falls back to
 * its default when missing or null.
 *
 * @return The record, or invalid_job_record describing the first problem
 */
[[nodiscard]] auto decode_job(const nlohmann::json& value) -> Result<job_record>;

/**
 * @brief Encode a job output reference (output_url, output_dir, scores)
 */
[[nodiscard]] auto encode_output(const job_output& output) -> nlohmann::json;

/**
 * @brief Decode a job output reference from an object holding its fields
 */
[[nodiscard]] auto decode_output(const nlohmann::json& value) -> Result<job_output>;

/**
 * @brief Encode queue statistics
 */
[[nodiscard]] auto encode_stats(const queue_stats& stats) -> nlohmann::json;

/**
 * @brief Decode queue statistics
 */
[[nodiscard]] auto decode_stats(const nlohmann::json& value) -> Result<queue_stats>;

}  // namespace genqueue::queue
