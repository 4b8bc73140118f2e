/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the generation job queue
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for genqueue, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace genqueue {

/**
 * @brief Result type alias for queue operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief genqueue-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int genqueue_base = -900;

    // Job errors (-900 to -909)
    constexpr int job_not_found = genqueue_base - 0;
    constexpr int invalid_job_record = genqueue_base - 1;
    constexpr int duplicate_job = genqueue_base - 2;
    constexpr int stale_claim = genqueue_base - 3;

    // Local store errors (-920 to -929)
    constexpr int store_read_error = genqueue_base - 20;
    constexpr int store_write_error = genqueue_base - 21;
    constexpr int store_corrupt = genqueue_base - 22;

    // Database errors (-930 to -939)
    constexpr int database_open_error = genqueue_base - 30;
    constexpr int database_query_error = genqueue_base - 31;
    constexpr int database_busy = genqueue_base - 32;

    // RPC errors (-950 to -959)
    constexpr int rpc_transport_error = genqueue_base - 50;
    constexpr int rpc_timeout = genqueue_base - 51;
    constexpr int rpc_bad_request = genqueue_base - 52;
    constexpr int rpc_unknown_route = genqueue_base - 53;
    constexpr int rpc_decode_error = genqueue_base - 54;
    constexpr int rpc_rejected = genqueue_base - 55;

    // Configuration errors (-970 to -979)
    constexpr int config_file_error = genqueue_base - 70;
    constexpr int config_parse_error = genqueue_base - 71;
    constexpr int config_invalid = genqueue_base - 72;

    // Worker errors (-980 to -989)
    constexpr int pipeline_failed = genqueue_base - 80;

    /**
     * @brief Check whether an error is worth retrying at the call site
     *
     * Storage I/O failures and transport failures are transient. Rejections
     * (stale claims, unknown jobs, malformed requests) are not.
     */
    [[nodiscard]] constexpr bool is_transient(int code) noexcept {
        return code == store_read_error ||
               code == store_write_error ||
               code == database_query_error ||
               code == database_busy ||
               code == rpc_transport_error ||
               code == rpc_timeout;
    }
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;

/**
 * @brief Create a genqueue error result with module context
 * @tparam T The result value type
 * @param code Error code from genqueue::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> genqueue_error(int code, const std::string& message,
                                const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "genqueue");
    }
    return kcenon::common::make_error<T>(code, message, "genqueue", details);
}

/**
 * @brief Create a genqueue void error result
 * @param code Error code from genqueue::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult genqueue_void_error(int code, const std::string& message,
                                      const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "genqueue"});
    }
    return VoidResult(error_info{code, message, "genqueue", details});
}

} // namespace genqueue

