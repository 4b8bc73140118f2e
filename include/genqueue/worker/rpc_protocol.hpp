/**
 * @file rpc_protocol.hpp
 * @brief JSON wire format of the worker queue RPCs
 *
 * Remote workers reach the queue through the API process. Both sides use
 * these routes and codecs: remote_endpoint encodes requests and decodes
 * responses, rpc_dispatcher does the opposite. HTTP framing is left to the
 * hosting server.
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/queue/job_types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace genqueue::worker {

// =============================================================================
// Routes
// =============================================================================

namespace routes {
inline constexpr std::string_view claim = "/api/v2/queue/claim";
inline constexpr std::string_view progress = "/api/v2/queue/progress";
inline constexpr std::string_view complete = "/api/v2/queue/complete";
inline constexpr std::string_view fail = "/api/v2/queue/fail";
inline constexpr std::string_view submit = "/api/v2/queue/submit";
inline constexpr std::string_view stats = "/api/v2/queue/stats";
inline constexpr std::string_view status = "/api/v2/queue/status";
}  // namespace routes

/// Timeout for claim, complete and fail calls
inline constexpr std::chrono::milliseconds report_timeout{10000};

/// Timeout for progress calls
inline constexpr std::chrono::milliseconds progress_timeout{5000};

/// Message returned with an empty claim
inline constexpr std::string_view no_jobs_message = "No jobs available";

// =============================================================================
// Messages
// =============================================================================

/**
 * @brief One outgoing RPC
 */
struct rpc_call {
    std::string route;                  ///< One of routes::*
    std::string body;                   ///< JSON request body
    std::chrono::milliseconds timeout;  ///< Transport deadline
};

/**
 * @brief Response to an RPC
 */
struct rpc_response {
    int status_code{200};
    std::string body;
};

/// HTTP-style status codes used by the dispatcher
namespace status_codes {
inline constexpr int ok = 200;
inline constexpr int bad_request = 400;
inline constexpr int not_found = 404;
inline constexpr int conflict = 409;
inline constexpr int internal_error = 500;
}  // namespace status_codes

// =============================================================================
// Request Encoding
// =============================================================================

[[nodiscard]] auto make_claim_call(std::string_view worker_id, std::string_view worker_type)
    -> rpc_call;

[[nodiscard]] auto make_progress_call(std::string_view job_id,
                                      const queue::progress_report& report) -> rpc_call;

[[nodiscard]] auto make_complete_call(std::string_view job_id,
                                      const queue::job_output& output,
                                      std::string_view worker_id) -> rpc_call;

[[nodiscard]] auto make_fail_call(std::string_view job_id, std::string_view error,
                                  std::string_view worker_id) -> rpc_call;

// =============================================================================
// Response Encoding / Decoding
// =============================================================================

/**
 * @brief Build an error response body {ok:false, error, code}
 */
[[nodiscard]] auto make_error_response(int status_code, const error_info& error)
    -> rpc_response;

/**
 * @brief Convert a non-200 response back into the error it reports
 *
 * Uses the body's code when present; otherwise 5xx maps to
 * rpc_transport_error and anything else to rpc_rejected.
 */
[[nodiscard]] auto response_error(const rpc_response& response) -> error_info;

/**
 * @brief Parse a JSON body, reporting rpc_decode_error on failure
 */
[[nodiscard]] auto parse_body(std::string_view body) -> Result<nlohmann::json>;

/**
 * @brief Decode a claim response
 * @return The claimed record, or std::nullopt for {job: null}
 */
[[nodiscard]] auto decode_claim_response(const rpc_response& response)
    -> Result<std::optional<queue::job_record>>;

/**
 * @brief Decode an {ok: ...} acknowledgement
 */
[[nodiscard]] auto decode_ack_response(const rpc_response& response) -> VoidResult;

/**
 * @brief Decode a fail response
 * @return The resulting job status (queued or dead)
 */
[[nodiscard]] auto decode_fail_response(const rpc_response& response)
    -> Result<queue::job_status>;

}  // namespace genqueue::worker
