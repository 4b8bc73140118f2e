/**
 * @file queue_endpoint.hpp
 * @brief How a worker reaches the queue
 *
 * A worker pulls jobs and reports outcomes through this interface whether it
 * runs next to the store (local_endpoint) or on a remote machine that talks
 * to the API process (remote_endpoint).
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/queue/job_types.hpp>

#include <optional>
#include <string_view>

namespace genqueue::worker {

/**
 * @brief Worker-side view of the queue
 */
class queue_endpoint {
public:
    virtual ~queue_endpoint() = default;

    /**
     * @brief Try to claim the next job
     * @return The claimed job, or std::nullopt when none is available
     */
    [[nodiscard]] virtual auto claim(std::string_view worker_id,
                                     std::string_view worker_type)
        -> Result<std::optional<queue::job_record>> = 0;

    [[nodiscard]] virtual auto report_progress(std::string_view job_id,
                                               const queue::progress_report& report)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto report_complete(std::string_view job_id,
                                               const queue::job_output& output,
                                               std::string_view worker_id)
        -> VoidResult = 0;

    /**
     * @return The status the job moved to (queued or dead)
     */
    [[nodiscard]] virtual auto report_failure(std::string_view job_id,
                                              std::string_view error,
                                              std::string_view worker_id)
        -> Result<queue::job_status> = 0;

    /// Short description for log messages
    [[nodiscard]] virtual auto describe() const -> std::string_view = 0;

protected:
    queue_endpoint() = default;
    queue_endpoint(const queue_endpoint&) = default;
    queue_endpoint& operator=(const queue_endpoint&) = default;
};

}  // namespace genqueue::worker
