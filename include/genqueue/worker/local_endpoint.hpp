/**
 * @file local_endpoint.hpp
 * @brief Queue endpoint for workers running in the queue's own process
 */

#pragma once

#include <genqueue/queue/queue_manager.hpp>
#include <genqueue/worker/queue_endpoint.hpp>

namespace genqueue::worker {

/**
 * @brief Direct calls on a queue_manager
 */
class local_endpoint final : public queue_endpoint {
public:
    explicit local_endpoint(queue::queue_manager& manager) : manager_(manager) {}

    [[nodiscard]] auto claim(std::string_view worker_id, std::string_view worker_type)
        -> Result<std::optional<queue::job_record>> override;

    [[nodiscard]] auto report_progress(std::string_view job_id,
                                       const queue::progress_report& report)
        -> VoidResult override;

    [[nodiscard]] auto report_complete(std::string_view job_id,
                                       const queue::job_output& output,
                                       std::string_view worker_id) -> VoidResult override;

    [[nodiscard]] auto report_failure(std::string_view job_id, std::string_view error,
                                      std::string_view worker_id)
        -> Result<queue::job_status> override;

    [[nodiscard]] auto describe() const -> std::string_view override {
        return "local";
    }

private:
    queue::queue_manager& manager_;
};

}  // namespace genqueue::worker
