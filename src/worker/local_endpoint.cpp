/**
 * @file local_endpoint.cpp
 * @brief Queue endpoint for workers running in the queue's own process
 */

#include <genqueue/worker/local_endpoint.hpp>

namespace genqueue::worker {

auto local_endpoint::claim(std::string_view worker_id, std::string_view worker_type)
    -> Result<std::optional<queue::job_record>> {
    return manager_.claim(worker_id, worker_type);
}

auto local_endpoint::report_progress(std::string_view job_id,
                                     const queue::progress_report& report) -> VoidResult {
    return manager_.update_progress(job_id, report);
}

auto local_endpoint::report_complete(std::string_view job_id,
                                     const queue::job_output& output,
                                     std::string_view worker_id) -> VoidResult {
    return manager_.complete(job_id, output, std::string(worker_id));
}

auto local_endpoint::report_failure(std::string_view job_id, std::string_view error,
                                    std::string_view worker_id)
    -> Result<queue::job_status> {
    return manager_.fail(job_id, error, std::string(worker_id));
}

}  // namespace genqueue::worker
