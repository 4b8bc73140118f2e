/**
 * @file job_store.hpp
 * @brief Storage contract shared by the local and the shared job store
 *
 * Every primitive is atomic with respect to every other primitive on the same
 * store, including calls from other threads (and, for the shared store, other
 * processes). Callers depend only on this interface.
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/queue/job_types.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace genqueue::queue {

/**
 * @brief Source of "now" for every timestamp a store writes
 *
 * Tests inject a controllable clock to age claims.
 */
using clock_source = std::function<timestamp()>;

/**
 * @brief Default clock: system time truncated to microseconds
 */
[[nodiscard]] auto system_clock_source() -> clock_source;

/**
 * @brief Abstract job store
 *
 * Thread Safety: implementations are safe to call from any thread.
 */
class job_store {
public:
    virtual ~job_store() = default;

    // Non-copyable, non-movable
    job_store(const job_store&) = delete;
    auto operator=(const job_store&) -> job_store& = delete;
    job_store(job_store&&) = delete;
    auto operator=(job_store&&) -> job_store& = delete;

    /**
     * @brief Insert a new QUEUED record
     * @return The job id, or invalid_job_record / duplicate_job / a storage error
     */
    [[nodiscard]] virtual auto enqueue(const job_record& record)
        -> Result<std::string> = 0;

    /**
     * @brief Atomically take the best QUEUED job
     *
     * Best means lowest priority, then earliest created_at, then insertion
     * order. Exactly one of any number of concurrent callers wins a job.
     *
     * @return The claimed record, or std::nullopt when nothing was claimed
     */
    [[nodiscard]] virtual auto claim(std::string_view worker_id,
                                     std::string_view worker_type)
        -> Result<std::optional<job_record>> = 0;

    /**
     * @brief Record progress on an in-flight job
     *
     * Reports on jobs that are no longer in flight, or that are held by a
     * different worker, succeed without changing anything.
     *
     * @return job_not_found for an unknown id, or a storage error
     */
    [[nodiscard]] virtual auto update_progress(std::string_view job_id,
                                               const progress_report& report)
        -> VoidResult = 0;

    /**
     * @brief Mark an in-flight job complete
     *
     * Repeating the call on a complete job succeeds and keeps the first output.
     *
     * @return stale_claim when the job is not in flight or held by someone else
     */
    [[nodiscard]] virtual auto complete(std::string_view job_id,
                                        const job_output& output,
                                        const std::optional<std::string>& worker_id)
        -> VoidResult = 0;

    /**
     * @brief Consume one attempt of an in-flight job
     * @return queued when retried, dead when attempts are exhausted, or
     *         stale_claim when the job is not in flight or held by someone else
     */
    [[nodiscard]] virtual auto fail(std::string_view job_id,
                                    std::string_view error,
                                    const std::optional<std::string>& worker_id)
        -> Result<job_status> = 0;

    /**
     * @brief Return in-flight jobs claimed before now - threshold to the queue
     *
     * The attempt counter is left unchanged.
     *
     * @return Ids of the requeued jobs
     */
    [[nodiscard]] virtual auto requeue_stale(std::chrono::seconds threshold)
        -> Result<std::vector<std::string>> = 0;

    /**
     * @brief Look up one job
     */
    [[nodiscard]] virtual auto get(std::string_view job_id)
        -> Result<std::optional<job_record>> = 0;

    /**
     * @brief Count jobs by status
     */
    [[nodiscard]] virtual auto stats() -> Result<queue_stats> = 0;

    /**
     * @brief Short backend name used in log messages ("local", "shared")
     */
    [[nodiscard]] virtual auto backend_name() const noexcept -> std::string_view = 0;

protected:
    job_store() = default;
};

}  // namespace genqueue::queue
