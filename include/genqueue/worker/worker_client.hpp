/**
 * @file worker_client.hpp
 * @brief Poll loop of an ephemeral generation worker
 *
 * A worker claims a job through its queue_endpoint, runs the generation
 * pipeline and reports the outcome. Claims and final reports are retried on
 * transient errors; progress reports are best effort and never interrupt
 * generation.
 *
 * @example
 * @code
 * local_endpoint endpoint(manager);
 * command_pipeline pipeline("./generate.sh", "work");
 * worker_client worker(endpoint, pipeline, {.worker_type = "colab"});
 * worker.run();
 * @endcode
 */

#pragma once

#include <genqueue/core/identifiers.hpp>
#include <genqueue/di/ilogger.hpp>
#include <genqueue/worker/generation_pipeline.hpp>
#include <genqueue/worker/queue_endpoint.hpp>
#include <genqueue/worker/retry_policy.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace genqueue::worker {

/// Progress reported right after a claim, before the pipeline starts
inline constexpr int preparing_progress = 5;

/// Message of the first progress report
inline constexpr std::string_view preparing_message = "claimed, preparing";

/**
 * @brief Worker identity and polling behaviour
 */
struct worker_config {
    std::string worker_id = core::generate_worker_id();
    std::string worker_type{"local"};

    /// Sleep between polls when the queue is empty
    std::chrono::milliseconds poll_interval{std::chrono::seconds{15}};

    /// Exit run() after this long without work (0 = never)
    std::chrono::milliseconds max_idle{0};

    /// Longest a sleeping poll goes without checking the watched stop flag
    std::chrono::milliseconds stop_check_interval{250};

    /// Retry of claim, complete and fail calls
    retry_config retry;
};

/**
 * @brief Counters accumulated over a worker's lifetime
 */
struct worker_statistics {
    std::size_t jobs_claimed{0};
    std::size_t jobs_completed{0};
    std::size_t jobs_failed{0};
    std::size_t report_failures{0};
    std::chrono::milliseconds total_generation_time{0};
};

/**
 * @brief Claims jobs and drives them through a generation pipeline
 */
class worker_client {
public:
    /**
     * @brief Construct a worker
     *
     * The endpoint and pipeline must outlive the worker.
     *
     * @param sleep Backoff sleep used by the retry policy (tests pass a no-op)
     */
    worker_client(queue_endpoint& endpoint,
                  generation_pipeline& pipeline,
                  worker_config config = {},
                  std::shared_ptr<di::ILogger> logger = nullptr,
                  retry_policy::sleeper sleep = nullptr);

    worker_client(const worker_client&) = delete;
    auto operator=(const worker_client&) -> worker_client& = delete;

    /**
     * @brief Claim and process at most one job
     * @return true if a job was claimed and processed
     */
    auto run_once() -> bool;

    /**
     * @brief Poll until stopped or idle for longer than max_idle
     */
    void run();

    /**
     * @brief Ask run() to return; wakes a sleeping poll. Safe from any thread,
     *        but not from a signal handler (use watch_stop_flag there).
     */
    void request_stop();

    /**
     * @brief Also stop once @p flag becomes true
     *
     * The flag is only read, so a signal handler may set it. A sleeping poll
     * notices it within stop_check_interval. The flag must outlive the worker.
     */
    void watch_stop_flag(const std::atomic<bool>& flag) noexcept {
        external_stop_.store(&flag);
    }

    [[nodiscard]] auto stop_requested() const noexcept -> bool {
        if (stop_requested_.load()) {
            return true;
        }
        const auto* flag = external_stop_.load();
        return flag != nullptr && flag->load();
    }

    [[nodiscard]] auto get_statistics() const -> worker_statistics;

    [[nodiscard]] auto config() const noexcept -> const worker_config& {
        return config_;
    }

private:
    class endpoint_sink;

    /// Sleep for poll_interval, waking early when a stop is requested
    void wait_for_next_poll();

    void process(const queue::job_record& job);
    void finish_success(const queue::job_record& job, const queue::job_output& output);
    void finish_failure(const queue::job_record& job, const std::string& error);
    void count_report_failure();

    queue_endpoint& endpoint_;
    generation_pipeline& pipeline_;
    worker_config config_;
    std::shared_ptr<di::ILogger> logger_;
    retry_policy retry_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<const std::atomic<bool>*> external_stop_{nullptr};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    mutable std::mutex stats_mutex_;
    worker_statistics stats_;
};

}  // namespace genqueue::worker
