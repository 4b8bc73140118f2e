/**
 * @file queue_manager.hpp
 * @brief Submission API and single in-process entry point to the job store
 *
 * The queue manager is built once at startup around the configured job store
 * and passed by reference to whatever needs it: the worker's local endpoint,
 * the RPC dispatcher and the admin tool. Every state transition that goes
 * through it is written to the audit trail.
 *
 * @example
 * @code
 * auto store = storage::make_job_store(config);
 * queue_manager manager(std::move(store.value()));
 * manager.start_monitor();
 *
 * job_input input;
 * input.audio_path = "/uploads/track.wav";
 * auto job = manager.submit(input);
 * @endcode
 */

#pragma once

#include <genqueue/di/ilogger.hpp>
#include <genqueue/queue/job_store.hpp>
#include <genqueue/queue/stale_claim_monitor.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace genqueue::queue {

/**
 * @brief Queue manager configuration
 */
struct queue_manager_config {
    /// Priority for submissions that do not give one
    int priority{queue::default_priority};

    /// Attempts for submissions that do not give a limit
    int max_attempts{queue::default_max_attempts};

    /// Stale-claim monitor timing
    monitor_config monitor;
};

/**
 * @brief Job submission, inspection and worker-facing façade
 *
 * Thread Safety: all methods are thread-safe.
 */
class queue_manager {
public:
    /**
     * @brief Construct around an opened store
     *
     * @param store The job store (owned)
     * @param config Submission defaults and monitor timing
     * @param clock Source of creation timestamps (should match the store's)
     * @param logger Logger instance
     */
    explicit queue_manager(std::unique_ptr<job_store> store,
                           queue_manager_config config = {},
                           clock_source clock = system_clock_source(),
                           std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Destructor - stops the monitor
     */
    ~queue_manager();

    queue_manager(const queue_manager&) = delete;
    auto operator=(const queue_manager&) -> queue_manager& = delete;
    queue_manager(queue_manager&&) = delete;
    auto operator=(queue_manager&&) -> queue_manager& = delete;

    // =========================================================================
    // Submission
    // =========================================================================

    /**
     * @brief Create a QUEUED job for full generation
     *
     * @param input Source media and parameters, carried verbatim
     * @param options Priority, attempt limit and optional caller-chosen id
     * @return The stored record
     */
    [[nodiscard]] auto submit(job_input input, const submit_options& options = {})
        -> Result<job_record>;

    /**
     * @brief Look up a job
     * @return The record, or std::nullopt for an unknown id
     */
    [[nodiscard]] auto get_status(std::string_view job_id)
        -> Result<std::optional<job_record>>;

    /**
     * @brief Count jobs by status
     */
    [[nodiscard]] auto get_stats() -> Result<queue_stats>;

    // =========================================================================
    // Stale-Claim Monitor
    // =========================================================================

    /**
     * @brief Start the monitor with the configured interval
     */
    void start_monitor();

    /**
     * @brief Start the monitor with an explicit interval
     *
     * Has no effect while the monitor is already running.
     */
    void start_monitor(std::chrono::milliseconds interval);

    void stop_monitor();

    [[nodiscard]] auto is_monitor_running() const -> bool;

    /**
     * @brief Run one stale-claim scan now, whether or not the monitor runs
     * @return Number of jobs requeued
     */
    auto run_monitor_cycle() -> Result<std::size_t>;

    [[nodiscard]] auto get_monitor_statistics() const -> monitor_statistics;

    // =========================================================================
    // Worker Operations
    // =========================================================================

    [[nodiscard]] auto claim(std::string_view worker_id, std::string_view worker_type)
        -> Result<std::optional<job_record>>;

    [[nodiscard]] auto update_progress(std::string_view job_id,
                                       const progress_report& report) -> VoidResult;

    [[nodiscard]] auto complete(std::string_view job_id, const job_output& output,
                                const std::optional<std::string>& worker_id = std::nullopt)
        -> VoidResult;

    [[nodiscard]] auto fail(std::string_view job_id, std::string_view error,
                            const std::optional<std::string>& worker_id = std::nullopt)
        -> Result<job_status>;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] auto store() noexcept -> job_store&;

    [[nodiscard]] auto config() const noexcept -> const queue_manager_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace genqueue::queue
