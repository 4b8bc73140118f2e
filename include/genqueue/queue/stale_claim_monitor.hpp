/**
 * @file stale_claim_monitor.hpp
 * @brief Background reclamation of claims left behind by vanished workers
 *
 * Workers on preemptible machines disappear without reporting. The monitor
 * periodically returns every in-flight job whose claim is older than the
 * staleness threshold to the queue, without consuming a retry. Several
 * monitors may run against the same shared store; requeue is conditional so
 * they never double-count a job.
 */

#pragma once

#include <genqueue/di/ilogger.hpp>
#include <genqueue/queue/job_store.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace genqueue::queue {

/**
 * @brief Monitor timing
 */
struct monitor_config {
    /// Delay between scans
    std::chrono::milliseconds interval{std::chrono::seconds{30}};

    /// Claims older than this are reclaimed
    std::chrono::seconds stale_threshold{std::chrono::minutes{30}};
};

/**
 * @brief Cumulative monitor counters
 */
struct monitor_statistics {
    std::size_t cycles{0};     ///< Scans executed
    std::size_t reclaimed{0};  ///< Jobs returned to the queue
    std::size_t errors{0};     ///< Scans that failed on a store error
};

/**
 * @brief Periodic stale-claim scanner
 *
 * @example
 * @code
 * stale_claim_monitor monitor(store, {std::chrono::seconds{30}, std::chrono::minutes{30}});
 * monitor.start();
 * // ...
 * monitor.stop();
 * @endcode
 */
class stale_claim_monitor {
public:
    /// Called with the ids requeued by one scan (never empty)
    using requeue_callback = std::function<void(const std::vector<std::string>&)>;

    /**
     * @brief Construct a monitor over a store that outlives it
     */
    explicit stale_claim_monitor(job_store& store,
                                 monitor_config config = {},
                                 std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Destructor - stops the background thread
     */
    ~stale_claim_monitor();

    stale_claim_monitor(const stale_claim_monitor&) = delete;
    auto operator=(const stale_claim_monitor&) -> stale_claim_monitor& = delete;
    stale_claim_monitor(stale_claim_monitor&&) = delete;
    auto operator=(stale_claim_monitor&&) -> stale_claim_monitor& = delete;

    /**
     * @brief Start the background thread (no-op when already running)
     */
    void start();

    /**
     * @brief Wake and join the background thread (no-op when stopped)
     */
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool;

    /**
     * @brief Execute one scan on the calling thread
     * @return Number of jobs requeued, or the store error
     */
    auto run_cycle() -> Result<std::size_t>;

    /**
     * @brief Register a callback for requeued jobs
     *
     * Must be set before start().
     */
    void set_requeue_callback(requeue_callback callback);

    [[nodiscard]] auto get_statistics() const -> monitor_statistics;

    [[nodiscard]] auto config() const noexcept -> const monitor_config& {
        return config_;
    }

private:
    void run_loop();

    job_store& store_;
    monitor_config config_;
    std::shared_ptr<di::ILogger> logger_;
    requeue_callback on_requeued_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread monitor_thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    mutable std::mutex stats_mutex_;
    monitor_statistics stats_;
};

}  // namespace genqueue::queue
