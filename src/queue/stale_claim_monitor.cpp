/**
 * @file stale_claim_monitor.cpp
 * @brief Background reclamation of claims left behind by vanished workers
 */

#include <genqueue/queue/stale_claim_monitor.hpp>

namespace genqueue::queue {

stale_claim_monitor::stale_claim_monitor(job_store& store,
                                         monitor_config config,
                                         std::shared_ptr<di::ILogger> logger)
    : store_(store),
      config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

stale_claim_monitor::~stale_claim_monitor() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void stale_claim_monitor::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    stop_requested_.store(false);

    monitor_thread_ = std::thread([this]() {
        run_loop();
    });

    logger_->info_fmt("Stale claim monitor started interval_ms={} threshold_sec={} backend={}",
                      config_.interval.count(), config_.stale_threshold.count(),
                      store_.backend_name());
}

void stale_claim_monitor::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    {
        std::lock_guard lock(mutex_);
        stop_requested_.store(true);
    }

    // Wake up the monitor thread
    cv_.notify_all();

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    logger_->info("Stale claim monitor stopped");
}

auto stale_claim_monitor::is_running() const noexcept -> bool {
    return running_.load();
}

void stale_claim_monitor::set_requeue_callback(requeue_callback callback) {
    on_requeued_ = std::move(callback);
}

auto stale_claim_monitor::get_statistics() const -> monitor_statistics {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// =============================================================================
// Scanning
// =============================================================================

auto stale_claim_monitor::run_cycle() -> Result<std::size_t> {
    auto requeued = store_.requeue_stale(config_.stale_threshold);

    if (requeued.is_err()) {
        {
            std::lock_guard lock(stats_mutex_);
            ++stats_.cycles;
            ++stats_.errors;
        }
        logger_->error_fmt("Stale claim scan failed: {}", requeued.error().message);
        return make_error<std::size_t>(requeued.error().code, requeued.error().message,
                                       "stale_claim_monitor");
    }

    const auto& ids = requeued.value();
    {
        std::lock_guard lock(stats_mutex_);
        ++stats_.cycles;
        stats_.reclaimed += ids.size();
    }

    if (!ids.empty()) {
        logger_->info_fmt("Requeued {} stale job(s) older than {}s", ids.size(),
                          config_.stale_threshold.count());
        if (on_requeued_) {
            on_requeued_(ids);
        }
    }

    return ok(ids.size());
}

void stale_claim_monitor::run_loop() {
    logger_->debug("Stale claim monitor thread started");

    while (!stop_requested_.load()) {
        std::unique_lock<std::mutex> lock(mutex_);

        // Wait for the scan interval or until woken up
        cv_.wait_for(lock, config_.interval, [this]() {
            return stop_requested_.load();
        });

        if (stop_requested_.load()) {
            break;
        }

        lock.unlock();

        // Errors are logged and counted by run_cycle; the next scan retries
        auto cycle = run_cycle();
        (void)cycle;
    }

    logger_->debug("Stale claim monitor thread stopped");
}

}  // namespace genqueue::queue
