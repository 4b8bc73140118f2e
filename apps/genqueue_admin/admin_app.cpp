/**
 * @file admin_app.cpp
 * @brief Queue administration application implementation
 */

#include "admin_app.hpp"

#include <genqueue/integration/logger_adapter.hpp>
#include <genqueue/queue/job_codec.hpp>
#include <genqueue/storage/job_store_factory.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <thread>

namespace genqueue::apps {

namespace {

/// How often the monitor command checks for a shutdown request
constexpr std::chrono::milliseconds stop_check_interval{250};

}  // namespace

admin_app::admin_app(const admin_app_config& config) : config_(config) {}

admin_app::~admin_app() {
    manager_.reset();
    integration::logger_adapter::shutdown();
}

bool admin_app::initialize() {
    const auto& settings = config_.settings;

    integration::logger_adapter::initialize(settings.logging);
    logger_ = std::make_shared<di::LoggerService>();

    auto store = storage::make_job_store(settings, queue::system_clock_source(), logger_);
    if (store.is_err()) {
        std::cerr << "Error: Failed to open job store: " << store.error().message << "\n";
        return false;
    }

    queue::queue_manager_config manager_config;
    manager_config.priority = settings.queue.default_priority;
    manager_config.max_attempts = settings.queue.default_max_attempts;
    manager_config.monitor.interval = settings.monitor.interval;
    manager_config.monitor.stale_threshold = settings.monitor.stale_threshold;

    manager_ = std::make_unique<queue::queue_manager>(
        std::move(store.value()), manager_config, queue::system_clock_source(), logger_);
    return true;
}

int admin_app::execute() {
    if (!manager_) {
        std::cerr << "Error: Store not initialized\n";
        return 1;
    }

    switch (config_.command) {
        case admin_command::submit: return submit();
        case admin_command::status: return status();
        case admin_command::stats: return stats();
        case admin_command::requeue_stale: return requeue_stale();
        case admin_command::monitor: return monitor();
    }
    return 1;
}

// =============================================================================
// Commands
// =============================================================================

int admin_app::submit() {
    auto job = manager_->submit(config_.input, config_.submit);
    if (job.is_err()) {
        std::cerr << "Error: Submit failed: " << job.error().message << "\n";
        return 1;
    }

    nlohmann::json body;
    body["ok"] = true;
    body["job_id"] = job.value().job_id;
    body["status"] = queue::to_string(job.value().status);

    auto stats = manager_->get_stats();
    if (stats.is_ok()) {
        body["queue_stats"] = queue::encode_stats(stats.value());
    }

    std::cout << body.dump(2) << "\n";
    return 0;
}

int admin_app::status() {
    auto job = manager_->get_status(config_.job_id);
    if (job.is_err()) {
        std::cerr << "Error: " << job.error().message << "\n";
        return 1;
    }
    if (!job.value().has_value()) {
        std::cerr << "Job not found: " << config_.job_id << "\n";
        return 2;
    }

    std::cout << queue::encode_job(*job.value()).dump(2) << "\n";
    return 0;
}

int admin_app::stats() {
    auto stats = manager_->get_stats();
    if (stats.is_err()) {
        std::cerr << "Error: " << stats.error().message << "\n";
        return 1;
    }

    std::cout << queue::encode_stats(stats.value()).dump(2) << "\n";
    return 0;
}

int admin_app::requeue_stale() {
    auto requeued = manager_->run_monitor_cycle();
    if (requeued.is_err()) {
        std::cerr << "Error: " << requeued.error().message << "\n";
        return 1;
    }

    std::cout << "Requeued " << requeued.value() << " stale job(s)\n";
    return 0;
}

int admin_app::monitor() {
    manager_->start_monitor();

    std::cout << "Stale claim monitor running on the "
              << manager_->store().backend_name() << " store\n";
    std::cout << "  Interval: " << config_.settings.monitor.interval.count() << " seconds\n";
    std::cout << "  Threshold: " << config_.settings.monitor.stale_threshold.count()
              << " seconds\n";
    std::cout << "Press Ctrl+C to stop\n";

    while (stop_flag_ == nullptr || !stop_flag_->load()) {
        std::this_thread::sleep_for(stop_check_interval);
    }

    manager_->stop_monitor();

    auto stats = manager_->get_monitor_statistics();
    std::cout << "\n";
    std::cout << "=== Monitor Statistics ===\n";
    std::cout << "Scans: " << stats.cycles << "\n";
    std::cout << "Requeued: " << stats.reclaimed << "\n";
    std::cout << "Errors: " << stats.errors << "\n";
    std::cout << "==========================\n";
    std::cout << "\n";
    return 0;
}

}  // namespace genqueue::apps
