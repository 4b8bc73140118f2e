/**
 * @file worker_app.cpp
 * @brief Generation worker application implementation
 */

#include "worker_app.hpp"

#include <genqueue/core/identifiers.hpp>
#include <genqueue/integration/logger_adapter.hpp>
#include <genqueue/storage/job_store_factory.hpp>

#include <iostream>

namespace genqueue::apps {

worker_app::worker_app(const worker_app_config& config)
    : config_(config), started_at_(std::chrono::steady_clock::now()) {}

worker_app::~worker_app() {
    worker_.reset();
    endpoint_.reset();
    manager_.reset();
    integration::logger_adapter::shutdown();
}

bool worker_app::initialize() {
    const auto& settings = config_.settings;

    integration::logger_adapter::initialize(settings.logging);
    logger_ = std::make_shared<di::LoggerService>();

    if (settings.worker.generator_command.empty()) {
        std::cerr << "Error: No generator command configured (use --generator)\n";
        return false;
    }

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
    endpoint_ = std::make_unique<worker::local_endpoint>(*manager_);
    pipeline_ = std::make_unique<worker::command_pipeline>(
        settings.worker.generator_command, settings.worker.work_directory, logger_);

    worker::worker_config worker_config;
    worker_config.worker_id = settings.worker.worker_id.empty()
                                  ? core::generate_worker_id()
                                  : settings.worker.worker_id;
    worker_config.worker_type = settings.worker.worker_type;
    worker_config.poll_interval = settings.worker.poll_interval;
    worker_config.max_idle = settings.worker.max_idle;
    worker_config.retry.max_attempts = static_cast<std::size_t>(
        settings.worker.report_attempts < 1 ? 1 : settings.worker.report_attempts);
    worker_config.retry.initial_delay = settings.worker.retry_delay;

    worker_ = std::make_unique<worker::worker_client>(*endpoint_, *pipeline_,
                                                      std::move(worker_config), logger_);
    if (stop_flag_ != nullptr) {
        worker_->watch_stop_flag(*stop_flag_);
    }

    std::cout << "Worker " << worker_->config().worker_id << " ("
              << worker_->config().worker_type << ")\n";
    std::cout << "  Backend: " << manager_->store().backend_name() << "\n";
    std::cout << "  Generator: " << pipeline_->command() << "\n";
    std::cout << "  Mode: " << (config_.continuous ? "continuous" : "single job") << "\n";
    return true;
}

int worker_app::run() {
    if (!worker_) {
        std::cerr << "Error: Worker not initialized\n";
        return 1;
    }

    if (config_.continuous) {
        worker_->run();
        return 0;
    }

    if (!worker_->run_once()) {
        std::cout << "No jobs available\n";
    }
    return 0;
}

void worker_app::print_statistics() const {
    if (!worker_) {
        return;
    }

    auto stats = worker_->get_statistics();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);

    std::cout << "\n";
    std::cout << "=== Worker Statistics ===\n";
    std::cout << "Worker: " << worker_->config().worker_id << "\n";
    std::cout << "Uptime: " << uptime.count() << " seconds\n";
    std::cout << "Jobs Claimed: " << stats.jobs_claimed << "\n";
    std::cout << "Jobs Completed: " << stats.jobs_completed << "\n";
    std::cout << "Jobs Failed: " << stats.jobs_failed << "\n";
    std::cout << "Report Failures: " << stats.report_failures << "\n";
    std::cout << "Generation Time: "
              << std::chrono::duration_cast<std::chrono::seconds>(stats.total_generation_time)
                     .count()
              << " seconds\n";
    std::cout << "=========================\n";
    std::cout << "\n";
}

}  // namespace genqueue::apps
