/**
 * @file queue_manager.cpp
 * @brief Submission API and single in-process entry point to the job store
 */

#include <genqueue/queue/queue_manager.hpp>

#include <genqueue/core/identifiers.hpp>
#include <genqueue/integration/logger_adapter.hpp>
#include <genqueue/queue/job_state_machine.hpp>

#include <mutex>

namespace genqueue::queue {

namespace {

constexpr const char* module_name = "queue_manager";

/// Audit name for a status that was not read
constexpr std::string_view unknown_status = "unknown";

/// Audit name for the source of a stale requeue
constexpr std::string_view in_flight_status = "in_flight";

}  // namespace

// =============================================================================
// Implementation
// =============================================================================

struct queue_manager::impl {
    std::unique_ptr<job_store> store;
    queue_manager_config config;
    clock_source clock;
    std::shared_ptr<di::ILogger> logger;

    mutable std::mutex monitor_mutex;
    std::unique_ptr<stale_claim_monitor> monitor;

    impl(std::unique_ptr<job_store> s, queue_manager_config cfg,
         clock_source clk, std::shared_ptr<di::ILogger> log)
        : store(std::move(s)),
          config(cfg),
          clock(clk ? std::move(clk) : system_clock_source()),
          logger(log ? std::move(log) : di::null_logger()) {
        monitor = make_monitor(config.monitor);
    }

    auto make_monitor(const monitor_config& monitor_cfg)
        -> std::unique_ptr<stale_claim_monitor> {
        auto created = std::make_unique<stale_claim_monitor>(*store, monitor_cfg, logger);
        created->set_requeue_callback([](const std::vector<std::string>& ids) {
            for (const auto& id : ids) {
                integration::logger_adapter::log_job_transition(
                    id, in_flight_status, to_string(job_status::queued), "",
                    stale_requeue_message);
            }
        });
        return created;
    }

    /// Current status name for the audit trail, read only when auditing
    auto audit_status(std::string_view job_id) -> std::string {
        if (!integration::logger_adapter::is_audit_enabled()) {
            return std::string(unknown_status);
        }
        auto current = store->get(job_id);
        if (current.is_err() || !current.value().has_value()) {
            return std::string(unknown_status);
        }
        return to_string(current.value()->status);
    }

    static void audit(std::string_view job_id, std::string_view from, std::string_view to,
                      const std::optional<std::string>& worker_id, std::string_view detail) {
        if (from == to) {
            return;
        }
        integration::logger_adapter::log_job_transition(
            job_id, from, to, worker_id.value_or(""), detail);
    }
};

// =============================================================================
// Construction / Destruction
// =============================================================================

queue_manager::queue_manager(std::unique_ptr<job_store> store,
                             queue_manager_config config,
                             clock_source clock,
                             std::shared_ptr<di::ILogger> logger)
    : impl_(std::make_unique<impl>(std::move(store), config, std::move(clock),
                                   std::move(logger))) {}

queue_manager::~queue_manager() {
    stop_monitor();
}

// =============================================================================
// Submission
// =============================================================================

auto queue_manager::submit(job_input input, const submit_options& options)
    -> Result<job_record> {
    auto now = impl_->clock();

    job_record record;
    record.job_id = options.job_id.value_or(core::generate_uuid());
    record.status = job_status::queued;
    record.created_at = now;
    record.updated_at = now;
    record.input = std::move(input);
    record.generation_mode = std::string(full_generation_mode);
    record.priority = options.priority.value_or(impl_->config.priority);
    record.max_attempts = options.max_attempts.value_or(impl_->config.max_attempts);
    record.message = std::string(queued_message);

    auto enqueued = impl_->store->enqueue(record);
    if (enqueued.is_err()) {
        impl_->logger->warn_fmt("Failed to submit job {}: {}", record.job_id,
                                enqueued.error().message);
        return make_error<job_record>(enqueued.error().code, enqueued.error().message,
                                      module_name);
    }

    impl_->logger->info_fmt("Submitted job {} priority={} max_attempts={} audio={}",
                            record.job_id, record.priority, record.max_attempts,
                            record.input.audio_path);
    impl::audit(record.job_id, "", to_string(job_status::queued), std::nullopt,
                "submitted");
    return ok(std::move(record));
}

auto queue_manager::get_status(std::string_view job_id)
    -> Result<std::optional<job_record>> {
    return impl_->store->get(job_id);
}

auto queue_manager::get_stats() -> Result<queue_stats> {
    return impl_->store->stats();
}

// =============================================================================
// Stale-Claim Monitor
// =============================================================================

void queue_manager::start_monitor() {
    std::lock_guard lock(impl_->monitor_mutex);
    impl_->monitor->start();
}

void queue_manager::start_monitor(std::chrono::milliseconds interval) {
    std::lock_guard lock(impl_->monitor_mutex);
    if (impl_->monitor->is_running()) {
        return;
    }
    impl_->config.monitor.interval = interval;
    impl_->monitor = impl_->make_monitor(impl_->config.monitor);
    impl_->monitor->start();
}

void queue_manager::stop_monitor() {
    std::lock_guard lock(impl_->monitor_mutex);
    impl_->monitor->stop();
}

auto queue_manager::is_monitor_running() const -> bool {
    std::lock_guard lock(impl_->monitor_mutex);
    return impl_->monitor->is_running();
}

auto queue_manager::run_monitor_cycle() -> Result<std::size_t> {
    std::lock_guard lock(impl_->monitor_mutex);
    return impl_->monitor->run_cycle();
}

auto queue_manager::get_monitor_statistics() const -> monitor_statistics {
    std::lock_guard lock(impl_->monitor_mutex);
    return impl_->monitor->get_statistics();
}

// =============================================================================
// Worker Operations
// =============================================================================

auto queue_manager::claim(std::string_view worker_id, std::string_view worker_type)
    -> Result<std::optional<job_record>> {
    auto claimed = impl_->store->claim(worker_id, worker_type);
    if (claimed.is_err()) {
        impl_->logger->warn_fmt("Claim by {} failed: {}", worker_id,
                                claimed.error().message);
        return claimed;
    }

    if (claimed.value().has_value()) {
        const auto& job = *claimed.value();
        impl_->logger->info_fmt("Job {} claimed by {} ({})", job.job_id, worker_id,
                                worker_type);
        impl::audit(job.job_id, to_string(job_status::queued), to_string(job.status),
                    std::string(worker_id), worker_type);
    }
    return claimed;
}

auto queue_manager::update_progress(std::string_view job_id, const progress_report& report)
    -> VoidResult {
    auto before = impl_->audit_status(job_id);

    auto updated = impl_->store->update_progress(job_id, report);
    if (updated.is_err()) {
        impl_->logger->debug_fmt("Progress for job {} not recorded: {}", job_id,
                                 updated.error().message);
        return updated;
    }

    if (before != unknown_status) {
        impl::audit(job_id, before, impl_->audit_status(job_id), report.worker_id,
                    report.message);
    }
    return updated;
}

auto queue_manager::complete(std::string_view job_id, const job_output& output,
                             const std::optional<std::string>& worker_id) -> VoidResult {
    auto before = impl_->audit_status(job_id);

    auto completed = impl_->store->complete(job_id, output, worker_id);
    if (completed.is_err()) {
        impl_->logger->warn_fmt("Completion of job {} by {} rejected: {}", job_id,
                                worker_id.value_or("unknown worker"),
                                completed.error().message);
        return completed;
    }

    if (before != to_string(job_status::complete)) {
        impl_->logger->info_fmt("Job {} complete output={}", job_id, output.output_url);
        impl::audit(job_id, before, to_string(job_status::complete), worker_id,
                    output.output_url);
    }
    return completed;
}

auto queue_manager::fail(std::string_view job_id, std::string_view error,
                         const std::optional<std::string>& worker_id)
    -> Result<job_status> {
    auto before = impl_->audit_status(job_id);

    auto failed = impl_->store->fail(job_id, error, worker_id);
    if (failed.is_err()) {
        impl_->logger->warn_fmt("Failure report for job {} by {} rejected: {}", job_id,
                                worker_id.value_or("unknown worker"),
                                failed.error().message);
        return failed;
    }

    if (failed.value() == job_status::dead) {
        impl_->logger->warn_fmt("Job {} is dead: {}", job_id, error);
    } else {
        impl_->logger->info_fmt("Job {} requeued after failure: {}", job_id, error);
    }
    impl::audit(job_id, before, to_string(failed.value()), worker_id, error);
    return failed;
}

// =============================================================================
// Accessors
// =============================================================================

auto queue_manager::store() noexcept -> job_store& {
    return *impl_->store;
}

auto queue_manager::config() const noexcept -> const queue_manager_config& {
    return impl_->config;
}

}  // namespace genqueue::queue
