/**
 * @file worker_client.cpp
 * @brief Poll loop of an ephemeral generation worker
 */

#include <genqueue/worker/worker_client.hpp>

#include <algorithm>

namespace genqueue::worker {

// =============================================================================
// Progress Relay
// =============================================================================

/**
 * @brief Forwards pipeline progress to the endpoint, swallowing failures
 */
class worker_client::endpoint_sink final : public progress_sink {
public:
    endpoint_sink(worker_client& owner, const queue::job_record& job)
        : owner_(owner), job_(job) {}

    void report(int progress, std::string_view message,
                std::optional<queue::job_status> status) override {
        queue::progress_report report;
        report.progress = progress;
        report.message = std::string(message);
        report.status = status;
        report.worker_id = owner_.config_.worker_id;

        auto result = owner_.endpoint_.report_progress(job_.job_id, report);
        if (result.is_err()) {
            // Progress is advisory; generation continues regardless
            owner_.logger_->debug_fmt("Progress report for job {} dropped: {}",
                                      job_.job_id, result.error().message);
            owner_.count_report_failure();
        }
    }

private:
    worker_client& owner_;
    const queue::job_record& job_;
};

// =============================================================================
// Construction
// =============================================================================

worker_client::worker_client(queue_endpoint& endpoint,
                             generation_pipeline& pipeline,
                             worker_config config,
                             std::shared_ptr<di::ILogger> logger,
                             retry_policy::sleeper sleep)
    : endpoint_(endpoint),
      pipeline_(pipeline),
      config_(std::move(config)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      retry_(config_.retry, logger_, std::move(sleep)) {
    if (config_.worker_id.empty()) {
        config_.worker_id = core::generate_worker_id();
    }
}

// =============================================================================
// Polling
// =============================================================================

auto worker_client::run_once() -> bool {
    auto claimed = retry_.execute("claim", [this]() {
        return endpoint_.claim(config_.worker_id, config_.worker_type);
    });

    if (claimed.is_err()) {
        logger_->error_fmt("Worker {} could not claim from {}: {}", config_.worker_id,
                           endpoint_.describe(), claimed.error().message);
        return false;
    }

    if (!claimed.value().has_value()) {
        logger_->debug_fmt("Worker {}: no jobs available", config_.worker_id);
        return false;
    }

    const queue::job_record job = *claimed.value();
    {
        std::lock_guard lock(stats_mutex_);
        ++stats_.jobs_claimed;
    }

    process(job);
    return true;
}

void worker_client::run() {
    logger_->info_fmt("Worker {} ({}) polling {} every {} ms", config_.worker_id,
                      config_.worker_type, endpoint_.describe(),
                      config_.poll_interval.count());

    auto idle_since = std::chrono::steady_clock::now();

    while (!stop_requested()) {
        if (run_once()) {
            idle_since = std::chrono::steady_clock::now();
            continue;
        }

        if (config_.max_idle.count() > 0 &&
            std::chrono::steady_clock::now() - idle_since >= config_.max_idle) {
            logger_->info_fmt("Worker {} idle for {} ms, exiting", config_.worker_id,
                              config_.max_idle.count());
            break;
        }

        wait_for_next_poll();
    }

    logger_->info_fmt("Worker {} stopped", config_.worker_id);
}

void worker_client::wait_for_next_poll() {
    using clock = std::chrono::steady_clock;

    auto slice = std::chrono::duration_cast<clock::duration>(config_.stop_check_interval);
    if (slice <= clock::duration::zero()) {
        slice = std::chrono::duration_cast<clock::duration>(config_.poll_interval);
    }
    auto deadline = clock::now() + config_.poll_interval;

    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (!stop_requested()) {
        auto now = clock::now();
        if (now >= deadline) {
            break;
        }
        wait_cv_.wait_for(lock, std::min(slice, deadline - now));
    }
}

void worker_client::request_stop() {
    {
        std::lock_guard lock(wait_mutex_);
        stop_requested_.store(true);
    }
    wait_cv_.notify_all();
}

auto worker_client::get_statistics() const -> worker_statistics {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// =============================================================================
// Job Processing
// =============================================================================

void worker_client::process(const queue::job_record& job) {
    logger_->info_fmt("Worker {} claimed job {} (attempt {}/{})", config_.worker_id,
                      job.job_id, job.attempt + 1, job.max_attempts);

    endpoint_sink sink(*this, job);
    sink.report(preparing_progress, preparing_message, std::nullopt);

    auto started = std::chrono::steady_clock::now();
    auto output = pipeline_.run(job, sink);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    {
        std::lock_guard lock(stats_mutex_);
        stats_.total_generation_time += elapsed;
    }

    if (output.is_ok()) {
        finish_success(job, output.value());
    } else {
        finish_failure(job, output.error().message);
    }
}

void worker_client::finish_success(const queue::job_record& job,
                                   const queue::job_output& output) {
    auto reported = retry_.execute("complete", [&]() {
        return endpoint_.report_complete(job.job_id, output, config_.worker_id);
    });

    if (reported.is_err()) {
        if (reported.error().code == error_codes::stale_claim) {
            logger_->warn_fmt("Job {} was reclaimed before completion was reported",
                              job.job_id);
        } else {
            logger_->error_fmt("Failed to report completion of job {}: {}", job.job_id,
                               reported.error().message);
        }
        count_report_failure();
        return;
    }

    std::lock_guard lock(stats_mutex_);
    ++stats_.jobs_completed;
    logger_->info_fmt("Job {} complete: {}", job.job_id, output.output_url);
}

void worker_client::finish_failure(const queue::job_record& job, const std::string& error) {
    logger_->warn_fmt("Generation failed for job {}: {}", job.job_id, error);

    {
        std::lock_guard lock(stats_mutex_);
        ++stats_.jobs_failed;
    }

    auto reported = retry_.execute("fail", [&]() {
        return endpoint_.report_failure(job.job_id, error, config_.worker_id);
    });

    if (reported.is_err()) {
        logger_->error_fmt("Failed to report failure of job {}: {}", job.job_id,
                           reported.error().message);
        count_report_failure();
        return;
    }

    if (reported.value() == queue::job_status::dead) {
        logger_->error_fmt("Job {} moved to dead letter after {} attempts", job.job_id,
                           job.max_attempts);
    } else {
        logger_->info_fmt("Job {} requeued for retry", job.job_id);
    }
}

void worker_client::count_report_failure() {
    std::lock_guard lock(stats_mutex_);
    ++stats_.report_failures;
}

}  // namespace genqueue::worker
