/**
 * @file job_state_machine.cpp
 * @brief State transitions and validation shared by every job store
 */

#include <genqueue/queue/job_state_machine.hpp>

#include <genqueue/compat/format.hpp>

#include <algorithm>

namespace genqueue::queue {

auto retry_message(int attempt, int max_attempts, std::string_view error)
    -> std::string {
    return genqueue::compat::format("retry {}/{}: {}", attempt, max_attempts, error);
}

auto dead_message(int attempt, std::string_view error) -> std::string {
    return genqueue::compat::format("failed after {} attempts: {}", attempt, error);
}

bool can_transition(job_status from, job_status to) noexcept {
    switch (from) {
        case job_status::queued:
            return to == job_status::claimed;
        case job_status::claimed:
            return to == job_status::claimed ||
                   to == job_status::generating ||
                   to == job_status::complete ||
                   to == job_status::queued ||
                   to == job_status::dead;
        case job_status::generating:
            return to == job_status::generating ||
                   to == job_status::uploading ||
                   to == job_status::complete ||
                   to == job_status::queued ||
                   to == job_status::dead;
        case job_status::uploading:
            return to == job_status::uploading ||
                   to == job_status::complete ||
                   to == job_status::queued ||
                   to == job_status::dead;
        case job_status::complete:
        case job_status::dead:
        case job_status::failed:
        default:
            return false;
    }
}

job_status progress_target(job_status current,
                           std::optional<job_status> requested) noexcept {
    if (!requested.has_value()) {
        return current == job_status::claimed ? job_status::generating : current;
    }
    // A worker that skips straight to publishing has finished generating
    if (current == job_status::claimed && *requested == job_status::uploading) {
        return job_status::uploading;
    }
    // Progress may only move forward through the in-flight statuses
    if (!is_in_flight_status(*requested) || !can_transition(current, *requested)) {
        return current;
    }
    return *requested;
}

bool is_valid_job_id(std::string_view job_id) noexcept {
    if (job_id.empty() || job_id.size() > max_job_id_length) {
        return false;
    }
    return std::all_of(job_id.begin(), job_id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

auto validate_new_record(const job_record& record) -> VoidResult {
    if (record.job_id.empty()) {
        return genqueue_void_error(error_codes::invalid_job_record,
                                   "Job id must not be empty");
    }
    if (!is_valid_job_id(record.job_id)) {
        return genqueue_void_error(
            error_codes::invalid_job_record,
            genqueue::compat::format(
                "Job id '{}' must be at most {} characters of [A-Za-z0-9_-]",
                record.job_id, max_job_id_length));
    }
    if (record.status != job_status::queued) {
        return genqueue_void_error(
            error_codes::invalid_job_record,
            genqueue::compat::format("Job {} must be enqueued as queued, not {}",
                                     record.job_id, to_string(record.status)));
    }
    if (record.claimed_by.has_value() || record.claimed_at.has_value()) {
        return genqueue_void_error(
            error_codes::invalid_job_record,
            genqueue::compat::format("Job {} must not carry a claim", record.job_id));
    }
    if (record.max_attempts < 1) {
        return genqueue_void_error(
            error_codes::invalid_job_record,
            genqueue::compat::format("Job {} max_attempts must be at least 1",
                                     record.job_id));
    }
    if (record.attempt < 0) {
        return genqueue_void_error(
            error_codes::invalid_job_record,
            genqueue::compat::format("Job {} attempt must not be negative",
                                     record.job_id));
    }
    return ok();
}

report_decision admit_progress(const job_record& record,
                               const std::optional<std::string>& worker_id) noexcept {
    if (!record.is_in_flight()) {
        return report_decision::ignore;
    }
    if (worker_id.has_value() && !record.is_claimed_by(*worker_id)) {
        return report_decision::ignore;
    }
    return report_decision::apply;
}

report_decision admit_completion(const job_record& record,
                                 const std::optional<std::string>& worker_id) noexcept {
    if (record.status == job_status::complete) {
        return report_decision::already_applied;
    }
    if (!record.is_in_flight()) {
        return report_decision::reject;
    }
    if (worker_id.has_value() && !record.is_claimed_by(*worker_id)) {
        return report_decision::reject;
    }
    return report_decision::apply;
}

report_decision admit_failure(const job_record& record,
                              const std::optional<std::string>& worker_id) noexcept {
    if (!record.is_in_flight()) {
        return report_decision::reject;
    }
    if (worker_id.has_value() && !record.is_claimed_by(*worker_id)) {
        return report_decision::reject;
    }
    return report_decision::apply;
}

void apply_claim(job_record& record, std::string_view worker_id,
                 std::string_view worker_type, timestamp now) {
    record.status = job_status::claimed;
    record.claimed_by = std::string(worker_id);
    record.claimed_at = now;
    record.worker_type = std::string(worker_type);
    record.message = genqueue::compat::format("claimed by {}", worker_id);
    record.updated_at = now;
}

void apply_progress(job_record& record, const progress_report& report, timestamp now) {
    record.status = progress_target(record.status, report.status);
    record.progress = clamp_progress(report.progress);
    record.message = report.message;
    record.updated_at = now;
}

void apply_completion(job_record& record, const job_output& output, timestamp now) {
    record.status = job_status::complete;
    record.progress = 100;
    record.message = std::string(complete_message);
    record.output = output;
    record.updated_at = now;
}

job_status apply_failure(job_record& record, std::string_view error, timestamp now) {
    record.attempt += 1;
    record.updated_at = now;

    if (record.attempt >= record.max_attempts) {
        record.status = job_status::dead;
        record.last_error = std::string(error);
        record.message = dead_message(record.attempt, error);
        return record.status;
    }

    record.status = job_status::queued;
    record.claimed_by.reset();
    record.claimed_at.reset();
    record.last_error = std::string(error);
    record.message = retry_message(record.attempt, record.max_attempts, error);
    return record.status;
}

bool is_stale(const job_record& record, timestamp cutoff) noexcept {
    return record.is_in_flight() && record.claimed_at.has_value() &&
           *record.claimed_at < cutoff;
}

void apply_stale_requeue(job_record& record, timestamp now) {
    record.status = job_status::queued;
    record.claimed_by.reset();
    record.claimed_at.reset();
    record.message = std::string(stale_requeue_message);
    record.updated_at = now;
}

}  // namespace genqueue::queue
