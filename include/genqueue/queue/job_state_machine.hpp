/**
 * @file job_state_machine.hpp
 * @brief State transitions and validation shared by every job store
 *
 * Stores decide *whether* a mutation may happen and *what* the record looks
 * like afterwards through these functions, so the local document store and
 * the SQL store cannot drift apart. Atomicity is the store's concern: the
 * local store calls these under its mutex, the shared store applies the
 * result with a conditional update.
 *
 * Authoritative edges:
 * @code
 * queued     --claim-->         claimed
 * claimed    --progress-->      generating
 * generating --progress-->      uploading
 * claimed    --progress(uploading)--> uploading   (via generating)
 * in-flight  --complete-->      complete
 * in-flight  --fail (retry)-->  queued
 * in-flight  --fail (exhausted)--> dead
 * in-flight  --stale reclaim--> queued   (attempt unchanged)
 * @endcode
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/queue/job_types.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace genqueue::queue {

// =============================================================================
// Lifecycle Messages
// =============================================================================

/// Message set by the stale-claim monitor on requeue
inline constexpr std::string_view stale_requeue_message = "requeued: claim timed out";

/// Message set on successful completion
inline constexpr std::string_view complete_message = "generation complete";

/// Message set on a freshly enqueued job
inline constexpr std::string_view queued_message = "queued for generation";

/**
 * @brief Build the message for a failure that will be retried
 * @return "retry N/M: <error>"
 */
[[nodiscard]] auto retry_message(int attempt, int max_attempts, std::string_view error)
    -> std::string;

/**
 * @brief Build the message for a failure that exhausted all attempts
 * @return "failed after N attempts: <error>"
 */
[[nodiscard]] auto dead_message(int attempt, std::string_view error) -> std::string;

// =============================================================================
// Transition Rules
// =============================================================================

/**
 * @brief Check whether the state machine has an edge from one status to another
 *
 * Same-status "transitions" of in-flight jobs (progress messages) are allowed.
 */
[[nodiscard]] bool can_transition(job_status from, job_status to) noexcept;

/**
 * @brief Status a job moves to after a progress report
 *
 * CLAIMED moves to GENERATING when nothing is requested. UPLOADING requested
 * on a CLAIMED job passes through GENERATING and lands on UPLOADING. Any other
 * requested status is honoured only along a valid edge; otherwise the current
 * status is kept.
 */
[[nodiscard]] job_status progress_target(job_status current,
                                         std::optional<job_status> requested) noexcept;

/**
 * @brief Clamp a reported progress value to 0-100
 */
[[nodiscard]] constexpr int clamp_progress(int progress) noexcept {
    return progress < 0 ? 0 : (progress > 100 ? 100 : progress);
}

/// Longest accepted job id
inline constexpr std::size_t max_job_id_length = 128;

/**
 * @brief Check that a job id is safe to use as a file or directory name
 *
 * Ids are 1 to max_job_id_length characters from [A-Za-z0-9_-]. Separators,
 * dots and control characters are refused, so an id never names a path
 * outside the directory it is joined to.
 */
[[nodiscard]] bool is_valid_job_id(std::string_view job_id) noexcept;

/**
 * @brief Validate a record before it is enqueued
 *
 * Rejects an empty or unsafe id (see is_valid_job_id), a status other than
 * QUEUED, a set claim, max_attempts < 1 and a negative attempt count.
 */
[[nodiscard]] auto validate_new_record(const job_record& record) -> VoidResult;

// =============================================================================
// Report Admission
// =============================================================================

/**
 * @brief What a store should do with a worker report
 */
enum class report_decision {
    apply,           ///< Mutate the record
    ignore,          ///< Accept silently without mutating
    already_applied, ///< Idempotent repeat, accept without mutating
    reject           ///< Refuse with a stale_claim error
};

/**
 * @brief Decide how to handle a progress report
 *
 * Progress on a job that is not in flight, or that is held by a different
 * worker than the reporter, is ignored.
 */
[[nodiscard]] report_decision admit_progress(const job_record& record,
                                             const std::optional<std::string>& worker_id) noexcept;

/**
 * @brief Decide how to handle a completion report
 *
 * A completion on an already complete job is an idempotent repeat. A
 * completion on a job that is not in flight, or held by someone else, is
 * a late report from a reclaimed claim and is rejected.
 */
[[nodiscard]] report_decision admit_completion(const job_record& record,
                                               const std::optional<std::string>& worker_id) noexcept;

/**
 * @brief Decide how to handle a failure report
 *
 * Only the current holder of an in-flight job may consume a retry.
 */
[[nodiscard]] report_decision admit_failure(const job_record& record,
                                            const std::optional<std::string>& worker_id) noexcept;

// =============================================================================
// Mutations
// =============================================================================

/**
 * @brief Transition a QUEUED record to CLAIMED
 */
void apply_claim(job_record& record, std::string_view worker_id,
                 std::string_view worker_type, timestamp now);

/**
 * @brief Record a progress report on an in-flight record
 */
void apply_progress(job_record& record, const progress_report& report, timestamp now);

/**
 * @brief Transition an in-flight record to COMPLETE
 */
void apply_completion(job_record& record, const job_output& output, timestamp now);

/**
 * @brief Consume one attempt and requeue or dead-letter the record
 * @return The resulting status (queued or dead)
 */
job_status apply_failure(job_record& record, std::string_view error, timestamp now);

/**
 * @brief Check whether an in-flight record's claim is older than the cutoff
 */
[[nodiscard]] bool is_stale(const job_record& record, timestamp cutoff) noexcept;

/**
 * @brief Return a stale in-flight record to QUEUED without consuming an attempt
 */
void apply_stale_requeue(job_record& record, timestamp now);

}  // namespace genqueue::queue
