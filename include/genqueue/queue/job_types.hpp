/**
 * @file job_types.hpp
 * @brief Job record, status and statistics types for the generation queue
 *
 * A job record tracks one unit of dispatchable generation work: who owns it,
 * where it is in its lifecycle, and how many attempts it has consumed. The
 * input and output references are carried verbatim and never interpreted by
 * the queue.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace genqueue::queue {

/// Clock used for every job timestamp
using clock_type = std::chrono::system_clock;

/// Timestamp type used by job records
using timestamp = clock_type::time_point;

// =============================================================================
// Job Status
// =============================================================================

/**
 * @brief Lifecycle status of a generation job
 */
enum class job_status {
    queued,      ///< Waiting for a worker
    claimed,     ///< Taken by a worker, generation not yet reported
    generating,  ///< Worker reported generation progress
    uploading,   ///< Worker is publishing the output
    complete,    ///< Finished successfully (terminal)
    failed,      ///< Reserved transient failure marker
    dead         ///< Retry attempts exhausted (terminal)
};

/**
 * @brief Convert job_status to its persisted name
 * @param status The status to convert
 * @return Lowercase status name
 */
[[nodiscard]] constexpr const char* to_string(job_status status) noexcept {
    switch (status) {
        case job_status::queued: return "queued";
        case job_status::claimed: return "claimed";
        case job_status::generating: return "generating";
        case job_status::uploading: return "uploading";
        case job_status::complete: return "complete";
        case job_status::failed: return "failed";
        case job_status::dead: return "dead";
        default: return "unknown";
    }
}

/**
 * @brief Parse a persisted status name
 * @param str The string to parse
 * @return Parsed status, or std::nullopt if the name is unknown
 */
[[nodiscard]] inline std::optional<job_status> job_status_from_string(
    std::string_view str) noexcept {
    if (str == "queued") return job_status::queued;
    if (str == "claimed") return job_status::claimed;
    if (str == "generating") return job_status::generating;
    if (str == "uploading") return job_status::uploading;
    if (str == "complete") return job_status::complete;
    if (str == "failed") return job_status::failed;
    if (str == "dead") return job_status::dead;
    return std::nullopt;
}

/**
 * @brief Check if a status is terminal (COMPLETE or DEAD)
 */
[[nodiscard]] constexpr bool is_terminal_status(job_status status) noexcept {
    return status == job_status::complete || status == job_status::dead;
}

/**
 * @brief Check if a status means a worker currently holds the job
 */
[[nodiscard]] constexpr bool is_in_flight_status(job_status status) noexcept {
    return status == job_status::claimed ||
           status == job_status::generating ||
           status == job_status::uploading;
}

// =============================================================================
// Input / Output References
// =============================================================================

/**
 * @brief Source media and generation parameters supplied by the submitter
 *
 * Opaque to the queue: handed back verbatim to the worker that claims the job.
 */
struct job_input {
    std::string audio_path;                 ///< Local path or URL of the source audio
    std::optional<std::string> audio_url;   ///< Public URL for remote workers
    nlohmann::json direction;               ///< Selected visual direction (null if none)
    nlohmann::json emotional_dna;           ///< Audio analysis summary (null if none)
    nlohmann::json params = nlohmann::json::object();  ///< Free-form generation parameters

    bool operator==(const job_input&) const = default;
};

/**
 * @brief Output reference and externally computed scores
 */
struct job_output {
    std::string output_url;                 ///< Where the generated artifact lives
    std::optional<std::string> output_dir;  ///< Worker-side output directory
    std::optional<double> quality_score;    ///< External quality gate score
    std::optional<double> loop_score;       ///< External loop seamlessness score

    bool operator==(const job_output&) const = default;
};

// =============================================================================
// Job Record
// =============================================================================

/// Generation mode requested by the submission API
inline constexpr std::string_view full_generation_mode = "full";

/// Default priority of submitted jobs (lower is served first)
inline constexpr int default_priority = 10;

/// Default number of attempts before a job is dead-lettered
inline constexpr int default_max_attempts = 3;

/**
 * @brief Complete state of one generation job
 *
 * Invariants maintained by every job_store:
 * - claimed_by and claimed_at are both set or both unset
 * - attempt only grows, and only through fail()
 * - output is set only once status is complete
 */
struct job_record {
    // =========================================================================
    // Identification
    // =========================================================================

    std::string job_id;                       ///< Unique, immutable identifier
    job_status status{job_status::queued};    ///< Current lifecycle status
    timestamp created_at;                     ///< Creation time
    timestamp updated_at;                     ///< Last mutation time

    // =========================================================================
    // Input
    // =========================================================================

    job_input input;                          ///< Opaque input reference
    std::string generation_mode{full_generation_mode};  ///< Requested fidelity
    int priority{default_priority};           ///< Lower value served first

    // =========================================================================
    // Ownership
    // =========================================================================

    std::optional<std::string> claimed_by;    ///< Worker holding the job
    std::optional<timestamp> claimed_at;      ///< When the claim was taken
    std::optional<std::string> worker_type;   ///< Descriptive worker tag

    // =========================================================================
    // Progress
    // =========================================================================

    int progress{0};                          ///< Advisory 0-100 progress
    std::string message;                      ///< Human-readable status message

    // =========================================================================
    // Result
    // =========================================================================

    std::optional<job_output> output;         ///< Set only on completion

    // =========================================================================
    // Retry
    // =========================================================================

    int attempt{0};                           ///< Reported failures so far
    int max_attempts{default_max_attempts};   ///< Attempts before dead-letter
    std::optional<std::string> last_error;    ///< Most recent failure text

    [[nodiscard]] bool is_finished() const noexcept {
        return is_terminal_status(status);
    }

    [[nodiscard]] bool is_in_flight() const noexcept {
        return is_in_flight_status(status);
    }

    /**
     * @brief Check if the job is currently held by the given worker
     */
    [[nodiscard]] bool is_claimed_by(std::string_view worker_id) const noexcept {
        return claimed_by.has_value() && *claimed_by == worker_id;
    }

    bool operator==(const job_record&) const = default;
};

// =============================================================================
// Operation Parameters
// =============================================================================

/**
 * @brief Progress report from a worker
 */
struct progress_report {
    int progress{0};                          ///< 0-100, clamped by the store
    std::string message;                      ///< Human-readable message
    std::optional<job_status> status;         ///< Requested in-flight status
    std::optional<std::string> worker_id;     ///< Reporting worker, if known
};

/**
 * @brief Options for submitting a new job
 */
struct submit_options {
    std::optional<int> priority;              ///< Lower value served first (configured default when empty)
    std::optional<int> max_attempts;          ///< Attempts before dead-letter (configured default when empty)
    std::optional<std::string> job_id;        ///< Caller-chosen id (UUID when empty)
};

// =============================================================================
// Queue Statistics
// =============================================================================

/**
 * @brief Job counts by status plus completion score averages
 */
struct queue_stats {
    std::size_t total{0};
    std::size_t queued{0};
    std::size_t claimed{0};
    std::size_t generating{0};
    std::size_t uploading{0};
    std::size_t complete{0};
    std::size_t failed{0};
    std::size_t dead{0};

    std::optional<double> avg_quality;        ///< Mean quality score of complete jobs
    std::optional<double> avg_loop_score;     ///< Mean loop score of complete jobs

    /**
     * @brief Add jobs with the given status to the counters
     */
    void add(job_status status, std::size_t count = 1) noexcept {
        total += count;
        switch (status) {
            case job_status::queued: queued += count; break;
            case job_status::claimed: claimed += count; break;
            case job_status::generating: generating += count; break;
            case job_status::uploading: uploading += count; break;
            case job_status::complete: complete += count; break;
            case job_status::failed: failed += count; break;
            case job_status::dead: dead += count; break;
        }
    }

    /**
     * @brief Jobs currently held by workers
     */
    [[nodiscard]] std::size_t in_flight() const noexcept {
        return claimed + generating + uploading;
    }
};

}  // namespace genqueue::queue
