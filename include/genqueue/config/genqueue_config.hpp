/**
 * @file genqueue_config.hpp
 * @brief Process configuration for queue, monitor, worker and logging
 *
 * Configuration is layered: built-in defaults, then an optional JSON file,
 * then GENQUEUE_* environment variables, then command line options applied
 * by the executables.
 *
 * @code
 * {
 *   "queue":   { "backend": "shared", "shared_url": "host=db.internal dbname=genqueue" },
 *   "monitor": { "interval_seconds": 30, "stale_threshold_seconds": 1800 },
 *   "worker":  { "worker_type": "colab", "poll_interval_seconds": 15 },
 *   "logging": { "level": "debug", "directory": "logs", "audit": true }
 * }
 * @endcode
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/integration/logger_adapter.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace genqueue::config {

/// Backend name selecting local_job_store
inline constexpr const char* local_backend = "local";

/// Backend name selecting shared_job_store
inline constexpr const char* shared_backend = "shared";

/**
 * @brief Job store selection and job defaults
 */
struct queue_settings {
    /// "local", "shared", or empty to pick from the configured paths
    std::string backend;

    /// Directory holding jobs.json for the local backend
    std::filesystem::path local_directory{"queue"};

    /// SQLite database file for a single-host shared backend
    std::filesystem::path shared_database;

    /// PostgreSQL connection string for a multi-host shared backend (wins over shared_database)
    std::string shared_url;

    /// Lock wait limit for shared backend statements
    std::chrono::milliseconds busy_timeout{5000};

    /// Priority of submitted jobs when the caller gives none
    int default_priority{10};

    /// Attempts before a job is dead-lettered
    int default_max_attempts{3};
};

/**
 * @brief Stale-claim monitor timing
 */
struct monitor_settings {
    std::chrono::seconds interval{30};
    std::chrono::seconds stale_threshold{30 * 60};
};

/**
 * @brief Worker identity, polling and generator settings
 */
struct worker_settings {
    /// Worker id; generated as worker-xxxxxx when empty
    std::string worker_id;

    /// Descriptive worker class (local, colab, kaggle, ...)
    std::string worker_type{"local"};

    std::chrono::seconds poll_interval{15};

    /// Exit after this long without work; zero waits forever
    std::chrono::seconds max_idle{0};

    /// Attempts for claim, complete and fail calls
    int report_attempts{3};

    /// Initial backoff between those attempts
    std::chrono::milliseconds retry_delay{1000};

    /// External generator command run once per job
    std::string generator_command;

    /// Per-job scratch and output root
    std::filesystem::path work_directory{"work"};
};

/**
 * @brief Complete process configuration
 */
struct genqueue_config {
    queue_settings queue;
    monitor_settings monitor;
    worker_settings worker;
    integration::logger_config logging;

    /**
     * @brief Backend actually used
     *
     * An explicit backend wins; otherwise "shared" when a shared database
     * file or connection string is configured, else "local".
     */
    [[nodiscard]] auto effective_backend() const -> std::string;

    /**
     * @brief Check value ranges and backend requirements
     * @return config_invalid describing the first problem
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

/**
 * @brief Environment variable lookup, replaceable in tests
 */
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Apply a parsed JSON document on top of the given configuration
 *
 * Missing keys keep their current values.
 *
 * @return config_parse_error on a type mismatch or unknown log level
 */
[[nodiscard]] auto apply_json(genqueue_config& config, const nlohmann::json& document)
    -> VoidResult;

/**
 * @brief Load a JSON configuration file over the defaults
 * @return config_file_error when unreadable, config_parse_error when malformed
 */
[[nodiscard]] auto load_config(const std::filesystem::path& path)
    -> Result<genqueue_config>;

/**
 * @brief Override settings from environment variables
 *
 * Recognized suffixes: BACKEND, QUEUE_DIR, SHARED_DB, WORKER_ID, WORKER_TYPE,
 * POLL_INTERVAL, MAX_IDLE, LOG_LEVEL, LOG_DIR.
 *
 * @param config Configuration to modify
 * @param prefix Variable name prefix
 * @param lookup Variable source (std::getenv when empty)
 * @return config_invalid when a numeric or level value does not parse
 */
[[nodiscard]] auto apply_environment(genqueue_config& config,
                                     const std::string& prefix = "GENQUEUE_",
                                     const env_lookup& lookup = nullptr) -> VoidResult;

}  // namespace genqueue::config
