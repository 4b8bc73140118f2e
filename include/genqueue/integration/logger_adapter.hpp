/**
 * @file logger_adapter.hpp
 * @brief Adapter for logging and job audit trail via logger_system
 *
 * Provides a static logging façade for the queue built on kcenon's
 * logger_system, plus an append-only audit trail that records every job
 * state transition as one JSON line.
 */

#pragma once

#include <genqueue/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace genqueue::integration {

// ─────────────────────────────────────────────────────
// Log Level
// ─────────────────────────────────────────────────────

/**
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" .. "fatal", "off")
 *
 * "warning" and "critical" are accepted as aliases of warn and fatal.
 *
 * @param name Level name
 * @return Parsed level, or std::nullopt for an unknown name
 */
[[nodiscard]] auto log_level_from_string(std::string_view name)
    -> std::optional<log_level>;

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @brief Configuration for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable rotating file output (genqueue.log)
    bool enable_file{false};

    /// Enable the job transition audit trail (job_audit.jsonl)
    bool enable_audit_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @brief Static logging façade over logger_system
 *
 * Messages logged before initialize() or after shutdown() are dropped.
 *
 * Thread Safety: all methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Worker {} started", worker_id);
 * logger_adapter::log_job_transition(job_id, "queued", "claimed", worker_id, "");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Creates the log directory when file or audit output is enabled.
     * Calling initialize() twice keeps the first configuration.
     *
     * @param config Logger configuration
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and stop the logger
     */
    static void shutdown();

    /**
     * @brief Check if the logger has been initialized
     */
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(genqueue::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, genqueue::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(genqueue::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, genqueue::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(genqueue::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, genqueue::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(genqueue::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, genqueue::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(genqueue::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, genqueue::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(genqueue::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, genqueue::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a preformatted message
     * @param level Severity
     * @param message Message text
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    // ─────────────────────────────────────────────────────
    // Job Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Check whether job transitions are being written to the audit trail
     */
    [[nodiscard]] static auto is_audit_enabled() noexcept -> bool;

    /**
     * @brief Record a job state transition
     *
     * Appends {"timestamp", "job_id", "from", "to", "worker_id", "detail"}
     * to job_audit.jsonl. No-op when the audit log is disabled.
     *
     * @param job_id Job identifier
     * @param from Previous status name (empty for creation)
     * @param to New status name
     * @param worker_id Worker responsible for the transition (may be empty)
     * @param detail Free-form detail such as the error string
     */
    static void log_job_transition(std::string_view job_id,
                                   std::string_view from,
                                   std::string_view to,
                                   std::string_view worker_id,
                                   std::string_view detail);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    /**
     * @brief Set the minimum log level
     */
    static void set_min_level(log_level level);

    /**
     * @brief Get the current minimum log level
     */
    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    /**
     * @brief Get the current configuration
     */
    [[nodiscard]] static auto get_config() -> const logger_config&;

    /**
     * @brief Convert a log level to its upper-case name
     */
    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace genqueue::integration
