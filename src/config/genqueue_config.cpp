/**
 * @file genqueue_config.cpp
 * @brief Process configuration loading and validation
 */

#include <genqueue/config/genqueue_config.hpp>

#include <genqueue/compat/format.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace genqueue::config {

using json = nlohmann::json;

namespace {

constexpr const char* module_name = "config";

auto config_error(int code, const std::string& message) -> VoidResult {
    return make_error<std::monostate>(code, message, module_name);
}

template <typename T>
void read_if_present(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

template <typename Duration>
void read_duration(const json& section, const char* key, Duration& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = Duration(section[key].get<long long>());
    }
}

void read_path(const json& section, const char* key, std::filesystem::path& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<std::string>();
    }
}

auto parse_integer(const std::string& name, const std::string& text) -> Result<long long> {
    long long value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return make_error<long long>(
            error_codes::config_invalid,
            genqueue::compat::format("{} must be an integer, got '{}'", name, text),
            module_name);
    }
    return ok(value);
}

}  // namespace

// =============================================================================
// genqueue_config
// =============================================================================

auto genqueue_config::effective_backend() const -> std::string {
    if (!queue.backend.empty()) {
        return queue.backend;
    }
    if (!queue.shared_url.empty() || !queue.shared_database.empty()) {
        return shared_backend;
    }
    return local_backend;
}

auto genqueue_config::validate() const -> VoidResult {
    const auto backend = effective_backend();
    if (backend != local_backend && backend != shared_backend) {
        return config_error(error_codes::config_invalid,
                            "Unknown queue backend: " + backend);
    }
    if (backend == shared_backend && queue.shared_database.empty() &&
        queue.shared_url.empty()) {
        return config_error(error_codes::config_invalid,
                            "The shared backend requires queue.shared_url or "
                            "queue.shared_database");
    }
    if (backend == local_backend && queue.local_directory.empty()) {
        return config_error(error_codes::config_invalid,
                            "The local backend requires queue.local_directory");
    }
    if (queue.busy_timeout.count() < 0) {
        return config_error(error_codes::config_invalid,
                            "queue.busy_timeout_ms must not be negative");
    }
    if (queue.default_max_attempts < 1) {
        return config_error(error_codes::config_invalid,
                            "queue.default_max_attempts must be at least 1");
    }
    if (monitor.interval.count() <= 0) {
        return config_error(error_codes::config_invalid,
                            "monitor.interval_seconds must be positive");
    }
    if (monitor.stale_threshold.count() <= 0) {
        return config_error(error_codes::config_invalid,
                            "monitor.stale_threshold_seconds must be positive");
    }
    if (worker.poll_interval.count() <= 0) {
        return config_error(error_codes::config_invalid,
                            "worker.poll_interval_seconds must be positive");
    }
    if (worker.max_idle.count() < 0) {
        return config_error(error_codes::config_invalid,
                            "worker.max_idle_seconds must not be negative");
    }
    if (worker.report_attempts < 1) {
        return config_error(error_codes::config_invalid,
                            "worker.report_attempts must be at least 1");
    }
    if (worker.retry_delay.count() < 0) {
        return config_error(error_codes::config_invalid,
                            "worker.retry_delay_ms must not be negative");
    }
    return ok();
}

// =============================================================================
// JSON
// =============================================================================

auto apply_json(genqueue_config& config, const json& document) -> VoidResult {
    if (!document.is_object()) {
        return config_error(error_codes::config_parse_error,
                            "Configuration root must be a JSON object");
    }

    try {
        if (document.contains("queue")) {
            const auto& queue = document["queue"];
            read_if_present(queue, "backend", config.queue.backend);
            read_path(queue, "local_directory", config.queue.local_directory);
            read_path(queue, "shared_database", config.queue.shared_database);
            read_if_present(queue, "shared_url", config.queue.shared_url);
            read_duration(queue, "busy_timeout_ms", config.queue.busy_timeout);
            read_if_present(queue, "default_priority", config.queue.default_priority);
            read_if_present(queue, "default_max_attempts", config.queue.default_max_attempts);
        }

        if (document.contains("monitor")) {
            const auto& monitor = document["monitor"];
            read_duration(monitor, "interval_seconds", config.monitor.interval);
            read_duration(monitor, "stale_threshold_seconds", config.monitor.stale_threshold);
        }

        if (document.contains("worker")) {
            const auto& worker = document["worker"];
            read_if_present(worker, "worker_id", config.worker.worker_id);
            read_if_present(worker, "worker_type", config.worker.worker_type);
            read_duration(worker, "poll_interval_seconds", config.worker.poll_interval);
            read_duration(worker, "max_idle_seconds", config.worker.max_idle);
            read_if_present(worker, "report_attempts", config.worker.report_attempts);
            read_duration(worker, "retry_delay_ms", config.worker.retry_delay);
            read_if_present(worker, "generator_command", config.worker.generator_command);
            read_path(worker, "work_directory", config.worker.work_directory);
        }

        if (document.contains("logging")) {
            const auto& logging = document["logging"];
            read_path(logging, "directory", config.logging.log_directory);
            if (logging.contains("level")) {
                auto name = logging["level"].get<std::string>();
                auto level = integration::log_level_from_string(name);
                if (!level) {
                    return config_error(error_codes::config_parse_error,
                                        "Unknown log level: " + name);
                }
                config.logging.min_level = *level;
            }
            read_if_present(logging, "console", config.logging.enable_console);
            read_if_present(logging, "file", config.logging.enable_file);
            read_if_present(logging, "audit", config.logging.enable_audit_log);
            read_if_present(logging, "max_file_size_mb", config.logging.max_file_size_mb);
            read_if_present(logging, "max_files", config.logging.max_files);
            read_if_present(logging, "async", config.logging.async_mode);
        }
    } catch (const json::exception& ex) {
        return config_error(error_codes::config_parse_error,
                            "Invalid configuration value: " + std::string(ex.what()));
    }

    return ok();
}

auto load_config(const std::filesystem::path& path) -> Result<genqueue_config> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<genqueue_config>(
            error_codes::config_file_error,
            "Failed to open configuration file: " + path.string(), module_name);
    }

    json document;
    try {
        file >> document;
    } catch (const json::exception& ex) {
        return make_error<genqueue_config>(
            error_codes::config_parse_error,
            "JSON parsing error in " + path.string() + ": " + ex.what(), module_name);
    }

    genqueue_config config;
    auto applied = apply_json(config, document);
    if (applied.is_err()) {
        return make_error<genqueue_config>(applied.error().code,
                                           applied.error().message, module_name);
    }
    return ok(std::move(config));
}

// =============================================================================
// Environment
// =============================================================================

auto apply_environment(genqueue_config& config, const std::string& prefix,
                       const env_lookup& lookup) -> VoidResult {
    auto getEnv = [&lookup](const std::string& name) -> std::optional<std::string> {
        if (lookup) {
            return lookup(name);
        }
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto value = getEnv(prefix + "BACKEND")) {
        config.queue.backend = *value;
    }

    if (auto value = getEnv(prefix + "QUEUE_DIR")) {
        config.queue.local_directory = *value;
    }

    if (auto value = getEnv(prefix + "SHARED_DB")) {
        config.queue.shared_database = *value;
    }

    if (auto value = getEnv(prefix + "SHARED_URL")) {
        config.queue.shared_url = *value;
    }

    if (auto value = getEnv(prefix + "WORKER_ID")) {
        config.worker.worker_id = *value;
    }

    if (auto value = getEnv(prefix + "WORKER_TYPE")) {
        config.worker.worker_type = *value;
    }

    if (auto value = getEnv(prefix + "POLL_INTERVAL")) {
        auto seconds = parse_integer(prefix + "POLL_INTERVAL", *value);
        if (seconds.is_err()) {
            return config_error(seconds.error().code, seconds.error().message);
        }
        config.worker.poll_interval = std::chrono::seconds(seconds.value());
    }

    if (auto value = getEnv(prefix + "MAX_IDLE")) {
        auto seconds = parse_integer(prefix + "MAX_IDLE", *value);
        if (seconds.is_err()) {
            return config_error(seconds.error().code, seconds.error().message);
        }
        config.worker.max_idle = std::chrono::seconds(seconds.value());
    }

    if (auto value = getEnv(prefix + "LOG_LEVEL")) {
        auto level = integration::log_level_from_string(*value);
        if (!level) {
            return config_error(error_codes::config_invalid,
                                prefix + "LOG_LEVEL is not a log level: " + *value);
        }
        config.logging.min_level = *level;
    }

    if (auto value = getEnv(prefix + "LOG_DIR")) {
        config.logging.log_directory = *value;
    }

    return ok();
}

}  // namespace genqueue::config
