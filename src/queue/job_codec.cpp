/**
 * @file job_codec.cpp
 * @brief JSON encoding of job records and queue statistics
 */

#include <genqueue/queue/job_codec.hpp>

#include <genqueue/compat/format.hpp>
#include <genqueue/core/timestamp.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace genqueue::queue {

namespace {

using json = nlohmann::json;

/// Exception raised inside decoding helpers and converted at the boundary
struct decode_failure {
    std::string message;
};

auto optional_text(const std::optional<std::string>& value) -> json {
    return value.has_value() ? json(*value) : json(nullptr);
}

auto optional_number(const std::optional<double>& value) -> json {
    return value.has_value() ? json(*value) : json(nullptr);
}

auto optional_time(const std::optional<timestamp>& value) -> json {
    return value.has_value() ? json(core::to_iso8601(*value)) : json(nullptr);
}

[[nodiscard]] bool has_value(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && !it->is_null();
}

auto read_text(const json& object, const char* key) -> std::optional<std::string> {
    if (!has_value(object, key)) {
        return std::nullopt;
    }
    const auto& value = object.at(key);
    if (!value.is_string()) {
        throw decode_failure{genqueue::compat::format("field '{}' must be a string", key)};
    }
    return value.get<std::string>();
}

auto read_int(const json& object, const char* key, int fallback) -> int {
    if (!has_value(object, key)) {
        return fallback;
    }
    auto value = to_checked_int(object.at(key));
    if (!value.has_value()) {
        throw decode_failure{
            genqueue::compat::format("field '{}' must be an integer in int range", key)};
    }
    return *value;
}

auto read_number(const json& object, const char* key) -> std::optional<double> {
    if (!has_value(object, key)) {
        return std::nullopt;
    }
    const auto& value = object.at(key);
    if (!value.is_number()) {
        throw decode_failure{genqueue::compat::format("field '{}' must be a number", key)};
    }
    return value.get<double>();
}

auto read_time(const json& object, const char* key) -> std::optional<timestamp> {
    auto text = read_text(object, key);
    if (!text.has_value()) {
        return std::nullopt;
    }
    auto parsed = core::from_iso8601(*text);
    if (!parsed.has_value()) {
        throw decode_failure{
            genqueue::compat::format("field '{}' is not a timestamp: {}", key, *text)};
    }
    return parsed;
}

auto read_blob(const json& object, const char* key, json fallback) -> json {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    return *it;
}

auto read_stat(const json& object, const char* key) -> std::size_t {
    auto count = read_int(object, key, 0);
    if (count < 0) {
        throw decode_failure{genqueue::compat::format("field '{}' must not be negative", key)};
    }
    return static_cast<std::size_t>(count);
}

}  // namespace

auto to_checked_int(const nlohmann::json& value) -> std::optional<int> {
    if (value.is_number_unsigned()) {
        auto number = value.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }
    if (value.is_number_integer()) {
        auto number = value.get<std::int64_t>();
        if (number < std::numeric_limits<int>::min() ||
            number > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }
    return std::nullopt;
}

// =============================================================================
// Job Records
// =============================================================================

auto encode_job(const job_record& record) -> nlohmann::json {
    json j;
    j["job_id"] = record.job_id;
    j["status"] = to_string(record.status);
    j["created_at"] = core::to_iso8601(record.created_at);
    j["updated_at"] = core::to_iso8601(record.updated_at);

    j["audio_path"] = record.input.audio_path;
    j["audio_url"] = optional_text(record.input.audio_url);
    j["direction"] = record.input.direction;
    j["emotional_dna"] = record.input.emotional_dna;
    j["params"] = record.input.params;
    j["generation_mode"] = record.generation_mode;
    j["priority"] = record.priority;

    j["claimed_by"] = optional_text(record.claimed_by);
    j["claimed_at"] = optional_time(record.claimed_at);
    j["worker_type"] = optional_text(record.worker_type);

    j["progress"] = record.progress;
    j["message"] = record.message;

    if (record.output.has_value()) {
        j["output_url"] = record.output->output_url;
        j["output_dir"] = optional_text(record.output->output_dir);
        j["quality_score"] = optional_number(record.output->quality_score);
        j["loop_score"] = optional_number(record.output->loop_score);
    } else {
        j["output_url"] = nullptr;
        j["output_dir"] = nullptr;
        j["quality_score"] = nullptr;
        j["loop_score"] = nullptr;
    }

    j["attempt"] = record.attempt;
    j["max_attempts"] = record.max_attempts;
    j["error"] = optional_text(record.last_error);
    return j;
}

auto decode_job(const nlohmann::json& value) -> Result<job_record> {
    if (!value.is_object()) {
        return genqueue_error<job_record>(error_codes::invalid_job_record,
                                          "Job record must be a JSON object");
    }

    try {
        job_record record;

        auto id = read_text(value, "job_id");
        if (!id.has_value() || id->empty()) {
            throw decode_failure{"missing job_id"};
        }
        record.job_id = *id;

        auto status_name = read_text(value, "status");
        if (!status_name.has_value()) {
            throw decode_failure{"missing status"};
        }
        auto status = job_status_from_string(*status_name);
        if (!status.has_value()) {
            throw decode_failure{"unknown status '" + *status_name + "'"};
        }
        record.status = *status;

        auto created = read_time(value, "created_at");
        if (!created.has_value()) {
            throw decode_failure{"missing created_at"};
        }
        record.created_at = *created;
        record.updated_at = read_time(value, "updated_at").value_or(record.created_at);

        record.input.audio_path = read_text(value, "audio_path").value_or("");
        record.input.audio_url = read_text(value, "audio_url");
        record.input.direction = read_blob(value, "direction", json(nullptr));
        record.input.emotional_dna = read_blob(value, "emotional_dna", json(nullptr));
        record.input.params = read_blob(value, "params", json::object());
        record.generation_mode =
            read_text(value, "generation_mode").value_or(std::string(full_generation_mode));
        record.priority = read_int(value, "priority", default_priority);

        record.claimed_by = read_text(value, "claimed_by");
        record.claimed_at = read_time(value, "claimed_at");
        record.worker_type = read_text(value, "worker_type");
        if (record.claimed_by.has_value() != record.claimed_at.has_value()) {
            throw decode_failure{"claimed_by and claimed_at must be set together"};
        }

        record.progress = read_int(value, "progress", 0);
        record.message = read_text(value, "message").value_or("");

        auto output_url = read_text(value, "output_url");
        if (output_url.has_value()) {
            job_output output;
            output.output_url = *output_url;
            output.output_dir = read_text(value, "output_dir");
            output.quality_score = read_number(value, "quality_score");
            output.loop_score = read_number(value, "loop_score");
            record.output = std::move(output);
        }

        record.attempt = read_int(value, "attempt", 0);
        record.max_attempts = read_int(value, "max_attempts", default_max_attempts);
        record.last_error = read_text(value, "error");

        return ok(std::move(record));
    } catch (const decode_failure& e) {
        return genqueue_error<job_record>(error_codes::invalid_job_record,
                                          "Malformed job record: " + e.message);
    } catch (const json::exception& e) {
        return genqueue_error<job_record>(
            error_codes::invalid_job_record,
            std::string("Malformed job record: ") + e.what());
    }
}

// =============================================================================
// Output References
// =============================================================================

auto encode_output(const job_output& output) -> nlohmann::json {
    json j;
    j["output_url"] = output.output_url;
    j["output_dir"] = optional_text(output.output_dir);
    j["quality_score"] = optional_number(output.quality_score);
    j["loop_score"] = optional_number(output.loop_score);
    return j;
}

auto decode_output(const nlohmann::json& value) -> Result<job_output> {
    if (!value.is_object()) {
        return genqueue_error<job_output>(error_codes::invalid_job_record,
                                          "Output reference must be a JSON object");
    }

    try {
        job_output output;
        auto url = read_text(value, "output_url");
        if (!url.has_value()) {
            throw decode_failure{"missing output_url"};
        }
        output.output_url = *url;
        output.output_dir = read_text(value, "output_dir");
        output.quality_score = read_number(value, "quality_score");
        output.loop_score = read_number(value, "loop_score");
        return ok(std::move(output));
    } catch (const decode_failure& e) {
        return genqueue_error<job_output>(error_codes::invalid_job_record,
                                          "Malformed output reference: " + e.message);
    } catch (const json::exception& e) {
        return genqueue_error<job_output>(
            error_codes::invalid_job_record,
            std::string("Malformed output reference: ") + e.what());
    }
}

// =============================================================================
// Statistics
// =============================================================================

auto encode_stats(const queue_stats& stats) -> nlohmann::json {
    json j;
    j["total"] = stats.total;
    j["queued"] = stats.queued;
    j["claimed"] = stats.claimed;
    j["generating"] = stats.generating;
    j["uploading"] = stats.uploading;
    j["complete"] = stats.complete;
    j["failed"] = stats.failed;
    j["dead"] = stats.dead;
    j["avg_quality"] = optional_number(stats.avg_quality);
    j["avg_loop_score"] = optional_number(stats.avg_loop_score);
    return j;
}

auto decode_stats(const nlohmann::json& value) -> Result<queue_stats> {
    if (!value.is_object()) {
        return genqueue_error<queue_stats>(error_codes::rpc_decode_error,
                                           "Statistics must be a JSON object");
    }

    try {
        queue_stats stats;
        stats.total = read_stat(value, "total");
        stats.queued = read_stat(value, "queued");
        stats.claimed = read_stat(value, "claimed");
        stats.generating = read_stat(value, "generating");
        stats.uploading = read_stat(value, "uploading");
        stats.complete = read_stat(value, "complete");
        stats.failed = read_stat(value, "failed");
        stats.dead = read_stat(value, "dead");
        stats.avg_quality = read_number(value, "avg_quality");
        stats.avg_loop_score = read_number(value, "avg_loop_score");
        return ok(std::move(stats));
    } catch (const decode_failure& e) {
        return genqueue_error<queue_stats>(error_codes::rpc_decode_error,
                                           "Malformed statistics: " + e.message);
    } catch (const json::exception& e) {
        return genqueue_error<queue_stats>(error_codes::rpc_decode_error,
                                           std::string("Malformed statistics: ") + e.what());
    }
}

}  // namespace genqueue::queue
