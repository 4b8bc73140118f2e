/**
 * @file rpc_dispatcher.cpp
 * @brief Server-side handler for the worker queue RPCs
 */

#include <genqueue/worker/rpc_dispatcher.hpp>

#include <genqueue/queue/job_codec.hpp>

namespace genqueue::worker {

using json = nlohmann::json;

namespace {

constexpr const char* module_name = "rpc_dispatcher";

auto bad_request(const std::string& message) -> rpc_response {
    return make_error_response(status_codes::bad_request,
                               error_info{error_codes::rpc_bad_request, message, module_name});
}

auto ok_response(const json& body) -> rpc_response {
    return rpc_response{status_codes::ok,
                        body.dump(-1, ' ', false, json::error_handler_t::replace)};
}

/// Read a required non-empty string field
auto required_text(const json& body, const char* key) -> std::optional<std::string> {
    if (!body.contains(key) || !body[key].is_string()) {
        return std::nullopt;
    }
    auto value = body[key].get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

/// Read an optional string field (absent or null yields nullopt)
auto optional_text(const json& body, const char* key) -> std::optional<std::string> {
    if (!body.contains(key) || !body[key].is_string()) {
        return std::nullopt;
    }
    return body[key].get<std::string>();
}

/// Outcome of reading an optional integer field
struct int_field {
    std::optional<int> value;
    bool valid{true};
};

/// Read an optional int field; absent or null is valid and empty
auto optional_int(const json& body, const char* key) -> int_field {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return {};
    }
    auto value = queue::to_checked_int(*it);
    if (!value.has_value()) {
        return {std::nullopt, false};
    }
    return {value, true};
}

auto invalid_int(const char* key) -> rpc_response {
    return bad_request(std::string(key) + " must be an integer in int range");
}

}  // namespace

rpc_dispatcher::rpc_dispatcher(queue::queue_manager& manager,
                               std::shared_ptr<di::ILogger> logger)
    : manager_(manager), logger_(logger ? std::move(logger) : di::null_logger()) {}

auto rpc_dispatcher::dispatch(std::string_view route, std::string_view body)
    -> rpc_response {
    if (route == routes::stats) {
        return handle_stats();
    }

    auto known = route == routes::claim || route == routes::progress ||
                 route == routes::complete || route == routes::fail ||
                 route == routes::submit || route == routes::status;
    if (!known) {
        logger_->debug_fmt("Unknown RPC route {}", route);
        return make_error_response(
            status_codes::not_found,
            error_info{error_codes::rpc_unknown_route,
                       "Unknown route: " + std::string(route), module_name});
    }

    auto parsed = parse_body(body.empty() ? std::string_view("{}") : body);
    if (parsed.is_err() || !parsed.value().is_object()) {
        return bad_request("Request body must be a JSON object");
    }
    const auto& request = parsed.value();

    try {
        if (route == routes::claim) return handle_claim(request);
        if (route == routes::progress) return handle_progress(request);
        if (route == routes::complete) return handle_complete(request);
        if (route == routes::fail) return handle_fail(request);
        if (route == routes::submit) return handle_submit(request);
        return handle_status(request);
    } catch (const json::exception& e) {
        return bad_request(std::string("Invalid request field: ") + e.what());
    }
}

auto rpc_dispatcher::error_response(const error_info& error) const -> rpc_response {
    int status = status_codes::internal_error;
    if (error.code == error_codes::stale_claim) {
        status = status_codes::conflict;
    } else if (error.code == error_codes::job_not_found) {
        status = status_codes::not_found;
    } else if (error.code == error_codes::invalid_job_record ||
               error.code == error_codes::duplicate_job) {
        status = status_codes::bad_request;
    }

    if (status == status_codes::internal_error) {
        logger_->error_fmt("Queue operation failed: {}", error.message);
    }
    return make_error_response(status, error);
}

// =============================================================================
// Worker Routes
// =============================================================================

auto rpc_dispatcher::handle_claim(const json& body) -> rpc_response {
    auto worker_id = required_text(body, "worker_id");
    if (!worker_id) {
        return bad_request("worker_id is required");
    }
    auto worker_type = optional_text(body, "worker_type").value_or("unknown");

    auto claimed = manager_.claim(*worker_id, worker_type);
    if (claimed.is_err()) {
        return error_response(claimed.error());
    }

    json response;
    if (claimed.value().has_value()) {
        response["job"] = queue::encode_job(*claimed.value());
    } else {
        response["job"] = nullptr;
        response["message"] = std::string(no_jobs_message);
    }
    return ok_response(response);
}

auto rpc_dispatcher::handle_progress(const json& body) -> rpc_response {
    auto job_id = required_text(body, "job_id");
    if (!job_id) {
        return bad_request("job_id is required");
    }

    auto progress = optional_int(body, "progress");
    if (!progress.valid) {
        return invalid_int("progress");
    }

    queue::progress_report report;
    report.progress = progress.value.value_or(0);
    report.message = optional_text(body, "message").value_or("");
    report.worker_id = optional_text(body, "worker_id");
    if (auto status_name = optional_text(body, "status")) {
        // Unknown names are treated like an invalid edge: status unchanged
        report.status = queue::job_status_from_string(*status_name);
    }

    auto updated = manager_.update_progress(*job_id, report);
    if (updated.is_err()) {
        return error_response(updated.error());
    }
    return ok_response(json{{"ok", true}});
}

auto rpc_dispatcher::handle_complete(const json& body) -> rpc_response {
    auto job_id = required_text(body, "job_id");
    if (!job_id) {
        return bad_request("job_id is required");
    }

    auto output = queue::decode_output(body);
    if (output.is_err()) {
        return bad_request(output.error().message);
    }

    auto completed = manager_.complete(*job_id, output.value(),
                                       optional_text(body, "worker_id"));
    if (completed.is_err()) {
        return error_response(completed.error());
    }
    return ok_response(json{{"ok", true}});
}

auto rpc_dispatcher::handle_fail(const json& body) -> rpc_response {
    auto job_id = required_text(body, "job_id");
    if (!job_id) {
        return bad_request("job_id is required");
    }
    auto error = optional_text(body, "error").value_or("Unknown error");

    auto failed = manager_.fail(*job_id, error, optional_text(body, "worker_id"));
    if (failed.is_err()) {
        return error_response(failed.error());
    }

    json response;
    response["ok"] = true;
    response["status"] = queue::to_string(failed.value());
    return ok_response(response);
}

// =============================================================================
// Submission Routes
// =============================================================================

auto rpc_dispatcher::handle_submit(const json& body) -> rpc_response {
    auto audio_path = required_text(body, "audio_path");
    if (!audio_path) {
        return bad_request("audio_path is required");
    }

    queue::job_input input;
    input.audio_path = *audio_path;
    input.audio_url = optional_text(body, "audio_url");
    input.direction = body.value("direction", json(nullptr));
    input.emotional_dna = body.value("emotional_dna", json(nullptr));
    input.params = body.value("params", json::object());
    if (input.params.is_null()) {
        input.params = json::object();
    }

    auto priority = optional_int(body, "priority");
    if (!priority.valid) {
        return invalid_int("priority");
    }
    auto max_attempts = optional_int(body, "max_attempts");
    if (!max_attempts.valid) {
        return invalid_int("max_attempts");
    }

    queue::submit_options options;
    options.priority = priority.value;
    options.max_attempts = max_attempts.value;
    options.job_id = optional_text(body, "job_id");

    auto submitted = manager_.submit(std::move(input), options);
    if (submitted.is_err()) {
        return error_response(submitted.error());
    }

    json response;
    response["ok"] = true;
    response["job_id"] = submitted.value().job_id;
    response["status"] = queue::to_string(submitted.value().status);

    auto stats = manager_.get_stats();
    if (stats.is_ok()) {
        response["queue_stats"] = queue::encode_stats(stats.value());
    } else {
        response["queue_stats"] = nullptr;
    }
    return ok_response(response);
}

auto rpc_dispatcher::handle_stats() -> rpc_response {
    auto stats = manager_.get_stats();
    if (stats.is_err()) {
        return error_response(stats.error());
    }
    return ok_response(json{{"stats", queue::encode_stats(stats.value())}});
}

auto rpc_dispatcher::handle_status(const json& body) -> rpc_response {
    auto job_id = required_text(body, "job_id");
    if (!job_id) {
        return bad_request("job_id is required");
    }

    auto found = manager_.get_status(*job_id);
    if (found.is_err()) {
        return error_response(found.error());
    }

    json response;
    if (found.value().has_value()) {
        response["job"] = queue::encode_job(*found.value());
    } else {
        response["job"] = nullptr;
    }
    return ok_response(response);
}

}  // namespace genqueue::worker
