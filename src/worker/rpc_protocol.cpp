/**
 * @file rpc_protocol.cpp
 * @brief JSON wire format of the worker queue RPCs
 */

#include <genqueue/worker/rpc_protocol.hpp>

#include <genqueue/queue/job_codec.hpp>

namespace genqueue::worker {

using json = nlohmann::json;

namespace {

constexpr const char* module_name = "rpc_protocol";

template <typename T>
auto rpc_error(int code, const std::string& message) -> Result<T> {
    return make_error<T>(code, message, module_name);
}

auto dump_body(const json& body) -> std::string {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

// =============================================================================
// Request Encoding
// =============================================================================

auto make_claim_call(std::string_view worker_id, std::string_view worker_type) -> rpc_call {
    json body;
    body["worker_id"] = std::string(worker_id);
    body["worker_type"] = std::string(worker_type);
    return rpc_call{std::string(routes::claim), dump_body(body), report_timeout};
}

auto make_progress_call(std::string_view job_id, const queue::progress_report& report)
    -> rpc_call {
    json body;
    body["job_id"] = std::string(job_id);
    body["progress"] = report.progress;
    body["message"] = report.message;
    if (report.status.has_value()) {
        body["status"] = queue::to_string(*report.status);
    }
    if (report.worker_id.has_value()) {
        body["worker_id"] = *report.worker_id;
    }
    return rpc_call{std::string(routes::progress), dump_body(body), progress_timeout};
}

auto make_complete_call(std::string_view job_id, const queue::job_output& output,
                        std::string_view worker_id) -> rpc_call {
    auto body = queue::encode_output(output);
    body["job_id"] = std::string(job_id);
    body["worker_id"] = std::string(worker_id);
    return rpc_call{std::string(routes::complete), dump_body(body), report_timeout};
}

auto make_fail_call(std::string_view job_id, std::string_view error,
                    std::string_view worker_id) -> rpc_call {
    json body;
    body["job_id"] = std::string(job_id);
    body["error"] = std::string(error);
    body["worker_id"] = std::string(worker_id);
    return rpc_call{std::string(routes::fail), dump_body(body), report_timeout};
}

// =============================================================================
// Responses
// =============================================================================

auto make_error_response(int status_code, const error_info& error) -> rpc_response {
    json body;
    body["ok"] = false;
    body["error"] = error.message;
    body["code"] = error.code;
    return rpc_response{status_code, dump_body(body)};
}

auto response_error(const rpc_response& response) -> error_info {
    int fallback = response.status_code >= 500 ? error_codes::rpc_transport_error
                                                : error_codes::rpc_rejected;
    std::string message = "RPC failed with status " + std::to_string(response.status_code);

    auto body = json::parse(response.body, nullptr, false);
    if (body.is_object()) {
        if (body.contains("error") && body["error"].is_string()) {
            message = body["error"].get<std::string>();
        }
        // Storage failures stay transient whatever code they carried
        if (response.status_code < 500 && body.contains("code") &&
            body["code"].is_number_integer()) {
            fallback = body["code"].get<int>();
        }
    }
    return error_info{fallback, message, module_name};
}

auto parse_body(std::string_view body) -> Result<json> {
    auto parsed = json::parse(body.begin(), body.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return rpc_error<json>(error_codes::rpc_decode_error, "Body is not valid JSON");
    }
    return ok(std::move(parsed));
}

auto decode_claim_response(const rpc_response& response)
    -> Result<std::optional<queue::job_record>> {
    using claim_result = std::optional<queue::job_record>;

    if (response.status_code != status_codes::ok) {
        return Result<claim_result>(response_error(response));
    }

    auto body = parse_body(response.body);
    if (body.is_err()) {
        return rpc_error<claim_result>(body.error().code, body.error().message);
    }
    const auto& value = body.value();

    if (!value.is_object() || !value.contains("job") || value["job"].is_null()) {
        return ok(claim_result{});
    }

    auto record = queue::decode_job(value["job"]);
    if (record.is_err()) {
        return rpc_error<claim_result>(error_codes::rpc_decode_error,
                                       record.error().message);
    }
    return ok(claim_result{std::move(record.value())});
}

auto decode_ack_response(const rpc_response& response) -> VoidResult {
    if (response.status_code != status_codes::ok) {
        return VoidResult(response_error(response));
    }

    auto body = parse_body(response.body);
    if (body.is_err()) {
        return rpc_error<std::monostate>(body.error().code, body.error().message);
    }
    const auto& value = body.value();

    if (value.is_object() && value.contains("ok") && value["ok"].is_boolean() &&
        !value["ok"].get<bool>()) {
        return VoidResult(response_error(rpc_response{status_codes::conflict, response.body}));
    }
    return ok();
}

auto decode_fail_response(const rpc_response& response) -> Result<queue::job_status> {
    if (response.status_code != status_codes::ok) {
        return Result<queue::job_status>(response_error(response));
    }

    auto body = parse_body(response.body);
    if (body.is_err()) {
        return rpc_error<queue::job_status>(body.error().code, body.error().message);
    }
    const auto& value = body.value();

    if (!value.is_object() || !value.contains("status") || !value["status"].is_string()) {
        return rpc_error<queue::job_status>(error_codes::rpc_decode_error,
                                            "Fail response has no status");
    }
    auto status = queue::job_status_from_string(value["status"].get<std::string>());
    if (!status.has_value()) {
        return rpc_error<queue::job_status>(
            error_codes::rpc_decode_error,
            "Fail response has unknown status: " + value["status"].get<std::string>());
    }
    return ok(*status);
}

}  // namespace genqueue::worker
