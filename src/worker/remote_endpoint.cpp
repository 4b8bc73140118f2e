/**
 * @file remote_endpoint.cpp
 * @brief Queue endpoint for workers that reach the API process over RPC
 */

#include <genqueue/worker/remote_endpoint.hpp>

namespace genqueue::worker {

remote_endpoint::remote_endpoint(rpc_transport transport,
                                 std::shared_ptr<di::ILogger> logger)
    : transport_(std::move(transport)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto remote_endpoint::send(const rpc_call& call) -> Result<rpc_response> {
    if (!transport_) {
        return make_error<rpc_response>(error_codes::rpc_transport_error,
                                        "No RPC transport configured", "remote_endpoint");
    }

    auto response = transport_(call);
    if (response.is_err()) {
        logger_->debug_fmt("RPC {} failed: {}", call.route, response.error().message);
    }
    return response;
}

auto remote_endpoint::claim(std::string_view worker_id, std::string_view worker_type)
    -> Result<std::optional<queue::job_record>> {
    auto response = send(make_claim_call(worker_id, worker_type));
    if (response.is_err()) {
        return make_error<std::optional<queue::job_record>>(
            response.error().code, response.error().message, "remote_endpoint");
    }
    return decode_claim_response(response.value());
}

auto remote_endpoint::report_progress(std::string_view job_id,
                                      const queue::progress_report& report) -> VoidResult {
    auto response = send(make_progress_call(job_id, report));
    if (response.is_err()) {
        return make_error<std::monostate>(response.error().code, response.error().message,
                                          "remote_endpoint");
    }
    return decode_ack_response(response.value());
}

auto remote_endpoint::report_complete(std::string_view job_id,
                                      const queue::job_output& output,
                                      std::string_view worker_id) -> VoidResult {
    auto response = send(make_complete_call(job_id, output, worker_id));
    if (response.is_err()) {
        return make_error<std::monostate>(response.error().code, response.error().message,
                                          "remote_endpoint");
    }
    return decode_ack_response(response.value());
}

auto remote_endpoint::report_failure(std::string_view job_id, std::string_view error,
                                     std::string_view worker_id)
    -> Result<queue::job_status> {
    auto response = send(make_fail_call(job_id, error, worker_id));
    if (response.is_err()) {
        return make_error<queue::job_status>(response.error().code,
                                             response.error().message, "remote_endpoint");
    }
    return decode_fail_response(response.value());
}

}  // namespace genqueue::worker
