/**
 * @file remote_endpoint.hpp
 * @brief Queue endpoint for workers that reach the API process over RPC
 */

#pragma once

#include <genqueue/di/ilogger.hpp>
#include <genqueue/worker/queue_endpoint.hpp>
#include <genqueue/worker/rpc_protocol.hpp>

#include <functional>
#include <memory>

namespace genqueue::worker {

/**
 * @brief Sends one RPC and returns the server's response
 *
 * Implementations report connection failures as rpc_transport_error and
 * expired deadlines as rpc_timeout.
 */
using rpc_transport = std::function<Result<rpc_response>(const rpc_call&)>;

/**
 * @brief RPC-backed queue endpoint
 */
class remote_endpoint final : public queue_endpoint {
public:
    explicit remote_endpoint(rpc_transport transport,
                             std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto claim(std::string_view worker_id, std::string_view worker_type)
        -> Result<std::optional<queue::job_record>> override;

    [[nodiscard]] auto report_progress(std::string_view job_id,
                                       const queue::progress_report& report)
        -> VoidResult override;

    [[nodiscard]] auto report_complete(std::string_view job_id,
                                       const queue::job_output& output,
                                       std::string_view worker_id) -> VoidResult override;

    [[nodiscard]] auto report_failure(std::string_view job_id, std::string_view error,
                                      std::string_view worker_id)
        -> Result<queue::job_status> override;

    [[nodiscard]] auto describe() const -> std::string_view override {
        return "remote";
    }

private:
    [[nodiscard]] auto send(const rpc_call& call) -> Result<rpc_response>;

    rpc_transport transport_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace genqueue::worker
