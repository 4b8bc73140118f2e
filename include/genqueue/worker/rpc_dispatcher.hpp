/**
 * @file rpc_dispatcher.hpp
 * @brief Server-side handler for the worker queue RPCs
 *
 * The hosting HTTP server hands each request's route and body to dispatch()
 * and writes the returned status code and JSON body back. All queue access
 * goes through queue_manager so remote transitions are audited like local
 * ones.
 */

#pragma once

#include <genqueue/di/ilogger.hpp>
#include <genqueue/queue/queue_manager.hpp>
#include <genqueue/worker/rpc_protocol.hpp>

#include <memory>
#include <string_view>

namespace genqueue::worker {

/**
 * @brief Routes RPC requests to a queue_manager
 *
 * Thread Safety: dispatch() may be called concurrently.
 */
class rpc_dispatcher {
public:
    explicit rpc_dispatcher(queue::queue_manager& manager,
                            std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Handle one request
     *
     * @param route Request path (one of routes::*)
     * @param body JSON request body (may be empty for stats)
     * @return Status code and JSON response body
     */
    [[nodiscard]] auto dispatch(std::string_view route, std::string_view body)
        -> rpc_response;

private:
    [[nodiscard]] auto handle_claim(const nlohmann::json& body) -> rpc_response;
    [[nodiscard]] auto handle_progress(const nlohmann::json& body) -> rpc_response;
    [[nodiscard]] auto handle_complete(const nlohmann::json& body) -> rpc_response;
    [[nodiscard]] auto handle_fail(const nlohmann::json& body) -> rpc_response;
    [[nodiscard]] auto handle_submit(const nlohmann::json& body) -> rpc_response;
    [[nodiscard]] auto handle_stats() -> rpc_response;
    [[nodiscard]] auto handle_status(const nlohmann::json& body) -> rpc_response;

    /// Map a queue error onto a response status code
    [[nodiscard]] auto error_response(const error_info& error) const -> rpc_response;

    queue::queue_manager& manager_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace genqueue::worker
