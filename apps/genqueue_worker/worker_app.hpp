/**
 * @file worker_app.hpp
 * @brief Generation worker application class
 *
 * Wires the configured job store, the queue manager, a local endpoint and
 * the command pipeline into a worker_client.
 *
 * ```
 * +-----------------------------------------------+
 * |                  worker_app                   |
 * |                                               |
 * |  worker_client --> local_endpoint             |
 * |       |                 |                     |
 * |       v                 v                     |
 * |  command_pipeline   queue_manager --> job_store|
 * +-----------------------------------------------+
 * ```
 */

#ifndef GENQUEUE_APPS_WORKER_WORKER_APP_HPP
#define GENQUEUE_APPS_WORKER_WORKER_APP_HPP

#include "config.hpp"

#include <genqueue/queue/queue_manager.hpp>
#include <genqueue/worker/command_pipeline.hpp>
#include <genqueue/worker/local_endpoint.hpp>
#include <genqueue/worker/worker_client.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace genqueue::apps {

/**
 * @brief Generation worker process
 */
class worker_app {
public:
    explicit worker_app(const worker_app_config& config);

    /**
     * @brief Destructor - flushes and shuts down logging
     */
    ~worker_app();

    worker_app(const worker_app&) = delete;
    worker_app& operator=(const worker_app&) = delete;
    worker_app(worker_app&&) = delete;
    worker_app& operator=(worker_app&&) = delete;

    /**
     * @brief Initialize logging, open the store and build the worker
     * @return true if initialization succeeded
     */
    [[nodiscard]] bool initialize();

    /**
     * @brief Process one job, or poll until stopped in continuous mode
     * @return Process exit code
     */
    [[nodiscard]] int run();

    /**
     * @brief Stop after the current job once @p flag becomes true
     *
     * The flag may be set from a signal handler and must outlive the app.
     */
    void watch_stop_flag(const std::atomic<bool>& flag) noexcept {
        stop_flag_ = &flag;
    }

    /**
     * @brief Print run statistics to stdout
     */
    void print_statistics() const;

private:
    worker_app_config config_;
    std::shared_ptr<di::ILogger> logger_;
    std::unique_ptr<queue::queue_manager> manager_;
    std::unique_ptr<worker::local_endpoint> endpoint_;
    std::unique_ptr<worker::command_pipeline> pipeline_;
    std::unique_ptr<worker::worker_client> worker_;
    std::chrono::steady_clock::time_point started_at_;
    const std::atomic<bool>* stop_flag_{nullptr};
};

}  // namespace genqueue::apps

#endif  // GENQUEUE_APPS_WORKER_WORKER_APP_HPP
