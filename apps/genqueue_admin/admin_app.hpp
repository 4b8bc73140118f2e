/**
 * @file admin_app.hpp
 * @brief Queue administration application class
 */

#ifndef GENQUEUE_APPS_ADMIN_ADMIN_APP_HPP
#define GENQUEUE_APPS_ADMIN_ADMIN_APP_HPP

#include "config.hpp"

#include <genqueue/queue/queue_manager.hpp>

#include <atomic>
#include <memory>

namespace genqueue::apps {

/**
 * @brief Runs one administrative command against the configured store
 */
class admin_app {
public:
    explicit admin_app(const admin_app_config& config);

    /**
     * @brief Destructor - stops the monitor and shuts down logging
     */
    ~admin_app();

    admin_app(const admin_app&) = delete;
    admin_app& operator=(const admin_app&) = delete;
    admin_app(admin_app&&) = delete;
    admin_app& operator=(admin_app&&) = delete;

    /**
     * @brief Initialize logging and open the store
     * @return true if initialization succeeded
     */
    [[nodiscard]] bool initialize();

    /**
     * @brief Execute the configured command
     * @return Process exit code
     */
    [[nodiscard]] int execute();

    /**
     * @brief Stop a running monitor command once @p flag becomes true
     *
     * The flag may be set from a signal handler and must outlive the app.
     */
    void watch_stop_flag(const std::atomic<bool>& flag) noexcept {
        stop_flag_ = &flag;
    }

private:
    int submit();
    int status();
    int stats();
    int requeue_stale();
    int monitor();

    admin_app_config config_;
    std::shared_ptr<di::ILogger> logger_;
    std::unique_ptr<queue::queue_manager> manager_;

    const std::atomic<bool>* stop_flag_{nullptr};
};

}  // namespace genqueue::apps

#endif  // GENQUEUE_APPS_ADMIN_ADMIN_APP_HPP
