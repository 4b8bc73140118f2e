/**
 * @file main.cpp
 * @brief Entry point for the queue administration tool
 *
 * Usage:
 *   genqueue_admin [OPTIONS] submit --audio <path>
 *   genqueue_admin [OPTIONS] status <job_id>
 *   genqueue_admin [OPTIONS] stats
 *   genqueue_admin [OPTIONS] requeue-stale
 *   genqueue_admin [OPTIONS] monitor
 */

#include "admin_app.hpp"
#include "config.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Set by the signal handler, polled by the monitor command
std::atomic<bool> g_shutdown_requested{false};
static_assert(std::atomic<bool>::is_always_lock_free);

/// Signal handler for graceful shutdown (async-signal-safe: only sets the flag)
void signal_handler(int /*signal*/) {
    g_shutdown_requested.store(true);
}

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = genqueue::apps::admin_app_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    install_signal_handlers();

    genqueue::apps::admin_app app(config.value());
    app.watch_stop_flag(g_shutdown_requested);

    if (!app.initialize()) {
        return 1;
    }

    return app.execute();
}
