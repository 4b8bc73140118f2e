/**
 * @file main.cpp
 * @brief Entry point for the generation worker
 *
 * Usage:
 *   genqueue_worker [OPTIONS]
 *
 * Claims jobs from the configured queue, runs the generator command for each
 * and reports the outcome. Without --continuous a single job is processed.
 */

#include "config.hpp"
#include "worker_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Set by the signal handler, polled by the worker loop
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
    auto config = genqueue::apps::worker_app_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    install_signal_handlers();

    genqueue::apps::worker_app app(config.value());
    app.watch_stop_flag(g_shutdown_requested);

    if (!app.initialize()) {
        std::cerr << "Failed to initialize worker\n";
        return 1;
    }

    auto exit_code = app.run();
    if (g_shutdown_requested.load()) {
        std::cout << "\nShutdown requested, stopped after the current job\n";
    }

    app.print_statistics();
    return exit_code;
}
