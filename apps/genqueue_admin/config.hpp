/**
 * @file config.hpp
 * @brief Command line configuration for the queue administration tool
 */

#ifndef GENQUEUE_APPS_ADMIN_CONFIG_HPP
#define GENQUEUE_APPS_ADMIN_CONFIG_HPP

#include <genqueue/config/genqueue_config.hpp>
#include <genqueue/queue/job_types.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace genqueue::apps {

/**
 * @brief Administrative command
 */
enum class admin_command {
    submit,         ///< Enqueue a new job
    status,         ///< Print one job
    stats,          ///< Print queue statistics
    requeue_stale,  ///< Run one stale-claim scan
    monitor         ///< Run the stale-claim monitor until signalled
};

/**
 * @brief Complete admin tool configuration
 */
struct admin_app_config {
    config::genqueue_config settings;
    std::optional<std::filesystem::path> config_file;

    admin_command command{admin_command::stats};

    /// Job id for status, or the caller-chosen id for submit
    std::string job_id;

    /// Submission input (submit only)
    queue::job_input input;
    queue::submit_options submit;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Usage: genqueue_admin [OPTIONS] <command> [ARGS]
     *
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[]) -> std::optional<admin_app_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace genqueue::apps

#endif  // GENQUEUE_APPS_ADMIN_CONFIG_HPP
