/**
 * @file config.hpp
 * @brief Command line configuration for the generation worker
 *
 * Settings are layered: defaults, then the --config JSON file, then
 * GENQUEUE_* environment variables, then the remaining command line options.
 */

#ifndef GENQUEUE_APPS_WORKER_CONFIG_HPP
#define GENQUEUE_APPS_WORKER_CONFIG_HPP

#include <genqueue/config/genqueue_config.hpp>

#include <filesystem>
#include <optional>

namespace genqueue::apps {

/**
 * @brief Complete worker process configuration
 */
struct worker_app_config {
    /// Queue, worker and logging settings after all layers are applied
    config::genqueue_config settings;

    /// JSON file given with --config, if any
    std::optional<std::filesystem::path> config_file;

    /// Keep polling instead of processing a single job
    bool continuous{false};

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --config <file>         JSON configuration file
     *   --queue-dir <path>      Local store directory
     *   --shared-db <path>      Shared SQLite database (selects the shared store)
     *   --shared-url <conninfo> Shared PostgreSQL database (selects the shared store)
     *   --worker-id <id>        Worker id (default: worker-xxxxxx)
     *   --type <type>           Worker type tag (default: local)
     *   --poll-interval <sec>   Seconds between polls when idle (default: 15)
     *   --max-idle <sec>        Exit after this long without work (default: 0, never)
     *   --continuous            Keep polling for jobs
     *   --generator <cmd>       External generator command
     *   --work-dir <path>       Per-job work directory root (default: work)
     *   --log-level <level>     Log level (default: info)
     *   --help                  Show help message
     *
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[]) -> std::optional<worker_app_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace genqueue::apps

#endif  // GENQUEUE_APPS_WORKER_CONFIG_HPP
