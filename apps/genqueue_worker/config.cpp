/**
 * @file config.cpp
 * @brief Command line configuration for the generation worker
 */

#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace genqueue::apps {

namespace {

/// Options that take a value
bool takes_value(std::string_view arg) {
    return arg == "--config" || arg == "--queue-dir" || arg == "--shared-db" ||
           arg == "--shared-url" ||
           arg == "--worker-id" || arg == "--type" || arg == "--poll-interval" ||
           arg == "--max-idle" || arg == "--generator" || arg == "--work-dir" ||
           arg == "--log-level";
}

bool parse_seconds(std::string_view option, const std::string& value,
                   std::chrono::seconds& out) {
    try {
        auto seconds = std::stol(value);
        if (seconds < 0) {
            std::cerr << "Error: " << option << " must not be negative\n";
            return false;
        }
        out = std::chrono::seconds{seconds};
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid " << option << " value: " << value << "\n";
        return false;
    }
}

}  // namespace

void worker_app_config::print_help() {
    std::cout << R"(
genqueue worker - Generation Job Worker

Usage: genqueue_worker [OPTIONS]

Options:
  --config <file>         JSON configuration file
  --queue-dir <path>      Local queue directory (default: ./queue)
  --shared-db <path>      Shared SQLite queue database (selects the shared store)
  --shared-url <conninfo> Shared PostgreSQL queue database, reachable from every
                          host (selects the shared store, wins over --shared-db)
  --worker-id <id>        Worker id (default: worker-xxxxxx)
  --type <type>           Worker type: local, colab, kaggle, ... (default: local)
  --poll-interval <sec>   Seconds between polls when idle (default: 15)
  --max-idle <sec>        Exit after this many idle seconds (default: 0, never)
  --continuous            Keep polling for jobs instead of processing one
  --generator <cmd>       Generator command, run as <cmd> <job.json> <output_dir>
  --work-dir <path>       Per-job work directory root (default: ./work)
  --log-level <level>     Log level: trace, debug, info, warning, error, critical
                          (default: info)
  --help, -h              Show this help message

Generator protocol (stdout lines):
  progress <n> <message>  Report progress (0-100)
  status uploading        Report that the output is being published
  result {json}           Output reference: {"output_url": ..., "quality_score": ...}

Environment:
  GENQUEUE_BACKEND, GENQUEUE_QUEUE_DIR, GENQUEUE_SHARED_DB, GENQUEUE_SHARED_URL,
  GENQUEUE_WORKER_ID,
  GENQUEUE_WORKER_TYPE, GENQUEUE_POLL_INTERVAL, GENQUEUE_MAX_IDLE,
  GENQUEUE_LOG_LEVEL, GENQUEUE_LOG_DIR

Examples:
  # Process one job from the local queue
  genqueue_worker --generator ./generate.sh

  # Poll a shared queue until idle for ten minutes
  genqueue_worker --shared-db /srv/queue.db --type colab --continuous --max-idle 600

)";
}

auto worker_app_config::parse_args(int argc, char* argv[])
    -> std::optional<worker_app_config> {

    worker_app_config config;

    // First pass: help and the configuration file, which the other options override
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a value\n";
                return std::nullopt;
            }
            config.config_file = std::filesystem::path(argv[++i]);
            continue;
        }

        if (takes_value(arg)) {
            ++i;
        }
    }

    if (config.config_file) {
        auto loaded = config::load_config(*config.config_file);
        if (loaded.is_err()) {
            std::cerr << "Error: " << loaded.error().message << "\n";
            return std::nullopt;
        }
        config.settings = loaded.value();
    }

    auto env = config::apply_environment(config.settings);
    if (env.is_err()) {
        std::cerr << "Error: " << env.error().message << "\n";
        return std::nullopt;
    }

    auto& queue = config.settings.queue;
    auto& worker = config.settings.worker;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--continuous") {
            config.continuous = true;
            continue;
        }

        if (!takes_value(arg)) {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }

        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return std::nullopt;
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            continue;
        }

        if (arg == "--queue-dir") {
            queue.local_directory = value;
            if (queue.backend.empty()) {
                queue.backend = config::local_backend;
            }
        } else if (arg == "--shared-db") {
            queue.shared_database = value;
            queue.backend = config::shared_backend;
        } else if (arg == "--shared-url") {
            queue.shared_url = value;
            queue.backend = config::shared_backend;
        } else if (arg == "--worker-id") {
            worker.worker_id = value;
        } else if (arg == "--type") {
            worker.worker_type = value;
        } else if (arg == "--poll-interval") {
            if (!parse_seconds(arg, value, worker.poll_interval)) {
                return std::nullopt;
            }
        } else if (arg == "--max-idle") {
            if (!parse_seconds(arg, value, worker.max_idle)) {
                return std::nullopt;
            }
        } else if (arg == "--generator") {
            worker.generator_command = value;
        } else if (arg == "--work-dir") {
            worker.work_directory = value;
        } else if (arg == "--log-level") {
            auto level = integration::log_level_from_string(value);
            if (!level) {
                std::cerr << "Error: Invalid log level: " << value << "\n";
                std::cerr << "Valid levels: trace, debug, info, warning, error, critical\n";
                return std::nullopt;
            }
            config.settings.logging.min_level = *level;
        }
    }

    auto valid = config.settings.validate();
    if (valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << "\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace genqueue::apps
