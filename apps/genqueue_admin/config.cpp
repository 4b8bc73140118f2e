/**
 * @file config.cpp
 * @brief Command line configuration for the queue administration tool
 */

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace genqueue::apps {

namespace {

bool takes_value(std::string_view arg) {
    return arg == "--config" || arg == "--queue-dir" || arg == "--shared-db" ||
           arg == "--shared-url" ||
           arg == "--log-level" || arg == "--threshold" || arg == "--interval" ||
           arg == "--audio" || arg == "--audio-url" || arg == "--priority" ||
           arg == "--max-attempts" || arg == "--job-id" || arg == "--params" ||
           arg == "--direction";
}

bool parse_int(std::string_view option, const std::string& value, int& out) {
    try {
        out = std::stoi(value);
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid " << option << " value: " << value << "\n";
        return false;
    }
}

bool parse_json(std::string_view option, const std::string& value, nlohmann::json& out) {
    auto parsed = nlohmann::json::parse(value, nullptr, false);
    if (parsed.is_discarded()) {
        std::cerr << "Error: " << option << " is not valid JSON\n";
        return false;
    }
    out = std::move(parsed);
    return true;
}

std::optional<admin_command> command_from_string(std::string_view name) {
    if (name == "submit") return admin_command::submit;
    if (name == "status") return admin_command::status;
    if (name == "stats") return admin_command::stats;
    if (name == "requeue-stale") return admin_command::requeue_stale;
    if (name == "monitor") return admin_command::monitor;
    return std::nullopt;
}

}  // namespace

void admin_app_config::print_help() {
    std::cout << R"(
genqueue admin - Generation Queue Administration

Usage: genqueue_admin [OPTIONS] <command> [ARGS]

Commands:
  submit --audio <path>   Enqueue a full generation job
  status <job_id>         Print a job record as JSON
  stats                   Print job counts by status
  requeue-stale           Requeue claims older than the stale threshold once
  monitor                 Run the stale-claim monitor until interrupted

Options:
  --config <file>         JSON configuration file
  --queue-dir <path>      Local queue directory (default: ./queue)
  --shared-db <path>      Shared SQLite queue database (selects the shared store)
  --shared-url <conninfo> Shared PostgreSQL queue database, reachable from every
                          host (selects the shared store, wins over --shared-db)
  --log-level <level>     Log level (default: info)
  --threshold <sec>       Stale claim threshold (default: 1800)
  --interval <sec>        Monitor scan interval (default: 30)
  --help, -h              Show this help message

Submit options:
  --audio <path>          Source audio path or URL (required)
  --audio-url <url>       Public audio URL for remote workers
  --direction <json>      Selected visual direction
  --params <json>         Generation parameters
  --priority <n>          Lower runs first (default: 10)
  --max-attempts <n>      Attempts before dead-letter (default: 3)
  --job-id <id>           Explicit job id (default: UUID)

Examples:
  genqueue_admin submit --audio /data/track.wav --priority 5
  genqueue_admin --shared-db /srv/queue.db stats
  genqueue_admin --shared-db /srv/queue.db monitor --interval 60

)";
}

auto admin_app_config::parse_args(int argc, char* argv[])
    -> std::optional<admin_app_config> {

    admin_app_config config;

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

    std::vector<std::string> positional;
    auto& settings = config.settings;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (!takes_value(arg)) {
            if (arg.rfind("--", 0) == 0) {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information\n";
                return std::nullopt;
            }
            positional.emplace_back(arg);
            continue;
        }

        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return std::nullopt;
        }
        const std::string value = argv[++i];
        int number = 0;

        if (arg == "--config") {
            continue;
        }

        if (arg == "--queue-dir") {
            settings.queue.local_directory = value;
            if (settings.queue.backend.empty()) {
                settings.queue.backend = config::local_backend;
            }
        } else if (arg == "--shared-db") {
            settings.queue.shared_database = value;
            settings.queue.backend = config::shared_backend;
        } else if (arg == "--shared-url") {
            settings.queue.shared_url = value;
            settings.queue.backend = config::shared_backend;
        } else if (arg == "--log-level") {
            auto level = integration::log_level_from_string(value);
            if (!level) {
                std::cerr << "Error: Invalid log level: " << value << "\n";
                return std::nullopt;
            }
            settings.logging.min_level = *level;
        } else if (arg == "--threshold") {
            if (!parse_int(arg, value, number)) {
                return std::nullopt;
            }
            settings.monitor.stale_threshold = std::chrono::seconds{number};
        } else if (arg == "--interval") {
            if (!parse_int(arg, value, number)) {
                return std::nullopt;
            }
            settings.monitor.interval = std::chrono::seconds{number};
        } else if (arg == "--audio") {
            config.input.audio_path = value;
        } else if (arg == "--audio-url") {
            config.input.audio_url = value;
        } else if (arg == "--direction") {
            if (!parse_json(arg, value, config.input.direction)) {
                return std::nullopt;
            }
        } else if (arg == "--params") {
            if (!parse_json(arg, value, config.input.params)) {
                return std::nullopt;
            }
        } else if (arg == "--priority") {
            if (!parse_int(arg, value, number)) {
                return std::nullopt;
            }
            config.submit.priority = number;
        } else if (arg == "--max-attempts") {
            if (!parse_int(arg, value, number)) {
                return std::nullopt;
            }
            config.submit.max_attempts = number;
        } else if (arg == "--job-id") {
            config.submit.job_id = value;
        }
    }

    if (positional.empty()) {
        std::cerr << "Error: No command given\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    auto command = command_from_string(positional.front());
    if (!command) {
        std::cerr << "Error: Unknown command: " << positional.front() << "\n";
        return std::nullopt;
    }
    config.command = *command;

    if (config.command == admin_command::status) {
        if (positional.size() < 2) {
            std::cerr << "Error: status requires a job id\n";
            return std::nullopt;
        }
        config.job_id = positional[1];
    } else if (positional.size() > 1) {
        std::cerr << "Error: Unexpected argument: " << positional[1] << "\n";
        return std::nullopt;
    }

    if (config.command == admin_command::submit && config.input.audio_path.empty()) {
        std::cerr << "Error: submit requires --audio\n";
        return std::nullopt;
    }

    auto valid = settings.validate();
    if (valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << "\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace genqueue::apps
