/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter and the job audit trail
 */

#include "../mocks/queue_fixtures.hpp"

#include <genqueue/di/ilogger.hpp>
#include <genqueue/integration/logger_adapter.hpp>
#include <genqueue/queue/queue_manager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <vector>

using namespace genqueue;
using namespace genqueue::integration;
using namespace genqueue::testing;

namespace {

/**
 * @brief Read a JSON-lines file
 */
auto read_lines(const std::filesystem::path& path) -> std::vector<nlohmann::json> {
    std::vector<nlohmann::json> entries;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            entries.push_back(nlohmann::json::parse(line));
        }
    }
    return entries;
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;
};

auto quiet_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.async_mode = false;
    return config;
}

}  // namespace

// =============================================================================
// Initialization
// =============================================================================

TEST_CASE("logger_adapter: initialization and shutdown", "[logger_adapter][init]") {
    temp_directory temp_dir;

    SECTION("basic initialization") {
        auto config = quiet_config(temp_dir.path());
        config.enable_file = true;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());
        CHECK(logger_adapter::get_config().enable_file);

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("repeated initialization keeps the first configuration") {
        auto first = quiet_config(temp_dir.path());
        first.min_level = log_level::debug;
        auto second = first;
        second.min_level = log_level::error;

        logger_adapter::initialize(first);
        logger_adapter::initialize(second);
        CHECK(logger_adapter::get_min_level() == log_level::debug);

        logger_adapter::shutdown();
    }

    SECTION("shutdown without initialization") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("messages before initialization are dropped") {
        logger_adapter::info("nobody hears {}", "this");
        CHECK_FALSE(logger_adapter::is_audit_enabled());
    }
}

// =============================================================================
// Levels
// =============================================================================

TEST_CASE("logger_adapter: level filtering", "[logger_adapter][level]") {
    temp_directory temp_dir;
    logger_test_fixture fixture(quiet_config(temp_dir.path()));

    logger_adapter::set_min_level(log_level::warn);
    CHECK(logger_adapter::get_min_level() == log_level::warn);
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::info));
    CHECK(logger_adapter::is_level_enabled(log_level::warn));
    CHECK(logger_adapter::is_level_enabled(log_level::fatal));

    logger_adapter::set_min_level(log_level::info);
}

TEST_CASE("logger_adapter: level names", "[logger_adapter][level]") {
    CHECK(log_level_from_string("debug") == log_level::debug);
    CHECK(log_level_from_string("warning") == log_level::warn);
    CHECK(log_level_from_string("critical") == log_level::fatal);
    CHECK(log_level_from_string("off") == log_level::off);
    CHECK_FALSE(log_level_from_string("loud").has_value());

    CHECK(logger_adapter::log_level_to_string(log_level::trace) == "TRACE");
    CHECK(logger_adapter::log_level_to_string(log_level::warn) == "WARN");
    CHECK(logger_adapter::log_level_to_string(log_level::off) == "OFF");
}

TEST_CASE("logger_adapter: logger service follows the adapter level", "[logger_adapter][di]") {
    temp_directory temp_dir;
    auto config = quiet_config(temp_dir.path());
    config.min_level = log_level::error;
    logger_test_fixture fixture(config);

    di::LoggerService service;
    CHECK_FALSE(service.is_enabled(log_level::warn));
    CHECK(service.is_enabled(log_level::error));

    CHECK_FALSE(di::null_logger()->is_enabled(log_level::fatal));
}

// =============================================================================
// Audit Trail
// =============================================================================

TEST_CASE("logger_adapter: job transitions are appended to the audit trail",
          "[logger_adapter][audit]") {
    temp_directory temp_dir;
    auto config = quiet_config(temp_dir.path() / "logs");
    config.enable_audit_log = true;
    auto audit_path = config.log_directory / "job_audit.jsonl";

    {
        logger_test_fixture fixture(config);
        REQUIRE(logger_adapter::is_audit_enabled());

        manual_clock clock;
        queue::queue_manager manager(
            open_store(backend::local, temp_dir.path(), clock.source()), {},
            clock.source());

        queue::job_input input;
        input.audio_path = "uploads/a.wav";
        queue::submit_options options;
        options.job_id = "job-1";
        options.max_attempts = 1;
        REQUIRE(manager.submit(input, options).is_ok());
        REQUIRE(manager.claim("w1", "local").is_ok());

        queue::progress_report report;
        report.progress = 40;
        report.message = "rendering";
        report.worker_id = "w1";
        REQUIRE(manager.update_progress("job-1", report).is_ok());
        REQUIRE(manager.update_progress("job-1", report).is_ok());

        auto failed = manager.fail("job-1", "cuda error", std::string("w1"));
        REQUIRE(failed.is_ok());
        CHECK(failed.value() == queue::job_status::dead);
    }

    auto entries = read_lines(audit_path);
    REQUIRE(entries.size() == 4);

    CHECK(entries[0]["job_id"] == "job-1");
    CHECK(entries[0]["from"] == "");
    CHECK(entries[0]["to"] == "queued");
    CHECK(entries[0]["detail"] == "submitted");

    CHECK(entries[1]["from"] == "queued");
    CHECK(entries[1]["to"] == "claimed");
    CHECK(entries[1]["worker_id"] == "w1");

    CHECK(entries[2]["from"] == "claimed");
    CHECK(entries[2]["to"] == "generating");

    CHECK(entries[3]["from"] == "generating");
    CHECK(entries[3]["to"] == "dead");
    CHECK(entries[3]["detail"] == "cuda error");
    CHECK(entries[3].contains("timestamp"));
}

TEST_CASE("logger_adapter: the audit trail is off by default", "[logger_adapter][audit]") {
    temp_directory temp_dir;
    logger_test_fixture fixture(quiet_config(temp_dir.path()));

    CHECK_FALSE(logger_adapter::is_audit_enabled());
    logger_adapter::log_job_transition("job-1", "queued", "claimed", "w1", "");
    CHECK_FALSE(std::filesystem::exists(temp_dir.path() / "job_audit.jsonl"));
}
