/**
 * @file shared_job_store_test.cpp
 * @brief Unit tests for the shared SQL job store
 *
 * SQLite cases always run. PostgreSQL cases run when GENQUEUE_TEST_POSTGRES_URL
 * names a scratch database whose generation_jobs table may be emptied.
 */

#include "../mocks/queue_fixtures.hpp"

#include <genqueue/storage/shared_job_store.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <atomic>
#include <cstdlib>
#include <set>
#include <thread>
#include <vector>

using namespace genqueue;
using namespace genqueue::queue;
using namespace genqueue::storage;
using namespace genqueue::testing;
using namespace std::chrono_literals;

namespace {

auto open_shared(const std::filesystem::path& path, manual_clock& clock)
    -> std::unique_ptr<shared_job_store> {
    shared_store_options options;
    options.database_path = path;
    options.busy_timeout = 10000ms;
    auto store = shared_job_store::open(options, clock.source());
    REQUIRE(store.is_ok());
    return std::move(store.value());
}

/// Connection string of a scratch PostgreSQL database, empty when not configured
auto postgres_test_url() -> std::string {
    const char* url = std::getenv("GENQUEUE_TEST_POSTGRES_URL");
    return url ? std::string(url) : std::string();
}

auto open_postgres(const std::string& url, manual_clock& clock)
    -> std::unique_ptr<shared_job_store> {
    shared_store_options options;
    options.backend = database_backend::postgres;
    options.connection_string = url;
    options.busy_timeout = 10000ms;
    auto store = shared_job_store::open(options, clock.source());
    REQUIRE(store.is_ok());
    return std::move(store.value());
}

/// Read one text column with a raw connection
auto query_text(const std::filesystem::path& path, const std::string& sql) -> std::string {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr) ==
            SQLITE_OK);

    sqlite3_stmt* stmt = nullptr;
    std::string value;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK &&
        sqlite3_step(stmt) == SQLITE_ROW) {
        const auto* text = sqlite3_column_text(stmt, 0);
        if (text) {
            value = reinterpret_cast<const char*>(text);
        }
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return value;
}

}  // namespace

// ============================================================================
// Schema
// ============================================================================

TEST_CASE("shared_job_store: open creates the table and indexes", "[storage][shared_store]") {
    temp_directory temp_dir;
    manual_clock clock;
    auto path = temp_dir.path() / "db" / "queue.db";

    auto store = open_shared(path, clock);
    CHECK(store->backend_name() == "shared");
    REQUIRE(std::filesystem::exists(path));

    CHECK(query_text(path, "SELECT name FROM sqlite_master WHERE type = 'table' AND "
                           "name = 'generation_jobs';") == "generation_jobs");
    CHECK(query_text(path, "SELECT name FROM sqlite_master WHERE type = 'index' AND "
                           "name = 'idx_generation_jobs_dispatch';") ==
          "idx_generation_jobs_dispatch");
    CHECK(query_text(path, "PRAGMA journal_mode;") == "wal");
}

TEST_CASE("shared_job_store: in-memory databases work without WAL", "[storage][shared_store]") {
    manual_clock clock;
    shared_store_options options;
    options.database_path = ":memory:";

    auto opened = shared_job_store::open(options, clock.source());
    REQUIRE(opened.is_ok());
    auto& store = *opened.value();

    REQUIRE(store.enqueue(make_job("job-1", clock.now())).is_ok());
    auto claimed = store.claim("w1", "local");
    REQUIRE(claimed.is_ok());
    CHECK(claimed.value().has_value());
}

TEST_CASE("shared_job_store: statuses are persisted by name", "[storage][shared_store]") {
    temp_directory temp_dir;
    manual_clock clock;
    auto path = temp_dir.path() / "queue.db";
    auto store = open_shared(path, clock);

    REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());
    CHECK(query_text(path, "SELECT status FROM generation_jobs WHERE job_id = 'job-1';") ==
          "queued");

    REQUIRE(store->claim("w1", "local").is_ok());
    CHECK(query_text(path, "SELECT status FROM generation_jobs WHERE job_id = 'job-1';") ==
          "claimed");

    progress_report report;
    report.progress = 90;
    report.status = job_status::uploading;
    REQUIRE(store->update_progress("job-1", report).is_ok());
    CHECK(query_text(path, "SELECT status FROM generation_jobs WHERE job_id = 'job-1';") ==
          "uploading");
    CHECK(query_text(path, "SELECT claimed_at FROM generation_jobs WHERE job_id = 'job-1';") ==
          "2026-10-18T09:00:00.000000Z");
}

// ============================================================================
// Multi-Instance Behaviour
// ============================================================================

TEST_CASE("shared_job_store: two instances on one file never share a claim",
          "[storage][shared_store][concurrency]") {
    temp_directory temp_dir;
    manual_clock clock;
    auto path = temp_dir.path() / "queue.db";

    auto first = open_shared(path, clock);
    auto second = open_shared(path, clock);

    constexpr int job_count = 30;
    for (int i = 0; i < job_count; ++i) {
        REQUIRE(first->enqueue(make_job("job-" + std::to_string(i), clock.now())).is_ok());
    }

    std::mutex ids_mutex;
    std::vector<std::string> claimed_ids;
    std::atomic<int> errors{0};

    auto drain = [&](shared_job_store& store, const std::string& worker) {
        for (int attempt = 0; attempt < job_count; ++attempt) {
            auto claimed = store.claim(worker, "local");
            if (claimed.is_err()) {
                ++errors;
                continue;
            }
            if (!claimed.value().has_value()) {
                continue;
            }
            std::lock_guard lock(ids_mutex);
            claimed_ids.push_back(claimed.value()->job_id);
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back(drain, std::ref(*first), "a" + std::to_string(i));
        threads.emplace_back(drain, std::ref(*second), "b" + std::to_string(i));
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(errors.load() == 0);
    std::set<std::string> unique(claimed_ids.begin(), claimed_ids.end());
    CHECK(unique.size() == claimed_ids.size());
    CHECK(unique.size() == static_cast<std::size_t>(job_count));

    auto stats = second->stats();
    REQUIRE(stats.is_ok());
    CHECK(stats.value().claimed == static_cast<std::size_t>(job_count));
}

TEST_CASE("shared_job_store: reports from one instance are visible to another",
          "[storage][shared_store]") {
    temp_directory temp_dir;
    manual_clock clock;
    auto path = temp_dir.path() / "queue.db";

    auto api = open_shared(path, clock);
    auto worker = open_shared(path, clock);

    REQUIRE(api->enqueue(make_job("job-1", clock.now())).is_ok());
    auto claimed = worker->claim("w1", "colab");
    REQUIRE(claimed.is_ok());
    REQUIRE(claimed.value().has_value());

    clock.advance(1h);

    SECTION("completion") {
        REQUIRE(worker->complete("job-1", job_output{"out/1"}, "w1").is_ok());
        auto found = api->get("job-1");
        REQUIRE(found.is_ok());
        CHECK(found.value()->status == job_status::complete);
    }

    SECTION("a monitor on the API side reclaims, the worker's late report is rejected") {
        auto requeued = api->requeue_stale(30min);
        REQUIRE(requeued.is_ok());
        CHECK(requeued.value().size() == 1);

        auto late = worker->complete("job-1", job_output{"out/late"}, "w1");
        REQUIRE(late.is_err());
        CHECK(late.error().code == error_codes::stale_claim);
    }

    SECTION("two monitors never double-requeue") {
        auto first_scan = api->requeue_stale(30min);
        auto second_scan = worker->requeue_stale(30min);
        REQUIRE(first_scan.is_ok());
        REQUIRE(second_scan.is_ok());
        CHECK(first_scan.value().size() + second_scan.value().size() == 1);
    }
}

TEST_CASE("shared_job_store: open fails for an unusable path", "[storage][shared_store]") {
    temp_directory temp_dir;
    manual_clock clock;

    // A directory cannot be opened as a database file
    shared_store_options options;
    options.database_path = temp_dir.path();

    auto store = shared_job_store::open(options, clock.source());
    REQUIRE(store.is_err());
    CHECK(store.error().code == error_codes::database_open_error);
}

// ============================================================================
// PostgreSQL
// ============================================================================

TEST_CASE("shared_job_store: PostgreSQL instances never share a claim",
          "[storage][shared_store][postgres][concurrency]") {
    const auto url = postgres_test_url();
    if (url.empty()) {
        SKIP("GENQUEUE_TEST_POSTGRES_URL is not set");
    }

    manual_clock clock;
    auto api = open_postgres(url, clock);
    auto worker_host = open_postgres(url, clock);

    {
        queue_database scratch(database_backend::postgres, url);
        REQUIRE(scratch.connect().is_ok());
        REQUIRE(scratch.execute("DELETE FROM generation_jobs").is_ok());
    }

    constexpr int job_count = 20;
    for (int i = 0; i < job_count; ++i) {
        auto job = make_job("pg-job-" + std::to_string(i), clock.now(), 10 - i % 3);
        job.input.audio_path = "uploads/it's-" + std::to_string(i) + ".wav";
        REQUIRE(api->enqueue(job).is_ok());
    }
    auto duplicate = api->enqueue(make_job("pg-job-0", clock.now()));
    REQUIRE(duplicate.is_err());
    CHECK(duplicate.error().code == error_codes::duplicate_job);

    std::mutex ids_mutex;
    std::vector<std::string> claimed_ids;
    std::atomic<int> errors{0};

    auto drain = [&](shared_job_store& store, const std::string& worker) {
        for (int attempt = 0; attempt < job_count; ++attempt) {
            auto claimed = store.claim(worker, "colab");
            if (claimed.is_err()) {
                ++errors;
                continue;
            }
            if (!claimed.value().has_value()) {
                continue;
            }
            std::lock_guard lock(ids_mutex);
            claimed_ids.push_back(claimed.value()->job_id);
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back(drain, std::ref(*api), "a" + std::to_string(i));
        threads.emplace_back(drain, std::ref(*worker_host), "b" + std::to_string(i));
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(errors.load() == 0);
    std::set<std::string> unique(claimed_ids.begin(), claimed_ids.end());
    CHECK(unique.size() == claimed_ids.size());
    CHECK(unique.size() == static_cast<std::size_t>(job_count));

    auto job = api->get("pg-job-3");
    REQUIRE(job.is_ok());
    REQUIRE(job.value().has_value());
    CHECK(job.value()->input.audio_path == "uploads/it's-3.wav");
    REQUIRE(job.value()->claimed_by.has_value());

    auto worker_id = *job.value()->claimed_by;
    job_output output;
    output.output_url = "out/pg-3";
    output.quality_score = 9.4;
    REQUIRE(worker_host->complete("pg-job-3", output, worker_id).is_ok());

    auto stats = api->stats();
    REQUIRE(stats.is_ok());
    CHECK(stats.value().complete == 1);
    CHECK(stats.value().claimed == static_cast<std::size_t>(job_count - 1));
    REQUIRE(stats.value().avg_quality.has_value());
    CHECK(*stats.value().avg_quality == Catch::Approx(9.4));
}
