/**
 * @file job_store_contract_test.cpp
 * @brief Behaviour every job store backend must share
 *
 * Each test case runs once per backend through GENERATE.
 */

#include "../mocks/queue_fixtures.hpp"

#include <genqueue/queue/job_state_machine.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace genqueue;
using namespace genqueue::queue;
using namespace genqueue::testing;
using namespace std::chrono_literals;

namespace {

auto fetch(job_store& store, const std::string& job_id) -> job_record {
    auto found = store.get(job_id);
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    return *found.value();
}

auto claim_id(job_store& store, const std::string& worker_id) -> std::optional<std::string> {
    auto claimed = store.claim(worker_id, "local");
    REQUIRE(claimed.is_ok());
    if (!claimed.value().has_value()) {
        return std::nullopt;
    }
    return claimed.value()->job_id;
}

}  // namespace

// ============================================================================
// Enqueue
// ============================================================================

TEST_CASE("job_store: enqueue stores a queued record", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    auto job = make_job("job-1", clock.now(), 7, 4);
    job.input.audio_url = "https://cdn.example.com/job-1.wav";
    job.input.params = nlohmann::json{{"fps", 24}, {"seed", 99}};

    auto id = store->enqueue(job);
    REQUIRE(id.is_ok());
    CHECK(id.value() == "job-1");

    auto stored = fetch(*store, "job-1");
    CHECK(stored == job);
}

TEST_CASE("job_store: enqueue rejects invalid records", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    SECTION("empty id") {
        auto job = make_job("", clock.now());
        auto result = store->enqueue(job);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_job_record);
    }

    SECTION("id that would leave a directory") {
        auto id = GENERATE(as<std::string>{}, "../../home/victim", "/tmp/abs_job", "..",
                           ".hidden", "a/b", "a\\b", "job 1", "job.json");
        CAPTURE(id);
        auto result = store->enqueue(make_job(id, clock.now()));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_job_record);

        auto stats = store->stats();
        REQUIRE(stats.is_ok());
        CHECK(stats.value().total == 0);
    }

    SECTION("overlong id") {
        auto result = store->enqueue(make_job(std::string(max_job_id_length + 1, 'a'),
                                              clock.now()));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_job_record);
    }

    SECTION("status other than queued") {
        auto job = make_job("job-1", clock.now());
        job.status = job_status::generating;
        auto result = store->enqueue(job);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_job_record);
    }

    SECTION("max_attempts below one") {
        auto job = make_job("job-1", clock.now(), 10, 0);
        auto result = store->enqueue(job);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_job_record);
    }

    SECTION("duplicate id") {
        REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());
        auto result = store->enqueue(make_job("job-1", clock.now()));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::duplicate_job);
    }
}

// ============================================================================
// Claim
// ============================================================================

TEST_CASE("job_store: claim on an empty queue returns nothing", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    auto claimed = store->claim("w1", "local");
    REQUIRE(claimed.is_ok());
    CHECK_FALSE(claimed.value().has_value());
}

TEST_CASE("job_store: claim sets ownership fields", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());
    clock.advance(5s);

    auto claimed = store->claim("w1", "colab");
    REQUIRE(claimed.is_ok());
    REQUIRE(claimed.value().has_value());

    const auto& job = *claimed.value();
    CHECK(job.job_id == "job-1");
    CHECK(job.status == job_status::claimed);
    CHECK(job.claimed_by == std::optional<std::string>("w1"));
    CHECK(job.claimed_at == std::optional<timestamp>(clock.now()));
    CHECK(job.worker_type == std::optional<std::string>("colab"));
    CHECK(job.message == "claimed by w1");
    CHECK(job.updated_at == clock.now());
    CHECK(job.attempt == 0);

    CHECK(fetch(*store, "job-1") == job);

    auto second = store->claim("w2", "colab");
    REQUIRE(second.is_ok());
    CHECK_FALSE(second.value().has_value());
}

TEST_CASE("job_store: claim serves lower priority values first", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("x", clock.now(), 10)).is_ok());
    clock.advance(1s);
    REQUIRE(store->enqueue(make_job("y", clock.now(), 1)).is_ok());

    CHECK(claim_id(*store, "w1") == std::optional<std::string>("y"));
    CHECK(claim_id(*store, "w2") == std::optional<std::string>("x"));
    CHECK_FALSE(claim_id(*store, "w3").has_value());
}

TEST_CASE("job_store: claim breaks priority ties by creation time", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    auto t0 = clock.now();

    // Inserted out of creation order on purpose
    REQUIRE(store->enqueue(make_job("second", t0 + 1s, 5)).is_ok());
    REQUIRE(store->enqueue(make_job("first", t0, 5)).is_ok());

    SECTION("earlier creation wins") {
        CHECK(claim_id(*store, "w1") == std::optional<std::string>("first"));
        CHECK(claim_id(*store, "w1") == std::optional<std::string>("second"));
    }

    SECTION("equal creation time falls back to insertion order") {
        REQUIRE(store->enqueue(make_job("tie-a", t0 - 1s, 5)).is_ok());
        REQUIRE(store->enqueue(make_job("tie-b", t0 - 1s, 5)).is_ok());
        CHECK(claim_id(*store, "w1") == std::optional<std::string>("tie-a"));
        CHECK(claim_id(*store, "w1") == std::optional<std::string>("tie-b"));
        CHECK(claim_id(*store, "w1") == std::optional<std::string>("first"));
    }
}

TEST_CASE("job_store: concurrent claims give each job to exactly one worker",
          "[storage][contract][concurrency]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    constexpr int worker_count = 8;

    SECTION("one job, many workers") {
        REQUIRE(store->enqueue(make_job("only", clock.now())).is_ok());

        std::atomic<int> winners{0};
        std::atomic<int> errors{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < worker_count; ++i) {
            threads.emplace_back([&, i]() {
                auto claimed = store->claim("w" + std::to_string(i), "local");
                if (claimed.is_err()) {
                    ++errors;
                } else if (claimed.value().has_value()) {
                    ++winners;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        CHECK(errors.load() == 0);
        CHECK(winners.load() == 1);
        CHECK(fetch(*store, "only").status == job_status::claimed);
    }

    SECTION("many jobs, many workers") {
        constexpr int job_count = 20;
        for (int i = 0; i < job_count; ++i) {
            REQUIRE(store->enqueue(make_job("job-" + std::to_string(i), clock.now())).is_ok());
        }

        std::mutex ids_mutex;
        std::vector<std::string> claimed_ids;
        std::vector<std::thread> threads;
        for (int i = 0; i < worker_count; ++i) {
            threads.emplace_back([&, i]() {
                const auto worker = "w" + std::to_string(i);
                for (int attempt = 0; attempt < job_count; ++attempt) {
                    auto claimed = store->claim(worker, "local");
                    if (claimed.is_err() || !claimed.value().has_value()) {
                        continue;
                    }
                    std::lock_guard lock(ids_mutex);
                    claimed_ids.push_back(claimed.value()->job_id);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        std::set<std::string> unique(claimed_ids.begin(), claimed_ids.end());
        CHECK(claimed_ids.size() == unique.size());
        CHECK(unique.size() == static_cast<std::size_t>(job_count));
    }
}

// ============================================================================
// Progress
// ============================================================================

TEST_CASE("job_store: progress moves a claimed job to generating", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());
    REQUIRE(claim_id(*store, "w1").has_value());

    progress_report report;
    report.progress = 40;
    report.message = "rendering frames";
    report.worker_id = "w1";
    REQUIRE(store->update_progress("job-1", report).is_ok());

    auto job = fetch(*store, "job-1");
    CHECK(job.status == job_status::generating);
    CHECK(job.progress == 40);
    CHECK(job.message == "rendering frames");

    SECTION("uploading is reachable from generating") {
        report.progress = 95;
        report.status = job_status::uploading;
        REQUIRE(store->update_progress("job-1", report).is_ok());
        CHECK(fetch(*store, "job-1").status == job_status::uploading);

        SECTION("and does not go back") {
            report.status = job_status::generating;
            REQUIRE(store->update_progress("job-1", report).is_ok());
            CHECK(fetch(*store, "job-1").status == job_status::uploading);
        }
    }

    SECTION("terminal statuses cannot be requested") {
        report.status = job_status::complete;
        REQUIRE(store->update_progress("job-1", report).is_ok());
        auto after = fetch(*store, "job-1");
        CHECK(after.status == job_status::generating);
        CHECK_FALSE(after.output.has_value());
    }

    SECTION("values are clamped") {
        report.progress = 250;
        REQUIRE(store->update_progress("job-1", report).is_ok());
        CHECK(fetch(*store, "job-1").progress == 100);

        report.progress = -5;
        REQUIRE(store->update_progress("job-1", report).is_ok());
        CHECK(fetch(*store, "job-1").progress == 0);
    }
}

TEST_CASE("job_store: uploading reported straight after a claim", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());
    REQUIRE(claim_id(*store, "w1").has_value());

    progress_report report;
    report.progress = 90;
    report.message = "publishing";
    report.status = job_status::uploading;
    report.worker_id = "w1";
    REQUIRE(store->update_progress("job-1", report).is_ok());

    auto job = fetch(*store, "job-1");
    CHECK(job.status == job_status::uploading);
    CHECK(job.progress == 90);
    CHECK(job.claimed_by == "w1");
}

TEST_CASE("job_store: text with quotes and newlines is stored verbatim",
          "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    auto job = make_job("job-1", clock.now());
    job.input.audio_path = "uploads/o'brien's \"mix\".wav";
    job.input.params = nlohmann::json{{"title", "it's; DROP TABLE generation_jobs; --"}};
    REQUIRE(store->enqueue(job).is_ok());
    CHECK(fetch(*store, "job-1") == job);

    REQUIRE(claim_id(*store, "w1").has_value());
    auto failed = store->fail("job-1", "can't allocate\nline two", "w1");
    REQUIRE(failed.is_ok());

    auto after = fetch(*store, "job-1");
    CHECK(after.last_error == "can't allocate\nline two");
    CHECK(after.input.audio_path == job.input.audio_path);
}

TEST_CASE("job_store: progress outside the current claim is ignored", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());

    progress_report report;
    report.progress = 50;
    report.message = "late";

    SECTION("queued job") {
        REQUIRE(store->update_progress("job-1", report).is_ok());
        auto job = fetch(*store, "job-1");
        CHECK(job.status == job_status::queued);
        CHECK(job.progress == 0);
    }

    SECTION("job held by another worker") {
        REQUIRE(claim_id(*store, "w1").has_value());
        report.worker_id = "w2";
        REQUIRE(store->update_progress("job-1", report).is_ok());
        auto job = fetch(*store, "job-1");
        CHECK(job.status == job_status::claimed);
        CHECK(job.message == "claimed by w1");
    }

    SECTION("completed job") {
        REQUIRE(claim_id(*store, "w1").has_value());
        REQUIRE(store->complete("job-1", job_output{"out/1"}, "w1").is_ok());
        REQUIRE(store->update_progress("job-1", report).is_ok());
        auto job = fetch(*store, "job-1");
        CHECK(job.status == job_status::complete);
        CHECK(job.progress == 100);
    }

    SECTION("unknown job") {
        auto result = store->update_progress("missing", report);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::job_not_found);
    }
}

// ============================================================================
// Complete
// ============================================================================

TEST_CASE("job_store: complete finalizes an in-flight job", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());
    REQUIRE(claim_id(*store, "w1").has_value());

    job_output output;
    output.output_url = "out/123";
    output.output_dir = "/tmp/out/123";
    output.quality_score = 0.82;
    output.loop_score = 0.91;

    REQUIRE(store->complete("job-1", output, "w1").is_ok());

    auto job = fetch(*store, "job-1");
    CHECK(job.status == job_status::complete);
    CHECK(job.progress == 100);
    CHECK(job.message == "generation complete");
    REQUIRE(job.output.has_value());
    CHECK(*job.output == output);
    CHECK(job.claimed_by == std::optional<std::string>("w1"));

    SECTION("repeat completion is accepted and keeps the first payload") {
        job_output other;
        other.output_url = "out/other";
        REQUIRE(store->complete("job-1", other, "w1").is_ok());
        REQUIRE(store->complete("job-1", other, std::nullopt).is_ok());
        CHECK(fetch(*store, "job-1").output->output_url == "out/123");
    }
}

TEST_CASE("job_store: complete without an active claim is rejected", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now(), 10, 1)).is_ok());

    SECTION("queued job") {
        auto result = store->complete("job-1", job_output{"out/1"}, std::nullopt);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::stale_claim);
        CHECK(fetch(*store, "job-1").status == job_status::queued);
    }

    SECTION("dead job") {
        REQUIRE(claim_id(*store, "w1").has_value());
        REQUIRE(store->fail("job-1", "boom", "w1").is_ok());
        auto result = store->complete("job-1", job_output{"out/1"}, "w1");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::stale_claim);
        CHECK(fetch(*store, "job-1").status == job_status::dead);
    }

    SECTION("job held by another worker") {
        REQUIRE(claim_id(*store, "w1").has_value());
        auto result = store->complete("job-1", job_output{"out/1"}, "w2");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::stale_claim);
        CHECK(fetch(*store, "job-1").status == job_status::claimed);
    }

    SECTION("unknown job") {
        auto result = store->complete("missing", job_output{"out/1"}, std::nullopt);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::job_not_found);
    }
}

// ============================================================================
// Fail
// ============================================================================

TEST_CASE("job_store: failures requeue until attempts run out", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now(), 10, 3)).is_ok());

    REQUIRE(claim_id(*store, "w1").has_value());
    auto first = store->fail("job-1", "e1", "w1");
    REQUIRE(first.is_ok());
    CHECK(first.value() == job_status::queued);
    {
        auto job = fetch(*store, "job-1");
        CHECK(job.status == job_status::queued);
        CHECK(job.attempt == 1);
        CHECK(job.message == "retry 1/3: e1");
        CHECK(job.last_error == std::optional<std::string>("e1"));
        CHECK_FALSE(job.claimed_by.has_value());
        CHECK_FALSE(job.claimed_at.has_value());
    }

    REQUIRE(claim_id(*store, "w2").has_value());
    auto second = store->fail("job-1", "e2", "w2");
    REQUIRE(second.is_ok());
    CHECK(second.value() == job_status::queued);
    CHECK(fetch(*store, "job-1").attempt == 2);

    REQUIRE(claim_id(*store, "w3").has_value());
    auto third = store->fail("job-1", "e3", "w3");
    REQUIRE(third.is_ok());
    CHECK(third.value() == job_status::dead);

    auto job = fetch(*store, "job-1");
    CHECK(job.status == job_status::dead);
    CHECK(job.attempt == 3);
    CHECK(job.last_error == std::optional<std::string>("e3"));
    CHECK(job.message == "failed after 3 attempts: e3");

    CHECK_FALSE(claim_id(*store, "w4").has_value());
}

TEST_CASE("job_store: fail without an active claim is rejected", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("job-1", clock.now())).is_ok());

    SECTION("queued job keeps its attempt count") {
        auto result = store->fail("job-1", "late", std::nullopt);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::stale_claim);
        CHECK(fetch(*store, "job-1").attempt == 0);
    }

    SECTION("complete job stays complete") {
        REQUIRE(claim_id(*store, "w1").has_value());
        REQUIRE(store->complete("job-1", job_output{"out/1"}, "w1").is_ok());
        auto result = store->fail("job-1", "late", "w1");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::stale_claim);
        CHECK(fetch(*store, "job-1").status == job_status::complete);
    }

    SECTION("unknown job") {
        auto result = store->fail("missing", "boom", std::nullopt);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::job_not_found);
    }
}

// ============================================================================
// Stale Reclaim
// ============================================================================

TEST_CASE("job_store: stale claims are requeued without consuming a retry",
          "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("old", clock.now())).is_ok());
    REQUIRE(store->enqueue(make_job("fresh", clock.now())).is_ok());
    REQUIRE(store->enqueue(make_job("waiting", clock.now())).is_ok());

    REQUIRE(claim_id(*store, "w1") == std::optional<std::string>("old"));
    progress_report report;
    report.progress = 30;
    report.message = "generating";
    REQUIRE(store->update_progress("old", report).is_ok());

    clock.advance(20min);
    REQUIRE(claim_id(*store, "w2") == std::optional<std::string>("fresh"));
    clock.advance(15min);

    auto requeued = store->requeue_stale(30min);
    REQUIRE(requeued.is_ok());
    REQUIRE(requeued.value().size() == 1);
    CHECK(requeued.value().front() == "old");

    auto old = fetch(*store, "old");
    CHECK(old.status == job_status::queued);
    CHECK(old.attempt == 0);
    CHECK_FALSE(old.claimed_by.has_value());
    CHECK_FALSE(old.claimed_at.has_value());
    CHECK(old.message == "requeued: claim timed out");

    CHECK(fetch(*store, "fresh").status == job_status::claimed);
    CHECK(fetch(*store, "waiting").status == job_status::queued);

    SECTION("a second scan finds nothing") {
        auto again = store->requeue_stale(30min);
        REQUIRE(again.is_ok());
        CHECK(again.value().empty());
    }

    SECTION("late reports from the reclaimed worker are rejected") {
        auto completed = store->complete("old", job_output{"out/late"}, "w1");
        REQUIRE(completed.is_err());
        CHECK(completed.error().code == error_codes::stale_claim);

        auto failed = store->fail("old", "late", "w1");
        REQUIRE(failed.is_err());
        CHECK(failed.error().code == error_codes::stale_claim);

        REQUIRE(store->update_progress("old", report).is_ok());
        CHECK(fetch(*store, "old").status == job_status::queued);
    }

    SECTION("late reports lose against the next claimant") {
        REQUIRE(claim_id(*store, "w3") == std::optional<std::string>("old"));

        auto completed = store->complete("old", job_output{"out/late"}, "w1");
        REQUIRE(completed.is_err());
        CHECK(completed.error().code == error_codes::stale_claim);

        REQUIRE(store->complete("old", job_output{"out/new"}, "w3").is_ok());
        CHECK(fetch(*store, "old").output->output_url == "out/new");
    }
}

TEST_CASE("job_store: terminal jobs are never reclaimed", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    REQUIRE(store->enqueue(make_job("done", clock.now(), 10, 1)).is_ok());
    REQUIRE(store->enqueue(make_job("dead", clock.now(), 10, 1)).is_ok());
    REQUIRE(claim_id(*store, "w1") == std::optional<std::string>("done"));
    REQUIRE(claim_id(*store, "w2") == std::optional<std::string>("dead"));
    REQUIRE(store->complete("done", job_output{"out/done"}, "w1").is_ok());
    REQUIRE(store->fail("dead", "boom", "w2").is_ok());

    clock.advance(24h);
    auto requeued = store->requeue_stale(1min);
    REQUIRE(requeued.is_ok());
    CHECK(requeued.value().empty());
    CHECK(fetch(*store, "done").status == job_status::complete);
    CHECK(fetch(*store, "dead").status == job_status::dead);
}

// ============================================================================
// Statistics and Lookup
// ============================================================================

TEST_CASE("job_store: stats counts jobs by status", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    SECTION("empty store") {
        auto stats = store->stats();
        REQUIRE(stats.is_ok());
        CHECK(stats.value().total == 0);
        CHECK_FALSE(stats.value().avg_quality.has_value());
    }

    SECTION("mixed statuses") {
        for (const auto* id : {"a", "b", "c", "d", "e"}) {
            REQUIRE(store->enqueue(make_job(id, clock.now(), 10, 1)).is_ok());
            clock.advance(1s);
        }

        REQUIRE(claim_id(*store, "w1") == std::optional<std::string>("a"));
        job_output first{"out/a", std::nullopt, 0.8, 0.6};
        REQUIRE(store->complete("a", first, "w1").is_ok());

        REQUIRE(claim_id(*store, "w1") == std::optional<std::string>("b"));
        job_output second{"out/b", std::nullopt, 0.6, std::nullopt};
        REQUIRE(store->complete("b", second, "w1").is_ok());

        REQUIRE(claim_id(*store, "w1") == std::optional<std::string>("c"));
        REQUIRE(store->fail("c", "boom", "w1").is_ok());

        REQUIRE(claim_id(*store, "w1") == std::optional<std::string>("d"));

        auto stats = store->stats();
        REQUIRE(stats.is_ok());
        const auto& s = stats.value();
        CHECK(s.total == 5);
        CHECK(s.complete == 2);
        CHECK(s.dead == 1);
        CHECK(s.claimed == 1);
        CHECK(s.queued == 1);
        CHECK(s.in_flight() == 1);
        REQUIRE(s.avg_quality.has_value());
        CHECK(*s.avg_quality == Catch::Approx(0.7));
        REQUIRE(s.avg_loop_score.has_value());
        CHECK(*s.avg_loop_score == Catch::Approx(0.6));
    }
}

TEST_CASE("job_store: get returns nothing for unknown ids", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;
    auto store = open_store(kind, dir.path(), clock.source());

    auto found = store->get("missing");
    REQUIRE(found.is_ok());
    CHECK_FALSE(found.value().has_value());
}

// ============================================================================
// Durability
// ============================================================================

TEST_CASE("job_store: records survive reopening the store", "[storage][contract]") {
    auto kind = GENERATE(backend::local, backend::shared);
    CAPTURE(backend_label(kind));

    temp_directory dir;
    manual_clock clock;

    job_record expected;
    {
        auto store = open_store(kind, dir.path(), clock.source());
        auto job = make_job("job-1", clock.now(), 3, 5);
        job.input.direction = nlohmann::json{{"palette", "dusk"}};
        job.input.emotional_dna = nlohmann::json{{"energy", 0.4}};
        REQUIRE(store->enqueue(job).is_ok());
        REQUIRE(store->enqueue(make_job("job-2", clock.now())).is_ok());

        clock.advance(2s);
        REQUIRE(claim_id(*store, "w1") == std::optional<std::string>("job-1"));
        progress_report report;
        report.progress = 60;
        report.message = "halfway";
        REQUIRE(store->update_progress("job-1", report).is_ok());

        expected = fetch(*store, "job-1");
    }

    auto reopened = open_store(kind, dir.path(), clock.source());
    CHECK(fetch(*reopened, "job-1") == expected);
    CHECK(fetch(*reopened, "job-2").status == job_status::queued);
    CHECK(claim_id(*reopened, "w2") == std::optional<std::string>("job-2"));
}
