/**
 * @file job_codec_test.cpp
 * @brief Unit tests for the JSON encoding of job records and statistics
 */

#include "../mocks/queue_fixtures.hpp"

#include <genqueue/queue/job_codec.hpp>
#include <genqueue/queue/job_state_machine.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace genqueue;
using namespace genqueue::queue;
using namespace genqueue::testing;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

auto full_record(manual_clock& clock) -> job_record {
    auto job = make_job("job-1", clock.now(), 3, 4);
    job.input.audio_url = "https://cdn.example.com/a.wav";
    job.input.direction = {{"name", "aurora"}};
    job.input.emotional_dna = {{"tempo", 121.5}};
    job.input.params = {{"frames", 240}};
    clock.advance(90s);
    apply_claim(job, "w1", "colab", clock.now());
    apply_progress(job, progress_report{55, "rendering"}, clock.now());

    job_output output;
    output.output_url = "https://cdn.example.com/out.mp4";
    output.output_dir = "/work/job-1/output";
    output.quality_score = 0.88;
    apply_completion(job, output, clock.now());
    return job;
}

}  // namespace

TEST_CASE("job_codec: encoded field names", "[queue][codec]") {
    manual_clock clock;
    auto encoded = encode_job(full_record(clock));

    CHECK(encoded["job_id"] == "job-1");
    CHECK(encoded["status"] == "complete");
    CHECK(encoded["created_at"] == "2026-10-18T09:00:00.000000Z");
    CHECK(encoded["claimed_at"] == "2026-10-18T09:01:30.000000Z");
    CHECK(encoded["claimed_by"] == "w1");
    CHECK(encoded["worker_type"] == "colab");
    CHECK(encoded["generation_mode"] == "full");
    CHECK(encoded["progress"] == 100);
    CHECK(encoded["output_url"] == "https://cdn.example.com/out.mp4");
    CHECK(encoded["quality_score"] == 0.88);
    CHECK(encoded["loop_score"].is_null());
    CHECK(encoded["error"].is_null());
    CHECK(encoded["attempt"] == 0);
    CHECK(encoded["max_attempts"] == 4);
}

TEST_CASE("job_codec: a full record decodes back unchanged", "[queue][codec]") {
    manual_clock clock;
    auto job = full_record(clock);

    auto decoded = decode_job(encode_job(job));
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == job);
}

TEST_CASE("job_codec: a queued record has null ownership and output", "[queue][codec]") {
    manual_clock clock;
    auto encoded = encode_job(make_job("job-2", clock.now()));

    CHECK(encoded["claimed_by"].is_null());
    CHECK(encoded["claimed_at"].is_null());
    CHECK(encoded["output_url"].is_null());

    auto decoded = decode_job(encoded);
    REQUIRE(decoded.is_ok());
    CHECK_FALSE(decoded.value().output.has_value());
    CHECK_FALSE(decoded.value().claimed_by.has_value());
}

TEST_CASE("job_codec: minimal records take defaults", "[queue][codec]") {
    json minimal = {
        {"job_id", "job-3"},
        {"status", "queued"},
        {"created_at", "2026-10-18 09:00:00"},
    };

    auto decoded = decode_job(minimal);
    REQUIRE(decoded.is_ok());
    const auto& job = decoded.value();
    CHECK(job.updated_at == job.created_at);
    CHECK(job.priority == default_priority);
    CHECK(job.max_attempts == default_max_attempts);
    CHECK(job.generation_mode == "full");
    CHECK(job.input.params == json::object());
    CHECK(job.input.direction.is_null());
    CHECK(job.message.empty());
}

TEST_CASE("job_codec: malformed records are rejected", "[queue][codec]") {
    json record = {
        {"job_id", "job-4"},
        {"status", "queued"},
        {"created_at", "2026-10-18T09:00:00Z"},
    };

    SECTION("not an object") {
        record = json::array({1, 2});
    }

    SECTION("missing id") {
        record.erase("job_id");
    }

    SECTION("unknown status") {
        record["status"] = "paused";
    }

    SECTION("bad timestamp") {
        record["created_at"] = "yesterday";
    }

    SECTION("wrong field type") {
        record["priority"] = "high";
    }

    SECTION("integer field out of int range") {
        record["max_attempts"] = 2147483648LL;
    }

    SECTION("integer field given as a huge float") {
        record["priority"] = 1e300;
    }

    SECTION("integer field given as a fraction") {
        record["progress"] = 42.5;
    }

    SECTION("half-set claim") {
        record["status"] = "claimed";
        record["claimed_by"] = "w1";
    }

    auto decoded = decode_job(record);
    REQUIRE(decoded.is_err());
    CHECK(decoded.error().code == error_codes::invalid_job_record);
}

TEST_CASE("job_codec: checked int conversion", "[queue][codec]") {
    CHECK(to_checked_int(json(7)) == 7);
    CHECK(to_checked_int(json(-3)) == -3);
    CHECK(to_checked_int(json(2147483647)) == 2147483647);
    CHECK(to_checked_int(json(-2147483648LL)) == std::numeric_limits<int>::min());

    CHECK_FALSE(to_checked_int(json(2147483648LL)).has_value());
    CHECK_FALSE(to_checked_int(json(-2147483649LL)).has_value());
    CHECK_FALSE(to_checked_int(json(18446744073709551615ULL)).has_value());
    CHECK_FALSE(to_checked_int(json(1e300)).has_value());
    CHECK_FALSE(to_checked_int(json(3.0)).has_value());
    CHECK_FALSE(to_checked_int(json("5")).has_value());
    CHECK_FALSE(to_checked_int(json(nullptr)).has_value());
}

TEST_CASE("job_codec: output references", "[queue][codec]") {
    auto decoded = decode_output({{"output_url", "out/1"}, {"loop_score", 0.4}});
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().output_url == "out/1");
    CHECK(decoded.value().loop_score == 0.4);
    CHECK_FALSE(decoded.value().quality_score.has_value());

    auto missing = decode_output({{"quality_score", 1.0}});
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::invalid_job_record);
}

TEST_CASE("job_codec: statistics", "[queue][codec]") {
    queue_stats stats;
    stats.add(job_status::queued, 2);
    stats.add(job_status::generating);
    stats.add(job_status::complete);
    stats.avg_quality = 0.5;

    auto encoded = encode_stats(stats);
    CHECK(encoded["total"] == 4);
    CHECK(encoded["queued"] == 2);
    CHECK(encoded["avg_loop_score"].is_null());
    CHECK(stats.in_flight() == 1);

    auto decoded = decode_stats(encoded);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().total == 4);
    CHECK(decoded.value().avg_quality == 0.5);

    auto negative = decode_stats({{"total", -1}});
    REQUIRE(negative.is_err());
    CHECK(negative.error().code == error_codes::rpc_decode_error);
}
