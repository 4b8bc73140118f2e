/**
 * @file job_state_machine_test.cpp
 * @brief Unit tests for job status transitions and report admission
 */

#include "../mocks/queue_fixtures.hpp"

#include <genqueue/queue/job_state_machine.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace genqueue;
using namespace genqueue::queue;
using namespace genqueue::testing;
using namespace std::chrono_literals;

namespace {

auto claimed_job(const std::string& id, const std::string& worker, timestamp now)
    -> job_record {
    auto job = make_job(id, now);
    apply_claim(job, worker, "local", now);
    return job;
}

}  // namespace

// ============================================================================
// Transitions
// ============================================================================

TEST_CASE("job_state_machine: authoritative edges", "[queue][state_machine]") {
    CHECK(can_transition(job_status::queued, job_status::claimed));
    CHECK(can_transition(job_status::claimed, job_status::generating));
    CHECK(can_transition(job_status::generating, job_status::uploading));
    CHECK(can_transition(job_status::uploading, job_status::complete));
    CHECK(can_transition(job_status::generating, job_status::queued));
    CHECK(can_transition(job_status::claimed, job_status::dead));
}

TEST_CASE("job_state_machine: terminal statuses have no outgoing edges",
          "[queue][state_machine]") {
    auto from = GENERATE(job_status::complete, job_status::dead);
    auto to = GENERATE(job_status::queued, job_status::claimed, job_status::generating,
                       job_status::uploading, job_status::complete, job_status::dead);
    CHECK_FALSE(can_transition(from, to));
}

TEST_CASE("job_state_machine: no backwards progress edges", "[queue][state_machine]") {
    CHECK_FALSE(can_transition(job_status::queued, job_status::generating));
    CHECK_FALSE(can_transition(job_status::generating, job_status::claimed));
    CHECK_FALSE(can_transition(job_status::uploading, job_status::generating));
    CHECK_FALSE(can_transition(job_status::claimed, job_status::uploading));
}

TEST_CASE("job_state_machine: progress target", "[queue][state_machine]") {
    CHECK(progress_target(job_status::claimed, std::nullopt) == job_status::generating);
    CHECK(progress_target(job_status::generating, std::nullopt) == job_status::generating);
    CHECK(progress_target(job_status::generating, job_status::uploading) ==
          job_status::uploading);
    CHECK(progress_target(job_status::uploading, job_status::generating) ==
          job_status::uploading);
    CHECK(progress_target(job_status::generating, job_status::complete) ==
          job_status::generating);
    CHECK(progress_target(job_status::claimed, job_status::queued) == job_status::claimed);
}

TEST_CASE("job_state_machine: uploading on a claimed job passes through generating",
          "[queue][state_machine]") {
    CHECK(progress_target(job_status::claimed, job_status::uploading) ==
          job_status::uploading);
    CHECK(progress_target(job_status::claimed, job_status::generating) ==
          job_status::generating);
    CHECK(progress_target(job_status::claimed, job_status::complete) ==
          job_status::claimed);

    job_record record;
    record.job_id = "job-1";
    record.status = job_status::claimed;
    record.claimed_by = "w1";
    apply_progress(record, progress_report{90, "publishing", job_status::uploading},
                   timestamp{});
    CHECK(record.status == job_status::uploading);
    CHECK(record.progress == 90);
}

TEST_CASE("job_state_machine: progress is clamped", "[queue][state_machine]") {
    STATIC_REQUIRE(clamp_progress(-5) == 0);
    STATIC_REQUIRE(clamp_progress(0) == 0);
    STATIC_REQUIRE(clamp_progress(55) == 55);
    STATIC_REQUIRE(clamp_progress(150) == 100);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("job_state_machine: new record validation", "[queue][state_machine]") {
    manual_clock clock;
    auto job = make_job("job-1", clock.now());
    CHECK(validate_new_record(job).is_ok());

    SECTION("negative attempt") {
        job.attempt = -1;
        auto result = validate_new_record(job);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_job_record);
    }

    SECTION("claim already set") {
        job.claimed_by = "w1";
        CHECK(validate_new_record(job).is_err());
    }

    SECTION("zero max attempts") {
        job.max_attempts = 0;
        CHECK(validate_new_record(job).is_err());
    }
}

// ============================================================================
// Admission
// ============================================================================

TEST_CASE("job_state_machine: progress admission", "[queue][state_machine]") {
    manual_clock clock;
    auto job = claimed_job("job-1", "w1", clock.now());

    CHECK(admit_progress(job, std::nullopt) == report_decision::apply);
    CHECK(admit_progress(job, std::string("w1")) == report_decision::apply);
    CHECK(admit_progress(job, std::string("w2")) == report_decision::ignore);

    job.status = job_status::queued;
    CHECK(admit_progress(job, std::nullopt) == report_decision::ignore);
}

TEST_CASE("job_state_machine: completion admission", "[queue][state_machine]") {
    manual_clock clock;
    auto job = claimed_job("job-1", "w1", clock.now());

    CHECK(admit_completion(job, std::string("w1")) == report_decision::apply);
    CHECK(admit_completion(job, std::string("w2")) == report_decision::reject);

    apply_completion(job, job_output{"out/1"}, clock.now());
    CHECK(admit_completion(job, std::string("w2")) == report_decision::already_applied);

    auto requeued = claimed_job("job-2", "w1", clock.now());
    apply_stale_requeue(requeued, clock.now());
    CHECK(admit_completion(requeued, std::string("w1")) == report_decision::reject);
}

TEST_CASE("job_state_machine: failure admission", "[queue][state_machine]") {
    manual_clock clock;
    auto job = claimed_job("job-1", "w1", clock.now());

    CHECK(admit_failure(job, std::nullopt) == report_decision::apply);
    CHECK(admit_failure(job, std::string("w2")) == report_decision::reject);

    job.status = job_status::dead;
    CHECK(admit_failure(job, std::string("w1")) == report_decision::reject);
}

// ============================================================================
// Mutations
// ============================================================================

TEST_CASE("job_state_machine: claim sets ownership", "[queue][state_machine]") {
    manual_clock clock;
    auto job = make_job("job-1", clock.now());
    clock.advance(2s);

    apply_claim(job, "w1", "colab", clock.now());

    CHECK(job.status == job_status::claimed);
    CHECK(job.claimed_by == "w1");
    CHECK(job.claimed_at == clock.now());
    CHECK(job.worker_type == "colab");
    CHECK(job.message == "claimed by w1");
    CHECK(job.updated_at == clock.now());
    CHECK(job.created_at != job.updated_at);
}

TEST_CASE("job_state_machine: failure retries then dead-letters", "[queue][state_machine]") {
    manual_clock clock;
    auto job = claimed_job("job-1", "w1", clock.now());
    job.max_attempts = 2;

    CHECK(apply_failure(job, "timeout", clock.now()) == job_status::queued);
    CHECK(job.attempt == 1);
    CHECK(job.message == "retry 1/2: timeout");
    CHECK(job.last_error == "timeout");
    CHECK_FALSE(job.claimed_by.has_value());
    CHECK_FALSE(job.claimed_at.has_value());

    apply_claim(job, "w2", "local", clock.now());
    CHECK(apply_failure(job, "oom", clock.now()) == job_status::dead);
    CHECK(job.attempt == 2);
    CHECK(job.message == "failed after 2 attempts: oom");
    CHECK(job.last_error == "oom");
    CHECK(job.claimed_by == "w2");
}

TEST_CASE("job_state_machine: a single-attempt job dies on the first failure",
          "[queue][state_machine]") {
    manual_clock clock;
    auto job = claimed_job("job-1", "w1", clock.now());
    job.max_attempts = 1;

    CHECK(apply_failure(job, "bad input", clock.now()) == job_status::dead);
    CHECK(job.attempt == 1);
}

TEST_CASE("job_state_machine: staleness and stale requeue", "[queue][state_machine]") {
    manual_clock clock;
    auto job = claimed_job("job-1", "w1", clock.now());
    job.progress = 40;
    clock.advance(31min);
    auto cutoff = clock.now() - 30min;

    CHECK(is_stale(job, cutoff));
    CHECK_FALSE(is_stale(job, job.claimed_at.value()));

    apply_stale_requeue(job, clock.now());
    CHECK(job.status == job_status::queued);
    CHECK(job.attempt == 0);
    CHECK(job.progress == 40);
    CHECK(job.message == stale_requeue_message);
    CHECK_FALSE(job.claimed_by.has_value());
    CHECK_FALSE(is_stale(job, clock.now()));
}

TEST_CASE("job_state_machine: lifecycle messages", "[queue][state_machine]") {
    CHECK(retry_message(2, 5, "disk full") == "retry 2/5: disk full");
    CHECK(dead_message(3, "disk full") == "failed after 3 attempts: disk full");
}
