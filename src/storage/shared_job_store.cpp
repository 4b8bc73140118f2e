/**
 * @file shared_job_store.cpp
 * @brief Multi-host job store backed by an SQL database
 */

#include <genqueue/storage/shared_job_store.hpp>

#include <genqueue/compat/format.hpp>
#include <genqueue/core/timestamp.hpp>
#include <genqueue/queue/job_state_machine.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <variant>

namespace genqueue::storage {

namespace {

constexpr const char* module_name = "shared_job_store";

template <typename T>
auto store_error(int code, const std::string& message) -> Result<T> {
    return make_error<T>(code, message, module_name);
}

template <typename T, typename U>
auto forward_error(const Result<U>& failed) -> Result<T> {
    return store_error<T>(failed.error().code, failed.error().message);
}

// =============================================================================
// Column Helpers
// =============================================================================

/// Column text; NULL and missing columns read as empty
[[nodiscard]] auto column(const database_row& row, const char* name) -> std::string {
    auto it = row.find(name);
    return it == row.end() ? std::string() : it->second;
}

[[nodiscard]] auto optional_column(const database_row& row, const char* name)
    -> std::optional<std::string> {
    auto value = column(row, name);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] auto int64_column(const database_row& row, const char* name,
                                std::int64_t default_val = 0) -> std::int64_t {
    auto text = column(row, name);
    std::int64_t value = default_val;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return default_val;
    }
    return value;
}

[[nodiscard]] int int_column(const database_row& row, const char* name, int default_val = 0) {
    return static_cast<int>(int64_column(row, name, default_val));
}

[[nodiscard]] auto optional_double(const database_row& row, const char* name)
    -> std::optional<double> {
    auto text = column(row, name);
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] auto timestamp_literal(const std::optional<queue::timestamp>& value)
    -> std::string {
    return value.has_value() ? sql_literal(core::to_iso8601(*value)) : std::string("NULL");
}

[[nodiscard]] auto json_literal(const nlohmann::json& value) -> std::string {
    if (value.is_null()) {
        return "NULL";
    }
    return sql_literal(
        value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

// =============================================================================
// Row Mapping
// =============================================================================

constexpr const char* select_columns = R"(
    job_id, status, created_at, updated_at,
    audio_path, audio_url, direction_json, emotional_dna_json, params_json,
    generation_mode, priority,
    claimed_by, claimed_at, worker_type,
    progress, message,
    output_url, output_dir, quality_score, loop_score,
    attempt, max_attempts, error, revision
)";

struct parsed_row {
    queue::job_record record;
    std::int64_t revision{0};
};

auto parse_timestamp_column(const database_row& row, const char* name)
    -> Result<std::optional<queue::timestamp>> {
    auto text = optional_column(row, name);
    if (!text.has_value()) {
        return ok(std::optional<queue::timestamp>{});
    }
    auto parsed = core::from_iso8601(*text);
    if (!parsed.has_value()) {
        return store_error<std::optional<queue::timestamp>>(
            error_codes::invalid_job_record,
            genqueue::compat::format("Column {} is not a timestamp: {}", name, *text));
    }
    return ok(std::optional<queue::timestamp>{*parsed});
}

auto parse_json_column(const database_row& row, const char* name, nlohmann::json fallback)
    -> Result<nlohmann::json> {
    auto text = optional_column(row, name);
    if (!text.has_value()) {
        return ok(std::move(fallback));
    }
    try {
        return ok(nlohmann::json::parse(*text));
    } catch (const nlohmann::json::parse_error& e) {
        return store_error<nlohmann::json>(
            error_codes::invalid_job_record,
            genqueue::compat::format("Column {} is not valid JSON: {}", name, e.what()));
    }
}

auto parse_row(const database_row& row) -> Result<parsed_row> {
    parsed_row parsed;
    auto& record = parsed.record;

    record.job_id = column(row, "job_id");

    auto status_name = column(row, "status");
    auto status = queue::job_status_from_string(status_name);
    if (!status.has_value()) {
        return store_error<parsed_row>(
            error_codes::invalid_job_record,
            genqueue::compat::format("Job {} has unknown status '{}'", record.job_id,
                                     status_name));
    }
    record.status = *status;

    auto created = parse_timestamp_column(row, "created_at");
    if (created.is_err()) {
        return forward_error<parsed_row>(created);
    }
    if (!created.value().has_value()) {
        return store_error<parsed_row>(error_codes::invalid_job_record,
                                       "Job " + record.job_id + " has no created_at");
    }
    record.created_at = *created.value();

    auto updated = parse_timestamp_column(row, "updated_at");
    if (updated.is_err()) {
        return forward_error<parsed_row>(updated);
    }
    record.updated_at = updated.value().value_or(record.created_at);

    record.input.audio_path = column(row, "audio_path");
    record.input.audio_url = optional_column(row, "audio_url");

    auto direction = parse_json_column(row, "direction_json", nullptr);
    auto dna = parse_json_column(row, "emotional_dna_json", nullptr);
    auto params = parse_json_column(row, "params_json", nlohmann::json::object());
    for (const auto* blob : {&direction, &dna, &params}) {
        if (blob->is_err()) {
            return forward_error<parsed_row>(*blob);
        }
    }
    record.input.direction = std::move(direction.value());
    record.input.emotional_dna = std::move(dna.value());
    record.input.params = std::move(params.value());

    record.generation_mode = column(row, "generation_mode");
    record.priority = int_column(row, "priority", queue::default_priority);

    record.claimed_by = optional_column(row, "claimed_by");
    auto claimed_at = parse_timestamp_column(row, "claimed_at");
    if (claimed_at.is_err()) {
        return forward_error<parsed_row>(claimed_at);
    }
    record.claimed_at = claimed_at.value();
    record.worker_type = optional_column(row, "worker_type");

    record.progress = int_column(row, "progress");
    record.message = column(row, "message");

    auto output_url = optional_column(row, "output_url");
    if (output_url.has_value()) {
        queue::job_output output;
        output.output_url = *output_url;
        output.output_dir = optional_column(row, "output_dir");
        output.quality_score = optional_double(row, "quality_score");
        output.loop_score = optional_double(row, "loop_score");
        record.output = std::move(output);
    }

    record.attempt = int_column(row, "attempt");
    record.max_attempts = int_column(row, "max_attempts", queue::default_max_attempts);
    record.last_error = optional_column(row, "error");
    parsed.revision = int64_column(row, "revision");

    return ok(std::move(parsed));
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

shared_job_store::shared_job_store(std::unique_ptr<queue_database> db,
                                   shared_store_options options,
                                   queue::clock_source clock,
                                   std::shared_ptr<di::ILogger> logger)
    : db_(std::move(db)),
      options_(std::move(options)),
      clock_(std::move(clock)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

shared_job_store::~shared_job_store() {
    if (db_ && db_->is_connected()) {
        auto closed = db_->disconnect();
        if (closed.is_err()) {
            logger_->warn_fmt("Closing shared job store: {}", closed.error().message);
        }
    }
}

auto shared_job_store::open(const shared_store_options& options,
                            queue::clock_source clock,
                            std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<shared_job_store>> {
    using store_ptr = std::unique_ptr<shared_job_store>;

    const auto target = options.target();
    if (target.empty()) {
        return store_error<store_ptr>(
            error_codes::database_open_error,
            options.backend == database_backend::postgres
                ? "Shared database connection string is empty"
                : "Shared database path is empty");
    }

    if (options.backend == database_backend::sqlite && target != ":memory:") {
        std::error_code ec;
        if (std::filesystem::is_directory(options.database_path, ec)) {
            return store_error<store_ptr>(
                error_codes::database_open_error,
                "Shared database path is a directory: " + target);
        }
        if (options.database_path.has_parent_path()) {
            std::filesystem::create_directories(options.database_path.parent_path(), ec);
            if (ec) {
                return store_error<store_ptr>(
                    error_codes::database_open_error,
                    "Failed to create database directory: " + ec.message());
            }
        }
    }

    auto db = std::make_unique<queue_database>(options.backend, target);
    auto connected = db->connect();
    if (connected.is_err()) {
        return forward_error<store_ptr>(connected);
    }

    if (!clock) {
        clock = queue::system_clock_source();
    }

    auto store = store_ptr(
        new shared_job_store(std::move(db), options, std::move(clock), std::move(logger)));

    auto session = store->configure_session();
    if (session.is_err()) {
        return store_error<store_ptr>(error_codes::database_open_error,
                                      "Failed to configure session: " +
                                          session.error().message);
    }

    auto schema = store->initialize_schema();
    if (schema.is_err()) {
        return store_error<store_ptr>(error_codes::database_open_error,
                                      "Failed to create schema: " + schema.error().message);
    }

    store->logger_->info_fmt("Opened shared job store on {} (busy_timeout={}ms)",
                             to_string(options.backend), options.busy_timeout.count());
    return ok(std::move(store));
}

auto shared_job_store::configure_session() -> VoidResult {
    const auto timeout_ms = options_.busy_timeout.count();

    if (options_.backend == database_backend::postgres) {
        return db_->execute(genqueue::compat::format("SET lock_timeout = {}", timeout_ms));
    }

    auto busy = db_->execute(genqueue::compat::format("PRAGMA busy_timeout = {}", timeout_ms));
    if (busy.is_err()) {
        return busy;
    }
    if (options_.wal_mode && options_.target() != ":memory:") {
        return db_->execute("PRAGMA journal_mode = WAL");
    }
    return ok();
}

auto shared_job_store::initialize_schema() -> VoidResult {
    // Column types are spelled so both SQLite and PostgreSQL accept them
    static constexpr const char* statements[] = {
        R"(
        CREATE TABLE IF NOT EXISTS generation_jobs (
            job_id              TEXT PRIMARY KEY,
            status              TEXT NOT NULL DEFAULT 'queued',
            created_at          TEXT NOT NULL,
            updated_at          TEXT NOT NULL,
            audio_path          TEXT NOT NULL DEFAULT '',
            audio_url           TEXT,
            direction_json      TEXT,
            emotional_dna_json  TEXT,
            params_json         TEXT,
            generation_mode     TEXT NOT NULL DEFAULT 'full',
            priority            INTEGER NOT NULL DEFAULT 10,
            claimed_by          TEXT,
            claimed_at          TEXT,
            worker_type         TEXT,
            progress            INTEGER NOT NULL DEFAULT 0,
            message             TEXT NOT NULL DEFAULT '',
            output_url          TEXT,
            output_dir          TEXT,
            quality_score       DOUBLE PRECISION,
            loop_score          DOUBLE PRECISION,
            attempt             INTEGER NOT NULL DEFAULT 0,
            max_attempts        INTEGER NOT NULL DEFAULT 3,
            error               TEXT,
            enqueue_seq         BIGINT NOT NULL DEFAULT 0,
            revision            BIGINT NOT NULL DEFAULT 0
        ))",
        R"(
        CREATE INDEX IF NOT EXISTS idx_generation_jobs_dispatch
            ON generation_jobs(priority, created_at, enqueue_seq) WHERE status = 'queued')",
        R"(
        CREATE INDEX IF NOT EXISTS idx_generation_jobs_status
            ON generation_jobs(status))",
        R"(
        CREATE INDEX IF NOT EXISTS idx_generation_jobs_claimed_by
            ON generation_jobs(claimed_by))",
    };

    for (const auto* sql : statements) {
        auto result = db_->execute(sql);
        if (result.is_err()) {
            return result;
        }
    }
    return ok();
}

// =============================================================================
// Row Access
// =============================================================================

auto shared_job_store::load_row(std::string_view job_id)
    -> Result<std::optional<stored_row>> {
    using row_result = std::optional<stored_row>;

    auto sql = genqueue::compat::format("SELECT {} FROM generation_jobs WHERE job_id = {}",
                                        select_columns, sql_literal(job_id));
    auto selected = db_->select(sql);
    if (selected.is_err()) {
        return forward_error<row_result>(selected);
    }
    if (selected.value().empty()) {
        return ok(row_result{});
    }

    auto parsed = parse_row(selected.value()[0]);
    if (parsed.is_err()) {
        logger_->warn_fmt("Job '{}' in {} is malformed: {}", job_id, shared_table_name,
                          parsed.error().message);
        return forward_error<row_result>(parsed);
    }

    stored_row row{std::move(parsed.value().record), parsed.value().revision};
    return ok(row_result{std::move(row)});
}

auto shared_job_store::store_row(const queue::job_record& record,
                                 std::int64_t expected_revision) -> Result<bool> {
    const auto& output = record.output;
    auto sql = genqueue::compat::format(
        "UPDATE generation_jobs SET "
        "status = {}, updated_at = {}, "
        "claimed_by = {}, claimed_at = {}, worker_type = {}, "
        "progress = {}, message = {}, "
        "output_url = {}, output_dir = {}, quality_score = {}, loop_score = {}, "
        "attempt = {}, error = {}, "
        "revision = revision + 1 "
        "WHERE job_id = {} AND revision = {}",
        sql_literal(queue::to_string(record.status)),
        sql_literal(core::to_iso8601(record.updated_at)),
        sql_nullable(record.claimed_by), timestamp_literal(record.claimed_at),
        sql_nullable(record.worker_type),
        record.progress, sql_literal(record.message),
        output ? sql_literal(output->output_url) : std::string("NULL"),
        output ? sql_nullable(output->output_dir) : std::string("NULL"),
        output ? sql_real(output->quality_score) : std::string("NULL"),
        output ? sql_real(output->loop_score) : std::string("NULL"),
        record.attempt, sql_nullable(record.last_error),
        sql_literal(record.job_id), expected_revision);

    auto changed = db_->update(sql);
    if (changed.is_err()) {
        return forward_error<bool>(changed);
    }
    return ok(changed.value() == 1);
}

auto shared_job_store::update_with_retry(std::string_view job_id,
                                         const row_mutation& mutate) -> VoidResult {
    for (int round = 0; round < options_.max_update_rounds; ++round) {
        auto loaded = load_row(job_id);
        if (loaded.is_err()) {
            return forward_error<std::monostate>(loaded);
        }
        if (!loaded.value().has_value()) {
            return store_error<std::monostate>(
                error_codes::job_not_found,
                genqueue::compat::format("Job not found: {}", job_id));
        }

        auto row = std::move(*loaded.value());
        auto action = mutate(row.record);
        if (action.is_err()) {
            return forward_error<std::monostate>(action);
        }
        if (action.value() == row_action::skip) {
            return ok();
        }

        auto stored = store_row(row.record, row.revision);
        if (stored.is_err()) {
            return forward_error<std::monostate>(stored);
        }
        if (stored.value()) {
            return ok();
        }

        logger_->debug_fmt("Job {} changed concurrently (revision {}), retrying",
                           job_id, row.revision);
    }

    return store_error<std::monostate>(
        error_codes::database_busy,
        genqueue::compat::format("Job {} kept changing after {} update attempts",
                                 job_id, options_.max_update_rounds));
}

// =============================================================================
// Primitives
// =============================================================================

auto shared_job_store::enqueue(const queue::job_record& record) -> Result<std::string> {
    auto valid = queue::validate_new_record(record);
    if (valid.is_err()) {
        return forward_error<std::string>(valid);
    }

    std::lock_guard lock(mutex_);

    auto existing = load_row(record.job_id);
    if (existing.is_ok() && existing.value().has_value()) {
        return store_error<std::string>(error_codes::duplicate_job,
                                        "Job already exists: " + record.job_id);
    }

    auto sql = genqueue::compat::format(
        "INSERT INTO generation_jobs ("
        "job_id, status, created_at, updated_at, "
        "audio_path, audio_url, direction_json, emotional_dna_json, params_json, "
        "generation_mode, priority, "
        "progress, message, attempt, max_attempts, error, enqueue_seq, revision"
        ") VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, "
        "(SELECT COALESCE(MAX(enqueue_seq), 0) + 1 FROM generation_jobs), 0)",
        sql_literal(record.job_id), sql_literal(queue::to_string(record.status)),
        sql_literal(core::to_iso8601(record.created_at)),
        sql_literal(core::to_iso8601(record.updated_at)),
        sql_literal(record.input.audio_path), sql_nullable(record.input.audio_url),
        json_literal(record.input.direction), json_literal(record.input.emotional_dna),
        json_literal(record.input.params),
        sql_literal(record.generation_mode), record.priority,
        record.progress, sql_literal(record.message),
        record.attempt, record.max_attempts, sql_nullable(record.last_error));

    auto inserted = db_->insert(sql);
    if (inserted.is_err()) {
        // A concurrent insert of the same id surfaces as a key violation
        auto raced = load_row(record.job_id);
        if (raced.is_ok() && raced.value().has_value()) {
            return store_error<std::string>(error_codes::duplicate_job,
                                            "Job already exists: " + record.job_id);
        }
        return forward_error<std::string>(inserted);
    }
    return ok(record.job_id);
}

auto shared_job_store::select_claim_candidates() -> Result<std::vector<std::string>> {
    using id_list = std::vector<std::string>;

    auto sql = genqueue::compat::format(
        "SELECT job_id FROM generation_jobs "
        "WHERE status = 'queued' "
        "ORDER BY priority ASC, created_at ASC, enqueue_seq ASC "
        "LIMIT {}",
        options_.claim_batch_size);

    auto selected = db_->select(sql);
    if (selected.is_err()) {
        return forward_error<id_list>(selected);
    }

    id_list ids;
    ids.reserve(selected.value().size());
    for (const auto& row : selected.value()) {
        ids.push_back(column(row, "job_id"));
    }
    return ok(std::move(ids));
}

auto shared_job_store::try_claim(const std::string& job_id, std::string_view worker_id,
                                 std::string_view worker_type) -> Result<bool> {
    // Claimed column values come from the shared state machine
    queue::job_record claimed;
    queue::apply_claim(claimed, worker_id, worker_type, clock_());

    auto sql = genqueue::compat::format(
        "UPDATE generation_jobs SET "
        "status = 'claimed', "
        "claimed_by = {}, claimed_at = {}, worker_type = {}, "
        "message = {}, updated_at = {}, "
        "revision = revision + 1 "
        "WHERE job_id = {} AND status = 'queued'",
        sql_nullable(claimed.claimed_by), timestamp_literal(claimed.claimed_at),
        sql_nullable(claimed.worker_type), sql_literal(claimed.message),
        sql_literal(core::to_iso8601(claimed.updated_at)), sql_literal(job_id));

    auto changed = db_->update(sql);
    if (changed.is_err()) {
        return forward_error<bool>(changed);
    }
    return ok(changed.value() == 1);
}

auto shared_job_store::claim(std::string_view worker_id, std::string_view worker_type)
    -> Result<std::optional<queue::job_record>> {
    using claim_result = std::optional<queue::job_record>;

    std::lock_guard lock(mutex_);

    for (int round = 0; round < options_.max_claim_rounds; ++round) {
        auto candidates = select_claim_candidates();
        if (candidates.is_err()) {
            if (candidates.error().code == error_codes::database_busy) {
                logger_->warn_fmt("Claim by {} found the database busy: {}", worker_id,
                                  candidates.error().message);
                return ok(claim_result{});
            }
            return forward_error<claim_result>(candidates);
        }
        if (candidates.value().empty()) {
            return ok(claim_result{});
        }

        for (const auto& job_id : candidates.value()) {
            auto won = try_claim(job_id, worker_id, worker_type);
            if (won.is_err()) {
                if (won.error().code == error_codes::database_busy) {
                    logger_->warn_fmt("Claim by {} found the database busy: {}",
                                      worker_id, won.error().message);
                    return ok(claim_result{});
                }
                return forward_error<claim_result>(won);
            }
            if (!won.value()) {
                continue;
            }

            auto loaded = load_row(job_id);
            if (loaded.is_err()) {
                logger_->error_fmt("Job {} was claimed by {} but could not be read back: {}",
                                   job_id, worker_id, loaded.error().message);
                return forward_error<claim_result>(loaded);
            }
            if (!loaded.value().has_value()) {
                return store_error<claim_result>(
                    error_codes::job_not_found,
                    "Claimed job disappeared: " + job_id);
            }

            logger_->debug_fmt("Job {} claimed by {}", job_id, worker_id);
            return ok(claim_result{std::move(loaded.value()->record)});
        }

        logger_->debug_fmt("Claim by {} lost {} candidates in round {}", worker_id,
                           candidates.value().size(), round + 1);
    }

    return ok(claim_result{});
}

auto shared_job_store::update_progress(std::string_view job_id,
                                       const queue::progress_report& report)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    return update_with_retry(job_id, [&](queue::job_record& record) -> Result<row_action> {
        if (queue::admit_progress(record, report.worker_id) != queue::report_decision::apply) {
            logger_->debug_fmt("Ignoring progress for job {} in status {}", job_id,
                               queue::to_string(record.status));
            return ok(row_action::skip);
        }
        queue::apply_progress(record, report, clock_());
        return ok(row_action::write);
    });
}

auto shared_job_store::complete(std::string_view job_id,
                                const queue::job_output& output,
                                const std::optional<std::string>& worker_id)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    return update_with_retry(job_id, [&](queue::job_record& record) -> Result<row_action> {
        switch (queue::admit_completion(record, worker_id)) {
            case queue::report_decision::already_applied:
                return ok(row_action::skip);
            case queue::report_decision::apply:
                queue::apply_completion(record, output, clock_());
                return ok(row_action::write);
            default:
                return store_error<row_action>(
                    error_codes::stale_claim,
                    genqueue::compat::format(
                        "Job {} cannot complete from status {} (claimed by {})", job_id,
                        queue::to_string(record.status),
                        record.claimed_by.value_or("nobody")));
        }
    });
}

auto shared_job_store::fail(std::string_view job_id,
                            std::string_view error,
                            const std::optional<std::string>& worker_id)
    -> Result<queue::job_status> {
    std::lock_guard lock(mutex_);

    auto next = queue::job_status::queued;
    auto updated = update_with_retry(
        job_id, [&](queue::job_record& record) -> Result<row_action> {
            if (queue::admit_failure(record, worker_id) != queue::report_decision::apply) {
                return store_error<row_action>(
                    error_codes::stale_claim,
                    genqueue::compat::format(
                        "Job {} cannot fail from status {} (claimed by {})", job_id,
                        queue::to_string(record.status),
                        record.claimed_by.value_or("nobody")));
            }
            next = queue::apply_failure(record, error, clock_());
            return ok(row_action::write);
        });

    if (updated.is_err()) {
        return forward_error<queue::job_status>(updated);
    }
    return ok(next);
}

auto shared_job_store::requeue_stale(std::chrono::seconds threshold)
    -> Result<std::vector<std::string>> {
    using id_list = std::vector<std::string>;

    std::lock_guard lock(mutex_);

    const auto now = clock_();
    const auto cutoff = sql_literal(core::to_iso8601(now - threshold));

    auto selected = db_->select(genqueue::compat::format(
        "SELECT job_id FROM generation_jobs "
        "WHERE status IN ('claimed', 'generating', 'uploading') AND claimed_at < {} "
        "ORDER BY claimed_at ASC",
        cutoff));
    if (selected.is_err()) {
        return forward_error<id_list>(selected);
    }

    const auto now_text = sql_literal(core::to_iso8601(now));
    const auto message = sql_literal(queue::stale_requeue_message);

    id_list requeued;
    for (const auto& row : selected.value()) {
        auto job_id = column(row, "job_id");
        auto changed = db_->update(genqueue::compat::format(
            "UPDATE generation_jobs SET "
            "status = 'queued', "
            "claimed_by = NULL, claimed_at = NULL, "
            "message = {}, updated_at = {}, "
            "revision = revision + 1 "
            "WHERE job_id = {} "
            "AND status IN ('claimed', 'generating', 'uploading') "
            "AND claimed_at < {}",
            message, now_text, sql_literal(job_id), cutoff));
        if (changed.is_err()) {
            return forward_error<id_list>(changed);
        }

        // Zero rows: another monitor or a late report got there first
        if (changed.value() == 1) {
            requeued.push_back(std::move(job_id));
        }
    }

    return ok(std::move(requeued));
}

auto shared_job_store::get(std::string_view job_id)
    -> Result<std::optional<queue::job_record>> {
    using lookup_result = std::optional<queue::job_record>;

    std::lock_guard lock(mutex_);

    auto loaded = load_row(job_id);
    if (loaded.is_err()) {
        return forward_error<lookup_result>(loaded);
    }
    if (!loaded.value().has_value()) {
        return ok(lookup_result{});
    }
    return ok(lookup_result{std::move(loaded.value()->record)});
}

auto shared_job_store::stats() -> Result<queue::queue_stats> {
    std::lock_guard lock(mutex_);

    queue::queue_stats result;

    auto counts = db_->select(
        "SELECT status, COUNT(*) AS job_count FROM generation_jobs GROUP BY status");
    if (counts.is_err()) {
        return forward_error<queue::queue_stats>(counts);
    }
    for (const auto& row : counts.value()) {
        auto name = column(row, "status");
        auto count = int64_column(row, "job_count");
        auto status = queue::job_status_from_string(name);
        if (!status.has_value()) {
            logger_->warn_fmt("Skipping {} jobs with unknown status '{}'", count, name);
            continue;
        }
        result.add(*status, static_cast<std::size_t>(count));
    }

    auto averages = db_->select(
        "SELECT AVG(quality_score) AS avg_quality, AVG(loop_score) AS avg_loop "
        "FROM generation_jobs WHERE status = 'complete'");
    if (averages.is_err()) {
        return forward_error<queue::queue_stats>(averages);
    }
    if (!averages.value().empty()) {
        result.avg_quality = optional_double(averages.value()[0], "avg_quality");
        result.avg_loop_score = optional_double(averages.value()[0], "avg_loop");
    }

    return ok(std::move(result));
}

}  // namespace genqueue::storage
