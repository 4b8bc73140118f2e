/**
 * @file local_job_store.cpp
 * @brief Single-node job store backed by one JSON document
 */

#include <genqueue/storage/local_job_store.hpp>

#include <genqueue/compat/format.hpp>
#include <genqueue/queue/job_codec.hpp>
#include <genqueue/queue/job_state_machine.hpp>

#include <fstream>
#include <sstream>

namespace genqueue::storage {

namespace {

constexpr const char* module_name = "local_job_store";

template <typename T>
auto store_error(int code, const std::string& message) -> Result<T> {
    return make_error<T>(code, message, module_name);
}

/// Track running sums for the score averages of complete jobs
struct score_average {
    double sum{0.0};
    std::size_t count{0};

    void add(const std::optional<double>& value) {
        if (value.has_value()) {
            sum += *value;
            ++count;
        }
    }

    [[nodiscard]] auto mean() const -> std::optional<double> {
        if (count == 0) {
            return std::nullopt;
        }
        return sum / static_cast<double>(count);
    }
};

}  // namespace

// =============================================================================
// Construction
// =============================================================================

local_job_store::local_job_store(std::filesystem::path directory,
                                 queue::clock_source clock,
                                 std::shared_ptr<di::ILogger> logger)
    : directory_(std::move(directory)),
      document_path_(directory_ / local_document_name),
      clock_(std::move(clock)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto local_job_store::open(const std::filesystem::path& directory,
                           queue::clock_source clock,
                           std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<local_job_store>> {
    using store_ptr = std::unique_ptr<local_job_store>;

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return store_error<store_ptr>(
            error_codes::store_write_error,
            "Failed to create store directory " + directory.string() + ": " + ec.message());
    }

    if (!clock) {
        clock = queue::system_clock_source();
    }

    auto store = store_ptr(
        new local_job_store(directory, std::move(clock), std::move(logger)));

    if (!std::filesystem::exists(store->document_path_, ec)) {
        std::lock_guard lock(store->mutex_);
        auto created = store->save(document::object());
        if (created.is_err()) {
            return store_error<store_ptr>(created.error().code, created.error().message);
        }
        store->logger_->info_fmt("Created job document {}", store->document_path_.string());
    }

    return ok(std::move(store));
}

// =============================================================================
// Document I/O
// =============================================================================

auto local_job_store::load() const -> Result<document> {
    std::ifstream in(document_path_);
    if (!in.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(document_path_, ec)) {
            return ok(document::object());
        }
        return store_error<document>(
            error_codes::store_read_error,
            "Failed to open job document: " + document_path_.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return store_error<document>(
            error_codes::store_read_error,
            "Failed to read job document: " + document_path_.string());
    }

    auto text = buffer.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return ok(document::object());
    }

    try {
        auto doc = document::parse(text);
        if (!doc.is_object()) {
            return store_error<document>(
                error_codes::store_corrupt,
                "Job document is not a JSON object: " + document_path_.string());
        }
        return ok(std::move(doc));
    } catch (const document::parse_error& e) {
        return store_error<document>(
            error_codes::store_corrupt,
            "Failed to parse job document " + document_path_.string() + ": " + e.what());
    }
}

auto local_job_store::save(const document& doc) const -> VoidResult {
    auto temp_path = document_path_;
    temp_path += ".tmp";

    {
        std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return store_error<std::monostate>(
                error_codes::store_write_error,
                "Failed to open temp file: " + temp_path.string());
        }
        out << doc.dump(2, ' ', false, document::error_handler_t::replace) << '\n';
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return store_error<std::monostate>(
                error_codes::store_write_error,
                "Failed to write temp file: " + temp_path.string());
        }
    }

    // Atomic rename
    std::error_code ec;
    std::filesystem::rename(temp_path, document_path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return store_error<std::monostate>(
            error_codes::store_write_error,
            "Failed to rename temp file: " + ec.message());
    }

    return ok();
}

auto local_job_store::decode_entry(const std::string& key, const document& value) const
    -> std::optional<queue::job_record> {
    auto decoded = queue::decode_job(nlohmann::json(value));
    if (decoded.is_err()) {
        logger_->warn_fmt("Skipping job '{}' in {}: {}", key,
                          document_path_.string(), decoded.error().message);
        return std::nullopt;
    }
    if (decoded.value().job_id != key) {
        logger_->warn_fmt("Skipping job '{}' in {}: record id is '{}'", key,
                          document_path_.string(), decoded.value().job_id);
        return std::nullopt;
    }
    return std::move(decoded.value());
}

auto local_job_store::find(const document& doc, std::string_view job_id) const
    -> Result<queue::job_record> {
    auto it = doc.find(std::string(job_id));
    if (it == doc.end()) {
        return store_error<queue::job_record>(
            error_codes::job_not_found,
            genqueue::compat::format("Job not found: {}", job_id));
    }
    auto decoded = queue::decode_job(nlohmann::json(*it));
    if (decoded.is_err()) {
        logger_->warn_fmt("Job '{}' in {} is malformed: {}", job_id,
                          document_path_.string(), decoded.error().message);
        return store_error<queue::job_record>(decoded.error().code,
                                              decoded.error().message);
    }
    return decoded;
}

// =============================================================================
// Primitives
// =============================================================================

auto local_job_store::enqueue(const queue::job_record& record) -> Result<std::string> {
    auto valid = queue::validate_new_record(record);
    if (valid.is_err()) {
        return store_error<std::string>(valid.error().code, valid.error().message);
    }

    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<std::string>(loaded.error().code, loaded.error().message);
    }
    auto& doc = loaded.value();

    if (doc.contains(record.job_id)) {
        return store_error<std::string>(
            error_codes::duplicate_job, "Job already exists: " + record.job_id);
    }

    doc[record.job_id] = document(queue::encode_job(record));

    auto saved = save(doc);
    if (saved.is_err()) {
        return store_error<std::string>(saved.error().code, saved.error().message);
    }
    return ok(record.job_id);
}

auto local_job_store::claim(std::string_view worker_id, std::string_view worker_type)
    -> Result<std::optional<queue::job_record>> {
    using claim_result = std::optional<queue::job_record>;

    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<claim_result>(loaded.error().code, loaded.error().message);
    }
    auto& doc = loaded.value();

    // Strict comparison keeps the earliest inserted job among equals
    std::optional<queue::job_record> best;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        auto record = decode_entry(it.key(), it.value());
        if (!record || record->status != queue::job_status::queued) {
            continue;
        }
        if (!best || record->priority < best->priority ||
            (record->priority == best->priority &&
             record->created_at < best->created_at)) {
            best = std::move(record);
        }
    }

    if (!best) {
        return ok(claim_result{});
    }

    queue::apply_claim(*best, worker_id, worker_type, clock_());
    doc[best->job_id] = document(queue::encode_job(*best));

    auto saved = save(doc);
    if (saved.is_err()) {
        return store_error<claim_result>(saved.error().code, saved.error().message);
    }

    logger_->debug_fmt("Job {} claimed by {}", best->job_id, worker_id);
    return ok(std::move(best));
}

auto local_job_store::update_progress(std::string_view job_id,
                                      const queue::progress_report& report)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<std::monostate>(loaded.error().code, loaded.error().message);
    }
    auto& doc = loaded.value();

    auto found = find(doc, job_id);
    if (found.is_err()) {
        return store_error<std::monostate>(found.error().code, found.error().message);
    }
    auto record = std::move(found.value());

    if (queue::admit_progress(record, report.worker_id) != queue::report_decision::apply) {
        logger_->debug_fmt("Ignoring progress for job {} in status {}", job_id,
                           queue::to_string(record.status));
        return ok();
    }

    queue::apply_progress(record, report, clock_());
    doc[record.job_id] = document(queue::encode_job(record));
    return save(doc);
}

auto local_job_store::complete(std::string_view job_id,
                               const queue::job_output& output,
                               const std::optional<std::string>& worker_id)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<std::monostate>(loaded.error().code, loaded.error().message);
    }
    auto& doc = loaded.value();

    auto found = find(doc, job_id);
    if (found.is_err()) {
        return store_error<std::monostate>(found.error().code, found.error().message);
    }
    auto record = std::move(found.value());

    switch (queue::admit_completion(record, worker_id)) {
        case queue::report_decision::already_applied:
            return ok();
        case queue::report_decision::apply:
            break;
        default:
            return store_error<std::monostate>(
                error_codes::stale_claim,
                genqueue::compat::format("Job {} cannot complete from status {} (claimed by {})",
                                         job_id, queue::to_string(record.status),
                                         record.claimed_by.value_or("nobody")));
    }

    queue::apply_completion(record, output, clock_());
    doc[record.job_id] = document(queue::encode_job(record));
    return save(doc);
}

auto local_job_store::fail(std::string_view job_id,
                           std::string_view error,
                           const std::optional<std::string>& worker_id)
    -> Result<queue::job_status> {
    using status_result = queue::job_status;

    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<status_result>(loaded.error().code, loaded.error().message);
    }
    auto& doc = loaded.value();

    auto found = find(doc, job_id);
    if (found.is_err()) {
        return store_error<status_result>(found.error().code, found.error().message);
    }
    auto record = std::move(found.value());

    if (queue::admit_failure(record, worker_id) != queue::report_decision::apply) {
        return store_error<status_result>(
            error_codes::stale_claim,
            genqueue::compat::format("Job {} cannot fail from status {} (claimed by {})",
                                     job_id, queue::to_string(record.status),
                                     record.claimed_by.value_or("nobody")));
    }

    auto next = queue::apply_failure(record, error, clock_());
    doc[record.job_id] = document(queue::encode_job(record));

    auto saved = save(doc);
    if (saved.is_err()) {
        return store_error<status_result>(saved.error().code, saved.error().message);
    }
    return ok(next);
}

auto local_job_store::requeue_stale(std::chrono::seconds threshold)
    -> Result<std::vector<std::string>> {
    using id_list = std::vector<std::string>;

    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<id_list>(loaded.error().code, loaded.error().message);
    }
    auto& doc = loaded.value();

    auto now = clock_();
    auto cutoff = now - threshold;

    id_list requeued;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        auto record = decode_entry(it.key(), it.value());
        if (!record || !queue::is_stale(*record, cutoff)) {
            continue;
        }
        queue::apply_stale_requeue(*record, now);
        it.value() = document(queue::encode_job(*record));
        requeued.push_back(record->job_id);
    }

    if (requeued.empty()) {
        return ok(std::move(requeued));
    }

    auto saved = save(doc);
    if (saved.is_err()) {
        return store_error<id_list>(saved.error().code, saved.error().message);
    }
    return ok(std::move(requeued));
}

auto local_job_store::get(std::string_view job_id)
    -> Result<std::optional<queue::job_record>> {
    using lookup_result = std::optional<queue::job_record>;

    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<lookup_result>(loaded.error().code, loaded.error().message);
    }

    auto found = find(loaded.value(), job_id);
    if (found.is_err()) {
        if (found.error().code == error_codes::job_not_found) {
            return ok(lookup_result{});
        }
        return store_error<lookup_result>(found.error().code, found.error().message);
    }
    return ok(lookup_result{std::move(found.value())});
}

auto local_job_store::stats() -> Result<queue::queue_stats> {
    std::lock_guard lock(mutex_);

    auto loaded = load();
    if (loaded.is_err()) {
        return store_error<queue::queue_stats>(loaded.error().code, loaded.error().message);
    }
    const auto& doc = loaded.value();

    queue::queue_stats result;
    score_average quality;
    score_average loop;

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        auto record = decode_entry(it.key(), it.value());
        if (!record) {
            continue;
        }
        result.add(record->status);
        if (record->status == queue::job_status::complete && record->output) {
            quality.add(record->output->quality_score);
            loop.add(record->output->loop_score);
        }
    }

    result.avg_quality = quality.mean();
    result.avg_loop_score = loop.mean();
    return ok(std::move(result));
}

}  // namespace genqueue::storage
