/**
 * @file shared_job_store.hpp
 * @brief Multi-host job store backed by an SQL database
 *
 * Every API replica and worker host connects to the same database: a
 * PostgreSQL server for fleets spread across hosts, or an SQLite file when
 * all processes share one machine. Claims are a compare-and-swap: candidates
 * are selected, then each is taken with
 * `UPDATE ... WHERE job_id = ? AND status = 'queued'` and accepted only when
 * exactly one row changed. Worker reports read the row, run it through the
 * shared state machine and write it back guarded by a revision counter.
 */

#pragma once

#include <genqueue/di/ilogger.hpp>
#include <genqueue/queue/job_store.hpp>
#include <genqueue/storage/queue_database.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace genqueue::storage {

/// Name of the jobs table
inline constexpr const char* shared_table_name = "generation_jobs";

/**
 * @brief Options for opening a shared job store
 */
struct shared_store_options {
    /// SQL backend holding the jobs table
    database_backend backend{database_backend::sqlite};

    /// Database file for SQLite (":memory:" for a private in-memory database)
    std::filesystem::path database_path;

    /// Connection string for PostgreSQL (libpq conninfo or postgresql:// URI)
    std::string connection_string;

    /// How long a statement waits on a locked row or database
    std::chrono::milliseconds busy_timeout{5000};

    /// Enable WAL journal mode (SQLite files only)
    bool wal_mode{true};

    /// Candidates selected per claim round
    std::size_t claim_batch_size{8};

    /// Claim rounds before giving up when every candidate was taken
    int max_claim_rounds{4};

    /// Optimistic write attempts for worker reports
    int max_update_rounds{8};

    /// Connection target handed to the database adapter
    [[nodiscard]] auto target() const -> std::string {
        return backend == database_backend::postgres ? connection_string
                                                     : database_path.string();
    }
};

/**
 * @brief SQL job store
 *
 * Thread Safety: one connection per instance, serialized by a mutex.
 * Separate instances, processes and hosts coordinate through the database.
 */
class shared_job_store final : public queue::job_store {
public:
    /**
     * @brief Connect to the database and create the schema if missing
     * @return The store, or database_open_error
     */
    [[nodiscard]] static auto open(
        const shared_store_options& options,
        queue::clock_source clock = queue::system_clock_source(),
        std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<shared_job_store>>;

    ~shared_job_store() override;

    // =========================================================================
    // job_store
    // =========================================================================

    [[nodiscard]] auto enqueue(const queue::job_record& record)
        -> Result<std::string> override;

    [[nodiscard]] auto claim(std::string_view worker_id, std::string_view worker_type)
        -> Result<std::optional<queue::job_record>> override;

    [[nodiscard]] auto update_progress(std::string_view job_id,
                                       const queue::progress_report& report)
        -> VoidResult override;

    [[nodiscard]] auto complete(std::string_view job_id,
                                const queue::job_output& output,
                                const std::optional<std::string>& worker_id)
        -> VoidResult override;

    [[nodiscard]] auto fail(std::string_view job_id,
                            std::string_view error,
                            const std::optional<std::string>& worker_id)
        -> Result<queue::job_status> override;

    [[nodiscard]] auto requeue_stale(std::chrono::seconds threshold)
        -> Result<std::vector<std::string>> override;

    [[nodiscard]] auto get(std::string_view job_id)
        -> Result<std::optional<queue::job_record>> override;

    [[nodiscard]] auto stats() -> Result<queue::queue_stats> override;

    [[nodiscard]] auto backend_name() const noexcept -> std::string_view override {
        return "shared";
    }

    [[nodiscard]] auto options() const noexcept -> const shared_store_options& {
        return options_;
    }

private:
    /// A record together with the revision it was read at
    struct stored_row {
        queue::job_record record;
        std::int64_t revision{0};
    };

    /// What a report handler wants done with the row it inspected
    enum class row_action { write, skip };

    using row_mutation = std::function<Result<row_action>(queue::job_record&)>;

    shared_job_store(std::unique_ptr<queue_database> db, shared_store_options options,
                     queue::clock_source clock, std::shared_ptr<di::ILogger> logger);

    [[nodiscard]] auto configure_session() -> VoidResult;
    [[nodiscard]] auto initialize_schema() -> VoidResult;

    [[nodiscard]] auto load_row(std::string_view job_id)
        -> Result<std::optional<stored_row>>;

    /// Write every mutable column if the row is still at expected_revision
    [[nodiscard]] auto store_row(const queue::job_record& record,
                                 std::int64_t expected_revision) -> Result<bool>;

    /// Read-decide-write loop used by worker reports (caller holds mutex_)
    [[nodiscard]] auto update_with_retry(std::string_view job_id,
                                         const row_mutation& mutate) -> VoidResult;

    /// Select up to claim_batch_size QUEUED ids in dispatch order
    [[nodiscard]] auto select_claim_candidates() -> Result<std::vector<std::string>>;

    /// Conditionally take one candidate; true when this call won it
    [[nodiscard]] auto try_claim(const std::string& job_id, std::string_view worker_id,
                                 std::string_view worker_type) -> Result<bool>;

    std::unique_ptr<queue_database> db_;
    shared_store_options options_;
    queue::clock_source clock_;
    std::shared_ptr<di::ILogger> logger_;
    std::mutex mutex_;
};

}  // namespace genqueue::storage
