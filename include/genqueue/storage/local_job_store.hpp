/**
 * @file local_job_store.hpp
 * @brief Single-node job store backed by one JSON document
 *
 * The whole queue lives in `<directory>/jobs.json`, a JSON object mapping job
 * id to record in insertion order. Every primitive loads the document, applies
 * its change and atomically replaces the file while holding one mutex.
 *
 * @note Only processes sharing the same store instance are serialized.
 *       Independent processes pointed at the same directory can interleave
 *       their read-modify-write cycles; use shared_job_store for multi-node
 *       deployments.
 */

#pragma once

#include <genqueue/di/ilogger.hpp>
#include <genqueue/queue/job_store.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <mutex>

namespace genqueue::storage {

/// File name of the queue document inside the store directory
inline constexpr const char* local_document_name = "jobs.json";

/**
 * @brief JSON document job store
 *
 * @example
 * @code
 * auto store = local_job_store::open("/var/lib/genqueue");
 * if (store.is_ok()) {
 *     queue::queue_manager manager(std::move(store.value()));
 * }
 * @endcode
 */
class local_job_store final : public queue::job_store {
public:
    /**
     * @brief Open (or create) the store in a directory
     *
     * Creates the directory and an empty document when they do not exist.
     * An existing document is not parsed until the first operation.
     *
     * @param directory Store directory
     * @param clock Source of timestamps
     * @param logger Logger for skipped records and claim tracing
     * @return The store, or store_write_error when the directory is unusable
     */
    [[nodiscard]] static auto open(
        const std::filesystem::path& directory,
        queue::clock_source clock = queue::system_clock_source(),
        std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<local_job_store>>;

    ~local_job_store() override = default;

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
        return "local";
    }

    /**
     * @brief Path of the queue document
     */
    [[nodiscard]] auto document_path() const -> const std::filesystem::path& {
        return document_path_;
    }

private:
    using document = nlohmann::ordered_json;

    local_job_store(std::filesystem::path directory, queue::clock_source clock,
                    std::shared_ptr<di::ILogger> logger);

    /// Read and parse the document (caller holds mutex_)
    [[nodiscard]] auto load() const -> Result<document>;

    /// Atomically replace the document (caller holds mutex_)
    [[nodiscard]] auto save(const document& doc) const -> VoidResult;

    /// Decode one entry, logging and skipping malformed records
    [[nodiscard]] auto decode_entry(const std::string& key,
                                    const document& value) const
        -> std::optional<queue::job_record>;

    /// Find and decode one record by id
    [[nodiscard]] auto find(const document& doc, std::string_view job_id) const
        -> Result<queue::job_record>;

    std::filesystem::path directory_;
    std::filesystem::path document_path_;
    queue::clock_source clock_;
    std::shared_ptr<di::ILogger> logger_;
    mutable std::mutex mutex_;
};

}  // namespace genqueue::storage
