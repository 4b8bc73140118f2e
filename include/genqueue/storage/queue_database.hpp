/**
 * @file queue_database.hpp
 * @brief Database adapter used by the shared job store
 *
 * Wraps database_system's unified_database_system behind a small Result-based
 * API so the shared store can run against PostgreSQL (the deployment backend
 * reachable from every API replica and worker host) or SQLite (single-host
 * deployments and tests) with the same SQL.
 *
 * @code
 * queue_database db(database_backend::postgres,
 *                   "host=db.internal dbname=genqueue user=queue");
 * auto connected = db.connect();
 * auto changed = db.update("UPDATE generation_jobs SET ... WHERE status = 'queued'");
 * @endcode
 */

#pragma once

#include <genqueue/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace genqueue::storage {

/**
 * @brief SQL backends the shared store can run on
 */
enum class database_backend {
    sqlite,    ///< Database file, one host
    postgres   ///< Network database, any number of hosts
};

/**
 * @brief Convert database_backend to its configuration name
 */
[[nodiscard]] constexpr const char* to_string(database_backend backend) noexcept {
    switch (backend) {
        case database_backend::sqlite: return "sqlite";
        case database_backend::postgres: return "postgres";
        default: return "unknown";
    }
}

/**
 * @brief Parse a configuration backend name
 * @return The backend, or std::nullopt for an unknown name
 */
[[nodiscard]] std::optional<database_backend> database_backend_from_string(
    std::string_view name) noexcept;

/// One result row, column name to text value (NULL reads as empty)
using database_row = std::map<std::string, std::string>;

/**
 * @brief Rows and affected-row count of one statement
 */
struct database_result {
    std::vector<database_row> rows;
    std::size_t affected_rows{0};
    std::chrono::microseconds execution_time{0};

    [[nodiscard]] auto empty() const noexcept -> bool { return rows.empty(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return rows.size(); }
    [[nodiscard]] auto operator[](std::size_t index) const -> const database_row& {
        return rows.at(index);
    }

    auto begin() const { return rows.begin(); }
    auto end() const { return rows.end(); }
};

// =============================================================================
// SQL Literals
// =============================================================================

/**
 * @brief Quote text as an SQL string literal ('it''s')
 */
[[nodiscard]] auto sql_literal(std::string_view text) -> std::string;

/**
 * @brief Quote optional text, NULL when unset
 */
[[nodiscard]] auto sql_nullable(const std::optional<std::string>& text) -> std::string;

/**
 * @brief Format an optional real, NULL when empty or not finite
 */
[[nodiscard]] auto sql_real(const std::optional<double>& value) -> std::string;

// =============================================================================
// queue_database
// =============================================================================

/**
 * @brief Connection to the shared queue database
 *
 * Error codes: connection failures are database_open_error; statements
 * that hit a lock or serialization conflict are database_busy; every other
 * statement failure is database_query_error.
 *
 * Thread Safety: NOT thread-safe. The owning store serializes access.
 */
class queue_database {
public:
    /**
     * @brief Create an adapter for the given backend
     * @param backend SQL backend
     * @param connection_string Database file for SQLite, libpq conninfo or URI
     *        for PostgreSQL
     */
    queue_database(database_backend backend, std::string connection_string);

    ~queue_database();

    queue_database(const queue_database&) = delete;
    auto operator=(const queue_database&) -> queue_database& = delete;
    queue_database(queue_database&&) noexcept;
    auto operator=(queue_database&&) noexcept -> queue_database&;

    // =========================================================================
    // Connection Management
    // =========================================================================

    [[nodiscard]] auto connect() -> VoidResult;
    [[nodiscard]] auto disconnect() -> VoidResult;
    [[nodiscard]] auto is_connected() const noexcept -> bool;

    [[nodiscard]] auto backend() const noexcept -> database_backend;
    [[nodiscard]] auto connection_string() const -> const std::string&;

    // =========================================================================
    // Statements
    // =========================================================================

    /**
     * @brief Run a SELECT and return its rows
     */
    [[nodiscard]] auto select(const std::string& query) -> Result<database_result>;

    /**
     * @brief Run an INSERT
     * @return Number of inserted rows
     */
    [[nodiscard]] auto insert(const std::string& query) -> Result<std::uint64_t>;

    /**
     * @brief Run an UPDATE
     * @return Number of changed rows
     */
    [[nodiscard]] auto update(const std::string& query) -> Result<std::uint64_t>;

    /**
     * @brief Run DDL, PRAGMA or SET statements
     */
    [[nodiscard]] auto execute(const std::string& query) -> VoidResult;

    /**
     * @brief Message of the most recent failed call
     */
    [[nodiscard]] auto last_error() const -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace genqueue::storage
