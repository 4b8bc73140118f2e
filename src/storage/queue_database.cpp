/**
 * @file queue_database.cpp
 * @brief Implementation of the shared queue database adapter
 */

#include <genqueue/storage/queue_database.hpp>

#include <genqueue/compat/format.hpp>

#include <database/database_types.h>
#include <database/integrated/unified_database_system.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <variant>

namespace genqueue::storage {

namespace {

constexpr const char* module_name = "queue_database";

auto to_backend_type(database_backend backend) -> database::integrated::backend_type {
    switch (backend) {
        case database_backend::postgres:
            return database::integrated::backend_type::postgres;
        case database_backend::sqlite:
        default:
            return database::integrated::backend_type::sqlite;
    }
}

auto convert_result(const database::integrated::query_result& src) -> database_result {
    database_result result;
    result.affected_rows = src.affected_rows;
    result.execution_time = src.execution_time;

    result.rows.reserve(src.rows.size());
    for (const auto& src_row : src.rows) {
        database_row row;
        for (const auto& [key, value] : src_row) {
            row[key] = value;
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

/// Lock waits and serialization conflicts are worth retrying
[[nodiscard]] bool is_contention(std::string message) {
    std::transform(message.begin(), message.end(), message.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* marker : {"database is locked", "database table is locked", "busy",
                               "could not serialize", "deadlock detected",
                               "lock timeout", "could not obtain lock"}) {
        if (message.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

template <typename T>
auto statement_error(const std::string& what, const std::string& message) -> Result<T> {
    auto code = is_contention(message) ? error_codes::database_busy
                                       : error_codes::database_query_error;
    return make_error<T>(code, genqueue::compat::format("{} failed: {}", what, message),
                         module_name);
}

template <typename T>
auto not_connected() -> Result<T> {
    return make_error<T>(error_codes::database_query_error, "Not connected to database",
                         module_name);
}

}  // namespace

// =============================================================================
// Free Functions
// =============================================================================

std::optional<database_backend> database_backend_from_string(std::string_view name) noexcept {
    if (name == "sqlite") return database_backend::sqlite;
    if (name == "postgres" || name == "postgresql") return database_backend::postgres;
    return std::nullopt;
}

auto sql_literal(std::string_view text) -> std::string {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('\'');
    for (char c : text) {
        if (c == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

auto sql_nullable(const std::optional<std::string>& text) -> std::string {
    return text.has_value() ? sql_literal(*text) : std::string("NULL");
}

auto sql_real(const std::optional<double>& value) -> std::string {
    if (!value.has_value() || !std::isfinite(*value)) {
        return "NULL";
    }
    return genqueue::compat::format("{}", *value);
}

// =============================================================================
// Implementation Details
// =============================================================================

struct queue_database::impl {
    std::unique_ptr<database::integrated::unified_database_system> db;
    database_backend backend{database_backend::sqlite};
    std::string connection_string;
    std::string last_error_msg;

    impl(database_backend type, std::string conn_str)
        : backend(type), connection_string(std::move(conn_str)) {}
};

// =============================================================================
// Construction / Destruction
// =============================================================================

queue_database::queue_database(database_backend backend, std::string connection_string)
    : impl_(std::make_unique<impl>(backend, std::move(connection_string))) {}

queue_database::~queue_database() {
    if (impl_ && impl_->db && impl_->db->is_connected()) {
        (void)impl_->db->disconnect();
    }
}

queue_database::queue_database(queue_database&&) noexcept = default;

auto queue_database::operator=(queue_database&&) noexcept -> queue_database& = default;

// =============================================================================
// Connection Management
// =============================================================================

auto queue_database::connect() -> VoidResult {
    try {
        impl_->db = database::integrated::unified_database_system::create_builder()
                        .set_backend(to_backend_type(impl_->backend))
                        .set_connection_string(impl_->connection_string)
                        .enable_logging(database::integrated::db_log_level::warning)
                        .build();

        auto result = impl_->db->connect(to_backend_type(impl_->backend),
                                         impl_->connection_string);
        if (result.is_err()) {
            impl_->last_error_msg = result.error().message;
            return genqueue_void_error(
                error_codes::database_open_error,
                genqueue::compat::format("Failed to connect to {} database: {}",
                                         to_string(impl_->backend),
                                         result.error().message));
        }
        return ok();
    } catch (const std::exception& e) {
        impl_->last_error_msg = e.what();
        return genqueue_void_error(
            error_codes::database_open_error,
            genqueue::compat::format("Connection failed: {}", e.what()));
    }
}

auto queue_database::disconnect() -> VoidResult {
    if (!impl_ || !impl_->db) {
        return ok();
    }

    auto result = impl_->db->disconnect();
    if (result.is_err()) {
        impl_->last_error_msg = result.error().message;
        return genqueue_void_error(error_codes::database_query_error,
                                   "Failed to disconnect: " + result.error().message);
    }
    return ok();
}

auto queue_database::is_connected() const noexcept -> bool {
    return impl_ && impl_->db && impl_->db->is_connected();
}

auto queue_database::backend() const noexcept -> database_backend {
    return impl_->backend;
}

auto queue_database::connection_string() const -> const std::string& {
    return impl_->connection_string;
}

// =============================================================================
// Statements
// =============================================================================

auto queue_database::select(const std::string& query) -> Result<database_result> {
    if (!is_connected()) {
        return not_connected<database_result>();
    }

    auto result = impl_->db->select(query);
    if (result.is_err()) {
        impl_->last_error_msg = result.error().message;
        return statement_error<database_result>("SELECT", result.error().message);
    }
    return ok(convert_result(result.value()));
}

auto queue_database::insert(const std::string& query) -> Result<std::uint64_t> {
    if (!is_connected()) {
        return not_connected<std::uint64_t>();
    }

    auto result = impl_->db->insert(query);
    if (result.is_err()) {
        impl_->last_error_msg = result.error().message;
        return statement_error<std::uint64_t>("INSERT", result.error().message);
    }
    return ok(static_cast<std::uint64_t>(result.value()));
}

auto queue_database::update(const std::string& query) -> Result<std::uint64_t> {
    if (!is_connected()) {
        return not_connected<std::uint64_t>();
    }

    auto result = impl_->db->update(query);
    if (result.is_err()) {
        impl_->last_error_msg = result.error().message;
        return statement_error<std::uint64_t>("UPDATE", result.error().message);
    }
    return ok(static_cast<std::uint64_t>(result.value()));
}

auto queue_database::execute(const std::string& query) -> VoidResult {
    if (!is_connected()) {
        return genqueue_void_error(error_codes::database_query_error,
                                   "Not connected to database");
    }

    auto result = impl_->db->execute(query);
    if (result.is_err()) {
        impl_->last_error_msg = result.error().message;
        return statement_error<std::monostate>("Execute", result.error().message);
    }
    return ok();
}

auto queue_database::last_error() const -> std::string {
    return impl_ ? impl_->last_error_msg : "";
}

}  // namespace genqueue::storage
