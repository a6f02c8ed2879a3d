/**
 * @file sqlite_mapping_store.cpp
 * @brief Implementation of the SQLite mapping store
 */

#include "piiguard/storage/sqlite_mapping_store.hpp"

#include "piiguard/integration/logger_adapter.hpp"

#include <piiguard/compat/format.hpp>

#include <sqlite3.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace piiguard::storage {

using integration::logger_adapter;
using integration::security_event_type;

namespace {

constexpr const char* module_name = "sqlite_mapping_store";

/// Finalizes a prepared statement on scope exit
struct statement_deleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using statement_ptr = std::unique_ptr<sqlite3_stmt, statement_deleter>;

auto prepare(sqlite3* db, const char* sql) -> Result<statement_ptr> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return piiguard_error<statement_ptr>(
            error_codes::storage_query_error,
            piiguard::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
            module_name);
    }
    return statement_ptr(stmt);
}

void bind_key(sqlite3_stmt* stmt, int index, std::string_view key) {
    sqlite3_bind_text(stmt, index, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
}

auto current_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto query_error(sqlite3* db, std::string_view action) -> std::string {
    return piiguard::compat::format("Failed to {}: {}", action, sqlite3_errmsg(db));
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

auto sqlite_mapping_store::open(const std::string& db_path, security::mapping_cipher cipher)
    -> Result<std::unique_ptr<sqlite_mapping_store>> {
    sqlite3* db = nullptr;
    auto rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "unknown error";
        if (db) {
            sqlite3_close(db);
        }
        return piiguard_error<std::unique_ptr<sqlite_mapping_store>>(
            error_codes::storage_open_error,
            piiguard::compat::format("Failed to open database: {}", error_msg), module_name);
    }

    char* err_msg = nullptr;
    if (db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string error = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            sqlite3_close(db);
            return piiguard_error<std::unique_ptr<sqlite_mapping_store>>(
                error_codes::storage_open_error,
                piiguard::compat::format("Failed to enable WAL mode: {}", error), module_name);
        }
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        sqlite3_close(db);
        return piiguard_error<std::unique_ptr<sqlite_mapping_store>>(
            error_codes::storage_open_error,
            piiguard::compat::format("Failed to set synchronous mode: {}", error), module_name);
    }

    sqlite3_busy_timeout(db, 5000);

    auto tables = initialize_tables(db);
    if (tables.is_err()) {
        sqlite3_close(db);
        return piiguard_error<std::unique_ptr<sqlite_mapping_store>>(
            tables.error().code, tables.error().message, module_name);
    }

    logger_adapter::debug("Opened mapping store at {}", db_path);
    return std::unique_ptr<sqlite_mapping_store>(
        new sqlite_mapping_store(db_path, db, std::move(cipher)));
}

sqlite_mapping_store::sqlite_mapping_store(std::string db_path, sqlite3* db,
                                           security::mapping_cipher cipher)
    : db_path_(std::move(db_path)), db_(db), cipher_(std::move(cipher)) {}

sqlite_mapping_store::~sqlite_mapping_store() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_mapping_store::initialize_tables(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS mappings (
            store_key  TEXT PRIMARY KEY,
            record     BLOB NOT NULL,
            updated_at TEXT NOT NULL
        );
    )";

    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        return piiguard_void_error(error_codes::storage_open_error,
                                   "Failed to create tables: " + error, module_name);
    }
    return ok();
}

auto sqlite_mapping_store::check_key(std::string_view key) -> VoidResult {
    if (key.empty()) {
        return piiguard_void_error(error_codes::invalid_storage_key,
                                   "Store key must not be empty", module_name);
    }
    if (key.size() > max_store_key_length) {
        return piiguard_void_error(
            error_codes::invalid_storage_key,
            piiguard::compat::format("Store key exceeds {} bytes", max_store_key_length),
            module_name);
    }
    return ok();
}

auto sqlite_mapping_store::key_mutex(std::string_view key) -> std::shared_ptr<std::mutex> {
    std::lock_guard<std::mutex> lock(key_locks_mutex_);

    auto it = key_locks_.find(key);
    if (it != key_locks_.end()) {
        if (auto existing = it->second.lock()) {
            return existing;
        }
    }

    // Drop entries whose last holder has gone
    for (auto entry = key_locks_.begin(); entry != key_locks_.end();) {
        if (entry->second.expired()) {
            entry = key_locks_.erase(entry);
        } else {
            ++entry;
        }
    }

    auto created = std::make_shared<std::mutex>();
    key_locks_.insert_or_assign(std::string(key), created);
    return created;
}

// =============================================================================
// Record Access
// =============================================================================

auto sqlite_mapping_store::read_record(std::string_view key) -> Result<security::sealed_record> {
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto stmt = prepare(db_, "SELECT record FROM mappings WHERE store_key = ?;");
    if (stmt.is_err()) {
        return piiguard_error<security::sealed_record>(stmt.error().code, stmt.error().message,
                                                       module_name);
    }
    auto* raw = stmt.value().get();
    bind_key(raw, 1, key);

    auto rc = sqlite3_step(raw);
    if (rc == SQLITE_DONE) {
        return piiguard_error<security::sealed_record>(
            error_codes::mapping_not_found,
            piiguard::compat::format("No mapping stored under key '{}'", key), module_name);
    }
    if (rc != SQLITE_ROW) {
        return piiguard_error<security::sealed_record>(
            error_codes::storage_query_error, query_error(db_, "read mapping"), module_name);
    }

    const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(raw, 0));
    auto size = static_cast<std::size_t>(sqlite3_column_bytes(raw, 0));
    if (data == nullptr) {
        return security::sealed_record{};
    }
    return security::sealed_record(data, data + size);
}

auto sqlite_mapping_store::write_record(std::string_view key,
                                        const security::sealed_record& record) -> VoidResult {
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto stmt = prepare(db_, R"(
        INSERT INTO mappings (store_key, record, updated_at) VALUES (?, ?, ?)
        ON CONFLICT(store_key) DO UPDATE SET
            record = excluded.record,
            updated_at = excluded.updated_at;
    )");
    if (stmt.is_err()) {
        return piiguard_void_error(stmt.error().code, stmt.error().message, module_name);
    }
    auto* raw = stmt.value().get();
    auto timestamp = current_timestamp();

    bind_key(raw, 1, key);
    sqlite3_bind_blob(raw, 2, record.data(), static_cast<int>(record.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(raw, 3, timestamp.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return piiguard_void_error(error_codes::storage_query_error,
                                   query_error(db_, "write mapping"), module_name);
    }
    return ok();
}

auto sqlite_mapping_store::open_record(std::string_view key)
    -> Result<anonymization::placeholder_mapping> {
    auto record = read_record(key);
    if (record.is_err()) {
        return piiguard_error<anonymization::placeholder_mapping>(
            record.error().code, record.error().message, module_name);
    }

    auto plaintext = cipher_.open(record.value(), key);
    if (plaintext.is_err()) {
        logger_adapter::log_security_event(security_event_type::mapping_corrupt,
                                           "Stored mapping failed authentication",
                                           std::string(key));
        return piiguard_error<anonymization::placeholder_mapping>(
            error_codes::mapping_corrupt, plaintext.error().message, module_name);
    }

    auto mapping = anonymization::placeholder_mapping::from_json(plaintext.value());
    if (mapping.is_err()) {
        logger_adapter::log_security_event(security_event_type::mapping_corrupt,
                                           "Stored mapping could not be parsed",
                                           std::string(key));
        return piiguard_error<anonymization::placeholder_mapping>(
            error_codes::mapping_corrupt,
            "Stored mapping could not be parsed: " + mapping.error().message, module_name);
    }
    return mapping;
}

auto sqlite_mapping_store::seal_and_write(std::string_view key,
                                          const anonymization::placeholder_mapping& mapping)
    -> VoidResult {
    auto record = cipher_.seal(mapping.to_json(), key);
    if (record.is_err()) {
        return piiguard_void_error(record.error().code, record.error().message, module_name);
    }
    return write_record(key, record.value());
}

auto sqlite_mapping_store::delete_all() -> Result<std::size_t> {
    std::lock_guard<std::mutex> lock(db_mutex_);

    char* err_msg = nullptr;
    if (sqlite3_exec(db_, "DELETE FROM mappings;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        return piiguard_error<std::size_t>(error_codes::storage_query_error,
                                           "Failed to clear mappings: " + error, module_name);
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

// =============================================================================
// Mapping Operations
// =============================================================================

auto sqlite_mapping_store::save(std::string_view key,
                                const anonymization::placeholder_mapping& mapping)
    -> VoidResult {
    if (auto valid = check_key(key); valid.is_err()) {
        return valid;
    }

    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    auto guard = key_mutex(key);
    std::lock_guard<std::mutex> key_lock(*guard);

    auto written = seal_and_write(key, mapping);
    if (written.is_err()) {
        logger_adapter::error("Failed to store mapping: {}", written.error().message);
        return written;
    }

    logger_adapter::log_mapping_stored(std::string(key), mapping.size());
    return ok();
}

auto sqlite_mapping_store::merge(std::string_view key,
                                 const anonymization::placeholder_mapping& mapping)
    -> Result<std::size_t> {
    if (auto valid = check_key(key); valid.is_err()) {
        return piiguard_error<std::size_t>(valid.error().code, valid.error().message,
                                           module_name);
    }

    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    auto guard = key_mutex(key);
    std::lock_guard<std::mutex> key_lock(*guard);

    anonymization::placeholder_mapping combined;
    auto existing = open_record(key);
    if (existing.is_ok()) {
        combined = existing.value();
    } else if (existing.error().code != error_codes::mapping_not_found) {
        return piiguard_error<std::size_t>(existing.error().code, existing.error().message,
                                           module_name);
    }

    auto added = combined.merge(mapping);
    auto written = seal_and_write(key, combined);
    if (written.is_err()) {
        return piiguard_error<std::size_t>(written.error().code, written.error().message,
                                           module_name);
    }

    logger_adapter::log_mapping_stored(std::string(key), combined.size());
    return added;
}

auto sqlite_mapping_store::load(std::string_view key)
    -> Result<anonymization::placeholder_mapping> {
    if (auto valid = check_key(key); valid.is_err()) {
        return piiguard_error<anonymization::placeholder_mapping>(
            valid.error().code, valid.error().message, module_name);
    }

    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    auto guard = key_mutex(key);
    std::lock_guard<std::mutex> key_lock(*guard);

    auto mapping = open_record(key);
    if (mapping.is_ok()) {
        logger_adapter::log_mapping_loaded(std::string(key), mapping.value().size());
    }
    return mapping;
}

auto sqlite_mapping_store::remove(std::string_view key) -> Result<bool> {
    if (auto valid = check_key(key); valid.is_err()) {
        return piiguard_error<bool>(valid.error().code, valid.error().message, module_name);
    }

    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    auto guard = key_mutex(key);
    std::lock_guard<std::mutex> key_lock(*guard);

    std::size_t changes = 0;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        auto stmt = prepare(db_, "DELETE FROM mappings WHERE store_key = ?;");
        if (stmt.is_err()) {
            return piiguard_error<bool>(stmt.error().code, stmt.error().message, module_name);
        }
        bind_key(stmt.value().get(), 1, key);
        if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
            return piiguard_error<bool>(error_codes::storage_query_error,
                                        query_error(db_, "remove mapping"), module_name);
        }
        changes = static_cast<std::size_t>(sqlite3_changes(db_));
    }

    if (changes > 0) {
        logger_adapter::log_mappings_removed(std::string(key), changes);
    }
    return changes > 0;
}

auto sqlite_mapping_store::clear() -> Result<std::size_t> {
    std::unique_lock<std::shared_mutex> store_lock(store_mutex_);

    auto removed = delete_all();
    if (removed.is_ok()) {
        logger_adapter::log_mappings_removed("", removed.value());
    }
    return removed;
}

auto sqlite_mapping_store::contains(std::string_view key) -> Result<bool> {
    if (auto valid = check_key(key); valid.is_err()) {
        return piiguard_error<bool>(valid.error().code, valid.error().message, module_name);
    }

    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto stmt = prepare(db_, "SELECT 1 FROM mappings WHERE store_key = ?;");
    if (stmt.is_err()) {
        return piiguard_error<bool>(stmt.error().code, stmt.error().message, module_name);
    }
    bind_key(stmt.value().get(), 1, key);

    auto rc = sqlite3_step(stmt.value().get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return piiguard_error<bool>(error_codes::storage_query_error,
                                    query_error(db_, "query mapping"), module_name);
    }
    return rc == SQLITE_ROW;
}

auto sqlite_mapping_store::keys() -> Result<std::vector<std::string>> {
    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto stmt = prepare(db_, "SELECT store_key FROM mappings ORDER BY store_key;");
    if (stmt.is_err()) {
        return piiguard_error<std::vector<std::string>>(stmt.error().code,
                                                        stmt.error().message, module_name);
    }

    std::vector<std::string> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
        const auto* text =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt.value().get(), 0));
        result.emplace_back(text ? text : "");
    }
    if (rc != SQLITE_DONE) {
        return piiguard_error<std::vector<std::string>>(
            error_codes::storage_query_error, query_error(db_, "list mappings"), module_name);
    }
    return result;
}

// =============================================================================
// Backup and Rotation
// =============================================================================

auto sqlite_mapping_store::export_record(std::string_view key)
    -> Result<security::sealed_record> {
    if (auto valid = check_key(key); valid.is_err()) {
        return piiguard_error<security::sealed_record>(valid.error().code,
                                                       valid.error().message, module_name);
    }

    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    auto guard = key_mutex(key);
    std::lock_guard<std::mutex> key_lock(*guard);

    auto record = read_record(key);
    if (record.is_ok()) {
        logger_adapter::log_security_event(security_event_type::data_export,
                                           "Encrypted mapping record exported",
                                           std::string(key));
    }
    return record;
}

auto sqlite_mapping_store::import_record(std::string_view key,
                                         const security::sealed_record& record) -> VoidResult {
    if (auto valid = check_key(key); valid.is_err()) {
        return valid;
    }
    if (record.size() < security::mapping_cipher::header_size +
                            security::mapping_cipher::tag_size) {
        return piiguard_void_error(error_codes::mapping_corrupt,
                                   "Imported record is truncated", module_name);
    }

    std::shared_lock<std::shared_mutex> store_lock(store_mutex_);
    auto guard = key_mutex(key);
    std::lock_guard<std::mutex> key_lock(*guard);

    auto written = write_record(key, record);
    if (written.is_ok()) {
        logger_adapter::info("Imported encrypted mapping record for key {}", key);
    }
    return written;
}

auto sqlite_mapping_store::rotate_secret(std::string new_secret) -> Result<std::size_t> {
    auto next = security::mapping_cipher::create(std::move(new_secret), cipher_.options());
    if (next.is_err()) {
        logger_adapter::log_security_event(security_event_type::invalid_secret,
                                           "Secret rotation rejected: " + next.error().message);
        return piiguard_error<std::size_t>(next.error().code, next.error().message,
                                           module_name);
    }

    std::unique_lock<std::shared_mutex> store_lock(store_mutex_);

    auto removed = delete_all();
    if (removed.is_err()) {
        return removed;
    }
    cipher_ = next.value();

    logger_adapter::log_security_event(
        security_event_type::key_rotation,
        piiguard::compat::format("Encryption secret rotated, {} records discarded",
                                 removed.value()));
    return removed;
}

} // namespace piiguard::storage
