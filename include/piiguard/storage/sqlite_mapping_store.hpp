/**
 * @file sqlite_mapping_store.hpp
 * @brief SQLite implementation of the mapping store
 */

#pragma once

#include "piiguard/security/mapping_cipher.hpp"
#include "piiguard/storage/mapping_store_interface.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

// Forward declaration for SQLite3
struct sqlite3;

namespace piiguard::storage {

/**
 * @brief SQLite backend for encrypted mappings
 *
 * Records live in a single table keyed by store key. Encryption happens
 * outside the database lock so that unrelated keys are processed in
 * parallel.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * auto cipher = security::mapping_cipher::create(secret);
 * auto store = sqlite_mapping_store::open("mappings.db", cipher.value());
 * if (store.is_ok()) {
 *     (void)store.value()->save("session-42", mapping);
 * }
 * @endcode
 */
class sqlite_mapping_store : public mapping_store_interface {
public:
    /**
     * @brief Open or create a store
     * @param db_path Database file path, or ":memory:"
     * @param cipher Cipher used to seal and open records
     */
    [[nodiscard]] static auto open(const std::string& db_path, security::mapping_cipher cipher)
        -> Result<std::unique_ptr<sqlite_mapping_store>>;

    ~sqlite_mapping_store() override;

    sqlite_mapping_store(const sqlite_mapping_store&) = delete;
    sqlite_mapping_store& operator=(const sqlite_mapping_store&) = delete;
    sqlite_mapping_store(sqlite_mapping_store&&) = delete;
    sqlite_mapping_store& operator=(sqlite_mapping_store&&) = delete;

    [[nodiscard]] auto save(std::string_view key,
                            const anonymization::placeholder_mapping& mapping)
        -> VoidResult override;
    [[nodiscard]] auto merge(std::string_view key,
                             const anonymization::placeholder_mapping& mapping)
        -> Result<std::size_t> override;
    [[nodiscard]] auto load(std::string_view key)
        -> Result<anonymization::placeholder_mapping> override;
    [[nodiscard]] auto remove(std::string_view key) -> Result<bool> override;
    [[nodiscard]] auto clear() -> Result<std::size_t> override;
    [[nodiscard]] auto contains(std::string_view key) -> Result<bool> override;
    [[nodiscard]] auto keys() -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto export_record(std::string_view key)
        -> Result<security::sealed_record> override;
    [[nodiscard]] auto import_record(std::string_view key,
                                     const security::sealed_record& record)
        -> VoidResult override;
    [[nodiscard]] auto rotate_secret(std::string new_secret) -> Result<std::size_t> override;

    [[nodiscard]] auto path() const -> const std::string& { return db_path_; }

private:
    sqlite_mapping_store(std::string db_path, sqlite3* db, security::mapping_cipher cipher);

    [[nodiscard]] static auto initialize_tables(sqlite3* db) -> VoidResult;
    [[nodiscard]] static auto check_key(std::string_view key) -> VoidResult;

    /// Mutex serialising operations on one key
    [[nodiscard]] auto key_mutex(std::string_view key) -> std::shared_ptr<std::mutex>;

    // Callers hold the store lock (shared or exclusive) and the key lock
    [[nodiscard]] auto read_record(std::string_view key) -> Result<security::sealed_record>;
    [[nodiscard]] auto write_record(std::string_view key, const security::sealed_record& record)
        -> VoidResult;
    [[nodiscard]] auto open_record(std::string_view key)
        -> Result<anonymization::placeholder_mapping>;
    [[nodiscard]] auto seal_and_write(std::string_view key,
                                      const anonymization::placeholder_mapping& mapping)
        -> VoidResult;
    [[nodiscard]] auto delete_all() -> Result<std::size_t>;

    std::string db_path_;
    sqlite3* db_{nullptr};
    security::mapping_cipher cipher_;

    /// Shared for per-key operations, exclusive for clear and rotation
    std::shared_mutex store_mutex_;

    /// Guards db_ handle use
    std::mutex db_mutex_;

    std::mutex key_locks_mutex_;
    std::map<std::string, std::weak_ptr<std::mutex>, std::less<>> key_locks_;
};

} // namespace piiguard::storage
