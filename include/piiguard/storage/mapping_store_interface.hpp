/**
 * @file mapping_store_interface.hpp
 * @brief Abstract persistence for encrypted placeholder mappings
 *
 * A store holds one encrypted record per opaque store key. Records are
 * created by a pseudonymize call that asks for persistence, read by later
 * deanonymize calls, and deleted only by an explicit remove, clear or
 * secret rotation.
 *
 * Error kinds callers are expected to branch on:
 * - error_codes::mapping_not_found: no record under the key
 * - error_codes::mapping_corrupt: the record exists but cannot be
 *   decrypted, authenticated or parsed
 */

#pragma once

#include "piiguard/anonymization/placeholder_mapping.hpp"
#include "piiguard/core/result.hpp"
#include "piiguard/security/mapping_cipher.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::storage {

/// Longest store key accepted by the stores
inline constexpr std::size_t max_store_key_length = 256;

/**
 * @class mapping_store_interface
 * @brief Abstract interface for mapping persistence
 *
 * Implementations must serialise operations on the same key and make
 * clear() and rotate_secret() exclusive with respect to everything else.
 */
class mapping_store_interface {
public:
    virtual ~mapping_store_interface() = default;

    /**
     * @brief Store a mapping, replacing any existing record under the key
     */
    [[nodiscard]] virtual auto save(std::string_view key,
                                    const anonymization::placeholder_mapping& mapping)
        -> VoidResult = 0;

    /**
     * @brief Add entries to the record under the key, creating it if needed
     *
     * Labels already stored keep their stored value.
     *
     * @return Number of entries added
     */
    [[nodiscard]] virtual auto merge(std::string_view key,
                                     const anonymization::placeholder_mapping& mapping)
        -> Result<std::size_t> = 0;

    /**
     * @brief Load and decrypt the mapping stored under the key
     */
    [[nodiscard]] virtual auto load(std::string_view key)
        -> Result<anonymization::placeholder_mapping> = 0;

    /**
     * @brief Delete the record under the key
     * @return true if a record was deleted
     */
    [[nodiscard]] virtual auto remove(std::string_view key) -> Result<bool> = 0;

    /**
     * @brief Delete every record
     * @return Number of records deleted
     */
    [[nodiscard]] virtual auto clear() -> Result<std::size_t> = 0;

    [[nodiscard]] virtual auto contains(std::string_view key) -> Result<bool> = 0;

    /**
     * @brief List stored keys in ascending order
     */
    [[nodiscard]] virtual auto keys() -> Result<std::vector<std::string>> = 0;

    /**
     * @brief Read the raw encrypted record under the key
     */
    [[nodiscard]] virtual auto export_record(std::string_view key)
        -> Result<security::sealed_record> = 0;

    /**
     * @brief Write a raw encrypted record without inspecting it
     *
     * Used to restore backups; a record that does not match the current
     * secret fails later with mapping_corrupt on load().
     */
    [[nodiscard]] virtual auto import_record(std::string_view key,
                                             const security::sealed_record& record)
        -> VoidResult = 0;

    /**
     * @brief Switch to a new secret
     *
     * Records sealed under the old secret can no longer be opened and are
     * deleted.
     *
     * @return Number of records deleted
     */
    [[nodiscard]] virtual auto rotate_secret(std::string new_secret) -> Result<std::size_t> = 0;

protected:
    mapping_store_interface() = default;
    mapping_store_interface(const mapping_store_interface&) = delete;
    mapping_store_interface& operator=(const mapping_store_interface&) = delete;
    mapping_store_interface(mapping_store_interface&&) = default;
    mapping_store_interface& operator=(mapping_store_interface&&) = default;
};

} // namespace piiguard::storage
