/**
 * @file mapping_cipher.hpp
 * @brief Authenticated encryption of stored placeholder mappings
 *
 * Records are sealed with AES-256-GCM. The key is derived from a
 * caller-supplied secret with PBKDF2-HMAC-SHA256 and a fresh random salt per
 * record, so the same mapping never encrypts to the same bytes twice.
 *
 * Record layout (all integers big-endian):
 * @code
 * "PGM1" | version (1) | kdf_iterations (4) | salt (16) | nonce (12)
 *        | ciphertext (n) | tag (16)
 * @endcode
 *
 * The header and the storage key the record belongs to are authenticated as
 * associated data: a record copied under a different key fails to open.
 * Any failure to open a record is reported as error_codes::mapping_corrupt;
 * partial plaintext is never returned.
 */

#pragma once

#include "piiguard/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::security {

/// Encrypted record bytes
using sealed_record = std::vector<std::uint8_t>;

/**
 * @struct cipher_options
 * @brief Key-derivation parameters
 */
struct cipher_options {
    /// PBKDF2 iterations used when sealing
    std::uint32_t kdf_iterations{100000};

    /// Largest iteration count accepted from a record header
    std::uint32_t max_kdf_iterations{10000000};
};

/**
 * @class mapping_cipher
 * @brief Seals and opens mapping records under one secret
 *
 * Thread Safety: seal() and open() are const and may be called
 * concurrently.
 *
 * @example
 * @code
 * auto cipher = mapping_cipher::create(secret);
 * if (cipher.is_ok()) {
 *     auto record = cipher.value().seal(mapping.to_json(), "session-42");
 *     auto plain = cipher.value().open(record.value(), "session-42");
 * }
 * @endcode
 */
class mapping_cipher {
public:
    static constexpr std::uint8_t format_version = 1;
    static constexpr std::size_t magic_size = 4;
    static constexpr std::size_t salt_size = 16;
    static constexpr std::size_t nonce_size = 12;
    static constexpr std::size_t tag_size = 16;
    static constexpr std::size_t key_size = 32;
    static constexpr std::size_t header_size = magic_size + 1 + 4 + salt_size + nonce_size;

    /// Shortest secret accepted by create()
    static constexpr std::size_t min_secret_length = 16;

    /// Fewest PBKDF2 iterations accepted by create()
    static constexpr std::uint32_t min_kdf_iterations = 1000;

    /**
     * @brief Create a cipher bound to a secret
     * @return Cipher, or error_codes::invalid_secret if the secret is too
     *         short or the options are out of range
     */
    [[nodiscard]] static auto create(std::string secret, cipher_options options = {})
        -> Result<mapping_cipher>;

    /**
     * @brief Generate a fresh random secret (32 bytes, base64url encoded)
     */
    [[nodiscard]] static auto generate_secret() -> Result<std::string>;

    mapping_cipher(const mapping_cipher&) = default;
    mapping_cipher(mapping_cipher&&) noexcept = default;
    mapping_cipher& operator=(const mapping_cipher&) = default;
    mapping_cipher& operator=(mapping_cipher&&) noexcept = default;
    ~mapping_cipher();

    /**
     * @brief Encrypt a plaintext for a storage key
     * @param plaintext Serialised mapping
     * @param associated_key Storage key the record is filed under
     */
    [[nodiscard]] auto seal(std::string_view plaintext, std::string_view associated_key) const
        -> Result<sealed_record>;

    /**
     * @brief Decrypt and authenticate a record
     * @return Plaintext, or error_codes::mapping_corrupt
     */
    [[nodiscard]] auto open(const sealed_record& record, std::string_view associated_key) const
        -> Result<std::string>;

    [[nodiscard]] auto options() const noexcept -> const cipher_options& { return options_; }

private:
    mapping_cipher(std::string secret, cipher_options options);

    std::string secret_;
    cipher_options options_;
};

} // namespace piiguard::security
