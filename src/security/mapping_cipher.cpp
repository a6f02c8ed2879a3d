/**
 * @file mapping_cipher.cpp
 * @brief AES-256-GCM record sealing with PBKDF2-derived keys
 */

#include "piiguard/security/mapping_cipher.hpp"

#include <piiguard/compat/format.hpp>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <limits>
#include <memory>

namespace piiguard::security {

namespace {

constexpr const char* module_name = "mapping_cipher";
constexpr std::array<std::uint8_t, mapping_cipher::magic_size> record_magic{'P', 'G', 'M', '1'};

/**
 * @brief Get OpenSSL error string
 */
auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 */
struct evp_cipher_ctx_deleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};
using evp_cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, evp_cipher_ctx_deleter>;

/**
 * @brief Derived key buffer that is wiped on destruction
 */
struct derived_key {
    std::array<std::uint8_t, mapping_cipher::key_size> bytes{};

    ~derived_key() { OPENSSL_cleanse(bytes.data(), bytes.size()); }
};

auto corrupt(const std::string& reason) -> Result<std::string> {
    return piiguard_error<std::string>(error_codes::mapping_corrupt,
                                       "Stored mapping cannot be opened: " + reason,
                                       module_name);
}

void write_u32(sealed_record& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 24));
    out.push_back(static_cast<std::uint8_t>(value >> 16));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

auto read_u32(const std::uint8_t* in) -> std::uint32_t {
    return (static_cast<std::uint32_t>(in[0]) << 24) | (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8) | static_cast<std::uint32_t>(in[3]);
}

auto derive_key(const std::string& secret,
                const std::uint8_t* salt,
                std::uint32_t iterations,
                derived_key& key) -> bool {
    return PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()), salt,
                             static_cast<int>(mapping_cipher::salt_size),
                             static_cast<int>(iterations), EVP_sha256(),
                             static_cast<int>(key.bytes.size()), key.bytes.data()) == 1;
}

auto add_associated_data(EVP_CIPHER_CTX* ctx,
                         const std::uint8_t* header,
                         std::string_view associated_key,
                         bool encrypting) -> bool {
    int len = 0;
    auto update = encrypting ? EVP_EncryptUpdate : EVP_DecryptUpdate;
    if (update(ctx, nullptr, &len, header, static_cast<int>(mapping_cipher::header_size)) != 1) {
        return false;
    }
    if (!associated_key.empty() &&
        update(ctx, nullptr, &len, reinterpret_cast<const unsigned char*>(associated_key.data()),
               static_cast<int>(associated_key.size())) != 1) {
        return false;
    }
    return true;
}

auto base64url(const std::uint8_t* data, std::size_t size) -> std::string {
    std::string encoded(4 * ((size + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()), data,
                                        static_cast<int>(size));
    encoded.resize(static_cast<std::size_t>(written));
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    return encoded;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

mapping_cipher::mapping_cipher(std::string secret, cipher_options options)
    : secret_(std::move(secret)), options_(options) {}

mapping_cipher::~mapping_cipher() {
    if (!secret_.empty()) {
        OPENSSL_cleanse(secret_.data(), secret_.size());
    }
}

auto mapping_cipher::create(std::string secret, cipher_options options)
    -> Result<mapping_cipher> {
    if (secret.size() < min_secret_length) {
        return piiguard_error<mapping_cipher>(
            error_codes::invalid_secret,
            piiguard::compat::format("Encryption secret must be at least {} characters",
                                     min_secret_length),
            module_name);
    }
    if (options.kdf_iterations < min_kdf_iterations ||
        options.kdf_iterations > options.max_kdf_iterations ||
        options.max_kdf_iterations >
            static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
        return piiguard_error<mapping_cipher>(
            error_codes::invalid_secret,
            piiguard::compat::format("KDF iterations must be between {} and {}",
                                     min_kdf_iterations, options.max_kdf_iterations),
            module_name);
    }
    return mapping_cipher(std::move(secret), options);
}

auto mapping_cipher::generate_secret() -> Result<std::string> {
    std::array<std::uint8_t, key_size> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return piiguard_error<std::string>(
            error_codes::random_failed,
            "Failed to generate random secret: " + get_openssl_error(), module_name);
    }
    auto secret = base64url(bytes.data(), bytes.size());
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return secret;
}

// =============================================================================
// Sealing
// =============================================================================

auto mapping_cipher::seal(std::string_view plaintext, std::string_view associated_key) const
    -> Result<sealed_record> {
    sealed_record record;
    record.reserve(header_size + plaintext.size() + tag_size);
    record.insert(record.end(), record_magic.begin(), record_magic.end());
    record.push_back(format_version);
    write_u32(record, options_.kdf_iterations);

    const auto salt_offset = record.size();
    record.resize(header_size);
    if (RAND_bytes(record.data() + salt_offset, static_cast<int>(salt_size + nonce_size)) != 1) {
        return piiguard_error<sealed_record>(
            error_codes::random_failed,
            "Failed to generate salt and nonce: " + get_openssl_error(), module_name);
    }
    const auto* salt = record.data() + salt_offset;
    const auto* nonce = salt + salt_size;

    derived_key key;
    if (!derive_key(secret_, salt, options_.kdf_iterations, key)) {
        return piiguard_error<sealed_record>(
            error_codes::key_derivation_failed,
            "Key derivation failed: " + get_openssl_error(), module_name);
    }

    evp_cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return piiguard_error<sealed_record>(error_codes::encryption_failed,
                                             "Failed to create cipher context", module_name);
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce_size),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes.data(), nonce) != 1 ||
        !add_associated_data(ctx.get(), record.data(), associated_key, true)) {
        return piiguard_error<sealed_record>(
            error_codes::encryption_failed,
            "Failed to initialise encryption: " + get_openssl_error(), module_name);
    }

    record.resize(header_size + plaintext.size() + tag_size);
    auto* ciphertext = record.data() + header_size;
    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            return piiguard_error<sealed_record>(
                error_codes::encryption_failed,
                "Encryption failed: " + get_openssl_error(), module_name);
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + total, &len) != 1) {
        return piiguard_error<sealed_record>(
            error_codes::encryption_failed,
            "Encryption finalisation failed: " + get_openssl_error(), module_name);
    }
    total += len;

    auto* tag = ciphertext + total;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag_size), tag) !=
        1) {
        return piiguard_error<sealed_record>(
            error_codes::encryption_failed,
            "Failed to read authentication tag: " + get_openssl_error(), module_name);
    }

    record.resize(header_size + static_cast<std::size_t>(total) + tag_size);
    return record;
}

// =============================================================================
// Opening
// =============================================================================

auto mapping_cipher::open(const sealed_record& record, std::string_view associated_key) const
    -> Result<std::string> {
    if (record.size() < header_size + tag_size) {
        return corrupt("record is truncated");
    }
    if (!std::equal(record_magic.begin(), record_magic.end(), record.begin())) {
        return corrupt("unknown record format");
    }
    if (record[magic_size] != format_version) {
        return corrupt(piiguard::compat::format("unsupported record version {}",
                                                static_cast<int>(record[magic_size])));
    }

    const auto iterations = read_u32(record.data() + magic_size + 1);
    if (iterations < min_kdf_iterations || iterations > options_.max_kdf_iterations) {
        return corrupt("key derivation parameters out of range");
    }

    const auto* salt = record.data() + magic_size + 1 + 4;
    const auto* nonce = salt + salt_size;
    const auto* ciphertext = record.data() + header_size;
    const auto ciphertext_size = record.size() - header_size - tag_size;
    const auto* tag = ciphertext + ciphertext_size;

    derived_key key;
    if (!derive_key(secret_, salt, iterations, key)) {
        return corrupt("key derivation failed");
    }

    evp_cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return corrupt("cipher context unavailable");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce_size),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes.data(), nonce) != 1 ||
        !add_associated_data(ctx.get(), record.data(), associated_key, false)) {
        return corrupt("decryption setup failed");
    }

    std::string plaintext(ciphertext_size, '\0');
    int len = 0;
    int total = 0;
    if (ciphertext_size > 0) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()),
                              &len, ciphertext, static_cast<int>(ciphertext_size)) != 1) {
            OPENSSL_cleanse(plaintext.data(), plaintext.size());
            return corrupt("decryption failed");
        }
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_size),
                            const_cast<std::uint8_t*>(tag)) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return corrupt("authentication tag rejected");
    }

    std::array<unsigned char, 16> final_block{};
    if (EVP_DecryptFinal_ex(ctx.get(), final_block.data(), &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return corrupt("authentication failed");
    }
    total += len;

    plaintext.resize(static_cast<std::size_t>(total));
    return plaintext;
}

} // namespace piiguard::security
