/**
 * @file engine_config.hpp
 * @brief Engine configuration from defaults, environment and JSON file
 *
 * Sources are applied in order, later ones overriding earlier ones:
 * built-in defaults, environment variables, then the JSON file.
 *
 * Environment variables:
 * - PIIGUARD_ENCRYPTION_KEY: secret for stored mappings
 * - PIIGUARD_MAPPINGS_DB: mapping database path
 * - PIIGUARD_KDF_ITERATIONS: PBKDF2 iterations for new records
 * - PIIGUARD_LOG_LEVEL: trace, debug, info, warn, error, fatal or off
 * - PIIGUARD_LOG_DIR: log directory
 * - PIIGUARD_CONFIG: JSON file used by load() when no path is given
 *
 * JSON file example:
 * @code
 * {
 *   "encryption_key": "...",
 *   "mappings_db": "/var/lib/piiguard/mappings.db",
 *   "kdf_iterations": 200000,
 *   "duplicate_overlap_threshold": 0.5,
 *   "context_window": 40,
 *   "enable_model_detector": true,
 *   "preview_examples": 3,
 *   "log": { "directory": "logs", "level": "info", "console": false,
 *            "file": true, "audit": true }
 * }
 * @endcode
 */

#pragma once

#include "piiguard/anonymization/pii_anonymizer.hpp"
#include "piiguard/core/result.hpp"
#include "piiguard/integration/logger_adapter.hpp"
#include "piiguard/security/mapping_cipher.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace piiguard::config {

/**
 * @brief Logging section
 */
struct log_settings {
    /// Directory for piiguard.log and audit.json
    std::filesystem::path directory{"logs"};

    /// Minimum level name
    std::string level{"info"};

    bool console{false};
    bool file{true};
    bool audit{true};
};

/**
 * @struct engine_config
 * @brief Complete engine configuration
 */
struct engine_config {
    /// Secret for stored mappings; empty disables the store
    std::string encryption_key;

    /// Path to the SQLite mapping database
    std::string mappings_db{"mappings.db"};

    /// PBKDF2 iterations used when sealing new records
    std::uint32_t kdf_iterations{100000};

    double duplicate_overlap_threshold{detection::default_duplicate_overlap_threshold};
    std::size_t context_window{detection::default_context_window};
    bool enable_model_detector{true};
    std::size_t preview_examples{3};

    log_settings log;

    /**
     * @brief Check every value is in range
     * @return Error with error_codes::config_invalid_value naming the key
     */
    [[nodiscard]] auto validate() const -> VoidResult;

    /**
     * @brief Override values from PIIGUARD_* environment variables
     */
    [[nodiscard]] auto apply_environment() -> VoidResult;

    /**
     * @brief Override values present in a JSON file
     */
    [[nodiscard]] auto apply_file(const std::filesystem::path& path) -> VoidResult;

    /**
     * @brief Override values present in a JSON document
     */
    [[nodiscard]] auto apply_json(std::string_view document) -> VoidResult;

    [[nodiscard]] auto has_encryption_key() const noexcept -> bool {
        return !encryption_key.empty();
    }

    [[nodiscard]] auto to_anonymizer_options() const -> anonymization::anonymizer_options;
    [[nodiscard]] auto to_logger_config() const -> integration::logger_config;
    [[nodiscard]] auto to_cipher_options() const -> security::cipher_options;

    /**
     * @brief Defaults overridden by the environment
     */
    [[nodiscard]] static auto load_from_environment() -> Result<engine_config>;

    /**
     * @brief Defaults overridden by a JSON file
     */
    [[nodiscard]] static auto load_from_file(const std::filesystem::path& path)
        -> Result<engine_config>;

    /**
     * @brief Defaults, then environment, then the JSON file
     *
     * @param path Config file; when absent PIIGUARD_CONFIG is used if set
     */
    [[nodiscard]] static auto load(std::optional<std::filesystem::path> path = std::nullopt)
        -> Result<engine_config>;
};

} // namespace piiguard::config
