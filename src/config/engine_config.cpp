/**
 * @file engine_config.cpp
 * @brief Implementation of engine configuration loading
 */

#include "piiguard/config/engine_config.hpp"

#include <piiguard/compat/format.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace piiguard::config {

namespace {

constexpr const char* module_name = "engine_config";

auto invalid_value(std::string_view key, std::string_view reason) -> VoidResult {
    return piiguard_void_error(error_codes::config_invalid_value,
                               piiguard::compat::format("Invalid value for '{}': {}", key, reason),
                               module_name);
}

auto get_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto parse_unsigned(std::string_view key, const std::string& text) -> Result<std::uint64_t> {
    if (text.find_first_not_of("0123456789") != std::string::npos) {
        return piiguard_error<std::uint64_t>(
            error_codes::config_invalid_value,
            piiguard::compat::format("Invalid value for '{}': not an integer", key),
            module_name);
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return piiguard_error<std::uint64_t>(
            error_codes::config_invalid_value,
            piiguard::compat::format("Invalid value for '{}': out of range", key), module_name);
    }
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

auto engine_config::validate() const -> VoidResult {
    if (mappings_db.empty()) {
        return invalid_value("mappings_db", "must not be empty");
    }
    if (kdf_iterations < security::mapping_cipher::min_kdf_iterations ||
        kdf_iterations > security::cipher_options{}.max_kdf_iterations) {
        return invalid_value("kdf_iterations",
                             piiguard::compat::format("must be between {} and {}",
                                                      security::mapping_cipher::min_kdf_iterations,
                                                      security::cipher_options{}.max_kdf_iterations));
    }
    if (!(duplicate_overlap_threshold > 0.0 && duplicate_overlap_threshold < 1.0)) {
        return invalid_value("duplicate_overlap_threshold", "must be between 0 and 1 exclusive");
    }
    if (context_window == 0) {
        return invalid_value("context_window", "must be positive");
    }
    if (!integration::log_level_from_string(log.level)) {
        return invalid_value("log.level", log.level);
    }
    if (has_encryption_key() &&
        encryption_key.size() < security::mapping_cipher::min_secret_length) {
        return invalid_value("encryption_key",
                             piiguard::compat::format("must be at least {} characters",
                                                      security::mapping_cipher::min_secret_length));
    }
    return ok();
}

// =============================================================================
// Sources
// =============================================================================

auto engine_config::apply_environment() -> VoidResult {
    if (auto key = get_env("PIIGUARD_ENCRYPTION_KEY")) {
        encryption_key = *key;
    }
    if (auto db = get_env("PIIGUARD_MAPPINGS_DB")) {
        mappings_db = *db;
    }
    if (auto iterations = get_env("PIIGUARD_KDF_ITERATIONS")) {
        auto parsed = parse_unsigned("PIIGUARD_KDF_ITERATIONS", *iterations);
        if (parsed.is_err()) {
            return piiguard_void_error(parsed.error().code, parsed.error().message, module_name);
        }
        if (parsed.value() > security::cipher_options{}.max_kdf_iterations) {
            return invalid_value("PIIGUARD_KDF_ITERATIONS", "too large");
        }
        kdf_iterations = static_cast<std::uint32_t>(parsed.value());
    }
    if (auto level = get_env("PIIGUARD_LOG_LEVEL")) {
        log.level = *level;
    }
    if (auto directory = get_env("PIIGUARD_LOG_DIR")) {
        log.directory = *directory;
    }
    return ok();
}

auto engine_config::apply_json(std::string_view document) -> VoidResult {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(document);
    } catch (const nlohmann::json::parse_error& e) {
        return piiguard_void_error(error_codes::config_parse_error,
                                   piiguard::compat::format("Malformed JSON: {}", e.what()),
                                   module_name);
    }
    if (!root.is_object()) {
        return piiguard_void_error(error_codes::config_parse_error,
                                   "Configuration root must be a JSON object", module_name);
    }

    // Type mismatches surface as nlohmann::json::type_error
    std::string current_key;
    try {
        auto read = [&](const nlohmann::json& section, const char* name, auto& target) {
            current_key = name;
            if (section.contains(name)) {
                section.at(name).get_to(target);
            }
        };

        read(root, "encryption_key", encryption_key);
        read(root, "mappings_db", mappings_db);
        read(root, "kdf_iterations", kdf_iterations);
        read(root, "duplicate_overlap_threshold", duplicate_overlap_threshold);
        read(root, "context_window", context_window);
        read(root, "enable_model_detector", enable_model_detector);
        read(root, "preview_examples", preview_examples);

        if (root.contains("log")) {
            const auto& section = root.at("log");
            current_key = "log";
            if (!section.is_object()) {
                return invalid_value("log", "must be an object");
            }
            std::string directory = log.directory.string();
            read(section, "directory", directory);
            log.directory = directory;
            read(section, "level", log.level);
            read(section, "console", log.console);
            read(section, "file", log.file);
            read(section, "audit", log.audit);
        }
    } catch (const nlohmann::json::exception& e) {
        return invalid_value(current_key, e.what());
    }
    return ok();
}

auto engine_config::apply_file(const std::filesystem::path& path) -> VoidResult {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return piiguard_void_error(
            error_codes::config_file_not_found,
            piiguard::compat::format("Configuration file not found: {}", path.string()),
            module_name);
    }

    std::ifstream file(path);
    if (!file) {
        return piiguard_void_error(
            error_codes::config_file_not_found,
            piiguard::compat::format("Cannot open configuration file: {}", path.string()),
            module_name);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return apply_json(buffer.str());
}

auto engine_config::load_from_environment() -> Result<engine_config> {
    engine_config config;
    if (auto applied = config.apply_environment(); applied.is_err()) {
        return piiguard_error<engine_config>(applied.error().code, applied.error().message,
                                             module_name);
    }
    if (auto valid = config.validate(); valid.is_err()) {
        return piiguard_error<engine_config>(valid.error().code, valid.error().message,
                                             module_name);
    }
    return config;
}

auto engine_config::load_from_file(const std::filesystem::path& path) -> Result<engine_config> {
    engine_config config;
    if (auto applied = config.apply_file(path); applied.is_err()) {
        return piiguard_error<engine_config>(applied.error().code, applied.error().message,
                                             module_name);
    }
    if (auto valid = config.validate(); valid.is_err()) {
        return piiguard_error<engine_config>(valid.error().code, valid.error().message,
                                             module_name);
    }
    return config;
}

auto engine_config::load(std::optional<std::filesystem::path> path) -> Result<engine_config> {
    engine_config config;
    if (auto applied = config.apply_environment(); applied.is_err()) {
        return piiguard_error<engine_config>(applied.error().code, applied.error().message,
                                             module_name);
    }

    if (!path) {
        if (auto from_env = get_env("PIIGUARD_CONFIG")) {
            path = *from_env;
        }
    }
    if (path) {
        if (auto applied = config.apply_file(*path); applied.is_err()) {
            return piiguard_error<engine_config>(applied.error().code, applied.error().message,
                                                 module_name);
        }
    }

    if (auto valid = config.validate(); valid.is_err()) {
        return piiguard_error<engine_config>(valid.error().code, valid.error().message,
                                             module_name);
    }
    return config;
}

// =============================================================================
// Conversions
// =============================================================================

auto engine_config::to_anonymizer_options() const -> anonymization::anonymizer_options {
    anonymization::anonymizer_options options;
    options.duplicate_overlap_threshold = duplicate_overlap_threshold;
    options.context_window = context_window;
    options.enable_model_detector = enable_model_detector;
    options.preview_examples = preview_examples;
    return options;
}

auto engine_config::to_logger_config() const -> integration::logger_config {
    integration::logger_config config;
    config.log_directory = log.directory;
    config.min_level =
        integration::log_level_from_string(log.level).value_or(integration::log_level::info);
    config.enable_console = log.console;
    config.enable_file = log.file;
    config.enable_audit_log = log.audit;
    return config;
}

auto engine_config::to_cipher_options() const -> security::cipher_options {
    security::cipher_options options;
    options.kdf_iterations = kdf_iterations;
    return options;
}

} // namespace piiguard::config
