/**
 * @file logger_adapter.hpp
 * @brief Application and audit logging on top of logger_system
 *
 * Leveled diagnostics go to logger_system writers (console and a rotating
 * file). Audit records go to a separate JSON-lines file, one object per
 * line, so that anonymization runs and mapping store access can be
 * reviewed independently of diagnostic verbosity.
 *
 * Audit records carry counts, modes and opaque store keys only. Detected
 * values and restored text are never written to any log.
 */

#pragma once

#include <piiguard/compat/format.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace piiguard::integration {

/**
 * @enum log_level
 * @brief Log severity levels, ordered from most to least verbose
 */
enum class log_level { trace, debug, info, warn, error, fatal, off };

/**
 * @brief Parse a log level name ("trace" ... "off", case-sensitive)
 *
 * "warning" is accepted as an alias of "warn".
 */
[[nodiscard]] inline auto log_level_from_string(std::string_view name)
    -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    if (name == "off") return log_level::off;
    return std::nullopt;
}

/**
 * @enum audit_event
 * @brief Kinds of audit trail records
 */
enum class audit_event {
    anonymize,
    mapping_store,
    mapping_load,
    mapping_clear,
    detector_degraded,
    security
};

/**
 * @brief Audit trail name of an event ("ANONYMIZE", "MAPPING_STORE", ...)
 */
[[nodiscard]] constexpr auto to_string(audit_event event) noexcept -> std::string_view {
    switch (event) {
        case audit_event::anonymize: return "ANONYMIZE";
        case audit_event::mapping_store: return "MAPPING_STORE";
        case audit_event::mapping_load: return "MAPPING_LOAD";
        case audit_event::mapping_clear: return "MAPPING_CLEAR";
        case audit_event::detector_degraded: return "DETECTOR_DEGRADED";
        case audit_event::security: return "SECURITY";
    }
    return "UNKNOWN";
}

/**
 * @enum security_event_type
 * @brief Security-relevant occurrences around the mapping store
 */
enum class security_event_type {
    mapping_corrupt,   ///< A stored record failed authentication or decoding
    invalid_secret,    ///< A secret was rejected
    key_rotation,      ///< The store secret was replaced
    data_export        ///< Original values were restored from a stored mapping
};

[[nodiscard]] constexpr auto to_string(security_event_type type) noexcept -> std::string_view {
    switch (type) {
        case security_event_type::mapping_corrupt: return "mapping_corrupt";
        case security_event_type::invalid_secret: return "invalid_secret";
        case security_event_type::key_rotation: return "key_rotation";
        case security_event_type::data_export: return "data_export";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for the diagnostic log and the audit trail
    std::filesystem::path log_directory{"logs"};

    log_level min_level{log_level::info};

    bool enable_console{true};

    /// Write diagnostics to piiguard.log (rotated)
    bool enable_file{true};

    /// Write the JSON-lines audit trail
    bool enable_audit_log{true};

    /// Audit trail file name inside log_directory
    std::string audit_file_name{"audit.json"};

    /// Rotation threshold of piiguard.log in megabytes
    std::size_t max_file_size_mb{100};

    /// Rotated piiguard.log files to keep
    std::size_t max_files{10};

    bool async_mode{true};

    /// Queue size for async mode
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade used throughout piiguard
 *
 * Logging before initialize() is a silent no-op, so the library can be
 * embedded without any logging setup.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/piiguard";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Loaded {} detection rules", 27);
 * logger_adapter::log_anonymization_performed("pseudonymize", 4, false);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────

    /**
     * @brief Start writers and open the audit trail
     *
     * Calling it again while initialized has no effect. If the audit file
     * cannot be opened, diagnostics still work and audit records are
     * dropped with a warning.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages, close the audit trail and stop writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Diagnostics
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(piiguard::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(piiguard::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(piiguard::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(piiguard::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(piiguard::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::error, fmt, std::forward<Args>(args)...);
    }

    static void log(log_level level, const std::string& message);

    /**
     * @return false when the logger is not initialized or @p level is off
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record one anonymization run
     *
     * @param mode Mode name ("pseudonymize", "mask", "replace")
     * @param entity_count Number of entities rewritten
     * @param degraded True if the model detector was unavailable
     */
    static void log_anonymization_performed(std::string_view mode,
                                            std::size_t entity_count,
                                            bool degraded);

    static void log_mapping_stored(const std::string& store_key, std::size_t entries);

    static void log_mapping_loaded(const std::string& store_key, std::size_t entries);

    /**
     * @brief Record the removal of stored mappings
     * @param store_key Key removed, or empty for a full clear
     * @param records Number of records deleted
     */
    static void log_mappings_removed(const std::string& store_key, std::size_t records);

    static void log_detector_degraded(const std::string& detector, const std::string& reason);

    /**
     * @brief Record a security-related event
     *
     * @param type Type of security event
     * @param description Human-readable description without PII
     * @param subject Optional store key or component name
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& subject = "");

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    template <typename... Args>
    static void emit(log_level level, piiguard::compat::format_string<Args...> fmt,
                     Args&&... args) {
        if (!is_level_enabled(level)) return;
        log(level, piiguard::compat::format(fmt, std::forward<Args>(args)...));
    }

    /// Append one record; @p fields are merged after timestamp, event and outcome
    static void write_audit_record(audit_event event, std::string_view outcome,
                                   nlohmann::json fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace piiguard::integration
