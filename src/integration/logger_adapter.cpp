/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging and audit adapter
 */

#include <piiguard/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace piiguard::integration {

namespace {

constexpr std::array<kcenon::logger::log_level, 7> backend_levels = {
    kcenon::logger::log_level::trace, kcenon::logger::log_level::debug,
    kcenon::logger::log_level::info,  kcenon::logger::log_level::warn,
    kcenon::logger::log_level::error, kcenon::logger::log_level::fatal,
    kcenon::logger::log_level::off};

auto to_backend(log_level level) -> kcenon::logger::log_level {
    return backend_levels[static_cast<std::size_t>(level)];
}

/// UTC timestamp with millisecond precision, e.g. 2024-01-15T09:30:00.125Z
auto utc_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    return piiguard::compat::format("{}.{:03}Z", buffer, millis);
}

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        std::error_code dir_error;
        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory, dir_error);
        }

        backend_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                            config.buffer_size);
        backend_->set_min_level(to_backend(config.min_level));
        if (config.enable_console) {
            backend_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            backend_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "piiguard.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        backend_->start();

        if (config.enable_audit_log) {
            const auto audit_path = config.log_directory / config.audit_file_name;
            audit_.open(audit_path, std::ios::out | std::ios::app);
            if (!audit_) {
                backend_->log(kcenon::logger::log_level::warn,
                              piiguard::compat::format("Audit trail disabled, cannot open {}",
                                                       audit_path.string()));
            }
        }
        if (dir_error) {
            backend_->log(kcenon::logger::log_level::warn,
                          piiguard::compat::format("Cannot create log directory {}: {}",
                                                   config.log_directory.string(),
                                                   dir_error.message()));
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }

        if (audit_.is_open()) {
            audit_.close();
        }
        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_.load(); }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        if (!initialized_ || level == log_level::off) {
            return false;
        }
        return level >= min_level_.load();
    }

    void log(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (backend_ && is_level_enabled(level)) {
            backend_->log(to_backend(level), message);
        }
    }

    void append_audit(audit_event event, std::string_view outcome, nlohmann::json fields) {
        std::lock_guard lock(mutex_);
        if (!initialized_ || !audit_.is_open()) {
            return;
        }

        nlohmann::json record = {{"timestamp", utc_timestamp()},
                                 {"event_type", std::string(to_string(event))},
                                 {"outcome", std::string(outcome)}};
        if (fields.is_object()) {
            record.update(fields);
        }

        // Store keys come from callers and may hold arbitrary bytes.
        audit_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        audit_.flush();
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->flush();
        }
        if (audit_.is_open()) {
            audit_.flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        if (backend_) {
            backend_->set_min_level(to_backend(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

private:
    mutable std::mutex mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
    std::ofstream audit_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Lifecycle and Diagnostics
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->is_initialized(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Audit Trail
// =============================================================================

void logger_adapter::log_anonymization_performed(std::string_view mode,
                                                 std::size_t entity_count,
                                                 bool degraded) {
    if (degraded) {
        warn("Anonymized text in {} mode with pattern detection only: {} entities", mode,
             entity_count);
    } else {
        info("Anonymized text in {} mode: {} entities", mode, entity_count);
    }

    write_audit_record(audit_event::anonymize, "success",
                       {{"mode", std::string(mode)}, {"entity_count", entity_count}, {"degraded", degraded}});
}

void logger_adapter::log_mapping_stored(const std::string& store_key, std::size_t entries) {
    debug("Mapping stored: key={} entries={}", store_key, entries);
    write_audit_record(audit_event::mapping_store, "success",
                       {{"store_key", store_key}, {"entries", entries}});
}

void logger_adapter::log_mapping_loaded(const std::string& store_key, std::size_t entries) {
    debug("Mapping loaded: key={} entries={}", store_key, entries);
    write_audit_record(audit_event::mapping_load, "success",
                       {{"store_key", store_key}, {"entries", entries}});
}

void logger_adapter::log_mappings_removed(const std::string& store_key, std::size_t records) {
    if (store_key.empty()) {
        info("Mapping store cleared: {} records removed", records);
    } else {
        debug("Mapping removed: key={} records={}", store_key, records);
    }

    write_audit_record(audit_event::mapping_clear, "success",
                       {{"store_key", store_key.empty() ? "*" : store_key},
                        {"records", records}});
}

void logger_adapter::log_detector_degraded(const std::string& detector,
                                           const std::string& reason) {
    warn("Model detector '{}' unavailable, using pattern detection only: {}", detector,
         reason);
    write_audit_record(audit_event::detector_degraded, "failure",
                       {{"detector", detector}, {"reason", reason}});
}

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& subject) {
    const std::string name(to_string(type));
    const bool suspicious = type == security_event_type::mapping_corrupt ||
                            type == security_event_type::invalid_secret;
    if (suspicious) {
        warn("Security event: {} - {}", name, description);
    } else {
        info("Security event: {} - {}", name, description);
    }

    nlohmann::json fields = {{"security_event", name}, {"description", description}};
    if (!subject.empty()) {
        fields["subject"] = subject;
    }
    write_audit_record(audit_event::security, name, std::move(fields));
}

void logger_adapter::write_audit_record(audit_event event, std::string_view outcome,
                                        nlohmann::json fields) {
    pimpl_->append_audit(event, outcome, std::move(fields));
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->get_min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->get_config(); }

}  // namespace piiguard::integration
