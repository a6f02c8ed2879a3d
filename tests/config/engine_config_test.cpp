/**
 * @file engine_config_test.cpp
 * @brief Unit tests for engine configuration loading
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/config/engine_config.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

using namespace piiguard::config;
using piiguard::integration::log_level;
namespace error_codes = piiguard::error_codes;

namespace {

/// Sets environment variables and restores a clean environment on scope exit
class scoped_environment {
public:
    scoped_environment() { clear_all(); }
    ~scoped_environment() { clear_all(); }

    void set(const char* name, const std::string& value) {
        ::setenv(name, value.c_str(), 1);
    }

private:
    static void clear_all() {
        for (const char* name : {"PIIGUARD_ENCRYPTION_KEY", "PIIGUARD_MAPPINGS_DB",
                                 "PIIGUARD_KDF_ITERATIONS", "PIIGUARD_LOG_LEVEL",
                                 "PIIGUARD_LOG_DIR", "PIIGUARD_CONFIG"}) {
            ::unsetenv(name);
        }
    }
};

/// JSON file in the temp directory, removed on scope exit
class temp_config_file {
public:
    explicit temp_config_file(const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                ("piiguard_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".json");
        std::ofstream file(path_);
        file << content;
    }

    ~temp_config_file() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("EngineConfig: Defaults and Validation", "[config]") {
    engine_config config;

    SECTION("Defaults are valid") {
        REQUIRE(config.validate().is_ok());
        REQUIRE_FALSE(config.has_encryption_key());
        REQUIRE(config.mappings_db == "mappings.db");
        REQUIRE(config.kdf_iterations == 100000);
        REQUIRE(config.enable_model_detector);
        REQUIRE(config.log.level == "info");
    }

    SECTION("Out-of-range values name the offending key") {
        struct invalid_case {
            std::string key;
            std::function<void(engine_config&)> mutate;
        };
        const std::vector<invalid_case> cases = {
            {"mappings_db", [](engine_config& c) { c.mappings_db.clear(); }},
            {"kdf_iterations", [](engine_config& c) { c.kdf_iterations = 10; }},
            {"duplicate_overlap_threshold",
             [](engine_config& c) { c.duplicate_overlap_threshold = 1.0; }},
            {"context_window", [](engine_config& c) { c.context_window = 0; }},
            {"log.level", [](engine_config& c) { c.log.level = "loud"; }},
            {"encryption_key", [](engine_config& c) { c.encryption_key = "short"; }},
        };

        for (const auto& entry : cases) {
            engine_config invalid;
            entry.mutate(invalid);
            auto result = invalid.validate();
            REQUIRE(result.is_err());
            REQUIRE(result.error().code == error_codes::config_invalid_value);
            REQUIRE(result.error().message.find("'" + entry.key + "'") != std::string::npos);
        }
    }

    SECTION("Long enough key is accepted") {
        config.encryption_key = "0123456789abcdef";
        REQUIRE(config.validate().is_ok());
        REQUIRE(config.has_encryption_key());
    }
}

TEST_CASE("EngineConfig: JSON Document", "[config]") {
    engine_config config;

    SECTION("Every field is read") {
        auto applied = config.apply_json(R"({
            "encryption_key": "0123456789abcdef-key",
            "mappings_db": "/tmp/mappings.db",
            "kdf_iterations": 5000,
            "duplicate_overlap_threshold": 0.6,
            "context_window": 25,
            "enable_model_detector": false,
            "preview_examples": 5,
            "log": {"directory": "/tmp/piiguard-logs", "level": "debug",
                    "console": true, "file": false, "audit": false}
        })");
        REQUIRE(applied.is_ok());
        REQUIRE(config.encryption_key == "0123456789abcdef-key");
        REQUIRE(config.mappings_db == "/tmp/mappings.db");
        REQUIRE(config.kdf_iterations == 5000);
        REQUIRE(config.duplicate_overlap_threshold == 0.6);
        REQUIRE(config.context_window == 25);
        REQUIRE_FALSE(config.enable_model_detector);
        REQUIRE(config.preview_examples == 5);
        REQUIRE(config.log.directory == std::filesystem::path("/tmp/piiguard-logs"));
        REQUIRE(config.log.level == "debug");
        REQUIRE(config.log.console);
        REQUIRE_FALSE(config.log.file);
        REQUIRE_FALSE(config.log.audit);
        REQUIRE(config.validate().is_ok());
    }

    SECTION("Absent fields keep their values") {
        REQUIRE(config.apply_json(R"({"context_window": 10})").is_ok());
        REQUIRE(config.context_window == 10);
        REQUIRE(config.mappings_db == "mappings.db");
    }

    SECTION("Malformed JSON") {
        auto applied = config.apply_json("{not json");
        REQUIRE(applied.is_err());
        REQUIRE(applied.error().code == error_codes::config_parse_error);
    }

    SECTION("Root must be an object") {
        auto applied = config.apply_json("[1, 2]");
        REQUIRE(applied.is_err());
        REQUIRE(applied.error().code == error_codes::config_parse_error);
    }

    SECTION("Wrong value type") {
        auto applied = config.apply_json(R"({"kdf_iterations": "many"})");
        REQUIRE(applied.is_err());
        REQUIRE(applied.error().code == error_codes::config_invalid_value);
        REQUIRE(applied.error().message.find("'kdf_iterations'") != std::string::npos);
    }

    SECTION("Log section must be an object") {
        auto applied = config.apply_json(R"({"log": 5})");
        REQUIRE(applied.is_err());
        REQUIRE(applied.error().code == error_codes::config_invalid_value);
    }
}

TEST_CASE("EngineConfig: Environment", "[config]") {
    scoped_environment env;

    SECTION("Variables override defaults") {
        env.set("PIIGUARD_ENCRYPTION_KEY", "env-secret-0123456789");
        env.set("PIIGUARD_MAPPINGS_DB", "/tmp/env.db");
        env.set("PIIGUARD_KDF_ITERATIONS", "20000");
        env.set("PIIGUARD_LOG_LEVEL", "warn");
        env.set("PIIGUARD_LOG_DIR", "/tmp/env-logs");

        auto config = engine_config::load_from_environment();
        REQUIRE(config.is_ok());
        REQUIRE(config.value().encryption_key == "env-secret-0123456789");
        REQUIRE(config.value().mappings_db == "/tmp/env.db");
        REQUIRE(config.value().kdf_iterations == 20000);
        REQUIRE(config.value().log.level == "warn");
        REQUIRE(config.value().log.directory == std::filesystem::path("/tmp/env-logs"));
    }

    SECTION("Empty variables are ignored") {
        env.set("PIIGUARD_MAPPINGS_DB", "");
        auto config = engine_config::load_from_environment();
        REQUIRE(config.is_ok());
        REQUIRE(config.value().mappings_db == "mappings.db");
    }

    SECTION("Non-numeric iteration count") {
        env.set("PIIGUARD_KDF_ITERATIONS", "12abc");
        auto config = engine_config::load_from_environment();
        REQUIRE(config.is_err());
        REQUIRE(config.error().code == error_codes::config_invalid_value);
    }

    SECTION("Out-of-range iteration count") {
        env.set("PIIGUARD_KDF_ITERATIONS", "99999999999999999999999");
        auto config = engine_config::load_from_environment();
        REQUIRE(config.is_err());
        REQUIRE(config.error().code == error_codes::config_invalid_value);
    }

    SECTION("Invalid level fails validation") {
        env.set("PIIGUARD_LOG_LEVEL", "chatty");
        auto config = engine_config::load_from_environment();
        REQUIRE(config.is_err());
        REQUIRE(config.error().code == error_codes::config_invalid_value);
    }
}

TEST_CASE("EngineConfig: Files and Precedence", "[config]") {
    scoped_environment env;

    SECTION("Missing file") {
        auto config = engine_config::load_from_file("/nonexistent/piiguard.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code == error_codes::config_file_not_found);
    }

    SECTION("File values are loaded") {
        temp_config_file file(R"({"mappings_db": "file.db", "preview_examples": 7})");
        auto config = engine_config::load_from_file(file.path());
        REQUIRE(config.is_ok());
        REQUIRE(config.value().mappings_db == "file.db");
        REQUIRE(config.value().preview_examples == 7);
    }

    SECTION("File overrides environment") {
        env.set("PIIGUARD_MAPPINGS_DB", "env.db");
        env.set("PIIGUARD_LOG_LEVEL", "error");
        temp_config_file file(R"({"mappings_db": "file.db"})");

        auto config = engine_config::load(file.path());
        REQUIRE(config.is_ok());
        REQUIRE(config.value().mappings_db == "file.db");
        REQUIRE(config.value().log.level == "error");
    }

    SECTION("PIIGUARD_CONFIG names the file when no path is given") {
        temp_config_file file(R"({"context_window": 12})");
        env.set("PIIGUARD_CONFIG", file.path().string());

        auto config = engine_config::load();
        REQUIRE(config.is_ok());
        REQUIRE(config.value().context_window == 12);
    }

    SECTION("No file at all") {
        auto config = engine_config::load();
        REQUIRE(config.is_ok());
        REQUIRE(config.value().mappings_db == "mappings.db");
    }
}

TEST_CASE("EngineConfig: Conversions", "[config]") {
    engine_config config;
    config.duplicate_overlap_threshold = 0.7;
    config.context_window = 30;
    config.enable_model_detector = false;
    config.preview_examples = 2;
    config.kdf_iterations = 4000;
    config.log.level = "debug";
    config.log.console = true;
    config.log.audit = false;

    SECTION("Anonymizer options") {
        const auto options = config.to_anonymizer_options();
        REQUIRE(options.duplicate_overlap_threshold == 0.7);
        REQUIRE(options.context_window == 30);
        REQUIRE_FALSE(options.enable_model_detector);
        REQUIRE(options.preview_examples == 2);
    }

    SECTION("Logger configuration") {
        const auto logger = config.to_logger_config();
        REQUIRE(logger.min_level == log_level::debug);
        REQUIRE(logger.enable_console);
        REQUIRE(logger.enable_file);
        REQUIRE_FALSE(logger.enable_audit_log);
        REQUIRE(logger.log_directory == std::filesystem::path("logs"));
    }

    SECTION("Cipher options") {
        REQUIRE(config.to_cipher_options().kdf_iterations == 4000);
    }
}
