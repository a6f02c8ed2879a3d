/**
 * @file main.cpp
 * @brief PII Anonymize - free-text de-identification utility
 *
 * A command-line utility that detects personally identifiable information
 * in free text and pseudonymizes, masks or replaces it. Pseudonymized text
 * can be restored later from a mapping file or from the encrypted mapping
 * store.
 *
 * Usage:
 *   pii_anonymize [options] [input]
 *
 * Examples:
 *   pii_anonymize notes.txt
 *   pii_anonymize --mode mask notes.txt -o masked.txt
 *   pii_anonymize --store ticket-1042 notes.txt > anonymized.txt
 *   pii_anonymize --deanonymize --store ticket-1042 anonymized.txt
 */

#include "piiguard/anonymization/pii_anonymizer.hpp"
#include "piiguard/config/engine_config.hpp"
#include "piiguard/integration/logger_adapter.hpp"
#include "piiguard/security/mapping_cipher.hpp"
#include "piiguard/storage/sqlite_mapping_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace {

using piiguard::anonymization::anonymization_mode;
using piiguard::anonymization::pii_anonymizer;
using piiguard::integration::logger_adapter;

/**
 * @brief Command line options
 */
struct options {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    std::filesystem::path config_path;
    std::filesystem::path mapping_file;
    anonymization_mode mode{anonymization_mode::pseudonymize};
    std::optional<std::string> store_key;
    std::optional<std::string> new_secret;
    bool deanonymize{false};
    bool preview{false};
    bool stats{false};
    bool clear{false};
    bool list_keys{false};
    bool generate_secret{false};
    bool verbose{false};
};

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << "\nPII Anonymize - Free-text De-identification Utility\n\n";
    std::cout << "Usage: " << program_name << " [options] [input]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  input                   Input text file (default: stdin)\n\n";

    std::cout << "Anonymization Options:\n";
    std::cout << "  -m, --mode <name>       pseudonymize (default), mask or replace\n";
    std::cout << "  -o, --output <file>     Write result to file (default: stdout)\n";
    std::cout << "      --mapping-file <f>  Write the placeholder mapping as JSON,\n";
    std::cout << "                          or read it with --deanonymize\n";
    std::cout << "  -s, --store <key>       Persist the mapping under <key> in the\n";
    std::cout << "                          encrypted mapping store\n\n";

    std::cout << "Restoration Options:\n";
    std::cout << "  -d, --deanonymize       Restore labels using --mapping-file or --store\n\n";

    std::cout << "Inspection Options:\n";
    std::cout << "      --preview           Show detected entities grouped by type\n";
    std::cout << "      --stats             Show detection counts per type\n\n";

    std::cout << "Store Maintenance:\n";
    std::cout << "      --list-keys         List stored mapping keys\n";
    std::cout << "      --clear             Delete every stored mapping\n";
    std::cout << "      --rotate-secret <s> Switch to a new secret (discards mappings)\n";
    std::cout << "      --generate-secret   Print a fresh random secret\n\n";

    std::cout << "General Options:\n";
    std::cout << "  -c, --config <file>     JSON configuration file\n";
    std::cout << "  -v, --verbose           Print a summary to stderr\n";
    std::cout << "  -h, --help              Show this help message\n\n";

    std::cout << "Environment:\n";
    std::cout << "  PIIGUARD_ENCRYPTION_KEY Secret for the mapping store\n";
    std::cout << "  PIIGUARD_MAPPINGS_DB    Mapping database (default: mappings.db)\n";
    std::cout << "  PIIGUARD_CONFIG         Configuration file\n\n";

    std::cout << "Exit Codes:\n";
    std::cout << "  0  Success\n";
    std::cout << "  1  Invalid arguments\n";
    std::cout << "  2  Processing error\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param opts Output: parsed options
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if ((arg == "-m" || arg == "--mode") && i + 1 < argc) {
            std::string mode_name = argv[++i];
            auto mode = piiguard::anonymization::mode_from_string(mode_name);
            if (!mode) {
                std::cerr << "Error: Unknown mode '" << mode_name << "'\n";
                std::cerr << "Available modes: pseudonymize, mask, replace\n";
                return false;
            }
            opts.mode = *mode;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            opts.output_path = argv[++i];
        } else if (arg == "--mapping-file" && i + 1 < argc) {
            opts.mapping_file = argv[++i];
        } else if ((arg == "-s" || arg == "--store") && i + 1 < argc) {
            opts.store_key = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "-d" || arg == "--deanonymize") {
            opts.deanonymize = true;
        } else if (arg == "--preview") {
            opts.preview = true;
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg == "--list-keys") {
            opts.list_keys = true;
        } else if (arg == "--clear") {
            opts.clear = true;
        } else if (arg == "--rotate-secret" && i + 1 < argc) {
            opts.new_secret = argv[++i];
        } else if (arg == "--generate-secret") {
            opts.generate_secret = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (opts.input_path.empty()) {
            opts.input_path = arg;
        } else {
            std::cerr << "Error: Only one input file may be given\n";
            return false;
        }
    }

    // Validation
    if (opts.deanonymize && opts.mapping_file.empty() && !opts.store_key) {
        std::cerr << "Error: --deanonymize requires --mapping-file or --store\n";
        return false;
    }
    if (opts.deanonymize && (opts.preview || opts.stats)) {
        std::cerr << "Error: --deanonymize cannot be combined with --preview or --stats\n";
        return false;
    }
    if (opts.store_key && opts.mode != anonymization_mode::pseudonymize && !opts.deanonymize) {
        std::cerr << "Warning: --store has no effect outside pseudonymize mode\n";
    }

    return true;
}

auto read_input(const options& opts) -> std::optional<std::string> {
    if (opts.input_path.empty() || opts.input_path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream file(opts.input_path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open input file: " << opts.input_path.string() << "\n";
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool write_output(const options& opts, const std::string& text) {
    if (opts.output_path.empty()) {
        std::cout << text;
        return static_cast<bool>(std::cout);
    }

    std::ofstream file(opts.output_path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open output file: " << opts.output_path.string() << "\n";
        return false;
    }
    file << text;
    return static_cast<bool>(file);
}

bool write_text_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Error: Cannot write file: " << path.string() << "\n";
        return false;
    }
    file << content << "\n";
    return static_cast<bool>(file);
}

auto open_store(const piiguard::config::engine_config& config)
    -> std::unique_ptr<piiguard::storage::sqlite_mapping_store> {
    if (!config.has_encryption_key()) {
        std::cerr << "Error: No encryption key configured "
                     "(set PIIGUARD_ENCRYPTION_KEY or encryption_key)\n";
        return nullptr;
    }

    auto cipher = piiguard::security::mapping_cipher::create(config.encryption_key,
                                                             config.to_cipher_options());
    if (cipher.is_err()) {
        std::cerr << "Error: " << cipher.error().message << "\n";
        return nullptr;
    }

    auto store = piiguard::storage::sqlite_mapping_store::open(config.mappings_db,
                                                               cipher.value());
    if (store.is_err()) {
        std::cerr << "Error: " << store.error().message << "\n";
        return nullptr;
    }
    return std::move(store.value());
}

auto report_to_json(const piiguard::anonymization::detection_report& report) -> nlohmann::json {
    nlohmann::json json{{"input_rejected", report.input_rejected},
                        {"degraded", report.degraded},
                        {"pattern_candidates", report.pattern_candidates},
                        {"model_candidates", report.model_candidates}};
    if (report.model_status) {
        json["model_status"] = report.model_status->message;
    }
    return json;
}

// ─────────────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────────────

int run_store_maintenance(const options& opts, const piiguard::config::engine_config& config) {
    auto store = open_store(config);
    if (!store) {
        return 2;
    }

    if (opts.list_keys) {
        auto keys = store->keys();
        if (keys.is_err()) {
            std::cerr << "Error: " << keys.error().message << "\n";
            return 2;
        }
        for (const auto& key : keys.value()) {
            std::cout << key << "\n";
        }
    }

    if (opts.clear) {
        auto removed = store->clear();
        if (removed.is_err()) {
            std::cerr << "Error: " << removed.error().message << "\n";
            return 2;
        }
        std::cout << "Removed " << removed.value() << " stored mappings\n";
    }

    if (opts.new_secret) {
        auto removed = store->rotate_secret(*opts.new_secret);
        if (removed.is_err()) {
            std::cerr << "Error: " << removed.error().message << "\n";
            return 2;
        }
        std::cout << "Secret rotated; discarded " << removed.value() << " stored mappings\n";
        std::cout << "Update PIIGUARD_ENCRYPTION_KEY before the next run\n";
    }
    return 0;
}

int run_inspection(const options& opts, const pii_anonymizer& anonymizer,
                   const std::string& text) {
    nlohmann::json output = nlohmann::json::object();

    if (opts.preview) {
        auto preview = anonymizer.preview(text);
        nlohmann::json groups = nlohmann::json::array();
        for (const auto& group : preview.groups) {
            groups.push_back({{"type", group.label},
                              {"count", group.count},
                              {"examples", group.examples}});
        }
        output["preview"] = {{"total", preview.total},
                             {"groups", groups},
                             {"report", report_to_json(preview.report)}};
    }

    if (opts.stats) {
        output["stats"] = anonymizer.detection_stats(text);
    }

    return write_output(opts, output.dump(2) + "\n") ? 0 : 2;
}

int run_deanonymize(const options& opts, const pii_anonymizer& anonymizer,
                    const piiguard::config::engine_config& config, const std::string& text) {
    piiguard::anonymization::deanonymize_result restored;

    if (opts.store_key) {
        auto store = open_store(config);
        if (!store) {
            return 2;
        }
        auto result = anonymizer.deanonymize_from_store(text, *store, *opts.store_key);
        if (result.is_err()) {
            std::cerr << "Error: " << result.error().message << "\n";
            return 2;
        }
        restored = result.value();
    } else {
        std::ifstream file(opts.mapping_file);
        if (!file) {
            std::cerr << "Error: Cannot open mapping file: " << opts.mapping_file.string()
                      << "\n";
            return 2;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto mapping = piiguard::anonymization::placeholder_mapping::from_json(buffer.str());
        if (mapping.is_err()) {
            std::cerr << "Error: " << mapping.error().message << "\n";
            return 2;
        }
        restored = anonymizer.deanonymize(text, mapping.value());
    }

    if (opts.verbose) {
        std::cerr << "Restored " << restored.substitutions << " labels\n";
    }
    return write_output(opts, restored.restored_text) ? 0 : 2;
}

int run_anonymize(const options& opts, const pii_anonymizer& anonymizer,
                  const piiguard::config::engine_config& config, const std::string& text) {
    const bool persist = opts.store_key && opts.mode == anonymization_mode::pseudonymize;

    std::unique_ptr<piiguard::storage::sqlite_mapping_store> store;
    if (persist) {
        store = open_store(config);
        if (!store) {
            return 2;
        }
    }

    auto result = persist
                      ? anonymizer.anonymize_and_store(text, opts.mode, *store, *opts.store_key)
                      : anonymizer.anonymize(text, opts.mode);

    if (result.is_err()) {
        std::cerr << "Error: " << result.error().message << "\n";
        return 2;
    }
    const auto& anonymized = result.value();

    if (anonymized.report.input_rejected) {
        std::cerr << "Error: Input is not valid UTF-8 text\n";
        return 2;
    }
    if (anonymized.report.degraded) {
        std::cerr << "Warning: Model detector unavailable; pattern detection only\n";
    }

    if (!opts.mapping_file.empty() && !anonymized.mapping.empty()) {
        if (!write_text_file(opts.mapping_file, anonymized.mapping.to_json())) {
            return 2;
        }
    }

    if (opts.verbose) {
        std::cerr << "\n";
        std::cerr << "========================================\n";
        std::cerr << "       Anonymization Summary\n";
        std::cerr << "========================================\n";
        std::cerr << "  Mode:           " << to_string(opts.mode) << "\n";
        std::cerr << "  Entities:       " << anonymized.substitutions.size() << "\n";
        for (const auto& [type, count] : anonymized.entity_counts) {
            std::cerr << "    " << piiguard::core::human_label(type) << ": " << count << "\n";
        }
        std::cerr << "  Mapping labels: " << anonymized.mapping.size() << "\n";
        if (persist && !anonymized.mapping.empty()) {
            std::cerr << "  Stored under:   " << *opts.store_key << "\n";
        }
        std::cerr << "========================================\n";
    }

    return write_output(opts, anonymized.anonymized_text) ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    if (opts.generate_secret) {
        auto secret = piiguard::security::mapping_cipher::generate_secret();
        if (secret.is_err()) {
            std::cerr << "Error: " << secret.error().message << "\n";
            return 2;
        }
        std::cout << secret.value() << "\n";
        return 0;
    }

    std::optional<std::filesystem::path> config_path;
    if (!opts.config_path.empty()) {
        config_path = opts.config_path;
    }
    auto config = piiguard::config::engine_config::load(config_path);
    if (config.is_err()) {
        std::cerr << "Error: " << config.error().message << "\n";
        return 1;
    }

    logger_adapter::initialize(config.value().to_logger_config());

    int exit_code = 0;
    if (opts.list_keys || opts.clear || opts.new_secret) {
        exit_code = run_store_maintenance(opts, config.value());
    } else {
        auto text = read_input(opts);
        if (!text) {
            logger_adapter::shutdown();
            return 2;
        }

        pii_anonymizer anonymizer(config.value().to_anonymizer_options());
        if (opts.preview || opts.stats) {
            exit_code = run_inspection(opts, anonymizer, *text);
        } else if (opts.deanonymize) {
            exit_code = run_deanonymize(opts, anonymizer, config.value(), *text);
        } else {
            exit_code = run_anonymize(opts, anonymizer, config.value(), *text);
        }
    }

    logger_adapter::shutdown();
    return exit_code;
}
