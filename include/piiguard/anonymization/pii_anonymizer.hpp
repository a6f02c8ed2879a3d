/**
 * @file pii_anonymizer.hpp
 * @brief Detection, anonymization and restoration facade
 *
 * The anonymizer runs the pattern detector and, when enabled, a model
 * detector over the input; resolves overlaps between their candidates;
 * rewrites the text in one of three modes; and optionally persists the
 * placeholder mapping so the text can be restored later.
 *
 * @example
 * @code
 * pii_anonymizer anonymizer;
 * auto result = anonymizer.anonymize("Email john@example.com",
 *                                    anonymization_mode::pseudonymize);
 * if (result.is_ok()) {
 *     // result.value().anonymized_text == "Email email_1"
 *     auto restored = anonymizer.deanonymize(result.value().anonymized_text,
 *                                            result.value().mapping);
 * }
 * @endcode
 */

#pragma once

#include "piiguard/anonymization/anonymization_mode.hpp"
#include "piiguard/anonymization/deanonymizer.hpp"
#include "piiguard/anonymization/placeholder_mapping.hpp"
#include "piiguard/anonymization/transform_engine.hpp"
#include "piiguard/core/entity.hpp"
#include "piiguard/core/result.hpp"
#include "piiguard/detection/field_labels.hpp"
#include "piiguard/detection/model_detector.hpp"
#include "piiguard/detection/overlap_resolver.hpp"
#include "piiguard/detection/pattern_detector.hpp"
#include "piiguard/storage/mapping_store_interface.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::anonymization {

// ─────────────────────────────────────────────────────
// Options and Results
// ─────────────────────────────────────────────────────

/**
 * @struct anonymizer_options
 * @brief Tuning for one anonymizer instance
 */
struct anonymizer_options {
    /// Overlap ratio above which two candidates are the same detection
    double duplicate_overlap_threshold{detection::default_duplicate_overlap_threshold};

    /// Look-back distance for field-label reclassification
    std::size_t context_window{detection::default_context_window};

    /// Run the model detector alongside the patterns
    bool enable_model_detector{true};

    /// Maximum distinct examples per group in preview()
    std::size_t preview_examples{3};
};

/**
 * @struct detection_report
 * @brief How detection went, independent of what it found
 */
struct detection_report {
    /// Input was not valid UTF-8 and was not scanned
    bool input_rejected{false};

    /// Model detector failed; results come from patterns only
    bool degraded{false};

    /// Failure reported by the model detector when degraded
    std::optional<error_info> model_status;

    std::size_t pattern_candidates{0};
    std::size_t model_candidates{0};
};

/**
 * @struct detection_result
 * @brief Resolved entities in text order plus the detection report
 */
struct detection_result {
    std::vector<core::resolved_entity> entities;
    detection_report report;
};

/**
 * @struct anonymize_result
 * @brief Output of one anonymization call
 */
struct anonymize_result {
    std::string anonymized_text;

    /// Label to original value; empty unless mode is pseudonymize
    placeholder_mapping mapping;

    std::map<core::entity_type, std::size_t> entity_counts;
    std::vector<substitution> substitutions;
    detection_report report;
};

/**
 * @struct preview_group
 * @brief Detections of one entity type
 */
struct preview_group {
    core::entity_type type{core::entity_type::generic};
    std::string label;
    std::size_t count{0};

    /// Distinct detected texts, in order of first appearance
    std::vector<std::string> examples;
};

/**
 * @struct preview_result
 * @brief What anonymize() would replace, grouped for display
 */
struct preview_result {
    std::vector<preview_group> groups;
    std::size_t total{0};
    detection_report report;
};

// ─────────────────────────────────────────────────────
// Anonymizer
// ─────────────────────────────────────────────────────

/**
 * @class pii_anonymizer
 * @brief Stateless facade over detection and transformation
 *
 * Every call is independent: labels restart at _1 and the label cache is
 * dropped when the call returns.
 *
 * Thread Safety: All const methods may be called concurrently, provided the
 * model detector's detect() is itself safe to call concurrently.
 */
class pii_anonymizer {
public:
    /**
     * @brief Construct an anonymizer
     *
     * @param options Tuning options
     * @param model Model detector; when null and the model detector is
     *              enabled, the built-in gazetteer tagger is used
     */
    explicit pii_anonymizer(anonymizer_options options = {},
                            std::shared_ptr<detection::model_detector> model = nullptr);

    /**
     * @brief Detect and resolve entities without rewriting the text
     *
     * Blank input yields no entities. Input that is not valid UTF-8 yields
     * no entities and sets report.input_rejected.
     */
    [[nodiscard]] auto detect(std::string_view text) const -> detection_result;

    /**
     * @brief Detect entities and rewrite them
     * @return Result, or an error if the transform rejects the entity set
     */
    [[nodiscard]] auto anonymize(std::string_view text, anonymization_mode mode) const
        -> Result<anonymize_result>;

    /**
     * @brief Anonymize and persist the mapping under a store key
     *
     * A non-empty pseudonymize mapping replaces any record under the key.
     * Mask and replace never write to the store.
     */
    [[nodiscard]] auto anonymize_and_store(std::string_view text,
                                           anonymization_mode mode,
                                           storage::mapping_store_interface& store,
                                           std::string_view key) const
        -> Result<anonymize_result>;

    /**
     * @brief Replace mapping labels in the text with their original values
     */
    [[nodiscard]] auto deanonymize(std::string_view text,
                                   const placeholder_mapping& mapping) const
        -> deanonymize_result;

    /**
     * @brief Restore text with a mapping loaded from the store
     * @return Restored text, or mapping_not_found / mapping_corrupt
     */
    [[nodiscard]] auto deanonymize_from_store(std::string_view text,
                                              storage::mapping_store_interface& store,
                                              std::string_view key) const
        -> Result<deanonymize_result>;

    /**
     * @brief Group detections by entity type for display
     */
    [[nodiscard]] auto preview(std::string_view text) const -> preview_result;

    /**
     * @brief Count detections per human-readable type label
     */
    [[nodiscard]] auto detection_stats(std::string_view text) const
        -> std::map<std::string, std::size_t>;

    [[nodiscard]] auto options() const noexcept -> const anonymizer_options& {
        return options_;
    }

    /// Name of the active model detector, empty when disabled
    [[nodiscard]] auto model_name() const -> std::string;

private:
    [[nodiscard]] auto run_model(std::string_view text, detection_report& report) const
        -> std::vector<core::candidate>;

    anonymizer_options options_;
    detection::pattern_detector patterns_;
    detection::overlap_resolver resolver_;
    std::shared_ptr<detection::model_detector> model_;
    transform_engine engine_;
    deanonymizer restorer_;
};

} // namespace piiguard::anonymization
