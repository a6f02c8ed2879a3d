/**
 * @file pattern_detector.hpp
 * @brief Rule-based PII detector
 *
 * The pattern detector evaluates an ordered list of regular-expression
 * rules. Rules run in a fixed global priority and every accepted match
 * claims its region of the text; a later match that overlaps a claimed
 * region is skipped. Specific rules (form fields, full street addresses)
 * therefore win over generic fallbacks (bare five-digit numbers).
 *
 * @example
 * @code
 * pattern_detector detector;
 * auto candidates = detector.detect("Account Number: 9876543210");
 * // candidates[0].type == entity_type::account_number
 * @endcode
 */

#pragma once

#include "piiguard/core/entity.hpp"
#include "piiguard/detection/field_labels.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::detection {

/**
 * @enum match_filter
 * @brief Post-processing applied to a raw regex match
 */
enum class match_filter {
    none,
    /// Drop trailing sentence punctuation from URLs
    trailing_punctuation,
    /// Drop leading salutations and sentence starters
    leading_stopwords,
    /// Stop-word trimming plus rejection of calendar and place words
    person_sequence
};

/**
 * @struct pattern_rule
 * @brief One detection rule
 */
struct pattern_rule {
    std::string name;
    core::entity_type type;
    std::regex expression;

    /// Capture group holding the value; 0 means the whole match
    int value_group{0};

    /// Require non-identifier characters on both sides of the value
    bool numeric_boundary{false};

    match_filter filter{match_filter::none};

    /// Minimum number of words after filtering
    std::size_t min_words{0};
};

/**
 * @struct pattern_detector_options
 * @brief Tuning knobs for the pattern detector
 */
struct pattern_detector_options {
    /// Look-back distance for field-label reclassification
    std::size_t context_window{default_context_window};
};

/**
 * @class pattern_detector
 * @brief Ordered regex rules with region claiming and field-label context
 *
 * Thread Safety: detect() is const and may be called concurrently.
 */
class pattern_detector {
public:
    explicit pattern_detector(pattern_detector_options options = {});

    /**
     * @brief Scan text and return validated candidates
     *
     * Candidates are returned in rule order, not text order, and never
     * overlap each other. A match directly followed by a digit is dropped.
     * Whitespace or non-whitespace runs longer than core::max_scan_run
     * bytes are skipped.
     */
    [[nodiscard]] auto detect(std::string_view text) const -> std::vector<core::candidate>;

    [[nodiscard]] auto rules() const noexcept -> const std::vector<pattern_rule>& {
        return rules_;
    }

    [[nodiscard]] auto options() const noexcept -> const pattern_detector_options& {
        return options_;
    }

    /// The built-in rule set, in priority order
    [[nodiscard]] static auto default_rules() -> std::vector<pattern_rule>;

    /// Entity types whose value may be re-typed by a preceding field label
    [[nodiscard]] static auto is_context_sensitive(core::entity_type type) noexcept -> bool;

private:
    [[nodiscard]] auto classify(std::string_view text,
                                const core::span& location,
                                core::entity_type type) const -> std::optional<core::entity_type>;

    pattern_detector_options options_;
    std::vector<pattern_rule> rules_;
};

} // namespace piiguard::detection
