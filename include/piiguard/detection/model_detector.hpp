/**
 * @file model_detector.hpp
 * @brief Abstract interface for statistical or lexicon-based entity taggers
 *
 * A model detector returns coarse NER categories ("PERSON", "GPE", "ORG")
 * over byte spans of the input. The category table maps them onto
 * piiguard entity types; categories without a mapping are discarded.
 * Model output is validated like pattern output and gets no special
 * priority.
 */

#pragma once

#include "piiguard/core/entity.hpp"
#include "piiguard/core/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::detection {

/**
 * @struct model_span
 * @brief One tagged span reported by a model
 */
struct model_span {
    core::span location;
    std::string category;
};

/**
 * @brief Map a coarse model category to an entity type
 * @param category Category name such as "PERSON" or "GPE"
 * @return Mapped type, or nullopt for categories piiguard does not track
 */
[[nodiscard]] auto entity_type_from_category(std::string_view category)
    -> std::optional<core::entity_type>;

/**
 * @class model_detector
 * @brief Abstract tagger consumed by the anonymizer
 *
 * Implementations may call an external service. Failures are reported
 * through the Result (or by throwing a std::exception); the anonymizer
 * then degrades to pattern-only detection and flags the degradation.
 */
class model_detector {
public:
    virtual ~model_detector() = default;

    /**
     * @brief Tag entities in a text
     * @param text UTF-8 input
     * @return Spans with their model categories, or an error
     */
    [[nodiscard]] virtual auto detect(std::string_view text)
        -> Result<std::vector<model_span>> = 0;

    /// Identifier used in logs and detection reports
    [[nodiscard]] virtual auto name() const -> std::string = 0;

protected:
    model_detector() = default;
    model_detector(const model_detector&) = default;
    model_detector& operator=(const model_detector&) = default;
};

/**
 * @brief Convert model output into validated candidates
 *
 * Spans outside the text, spans directly followed by a digit, unmapped
 * categories and values failing their validator are dropped.
 */
[[nodiscard]] auto to_candidates(std::string_view text, const std::vector<model_span>& spans)
    -> std::vector<core::candidate>;

} // namespace piiguard::detection
