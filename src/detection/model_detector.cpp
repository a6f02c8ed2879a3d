/**
 * @file model_detector.cpp
 * @brief Category table and candidate conversion for model detectors
 */

#include "piiguard/detection/model_detector.hpp"

#include "piiguard/core/text_utils.hpp"
#include "piiguard/detection/validators.hpp"

namespace piiguard::detection {

using core::entity_type;

auto entity_type_from_category(std::string_view category) -> std::optional<entity_type> {
    if (category == "PERSON" || category == "PER") return entity_type::person_name;
    if (category == "GPE" || category == "LOC") return entity_type::location;
    if (category == "ORG") return entity_type::organization;
    if (category == "DATE" || category == "TIME") return entity_type::date_time;
    if (category == "MONEY") return entity_type::financial_amount;
    if (category == "FAC") return entity_type::facility;
    if (category == "NORP") return entity_type::nationality_group;
    if (category == "EVENT") return entity_type::event;
    if (category == "LAW") return entity_type::legal_document;
    return std::nullopt;
}

auto to_candidates(std::string_view text, const std::vector<model_span>& spans)
    -> std::vector<core::candidate> {
    std::vector<core::candidate> candidates;
    candidates.reserve(spans.size());

    for (const auto& tagged : spans) {
        if (!tagged.location.valid_for(text.size()) ||
            core::is_digit_at(text, tagged.location.end)) {
            continue;
        }
        const auto type = entity_type_from_category(tagged.category);
        if (!type) {
            continue;
        }
        const auto value = text.substr(tagged.location.start, tagged.location.length());
        if (!validate(*type, value)) {
            continue;
        }
        candidates.push_back(core::candidate{tagged.location, *type, std::string(value),
                                             core::detector_source::model, tagged.category});
    }
    return candidates;
}

} // namespace piiguard::detection
