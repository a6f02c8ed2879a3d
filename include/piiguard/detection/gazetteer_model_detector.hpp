/**
 * @file gazetteer_model_detector.hpp
 * @brief Built-in lexicon tagger implementing model_detector
 *
 * The gazetteer tagger recognises known given names, places, organisations,
 * nationalities, calendar expressions, money amounts and facility, event
 * and law names. It stands in for a statistical NER model when none is
 * plugged in and reports the same coarse categories.
 */

#pragma once

#include "piiguard/detection/model_detector.hpp"

#include <regex>
#include <string>
#include <vector>

namespace piiguard::detection {

/**
 * @struct gazetteer
 * @brief Word lists used to build the tagger's expressions
 */
struct gazetteer {
    std::vector<std::string> given_names;
    std::vector<std::string> places;
    std::vector<std::string> organizations;
    std::vector<std::string> nationalities;
    std::vector<std::string> languages;

    /// Lists shipped with piiguard
    [[nodiscard]] static auto defaults() -> gazetteer;
};

/**
 * @class gazetteer_model_detector
 * @brief Regex and word-list tagger
 *
 * Thread Safety: detect() does not modify the detector and may be called
 * concurrently.
 */
class gazetteer_model_detector final : public model_detector {
public:
    explicit gazetteer_model_detector(const gazetteer& lexicon = gazetteer::defaults());

    [[nodiscard]] auto detect(std::string_view text)
        -> Result<std::vector<model_span>> override;

    [[nodiscard]] auto name() const -> std::string override { return "gazetteer"; }

private:
    struct category_rule {
        std::string category;
        std::regex expression;
    };

    std::vector<category_rule> rules_;
};

} // namespace piiguard::detection
