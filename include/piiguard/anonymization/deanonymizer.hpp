/**
 * @file deanonymizer.hpp
 * @brief Restores pseudonymised text from its placeholder mapping
 *
 * The text is scanned once from left to right. At each position the
 * longest label that matches literally is replaced by its original value,
 * so "name_10" is never read as "name_1" followed by "0". Labels are found
 * even when glued to surrounding text ("USamount_1", "name_1_old").
 * Restored values are not rescanned, and labels missing from the mapping
 * are left as they are.
 */

#pragma once

#include "piiguard/anonymization/placeholder_mapping.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace piiguard::anonymization {

/**
 * @struct deanonymize_result
 * @brief Restored text and how many labels were replaced
 */
struct deanonymize_result {
    std::string restored_text;
    std::size_t substitutions{0};
};

/**
 * @class deanonymizer
 * @brief Single-pass, longest-label-first restorer
 */
class deanonymizer {
public:
    [[nodiscard]] auto restore(std::string_view text, const placeholder_mapping& mapping) const
        -> deanonymize_result;
};

} // namespace piiguard::anonymization
