/**
 * @file field_labels.hpp
 * @brief Form-style field labels ("Account Number:", "Phone Number:")
 *
 * Field labels serve two purposes:
 * - a span whose text is a field label is never classified as a person name
 * - a label shortly before an ambiguous number decides that number's type
 */

#pragma once

#include "piiguard/core/entity_type.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace piiguard::detection {

/// Default look-back distance, in bytes, for context reclassification
inline constexpr std::size_t default_context_window = 40;

/**
 * @struct field_label
 * @brief A lower-case label phrase and the entity type it announces
 */
struct field_label {
    std::string_view phrase;
    core::entity_type type;
};

/**
 * @brief Check whether text is, or contains, a known field label
 *
 * Matching is case-insensitive and ignores a trailing ':' or '#'.
 * Multi-word labels are also found inside longer text ("Contact Phone
 * Number"); single-word labels only match the whole text.
 */
[[nodiscard]] auto is_field_label(std::string_view text) -> bool;

/**
 * @brief Find the field label nearest before a position on the same line
 *
 * @param text Full source text
 * @param position Start offset of the value being classified
 * @param window Maximum number of bytes to look back
 * @return Entity type announced by the nearest label, or nullopt
 */
[[nodiscard]] auto find_context_label(std::string_view text,
                                      std::size_t position,
                                      std::size_t window = default_context_window)
    -> std::optional<core::entity_type>;

} // namespace piiguard::detection
