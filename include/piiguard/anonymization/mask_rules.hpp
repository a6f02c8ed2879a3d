/**
 * @file mask_rules.hpp
 * @brief Type-specific partial-reveal rules used by mask mode
 *
 * Examples:
 * - email: "john.doe@example.com" -> "jo******@example.com"
 * - credit card: "4532 1234 5678 9012" -> "4532-XXXX-XXXX-9012"
 * - phone: "+1-234-567-8901" -> "+1-234-XXX-XXX1"
 * - person name: "John Smith" -> "J*** S****"
 *
 * Types without a dedicated rule fall back to keeping the first and last
 * character. Masking never fails.
 */

#pragma once

#include "piiguard/core/entity_type.hpp"

#include <string>
#include <string_view>

namespace piiguard::anonymization {

/**
 * @brief Mask a value according to its entity type
 */
[[nodiscard]] auto mask_value(core::entity_type type, std::string_view text) -> std::string;

/**
 * @brief Bracketed type label used by replace mode ("[Person Name]")
 */
[[nodiscard]] auto replacement_label(core::entity_type type) -> std::string;

} // namespace piiguard::anonymization
