/**
 * @file validators.hpp
 * @brief Per-type plausibility checks applied to every detector candidate
 *
 * Validators are pure and deterministic. A candidate that fails its
 * validator is dropped before overlap resolution; this is normal filtering,
 * not an error.
 */

#pragma once

#include "piiguard/core/entity_type.hpp"

#include <string_view>

namespace piiguard::detection {

/**
 * @brief Check whether raw text is a plausible value of an entity type
 *
 * Surrounding whitespace is ignored. Values longer than core::max_scan_run
 * bytes are rejected.
 *
 * @param type Entity type the candidate was classified as
 * @param text Candidate text as it appears in the source
 * @return true if the candidate should be kept
 */
[[nodiscard]] auto validate(core::entity_type type, std::string_view text) -> bool;

[[nodiscard]] auto is_valid_email(std::string_view text) -> bool;
[[nodiscard]] auto is_valid_phone(std::string_view text) -> bool;
[[nodiscard]] auto is_valid_credit_card(std::string_view text) -> bool;
[[nodiscard]] auto is_valid_ssn(std::string_view text) -> bool;
[[nodiscard]] auto is_valid_ip_address(std::string_view text) -> bool;
[[nodiscard]] auto is_valid_person_name(std::string_view text) -> bool;

/**
 * @brief Words that begin sentences or salutations and are never names
 *
 * Used to trim leading words off title-case sequences ("Dear John Smith").
 */
[[nodiscard]] auto is_name_stopword(std::string_view word) -> bool;

} // namespace piiguard::detection
