/**
 * @file text_utils.hpp
 * @brief Byte-level text helpers shared by detectors and transforms
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace piiguard::core {

/**
 * @brief Check that a byte sequence is well-formed UTF-8
 *
 * Rejects overlong encodings, surrogate code points and code points above
 * U+10FFFF.
 */
[[nodiscard]] auto is_valid_utf8(std::string_view text) noexcept -> bool;

/// True if the text is empty or consists only of ASCII whitespace
[[nodiscard]] auto is_blank(std::string_view text) noexcept -> bool;

/// Strip leading and trailing ASCII whitespace
[[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view;

/// ASCII lower-casing; non-ASCII bytes are copied unchanged
[[nodiscard]] auto to_lower(std::string_view text) -> std::string;

/// Characters that continue an identifier: [A-Za-z0-9_]
[[nodiscard]] auto is_identifier_char(char c) noexcept -> bool;

/// Keep only ASCII digits
[[nodiscard]] auto digits_only(std::string_view text) -> std::string;

[[nodiscard]] auto count_digits(std::string_view text) noexcept -> std::size_t;

/// True if @p pos is inside @p text and holds an ASCII digit
[[nodiscard]] auto is_digit_at(std::string_view text, std::size_t pos) noexcept -> bool;

/// Longest run of whitespace or non-whitespace bytes handed to a regex
inline constexpr std::size_t max_scan_run = 512;

/**
 * @brief Copy of @p text safe for std::regex scanning
 *
 * std::regex recurses once per character while a loop keeps matching, so a
 * single long token (base64, minified data) can exhaust the stack. Every
 * run of whitespace or non-whitespace bytes longer than @p max_run is
 * overwritten with '\n'. No rule matches a newline, byte offsets are
 * unchanged, and the overwritten runs yield no matches.
 */
[[nodiscard]] auto shield_long_runs(std::string_view text,
                                    std::size_t max_run = max_scan_run) -> std::string;

/// Position of the last '\n' before @p pos, or npos
[[nodiscard]] auto line_start(std::string_view text, std::size_t pos) noexcept
    -> std::size_t;

} // namespace piiguard::core
