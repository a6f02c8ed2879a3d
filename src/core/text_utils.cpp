/**
 * @file text_utils.cpp
 * @brief Implementation of byte-level text helpers
 */

#include "piiguard/core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>

namespace piiguard::core {

namespace {

auto is_space(char c) noexcept -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto is_continuation(unsigned char c) noexcept -> bool {
    return (c & 0xC0U) == 0x80U;
}

} // namespace

auto is_valid_utf8(std::string_view text) noexcept -> bool {
    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t size = text.size();
    std::size_t i = 0;

    while (i < size) {
        const unsigned char lead = bytes[i];
        if (lead < 0x80U) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if ((lead & 0xE0U) == 0xC0U) {
            extra = 1;
            code_point = lead & 0x1FU;
        } else if ((lead & 0xF0U) == 0xE0U) {
            extra = 2;
            code_point = lead & 0x0FU;
        } else if ((lead & 0xF8U) == 0xF0U) {
            extra = 3;
            code_point = lead & 0x07U;
        } else {
            return false;
        }

        if (i + extra >= size) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if (!is_continuation(bytes[i + k])) {
                return false;
            }
            code_point = (code_point << 6) | (bytes[i + k] & 0x3FU);
        }

        // Overlong forms, UTF-16 surrogates and out-of-range values
        if ((extra == 1 && code_point < 0x80U) ||
            (extra == 2 && code_point < 0x800U) ||
            (extra == 3 && code_point < 0x10000U) ||
            (code_point >= 0xD800U && code_point <= 0xDFFFU) ||
            code_point > 0x10FFFFU) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

auto is_blank(std::string_view text) noexcept -> bool {
    for (char c : text) {
        if (!is_space(c)) return false;
    }
    return true;
}

auto trim(std::string_view text) noexcept -> std::string_view {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

auto to_lower(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        result.push_back(uc < 0x80U ? static_cast<char>(std::tolower(uc)) : c);
    }
    return result;
}

auto is_identifier_char(char c) noexcept -> bool {
    const auto uc = static_cast<unsigned char>(c);
    return uc < 0x80U && (std::isalnum(uc) != 0 || c == '_');
}

auto digits_only(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c >= '0' && c <= '9') result.push_back(c);
    }
    return result;
}

auto count_digits(std::string_view text) noexcept -> std::size_t {
    std::size_t count = 0;
    for (char c : text) {
        if (c >= '0' && c <= '9') ++count;
    }
    return count;
}

auto is_digit_at(std::string_view text, std::size_t pos) noexcept -> bool {
    return pos < text.size() && text[pos] >= '0' && text[pos] <= '9';
}

auto shield_long_runs(std::string_view text, std::size_t max_run) -> std::string {
    std::string shielded(text);
    std::size_t run_start = 0;
    for (std::size_t i = 1; i <= shielded.size(); ++i) {
        const bool run_ends =
            i == shielded.size() || is_space(text[i]) != is_space(text[run_start]);
        if (!run_ends) continue;
        if (i - run_start > max_run) {
            std::fill(shielded.begin() + static_cast<std::ptrdiff_t>(run_start),
                      shielded.begin() + static_cast<std::ptrdiff_t>(i), '\n');
        }
        run_start = i;
    }
    return shielded;
}

auto line_start(std::string_view text, std::size_t pos) noexcept -> std::size_t {
    if (pos == 0 || text.empty()) return std::string_view::npos;
    const auto bounded = pos > text.size() ? text.size() : pos;
    return text.rfind('\n', bounded - 1);
}

} // namespace piiguard::core
