/**
 * @file mask_rules.cpp
 * @brief Implementation of mask-mode rules
 */

#include "piiguard/anonymization/mask_rules.hpp"

#include "piiguard/core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace piiguard::anonymization {

using core::entity_type;

namespace {

auto is_digit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }

auto is_space(char c) noexcept -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Byte length of the UTF-8 sequence starting with @p lead
auto sequence_length(unsigned char lead) noexcept -> std::size_t {
    if (lead < 0x80U) return 1;
    if ((lead & 0xE0U) == 0xC0U) return 2;
    if ((lead & 0xF0U) == 0xE0U) return 3;
    if ((lead & 0xF8U) == 0xF0U) return 4;
    return 1;
}

auto split_code_points(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> points;
    std::size_t i = 0;
    while (i < text.size()) {
        auto length = sequence_length(static_cast<unsigned char>(text[i]));
        if (i + length > text.size()) length = text.size() - i;
        points.push_back(text.substr(i, length));
        i += length;
    }
    return points;
}

auto mask_generic(std::string_view text) -> std::string {
    const auto points = split_code_points(text);
    if (points.size() <= 2) {
        return std::string(points.size(), '*');
    }
    std::string masked(points.front());
    masked.append(points.size() - 2, '*');
    masked.append(points.back());
    return masked;
}

/// First character of every word kept, the rest replaced by '*'
auto mask_initials(std::string_view text, bool keep_numbers) -> std::string {
    std::string masked;
    masked.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (is_space(text[i])) {
            masked.push_back(text[i++]);
            continue;
        }
        std::size_t end = i;
        while (end < text.size() && !is_space(text[end])) ++end;
        const auto word = text.substr(i, end - i);

        if (keep_numbers && core::count_digits(word) == word.size()) {
            masked.append(word);
        } else {
            const auto points = split_code_points(word);
            masked.append(points.front());
            for (std::size_t k = 1; k < points.size(); ++k) {
                const bool punct = points[k].size() == 1 &&
                                   std::ispunct(static_cast<unsigned char>(points[k][0])) != 0;
                masked.append(punct ? points[k] : std::string_view("*"));
            }
        }
        i = end;
    }
    return masked;
}

auto mask_email(std::string_view text) -> std::string {
    const auto at = text.rfind('@');
    if (at == std::string_view::npos || at == 0) {
        return mask_generic(text);
    }
    const auto local = text.substr(0, at);
    const std::size_t keep = local.size() > 3 ? 2 : 1;

    std::string masked(local.substr(0, keep));
    masked.append(local.size() - keep, '*');
    masked.append(text.substr(at));
    return masked;
}

auto mask_credit_card(std::string_view text) -> std::string {
    const auto digits = core::digits_only(text);
    if (digits.size() < 8) {
        return mask_generic(text);
    }
    return digits.substr(0, 4) + "-XXXX-XXXX-" + digits.substr(digits.size() - 4);
}

auto mask_phone(std::string_view text) -> std::string {
    std::vector<std::size_t> digit_positions;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_digit(text[i])) digit_positions.push_back(i);
    }
    const auto total = digit_positions.size();
    if (total < 4) {
        return mask_generic(text);
    }

    std::size_t country = 0;
    if (!text.empty() && text.front() == '+') {
        std::size_t run = 0;
        while (1 + run < text.size() && is_digit(text[1 + run])) ++run;
        if (run <= 3) {
            country = run;
        } else {
            country = total > 10 ? std::min<std::size_t>(total - 10, 3) : 1;
        }
    } else if (total == 11 && text[digit_positions.front()] == '1') {
        country = 1;
    }

    const std::size_t keep_prefix = std::min(total, country + 3);
    std::string masked(text);
    for (std::size_t k = keep_prefix; k + 1 < total; ++k) {
        masked[digit_positions[k]] = 'X';
    }
    return masked;
}

auto mask_ssn(std::string_view text) -> std::string {
    const auto digits = core::digits_only(text);
    if (digits.size() < 3) {
        return mask_generic(text);
    }
    return digits.substr(0, 3) + "-XX-XXXX";
}

auto mask_zip_code(std::string_view text) -> std::string {
    const auto digits = core::digits_only(text);
    if (digits.size() < 5) {
        return mask_generic(text);
    }
    std::string masked = digits.substr(0, 3) + "**";
    if (digits.size() > 5) {
        masked += "-****";
    }
    return masked;
}

/// Keep the last four alphanumerics, separators unchanged
auto mask_keep_last_four(std::string_view text) -> std::string {
    std::size_t alnum_total = 0;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) ++alnum_total;
    }
    if (alnum_total <= 4) {
        return mask_generic(text);
    }

    std::string masked(text);
    std::size_t seen = 0;
    for (auto& c : masked) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0) continue;
        if (seen++ < alnum_total - 4) c = '*';
    }
    return masked;
}

auto mask_account_id(std::string_view text) -> std::string {
    std::size_t prefix = 0;
    while (prefix < text.size() && std::isalpha(static_cast<unsigned char>(text[prefix])) != 0) {
        ++prefix;
    }
    if (prefix == 0 || prefix + 1 >= text.size()) {
        return mask_generic(text);
    }

    std::string masked(text);
    for (std::size_t i = prefix; i + 1 < masked.size(); ++i) {
        if (is_digit(masked[i])) masked[i] = '*';
    }
    return masked;
}

auto mask_ip_address(std::string_view text) -> std::string {
    const auto dot = text.find('.');
    if (dot == std::string_view::npos) {
        return mask_generic(text);
    }
    return std::string(text.substr(0, dot)) + ".XXX.XXX.XXX";
}

auto mask_url(std::string_view text) -> std::string {
    const auto scheme = text.find("://");
    const auto host_start = scheme == std::string_view::npos ? 0 : scheme + 3;
    const auto path = text.find_first_of("/?#", host_start);
    if (path == std::string_view::npos) {
        return std::string(text);
    }
    return std::string(text.substr(0, path)) + "/***";
}

auto mask_digits(std::string_view text) -> std::string {
    std::string masked(text);
    for (auto& c : masked) {
        if (is_digit(c)) c = 'X';
    }
    return masked;
}

} // namespace

auto mask_value(entity_type type, std::string_view text) -> std::string {
    if (text.empty()) {
        return {};
    }

    switch (type) {
        case entity_type::email:
            return mask_email(text);
        case entity_type::credit_card:
            return mask_credit_card(text);
        case entity_type::phone:
            return mask_phone(text);
        case entity_type::ssn:
            return mask_ssn(text);
        case entity_type::zip_code:
            return mask_zip_code(text);
        case entity_type::account_number:
        case entity_type::bank_account:
        case entity_type::employee_id:
        case entity_type::application_number:
        case entity_type::medical_id:
        case entity_type::passport:
        case entity_type::driver_license:
            return mask_keep_last_four(text);
        case entity_type::account_id:
            return mask_account_id(text);
        case entity_type::person_name:
        case entity_type::organization:
        case entity_type::location:
        case entity_type::facility:
        case entity_type::event:
        case entity_type::nationality_group:
        case entity_type::legal_document:
            return mask_initials(text, false);
        case entity_type::address:
            return mask_initials(text, true);
        case entity_type::ip_address:
            return mask_ip_address(text);
        case entity_type::url:
            return mask_url(text);
        case entity_type::financial_amount:
        case entity_type::date_time:
            return mask_digits(text);
        case entity_type::generic:
            break;
    }
    return mask_generic(text);
}

auto replacement_label(entity_type type) -> std::string {
    std::string label;
    label.reserve(core::human_label(type).size() + 2);
    label.push_back('[');
    label.append(core::human_label(type));
    label.push_back(']');
    return label;
}

} // namespace piiguard::anonymization
