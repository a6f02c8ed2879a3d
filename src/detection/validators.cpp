/**
 * @file validators.cpp
 * @brief Implementation of per-type candidate validators
 */

#include "piiguard/detection/validators.hpp"

#include "piiguard/core/text_utils.hpp"
#include "piiguard/detection/field_labels.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <vector>

namespace piiguard::detection {

using core::entity_type;

namespace {

auto is_digit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }

auto is_alpha(char c) noexcept -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

auto is_upper(char c) noexcept -> bool {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

auto count_alnum(std::string_view text) noexcept -> std::size_t {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }));
}

auto has_letter(std::string_view text) noexcept -> bool {
    return std::any_of(text.begin(), text.end(), [](char c) { return is_alpha(c); });
}

auto split_words(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) ++i;
        const std::size_t begin = i;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) ++i;
        if (i > begin) words.push_back(text.substr(begin, i - begin));
    }
    return words;
}

auto strip_trailing_punctuation(std::string_view word) -> std::string_view {
    while (!word.empty() && (word.back() == '.' || word.back() == ',')) {
        word.remove_suffix(1);
    }
    return word;
}

auto in_list(std::string_view word, std::initializer_list<std::string_view> list) -> bool {
    const auto lower = core::to_lower(word);
    return std::find(list.begin(), list.end(), lower) != list.end();
}

auto is_title(std::string_view word) -> bool {
    return in_list(strip_trailing_punctuation(word),
                   {"mr", "mrs", "ms", "miss", "dr", "prof", "sir", "madam"});
}

auto is_organization_term(std::string_view word) -> bool {
    return in_list(strip_trailing_punctuation(word),
                   {"inc", "llc", "ltd", "corp", "corporation", "company", "co",
                    "group", "holdings", "gmbh", "plc", "llp", "bank", "hospital",
                    "university", "college", "institute", "clinic", "foundation",
                    "agency", "department", "association"});
}

auto is_identifier_word(std::string_view word) -> bool {
    return in_list(strip_trailing_punctuation(word),
                   {"number", "no", "id", "code", "account", "employee",
                    "application", "phone", "email", "address"});
}

auto max_digit_run(std::string_view text) noexcept -> std::size_t {
    std::size_t best = 0;
    std::size_t run = 0;
    for (char c : text) {
        run = is_digit(c) ? run + 1 : 0;
        best = std::max(best, run);
    }
    return best;
}

// ─────────────────────────────────────────────────────
// Type-specific validators
// ─────────────────────────────────────────────────────

auto is_valid_url(std::string_view text) -> bool {
    const auto lower = core::to_lower(text);
    std::string_view rest = lower;
    if (rest.starts_with("https://")) {
        rest.remove_prefix(8);
    } else if (rest.starts_with("http://")) {
        rest.remove_prefix(7);
    } else if (!rest.starts_with("www.")) {
        return false;
    }
    const auto host = rest.substr(0, rest.find_first_of("/:?#"));
    const auto dot = host.find('.');
    return dot != std::string_view::npos && dot > 0 && dot + 1 < host.size();
}

auto is_valid_zip_code(std::string_view text) -> bool {
    static const std::regex pattern(R"(\d{5}(?:-\d{4})?)");
    return std::regex_match(text.begin(), text.end(), pattern);
}

auto is_valid_account_digits(std::string_view text) -> bool {
    const auto digits = core::count_digits(text);
    if (digits < 8 || digits > 17) return false;
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return is_digit(c) || c == '-' || c == ' '; });
}

auto is_valid_account_id(std::string_view text) -> bool {
    static const std::regex pattern(R"([A-Z]{2,6}[-.\s#:]*\d{4,}(?:-\d+)*)");
    return text.size() >= 5 && std::regex_match(text.begin(), text.end(), pattern);
}

auto is_valid_reference_id(std::string_view text) -> bool {
    if (text.size() < 3 || text.size() > 15) return false;
    if (core::count_digits(text) == 0) return false;
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
    });
}

auto is_valid_passport(std::string_view text) -> bool {
    return count_alnum(text) >= 6 && core::count_digits(text) > 0;
}

auto is_valid_driver_license(std::string_view text) -> bool {
    return count_alnum(text) >= 7 && core::count_digits(text) >= 6;
}

auto is_valid_medical_id(std::string_view text) -> bool {
    return core::count_digits(text) >= 6;
}

auto is_valid_date_time(std::string_view text) -> bool {
    static const std::regex zip_shape(R"(\d{5}(?:-\d{4})?)");
    static const std::regex account_id_shape(R"([A-Z]{2,}[-.\s#:]*\d{4,}.*)");

    if (std::regex_match(text.begin(), text.end(), zip_shape)) return false;
    if (std::regex_match(text.begin(), text.end(), account_id_shape)) return false;

    const bool all_digits = std::all_of(text.begin(), text.end(), is_digit);
    if (all_digits && (text.size() == 5 || text.size() == 7 || text.size() > 8)) {
        return false;
    }

    const auto dashes = std::count(text.begin(), text.end(), '-');
    if (dashes >= 2 && has_letter(text) && core::count_digits(text) > 0) {
        return false;
    }
    return text.size() >= 3;
}

auto is_valid_address(std::string_view text) -> bool {
    static const std::regex counted_words(R"(\d+\s+words?)", std::regex::icase);
    if (text.size() < 5 || !has_letter(text)) return false;
    return !std::regex_match(text.begin(), text.end(), counted_words);
}

auto is_valid_proper_noun(std::string_view text) -> bool {
    return text.size() >= 2 && has_letter(text) && !is_field_label(text);
}

} // namespace

// ─────────────────────────────────────────────────────
// Public validators
// ─────────────────────────────────────────────────────

auto is_valid_email(std::string_view text) -> bool {
    if (std::count(text.begin(), text.end(), '@') != 1) return false;
    if (std::any_of(text.begin(), text.end(),
                    [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; })) {
        return false;
    }

    const auto at = text.find('@');
    const auto local = text.substr(0, at);
    const auto domain = text.substr(at + 1);
    if (local.empty() || domain.empty()) return false;
    if (domain.find('.') == std::string_view::npos) return false;

    // No empty label between dots, including leading or trailing dots
    std::size_t begin = 0;
    while (begin <= domain.size()) {
        const auto dot = domain.find('.', begin);
        const auto end = dot == std::string_view::npos ? domain.size() : dot;
        if (end == begin) return false;
        if (dot == std::string_view::npos) break;
        begin = dot + 1;
    }
    return true;
}

auto is_valid_phone(std::string_view text) -> bool {
    static const std::regex extension(R"(^(.*?)\s*(?:ext\.?|x)\s*\d{1,6}$)", std::regex::icase);

    std::string body(text);
    std::smatch match;
    if (std::regex_match(body, match, extension)) {
        body = match[1].str();
    }

    bool has_separator = false;
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (is_digit(c)) continue;
        if (c == '+' && i == 0) continue;
        if (c == ' ' || c == '-' || c == '.' || c == '(' || c == ')') {
            has_separator = true;
            continue;
        }
        return false;
    }

    const auto digits = core::count_digits(body);
    if (digits < 7 || digits > 15) return false;
    if (digits < 10 && !has_separator) return false;
    if (max_digit_run(body) >= 13) return false;
    if (digits > 11 && !has_separator) return false;
    return true;
}

auto is_valid_credit_card(std::string_view text) -> bool {
    std::string digits;
    for (char c : text) {
        if (c == ' ' || c == '-') continue;
        if (!is_digit(c)) return false;
        digits.push_back(c);
    }

    const auto length = digits.size();
    if (length < 13 || length > 19) return false;

    switch (digits[0]) {
        case '4':
            return length == 13 || length == 16;
        case '5':
            return digits[1] >= '1' && digits[1] <= '5' && length == 16;
        case '3':
            return length == 14 || length == 15;
        case '6':
            return length == 16;
        default:
            return false;
    }
}

auto is_valid_ssn(std::string_view text) -> bool {
    if (!std::all_of(text.begin(), text.end(),
                     [](char c) { return is_digit(c) || c == '-' || c == ' '; })) {
        return false;
    }
    const auto digits = core::digits_only(text);
    if (digits.size() != 9) return false;
    return digits.substr(0, 3) != "000" && digits.substr(3, 2) != "00" &&
           digits.substr(5, 4) != "0000";
}

auto is_valid_ip_address(std::string_view text) -> bool {
    int octets = 0;
    std::size_t begin = 0;
    while (true) {
        const auto dot = text.find('.', begin);
        const auto part = text.substr(begin, dot == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : dot - begin);
        if (part.empty() || part.size() > 3 || !std::all_of(part.begin(), part.end(), is_digit)) {
            return false;
        }
        if (std::stoi(std::string(part)) > 255) return false;
        ++octets;
        if (dot == std::string_view::npos) break;
        begin = dot + 1;
    }
    return octets == 4;
}

auto is_name_stopword(std::string_view word) -> bool {
    return in_list(strip_trailing_punctuation(word),
                   {"the", "a", "an", "this", "that", "these", "those", "dear", "hello",
                    "hi", "hey", "thanks", "thank", "please", "contact", "call", "from",
                    "to", "for", "and", "or", "with", "my", "our", "your", "his", "her",
                    "their", "is", "was", "are", "on", "in", "at", "by", "of", "regards",
                    "sincerely", "best", "attn", "cc", "re"});
}

auto is_valid_person_name(std::string_view text) -> bool {
    if (is_field_label(text)) return false;

    const auto words = split_words(text);
    if (words.empty()) return false;

    std::size_t name_tokens = 0;
    for (std::size_t i = 0; i < words.size(); ++i) {
        const auto word = words[i];
        if (i == 0 && is_title(word)) continue;
        if (is_organization_term(word) || is_identifier_word(word) || is_name_stopword(word)) {
            return false;
        }
        if (core::count_digits(word) > 0) return false;

        const auto lead = static_cast<unsigned char>(word.front());
        if (lead < 0x80U && !is_upper(word.front())) return false;
        ++name_tokens;
    }
    return name_tokens > 0;
}

auto validate(entity_type type, std::string_view raw_text) -> bool {
    const auto text = core::trim(raw_text);
    if (text.empty() || text.size() > core::max_scan_run) return false;

    switch (type) {
        case entity_type::email:
            return is_valid_email(text);
        case entity_type::phone:
            return is_valid_phone(text);
        case entity_type::credit_card:
            return is_valid_credit_card(text);
        case entity_type::ssn:
            return is_valid_ssn(text);
        case entity_type::ip_address:
            return is_valid_ip_address(text);
        case entity_type::url:
            return is_valid_url(text);
        case entity_type::zip_code:
            return is_valid_zip_code(text);
        case entity_type::account_number:
        case entity_type::bank_account:
            return is_valid_account_digits(text);
        case entity_type::account_id:
            return is_valid_account_id(text);
        case entity_type::employee_id:
        case entity_type::application_number:
            return is_valid_reference_id(text);
        case entity_type::passport:
            return is_valid_passport(text);
        case entity_type::driver_license:
            return is_valid_driver_license(text);
        case entity_type::medical_id:
            return is_valid_medical_id(text);
        case entity_type::date_time:
            return is_valid_date_time(text);
        case entity_type::address:
            return is_valid_address(text);
        case entity_type::person_name:
            return is_valid_person_name(text);
        case entity_type::organization:
        case entity_type::location:
        case entity_type::facility:
        case entity_type::event:
        case entity_type::legal_document:
        case entity_type::nationality_group:
            return is_valid_proper_noun(text);
        case entity_type::financial_amount:
            return core::count_digits(text) > 0;
        case entity_type::generic:
            return text.size() >= 2;
    }
    return false;
}

} // namespace piiguard::detection
