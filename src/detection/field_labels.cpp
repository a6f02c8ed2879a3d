/**
 * @file field_labels.cpp
 * @brief Field label table and context lookup
 */

#include "piiguard/detection/field_labels.hpp"

#include "piiguard/core/text_utils.hpp"

#include <string>

namespace piiguard::detection {

using core::entity_type;

namespace {

constexpr field_label label_table[] = {
    {"bank account number", entity_type::bank_account},
    {"bank account", entity_type::bank_account},
    {"routing number", entity_type::bank_account},
    {"account number", entity_type::account_number},
    {"account no", entity_type::account_number},
    {"acct number", entity_type::account_number},
    {"acct no", entity_type::account_number},
    {"employee id", entity_type::employee_id},
    {"employee number", entity_type::employee_id},
    {"employee no", entity_type::employee_id},
    {"application number", entity_type::application_number},
    {"application no", entity_type::application_number},
    {"application id", entity_type::application_number},
    {"phone number", entity_type::phone},
    {"mobile number", entity_type::phone},
    {"contact number", entity_type::phone},
    {"phone", entity_type::phone},
    {"mobile", entity_type::phone},
    {"cell", entity_type::phone},
    {"telephone", entity_type::phone},
    {"tel", entity_type::phone},
    {"social security number", entity_type::ssn},
    {"social security", entity_type::ssn},
    {"ssn", entity_type::ssn},
    {"zip code", entity_type::zip_code},
    {"postal code", entity_type::zip_code},
    {"zip", entity_type::zip_code},
    {"passport number", entity_type::passport},
    {"passport no", entity_type::passport},
    {"passport", entity_type::passport},
    {"driver license", entity_type::driver_license},
    {"driver's license", entity_type::driver_license},
    {"drivers license", entity_type::driver_license},
    {"license number", entity_type::driver_license},
    {"dl", entity_type::driver_license},
    {"medical record number", entity_type::medical_id},
    {"medical record", entity_type::medical_id},
    {"patient id", entity_type::medical_id},
    {"mrn", entity_type::medical_id},
    {"email address", entity_type::email},
    {"email", entity_type::email},
    {"date of birth", entity_type::date_time},
    {"birth date", entity_type::date_time},
    {"dob", entity_type::date_time},
    {"home address", entity_type::address},
    {"mailing address", entity_type::address},
    {"street address", entity_type::address},
    {"address", entity_type::address},
    {"full name", entity_type::person_name},
    {"first name", entity_type::person_name},
    {"last name", entity_type::person_name},
    {"credit card number", entity_type::credit_card},
    {"card number", entity_type::credit_card},
};

/// Lower-case, collapse whitespace runs, drop a trailing ':' or '#'
auto normalize(std::string_view text) -> std::string {
    auto trimmed = core::trim(text);
    while (!trimmed.empty() && (trimmed.back() == ':' || trimmed.back() == '#')) {
        trimmed.remove_suffix(1);
        trimmed = core::trim(trimmed);
    }

    std::string result;
    result.reserve(trimmed.size());
    bool pending_space = false;
    for (char c : core::to_lower(trimmed)) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            pending_space = true;
            continue;
        }
        if (pending_space && !result.empty()) {
            result.push_back(' ');
        }
        pending_space = false;
        result.push_back(c);
    }
    return result;
}

auto is_word_boundary(std::string_view text, std::size_t pos, std::size_t len) -> bool {
    const bool left_ok = pos == 0 || !core::is_identifier_char(text[pos - 1]);
    const std::size_t after = pos + len;
    const bool right_ok = after >= text.size() || !core::is_identifier_char(text[after]);
    return left_ok && right_ok;
}

} // namespace

auto is_field_label(std::string_view text) -> bool {
    const auto normalized = normalize(text);
    if (normalized.empty()) {
        return false;
    }
    if (normalized == "name") {
        return true;
    }

    for (const auto& label : label_table) {
        if (normalized == label.phrase) {
            return true;
        }
        if (label.phrase.find(' ') == std::string_view::npos) {
            continue;
        }
        std::size_t pos = normalized.find(label.phrase);
        while (pos != std::string::npos) {
            if (is_word_boundary(normalized, pos, label.phrase.size())) {
                return true;
            }
            pos = normalized.find(label.phrase, pos + 1);
        }
    }
    return false;
}

auto find_context_label(std::string_view text, std::size_t position, std::size_t window)
    -> std::optional<entity_type> {
    if (position == 0 || position > text.size() || window == 0) {
        return std::nullopt;
    }

    std::size_t begin = position > window ? position - window : 0;
    const auto newline = core::line_start(text, position);
    if (newline != std::string_view::npos && newline + 1 > begin) {
        begin = newline + 1;
    }
    if (begin >= position) {
        return std::nullopt;
    }

    const auto context = core::to_lower(text.substr(begin, position - begin));

    std::optional<entity_type> best;
    std::size_t best_end = 0;
    std::size_t best_length = 0;
    for (const auto& label : label_table) {
        std::size_t pos = context.rfind(label.phrase);
        while (pos != std::string::npos) {
            if (is_word_boundary(context, pos, label.phrase.size())) {
                const std::size_t end = pos + label.phrase.size();
                if (!best || end > best_end ||
                    (end == best_end && label.phrase.size() > best_length)) {
                    best = label.type;
                    best_end = end;
                    best_length = label.phrase.size();
                }
                break;
            }
            if (pos == 0) break;
            pos = context.rfind(label.phrase, pos - 1);
        }
    }
    return best;
}

} // namespace piiguard::detection
