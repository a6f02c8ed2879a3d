/**
 * @file pattern_detector.cpp
 * @brief Implementation of the rule-based PII detector
 */

#include "piiguard/detection/pattern_detector.hpp"

#include "piiguard/core/text_utils.hpp"
#include "piiguard/detection/validators.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace piiguard::detection {

using core::entity_type;

namespace {

constexpr auto default_flags = std::regex::ECMAScript | std::regex::optimize;
constexpr auto icase_flags = default_flags | std::regex::icase;

auto make_rule(std::string name,
               entity_type type,
               const char* pattern,
               std::regex::flag_type flags = default_flags,
               int value_group = 0,
               bool numeric_boundary = false,
               match_filter filter = match_filter::none,
               std::size_t min_words = 0) -> pattern_rule {
    return pattern_rule{std::move(name),
                        type,
                        std::regex(pattern, flags),
                        value_group,
                        numeric_boundary,
                        filter,
                        min_words};
}

auto is_space(char c) noexcept -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Words that capitalise like names but name places, dates or roles
auto is_non_person_term(std::string_view word) -> bool {
    static constexpr std::string_view terms[] = {
        "january", "february", "march", "april", "june", "july", "august",
        "september", "october", "november", "december", "monday", "tuesday",
        "wednesday", "thursday", "friday", "saturday", "sunday", "new", "united",
        "states", "kingdom", "north", "south", "east", "west", "san", "los",
        "las", "saint", "city", "county", "state", "street", "avenue", "road",
        "lane", "drive", "boulevard", "america", "american", "customer",
        "service", "services", "support", "team", "manager", "office", "center",
        "summary", "report", "meeting", "project", "invoice", "order", "dear"};
    const auto lower = core::to_lower(word);
    return std::find(std::begin(terms), std::end(terms), lower) != std::end(terms);
}

/// Words that trail a name in form text ("John Smith Phone: ...")
auto is_trailing_field_word(std::string_view word) -> bool {
    static constexpr std::string_view words[] = {
        "phone", "email", "address", "number", "id", "account", "tel", "mobile", "cell"};
    const auto lower = core::to_lower(word);
    return std::find(std::begin(words), std::end(words), lower) != std::end(words);
}

auto split_span_words(std::string_view text, const core::span& location)
    -> std::vector<core::span> {
    std::vector<core::span> words;
    std::size_t i = location.start;
    while (i < location.end) {
        while (i < location.end && is_space(text[i])) ++i;
        const std::size_t begin = i;
        while (i < location.end && !is_space(text[i])) ++i;
        if (i > begin) words.push_back({begin, i});
    }
    return words;
}

auto trim_span(std::string_view text, core::span location) -> core::span {
    while (location.start < location.end && is_space(text[location.start])) ++location.start;
    while (location.end > location.start && is_space(text[location.end - 1])) --location.end;
    return location;
}

auto apply_filter(std::string_view text, core::span location, const pattern_rule& rule)
    -> std::optional<core::span> {
    location = trim_span(text, location);

    switch (rule.filter) {
        case match_filter::none:
            break;

        case match_filter::trailing_punctuation: {
            constexpr std::string_view trailing = ".,;:!?)]}'\"";
            while (location.end > location.start &&
                   trailing.find(text[location.end - 1]) != std::string_view::npos) {
                --location.end;
            }
            break;
        }

        case match_filter::leading_stopwords:
        case match_filter::person_sequence: {
            auto words = split_span_words(text, location);
            auto first = words.begin();
            auto last = words.end();
            while (first != last &&
                   is_name_stopword(text.substr(first->start, first->length()))) {
                ++first;
            }
            if (rule.filter == match_filter::person_sequence) {
                while (last != first &&
                       is_trailing_field_word(text.substr((last - 1)->start,
                                                          (last - 1)->length()))) {
                    --last;
                }
                for (auto it = first; it != last; ++it) {
                    if (is_non_person_term(text.substr(it->start, it->length()))) {
                        return std::nullopt;
                    }
                }
            }
            if (first == last) {
                return std::nullopt;
            }
            if (static_cast<std::size_t>(std::distance(first, last)) < rule.min_words) {
                return std::nullopt;
            }
            location = {first->start, (last - 1)->end};
            break;
        }
    }

    if (location.empty()) {
        return std::nullopt;
    }
    return location;
}

auto has_clean_boundaries(std::string_view text, const core::span& location) -> bool {
    if (location.start > 0 && core::is_identifier_char(text[location.start - 1])) {
        return false;
    }
    if (location.end < text.size() && core::is_identifier_char(text[location.end])) {
        return false;
    }
    return true;
}

auto overlaps_any(const std::vector<core::span>& claimed, const core::span& location) -> bool {
    return std::any_of(claimed.begin(), claimed.end(),
                       [&](const core::span& s) { return s.overlaps(location); });
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

pattern_detector::pattern_detector(pattern_detector_options options)
    : options_(options), rules_(default_rules()) {}

auto pattern_detector::default_rules() -> std::vector<pattern_rule> {
    std::vector<pattern_rule> rules;

    // Form fields: the label fixes the type, the capture group is the value
    rules.push_back(make_rule(
        "bank_account_field", entity_type::bank_account,
        R"(\b(?:Bank[ \t]+Account|Routing)[ \t]*(?:Number|No\.?|#)?[ \t]*[:#][ \t]*(\d[\d-]{6,19}\d))",
        icase_flags, 1));
    rules.push_back(make_rule(
        "account_number_field", entity_type::account_number,
        R"(\b(?:Account|Acct)[ \t]*(?:Number|No\.?|#)[ \t]*[:#]?[ \t]*([A-Za-z0-9][A-Za-z0-9-]{3,24}))",
        icase_flags, 1));
    rules.push_back(make_rule(
        "employee_id_field", entity_type::employee_id,
        R"(\bEmployee[ \t]*(?:ID|Number|No\.?|#)[ \t]*[:#]?[ \t]*([A-Za-z0-9][A-Za-z0-9-]{2,14}))",
        icase_flags, 1));
    rules.push_back(make_rule(
        "application_number_field", entity_type::application_number,
        R"(\bApplication[ \t]*(?:Number|No\.?|ID|#)[ \t]*[:#]?[ \t]*([A-Za-z0-9][A-Za-z0-9-]{2,14}))",
        icase_flags, 1));
    rules.push_back(make_rule(
        "phone_field", entity_type::phone,
        R"(\b(?:Phone|Mobile|Cell|Telephone|Tel|Contact)(?:[ \t]+(?:Number|No\.?))?[ \t]*[:#][ \t]*(\+?\(?\d[\d ().-]{5,20}\d))",
        icase_flags, 1));
    rules.push_back(make_rule(
        "name_field", entity_type::person_name,
        R"(\b(?:(?:Full|First|Last|Customer|Patient)[ \t]+)?[Nn]ame[ \t]*:[ \t]*([A-Z][A-Za-z'-]+(?:[ \t]+[A-Z][A-Za-z'-]+){0,3}))",
        default_flags, 1));

    // Structured identifiers
    rules.push_back(make_rule(
        "credit_card", entity_type::credit_card,
        R"(\b(?:\d{4}[- ]?){3}\d{4}\b|\b\d{4}[- ]?\d{6}[- ]?\d{4,5}\b|\b4\d{12}\b)",
        default_flags, 0, true));
    rules.push_back(make_rule("ssn", entity_type::ssn, R"(\b\d{3}-\d{2}-\d{4}\b)",
                              default_flags, 0, true));
    rules.push_back(make_rule("email", entity_type::email,
                              R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"));
    rules.push_back(make_rule("url", entity_type::url,
                              R"(\b(?:https?://|www\.)[^\s<>"'\[\]]+)", icase_flags, 0,
                              false, match_filter::trailing_punctuation));
    rules.push_back(make_rule("ip_address", entity_type::ip_address,
                              R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", default_flags, 0, true));

    // Addresses
    rules.push_back(make_rule(
        "street_address", entity_type::address,
        R"(\b\d{1,6}[ \t]+(?:[A-Z][A-Za-z0-9'.-]*[ \t]+){1,4}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr|Court|Ct|Way|Place|Pl|Parkway|Pkwy|Circle|Cir|Terrace|Highway|Hwy)\b\.?(?:,?[ \t]+(?:Apt|Apartment|Suite|Ste|Unit)\.?[ \t]*#?[A-Za-z0-9-]+|[ \t]*#[ \t]*[A-Za-z0-9-]+)?)"));
    rules.push_back(make_rule(
        "unit_address", entity_type::address,
        R"(\b(?:Apt|Apartment|Suite|Ste|Unit)\.?[ \t]*#?[ \t]*\d+[A-Za-z]?\b)"));

    // Numeric identifiers
    rules.push_back(make_rule(
        "phone", entity_type::phone,
        R"((?:\+\d{1,3}[-. ]?|\b1[-. ])?(?:\(\d{3}\)|\b\d{3})[-. ]?\d{3}[-. ]?\d{4}\b(?:[ \t]*(?:ext\.?|x)[ \t]*\d{1,6}\b)?)",
        icase_flags, 0, true));
    rules.push_back(make_rule(
        "medical_id", entity_type::medical_id,
        R"(\b(?:MRN|MR|PATIENT|Patient[ \t]+ID)[ \t#:-]*(\d{6,12})\b)",
        default_flags, 1, true));
    rules.push_back(make_rule(
        "account_id", entity_type::account_id,
        R"(\b(?:ACC|ACCT|ID|REF|CASE|ORDER|TICKET|REQ)[-. \t#:]*\d{4,}(?:-\d+)*\b)",
        default_flags, 0, true));
    rules.push_back(make_rule("passport", entity_type::passport,
                              R"(\b[A-Z]{1,2}\d{6,9}\b)", default_flags, 0, true));
    rules.push_back(make_rule("driver_license", entity_type::driver_license,
                              R"(\b[A-Z]{1,2}[-. ]?\d{6,8}\b)", default_flags, 0, true));

    // Dates and times
    rules.push_back(make_rule(
        "numeric_date", entity_type::date_time,
        R"(\b(?:\d{1,2}[/-]\d{1,2}[/-](?:\d{4}|\d{2})|\d{4}[/-]\d{1,2}[/-]\d{1,2})\b)",
        default_flags, 0, true));
    rules.push_back(make_rule(
        "month_day_date", entity_type::date_time,
        R"(\b(?:Jan(?:uary)?|Feb(?:ruary)?|Mar(?:ch)?|Apr(?:il)?|May|June?|July?|Aug(?:ust)?|Sep(?:t(?:ember)?)?|Oct(?:ober)?|Nov(?:ember)?|Dec(?:ember)?)\.?[ \t]+\d{1,2}(?:st|nd|rd|th)?(?:,?[ \t]+\d{4})?\b)"));
    rules.push_back(make_rule(
        "day_month_date", entity_type::date_time,
        R"(\b\d{1,2}(?:st|nd|rd|th)?[ \t]+(?:January|February|March|April|May|June|July|August|September|October|November|December)(?:,?[ \t]+\d{4})?\b)"));
    rules.push_back(make_rule(
        "clock_time", entity_type::date_time,
        R"(\b\d{1,2}:\d{2}(?::\d{2})?(?:[ \t]*[AaPp]\.?[Mm]\.?)?)", default_flags, 0, true));

    // Multi-token names
    rules.push_back(make_rule(
        "titled_person", entity_type::person_name,
        R"(\b(?:Mr|Mrs|Ms|Miss|Dr|Prof|Sir|Madam)\.?[ \t]+[A-Z][A-Za-z'-]+(?:[ \t]+[A-Z][A-Za-z'-]+){0,2}\b)"));
    rules.push_back(make_rule(
        "legal_entity", entity_type::organization,
        R"(\b(?:[A-Z][A-Za-z0-9&'-]*,?[ \t]+){1,4}(?:Inc|LLC|Ltd|Corp|Corporation|Company|Co|Group|Holdings|GmbH|PLC|LLP)\b\.?)",
        default_flags, 0, false, match_filter::leading_stopwords, 2));
    rules.push_back(make_rule(
        "institution", entity_type::organization,
        R"(\b(?:[A-Z][A-Za-z&'-]*[ \t]+){1,4}(?:Bank|Hospital|University|College|Institute|Clinic|Foundation|Agency|Association)\b(?:[ \t]+of[ \t]+[A-Z][a-z]+(?:[ \t]+[A-Z][a-z]+)?)?|\b(?:Bank|University|Hospital|Institute|College)[ \t]+of[ \t]+[A-Z][a-z]+(?:[ \t]+[A-Z][a-z]+)?)",
        default_flags, 0, false, match_filter::leading_stopwords, 2));
    rules.push_back(make_rule(
        "title_case_person", entity_type::person_name,
        R"(\b[A-Z][a-z]+(?:[ \t]+[A-Z][a-z]+){1,3}\b)",
        default_flags, 0, false, match_filter::person_sequence, 2));

    // Bare postal codes are the last fallback
    rules.push_back(make_rule("zip_code", entity_type::zip_code, R"(\b\d{5}(?:-\d{4})?\b)",
                              default_flags, 0, true));

    return rules;
}

auto pattern_detector::is_context_sensitive(entity_type type) noexcept -> bool {
    switch (type) {
        case entity_type::phone:
        case entity_type::zip_code:
        case entity_type::ssn:
        case entity_type::account_id:
        case entity_type::passport:
        case entity_type::driver_license:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Detection
// =============================================================================

auto pattern_detector::detect(std::string_view text) const -> std::vector<core::candidate> {
    std::vector<core::candidate> accepted;
    std::vector<core::span> claimed;

    if (text.empty()) {
        return accepted;
    }

    const auto scan = core::shield_long_runs(text);
    const char* first = scan.data();
    const char* last = first + scan.size();

    for (const auto& rule : rules_) {
        for (std::cregex_iterator it(first, last, rule.expression), end; it != end; ++it) {
            const auto& match = *it;
            const auto group = static_cast<std::size_t>(rule.value_group);
            if (!match[group].matched || match.length(group) == 0) {
                continue;
            }

            const core::span raw{static_cast<std::size_t>(match.position(group)),
                                 static_cast<std::size_t>(match.position(group) +
                                                          match.length(group))};
            const auto location = apply_filter(text, raw, rule);
            if (!location) {
                continue;
            }
            if (rule.numeric_boundary && !has_clean_boundaries(text, *location)) {
                continue;
            }
            // A label written flush against a digit would read as a longer label
            if (core::is_digit_at(text, location->end)) {
                continue;
            }
            if (overlaps_any(claimed, *location)) {
                continue;
            }

            const auto value = text.substr(location->start, location->length());
            if (rule.type == entity_type::person_name && is_field_label(value)) {
                continue;
            }

            const auto type = classify(text, *location, rule.type);
            if (!type) {
                continue;
            }

            claimed.push_back(*location);
            accepted.push_back(core::candidate{*location, *type, std::string(value),
                                               core::detector_source::pattern, rule.name});
        }
    }

    return accepted;
}

auto pattern_detector::classify(std::string_view text,
                                const core::span& location,
                                entity_type type) const -> std::optional<entity_type> {
    const auto value = text.substr(location.start, location.length());

    if (is_context_sensitive(type)) {
        const auto labelled =
            find_context_label(text, location.start, options_.context_window);
        if (labelled && *labelled != type && validate(*labelled, value)) {
            return labelled;
        }
    }

    if (validate(type, value)) {
        return type;
    }
    return std::nullopt;
}

} // namespace piiguard::detection
