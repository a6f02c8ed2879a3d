/**
 * @file pattern_detector_test.cpp
 * @brief Unit tests for the rule-based PII detector
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/detection/pattern_detector.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace piiguard::detection;
using piiguard::core::candidate;
using piiguard::core::detector_source;
using piiguard::core::entity_type;

namespace {

auto find_type(const std::vector<candidate>& candidates, entity_type type)
    -> const candidate* {
    auto it = std::find_if(candidates.begin(), candidates.end(),
                           [type](const candidate& c) { return c.type == type; });
    return it == candidates.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("PatternDetector: Structured Identifiers", "[detection][pattern]") {
    pattern_detector detector;

    SECTION("Email") {
        auto result = detector.detect("Email john.doe@example.com");
        const auto* email = find_type(result, entity_type::email);
        REQUIRE(email != nullptr);
        REQUIRE(email->text == "john.doe@example.com");
        REQUIRE(email->location.start == 6);
        REQUIRE(email->source == detector_source::pattern);
    }

    SECTION("Credit card") {
        auto result = detector.detect("Card 4532 1234 5678 9012");
        const auto* card = find_type(result, entity_type::credit_card);
        REQUIRE(card != nullptr);
        REQUIRE(card->text == "4532 1234 5678 9012");
    }

    SECTION("SSN") {
        auto result = detector.detect("SSN 123-45-6789");
        const auto* ssn = find_type(result, entity_type::ssn);
        REQUIRE(ssn != nullptr);
        REQUIRE(ssn->text == "123-45-6789");
    }

    SECTION("Phone with area code in parentheses") {
        auto result = detector.detect("Call (555) 123-4567 today");
        const auto* phone = find_type(result, entity_type::phone);
        REQUIRE(phone != nullptr);
        REQUIRE(phone->text == "(555) 123-4567");
    }

    SECTION("URL drops trailing sentence punctuation") {
        auto result = detector.detect("Visit https://example.com/path.");
        const auto* url = find_type(result, entity_type::url);
        REQUIRE(url != nullptr);
        REQUIRE(url->text == "https://example.com/path");
    }

    SECTION("IP address") {
        auto result = detector.detect("Server at 192.168.1.10 responded");
        const auto* ip = find_type(result, entity_type::ip_address);
        REQUIRE(ip != nullptr);
        REQUIRE(ip->text == "192.168.1.10");
    }

    SECTION("ISO date") {
        auto result = detector.detect("Born on 2024-01-15");
        const auto* date = find_type(result, entity_type::date_time);
        REQUIRE(date != nullptr);
        REQUIRE(date->text == "2024-01-15");
    }
}

TEST_CASE("PatternDetector: Form Fields", "[detection][pattern]") {
    pattern_detector detector;

    SECTION("Account number field") {
        auto result = detector.detect("Account Number: 9876543210");
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type == entity_type::account_number);
        REQUIRE(result[0].text == "9876543210");
        REQUIRE(result[0].rule == "account_number_field");
    }

    SECTION("Bare field label yields nothing") {
        REQUIRE(detector.detect("Phone Number").empty());
        REQUIRE(detector.detect("Account Number").empty());
    }

    SECTION("Context label re-types an ambiguous number") {
        auto result = detector.detect("Passport No 1234567890");
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type == entity_type::passport);
        REQUIRE(result[0].text == "1234567890");
    }

    SECTION("Context window limits the look-back") {
        pattern_detector narrow(pattern_detector_options{5});
        auto result = narrow.detect("Passport No 1234567890");
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type == entity_type::phone);
    }
}

TEST_CASE("PatternDetector: Names and Addresses", "[detection][pattern]") {
    pattern_detector detector;

    SECTION("Leading stop word is trimmed from a name") {
        auto result = detector.detect("Contact John Smith at noon");
        const auto* name = find_type(result, entity_type::person_name);
        REQUIRE(name != nullptr);
        REQUIRE(name->text == "John Smith");
        REQUIRE(name->location.start == 8);
    }

    SECTION("Street address") {
        auto result = detector.detect("I live at 123 Main Street.");
        const auto* address = find_type(result, entity_type::address);
        REQUIRE(address != nullptr);
        REQUIRE(address->text == "123 Main Street.");
    }

    SECTION("Calendar words are not names") {
        auto result = detector.detect("See you in March Next");
        REQUIRE(find_type(result, entity_type::person_name) == nullptr);
    }
}

TEST_CASE("PatternDetector: Output Invariants", "[detection][pattern]") {
    pattern_detector detector;

    SECTION("Empty input") {
        REQUIRE(detector.detect("").empty());
    }

    SECTION("Candidates never overlap and match their spans") {
        const std::string text =
            "Contact John Smith at john.smith@example.com or +1-234-567-8901. "
            "Card 4532 1234 5678 9012, SSN 123-45-6789, zip 12345.";
        auto result = detector.detect(text);
        REQUIRE(result.size() >= 5);

        for (std::size_t i = 0; i < result.size(); ++i) {
            const auto& c = result[i];
            REQUIRE(c.location.valid_for(text.size()));
            REQUIRE(text.substr(c.location.start, c.location.length()) == c.text);
            for (std::size_t j = i + 1; j < result.size(); ++j) {
                REQUIRE_FALSE(c.location.overlaps(result[j].location));
            }
        }
    }

    SECTION("Default rule set") {
        const auto& rules = detector.rules();
        REQUIRE_FALSE(rules.empty());
        REQUIRE(rules.front().name == "bank_account_field");
        REQUIRE(rules.back().type == entity_type::zip_code);
        REQUIRE(pattern_detector::is_context_sensitive(entity_type::phone));
        REQUIRE_FALSE(pattern_detector::is_context_sensitive(entity_type::email));
    }
}

TEST_CASE("PatternDetector: Long Tokens", "[detection][pattern]") {
    pattern_detector detector;

    SECTION("Single 100 KB token yields nothing") {
        const std::string text = "blob " + std::string(100000, 'Q') + " end";
        REQUIRE(detector.detect(text).empty());
    }

    SECTION("URL with a huge path is skipped") {
        const std::string text = "Visit https://example.com/" + std::string(200000, 'a') + " now";
        REQUIRE(find_type(detector.detect(text), entity_type::url) == nullptr);
    }

    SECTION("Entities after a long token keep their offsets") {
        const std::string text = std::string(100000, 'Q') + " mail a@b.com";
        auto result = detector.detect(text);
        const auto* email = find_type(result, entity_type::email);
        REQUIRE(email != nullptr);
        REQUIRE(email->text == "a@b.com");
        REQUIRE(email->location.start == 100006);
    }

    SECTION("Long whitespace runs do not join values") {
        const std::string text = "Account Number:" + std::string(100000, ' ') + "12345678";
        REQUIRE(find_type(detector.detect(text), entity_type::account_number) == nullptr);
    }
}

TEST_CASE("PatternDetector: Values Followed By Digits", "[detection][pattern]") {
    pattern_detector detector;

    SECTION("Field value cut short by the length limit is dropped") {
        const std::string text = "Account Number: " + std::string(30, '7');
        REQUIRE(find_type(detector.detect(text), entity_type::account_number) == nullptr);
    }

    SECTION("Value followed by punctuation or letters is kept") {
        auto result = detector.detect("Account Number: 12345678_old");
        const auto* account = find_type(result, entity_type::account_number);
        REQUIRE(account != nullptr);
        REQUIRE(account->text == "12345678");
    }
}
