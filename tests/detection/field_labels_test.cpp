/**
 * @file field_labels_test.cpp
 * @brief Unit tests for field label recognition and context lookup
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/detection/field_labels.hpp"

#include <string>

using namespace piiguard::detection;
using piiguard::core::entity_type;

TEST_CASE("FieldLabels: Recognition", "[detection][labels]") {
    SECTION("Exact labels with punctuation and case") {
        REQUIRE(is_field_label("Account Number:"));
        REQUIRE(is_field_label("PHONE NUMBER"));
        REQUIRE(is_field_label("SSN #"));
        REQUIRE(is_field_label("Name"));
        REQUIRE(is_field_label("telephone"));
    }

    SECTION("Multi-word labels inside longer text") {
        REQUIRE(is_field_label("Contact Phone Number"));
        REQUIRE(is_field_label("Customer  Account   Number"));
    }

    SECTION("Single-word labels only match whole text") {
        REQUIRE_FALSE(is_field_label("My phone"));
        REQUIRE_FALSE(is_field_label("Telephones"));
    }

    SECTION("Non-labels") {
        REQUIRE_FALSE(is_field_label("John Smith"));
        REQUIRE_FALSE(is_field_label(""));
        REQUIRE_FALSE(is_field_label(" : "));
    }
}

TEST_CASE("FieldLabels: Context Lookup", "[detection][labels]") {
    SECTION("Label before the value decides the type") {
        const std::string text = "Account Number: 9876543210";
        REQUIRE(find_context_label(text, 16) == entity_type::account_number);
    }

    SECTION("Longest label ending nearest wins") {
        const std::string text = "Passport No 1234567890";
        REQUIRE(find_context_label(text, 12) == entity_type::passport);

        const std::string phone = "Phone Number: 9876543210";
        REQUIRE(find_context_label(phone, 14) == entity_type::phone);
    }

    SECTION("Nearest label on the line wins") {
        const std::string text = "SSN and Zip: 12345";
        REQUIRE(find_context_label(text, 13) == entity_type::zip_code);
    }

    SECTION("Labels on a previous line are ignored") {
        const std::string text = "Account Number:\n9876543210";
        REQUIRE_FALSE(find_context_label(text, 16).has_value());
    }

    SECTION("Labels outside the window are ignored") {
        const std::string text = "Account Number:" + std::string(50, ' ') + "9876543210";
        const auto position = text.find('9');
        REQUIRE_FALSE(find_context_label(text, position).has_value());
        REQUIRE(find_context_label(text, position, 100) == entity_type::account_number);
    }

    SECTION("Degenerate positions") {
        REQUIRE_FALSE(find_context_label("Phone: 555", 0).has_value());
        REQUIRE_FALSE(find_context_label("Phone: 555", 100).has_value());
        REQUIRE_FALSE(find_context_label("Phone: 555", 7, 0).has_value());
    }
}
