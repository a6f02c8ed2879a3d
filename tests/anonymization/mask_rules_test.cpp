/**
 * @file mask_rules_test.cpp
 * @brief Unit tests for mask-mode rules
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/anonymization/mask_rules.hpp"

using namespace piiguard::anonymization;
using piiguard::core::entity_type;

TEST_CASE("MaskRules: Contact Details", "[anonymization][mask]") {
    SECTION("Email keeps the domain") {
        REQUIRE(mask_value(entity_type::email, "john.smith@example.com") ==
                "jo********@example.com");
        REQUIRE(mask_value(entity_type::email, "abc@x.com") == "a**@x.com");
    }

    SECTION("Phone keeps country and area code and the last digit") {
        REQUIRE(mask_value(entity_type::phone, "+1-234-567-8901") == "+1-234-XXX-XXX1");
        REQUIRE(mask_value(entity_type::phone, "(555) 123-4567") == "(555) XXX-XXX7");
    }

    SECTION("URL keeps scheme and host") {
        REQUIRE(mask_value(entity_type::url, "https://example.com/path") ==
                "https://example.com/***");
        REQUIRE(mask_value(entity_type::url, "www.example.com?q=1") == "www.example.com/***");
    }

    SECTION("URL without a path is left as is") {
        REQUIRE(mask_value(entity_type::url, "https://example.com") == "https://example.com");
        REQUIRE(mask_value(entity_type::url, "www.example.org") == "www.example.org");
    }

    SECTION("IP keeps the first octet") {
        REQUIRE(mask_value(entity_type::ip_address, "192.168.1.10") == "192.XXX.XXX.XXX");
    }
}

TEST_CASE("MaskRules: Identifiers", "[anonymization][mask]") {
    SECTION("Credit card") {
        REQUIRE(mask_value(entity_type::credit_card, "4532 1234 5678 9012") ==
                "4532-XXXX-XXXX-9012");
    }

    SECTION("SSN and zip code") {
        REQUIRE(mask_value(entity_type::ssn, "123-45-6789") == "123-XX-XXXX");
        REQUIRE(mask_value(entity_type::zip_code, "12345") == "123**");
        REQUIRE(mask_value(entity_type::zip_code, "12345-6789") == "123**-****");
    }

    SECTION("Account numbers keep the last four") {
        REQUIRE(mask_value(entity_type::account_number, "9876543210") == "******3210");
        REQUIRE(mask_value(entity_type::account_id, "ACC-123456") == "ACC-*****6");
    }

    SECTION("Dates hide every digit") {
        REQUIRE(mask_value(entity_type::date_time, "2024-01-15") == "XXXX-XX-XX");
    }
}

TEST_CASE("MaskRules: Names and Free Text", "[anonymization][mask]") {
    SECTION("Initials of every word") {
        REQUIRE(mask_value(entity_type::person_name, "John Smith") == "J*** S****");
        REQUIRE(mask_value(entity_type::person_name, "Zo\xC3\xAB") == "Z**");
    }

    SECTION("Addresses keep house numbers") {
        REQUIRE(mask_value(entity_type::address, "123 Main Street") == "123 M*** S*****");
    }

    SECTION("Generic keeps first and last characters") {
        REQUIRE(mask_value(entity_type::generic, "secret") == "s****t");
        REQUIRE(mask_value(entity_type::generic, "ab") == "**");
    }

    SECTION("Empty value") {
        REQUIRE(mask_value(entity_type::email, "").empty());
    }
}

TEST_CASE("MaskRules: Replacement Labels", "[anonymization][mask]") {
    REQUIRE(replacement_label(entity_type::email) == "[Email Address]");
    REQUIRE(replacement_label(entity_type::generic) == "[Sensitive Data]");
}
