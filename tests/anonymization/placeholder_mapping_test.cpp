/**
 * @file placeholder_mapping_test.cpp
 * @brief Unit tests for the label-to-value mapping
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/anonymization/placeholder_mapping.hpp"

#include <nlohmann/json.hpp>

using namespace piiguard::anonymization;
namespace error_codes = piiguard::error_codes;

TEST_CASE("PlaceholderMapping: Basic Operations", "[anonymization][mapping]") {
    placeholder_mapping mapping;

    SECTION("Initial state is empty") {
        REQUIRE(mapping.empty());
        REQUIRE(mapping.size() == 0);
        REQUIRE_FALSE(mapping.find("name_1").has_value());
    }

    SECTION("add and find") {
        REQUIRE(mapping.add("name_1", "John Smith").is_ok());
        REQUIRE(mapping.size() == 1);
        REQUIRE(mapping.contains("name_1"));
        REQUIRE(mapping.find("name_1") == "John Smith");
    }

    SECTION("Duplicate label is rejected") {
        REQUIRE(mapping.add("name_1", "John Smith").is_ok());
        auto result = mapping.add("name_1", "Jane Doe");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::duplicate_label);
        REQUIRE(mapping.find("name_1") == "John Smith");
    }

    SECTION("Empty label is rejected") {
        auto result = mapping.add("", "value");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::invalid_input);
    }

    SECTION("Entries keep insertion order") {
        REQUIRE(mapping.add("mobNo_1", "+1-234-567-8901").is_ok());
        REQUIRE(mapping.add("email_1", "a@b.com").is_ok());
        REQUIRE(mapping.entries()[0].label == "mobNo_1");
        REQUIRE(mapping.entries()[1].label == "email_1");
    }

    SECTION("clear") {
        REQUIRE(mapping.add("name_1", "John Smith").is_ok());
        mapping.clear();
        REQUIRE(mapping.empty());
        REQUIRE_FALSE(mapping.contains("name_1"));
    }
}

TEST_CASE("PlaceholderMapping: Merge", "[anonymization][mapping]") {
    placeholder_mapping stored;
    REQUIRE(stored.add("name_1", "John Smith").is_ok());

    placeholder_mapping incoming;
    REQUIRE(incoming.add("name_1", "Jane Doe").is_ok());
    REQUIRE(incoming.add("email_1", "jane@example.com").is_ok());

    const auto added = stored.merge(incoming);

    REQUIRE(added == 1);
    REQUIRE(stored.size() == 2);
    REQUIRE(stored.find("name_1") == "John Smith");
    REQUIRE(stored.find("email_1") == "jane@example.com");
    REQUIRE(stored.merge(incoming) == 0);
}

TEST_CASE("PlaceholderMapping: JSON Document", "[anonymization][mapping]") {
    SECTION("Versioned document layout") {
        placeholder_mapping mapping;
        REQUIRE(mapping.add("name_1", "John \"JJ\" Smith").is_ok());

        const auto document = nlohmann::json::parse(mapping.to_json());
        REQUIRE(document["version"] == placeholder_mapping::format_version);
        REQUIRE(document["entries"].size() == 1);
        REQUIRE(document["entries"][0]["label"] == "name_1");
        REQUIRE(document["entries"][0]["value"] == "John \"JJ\" Smith");

        auto parsed = placeholder_mapping::from_json(mapping.to_json());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == mapping);
    }

    SECTION("Empty mapping") {
        auto parsed = placeholder_mapping::from_json(R"({"version":1,"entries":[]})");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().empty());
    }

    SECTION("Malformed documents") {
        const char* documents[] = {
            "not json",
            "[]",
            R"({"entries":[]})",
            R"({"version":2,"entries":[]})",
            R"({"version":1})",
            R"({"version":1,"entries":[{"label":"name_1"}]})",
            R"({"version":1,"entries":[{"label":1,"value":"x"}]})",
            R"({"version":1,"entries":[{"label":"a","value":"x"},{"label":"a","value":"y"}]})",
        };
        for (const auto* document : documents) {
            auto parsed = placeholder_mapping::from_json(document);
            REQUIRE(parsed.is_err());
            REQUIRE(parsed.error().code == error_codes::mapping_serialization_error);
        }
    }
}
