/**
 * @file entity_type_test.cpp
 * @brief Unit tests for entity type metadata and spans
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/core/entity.hpp"
#include "piiguard/core/entity_type.hpp"

#include <set>
#include <string>

using namespace piiguard::core;

TEST_CASE("EntityType: Table Lookup", "[core][entity]") {
    SECTION("Table is indexed by enum value") {
        for (std::size_t i = 0; i < entity_type_count; ++i) {
            REQUIRE(static_cast<std::size_t>(entity_type_table[i].type) == i);
        }
    }

    SECTION("Keys and prefixes are unique") {
        std::set<std::string> keys;
        std::set<std::string> prefixes;
        for (const auto& entry : entity_type_table) {
            REQUIRE(keys.insert(std::string(entry.key)).second);
            REQUIRE(prefixes.insert(std::string(entry.label_prefix)).second);
        }
    }

    SECTION("Known label prefixes") {
        REQUIRE(label_prefix(entity_type::person_name) == "name");
        REQUIRE(label_prefix(entity_type::email) == "email");
        REQUIRE(label_prefix(entity_type::phone) == "mobNo");
        REQUIRE(label_prefix(entity_type::account_number) == "account_number");
        REQUIRE(label_prefix(entity_type::generic) == "entity");
    }

    SECTION("Human labels") {
        REQUIRE(human_label(entity_type::email) == "Email Address");
        REQUIRE(human_label(entity_type::credit_card) == "Credit Card");
        REQUIRE(human_label(entity_type::generic) == "Sensitive Data");
    }
}

TEST_CASE("EntityType: String Conversion", "[core][entity]") {
    SECTION("Key round trip for every type") {
        for (const auto& entry : entity_type_table) {
            auto parsed = entity_type_from_string(to_string(entry.type));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == entry.type);
        }
    }

    SECTION("Unknown key") {
        REQUIRE_FALSE(entity_type_from_string("NOT_A_TYPE").has_value());
        REQUIRE_FALSE(entity_type_from_string("email").has_value());
    }

    SECTION("Prefix lookup") {
        REQUIRE(entity_type_from_prefix("mobNo") == entity_type::phone);
        REQUIRE(entity_type_from_prefix("zipcode") == entity_type::zip_code);
        REQUIRE_FALSE(entity_type_from_prefix("phone").has_value());
    }
}

TEST_CASE("Span: Geometry", "[core][entity]") {
    const span a{0, 10};
    const span b{5, 15};
    const span c{10, 12};

    SECTION("Length and emptiness") {
        REQUIRE(a.length() == 10);
        REQUIRE_FALSE(a.empty());
        REQUIRE(span{4, 4}.empty());
        REQUIRE(span{4, 4}.length() == 0);
    }

    SECTION("Bounds") {
        REQUIRE(a.valid_for(10));
        REQUIRE_FALSE(a.valid_for(9));
        REQUIRE_FALSE(span{3, 3}.valid_for(10));
    }

    SECTION("Overlap is half-open") {
        REQUIRE(a.overlaps(b));
        REQUIRE(b.overlaps(a));
        REQUIRE_FALSE(a.overlaps(c));
        REQUIRE(a.overlap_length(b) == 5);
        REQUIRE(a.overlap_length(c) == 0);
    }

    SECTION("Detector source names") {
        REQUIRE(to_string(detector_source::pattern) == "pattern");
        REQUIRE(to_string(detector_source::model) == "model");
    }
}
