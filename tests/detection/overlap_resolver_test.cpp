/**
 * @file overlap_resolver_test.cpp
 * @brief Unit tests for cross-detector overlap resolution
 */

#include <catch2/catch_test_macros.hpp>

#include "piiguard/detection/overlap_resolver.hpp"

#include <string>
#include <vector>

using namespace piiguard::detection;
using piiguard::core::candidate;
using piiguard::core::detector_source;
using piiguard::core::entity_type;
using piiguard::core::span;

namespace {

auto make_candidate(std::size_t start,
                    std::size_t end,
                    entity_type type,
                    detector_source source = detector_source::pattern) -> candidate {
    return candidate{span{start, end}, type, std::string(end - start, 'x'), source, "test"};
}

} // namespace

TEST_CASE("OverlapResolver: Priority", "[detection][overlap]") {
    REQUIRE(detector_priority(make_candidate(0, 5, entity_type::email)) == 3);
    REQUIRE(detector_priority(make_candidate(0, 5, entity_type::address)) == 2);
    REQUIRE(detector_priority(
                make_candidate(0, 5, entity_type::email, detector_source::model)) == 1);
}

TEST_CASE("OverlapResolver: Disjoint Candidates", "[detection][overlap]") {
    overlap_resolver resolver;

    SECTION("Empty input") {
        REQUIRE(resolver.resolve({}).empty());
    }

    SECTION("Output is sorted by start") {
        auto result = resolver.resolve({make_candidate(20, 25, entity_type::zip_code),
                                        make_candidate(0, 10, entity_type::phone),
                                        make_candidate(10, 15, entity_type::email)});
        REQUIRE(result.size() == 3);
        REQUIRE(result[0].location == span{0, 10});
        REQUIRE(result[1].location == span{10, 15});
        REQUIRE(result[2].location == span{20, 25});
        REQUIRE(result[1].type == entity_type::email);
    }

    SECTION("Empty spans are skipped") {
        auto result = resolver.resolve({make_candidate(3, 3, entity_type::email)});
        REQUIRE(result.empty());
    }
}

TEST_CASE("OverlapResolver: Overlapping Candidates", "[detection][overlap]") {
    overlap_resolver resolver;

    SECTION("Duplicate detection keeps the first accepted span") {
        auto result = resolver.resolve(
            {make_candidate(0, 10, entity_type::email),
             make_candidate(2, 10, entity_type::person_name, detector_source::model)});
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type == entity_type::email);
        REQUIRE(result[0].location == span{0, 10});
    }

    SECTION("Same start prefers the longer span") {
        auto result = resolver.resolve({make_candidate(0, 5, entity_type::phone),
                                        make_candidate(0, 12, entity_type::address)});
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type == entity_type::address);
    }

    SECTION("Partial overlap: longer span wins") {
        auto result = resolver.resolve({make_candidate(0, 10, entity_type::email),
                                        make_candidate(8, 20, entity_type::address)});
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].location == span{8, 20});
        REQUIRE(result[0].type == entity_type::address);
    }

    SECTION("Partial overlap of equal length: priority wins") {
        auto result = resolver.resolve({make_candidate(0, 10, entity_type::person_name),
                                        make_candidate(5, 15, entity_type::email)});
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type == entity_type::email);
        REQUIRE(result[0].location == span{5, 15});
    }

    SECTION("Lower threshold turns the same pair into a duplicate") {
        overlap_resolver strict(0.4);
        REQUIRE(strict.duplicate_threshold() == 0.4);
        auto result = strict.resolve({make_candidate(0, 10, entity_type::person_name),
                                      make_candidate(5, 15, entity_type::email)});
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type == entity_type::person_name);
    }

    SECTION("Result is always disjoint") {
        auto result = resolver.resolve({make_candidate(0, 6, entity_type::phone),
                                        make_candidate(4, 9, entity_type::ssn),
                                        make_candidate(8, 14, entity_type::zip_code),
                                        make_candidate(20, 30, entity_type::email),
                                        make_candidate(25, 28, entity_type::person_name,
                                                       detector_source::model)});
        for (std::size_t i = 1; i < result.size(); ++i) {
            REQUIRE(result[i - 1].location.end <= result[i].location.start);
        }
    }
}
