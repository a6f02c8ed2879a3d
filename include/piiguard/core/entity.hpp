/**
 * @file entity.hpp
 * @brief Spans, detector candidates and resolved entities
 *
 * Offsets are byte offsets into the original UTF-8 text and are half-open:
 * a span covers [start, end). For ASCII input byte offsets and character
 * offsets coincide.
 */

#pragma once

#include "piiguard/core/entity_type.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace piiguard::core {

/**
 * @struct span
 * @brief Half-open byte range [start, end) inside a source text
 */
struct span {
    std::size_t start{0};
    std::size_t end{0};

    [[nodiscard]] constexpr auto length() const noexcept -> std::size_t {
        return end > start ? end - start : 0;
    }

    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return end <= start; }

    /// True if the span is non-empty and lies inside a text of @p text_size bytes
    [[nodiscard]] constexpr auto valid_for(std::size_t text_size) const noexcept -> bool {
        return start < end && end <= text_size;
    }

    [[nodiscard]] constexpr auto overlaps(const span& other) const noexcept -> bool {
        return start < other.end && other.start < end;
    }

    [[nodiscard]] constexpr auto overlap_length(const span& other) const noexcept
        -> std::size_t {
        const auto lo = std::max(start, other.start);
        const auto hi = std::min(end, other.end);
        return hi > lo ? hi - lo : 0;
    }

    constexpr auto operator==(const span& other) const noexcept -> bool = default;
};

/**
 * @enum detector_source
 * @brief Which detector produced a candidate
 */
enum class detector_source : std::uint8_t {
    pattern,  ///< Rule-based pattern detector
    model     ///< Statistical or lexicon-based model detector
};

[[nodiscard]] constexpr auto to_string(detector_source source) noexcept
    -> std::string_view {
    switch (source) {
        case detector_source::pattern:
            return "pattern";
        case detector_source::model:
            return "model";
    }
    return "unknown";
}

/**
 * @struct candidate
 * @brief A proposed entity before validation and overlap resolution
 */
struct candidate {
    span location;
    entity_type type{entity_type::generic};
    std::string text;
    detector_source source{detector_source::pattern};

    /// Rule or model category that produced the candidate (diagnostics only)
    std::string rule;
};

/**
 * @struct resolved_entity
 * @brief An entity that survived validation and overlap resolution
 *
 * A resolved entity set is disjoint and sorted by start offset.
 */
struct resolved_entity {
    span location;
    entity_type type{entity_type::generic};
    std::string text;

    auto operator==(const resolved_entity& other) const -> bool = default;
};

} // namespace piiguard::core
