/**
 * @file label_allocator.hpp
 * @brief Run-scoped pseudonym label cache
 *
 * Labels have the form "<prefix>_<n>" with a 1-based counter per entity
 * type. Identical (type, text) pairs receive the same label for the whole
 * run. A counter value whose label already appears anywhere in the source
 * text, even inside a longer word, is skipped, so restoring never rewrites
 * text the caller wrote.
 */

#pragma once

#include "piiguard/core/entity_type.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace piiguard::anonymization {

/**
 * @struct allocated_label
 * @brief Label returned by the allocator
 */
struct allocated_label {
    std::string label;

    /// True if the label was created by this call rather than reused
    bool created{false};
};

/**
 * @class label_allocator
 * @brief Deterministic label assignment for one anonymization run
 */
class label_allocator {
public:
    /**
     * @param source_text Text being anonymised; labels occurring in it are skipped
     */
    explicit label_allocator(std::string_view source_text = {});

    /**
     * @brief Return the label for a value, creating it if needed
     */
    [[nodiscard]] auto allocate(core::entity_type type, const std::string& text)
        -> allocated_label;

    /// Number of distinct values labelled so far
    [[nodiscard]] auto size() const noexcept -> std::size_t { return cache_.size(); }

private:
    std::string_view source_text_;
    std::map<std::pair<core::entity_type, std::string>, std::string> cache_;
    std::array<std::size_t, core::entity_type_count> counters_{};
};

} // namespace piiguard::anonymization
