/**
 * @file overlap_resolver.hpp
 * @brief Merge candidates from all detectors into a disjoint entity set
 *
 * Candidates are sorted by start offset, longer spans first, then by
 * detector priority. Walking the sorted list, a candidate that overlaps the
 * last accepted entity is either a duplicate detection (overlap ratio above
 * the threshold; discarded) or a partial overlap, where the longer span
 * wins outright. Spans are never spliced.
 */

#pragma once

#include "piiguard/core/entity.hpp"

#include <vector>

namespace piiguard::detection {

/// Overlap ratio above which two candidates count as the same detection
inline constexpr double default_duplicate_overlap_threshold = 0.5;

/**
 * @brief Detector priority used to break ties between equal-length spans
 *
 * Pattern matches of structured types (card, SSN, email, phone, IP) rank
 * highest, then other pattern matches, then model output.
 */
[[nodiscard]] auto detector_priority(const core::candidate& candidate) noexcept -> int;

/**
 * @class overlap_resolver
 * @brief Produces a disjoint, start-ordered entity list
 */
class overlap_resolver {
public:
    explicit overlap_resolver(double duplicate_threshold = default_duplicate_overlap_threshold)
        : duplicate_threshold_(duplicate_threshold) {}

    /**
     * @brief Resolve overlapping candidates
     * @param candidates Validated candidates from any number of detectors
     * @return Disjoint entities sorted by start offset
     */
    [[nodiscard]] auto resolve(std::vector<core::candidate> candidates) const
        -> std::vector<core::resolved_entity>;

    [[nodiscard]] auto duplicate_threshold() const noexcept -> double {
        return duplicate_threshold_;
    }

private:
    double duplicate_threshold_;
};

} // namespace piiguard::detection
