/**
 * @file overlap_resolver.cpp
 * @brief Implementation of cross-detector overlap resolution
 */

#include "piiguard/detection/overlap_resolver.hpp"

#include <algorithm>

namespace piiguard::detection {

using core::entity_type;

auto detector_priority(const core::candidate& candidate) noexcept -> int {
    if (candidate.source == core::detector_source::model) {
        return 1;
    }
    switch (candidate.type) {
        case entity_type::credit_card:
        case entity_type::ssn:
        case entity_type::email:
        case entity_type::phone:
        case entity_type::ip_address:
            return 3;
        default:
            return 2;
    }
}

auto overlap_resolver::resolve(std::vector<core::candidate> candidates) const
    -> std::vector<core::resolved_entity> {
    std::sort(candidates.begin(), candidates.end(),
              [](const core::candidate& a, const core::candidate& b) {
                  if (a.location.start != b.location.start) {
                      return a.location.start < b.location.start;
                  }
                  if (a.location.length() != b.location.length()) {
                      return a.location.length() > b.location.length();
                  }
                  const auto pa = detector_priority(a);
                  const auto pb = detector_priority(b);
                  if (pa != pb) {
                      return pa > pb;
                  }
                  return a.type < b.type;
              });

    std::vector<core::candidate> accepted;
    accepted.reserve(candidates.size());

    for (auto& current : candidates) {
        if (current.location.empty()) {
            continue;
        }
        if (accepted.empty() || current.location.start >= accepted.back().location.end) {
            accepted.push_back(std::move(current));
            continue;
        }

        auto& previous = accepted.back();
        const auto overlap = previous.location.overlap_length(current.location);
        const auto shorter = std::min(previous.location.length(), current.location.length());
        const auto ratio = static_cast<double>(overlap) / static_cast<double>(shorter);

        if (ratio > duplicate_threshold_) {
            continue;
        }

        // Partial overlap: the longer span wins, priority breaks ties
        const bool replaces =
            current.location.length() > previous.location.length() ||
            (current.location.length() == previous.location.length() &&
             detector_priority(current) > detector_priority(previous));
        if (replaces) {
            previous = std::move(current);
        }
    }

    std::vector<core::resolved_entity> resolved;
    resolved.reserve(accepted.size());
    for (auto& entry : accepted) {
        resolved.push_back(
            core::resolved_entity{entry.location, entry.type, std::move(entry.text)});
    }
    return resolved;
}

} // namespace piiguard::detection
