/**
 * @file deanonymizer.cpp
 * @brief Implementation of label restoration
 */

#include "piiguard/anonymization/deanonymizer.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace piiguard::anonymization {

auto deanonymizer::restore(std::string_view text, const placeholder_mapping& mapping) const
    -> deanonymize_result {
    deanonymize_result result;
    if (mapping.empty() || text.empty()) {
        result.restored_text = std::string(text);
        return result;
    }

    // Candidates bucketed by first byte, longest label first within a bucket
    std::array<std::vector<const mapping_entry*>, 256> buckets;
    for (const auto& entry : mapping.entries()) {
        if (!entry.label.empty()) {
            buckets[static_cast<unsigned char>(entry.label.front())].push_back(&entry);
        }
    }
    for (auto& bucket : buckets) {
        std::stable_sort(bucket.begin(), bucket.end(),
                         [](const mapping_entry* a, const mapping_entry* b) {
                             return a->label.size() > b->label.size();
                         });
    }

    result.restored_text.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const mapping_entry* match = nullptr;
        for (const auto* entry : buckets[static_cast<unsigned char>(text[i])]) {
            if (text.compare(i, entry->label.size(), entry->label) == 0) {
                match = entry;
                break;
            }
        }

        if (match != nullptr) {
            result.restored_text.append(match->value);
            i += match->label.size();
            ++result.substitutions;
        } else {
            result.restored_text.push_back(text[i]);
            ++i;
        }
    }
    return result;
}

} // namespace piiguard::anonymization
