/**
 * @file label_allocator.cpp
 * @brief Implementation of run-scoped label assignment
 */

#include "piiguard/anonymization/label_allocator.hpp"

#include <piiguard/compat/format.hpp>

namespace piiguard::anonymization {

label_allocator::label_allocator(std::string_view source_text) : source_text_(source_text) {}

auto label_allocator::allocate(core::entity_type type, const std::string& text)
    -> allocated_label {
    auto key = std::make_pair(type, text);
    if (auto it = cache_.find(key); it != cache_.end()) {
        return allocated_label{it->second, false};
    }

    auto& counter = counters_[static_cast<std::size_t>(type)];
    std::string label;
    do {
        ++counter;
        label = piiguard::compat::format("{}_{}", core::label_prefix(type), counter);
    } while (source_text_.find(label) != std::string_view::npos);

    cache_.emplace(std::move(key), label);
    return allocated_label{std::move(label), true};
}

} // namespace piiguard::anonymization
