/**
 * @file placeholder_mapping.cpp
 * @brief Implementation of the placeholder mapping and its JSON form
 */

#include "piiguard/anonymization/placeholder_mapping.hpp"

#include <piiguard/compat/format.hpp>

#include <nlohmann/json.hpp>

namespace piiguard::anonymization {

namespace {

constexpr const char* module_name = "placeholder_mapping";

auto serialization_error(const std::string& message) -> Result<placeholder_mapping> {
    return piiguard_error<placeholder_mapping>(error_codes::mapping_serialization_error,
                                               message, module_name);
}

} // namespace

auto placeholder_mapping::add(std::string label, std::string value) -> VoidResult {
    if (label.empty()) {
        return piiguard_void_error(error_codes::invalid_input, "Label must not be empty",
                                   module_name);
    }
    if (index_.find(label) != index_.end()) {
        return piiguard_void_error(
            error_codes::duplicate_label,
            piiguard::compat::format("Label already mapped: {}", label), module_name);
    }

    index_.emplace(label, entries_.size());
    entries_.push_back(mapping_entry{std::move(label), std::move(value)});
    return ok();
}

auto placeholder_mapping::find(std::string_view label) const
    -> std::optional<std::string_view> {
    auto it = index_.find(label);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return std::string_view(entries_[it->second].value);
}

auto placeholder_mapping::contains(std::string_view label) const -> bool {
    return index_.find(label) != index_.end();
}

auto placeholder_mapping::merge(const placeholder_mapping& other) -> std::size_t {
    std::size_t added = 0;
    for (const auto& entry : other.entries_) {
        if (contains(entry.label)) {
            continue;
        }
        index_.emplace(entry.label, entries_.size());
        entries_.push_back(entry);
        ++added;
    }
    return added;
}

void placeholder_mapping::clear() noexcept {
    entries_.clear();
    index_.clear();
}

auto placeholder_mapping::to_json() const -> std::string {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : entries_) {
        entries.push_back({{"label", entry.label}, {"value", entry.value}});
    }

    nlohmann::json document;
    document["version"] = format_version;
    document["entries"] = std::move(entries);
    return document.dump();
}

auto placeholder_mapping::from_json(std::string_view json) -> Result<placeholder_mapping> {
    const auto document = nlohmann::json::parse(json.begin(), json.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return serialization_error("Mapping document is not a JSON object");
    }

    const auto version = document.find("version");
    if (version == document.end() || !version->is_number_integer() ||
        version->get<int>() != format_version) {
        return serialization_error("Unsupported mapping format version");
    }

    const auto entries = document.find("entries");
    if (entries == document.end() || !entries->is_array()) {
        return serialization_error("Mapping document has no entries array");
    }

    placeholder_mapping mapping;
    for (const auto& item : *entries) {
        if (!item.is_object() || !item.contains("label") || !item.contains("value") ||
            !item["label"].is_string() || !item["value"].is_string()) {
            return serialization_error("Malformed mapping entry");
        }
        auto added = mapping.add(item["label"].get<std::string>(),
                                 item["value"].get<std::string>());
        if (added.is_err()) {
            return serialization_error(added.error().message);
        }
    }
    return mapping;
}

} // namespace piiguard::anonymization
