/**
 * @file placeholder_mapping.hpp
 * @brief Reversible Label -> original value association
 *
 * A placeholder mapping is produced by one pseudonymize run and owned by its
 * result. Entries keep their insertion order so that serialisation is
 * stable; labels are unique.
 *
 * Serialised form:
 * @code
 * {"version":1,"entries":[{"label":"email_1","value":"a@b.com"}]}
 * @endcode
 */

#pragma once

#include "piiguard/core/result.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::anonymization {

/**
 * @struct mapping_entry
 * @brief One label and the original text it stands for
 */
struct mapping_entry {
    std::string label;
    std::string value;

    auto operator==(const mapping_entry& other) const -> bool = default;
};

/**
 * @class placeholder_mapping
 * @brief Insertion-ordered label table
 *
 * Not synchronised; a mapping belongs to a single call.
 */
class placeholder_mapping {
public:
    /// Serialisation format version
    static constexpr int format_version = 1;

    placeholder_mapping() = default;

    /**
     * @brief Add a label
     * @return Error with error_codes::duplicate_label if the label exists
     */
    [[nodiscard]] auto add(std::string label, std::string value) -> VoidResult;

    /**
     * @brief Look up the original value of a label
     */
    [[nodiscard]] auto find(std::string_view label) const -> std::optional<std::string_view>;

    [[nodiscard]] auto contains(std::string_view label) const -> bool;

    /**
     * @brief Add every entry of another mapping whose label is not present
     *
     * Existing entries are never overwritten.
     *
     * @return Number of entries added
     */
    auto merge(const placeholder_mapping& other) -> std::size_t;

    [[nodiscard]] auto entries() const noexcept -> const std::vector<mapping_entry>& {
        return entries_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    void clear() noexcept;

    /**
     * @brief Serialise to the versioned JSON document
     */
    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Parse a versioned JSON document
     * @return Mapping, or error_codes::mapping_serialization_error
     */
    [[nodiscard]] static auto from_json(std::string_view json) -> Result<placeholder_mapping>;

    auto operator==(const placeholder_mapping& other) const -> bool {
        return entries_ == other.entries_;
    }

private:
    std::vector<mapping_entry> entries_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace piiguard::anonymization
