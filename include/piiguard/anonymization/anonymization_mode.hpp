/**
 * @file anonymization_mode.hpp
 * @brief Substitution modes supported by the transform engine
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace piiguard::anonymization {

/**
 * @brief How detected entities are rewritten
 */
enum class anonymization_mode : std::uint8_t {
    /**
     * @brief Replace each entity with a reversible label ("name_1")
     *
     * The only mode that produces a mapping. Identical values of the same
     * type share a label within one run.
     */
    pseudonymize = 0,

    /**
     * @brief Partially reveal each entity ("jo**@example.com")
     *
     * Irreversible; the mapping is always empty.
     */
    mask = 1,

    /**
     * @brief Replace each entity with its bracketed type ("[Person Name]")
     *
     * Irreversible; the mapping is always empty.
     */
    replace = 2
};

[[nodiscard]] constexpr auto to_string(anonymization_mode mode) noexcept -> std::string_view {
    switch (mode) {
        case anonymization_mode::pseudonymize:
            return "pseudonymize";
        case anonymization_mode::mask:
            return "mask";
        case anonymization_mode::replace:
            return "replace";
    }
    return "unknown";
}

/**
 * @brief Parse a mode from its name
 * @param name "pseudonymize", "mask" or "replace"
 * @return Optional containing the mode, or nullopt if invalid
 */
[[nodiscard]] inline auto mode_from_string(std::string_view name)
    -> std::optional<anonymization_mode> {
    if (name == "pseudonymize") return anonymization_mode::pseudonymize;
    if (name == "mask") return anonymization_mode::mask;
    if (name == "replace") return anonymization_mode::replace;
    return std::nullopt;
}

} // namespace piiguard::anonymization
