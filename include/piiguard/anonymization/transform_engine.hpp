/**
 * @file transform_engine.hpp
 * @brief Rewrites resolved entities in one of the anonymization modes
 *
 * The engine makes one left-to-right pass over a disjoint, sorted entity
 * set while tracking the running offset between source and output, and
 * records where every substitution landed in the output.
 */

#pragma once

#include "piiguard/anonymization/anonymization_mode.hpp"
#include "piiguard/anonymization/placeholder_mapping.hpp"
#include "piiguard/core/entity.hpp"
#include "piiguard/core/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace piiguard::anonymization {

/**
 * @struct substitution
 * @brief Where one entity was replaced, in source and output coordinates
 */
struct substitution {
    core::span source;
    core::span output;
    core::entity_type type{core::entity_type::generic};
    std::string replacement;
};

/**
 * @struct transform_result
 * @brief Output text, mapping (pseudonymize only) and substitution records
 */
struct transform_result {
    std::string text;
    placeholder_mapping mapping;
    std::vector<substitution> substitutions;
};

/**
 * @class transform_engine
 * @brief Stateless rewriter; the label cache lives for one call only
 */
class transform_engine {
public:
    /**
     * @brief Rewrite every entity in the text
     *
     * @param text Original text
     * @param entities Disjoint entities sorted by start offset
     * @param mode Substitution mode
     * @return Transformed text, or error_codes::invalid_span /
     *         error_codes::overlapping_entities when the entity set breaks
     *         its ordering or bounds invariants
     */
    [[nodiscard]] auto transform(std::string_view text,
                                 const std::vector<core::resolved_entity>& entities,
                                 anonymization_mode mode) const -> Result<transform_result>;
};

} // namespace piiguard::anonymization
