/**
 * @file transform_engine.cpp
 * @brief Implementation of the single-pass entity rewriter
 */

#include "piiguard/anonymization/transform_engine.hpp"

#include "piiguard/anonymization/label_allocator.hpp"
#include "piiguard/anonymization/mask_rules.hpp"

#include <piiguard/compat/format.hpp>

namespace piiguard::anonymization {

namespace {

constexpr const char* module_name = "transform_engine";

} // namespace

auto transform_engine::transform(std::string_view text,
                                 const std::vector<core::resolved_entity>& entities,
                                 anonymization_mode mode) const -> Result<transform_result> {
    transform_result result;
    result.text.reserve(text.size());
    result.substitutions.reserve(entities.size());

    label_allocator labels(text);
    std::size_t cursor = 0;

    for (const auto& entity : entities) {
        const auto& location = entity.location;
        if (!location.valid_for(text.size())) {
            return piiguard_error<transform_result>(
                error_codes::invalid_span,
                piiguard::compat::format("Entity span [{}, {}) outside text of {} bytes",
                                         location.start, location.end, text.size()),
                module_name);
        }
        if (location.start < cursor) {
            return piiguard_error<transform_result>(
                error_codes::overlapping_entities,
                piiguard::compat::format("Entity at {} overlaps or precedes offset {}",
                                         location.start, cursor),
                module_name);
        }

        const std::string original(text.substr(location.start, location.length()));
        std::string replacement;
        switch (mode) {
            case anonymization_mode::pseudonymize: {
                auto allocated = labels.allocate(entity.type, original);
                if (allocated.created) {
                    auto added = result.mapping.add(allocated.label, original);
                    if (added.is_err()) {
                        return piiguard_error<transform_result>(
                            error_codes::transform_failed, added.error().message, module_name);
                    }
                }
                replacement = std::move(allocated.label);
                break;
            }
            case anonymization_mode::mask:
                replacement = mask_value(entity.type, original);
                break;
            case anonymization_mode::replace:
                replacement = replacement_label(entity.type);
                break;
            default:
                return piiguard_error<transform_result>(
                    error_codes::unknown_mode,
                    piiguard::compat::format("Unknown anonymization mode {}",
                                             static_cast<int>(mode)),
                    module_name);
        }

        result.text.append(text.substr(cursor, location.start - cursor));
        const auto output_start = result.text.size();
        result.text.append(replacement);

        result.substitutions.push_back(substitution{
            location, core::span{output_start, result.text.size()}, entity.type,
            std::move(replacement)});
        cursor = location.end;
    }

    result.text.append(text.substr(cursor));
    return result;
}

} // namespace piiguard::anonymization
