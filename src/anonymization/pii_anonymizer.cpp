/**
 * @file pii_anonymizer.cpp
 * @brief Implementation of the anonymization facade
 */

#include "piiguard/anonymization/pii_anonymizer.hpp"

#include "piiguard/core/text_utils.hpp"
#include "piiguard/detection/gazetteer_model_detector.hpp"
#include "piiguard/integration/logger_adapter.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

namespace piiguard::anonymization {

using integration::logger_adapter;

namespace {

constexpr const char* module_name = "pii_anonymizer";

} // namespace

pii_anonymizer::pii_anonymizer(anonymizer_options options,
                               std::shared_ptr<detection::model_detector> model)
    : options_(options),
      patterns_(detection::pattern_detector_options{options.context_window}),
      resolver_(options.duplicate_overlap_threshold),
      model_(std::move(model)) {
    if (!options_.enable_model_detector) {
        model_.reset();
    } else if (!model_) {
        model_ = std::make_shared<detection::gazetteer_model_detector>();
    }
}

auto pii_anonymizer::model_name() const -> std::string {
    return model_ ? model_->name() : std::string{};
}

// =============================================================================
// Detection
// =============================================================================

auto pii_anonymizer::run_model(std::string_view text, detection_report& report) const
    -> std::vector<core::candidate> {
    if (!model_) {
        return {};
    }

    auto degrade = [&](const std::string& reason) {
        report.degraded = true;
        report.model_status = error_info{error_codes::detector_unavailable, reason,
                                         model_->name()};
        logger_adapter::log_detector_degraded(model_->name(), reason);
    };

    try {
        auto spans = model_->detect(text);
        if (spans.is_err()) {
            degrade(spans.error().message);
            return {};
        }
        return detection::to_candidates(text, spans.value());
    } catch (const std::exception& e) {
        degrade(e.what());
        return {};
    }
}

auto pii_anonymizer::detect(std::string_view text) const -> detection_result {
    detection_result result;

    if (!core::is_valid_utf8(text)) {
        result.report.input_rejected = true;
        logger_adapter::warn("Rejected input of {} bytes: not valid UTF-8", text.size());
        return result;
    }
    if (core::is_blank(text)) {
        return result;
    }

    auto candidates = patterns_.detect(text);
    result.report.pattern_candidates = candidates.size();

    auto model_candidates = run_model(text, result.report);
    result.report.model_candidates = model_candidates.size();
    candidates.insert(candidates.end(), std::make_move_iterator(model_candidates.begin()),
                      std::make_move_iterator(model_candidates.end()));

    result.entities = resolver_.resolve(std::move(candidates));

    logger_adapter::debug("Detection found {} entities ({} pattern, {} model candidates)",
                          result.entities.size(), result.report.pattern_candidates,
                          result.report.model_candidates);
    return result;
}

// =============================================================================
// Anonymization
// =============================================================================

auto pii_anonymizer::anonymize(std::string_view text, anonymization_mode mode) const
    -> Result<anonymize_result> {
    auto detected = detect(text);

    auto transformed = engine_.transform(text, detected.entities, mode);
    if (transformed.is_err()) {
        logger_adapter::error("Anonymization failed: {}", transformed.error().message);
        return piiguard_error<anonymize_result>(transformed.error().code,
                                                transformed.error().message, module_name);
    }

    anonymize_result result;
    result.anonymized_text = transformed.value().text;
    result.mapping = transformed.value().mapping;
    result.substitutions = transformed.value().substitutions;
    result.report = std::move(detected.report);
    for (const auto& entity : detected.entities) {
        ++result.entity_counts[entity.type];
    }

    logger_adapter::log_anonymization_performed(to_string(mode), detected.entities.size(),
                                                result.report.degraded);
    return result;
}

auto pii_anonymizer::anonymize_and_store(std::string_view text,
                                         anonymization_mode mode,
                                         storage::mapping_store_interface& store,
                                         std::string_view key) const
    -> Result<anonymize_result> {
    auto result = anonymize(text, mode);
    if (result.is_err()) {
        return result;
    }

    const auto& mapping = result.value().mapping;
    if (mode != anonymization_mode::pseudonymize || mapping.empty()) {
        return result;
    }

    auto saved = store.save(key, mapping);
    if (saved.is_err()) {
        return piiguard_error<anonymize_result>(saved.error().code, saved.error().message,
                                                module_name);
    }
    return result;
}

// =============================================================================
// Restoration
// =============================================================================

auto pii_anonymizer::deanonymize(std::string_view text, const placeholder_mapping& mapping) const
    -> deanonymize_result {
    auto restored = restorer_.restore(text, mapping);
    logger_adapter::debug("Restored {} labels", restored.substitutions);
    return restored;
}

auto pii_anonymizer::deanonymize_from_store(std::string_view text,
                                            storage::mapping_store_interface& store,
                                            std::string_view key) const
    -> Result<deanonymize_result> {
    auto mapping = store.load(key);
    if (mapping.is_err()) {
        return piiguard_error<deanonymize_result>(mapping.error().code,
                                                  mapping.error().message, module_name);
    }

    logger_adapter::log_security_event(integration::security_event_type::data_export,
                                       "Anonymized text restored from stored mapping",
                                       std::string(key));
    return deanonymize(text, mapping.value());
}

// =============================================================================
// Reporting
// =============================================================================

auto pii_anonymizer::preview(std::string_view text) const -> preview_result {
    auto detected = detect(text);

    preview_result result;
    result.report = std::move(detected.report);
    result.total = detected.entities.size();

    for (const auto& entity : detected.entities) {
        auto group = std::find_if(result.groups.begin(), result.groups.end(),
                                  [&](const preview_group& g) { return g.type == entity.type; });
        if (group == result.groups.end()) {
            result.groups.push_back(
                preview_group{entity.type, std::string(core::human_label(entity.type)), 0, {}});
            group = std::prev(result.groups.end());
        }

        ++group->count;
        if (group->examples.size() < options_.preview_examples &&
            std::find(group->examples.begin(), group->examples.end(), entity.text) ==
                group->examples.end()) {
            group->examples.push_back(entity.text);
        }
    }
    return result;
}

auto pii_anonymizer::detection_stats(std::string_view text) const
    -> std::map<std::string, std::size_t> {
    std::map<std::string, std::size_t> stats;
    for (const auto& entity : detect(text).entities) {
        ++stats[std::string(core::human_label(entity.type))];
    }
    return stats;
}

} // namespace piiguard::anonymization
