/**
 * @file mock_model_detector.hpp
 * @brief Mock implementation of model_detector for testing
 *
 * Lets tests feed fixed model output into the anonymizer, or simulate a
 * model backend that is unavailable.
 */

#pragma once

#include <piiguard/detection/model_detector.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace piiguard::detection::testing {

/**
 * @brief Mock implementation of model_detector
 *
 * Modes of operation:
 * - **Fixed mode**: Returns the configured spans for every call
 * - **Failing mode**: Returns a detector_unavailable error
 * - **Throwing mode**: Throws std::runtime_error from detect()
 *
 * Thread Safety: All public methods are thread-safe.
 */
class mock_model_detector final : public model_detector {
public:
    enum class behavior {
        fixed,    ///< Return configured spans
        failing,  ///< Return an error result
        throwing  ///< Throw from detect()
    };

    explicit mock_model_detector(behavior mode = behavior::fixed) : mode_(mode) {}

    [[nodiscard]] auto detect(std::string_view /*text*/)
        -> Result<std::vector<model_span>> override {
        ++call_count_;
        std::lock_guard<std::mutex> lock(mutex_);
        switch (mode_) {
            case behavior::failing:
                return piiguard_error<std::vector<model_span>>(
                    error_codes::detector_unavailable, "model backend unreachable",
                    "mock_model_detector");
            case behavior::throwing:
                throw std::runtime_error("model crashed");
            case behavior::fixed:
                break;
        }
        return spans_;
    }

    [[nodiscard]] auto name() const -> std::string override { return "mock_model"; }

    // =========================================================================
    // Test Configuration
    // =========================================================================

    void set_spans(std::vector<model_span> spans) {
        std::lock_guard<std::mutex> lock(mutex_);
        spans_ = std::move(spans);
    }

    void set_behavior(behavior mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = mode;
    }

    [[nodiscard]] auto call_count() const noexcept -> std::size_t { return call_count_.load(); }

private:
    mutable std::mutex mutex_;
    behavior mode_;
    std::vector<model_span> spans_;
    std::atomic<std::size_t> call_count_{0};
};

} // namespace piiguard::detection::testing
