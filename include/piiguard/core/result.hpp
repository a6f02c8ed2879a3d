/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for piiguard
 *
 * Every fallible piiguard operation reports failure through common_system's
 * Result pattern. The error codes below are typed constants so that callers
 * can branch on the failure kind (for example a corrupt stored mapping versus
 * a missing one) instead of parsing messages.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace piiguard {

/**
 * @brief Result type alias for piiguard operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief piiguard-specific error codes
 *
 * Error code range: -600 to -719
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int piiguard_base = -600;

    // Detection errors (-600 to -619)
    constexpr int invalid_span = piiguard_base - 0;
    constexpr int overlapping_entities = piiguard_base - 1;
    constexpr int detector_unavailable = piiguard_base - 2;
    constexpr int invalid_input = piiguard_base - 3;

    // Transform errors (-620 to -639)
    constexpr int unknown_mode = piiguard_base - 20;
    constexpr int transform_failed = piiguard_base - 21;

    // Mapping errors (-640 to -659)
    constexpr int mapping_corrupt = piiguard_base - 40;
    constexpr int mapping_not_found = piiguard_base - 41;
    constexpr int duplicate_label = piiguard_base - 42;
    constexpr int mapping_serialization_error = piiguard_base - 43;

    // Crypto errors (-660 to -679)
    constexpr int invalid_secret = piiguard_base - 60;
    constexpr int key_derivation_failed = piiguard_base - 61;
    constexpr int encryption_failed = piiguard_base - 62;
    constexpr int random_failed = piiguard_base - 63;

    // Storage errors (-680 to -699)
    constexpr int storage_open_error = piiguard_base - 80;
    constexpr int storage_query_error = piiguard_base - 81;
    constexpr int invalid_storage_key = piiguard_base - 82;

    // Configuration errors (-700 to -719)
    constexpr int config_parse_error = piiguard_base - 100;
    constexpr int config_invalid_value = piiguard_base - 101;
    constexpr int config_file_not_found = piiguard_base - 102;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a piiguard error result with module context
 * @tparam T The result value type
 * @param code Error code from piiguard::error_codes
 * @param message Error message
 * @param module Component reporting the error
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> piiguard_error(int code, const std::string& message,
                                const std::string& module = "piiguard") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create a piiguard void error result
 * @param code Error code from piiguard::error_codes
 * @param message Error message
 * @param module Component reporting the error
 * @return VoidResult containing the error
 */
inline VoidResult piiguard_void_error(int code, const std::string& message,
                                      const std::string& module = "piiguard") {
    return VoidResult(error_info{code, message, module});
}

} // namespace piiguard
