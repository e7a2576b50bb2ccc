/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the kernel-phase validator
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for kpfits, integrating with common_system's Result pattern.
 *
 * Only boundary errors (unreadable files, corrupt containers, schema
 * misconfiguration) travel through Result. Data-quality problems are
 * reported as validation findings instead.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace kpfits {

/**
 * @brief Result type alias for kpfits operations
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
 * @brief kpfits-specific error codes
 *
 * Error code range: -700 to -749
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int kpfits_base = -700;

    // Container errors (-700 to -719)
    constexpr int file_not_found = kpfits_base - 0;
    constexpr int file_read_error = kpfits_base - 1;
    constexpr int invalid_fits_file = kpfits_base - 2;
    constexpr int missing_end_card = kpfits_base - 3;
    constexpr int invalid_header_value = kpfits_base - 4;
    constexpr int truncated_data = kpfits_base - 5;

    // Schema errors (-720 to -739)
    constexpr int unknown_quantity = kpfits_base - 20;
    constexpr int invalid_schema = kpfits_base - 21;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a kpfits error result with module context
 * @tparam T The result value type
 * @param code Error code from kpfits::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> kpfits_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "kpfits");
    }
    return kcenon::common::make_error<T>(code, message, "kpfits", details);
}

/**
 * @brief Create a kpfits void error result
 * @param code Error code from kpfits::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult kpfits_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "kpfits"});
    }
    return VoidResult(error_info{code, message, "kpfits", details});
}

} // namespace kpfits

