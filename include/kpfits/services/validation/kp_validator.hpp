/**
 * @file kp_validator.hpp
 * @brief Kernel-phase FITS structure and consistency validator
 *
 * Checks a segment catalog against a format_schema: the segment count
 * floor, presence of mandatory segments, agreement of every shared
 * dimension across the segments that encode it, and unrecognized segment
 * names. Every check always runs, so one pass reports every problem.
 */

#ifndef KPFITS_SERVICES_VALIDATION_KP_VALIDATOR_HPP
#define KPFITS_SERVICES_VALIDATION_KP_VALIDATOR_HPP

#include "kpfits/core/fits_segment.hpp"
#include "kpfits/services/validation/format_schema.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kpfits::services::validation {

// =============================================================================
// Validation Result Types
// =============================================================================

/**
 * @brief Outcome of a single check
 */
enum class validation_severity {
    pass,     ///< Check satisfied
    fail,     ///< File does not conform
    warning   ///< Informational, does not affect the verdict
};

/**
 * @brief Upper-case label used in reports ("PASS", "FAIL", "WARNING")
 */
[[nodiscard]] auto to_string(validation_severity severity) -> std::string_view;

/**
 * @brief Single validation finding
 */
struct validation_finding {
    validation_severity severity;  ///< Outcome of the check
    std::string check_id;          ///< Stable identifier, e.g. "consistency:kernels"
    std::string message;           ///< Human-readable detail
};

/**
 * @brief Result of validating one file
 */
struct validation_result {
    bool is_valid;                             ///< Overall verdict
    std::vector<validation_finding> findings;  ///< In check execution order

    [[nodiscard]] bool has_failures() const noexcept;

    [[nodiscard]] bool has_warnings() const noexcept;

    [[nodiscard]] size_t failure_count() const noexcept;

    [[nodiscard]] size_t warning_count() const noexcept;

    /**
     * @brief One-line summary, e.g. "FAILED - 1 failure(s), 0 warning(s)"
     */
    [[nodiscard]] std::string summary() const;
};

// =============================================================================
// Check Identifiers
// =============================================================================

namespace check_ids {
inline constexpr std::string_view segment_count_floor = "segment-count-floor";
inline constexpr std::string_view mandatory_present = "mandatory-hdus-present";
inline constexpr std::string_view consistency_prefix = "consistency:";
inline constexpr std::string_view unknown_segment = "unknown-segment";
}  // namespace check_ids

// =============================================================================
// Validation Options
// =============================================================================

/**
 * @brief Options for kernel-phase validation
 */
struct kp_validation_options {
    /// Strict mode - warnings also make the verdict FAIL
    bool strict_mode = false;
};

// =============================================================================
// Kernel-phase Validator
// =============================================================================

/**
 * @brief Validator for kernel-phase FITS files
 *
 * The validator holds its own copy of the schema and has no mutable state,
 * so one instance may validate any number of catalogs, from any thread.
 *
 * ## Checks, in order
 * 1. segment-count-floor: at least schema.minimum_segment_count() segments
 * 2. mandatory-hdus-present: one finding listing every missing name
 * 3. consistency:<quantity>: one finding per schema quantity
 * 4. unknown-segment: one warning per unrecognized name
 *
 * @example
 * @code
 * kp_validator validator{kernel_phase_schema()};
 * auto result = validator.validate(file.catalog());
 *
 * if (!result.is_valid) {
 *     for (const auto& finding : result.findings) {
 *         std::cerr << finding.check_id << ": " << finding.message << "\n";
 *     }
 * }
 * @endcode
 */
class kp_validator {
public:
    /**
     * @brief Construct validator for a schema
     * @param schema Format description to check against
     * @param options Validation options
     */
    explicit kp_validator(format_schema schema,
                          const kp_validation_options& options = {});

    /**
     * @brief Run every check against a catalog
     *
     * @param catalog Segments of the file under test
     * @return Validation result with all findings
     */
    [[nodiscard]] validation_result validate(const core::segment_catalog& catalog) const;

    [[nodiscard]] const format_schema& schema() const noexcept;

    [[nodiscard]] const kp_validation_options& options() const noexcept;

    void set_options(const kp_validation_options& options);

private:
    void check_segment_count(const core::segment_catalog& catalog,
                             std::vector<validation_finding>& findings) const;

    void check_mandatory_segments(const core::segment_catalog& catalog,
                                  std::vector<validation_finding>& findings) const;

    void check_quantity(const core::segment_catalog& catalog,
                        const quantity_definition& quantity,
                        std::vector<validation_finding>& findings) const;

    void check_unknown_segments(const core::segment_catalog& catalog,
                                std::vector<validation_finding>& findings) const;

    format_schema schema_;
    kp_validation_options options_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/**
 * @brief Validate a catalog against the kernel-phase schema with default options
 */
[[nodiscard]] validation_result validate_kernel_phase(const core::segment_catalog& catalog);

}  // namespace kpfits::services::validation

#endif  // KPFITS_SERVICES_VALIDATION_KP_VALIDATOR_HPP
