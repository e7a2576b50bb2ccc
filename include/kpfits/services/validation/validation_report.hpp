/**
 * @file validation_report.hpp
 * @brief Human-readable transcript and exit status for validation results
 */

#ifndef KPFITS_SERVICES_VALIDATION_VALIDATION_REPORT_HPP
#define KPFITS_SERVICES_VALIDATION_VALIDATION_REPORT_HPP

#include "kpfits/core/fits_segment.hpp"
#include "kpfits/services/validation/kp_validator.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace kpfits::services::validation {

/**
 * @brief Process exit codes
 */
namespace exit_codes {
inline constexpr int passed = 0;          ///< Every file conforms
inline constexpr int failed = 1;          ///< At least one FAIL finding
inline constexpr int unreadable = 2;      ///< File missing or not a FITS container
inline constexpr int usage_error = 3;     ///< Bad arguments or schema misconfiguration
}  // namespace exit_codes

/**
 * @brief Write the transcript for one validated file
 *
 * Output layout:
 * @code
 * validating: kp.fits
 * Segments (2):
 *   [0] PRIMARY    (6, 1, 192, 192)
 *   [1] APERTURE   (105, 3)
 * [FAIL] segment-count-floor: Found 2 segments, at least 7 required
 * ...
 * Result: FAILED - 3 failure(s), 0 warning(s)
 * @endcode
 *
 * @param out Destination stream
 * @param file_id File name as given by the user
 * @param catalog Segments of the file
 * @param result Validation result for the catalog
 */
void write_report(std::ostream& out,
                  std::string_view file_id,
                  const core::segment_catalog& catalog,
                  const validation_result& result);

/**
 * @brief Write only the verdict line ("kp.fits: PASSED - ...")
 */
void write_summary_line(std::ostream& out,
                        std::string_view file_id,
                        const validation_result& result);

/**
 * @brief Write a boundary error for a file that could not be validated
 */
void write_error(std::ostream& out, std::string_view file_id, std::string_view message);

/**
 * @brief Render the transcript to a string
 */
[[nodiscard]] auto format_report(std::string_view file_id,
                                 const core::segment_catalog& catalog,
                                 const validation_result& result) -> std::string;

/**
 * @brief Exit status for a validation result: 0 on PASS, 1 on FAIL
 */
[[nodiscard]] auto exit_status(const validation_result& result) noexcept -> int;

}  // namespace kpfits::services::validation

#endif  // KPFITS_SERVICES_VALIDATION_VALIDATION_REPORT_HPP
