/**
 * @file file_validation.hpp
 * @brief Validate files on disk and fold their outcomes into an exit code
 */

#ifndef KPFITS_SERVICES_VALIDATION_FILE_VALIDATION_HPP
#define KPFITS_SERVICES_VALIDATION_FILE_VALIDATION_HPP

#include "kpfits/services/validation/kp_validator.hpp"

#include <filesystem>
#include <ostream>
#include <span>

namespace kpfits::services::validation {

/**
 * @brief Output options for file validation
 */
struct file_validation_options {
    /// Print only the verdict line instead of the full transcript
    bool quiet{false};
};

/**
 * @brief Read, validate and report one file
 *
 * A missing path prints "<file> does not exist."; a file that is not a
 * readable FITS container prints the reader's error. Both are recorded in
 * the audit trail and return exit_codes::unreadable.
 *
 * @return exit_codes::passed, exit_codes::failed or exit_codes::unreadable
 */
[[nodiscard]] auto validate_file(std::ostream& out,
                                 const std::filesystem::path& path,
                                 const kp_validator& validator,
                                 const file_validation_options& options = {}) -> int;

/**
 * @brief Validate files in order and return the most severe exit code
 *
 * Every file is processed even after a failure. An unreadable file (2)
 * outranks a failed validation (1), which outranks a pass (0). Full
 * transcripts are separated by a blank line.
 *
 * @example
 * @code
 * kp_validator validator{kernel_phase_schema()};
 * std::vector<std::filesystem::path> files{"a.fits", "b.fits"};
 * int code = validate_files(std::cout, files, validator);
 * @endcode
 */
[[nodiscard]] auto validate_files(std::ostream& out,
                                  std::span<const std::filesystem::path> files,
                                  const kp_validator& validator,
                                  const file_validation_options& options = {}) -> int;

}  // namespace kpfits::services::validation

#endif  // KPFITS_SERVICES_VALIDATION_FILE_VALIDATION_HPP
