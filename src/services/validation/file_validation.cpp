/**
 * @file file_validation.cpp
 * @brief Implementation of file-level validation
 */

#include "kpfits/services/validation/file_validation.hpp"

#include "kpfits/core/fits_file.hpp"
#include "kpfits/integration/logger_adapter.hpp"
#include "kpfits/services/validation/validation_report.hpp"

#include <algorithm>

namespace kpfits::services::validation {

using integration::logger_adapter;

auto validate_file(std::ostream& out,
                   const std::filesystem::path& path,
                   const kp_validator& validator,
                   const file_validation_options& options) -> int {
    const auto file_id = path.string();

    if (!std::filesystem::exists(path)) {
        out << file_id << " does not exist.\n";
        logger_adapter::log_validation_error(file_id, "file does not exist");
        return exit_codes::unreadable;
    }

    auto file = core::fits_file::open(path);
    if (file.is_err()) {
        write_error(out, file_id, file.error().message);
        logger_adapter::log_validation_error(file_id, file.error().message);
        return exit_codes::unreadable;
    }

    const auto& catalog = file.value().catalog();
    const auto result = validator.validate(catalog);

    if (options.quiet) {
        write_summary_line(out, file_id, result);
    } else {
        write_report(out, file_id, catalog, result);
    }

    logger_adapter::log_validation_completed(file_id, result.is_valid,
                                             result.failure_count(),
                                             result.warning_count());
    return exit_status(result);
}

auto validate_files(std::ostream& out,
                    std::span<const std::filesystem::path> files,
                    const kp_validator& validator,
                    const file_validation_options& options) -> int {
    int exit_code = exit_codes::passed;
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (i > 0 && !options.quiet) {
            out << "\n";
        }
        exit_code = std::max(exit_code, validate_file(out, files[i], validator, options));
    }
    return exit_code;
}

}  // namespace kpfits::services::validation
