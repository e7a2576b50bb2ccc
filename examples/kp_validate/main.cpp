/**
 * @file main.cpp
 * @brief Kernel Phase FITS Validator - command-line entry point
 *
 * Validates that FITS files containing kernel phases follow the
 * kernel-phase interchange format: enough segments, every mandatory
 * segment present, and shared dimensions agreeing across segments.
 *
 * Usage:
 *   kp_validate <file> [<file> ...] [options]
 *
 * Example:
 *   kp_validate my_file.fits
 *   kp_validate my_file1.fits my_file2.fits --strict
 */

#include "config.hpp"

#include <kpfits/integration/logger_adapter.hpp>
#include <kpfits/services/validation/file_validation.hpp>
#include <kpfits/services/validation/format_schema.hpp>
#include <kpfits/services/validation/kp_validator.hpp>
#include <kpfits/services/validation/validation_report.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    using kpfits::integration::logger_adapter;
    namespace validation = kpfits::services::validation;

    auto config = kpfits::example::validator_config::parse_args(argc, argv);
    if (!config) {
        return validation::exit_codes::usage_error;
    }

    kpfits::integration::logger_config log_config;
    log_config.min_level = config->logging.level;
    log_config.log_directory = config->logging.directory;
    logger_adapter::initialize(log_config);

    const auto& schema = validation::kernel_phase_schema();
    auto schema_check = schema.check();
    if (schema_check.is_err()) {
        std::cerr << "Error: invalid format schema: " << schema_check.error().message << "\n";
        logger_adapter::shutdown();
        return validation::exit_codes::usage_error;
    }

    validation::kp_validation_options options;
    options.strict_mode = config->strict;
    validation::kp_validator validator{schema, options};

    logger_adapter::info("Validating {} file(s) against schema revision {}",
                         config->files.size(), schema.version());

    validation::file_validation_options output;
    output.quiet = config->quiet;
    const int exit_code = validation::validate_files(std::cout, config->files, validator, output);

    logger_adapter::shutdown();
    return exit_code;
}
