/**
 * @file config.cpp
 * @brief Command-line configuration implementation for kp_validate
 */

#include "config.hpp"

#include <iostream>
#include <string_view>

namespace kpfits::example {

void validator_config::print_help() {
    std::cout << R"(
Kernel Phase FITS Validator

Usage: kp_validate <file> [<file> ...] [OPTIONS]

Arguments:
  file                    Kernel-phase FITS file(s) to validate

Options:
  --strict                Treat warnings as failures
  --quiet, -q             Print only the verdict line for each file
  --log-level <level>     Log level: trace, debug, info, warn, error, off
                          (default: warn)
  --log-dir <path>        Write kpfits.log and the audit trail (audit.json)
  --help, -h              Show this help message

Exit Codes:
  0  Every file conforms
  1  At least one file failed validation
  2  A file does not exist or is not a readable FITS file
  3  Invalid arguments

Examples:
  kp_validate my_file.fits
  kp_validate my_file1.fits my_file2.fits --strict
  kp_validate data/*.fits --quiet --log-dir ./logs
)";
}

auto validator_config::parse_args(int argc, char* argv[])
    -> std::optional<validator_config> {

    validator_config config;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--strict") {
            config.strict = true;
            continue;
        }

        if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-level requires a value\n";
                return std::nullopt;
            }
            const std::string_view level = argv[++i];
            auto parsed = integration::parse_log_level(level);
            if (!parsed) {
                std::cerr << "Error: Invalid log level: " << level << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, off\n";
                return std::nullopt;
            }
            config.logging.level = *parsed;
            continue;
        }

        if (arg == "--log-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-dir requires a value\n";
                return std::nullopt;
            }
            config.logging.directory = argv[++i];
            continue;
        }

        if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }

        config.files.emplace_back(arg);
    }

    if (config.files.empty()) {
        std::cerr << "Error: no files provided.\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace kpfits::example
