/**
 * @file config.hpp
 * @brief Command-line configuration for the kp_validate tool
 */

#ifndef KPFITS_EXAMPLE_KP_VALIDATE_CONFIG_HPP
#define KPFITS_EXAMPLE_KP_VALIDATE_CONFIG_HPP

#include <kpfits/integration/logger_adapter.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kpfits::example {

/**
 * @brief Logging configuration
 */
struct logging_config {
    /// Minimum level written to the console (and log file)
    integration::log_level level{integration::log_level::warn};

    /// Directory for kpfits.log and audit.json (empty for console only)
    std::filesystem::path directory;
};

/**
 * @brief Complete kp_validate configuration
 */
struct validator_config {
    /// Files to validate, in command-line order
    std::vector<std::filesystem::path> files;

    /// Treat warnings as failures
    bool strict{false};

    /// Print only the verdict line per file
    bool quiet{false};

    /// Logging settings
    logging_config logging;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --strict                Warnings make the verdict FAIL
     *   --quiet, -q             Only print the verdict line per file
     *   --log-level <level>     Log level (default: warn)
     *   --log-dir <path>        Write kpfits.log and audit.json here
     *   --help, -h              Show help message
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<validator_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace kpfits::example

#endif  // KPFITS_EXAMPLE_KP_VALIDATE_CONFIG_HPP
