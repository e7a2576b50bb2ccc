/**
 * @file logger_adapter.hpp
 * @brief Validator logging on top of logger_system
 *
 * Diagnostic messages go to logger_system writers (console, and a rotating
 * kpfits.log when a log directory is configured). Each validated file also
 * leaves one JSON line in audit.json in that directory.
 */

#pragma once

#include <kpfits/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kpfits::integration {

/**
 * @enum log_level
 * @brief Log severity levels, lowest first
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5
};

/**
 * @brief Parse a level name as given to --log-level
 *
 * Accepts "trace", "debug", "info", "warn" (or "warning"), "error", "off".
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

/**
 * @struct logger_config
 * @brief Where and how much the validator logs
 */
struct logger_config {
    /// Messages below this level are discarded
    log_level min_level{log_level::warn};

    /// Write messages to the console
    bool enable_console{true};

    /// Directory for kpfits.log and audit.json; empty keeps both off
    std::filesystem::path log_directory;

    /// kpfits.log rotation threshold in megabytes
    std::size_t max_file_size_mb{10};

    /// Rotated kpfits.log files to keep
    std::size_t max_files{5};
};

/**
 * @struct validation_audit_record
 * @brief One audit.json entry
 */
struct validation_audit_record {
    std::string file;
    std::string outcome;  ///< "pass", "fail" or "error"
    std::size_t failures{0};
    std::size_t warnings{0};
    std::string reason;  ///< Boundary error text, empty otherwise
};

/**
 * @brief Render a record as a single JSON object (no trailing newline)
 *
 * Fields appear in a fixed order: timestamp, event, file, outcome, then
 * failures/warnings for completed validations or reason for errors.
 */
[[nodiscard]] auto to_json_line(const validation_audit_record& record,
                                std::string_view timestamp) -> std::string;

/**
 * @class logger_adapter
 * @brief Process-wide logging entry points for kpfits
 *
 * Calls made before initialize() or after shutdown() are dropped, so
 * library code logs unconditionally. Thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "logs";
 * logger_adapter::initialize(config);
 * logger_adapter::info("Validating {} file(s)", files.size());
 * logger_adapter::log_validation_completed("kp.fits", false, 1, 0);
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Start logging; a second call while running is ignored
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush and stop; safe to call when not initialized
     */
    static void shutdown();

    template <typename... Args>
    static void trace(kpfits::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, kpfits::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(kpfits::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, kpfits::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(kpfits::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::info)) {
            log(log_level::info, kpfits::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(kpfits::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::warn)) {
            log(log_level::warn, kpfits::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void error(kpfits::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::error)) {
            log(log_level::error, kpfits::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    static void log(log_level level, const std::string& message);

    /**
     * @brief true if a message at this level would reach a writer
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Record a finished validation (info log + audit entry)
     */
    static void log_validation_completed(const std::string& file,
                                         bool passed,
                                         std::size_t failures,
                                         std::size_t warnings);

    /**
     * @brief Record a file that could not be validated (debug log + audit entry)
     *
     * The CLI already prints the reason, so the console copy stays below the
     * default level.
     */
    static void log_validation_error(const std::string& file, const std::string& reason);
};

}  // namespace kpfits::integration
