/**
 * @file logger_adapter.cpp
 * @brief Implementation of validator logging
 */

#include <kpfits/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <memory>
#include <mutex>

namespace kpfits::integration {

namespace {

constexpr std::size_t bytes_per_mb = 1024 * 1024;
constexpr std::size_t message_buffer_size = 8192;

/**
 * @brief Everything initialize() sets up; reset by shutdown()
 */
struct logging_state {
    std::mutex mutex;
    std::atomic<log_level> threshold{log_level::off};
    std::unique_ptr<kcenon::logger::logger> logger;
    std::filesystem::path audit_path;
};

auto state() -> logging_state& {
    static logging_state instance;
    return instance;
}

[[nodiscard]] auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::off: break;
    }
    return kcenon::logger::log_level::off;
}

/// UTC, second resolution: 2024-05-01T12:00:00Z
[[nodiscard]] auto utc_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    std::array<char, 32> buffer{};
    const auto length = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer.data(), length);
}

[[nodiscard]] auto json_string(std::string_view text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += kpfits::compat::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

void append_audit_line(const validation_audit_record& record) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.audit_path.empty()) {
        return;
    }

    std::ofstream audit(s.audit_path, std::ios::app);
    if (!audit) {
        if (s.logger) {
            s.logger->log(kcenon::logger::log_level::warn,
                          "Cannot append to " + s.audit_path.string());
        }
        return;
    }
    audit << to_json_line(record, utc_timestamp()) << '\n';
}

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "off") return log_level::off;
    return std::nullopt;
}

auto to_json_line(const validation_audit_record& record, std::string_view timestamp)
    -> std::string {
    const bool is_error = record.outcome == "error";
    auto line = kpfits::compat::format(
        "{{\"timestamp\":{},\"event\":{},\"file\":{},\"outcome\":{}", json_string(timestamp),
        json_string(is_error ? "VALIDATION_ERROR" : "VALIDATION_COMPLETED"),
        json_string(record.file), json_string(record.outcome));
    if (is_error) {
        line += kpfits::compat::format(",\"reason\":{}}}", json_string(record.reason));
    } else {
        line += kpfits::compat::format(",\"failures\":{},\"warnings\":{}}}", record.failures,
                                       record.warnings);
    }
    return line;
}

// =============================================================================
// Lifecycle
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        return;
    }

    // Synchronous: transcript and log lines share the console
    auto logger = std::make_unique<kcenon::logger::logger>(false, message_buffer_size);
    logger->set_min_level(to_logger_level(config.min_level));

    if (config.enable_console) {
        logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }

    if (!config.log_directory.empty()) {
        std::filesystem::create_directories(config.log_directory);
        logger->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
            (config.log_directory / "kpfits.log").string(),
            config.max_file_size_mb * bytes_per_mb, config.max_files));
        s.audit_path = config.log_directory / "audit.json";
    }

    logger->start();
    s.logger = std::move(logger);
    s.threshold.store(config.min_level);
}

void logger_adapter::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.threshold.store(log_level::off);
    s.audit_path.clear();
    if (s.logger) {
        s.logger->flush();
        s.logger->stop();
        s.logger.reset();
    }
}

// =============================================================================
// Messages
// =============================================================================

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    const auto threshold = state().threshold.load();
    return level != log_level::off && threshold != log_level::off &&
           static_cast<int>(level) >= static_cast<int>(threshold);
}

void logger_adapter::log(log_level level, const std::string& message) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->log(to_logger_level(level), message);
    }
}

// =============================================================================
// Audit Trail
// =============================================================================

void logger_adapter::log_validation_completed(const std::string& file,
                                              bool passed,
                                              std::size_t failures,
                                              std::size_t warnings) {
    info("{}: {} ({} failure(s), {} warning(s))", file, passed ? "passed" : "failed",
         failures, warnings);
    append_audit_line({file, passed ? "pass" : "fail", failures, warnings, {}});
}

void logger_adapter::log_validation_error(const std::string& file, const std::string& reason) {
    debug("{}: not validated: {}", file, reason);
    append_audit_line({file, "error", 0, 0, reason});
}

}  // namespace kpfits::integration
