/**
 * @file kp_validator.cpp
 * @brief Implementation of the kernel-phase FITS validator
 */

#include "kpfits/services/validation/kp_validator.hpp"

#include <kpfits/compat/format.hpp>
#include <kpfits/integration/logger_adapter.hpp>

#include <algorithm>
#include <set>
#include <sstream>

namespace kpfits::services::validation {

using namespace kpfits::core;
using integration::logger_adapter;

namespace {

/**
 * @brief Render values as "[105, 104]"
 */
template <typename Range>
[[nodiscard]] std::string format_list(const Range& values) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& v : values) {
        if (!first) {
            oss << ", ";
        }
        oss << v;
        first = false;
    }
    oss << "]";
    return oss.str();
}

}  // namespace

auto to_string(validation_severity severity) -> std::string_view {
    switch (severity) {
        case validation_severity::pass:
            return "PASS";
        case validation_severity::fail:
            return "FAIL";
        case validation_severity::warning:
            return "WARNING";
    }
    return "UNKNOWN";
}

// =============================================================================
// validation_result Implementation
// =============================================================================

bool validation_result::has_failures() const noexcept {
    return failure_count() > 0;
}

bool validation_result::has_warnings() const noexcept {
    return warning_count() > 0;
}

size_t validation_result::failure_count() const noexcept {
    return static_cast<size_t>(std::count_if(
        findings.begin(), findings.end(),
        [](const validation_finding& f) { return f.severity == validation_severity::fail; }));
}

size_t validation_result::warning_count() const noexcept {
    return static_cast<size_t>(std::count_if(
        findings.begin(), findings.end(),
        [](const validation_finding& f) { return f.severity == validation_severity::warning; }));
}

std::string validation_result::summary() const {
    std::ostringstream oss;
    oss << (is_valid ? "PASSED" : "FAILED");
    oss << " - " << failure_count() << " failure(s), "
        << warning_count() << " warning(s)";
    return oss.str();
}

// =============================================================================
// kp_validator Implementation
// =============================================================================

kp_validator::kp_validator(format_schema schema, const kp_validation_options& options)
    : schema_(std::move(schema)), options_(options) {}

validation_result kp_validator::validate(const segment_catalog& catalog) const {
    validation_result result;
    result.is_valid = true;

    // Structural checks first, then dimensions; nothing short-circuits
    check_segment_count(catalog, result.findings);
    check_mandatory_segments(catalog, result.findings);
    for (const auto& quantity : schema_.definitions()) {
        check_quantity(catalog, quantity, result.findings);
    }
    check_unknown_segments(catalog, result.findings);

    for (const auto& finding : result.findings) {
        if (finding.severity == validation_severity::fail) {
            result.is_valid = false;
            break;
        }
        if (options_.strict_mode && finding.severity == validation_severity::warning) {
            result.is_valid = false;
            break;
        }
    }

    logger_adapter::debug("Validated {} segment(s) against schema revision {}: {}",
                          catalog.size(), schema_.version(), result.summary());
    return result;
}

const format_schema& kp_validator::schema() const noexcept {
    return schema_;
}

const kp_validation_options& kp_validator::options() const noexcept {
    return options_;
}

void kp_validator::set_options(const kp_validation_options& options) {
    options_ = options;
}

// =============================================================================
// Checks
// =============================================================================

void kp_validator::check_segment_count(const segment_catalog& catalog,
                                       std::vector<validation_finding>& findings) const {
    const auto required = schema_.minimum_segment_count();
    if (catalog.size() < required) {
        findings.push_back({
            validation_severity::fail,
            std::string(check_ids::segment_count_floor),
            compat::format("Found {} segments, at least {} required",
                           catalog.size(), required)
        });
        return;
    }

    findings.push_back({
        validation_severity::pass,
        std::string(check_ids::segment_count_floor),
        compat::format("Found {} segments (minimum {})", catalog.size(), required)
    });
}

void kp_validator::check_mandatory_segments(const segment_catalog& catalog,
                                            std::vector<validation_finding>& findings) const {
    std::vector<std::string> missing;
    for (const auto& name : schema_.mandatory_names()) {
        if (!catalog.contains(name)) {
            missing.push_back(name);
        }
    }

    if (!missing.empty()) {
        findings.push_back({
            validation_severity::fail,
            std::string(check_ids::mandatory_present),
            "Missing mandatory segments: " + format_list(missing)
        });
        return;
    }

    findings.push_back({
        validation_severity::pass,
        std::string(check_ids::mandatory_present),
        compat::format("All {} mandatory segments present",
                       schema_.mandatory_names().size())
    });
}

void kp_validator::check_quantity(const segment_catalog& catalog,
                                  const quantity_definition& quantity,
                                  std::vector<validation_finding>& findings) const {
    const auto check_id = std::string(check_ids::consistency_prefix) + quantity.name;

    // Bindings whose segment is absent take no part; presence is checked above
    std::vector<std::pair<const quantity_binding*, const fits_segment*>> participants;
    for (const auto& binding : quantity.bindings) {
        if (const auto* segment = catalog.find(binding.segment)) {
            participants.emplace_back(&binding, segment);
        }
    }

    if (participants.size() < 2) {
        findings.push_back({
            validation_severity::pass,
            check_id,
            compat::format("Nothing to compare for {}: {} of {} bindings present",
                           quantity.name, participants.size(), quantity.bindings.size())
        });
        return;
    }

    std::vector<std::string> binding_errors;
    for (const auto& [binding, segment] : participants) {
        if (binding->axis >= segment->shape.size()) {
            binding_errors.push_back(compat::format(
                "{} has {} axes, axis {} requested", segment->name,
                segment->shape.size(), binding->axis));
        }
    }

    if (!binding_errors.empty()) {
        std::string message = "Cannot read number of " + quantity.name + ": ";
        for (std::size_t i = 0; i < binding_errors.size(); ++i) {
            if (i > 0) {
                message += "; ";
            }
            message += binding_errors[i];
        }
        findings.push_back({validation_severity::fail, check_id, std::move(message)});
        return;
    }

    std::vector<std::size_t> distinct;
    for (const auto& [binding, segment] : participants) {
        const auto value = segment->shape[binding->axis];
        if (std::find(distinct.begin(), distinct.end(), value) == distinct.end()) {
            distinct.push_back(value);
        }
    }

    if (distinct.size() > 1) {
        findings.push_back({
            validation_severity::fail,
            check_id,
            "Inconsistent number of " + quantity.name + ": " + format_list(distinct)
        });
        return;
    }

    findings.push_back({
        validation_severity::pass,
        check_id,
        compat::format("Consistent number of {}: {} ({} axes compared)",
                       quantity.name, distinct.front(), participants.size())
    });
}

void kp_validator::check_unknown_segments(const segment_catalog& catalog,
                                          std::vector<validation_finding>& findings) const {
    std::set<std::string, std::less<>> reported;
    std::size_t index = 0;
    for (const auto& segment : catalog) {
        const auto position = index++;
        if (schema_.is_known_segment(segment.name)) {
            continue;
        }

        if (segment.name.empty()) {
            findings.push_back({
                validation_severity::warning,
                std::string(check_ids::unknown_segment),
                compat::format("Unnamed segment at index {} is not a standard segment",
                               position)
            });
            continue;
        }

        if (!reported.insert(segment.name).second) {
            continue;
        }
        findings.push_back({
            validation_severity::warning,
            std::string(check_ids::unknown_segment),
            segment.name + " is not a standard segment name"
        });
    }
}

// =============================================================================
// Convenience Functions
// =============================================================================

validation_result validate_kernel_phase(const segment_catalog& catalog) {
    kp_validator validator{kernel_phase_schema()};
    return validator.validate(catalog);
}

}  // namespace kpfits::services::validation
