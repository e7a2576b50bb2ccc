/**
 * @file format_schema.cpp
 * @brief Implementation of the format schema and the kernel-phase table
 */

#include "kpfits/services/validation/format_schema.hpp"

#include <kpfits/compat/format.hpp>

#include <algorithm>
#include <set>

namespace kpfits::services::validation {

namespace {

[[nodiscard]] auto contains_name(const std::vector<std::string>& names,
                                 std::string_view name) noexcept -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

// =============================================================================
// format_schema Implementation
// =============================================================================

format_schema::format_schema(std::string version,
                             std::size_t minimum_segment_count,
                             std::vector<std::string> mandatory_names,
                             std::vector<std::string> optional_names,
                             std::vector<quantity_definition> quantities)
    : version_(std::move(version)),
      minimum_segment_count_(minimum_segment_count),
      mandatory_names_(std::move(mandatory_names)),
      optional_names_(std::move(optional_names)),
      quantities_(std::move(quantities)) {}

auto format_schema::version() const noexcept -> const std::string& {
    return version_;
}

auto format_schema::minimum_segment_count() const noexcept -> std::size_t {
    return minimum_segment_count_;
}

auto format_schema::mandatory_names() const noexcept -> const std::vector<std::string>& {
    return mandatory_names_;
}

auto format_schema::optional_names() const noexcept -> const std::vector<std::string>& {
    return optional_names_;
}

auto format_schema::quantities() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(quantities_.size());
    for (const auto& q : quantities_) {
        names.push_back(q.name);
    }
    return names;
}

auto format_schema::definitions() const noexcept -> const std::vector<quantity_definition>& {
    return quantities_;
}

auto format_schema::bindings_for(std::string_view quantity) const
    -> kpfits::Result<std::vector<quantity_binding>> {
    for (const auto& q : quantities_) {
        if (q.name == quantity) {
            return kpfits::Result<std::vector<quantity_binding>>::ok(q.bindings);
        }
    }
    return kpfits::kpfits_error<std::vector<quantity_binding>>(
        kpfits::error_codes::unknown_quantity,
        compat::format("Unknown quantity '{}' in schema revision {}", quantity, version_));
}

auto format_schema::is_known_segment(std::string_view name) const noexcept -> bool {
    return contains_name(mandatory_names_, name) || contains_name(optional_names_, name);
}

auto format_schema::check() const -> kpfits::VoidResult {
    if (minimum_segment_count_ == 0) {
        return kpfits::kpfits_void_error(kpfits::error_codes::invalid_schema,
                                         "Minimum segment count must be positive");
    }

    for (const auto& name : mandatory_names_) {
        if (contains_name(optional_names_, name)) {
            return kpfits::kpfits_void_error(
                kpfits::error_codes::invalid_schema,
                compat::format("{} is listed as both mandatory and optional", name));
        }
    }

    std::set<std::string, std::less<>> seen;
    for (const auto& q : quantities_) {
        if (q.name.empty()) {
            return kpfits::kpfits_void_error(kpfits::error_codes::invalid_schema,
                                             "Quantity with empty name");
        }
        if (!seen.insert(q.name).second) {
            return kpfits::kpfits_void_error(
                kpfits::error_codes::invalid_schema,
                compat::format("Quantity {} is defined more than once", q.name));
        }
        for (const auto& b : q.bindings) {
            if (!is_known_segment(b.segment)) {
                return kpfits::kpfits_void_error(
                    kpfits::error_codes::invalid_schema,
                    compat::format("Quantity {} is bound to undeclared segment {}",
                                   q.name, b.segment));
            }
        }
    }

    return kpfits::ok();
}

// =============================================================================
// Kernel-phase format, revision 1
// =============================================================================
//
// Array layouts, slowest axis first:
//   PRIMARY   (frames, wavelengths, pixels, pixels)
//   APERTURE  (apertures, 3)
//   UV-PLANE  (uv-points, 3)
//   KER-MAT   (kernels, uv-points)
//   BLM-MAT   (uv-points, apertures)
//   KP-DATA, KP-SIGM, KA-DATA, KA-SIGM  (frames, wavelengths, kernels)
//   CWAVEL    table, one row per wavelength
//   DETPA     (frames)
//   VIS-DATA  (frames, wavelengths, uv-points)
//   CAL-MAT   (calibrators, kernels)
//   KP-COV, KA-COV  (frames, wavelengths, kernels, kernels)
//   FULL-COV  (frames, wavelengths, 2, kernels, 2, kernels)
//   IMSHIFT   table, one row per frame

auto kernel_phase_schema() -> const format_schema& {
    static const format_schema schema{
        "1",
        7,
        {"PRIMARY", "APERTURE", "UV-PLANE", "KER-MAT", "BLM-MAT", "KP-DATA", "CWAVEL"},
        {"KP-SIGM", "DETPA", "VIS-DATA", "KA-DATA", "KA-SIGM", "CAL-MAT", "KP-COV",
         "KA-COV", "FULL-COV", "IMSHIFT"},
        {
            {"kernels",
             {{"KER-MAT", 0}, {"KP-DATA", 2}, {"KP-SIGM", 2}, {"KA-DATA", 2},
              {"KA-SIGM", 2}, {"CAL-MAT", 1}, {"KP-COV", 2}, {"KP-COV", 3},
              {"KA-COV", 2}, {"KA-COV", 3}, {"FULL-COV", 3}, {"FULL-COV", 5}}},
            {"frames",
             {{"PRIMARY", 0}, {"KP-DATA", 0}, {"KP-SIGM", 0}, {"DETPA", 0},
              {"VIS-DATA", 0}, {"KA-DATA", 0}, {"KA-SIGM", 0}, {"KP-COV", 0},
              {"KA-COV", 0}, {"FULL-COV", 0}, {"IMSHIFT", 0}}},
            {"pixels", {{"PRIMARY", 2}, {"PRIMARY", 3}}},
            {"wavelengths",
             {{"PRIMARY", 1}, {"KP-DATA", 1}, {"KP-SIGM", 1}, {"CWAVEL", 0},
              {"VIS-DATA", 1}, {"KA-DATA", 1}, {"KA-SIGM", 1}, {"KP-COV", 1},
              {"KA-COV", 1}, {"FULL-COV", 1}}},
            {"uv-points",
             {{"UV-PLANE", 0}, {"KER-MAT", 1}, {"BLM-MAT", 0}, {"VIS-DATA", 2}}},
            {"apertures", {{"APERTURE", 0}, {"BLM-MAT", 1}}},
        }};
    return schema;
}

}  // namespace kpfits::services::validation
