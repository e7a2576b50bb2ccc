/**
 * @file validation_report.cpp
 * @brief Implementation of the validation transcript
 */

#include "kpfits/services/validation/validation_report.hpp"

#include <kpfits/compat/format.hpp>

#include <algorithm>
#include <sstream>

namespace kpfits::services::validation {

void write_report(std::ostream& out,
                  std::string_view file_id,
                  const core::segment_catalog& catalog,
                  const validation_result& result) {
    out << "validating: " << file_id << "\n";

    std::size_t name_width = 1;
    for (const auto& segment : catalog) {
        name_width = std::max(name_width, segment.name.size());
    }

    out << "Segments (" << catalog.size() << "):\n";
    std::size_t index = 0;
    for (const auto& segment : catalog) {
        out << compat::format("  [{}] {:<{}}  {}\n", index++, segment.name, name_width,
                              core::format_shape(segment.shape));
    }

    for (const auto& finding : result.findings) {
        out << "[" << to_string(finding.severity) << "] " << finding.check_id
            << ": " << finding.message << "\n";
    }

    out << "Result: " << result.summary() << "\n";
}

void write_summary_line(std::ostream& out,
                        std::string_view file_id,
                        const validation_result& result) {
    out << file_id << ": " << result.summary() << "\n";
}

void write_error(std::ostream& out, std::string_view file_id, std::string_view message) {
    out << "validating: " << file_id << "\n";
    out << "Error: " << message << "\n";
}

auto format_report(std::string_view file_id,
                   const core::segment_catalog& catalog,
                   const validation_result& result) -> std::string {
    std::ostringstream oss;
    write_report(oss, file_id, catalog, result);
    return oss.str();
}

auto exit_status(const validation_result& result) noexcept -> int {
    return result.is_valid ? exit_codes::passed : exit_codes::failed;
}

}  // namespace kpfits::services::validation
