/**
 * @file format_schema.hpp
 * @brief Declarative description of the kernel-phase FITS format
 *
 * The schema lists which segments a kernel-phase file must contain and, for
 * every shared dimension (kernels, frames, ...), which axis of which segment
 * expresses it. The consistency checks are driven entirely by this table,
 * so a format revision is a schema edit rather than new checking code.
 */

#ifndef KPFITS_SERVICES_VALIDATION_FORMAT_SCHEMA_HPP
#define KPFITS_SERVICES_VALIDATION_FORMAT_SCHEMA_HPP

#include <kpfits/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kpfits::services::validation {

// =============================================================================
// Schema Types
// =============================================================================

/**
 * @brief One place where a quantity is encoded: an axis of a segment's shape
 */
struct quantity_binding {
    std::string segment;  ///< Segment (EXTNAME) carrying the quantity
    std::size_t axis;     ///< Zero-based axis, slowest axis first
};

/**
 * @brief A semantic quantity and every axis that must agree on its value
 */
struct quantity_definition {
    std::string name;                        ///< e.g. "kernels"
    std::vector<quantity_binding> bindings;  ///< In comparison order
};

// =============================================================================
// Format Schema
// =============================================================================

/**
 * @brief Immutable description of one revision of the format
 *
 * Thread Safety: A constructed schema is never modified and may be read
 * from any number of threads.
 *
 * @example
 * @code
 * const auto& schema = kernel_phase_schema();
 * auto bindings = schema.bindings_for("apertures");
 * if (bindings.is_ok()) {
 *     for (const auto& b : bindings.value()) {
 *         std::cout << b.segment << " axis " << b.axis << "\n";
 *     }
 * }
 * @endcode
 */
class format_schema {
public:
    /**
     * @brief Construct a schema
     *
     * No consistency checks are made here; call check() before handing a
     * hand-built schema to a validator.
     *
     * @param version Format revision label
     * @param minimum_segment_count Minimum number of segments in a file
     * @param mandatory_names Segments that must be present
     * @param optional_names Segments that may be present
     * @param quantities Shared dimensions, in check order
     */
    format_schema(std::string version,
                  std::size_t minimum_segment_count,
                  std::vector<std::string> mandatory_names,
                  std::vector<std::string> optional_names,
                  std::vector<quantity_definition> quantities);

    [[nodiscard]] auto version() const noexcept -> const std::string&;

    [[nodiscard]] auto minimum_segment_count() const noexcept -> std::size_t;

    /**
     * @brief Mandatory segment names, in declaration order
     */
    [[nodiscard]] auto mandatory_names() const noexcept
        -> const std::vector<std::string>&;

    [[nodiscard]] auto optional_names() const noexcept
        -> const std::vector<std::string>&;

    /**
     * @brief Quantity names, in check order
     */
    [[nodiscard]] auto quantities() const -> std::vector<std::string>;

    /**
     * @brief All quantity definitions, in check order
     */
    [[nodiscard]] auto definitions() const noexcept
        -> const std::vector<quantity_definition>&;

    /**
     * @brief Bindings of a quantity
     * @return The bindings, or error_codes::unknown_quantity
     */
    [[nodiscard]] auto bindings_for(std::string_view quantity) const
        -> kpfits::Result<std::vector<quantity_binding>>;

    /**
     * @brief Whether the name is a mandatory or optional segment
     */
    [[nodiscard]] auto is_known_segment(std::string_view name) const noexcept -> bool;

    /**
     * @brief Verify the schema is self-consistent
     *
     * Rejects a zero minimum count, empty or duplicate quantity names,
     * names listed both as mandatory and optional, and bindings to
     * segments the schema does not declare.
     *
     * @return Success, or error_codes::invalid_schema
     */
    [[nodiscard]] auto check() const -> kpfits::VoidResult;

private:
    std::string version_;
    std::size_t minimum_segment_count_;
    std::vector<std::string> mandatory_names_;
    std::vector<std::string> optional_names_;
    std::vector<quantity_definition> quantities_;
};

/**
 * @brief The kernel-phase format, revision 1
 *
 * Built once on first use and shared for the lifetime of the process.
 */
[[nodiscard]] auto kernel_phase_schema() -> const format_schema&;

}  // namespace kpfits::services::validation

#endif  // KPFITS_SERVICES_VALIDATION_FORMAT_SCHEMA_HPP
