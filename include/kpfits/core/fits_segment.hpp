/**
 * @file fits_segment.hpp
 * @brief Segment catalog - ordered (name, shape) descriptors of a FITS file
 *
 * A segment is one HDU as seen by the validator: only its name and the
 * shape of its array are kept. The catalog preserves on-disk order.
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace kpfits::core {

/// Array shape, slowest-varying axis first
using segment_shape = std::vector<std::size_t>;

/**
 * @brief One named array descriptor
 */
struct fits_segment {
    std::string name;     ///< EXTNAME (may be empty or non-standard)
    segment_shape shape;  ///< Axis lengths; empty for scalar / no data
};

/**
 * @brief Ordered collection of segments as read from a container
 *
 * Duplicate names are kept as-is; lookups return the first match.
 *
 * @example
 * @code
 * segment_catalog catalog{{"PRIMARY", {6, 1, 192, 192}},
 *                         {"APERTURE", {105, 3}}};
 * if (const auto* seg = catalog.find("APERTURE")) {
 *     std::cout << format_shape(seg->shape) << "\n";   // (105, 3)
 * }
 * @endcode
 */
class segment_catalog {
public:
    using const_iterator = std::vector<fits_segment>::const_iterator;

    segment_catalog() = default;
    segment_catalog(std::initializer_list<fits_segment> segments);

    /**
     * @brief Append a segment at the end of the catalog
     */
    void add(fits_segment segment);

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;

    /**
     * @brief Check whether a segment with exactly this name exists
     */
    [[nodiscard]] auto contains(std::string_view name) const noexcept -> bool;

    /**
     * @brief Find the first segment with the given name
     * @return Pointer to the segment, or nullptr if absent
     */
    [[nodiscard]] auto find(std::string_view name) const noexcept
        -> const fits_segment*;

    [[nodiscard]] auto operator[](std::size_t index) const -> const fits_segment&;

    [[nodiscard]] auto begin() const noexcept -> const_iterator;
    [[nodiscard]] auto end() const noexcept -> const_iterator;

private:
    std::vector<fits_segment> segments_;
};

/**
 * @brief Render a shape as "(6, 1, 192, 192)"; scalars render as "()"
 */
[[nodiscard]] auto format_shape(const segment_shape& shape) -> std::string;

}  // namespace kpfits::core
