/**
 * @file fits_segment.cpp
 * @brief Implementation of the segment catalog
 */

#include "kpfits/core/fits_segment.hpp"

#include <algorithm>
#include <sstream>

namespace kpfits::core {

segment_catalog::segment_catalog(std::initializer_list<fits_segment> segments)
    : segments_(segments) {}

void segment_catalog::add(fits_segment segment) {
    segments_.push_back(std::move(segment));
}

auto segment_catalog::size() const noexcept -> std::size_t {
    return segments_.size();
}

auto segment_catalog::empty() const noexcept -> bool {
    return segments_.empty();
}

auto segment_catalog::contains(std::string_view name) const noexcept -> bool {
    return find(name) != nullptr;
}

auto segment_catalog::find(std::string_view name) const noexcept
    -> const fits_segment* {
    auto it = std::find_if(segments_.begin(), segments_.end(),
                           [name](const fits_segment& s) { return s.name == name; });
    return it != segments_.end() ? &*it : nullptr;
}

auto segment_catalog::operator[](std::size_t index) const -> const fits_segment& {
    return segments_.at(index);
}

auto segment_catalog::begin() const noexcept -> const_iterator {
    return segments_.begin();
}

auto segment_catalog::end() const noexcept -> const_iterator {
    return segments_.end();
}

auto format_shape(const segment_shape& shape) -> std::string {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

}  // namespace kpfits::core
