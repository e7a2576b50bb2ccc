/**
 * @file fits_file.cpp
 * @brief Implementation of the FITS header walker
 */

#include "kpfits/core/fits_file.hpp"

#include <kpfits/compat/format.hpp>
#include <kpfits/integration/logger_adapter.hpp>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace kpfits::core {

using integration::logger_adapter;

namespace {

/**
 * @brief Keyword/value pairs of one HDU header, in card order
 */
struct header_cards {
    std::string first_keyword;
    std::map<std::string, std::string, std::less<>> values;
};

[[nodiscard]] auto trim(std::string_view s) -> std::string_view {
    const auto first = s.find_first_not_of(' ');
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(' ');
    return s.substr(first, last - first + 1);
}

/**
 * @brief Extract the value field of a card (columns 11-80)
 *
 * Quoted strings are unquoted with '' collapsed to ' and trailing blanks
 * removed. Other values are cut at the comment separator.
 */
[[nodiscard]] auto parse_card_value(std::string_view field) -> std::string {
    field = trim(field);
    if (!field.empty() && field.front() == '\'') {
        std::string value;
        for (std::size_t i = 1; i < field.size(); ++i) {
            if (field[i] == '\'') {
                if (i + 1 < field.size() && field[i + 1] == '\'') {
                    value.push_back('\'');
                    ++i;
                    continue;
                }
                break;
            }
            value.push_back(field[i]);
        }
        return std::string(trim(value));
    }

    const auto slash = field.find('/');
    return std::string(trim(field.substr(0, slash)));
}

/**
 * @brief Read one header starting at offset
 * @param data Whole file contents
 * @param offset In: header start. Out: first byte after the header blocks
 */
[[nodiscard]] auto read_header(std::span<const uint8_t> data, std::size_t& offset)
    -> kpfits::Result<header_cards> {
    header_cards header;
    const std::size_t start = offset;
    std::size_t pos = offset;

    while (true) {
        if (pos + fits_card_size > data.size()) {
            return kpfits::kpfits_error<header_cards>(
                kpfits::error_codes::missing_end_card,
                compat::format("Header at offset {} has no END card", start));
        }

        std::string_view card(reinterpret_cast<const char*>(data.data() + pos),
                              fits_card_size);
        pos += fits_card_size;

        const auto keyword = trim(card.substr(0, 8));
        if (pos - fits_card_size == start) {
            header.first_keyword = std::string(keyword);
        }
        if (keyword == "END") {
            break;
        }
        // Only "KEYWORD = value" cards carry values we care about
        if (!keyword.empty() && card.substr(8, 2) == "= ") {
            header.values.try_emplace(std::string(keyword),
                                      parse_card_value(card.substr(10)));
        }
    }

    // Header occupies whole blocks
    const auto used = pos - start;
    const auto blocks = (used + fits_block_size - 1) / fits_block_size;
    offset = start + blocks * fits_block_size;
    return kpfits::Result<header_cards>::ok(std::move(header));
}

[[nodiscard]] auto parse_integer(std::string_view text) -> std::optional<long long> {
    long long value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    if (!text.empty() && *begin == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] auto require_integer(const header_cards& header, const std::string& keyword,
                                   std::size_t hdu_index) -> kpfits::Result<long long> {
    auto it = header.values.find(keyword);
    if (it == header.values.end()) {
        return kpfits::kpfits_error<long long>(
            kpfits::error_codes::invalid_header_value,
            compat::format("HDU {}: required keyword {} missing", hdu_index, keyword));
    }
    auto value = parse_integer(it->second);
    if (!value) {
        return kpfits::kpfits_error<long long>(
            kpfits::error_codes::invalid_header_value,
            compat::format("HDU {}: {} is not an integer: '{}'", hdu_index, keyword,
                           it->second));
    }
    return kpfits::Result<long long>::ok(*value);
}

[[nodiscard]] auto optional_integer(const header_cards& header, const std::string& keyword,
                                    long long fallback) -> long long {
    auto it = header.values.find(keyword);
    if (it == header.values.end()) {
        return fallback;
    }
    return parse_integer(it->second).value_or(fallback);
}

[[nodiscard]] auto is_valid_bitpix(long long bitpix) -> bool {
    switch (bitpix) {
        case 8: case 16: case 32: case 64: case -32: case -64:
            return true;
        default:
            return false;
    }
}

/**
 * @brief a * b, or nullopt when the product does not fit in size_t
 */
[[nodiscard]] auto checked_multiply(std::size_t a, std::size_t b)
    -> std::optional<std::size_t> {
    if (b != 0 && a > std::numeric_limits<std::size_t>::max() / b) {
        return std::nullopt;
    }
    return a * b;
}

/**
 * @brief Data area size: |BITPIX|/8 * GCOUNT * (PCOUNT + NAXIS1 * ... * NAXISn)
 */
[[nodiscard]] auto compute_data_size(long long bitpix, long long pcount, long long gcount,
                                     const std::vector<std::size_t>& axes)
    -> std::optional<std::size_t> {
    if (axes.empty()) {
        return std::size_t{0};
    }
    std::optional<std::size_t> elements = 1;
    for (auto length : axes) {
        elements = checked_multiply(*elements, length);
        if (!elements) {
            return std::nullopt;
        }
    }
    const auto params = static_cast<std::size_t>(std::max(pcount, 0LL));
    if (*elements > std::numeric_limits<std::size_t>::max() - params) {
        return std::nullopt;
    }
    auto size = checked_multiply(static_cast<std::size_t>(std::llabs(bitpix) / 8),
                                 static_cast<std::size_t>(std::max(gcount, 0LL)));
    if (!size) {
        return std::nullopt;
    }
    return checked_multiply(*size, *elements + params);
}

[[nodiscard]] auto is_table_extension(const header_cards& header) -> bool {
    auto it = header.values.find("XTENSION");
    if (it == header.values.end()) {
        return false;
    }
    return it->second == "BINTABLE" || it->second == "TABLE";
}

/**
 * @brief Read file contents into a vector
 */
[[nodiscard]] auto read_file_contents(const std::filesystem::path& path)
    -> kpfits::Result<std::vector<uint8_t>> {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return kpfits::kpfits_error<std::vector<uint8_t>>(
            kpfits::error_codes::file_not_found,
            "File not found: " + path.string());
    }

    const auto size = file.tellg();
    if (size < 0) {
        return kpfits::kpfits_error<std::vector<uint8_t>>(
            kpfits::error_codes::file_read_error,
            "Failed to read file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(size))) {
        return kpfits::kpfits_error<std::vector<uint8_t>>(
            kpfits::error_codes::file_read_error,
            "Failed to read file: " + path.string());
    }

    return kpfits::Result<std::vector<uint8_t>>::ok(std::move(buffer));
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

fits_file::fits_file(segment_catalog catalog) : catalog_(std::move(catalog)) {}

// ============================================================================
// Static Factory Methods
// ============================================================================

auto fits_file::open(const std::filesystem::path& path) -> kpfits::Result<fits_file> {
    auto contents = read_file_contents(path);
    if (contents.is_err()) {
        return kpfits::Result<fits_file>::err(contents.error());
    }

    auto parsed = from_bytes(contents.value());
    if (parsed.is_ok()) {
        logger_adapter::debug("Read {} HDU(s) from {}", parsed.value().hdu_count(),
                              path.string());
    }
    return parsed;
}

auto fits_file::from_bytes(std::span<const uint8_t> data) -> kpfits::Result<fits_file> {
    if (data.size() < fits_block_size) {
        return kpfits::kpfits_error<fits_file>(
            kpfits::error_codes::invalid_fits_file,
            "File too small to be a FITS file");
    }

    segment_catalog catalog;
    std::size_t offset = 0;

    while (offset < data.size()) {
        const auto hdu_index = catalog.size();
        const auto hdu_start = offset;

        auto header_result = read_header(data, offset);
        if (header_result.is_err()) {
            return kpfits::Result<fits_file>::err(header_result.error());
        }
        const auto& header = header_result.value();

        const char* expected = hdu_index == 0 ? "SIMPLE" : "XTENSION";
        if (header.first_keyword != expected) {
            return kpfits::kpfits_error<fits_file>(
                kpfits::error_codes::invalid_fits_file,
                compat::format("HDU {} at offset {} does not start with {}", hdu_index,
                               hdu_start, expected));
        }

        auto bitpix = require_integer(header, "BITPIX", hdu_index);
        if (bitpix.is_err()) {
            return kpfits::Result<fits_file>::err(bitpix.error());
        }
        if (!is_valid_bitpix(bitpix.value())) {
            return kpfits::kpfits_error<fits_file>(
                kpfits::error_codes::invalid_header_value,
                compat::format("HDU {}: unsupported BITPIX {}", hdu_index, bitpix.value()));
        }
        auto naxis = require_integer(header, "NAXIS", hdu_index);
        if (naxis.is_err()) {
            return kpfits::Result<fits_file>::err(naxis.error());
        }
        if (naxis.value() < 0 || naxis.value() > 999) {
            return kpfits::kpfits_error<fits_file>(
                kpfits::error_codes::invalid_header_value,
                compat::format("HDU {}: NAXIS out of range: {}", hdu_index, naxis.value()));
        }

        // FITS order: NAXIS1 varies fastest
        std::vector<std::size_t> axes;
        for (long long i = 1; i <= naxis.value(); ++i) {
            auto length = require_integer(header, compat::format("NAXIS{}", i), hdu_index);
            if (length.is_err()) {
                return kpfits::Result<fits_file>::err(length.error());
            }
            if (length.value() < 0) {
                return kpfits::kpfits_error<fits_file>(
                    kpfits::error_codes::invalid_header_value,
                    compat::format("HDU {}: NAXIS{} is negative", hdu_index, i));
            }
            axes.push_back(static_cast<std::size_t>(length.value()));
        }

        const auto pcount = optional_integer(header, "PCOUNT", 0);
        const auto gcount = optional_integer(header, "GCOUNT", 1);

        const auto size = compute_data_size(bitpix.value(), pcount, gcount, axes);
        if (!size) {
            return kpfits::kpfits_error<fits_file>(
                kpfits::error_codes::invalid_header_value,
                compat::format("HDU {}: declared data size overflows", hdu_index));
        }
        const auto data_size = *size;

        if (data_size > data.size() - offset) {
            return kpfits::kpfits_error<fits_file>(
                kpfits::error_codes::truncated_data,
                compat::format("HDU {}: data area of {} bytes extends past end of file",
                               hdu_index, data_size));
        }

        // Trailing padding of the last HDU may be missing
        const auto padded =
            (data_size + fits_block_size - 1) / fits_block_size * fits_block_size;
        offset = std::min(offset + padded, data.size());

        fits_segment segment;
        if (auto it = header.values.find("EXTNAME"); it != header.values.end()) {
            segment.name = it->second;
        }
        if (segment.name.empty() && hdu_index == 0) {
            segment.name = "PRIMARY";
        }

        if (is_table_extension(header)) {
            if (axes.size() >= 2) {
                segment.shape.push_back(axes[1]);
            }
        } else {
            segment.shape.assign(axes.rbegin(), axes.rend());
        }

        catalog.add(std::move(segment));
    }

    return kpfits::Result<fits_file>::ok(fits_file{std::move(catalog)});
}

// ============================================================================
// Accessors
// ============================================================================

auto fits_file::catalog() const noexcept -> const segment_catalog& {
    return catalog_;
}

auto fits_file::hdu_count() const noexcept -> std::size_t {
    return catalog_.size();
}

}  // namespace kpfits::core
