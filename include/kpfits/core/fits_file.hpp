/**
 * @file fits_file.hpp
 * @brief FITS file header walker producing a segment catalog
 *
 * A FITS file is a sequence of Header Data Units (HDUs). Each header is a
 * run of 80-character ASCII cards packed into 2880-byte blocks and closed
 * by an END card; the data area that follows is padded to a multiple of
 * 2880 bytes. Only headers are parsed; data arrays are skipped.
 *
 * @see FITS Standard 4.0, Section 3 (FITS file organization)
 * @see FITS Standard 4.0, Section 4.4 (Header keywords)
 */

#pragma once

#include "fits_segment.hpp"

#include <kpfits/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace kpfits::core {

/// FITS logical record length in bytes
inline constexpr std::size_t fits_block_size = 2880;

/// Length of one header card in bytes
inline constexpr std::size_t fits_card_size = 80;

/**
 * @brief A parsed FITS file, reduced to its segment catalog
 *
 * Segment names come from EXTNAME. An unnamed primary HDU is reported as
 * "PRIMARY"; other unnamed HDUs keep an empty name. Image shapes are given
 * slowest axis first ([NAXISn, ..., NAXIS1]); BINTABLE and TABLE extensions
 * report their row count ([NAXIS2]).
 *
 * @example
 * @code
 * auto result = fits_file::open("kernel_phase.fits");
 * if (result.is_ok()) {
 *     for (const auto& seg : result.value().catalog()) {
 *         std::cout << seg.name << " " << format_shape(seg.shape) << "\n";
 *     }
 * }
 * @endcode
 */
class fits_file {
public:
    fits_file() = default;
    fits_file(const fits_file&) = default;
    fits_file(fits_file&&) noexcept = default;
    auto operator=(const fits_file&) -> fits_file& = default;
    auto operator=(fits_file&&) noexcept -> fits_file& = default;
    ~fits_file() = default;

    /**
     * @brief Open and parse a FITS file from disk
     * @param path Path to the FITS file
     * @return Result containing the parsed file or an error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> kpfits::Result<fits_file>;

    /**
     * @brief Parse a FITS file from raw bytes
     * @param data Raw byte data of the FITS file
     * @return Result containing the parsed file or an error
     */
    [[nodiscard]] static auto from_bytes(std::span<const uint8_t> data)
        -> kpfits::Result<fits_file>;

    /**
     * @brief Segments in on-disk order
     */
    [[nodiscard]] auto catalog() const noexcept -> const segment_catalog&;

    /**
     * @brief Number of HDUs in the file
     */
    [[nodiscard]] auto hdu_count() const noexcept -> std::size_t;

private:
    explicit fits_file(segment_catalog catalog);

    segment_catalog catalog_;
};

}  // namespace kpfits::core
