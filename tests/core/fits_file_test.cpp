/**
 * @file fits_file_test.cpp
 * @brief Unit tests for fits_file
 */

#include <catch2/catch_test_macros.hpp>

#include <kpfits/core/fits_file.hpp>
#include <kpfits/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace kpfits::core;

namespace {

/**
 * @brief Format a "KEYWORD = value" card padded to 80 columns
 */
[[nodiscard]] auto card(const std::string& keyword, const std::string& value) -> std::string {
    std::string c = keyword;
    c.resize(8, ' ');
    c += "= " + value;
    c.resize(fits_card_size, ' ');
    return c;
}

[[nodiscard]] auto quoted(const std::string& s) -> std::string {
    return "'" + s + "'";
}

/**
 * @brief Append a header (cards + END, padded to a block) to the buffer
 */
void append_header(std::vector<uint8_t>& data, const std::vector<std::string>& cards) {
    std::string header;
    for (const auto& c : cards) {
        header += c;
    }
    std::string end = "END";
    end.resize(fits_card_size, ' ');
    header += end;
    header.resize((header.size() + fits_block_size - 1) / fits_block_size * fits_block_size, ' ');
    data.insert(data.end(), header.begin(), header.end());
}

/**
 * @brief Append a zero-filled data area padded to a block
 */
void append_data(std::vector<uint8_t>& data, std::size_t bytes) {
    const auto padded = (bytes + fits_block_size - 1) / fits_block_size * fits_block_size;
    data.insert(data.end(), padded, 0);
}

/**
 * @brief Image HDU (primary or IMAGE extension) of 64-bit floats with the
 *        given FITS axes (NAXIS1 first)
 */
void append_image(std::vector<uint8_t>& data, bool primary, const std::string& extname,
                  const std::vector<std::size_t>& fits_axes) {
    std::vector<std::string> cards;
    if (primary) {
        cards.push_back(card("SIMPLE", "T"));
    } else {
        cards.push_back(card("XTENSION", quoted("IMAGE   ")));
    }
    cards.push_back(card("BITPIX", "-64"));
    cards.push_back(card("NAXIS", std::to_string(fits_axes.size())));
    std::size_t elements = fits_axes.empty() ? 0 : 1;
    for (std::size_t i = 0; i < fits_axes.size(); ++i) {
        cards.push_back(card("NAXIS" + std::to_string(i + 1), std::to_string(fits_axes[i])));
        elements *= fits_axes[i];
    }
    if (!primary) {
        cards.push_back(card("PCOUNT", "0"));
        cards.push_back(card("GCOUNT", "1"));
    }
    if (!extname.empty()) {
        cards.push_back(card("EXTNAME", quoted(extname) + " / extension name"));
    }
    append_header(data, cards);
    append_data(data, elements * 8);
}

void append_bintable(std::vector<uint8_t>& data, const std::string& extname,
                     std::size_t row_bytes, std::size_t rows) {
    append_header(data, {card("XTENSION", quoted("BINTABLE")),
                         card("BITPIX", "8"),
                         card("NAXIS", "2"),
                         card("NAXIS1", std::to_string(row_bytes)),
                         card("NAXIS2", std::to_string(rows)),
                         card("PCOUNT", "0"),
                         card("GCOUNT", "1"),
                         card("TFIELDS", "2"),
                         card("EXTNAME", quoted(extname))});
    append_data(data, row_bytes * rows);
}

[[nodiscard]] auto create_kernel_phase_bytes() -> std::vector<uint8_t> {
    std::vector<uint8_t> data;
    append_image(data, true, "", {16, 16, 2, 4});
    append_image(data, false, "APERTURE", {3, 40});
    append_bintable(data, "CWAVEL", 16, 2);
    return data;
}

[[nodiscard]] auto create_temp_file_path(const std::string& name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / ("kpfits_test_" + name);
}

}  // namespace

// ============================================================================
// Reading Tests
// ============================================================================

TEST_CASE("fits_file reading from bytes", "[core][fits_file]") {
    SECTION("catalog reflects every HDU in order") {
        auto result = fits_file::from_bytes(create_kernel_phase_bytes());

        REQUIRE(result.is_ok());
        const auto& catalog = result.value().catalog();
        REQUIRE(result.value().hdu_count() == 3);
        CHECK(catalog[0].name == "PRIMARY");
        CHECK(catalog[1].name == "APERTURE");
        CHECK(catalog[2].name == "CWAVEL");
    }

    SECTION("image shapes are reported slowest axis first") {
        auto result = fits_file::from_bytes(create_kernel_phase_bytes());

        REQUIRE(result.is_ok());
        const auto& catalog = result.value().catalog();
        CHECK(catalog[0].shape == segment_shape{4, 2, 16, 16});
        CHECK(catalog[1].shape == segment_shape{40, 3});
    }

    SECTION("binary tables report their row count") {
        auto result = fits_file::from_bytes(create_kernel_phase_bytes());

        REQUIRE(result.is_ok());
        CHECK(result.value().catalog()[2].shape == segment_shape{2});
    }

    SECTION("empty primary HDU has scalar shape") {
        std::vector<uint8_t> data;
        append_image(data, true, "", {});
        append_image(data, false, "KER-MAT", {5, 3});

        auto result = fits_file::from_bytes(data);

        REQUIRE(result.is_ok());
        CHECK(result.value().catalog()[0].shape.empty());
        CHECK(result.value().catalog()[1].shape == segment_shape{3, 5});
    }

    SECTION("unnamed extension keeps an empty name") {
        std::vector<uint8_t> data;
        append_image(data, true, "", {});
        append_image(data, false, "", {2});

        auto result = fits_file::from_bytes(data);

        REQUIRE(result.is_ok());
        CHECK(result.value().catalog()[1].name.empty());
    }

    SECTION("named primary HDU keeps its EXTNAME") {
        std::vector<uint8_t> data;
        append_image(data, true, "IMAGES", {8, 8});

        auto result = fits_file::from_bytes(data);

        REQUIRE(result.is_ok());
        CHECK(result.value().catalog()[0].name == "IMAGES");
    }

    SECTION("missing padding after the last data area is accepted") {
        auto data = create_kernel_phase_bytes();
        data.resize(data.size() - fits_block_size + 32);

        auto result = fits_file::from_bytes(data);

        REQUIRE(result.is_ok());
        CHECK(result.value().hdu_count() == 3);
    }

    SECTION("zero-length axis declares no data") {
        std::vector<uint8_t> data;
        append_header(data, {card("SIMPLE", "T"), card("BITPIX", "16"), card("NAXIS", "2"),
                             card("NAXIS1", "0"), card("NAXIS2", "4294967296")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_ok());
        CHECK(result.value().catalog()[0].shape == segment_shape{4294967296, 0});
    }
}

TEST_CASE("fits_file rejects malformed containers", "[core][fits_file]") {
    SECTION("too small") {
        std::vector<uint8_t> data(100, ' ');
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::invalid_fits_file);
    }

    SECTION("first card is not SIMPLE") {
        std::vector<uint8_t> data;
        append_header(data, {card("BITPIX", "8"), card("NAXIS", "0")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::invalid_fits_file);
    }

    SECTION("extension without XTENSION") {
        auto data = create_kernel_phase_bytes();
        append_header(data, {card("SIMPLE", "T"), card("BITPIX", "8"), card("NAXIS", "0")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::invalid_fits_file);
    }

    SECTION("header without END card") {
        std::string header = card("SIMPLE", "T") + card("BITPIX", "8") + card("NAXIS", "0");
        header.resize(fits_block_size, ' ');
        std::vector<uint8_t> data(header.begin(), header.end());

        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::missing_end_card);
    }

    SECTION("missing NAXISn keyword") {
        std::vector<uint8_t> data;
        append_header(data, {card("SIMPLE", "T"), card("BITPIX", "8"), card("NAXIS", "2"),
                             card("NAXIS1", "4")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::invalid_header_value);
    }

    SECTION("non-integer BITPIX") {
        std::vector<uint8_t> data;
        append_header(data, {card("SIMPLE", "T"), card("BITPIX", "'eight'"),
                             card("NAXIS", "0")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::invalid_header_value);
    }

    SECTION("data area past end of file") {
        std::vector<uint8_t> data;
        append_header(data, {card("SIMPLE", "T"), card("BITPIX", "-64"), card("NAXIS", "2"),
                             card("NAXIS1", "192"), card("NAXIS2", "192")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::truncated_data);
        CHECK_FALSE(result.error().message.empty());
    }

    SECTION("unsupported BITPIX values") {
        for (const auto* bitpix : {"0", "7", "-8", "128"}) {
            std::vector<uint8_t> data;
            append_header(data, {card("SIMPLE", "T"), card("BITPIX", bitpix),
                                 card("NAXIS", "1"), card("NAXIS1", "10")});
            auto result = fits_file::from_bytes(data);
            INFO("BITPIX = " << bitpix);
            REQUIRE(result.is_err());
            CHECK(result.error().code == kpfits::error_codes::invalid_header_value);
        }
    }

    SECTION("axis lengths whose product wraps around") {
        std::vector<uint8_t> data;
        append_header(data, {card("SIMPLE", "T"), card("BITPIX", "8"), card("NAXIS", "2"),
                             card("NAXIS1", "4294967296"), card("NAXIS2", "4294967296")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::invalid_header_value);
    }

    SECTION("element size times element count overflows") {
        std::vector<uint8_t> data;
        append_header(data, {card("SIMPLE", "T"), card("BITPIX", "-64"), card("NAXIS", "1"),
                             card("NAXIS1", "4611686018427387904")});
        auto result = fits_file::from_bytes(data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::invalid_header_value);
    }
}

TEST_CASE("fits_file reading from file", "[core][fits_file]") {
    SECTION("non-existent file returns error") {
        auto result = fits_file::open("/nonexistent/path/test.fits");

        REQUIRE(result.is_err());
        CHECK(result.error().code == kpfits::error_codes::file_not_found);
    }

    SECTION("valid file is read correctly") {
        auto data = create_kernel_phase_bytes();
        auto temp_path = create_temp_file_path("read.fits");

        {
            std::ofstream file(temp_path, std::ios::binary);
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
        }

        auto result = fits_file::open(temp_path);

        REQUIRE(result.is_ok());
        CHECK(result.value().catalog().contains("APERTURE"));

        std::filesystem::remove(temp_path);
    }
}
