/**
 * @file fits_segment_test.cpp
 * @brief Unit tests for segment_catalog
 */

#include <catch2/catch_test_macros.hpp>

#include <kpfits/core/fits_segment.hpp>

using namespace kpfits::core;

TEST_CASE("segment_catalog lookup", "[core][catalog]") {
    segment_catalog catalog{{"PRIMARY", {6, 1, 192, 192}},
                            {"APERTURE", {105, 3}},
                            {"APERTURE", {99, 3}}};

    SECTION("size and order follow insertion") {
        CHECK(catalog.size() == 3);
        CHECK_FALSE(catalog.empty());
        CHECK(catalog[0].name == "PRIMARY");
        CHECK(catalog[1].name == "APERTURE");
    }

    SECTION("find returns the first match") {
        const auto* seg = catalog.find("APERTURE");
        REQUIRE(seg != nullptr);
        CHECK(seg->shape == segment_shape{105, 3});
    }

    SECTION("names match exactly") {
        CHECK(catalog.contains("PRIMARY"));
        CHECK_FALSE(catalog.contains("primary"));
        CHECK_FALSE(catalog.contains("KER-MAT"));
        CHECK(catalog.find("KER-MAT") == nullptr);
    }

    SECTION("add appends") {
        catalog.add({"CWAVEL", {1}});
        CHECK(catalog.size() == 4);
        CHECK(catalog[3].name == "CWAVEL");
    }
}

TEST_CASE("format_shape rendering", "[core][catalog]") {
    CHECK(format_shape({6, 1, 192, 192}) == "(6, 1, 192, 192)");
    CHECK(format_shape({1}) == "(1)");
    CHECK(format_shape({}) == "()");
}
