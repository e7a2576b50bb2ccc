/**
 * @file validation_report_test.cpp
 * @brief Unit tests for the validation transcript and exit status
 */

#include <kpfits/services/validation/validation_report.hpp>
#include <kpfits/services/validation/kp_validator.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <iomanip>
#include <sstream>

using namespace kpfits::services::validation;
using namespace kpfits::core;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

validation_result make_result(bool valid) {
    validation_result result;
    result.is_valid = valid;
    result.findings.push_back({validation_severity::pass, "segment-count-floor",
                               "Found 2 segments (minimum 1)"});
    if (!valid) {
        result.findings.push_back({validation_severity::fail, "consistency:apertures",
                                   "Inconsistent number of apertures: [105, 104]"});
    }
    result.findings.push_back({validation_severity::warning, "unknown-segment",
                               "FOO is not a standard segment name"});
    return result;
}

}  // namespace

TEST_CASE("write_report transcript layout", "[validation][report]") {
    segment_catalog catalog{{"PRIMARY", {6, 1, 192, 192}}, {"FOO", {2}}};
    auto text = format_report("kp.fits", catalog, make_result(false));

    SECTION("header names the file") {
        CHECK_THAT(text, StartsWith("validating: kp.fits\n"));
    }

    SECTION("catalog listing shows names and shapes") {
        CHECK_THAT(text, ContainsSubstring("Segments (2):\n"));
        CHECK_THAT(text, ContainsSubstring("[0] PRIMARY  (6, 1, 192, 192)\n"));
        CHECK_THAT(text, ContainsSubstring("[1] FOO      (2)\n"));
    }

    SECTION("one line per finding with a severity prefix") {
        CHECK_THAT(text, ContainsSubstring(
                             "[PASS] segment-count-floor: Found 2 segments (minimum 1)\n"));
        CHECK_THAT(text, ContainsSubstring("[FAIL] consistency:apertures: "
                                           "Inconsistent number of apertures: [105, 104]\n"));
        CHECK_THAT(text, ContainsSubstring(
                             "[WARNING] unknown-segment: FOO is not a standard segment name\n"));
    }

    SECTION("ends with the verdict") {
        CHECK_THAT(text, ContainsSubstring("Result: FAILED - 1 failure(s), 1 warning(s)\n"));
    }

    SECTION("findings keep their order") {
        CHECK(text.find("[PASS]") < text.find("[FAIL]"));
        CHECK(text.find("[FAIL]") < text.find("[WARNING]"));
    }
}

TEST_CASE("write_report leaves stream formatting untouched", "[validation][report]") {
    segment_catalog catalog{{"PRIMARY", {4}}, {"", {2}}};
    std::ostringstream out;
    const auto flags_before = out.flags();

    write_report(out, "kp.fits", catalog, make_result(true));
    out.str("");
    out << std::setw(6) << 42;

    CHECK(out.flags() == flags_before);
    CHECK(out.str() == "    42");
}

TEST_CASE("write_report is deterministic", "[validation][report]") {
    segment_catalog catalog{{"PRIMARY", {4}}};
    auto result = make_result(true);
    CHECK(format_report("a.fits", catalog, result) == format_report("a.fits", catalog, result));
}

TEST_CASE("write_summary_line and write_error", "[validation][report]") {
    std::ostringstream out;

    SECTION("summary line") {
        write_summary_line(out, "kp.fits", make_result(true));
        CHECK(out.str() == "kp.fits: PASSED - 0 failure(s), 1 warning(s)\n");
    }

    SECTION("boundary error") {
        write_error(out, "broken.fits", "File too small to be a FITS file");
        CHECK(out.str() == "validating: broken.fits\nError: File too small to be a FITS file\n");
    }
}

TEST_CASE("exit_status follows the verdict", "[validation][report]") {
    CHECK(exit_status(make_result(true)) == exit_codes::passed);
    CHECK(exit_status(make_result(false)) == exit_codes::failed);
    CHECK(exit_status(make_result(false)) != 0);
}
