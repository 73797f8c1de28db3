#include "code/CategoryCode.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace PT;

TEST_SUITE("code.category_code") {
    TEST_CASE("validation") {
        static_assert(is_valid_code("01"));
        static_assert(is_valid_code("01.2.15"));
        static_assert(!is_valid_code(""));

        CHECK(validate_code_impl("").code == CodeValidation::Code::Empty);
        CHECK(validate_code_impl(".1").code == CodeValidation::Code::LeadingDot);
        CHECK(validate_code_impl("01.").code == CodeValidation::Code::TrailingDot);
        CHECK(validate_code_impl("01..2").code == CodeValidation::Code::EmptySegment);
        CHECK(validate_code_impl("01.a").code == CodeValidation::Code::NonDigit);
        CHECK(code_validation_message(CodeValidation::Code::NonDigit) == "code segment is not numeric");
    }

    TEST_CASE("parent code is structural") {
        CHECK(parent_code("01.2.3") == "01.2");
        CHECK(parent_code("01.2") == "01");
        CHECK(parent_code("01").empty());
        CHECK(parent_code("").empty());
    }

    TEST_CASE("segments") {
        auto segments = code_segments("01.2.15");
        REQUIRE(segments.size() == 3);
        CHECK(segments[0] == "01");
        CHECK(segments[1] == "2");
        CHECK(segments[2] == "15");
        CHECK(code_segments("").empty());
    }

    TEST_CASE("trim") {
        CHECK(trim_ascii("  01.2\t") == "01.2");
        CHECK(trim_ascii("   ").empty());
    }

    TEST_CASE("total sentinel") {
        CHECK(is_total_sentinel(""));
        CHECK(is_total_sentinel("  "));
        CHECK(is_total_sentinel("0"));
        CHECK(is_total_sentinel("00"));
        CHECK(is_total_sentinel("0.0"));
        CHECK_FALSE(is_total_sentinel("01"));
        CHECK_FALSE(is_total_sentinel("10"));
        CHECK_FALSE(is_total_sentinel("Total"));

        std::vector<std::string> labels{"total", "Ensemble"};
        CHECK(is_total_sentinel("TOTAL", labels));
        CHECK(is_total_sentinel(" ensemble ", labels));
        CHECK_FALSE(is_total_sentinel("01", labels));
    }

    TEST_CASE("name classification keeps the binary depth convention") {
        auto nested = classify_name("__ Pain et céréales", "__");
        CHECK(nested.depth == 1);
        CHECK(nested.displayName == "Pain et céréales");

        auto deeper = classify_name("____ Baguette", "__");
        CHECK(deeper.depth == 1);
        CHECK(deeper.displayName == "____ Baguette");

        auto glued = classify_name("__Viande", "__");
        CHECK(glued.depth == 1);
        CHECK(glued.displayName == "__Viande");

        auto top = classify_name("Alimentation", "__");
        CHECK(top.depth == 0);
        CHECK(top.displayName == "Alimentation");

        auto noMarker = classify_name("__ Pain", "");
        CHECK(noMarker.depth == 0);
        CHECK(noMarker.displayName == "__ Pain");
    }
}
