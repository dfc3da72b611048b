#include <catch2/catch.hpp>

#include "libskinner/LocalesUtils.hpp"

using namespace Skinner;

TEST_CASE("Printing of numbers without trailing zeros", "[LocalesUtils]") {
    REQUIRE(to_string_nozero(2., 3) == "2.0");
    REQUIRE(to_string_nozero(1.25, 3) == "1.25");
    REQUIRE(to_string_nozero(1.2346, 3) == "1.235");
    REQUIRE(to_string_nozero(-0.0001, 3) == "0.0");
    REQUIRE(to_string_nozero(-12.5, 3) == "-12.5");
    REQUIRE(to_string_nozero(10.96, 1) == "11.0");
    REQUIRE(to_string_nozero(7.4, 0) == "7.0");
}

TEST_CASE("Printing of numbers with four significant figures", "[LocalesUtils]") {
    REQUIRE(to_string_four_significant_figures(210.) == "210.0");
    REQUIRE(to_string_four_significant_figures(123.456) == "123.46");
    REQUIRE(to_string_four_significant_figures(12.3456) == "12.35");
    REQUIRE(to_string_four_significant_figures(1.23456) == "1.235");
    REQUIRE(to_string_four_significant_figures(0.0123456) == "0.01235");
    REQUIRE(to_string_four_significant_figures(0.) == "0.0");
}

TEST_CASE("Parsing of numbers", "[LocalesUtils]") {
    double v = -1.;
    REQUIRE(parse_double_decimal_point("1.5", v));
    REQUIRE(v == 1.5);
    REQUIRE(parse_double_decimal_point("+2", v));
    REQUIRE(v == 2.);
    REQUIRE(parse_double_decimal_point("-3e2", v));
    REQUIRE(v == -300.);
    REQUIRE(parse_double_decimal_point(".5", v));
    REQUIRE(v == 0.5);
    v = 7.;
    REQUIRE(! parse_double_decimal_point("", v));
    REQUIRE(! parse_double_decimal_point("+", v));
    REQUIRE(! parse_double_decimal_point("1,5", v));
    REQUIRE(! parse_double_decimal_point("abc", v));
    REQUIRE(! parse_double_decimal_point("1.5mm", v));
    REQUIRE(v == 7.);

    size_t pos = 0;
    REQUIRE(string_to_double_decimal_point("12.5mm", &pos) == 12.5);
    REQUIRE(pos == 4);
}
