#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include "numeric.hpp"

using namespace investcalc;
using Catch::Matchers::WithinAbs;

TEST_CASE("safe_divide", "[numeric]") {
    SECTION("divides normally") {
        REQUIRE_THAT(safe_divide(10.0, 4.0), WithinAbs(2.5, 1e-12));
    }

    SECTION("zero denominator returns the default") {
        REQUIRE(safe_divide(10.0, 0.0) == 0.0);
        REQUIRE(safe_divide(10.0, 0.0, -1.0) == -1.0);
    }

    SECTION("negative zero counts as zero") {
        REQUIRE(safe_divide(1.0, -0.0, 7.0) == 7.0);
    }
}

TEST_CASE("round_to", "[numeric]") {
    REQUIRE(round_to(2.346, 2) == 2.35);
    REQUIRE(round_to(-2.5, 0) == -3.0);
    REQUIRE(round_currency(1234.5678) == 1234.57);
    REQUIRE(round_ratio(0.123456) == 0.1235);

    SECTION("non-finite values pass through") {
        double inf = std::numeric_limits<double>::infinity();
        REQUIRE(round_to(inf, 2) == inf);
        REQUIRE(std::isnan(round_to(std::nan(""), 2)));
    }
}

TEST_CASE("format_amount", "[numeric]") {
    REQUIRE(format_amount(1234.5) == "1234.50");
    REQUIRE(format_amount(3.14159, 1) == "3.1");
    REQUIRE(format_amount(2500.4, 0) == "2500");
}

TEST_CASE("Assertions throw ValidationError with the field name", "[numeric]") {
    SECTION("assert_positive") {
        REQUIRE_NOTHROW(assert_positive(1.0, "Engine", "amount"));
        REQUIRE_THROWS_AS(assert_positive(0.0, "Engine", "amount"), ValidationError);

        try {
            assert_positive(-1.0, "Engine", "amount");
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.engine() == "Engine");
            REQUIRE(e.field() == "amount");
            REQUIRE(std::string(e.what()) == "Engine: amount must be greater than zero");
        }
    }

    SECTION("assert_non_negative allows zero") {
        REQUIRE_NOTHROW(assert_non_negative(0.0, "Engine", "amount"));
        REQUIRE_THROWS_AS(assert_non_negative(-0.01, "Engine", "amount"), ValidationError);
    }

    SECTION("assert_range is inclusive") {
        REQUIRE_NOTHROW(assert_range(0.0, 0.0, 100.0, "Engine", "rate"));
        REQUIRE_NOTHROW(assert_range(100.0, 0.0, 100.0, "Engine", "rate"));
        REQUIRE_THROWS_AS(assert_range(100.5, 0.0, 100.0, "Engine", "rate"), ValidationError);
    }

    SECTION("non-finite values are rejected everywhere") {
        double nan = std::nan("");
        double inf = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(assert_finite(nan, "Engine", "x"), ValidationError);
        REQUIRE_THROWS_AS(assert_positive(inf, "Engine", "x"), ValidationError);
        REQUIRE_THROWS_AS(assert_range(nan, 0.0, 1.0, "Engine", "x"), ValidationError);
    }

    SECTION("ValidationError is an invalid_argument") {
        REQUIRE_THROWS_AS(assert_positive(0.0, "Engine", "x"), std::invalid_argument);
    }
}
