#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "break_even.hpp"
#include "validator.hpp"
#include <algorithm>

using namespace investcalc;
using Catch::Approx;

namespace {

bool contains_note(const std::vector<std::string>& notes, const std::string& fragment) {
    return std::any_of(notes.begin(), notes.end(), [&](const std::string& note) {
        return note.find(fragment) != std::string::npos;
    });
}

} // anonymous namespace

// ============================================================================
// Break-even
// ============================================================================

TEST_CASE("Break-even units are rounded up", "[break_even]") {
    BreakEvenInput input(50000.0, 25.0, 10.0);
    BreakEvenResult result = calculate_break_even(input);

    REQUIRE(result.contribution_margin_per_unit == Approx(15.0));
    REQUIRE(result.contribution_margin_ratio == Approx(60.0));
    REQUIRE(result.break_even_units == 3334.0);
    REQUIRE(result.break_even_revenue == Approx(83350.0));
    REQUIRE(result.units_per_month == 278.0);
    REQUIRE(result.revenue_per_month == Approx(83350.0 / 12.0));

    SECTION("no current sales, no margin of safety") {
        REQUIRE_FALSE(result.margin_of_safety.has_value());
        REQUIRE_FALSE(result.margin_of_safety_units.has_value());
        REQUIRE_FALSE(result.is_above_break_even);
    }

    SECTION("exact division needs no rounding") {
        BreakEvenInput exact(30000.0, 25.0, 10.0);
        REQUIRE(calculate_break_even(exact).break_even_units == 2000.0);
    }
}

TEST_CASE("Margin of safety", "[break_even]") {
    BreakEvenInput input(50000.0, 25.0, 10.0);

    SECTION("above break-even") {
        input.current_sales_units = 4000.0;
        BreakEvenResult result = calculate_break_even(input);
        REQUIRE(*result.margin_of_safety_units == Approx(666.0));
        REQUIRE(*result.margin_of_safety == Approx(16.65));
        REQUIRE(result.is_above_break_even);

        auto notes = break_even_recommendations(result);
        REQUIRE(contains_note(notes, "Acceptable margin of safety"));
        REQUIRE(contains_note(notes, "sell at least 278 units/month"));
    }

    SECTION("below break-even") {
        input.current_sales_units = 3000.0;
        BreakEvenResult result = calculate_break_even(input);
        REQUIRE(*result.margin_of_safety_units == Approx(-334.0));
        REQUIRE(*result.margin_of_safety < 0.0);
        REQUIRE_FALSE(result.is_above_break_even);

        auto notes = break_even_recommendations(result);
        REQUIRE(contains_note(notes, "CRITICAL: You are 334 units below break-even."));
    }

    SECTION("comfortably above") {
        input.current_sales_units = 6000.0;
        auto notes = break_even_recommendations(calculate_break_even(input));
        REQUIRE(contains_note(notes, "Healthy margin of safety"));
    }
}

TEST_CASE("Contribution margin notes", "[break_even]") {
    BreakEvenInput thin(10000.0, 20.0, 16.0);
    REQUIRE(contains_note(break_even_recommendations(calculate_break_even(thin)),
                          "Low contribution margin"));

    BreakEvenInput strong(10000.0, 20.0, 4.0);
    REQUIRE(contains_note(break_even_recommendations(calculate_break_even(strong)),
                          "Strong contribution margin"));
}

TEST_CASE("Break-even input validation", "[break_even]") {
    SECTION("price must exceed variable cost") {
        REQUIRE_THROWS_AS(calculate_break_even(BreakEvenInput(50000.0, 10.0, 10.0)), ValidationError);
        REQUIRE_THROWS_AS(calculate_break_even(BreakEvenInput(50000.0, 8.0, 10.0)), ValidationError);
    }

    SECTION("fixed costs must be positive") {
        REQUIRE_THROWS_AS(calculate_break_even(BreakEvenInput(0.0, 25.0, 10.0)), ValidationError);
    }

    SECTION("variable cost must be positive") {
        REQUIRE_THROWS_AS(calculate_break_even(BreakEvenInput(50000.0, 25.0, 0.0)), ValidationError);
        REQUIRE_THROWS_AS(calculate_break_even(BreakEvenInput(50000.0, 25.0, -1.0)), ValidationError);
    }
}

// ============================================================================
// Pricing
// ============================================================================

TEST_CASE("Target margin price", "[pricing]") {
    PricingInput input(25.0, 40.0);
    PricingResult result = calculate_pricing(input);

    REQUIRE(result.minimum_price == 25.0);
    REQUIRE(result.target_margin_price == Approx(41.6667).epsilon(1e-5));
    REQUIRE(result.gross_profit_per_unit == Approx(16.6667).epsilon(1e-5));
    REQUIRE(result.markup_percentage == Approx(66.6667).epsilon(1e-5));
    REQUIRE_FALSE(result.competitor_comparison.has_value());
    REQUIRE_FALSE(result.break_even_price.has_value());

    REQUIRE(result.recommended_price == Approx(result.target_margin_price));
    REQUIRE(result.strategies.premium == Approx(result.target_margin_price * 1.15));
    REQUIRE(result.strategies.penetration == Approx(result.target_margin_price * 0.85));
    REQUIRE(result.strategies.competitive == Approx(result.target_margin_price));
}

TEST_CASE("Pricing against a competitor", "[pricing]") {
    PricingInput input(25.0, 40.0);

    SECTION("cheaper than the competitor") {
        input.competitor_price = 44.0;
        PricingResult result = calculate_pricing(input);

        REQUIRE(result.competitor_comparison.has_value());
        REQUIRE(result.competitor_comparison->position == PricePosition::Below);
        REQUIRE(result.competitor_comparison->difference == Approx(-2.3333).epsilon(1e-4));
        REQUIRE(result.recommended_price == Approx(42.3667).epsilon(1e-5));
        REQUIRE(result.recommended_price_low == Approx(42.3667 * 0.9).epsilon(1e-5));
        REQUIRE(result.recommended_price_high == Approx(42.3667 * 1.15).epsilon(1e-5));
        REQUIRE(result.strategies.competitive == 44.0);

        auto notes = pricing_recommendations(result, input);
        REQUIRE(contains_note(notes, "5.3% below competitors"));
    }

    SECTION("within half a unit counts as the same price") {
        input.competitor_price = 41.5;
        PricingResult result = calculate_pricing(input);
        REQUIRE(result.competitor_comparison->position == PricePosition::Same);
        REQUIRE(price_position_to_string(PricePosition::Same) == "same");
    }

    SECTION("dearer than the competitor") {
        input.competitor_price = 35.0;
        PricingResult result = calculate_pricing(input);
        REQUIRE(result.competitor_comparison->position == PricePosition::Above);
        REQUIRE(contains_note(pricing_recommendations(result, input), "clear differentiators"));
    }
}

TEST_CASE("Recommended price never drops below cost plus 10%", "[pricing]") {
    PricingInput input(10.0, 0.0);
    PricingResult result = calculate_pricing(input);

    REQUIRE(result.target_margin_price == Approx(10.0));
    REQUIRE(result.recommended_price == Approx(11.0));
    REQUIRE(result.recommended_price_low == Approx(11.0));
    REQUIRE(result.recommended_price_high == Approx(12.65));
    REQUIRE(contains_note(pricing_recommendations(result, input), "Low margin target"));
}

TEST_CASE("Break-even price from fixed costs and volume", "[pricing]") {
    PricingInput input(25.0, 40.0);
    input.fixed_costs_per_period = 1000.0;
    input.target_volume = 100.0;

    PricingResult result = calculate_pricing(input);
    REQUIRE(result.break_even_price.has_value());
    REQUIRE(*result.break_even_price == Approx(35.0));
}

TEST_CASE("Pricing input validation", "[pricing]") {
    REQUIRE_THROWS_AS(calculate_pricing(PricingInput(0.0, 40.0)), ValidationError);
    REQUIRE_THROWS_AS(calculate_pricing(PricingInput(25.0, 100.0)), ValidationError);
    REQUIRE_THROWS_AS(calculate_pricing(PricingInput(25.0, -5.0)), ValidationError);
}
