#include "break_even.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include "validator.hpp"
#include <algorithm>
#include <cmath>

namespace investcalc {

namespace {

constexpr double HEALTHY_MARGIN_OF_SAFETY = 25.0;
constexpr double ACCEPTABLE_MARGIN_OF_SAFETY = 10.0;
constexpr double LOW_CONTRIBUTION_RATIO = 30.0;
constexpr double STRONG_CONTRIBUTION_RATIO = 60.0;

constexpr double PREMIUM_FACTOR = 1.15;
constexpr double PENETRATION_FACTOR = 0.85;
constexpr double TARGET_WEIGHT = 0.7;
constexpr double COMPETITOR_WEIGHT = 0.3;
constexpr double MINIMUM_MARKUP_FACTOR = 1.1;
constexpr double SAME_PRICE_BAND = 0.5;

} // anonymous namespace

// ============================================================================
// Break-even
// ============================================================================

BreakEvenResult::BreakEvenResult()
    : break_even_units(0.0),
      break_even_revenue(0.0),
      contribution_margin_per_unit(0.0),
      contribution_margin_ratio(0.0),
      units_per_month(0.0),
      revenue_per_month(0.0),
      is_above_break_even(false) {}

BreakEvenResult calculate_break_even(const BreakEvenInput& input) {
    CalculationContext ctx(engine_names::BREAK_EVEN, "calculate_break_even");
    validate_logged(input, ctx);

    BreakEvenResult result;
    result.contribution_margin_per_unit = input.price_per_unit - input.variable_cost_per_unit;
    result.contribution_margin_ratio =
        safe_divide(result.contribution_margin_per_unit, input.price_per_unit) * 100.0;

    // Partial units cannot be sold, so round up before pricing them
    result.break_even_units = std::ceil(input.fixed_costs / result.contribution_margin_per_unit);
    result.break_even_revenue = result.break_even_units * input.price_per_unit;

    if (input.current_sales_units) {
        double current = *input.current_sales_units;
        result.margin_of_safety_units = current - result.break_even_units;
        result.margin_of_safety = safe_divide(*result.margin_of_safety_units, current) * 100.0;
        result.is_above_break_even = current >= result.break_even_units;
    }

    result.units_per_month = std::round(result.break_even_units / input.period_months);
    result.revenue_per_month = result.break_even_revenue / input.period_months;

    Logger& logger = Logger::get_instance();
    logger.log_calculation(ctx, "break_even_units", result.break_even_units);
    logger.log_calculation(ctx, "break_even_revenue", result.break_even_revenue);
    logger.log_calculation(ctx, "contribution_margin_ratio", result.contribution_margin_ratio);

    return result;
}

std::vector<std::string> break_even_recommendations(const BreakEvenResult& result) {
    std::vector<std::string> notes;

    if (result.margin_of_safety) {
        double margin = *result.margin_of_safety;
        if (margin < 0.0) {
            notes.push_back("CRITICAL: You are " +
                            format_amount(std::abs(result.margin_of_safety_units.value_or(0.0)), 0) +
                            " units below break-even.");
            notes.push_back("Immediate action needed: reduce costs or increase prices.");
        } else if (margin < ACCEPTABLE_MARGIN_OF_SAFETY) {
            notes.push_back("Low margin of safety. A small sales decrease could cause losses.");
            notes.push_back("Consider building a cash reserve for slow periods.");
        } else if (margin < HEALTHY_MARGIN_OF_SAFETY) {
            notes.push_back("Acceptable margin of safety. Monitor sales trends closely.");
        } else {
            notes.push_back("Healthy margin of safety. Business is resilient to sales fluctuations.");
        }
    }

    if (result.contribution_margin_ratio < LOW_CONTRIBUTION_RATIO) {
        notes.push_back("Low contribution margin. Consider reducing variable costs or increasing prices.");
    } else if (result.contribution_margin_ratio > STRONG_CONTRIBUTION_RATIO) {
        notes.push_back("Strong contribution margin. Focus on increasing sales volume.");
    }

    notes.push_back("Target: sell at least " + format_amount(result.units_per_month, 0) +
                    " units/month to break even.");
    return notes;
}

// ============================================================================
// Pricing
// ============================================================================

PricingResult::PricingResult()
    : minimum_price(0.0),
      target_margin_price(0.0),
      markup_percentage(0.0),
      gross_profit_per_unit(0.0),
      recommended_price(0.0),
      recommended_price_low(0.0),
      recommended_price_high(0.0),
      strategies{0.0, 0.0, 0.0} {}

std::string price_position_to_string(PricePosition position) {
    switch (position) {
        case PricePosition::Above: return "above";
        case PricePosition::Below: return "below";
        case PricePosition::Same: return "same";
    }
    return "unknown";
}

PricingResult calculate_pricing(const PricingInput& input) {
    CalculationContext ctx(engine_names::PRICING, "calculate_pricing");
    validate_logged(input, ctx);

    PricingResult result;
    result.minimum_price = input.cost_per_unit;
    result.target_margin_price = input.cost_per_unit / (1.0 - input.desired_margin / 100.0);
    result.gross_profit_per_unit = result.target_margin_price - input.cost_per_unit;
    result.markup_percentage = result.gross_profit_per_unit / input.cost_per_unit * 100.0;

    if (input.fixed_costs_per_period && input.target_volume) {
        result.break_even_price = input.cost_per_unit + *input.fixed_costs_per_period / *input.target_volume;
    }

    result.recommended_price = result.target_margin_price;
    result.strategies.premium = result.target_margin_price * PREMIUM_FACTOR;
    result.strategies.competitive = result.target_margin_price;
    result.strategies.penetration = result.target_margin_price * PENETRATION_FACTOR;

    if (input.competitor_price) {
        double competitor = *input.competitor_price;

        CompetitorComparison comparison;
        comparison.difference = result.target_margin_price - competitor;
        comparison.percentage_diff = comparison.difference / competitor * 100.0;
        if (comparison.difference > SAME_PRICE_BAND) {
            comparison.position = PricePosition::Above;
        } else if (comparison.difference < -SAME_PRICE_BAND) {
            comparison.position = PricePosition::Below;
        } else {
            comparison.position = PricePosition::Same;
        }
        result.competitor_comparison = comparison;

        result.strategies.competitive = competitor;
        result.recommended_price = result.target_margin_price * TARGET_WEIGHT + competitor * COMPETITOR_WEIGHT;
    }

    double floor_price = result.minimum_price * MINIMUM_MARKUP_FACTOR;
    result.recommended_price = std::max(result.recommended_price, floor_price);
    result.recommended_price_low = std::max(floor_price, result.recommended_price * 0.9);
    result.recommended_price_high = result.recommended_price * PREMIUM_FACTOR;

    Logger& logger = Logger::get_instance();
    logger.log_calculation(ctx, "target_margin_price", result.target_margin_price);
    logger.log_calculation(ctx, "recommended_price", result.recommended_price);

    return result;
}

std::vector<std::string> pricing_recommendations(const PricingResult& result, const PricingInput& input) {
    std::vector<std::string> notes;

    if (input.desired_margin < 20.0) {
        notes.push_back("Low margin target (< 20%). Consider if this is sustainable long-term.");
    } else if (input.desired_margin > 60.0) {
        notes.push_back("High margin target (> 60%). Ensure value proposition justifies premium pricing.");
    }

    if (result.competitor_comparison) {
        const CompetitorComparison& comparison = *result.competitor_comparison;
        std::string diff = format_amount(std::abs(comparison.percentage_diff), 1);
        if (comparison.position == PricePosition::Above) {
            notes.push_back("Your price is " + diff + "% above competitors.");
            notes.push_back("Ensure your product or service has clear differentiators.");
        } else if (comparison.position == PricePosition::Below) {
            notes.push_back("Your price is " + diff + "% below competitors.");
            notes.push_back("You may have room to increase prices.");
        }
    }

    notes.push_back("Recommended price range: " + format_amount(result.recommended_price_low) +
                    " - " + format_amount(result.recommended_price_high));
    notes.push_back("At the target margin price you earn " +
                    format_amount(result.gross_profit_per_unit) + " per unit.");
    return notes;
}

} // namespace investcalc
