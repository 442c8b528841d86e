#ifndef INVESTCALC_BREAK_EVEN_HPP
#define INVESTCALC_BREAK_EVEN_HPP

#include "inputs.hpp"
#include <optional>
#include <string>
#include <vector>

namespace investcalc {

// ============================================================================
// Break-even
// ============================================================================

struct BreakEvenResult {
    double break_even_units;                    // Whole units, rounded up
    double break_even_revenue;                  // break_even_units * price
    double contribution_margin_per_unit;
    double contribution_margin_ratio;           // %
    std::optional<double> margin_of_safety;     // % of current sales
    std::optional<double> margin_of_safety_units;
    double units_per_month;
    double revenue_per_month;
    bool is_above_break_even;                   // false when current sales are unknown

    BreakEvenResult();
};

BreakEvenResult calculate_break_even(const BreakEvenInput& input);

std::vector<std::string> break_even_recommendations(const BreakEvenResult& result);

// ============================================================================
// Pricing
// ============================================================================

enum class PricePosition {
    Above,
    Below,
    Same                        // Within 0.5 of the competitor price
};

std::string price_position_to_string(PricePosition position);

struct CompetitorComparison {
    double difference;          // target margin price - competitor price
    double percentage_diff;
    PricePosition position;
};

struct PriceStrategies {
    double premium;             // 15% above target margin price
    double competitive;         // Competitor price, or target when unknown
    double penetration;         // 15% below target margin price
};

struct PricingResult {
    double minimum_price;                       // Unit cost
    double target_margin_price;                 // cost / (1 - margin)
    double markup_percentage;
    double gross_profit_per_unit;
    std::optional<double> break_even_price;     // cost + fixed / volume
    std::optional<CompetitorComparison> competitor_comparison;
    double recommended_price;
    double recommended_price_low;
    double recommended_price_high;
    PriceStrategies strategies;

    PricingResult();
};

PricingResult calculate_pricing(const PricingInput& input);

std::vector<std::string> pricing_recommendations(const PricingResult& result, const PricingInput& input);

} // namespace investcalc

#endif // INVESTCALC_BREAK_EVEN_HPP
