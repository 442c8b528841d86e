#include "composite_index.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include "validator.hpp"
#include <algorithm>
#include <cmath>

namespace investcalc {

namespace {

constexpr double WEEKS_PER_YEAR = 52.0;
constexpr double MONTHS_PER_YEAR = 12.0;
constexpr double SER_BURN_FLOOR = 0.01;
constexpr double SER_BURN_DECREASE_BONUS = 1.5;

double annual_manual_cost(const FrictionInputs& input) {
    return input.manual_hours_per_week * input.hourly_cost * WEEKS_PER_YEAR;
}

} // anonymous namespace

std::string index_rating_to_string(IndexRating rating) {
    switch (rating) {
        case IndexRating::Optimal: return "optimal";
        case IndexRating::Acceptable: return "acceptable";
        case IndexRating::Critical: return "critical";
    }
    return "unknown";
}

IndexRating rate_index(double value, const IndexBands& bands) {
    if (bands.lower_is_better) {
        if (value < bands.optimal) return IndexRating::Optimal;
        if (value < bands.acceptable) return IndexRating::Acceptable;
        return IndexRating::Critical;
    }
    if (value > bands.optimal) return IndexRating::Optimal;
    if (value > bands.acceptable) return IndexRating::Acceptable;
    return IndexRating::Critical;
}

// ============================================================================
// Index formulas
// ============================================================================

double calculate_ofi(const FrictionInputs& input) {
    validate_logged(input, CalculationContext(engine_names::COMPOSITE_INDEX, "calculate_ofi"));
    return round_ratio(safe_divide(annual_manual_cost(input), input.current_revenue));
}

double calculate_tfdi(const TechDebtInputs& input) {
    validate_logged(input, CalculationContext(engine_names::COMPOSITE_INDEX, "calculate_tfdi"));

    double maintenance_ratio = safe_divide(input.maintenance_hours_per_sprint,
                                           input.total_dev_hours_per_sprint);
    double drag = maintenance_ratio * input.team_annual_cost
                + input.incident_cost_per_month * MONTHS_PER_YEAR;
    return round_ratio(safe_divide(drag, input.team_annual_cost));
}

double calculate_ser(const EfficiencyInputs& input) {
    validate_logged(input, CalculationContext(engine_names::COMPOSITE_INDEX, "calculate_ser"));

    double revenue_growth = safe_divide(input.current_revenue - input.previous_revenue,
                                        input.previous_revenue);
    double burn_change = safe_divide(input.current_burn_rate - input.previous_burn_rate,
                                     input.previous_burn_rate);

    double ser = revenue_growth / std::max(std::abs(burn_change), SER_BURN_FLOOR);
    if (burn_change < 0.0) {
        ser *= SER_BURN_DECREASE_BONUS;
    }
    return round_ratio(ser);
}

// ============================================================================
// Combined evaluation
// ============================================================================

CompositeResult calculate_composite_indices(const CompositeInputs& input) {
    CalculationContext ctx(engine_names::COMPOSITE_INDEX, "calculate_composite_indices");
    validate_logged(input, ctx);

    CompositeResult result;
    result.ofi.value = calculate_ofi(input.friction);
    result.ofi.rating = rate_index(result.ofi.value, OFI_BANDS);
    result.tfdi.value = calculate_tfdi(input.tech_debt);
    result.tfdi.rating = rate_index(result.tfdi.value, TFDI_BANDS);
    result.ser.value = calculate_ser(input.efficiency);
    result.ser.rating = rate_index(result.ser.value, SER_BANDS);

    result.annual_manual_cost = annual_manual_cost(input.friction);
    if (input.friction.automation_potential) {
        result.automation_savings = result.annual_manual_cost * *input.friction.automation_potential / 100.0;
    }

    Logger& logger = Logger::get_instance();
    logger.log_calculation(ctx, "ofi", result.ofi.value);
    logger.log_calculation(ctx, "tfdi", result.tfdi.value);
    logger.log_calculation(ctx, "ser", result.ser.value);

    return result;
}

} // namespace investcalc
