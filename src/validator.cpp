#include "validator.hpp"
#include <string>

namespace investcalc {

namespace {

constexpr int MAX_PROJECT_MONTHS = 600;
constexpr int MAX_LOAN_TERM_MONTHS = 360;
constexpr int MAX_FORECAST_MONTHS = 60;
constexpr int MAX_BREAK_EVEN_PERIOD_MONTHS = 120;
constexpr size_t SEASONAL_FACTOR_COUNT = 12;

void assert_months(int value, int min, int max, const char* engine, const std::string& field) {
    if (value < min || value > max) {
        throw ValidationError(engine, field,
            "must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
}

void validate_monthly_amounts(const std::vector<MonthlyAmount>& amounts, int forecast_months,
                              const std::string& field) {
    for (size_t i = 0; i < amounts.size(); ++i) {
        std::string item = field + "[" + std::to_string(i) + "]";
        assert_months(amounts[i].month, 1, forecast_months,
                      engine_names::CASH_FLOW_FORECAST, item + ".month");
        assert_non_negative(amounts[i].amount, engine_names::CASH_FLOW_FORECAST, item + ".amount");
    }
}

} // anonymous namespace

void validate(const ScenarioInput& input) {
    const char* engine = engine_names::STANDARD_METRICS;
    assert_positive(input.initial_investment, engine, "initial_investment");
    assert_range(input.discount_rate, 0.0, 100.0, engine, "discount_rate");
    assert_months(input.project_duration, 1, MAX_PROJECT_MONTHS, engine, "project_duration");
    assert_positive(input.yearly_revenue, engine, "yearly_revenue");
    assert_range(input.revenue_growth, -100.0, 1000.0, engine, "revenue_growth");
    assert_positive(input.operating_costs, engine, "operating_costs");
    assert_positive(input.maintenance_costs, engine, "maintenance_costs");
    assert_positive(input.multiplier, engine, "multiplier");
}

void validate(const ScenarioAdjustments& adjustments) {
    const char* engine = engine_names::SCENARIO;
    assert_range(adjustments.sales_percent, -50.0, 50.0, engine, "sales_percent");
    assert_range(adjustments.costs_percent, -50.0, 50.0, engine, "costs_percent");
    assert_range(adjustments.discount_points, -5.0, 5.0, engine, "discount_points");
}

void validate(const LoanInput& input) {
    const char* engine = engine_names::AMORTIZATION;
    assert_positive(input.principal, engine, "principal");
    assert_range(input.annual_rate, 0.0, 100.0, engine, "annual_rate");
    assert_months(input.term_months, 1, MAX_LOAN_TERM_MONTHS, engine, "term_months");

    if (input.origination_fee_percent) {
        assert_range(*input.origination_fee_percent, 0.0, 10.0, engine, "origination_fee_percent");
    }
    if (input.monthly_revenue) {
        assert_non_negative(*input.monthly_revenue, engine, "monthly_revenue");
    }
    if (input.monthly_expenses) {
        assert_non_negative(*input.monthly_expenses, engine, "monthly_expenses");
    }
}

void validate(const ForecastInput& input) {
    const char* engine = engine_names::CASH_FLOW_FORECAST;
    assert_finite(input.starting_cash, engine, "starting_cash");
    assert_positive(input.monthly_revenue, engine, "monthly_revenue");
    assert_positive(input.monthly_expenses, engine, "monthly_expenses");
    assert_range(input.revenue_growth_rate, -100.0, 1000.0, engine, "revenue_growth_rate");
    assert_range(input.expense_growth_rate, -100.0, 1000.0, engine, "expense_growth_rate");
    assert_months(input.forecast_months, 1, MAX_FORECAST_MONTHS, engine, "forecast_months");

    if (input.seasonal_factors.size() > SEASONAL_FACTOR_COUNT) {
        throw ValidationError(engine, "seasonal_factors", "must have at most 12 entries");
    }
    for (size_t i = 0; i < input.seasonal_factors.size(); ++i) {
        assert_range(input.seasonal_factors[i], 0.1, 3.0, engine,
                     "seasonal_factors[" + std::to_string(i) + "]");
    }

    validate_monthly_amounts(input.one_time_expenses, input.forecast_months, "one_time_expenses");
    validate_monthly_amounts(input.expected_receivables, input.forecast_months, "expected_receivables");
}

void validate(const FrictionInputs& input) {
    const char* engine = engine_names::COMPOSITE_INDEX;
    assert_positive(input.manual_hours_per_week, engine, "manual_hours_per_week");
    assert_positive(input.hourly_cost, engine, "hourly_cost");
    assert_positive(input.current_revenue, engine, "current_revenue");
    if (input.automation_potential) {
        assert_range(*input.automation_potential, 0.0, 100.0, engine, "automation_potential");
    }
}

void validate(const TechDebtInputs& input) {
    const char* engine = engine_names::COMPOSITE_INDEX;
    assert_positive(input.maintenance_hours_per_sprint, engine, "maintenance_hours_per_sprint");
    assert_positive(input.total_dev_hours_per_sprint, engine, "total_dev_hours_per_sprint");
    assert_positive(input.team_annual_cost, engine, "team_annual_cost");
    assert_positive(input.incident_cost_per_month, engine, "incident_cost_per_month");

    // Checked as one precondition so the caller gets a single clear message
    if (input.maintenance_hours_per_sprint > input.total_dev_hours_per_sprint) {
        throw ValidationError(engine, "maintenance_hours_per_sprint",
                              "cannot exceed total_dev_hours_per_sprint");
    }
}

void validate(const EfficiencyInputs& input) {
    const char* engine = engine_names::COMPOSITE_INDEX;
    assert_positive(input.current_revenue, engine, "current_revenue");
    assert_positive(input.previous_revenue, engine, "previous_revenue");
    assert_positive(input.current_burn_rate, engine, "current_burn_rate");
    assert_positive(input.previous_burn_rate, engine, "previous_burn_rate");
}

void validate(const CompositeInputs& input) {
    validate(input.friction);
    validate(input.tech_debt);
    validate(input.efficiency);
}

void validate(const BreakEvenInput& input) {
    const char* engine = engine_names::BREAK_EVEN;
    assert_positive(input.fixed_costs, engine, "fixed_costs");
    assert_positive(input.price_per_unit, engine, "price_per_unit");
    assert_positive(input.variable_cost_per_unit, engine, "variable_cost_per_unit");

    if (input.price_per_unit <= input.variable_cost_per_unit) {
        throw ValidationError(engine, "price_per_unit",
                              "must be greater than variable_cost_per_unit");
    }
    if (input.current_sales_units) {
        assert_non_negative(*input.current_sales_units, engine, "current_sales_units");
    }
    assert_months(input.period_months, 1, MAX_BREAK_EVEN_PERIOD_MONTHS, engine, "period_months");
}

void validate(const PricingInput& input) {
    const char* engine = engine_names::PRICING;
    assert_positive(input.cost_per_unit, engine, "cost_per_unit");
    assert_range(input.desired_margin, 0.0, 99.0, engine, "desired_margin");

    if (input.competitor_price) {
        assert_positive(*input.competitor_price, engine, "competitor_price");
    }
    if (input.target_volume) {
        assert_positive(*input.target_volume, engine, "target_volume");
    }
    if (input.fixed_costs_per_period) {
        assert_positive(*input.fixed_costs_per_period, engine, "fixed_costs_per_period");
    }
}

} // namespace investcalc
