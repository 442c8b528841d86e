#ifndef INVESTCALC_INPUTS_HPP
#define INVESTCALC_INPUTS_HPP

#include <optional>
#include <vector>

namespace investcalc {

// LoanInput: a single financing offer
struct LoanInput {
    double principal;
    double annual_rate;                             // Annual interest rate (%)
    int term_months;
    std::optional<double> origination_fee_percent;  // Fee as % of principal (0-10)
    std::optional<double> monthly_revenue;          // Needed for affordability
    std::optional<double> monthly_expenses;         // Needed for affordability

    LoanInput();
    LoanInput(double principal_, double rate, int term);
};

// An amount keyed to a forecast month (1-based)
struct MonthlyAmount {
    int month;
    double amount;
};

// ForecastInput: cash position and monthly run-rate
struct ForecastInput {
    double starting_cash;
    double monthly_revenue;
    double monthly_expenses;
    double revenue_growth_rate;                 // Monthly growth (%)
    double expense_growth_rate;                 // Monthly growth (%)
    std::vector<double> seasonal_factors;       // Up to 12, by calendar position; empty = flat
    std::vector<MonthlyAmount> one_time_expenses;
    std::vector<MonthlyAmount> expected_receivables;
    int forecast_months;

    ForecastInput();
    ForecastInput(double cash, double revenue, double expenses, int months = 12);
};

// Inputs for the Operational Friction Index
struct FrictionInputs {
    double manual_hours_per_week;
    double hourly_cost;
    double current_revenue;
    std::optional<double> automation_potential;  // % of manual work that can be automated
};

// Inputs for the Tech-Debt Financial Drag Index
struct TechDebtInputs {
    double maintenance_hours_per_sprint;
    double total_dev_hours_per_sprint;
    double team_annual_cost;
    double incident_cost_per_month;
};

// Inputs for the Strategic Efficiency Ratio
struct EfficiencyInputs {
    double current_revenue;
    double previous_revenue;
    double current_burn_rate;
    double previous_burn_rate;
};

struct CompositeInputs {
    FrictionInputs friction;
    TechDebtInputs tech_debt;
    EfficiencyInputs efficiency;
};

struct BreakEvenInput {
    double fixed_costs;
    double price_per_unit;
    double variable_cost_per_unit;
    std::optional<double> current_sales_units;
    int period_months;

    BreakEvenInput();
    BreakEvenInput(double fixed, double price, double variable_cost);
};

struct PricingInput {
    double cost_per_unit;
    double desired_margin;                       // Gross margin target (%)
    std::optional<double> competitor_price;
    std::optional<double> target_volume;
    std::optional<double> fixed_costs_per_period;

    PricingInput();
    PricingInput(double cost, double margin);
};

} // namespace investcalc

#endif // INVESTCALC_INPUTS_HPP
