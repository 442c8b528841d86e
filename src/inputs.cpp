#include "inputs.hpp"

namespace investcalc {

LoanInput::LoanInput()
    : principal(0.0), annual_rate(0.0), term_months(0) {}

LoanInput::LoanInput(double principal_, double rate, int term)
    : principal(principal_), annual_rate(rate), term_months(term) {}

ForecastInput::ForecastInput()
    : starting_cash(0.0),
      monthly_revenue(0.0),
      monthly_expenses(0.0),
      revenue_growth_rate(0.0),
      expense_growth_rate(0.0),
      forecast_months(12) {}

ForecastInput::ForecastInput(double cash, double revenue, double expenses, int months)
    : starting_cash(cash),
      monthly_revenue(revenue),
      monthly_expenses(expenses),
      revenue_growth_rate(0.0),
      expense_growth_rate(0.0),
      forecast_months(months) {}

BreakEvenInput::BreakEvenInput()
    : fixed_costs(0.0), price_per_unit(0.0), variable_cost_per_unit(0.0), period_months(12) {}

BreakEvenInput::BreakEvenInput(double fixed, double price, double variable_cost)
    : fixed_costs(fixed), price_per_unit(price), variable_cost_per_unit(variable_cost),
      period_months(12) {}

PricingInput::PricingInput()
    : cost_per_unit(0.0), desired_margin(0.0) {}

PricingInput::PricingInput(double cost, double margin)
    : cost_per_unit(cost), desired_margin(margin) {}

} // namespace investcalc
