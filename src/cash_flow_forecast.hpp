#ifndef INVESTCALC_CASH_FLOW_FORECAST_HPP
#define INVESTCALC_CASH_FLOW_FORECAST_HPP

#include "inputs.hpp"
#include <optional>
#include <string>
#include <vector>

namespace investcalc {

struct ForecastMonth {
    int month;                  // 1-based
    std::string month_name;     // Jan..Dec, month 1 is Jan
    double revenue;             // Including receivables
    double expenses;            // Including one-time expenses
    double net_cash_flow;
    double ending_cash;
    bool is_deficit;            // ending_cash < 0
};

struct ForecastResult {
    std::vector<ForecastMonth> months;

    double total_revenue;
    double total_expenses;
    double total_net_cash_flow;
    double ending_cash_balance;
    double lowest_cash_balance;
    int lowest_cash_month;                      // 0 when the starting balance is the lowest
    std::vector<int> deficit_months;
    std::optional<int> months_until_deficit;    // First deficit month
    double minimum_cash_reserve;
    double average_monthly_net_flow;
    std::optional<double> runway_months;        // Only while burning cash
    bool is_healthy;

    ForecastResult();
};

// Seasonal factor for a 1-based month; factors repeat every 12 months
// and missing entries count as 1.0
double seasonal_factor_for(const std::vector<double>& factors, int month);

// Validate and project the cash position month by month
ForecastResult calculate_forecast(const ForecastInput& input);

// Advisory notes on deficits, reserve and burn
std::vector<std::string> forecast_alerts(const ForecastResult& result);

} // namespace investcalc

#endif // INVESTCALC_CASH_FLOW_FORECAST_HPP
