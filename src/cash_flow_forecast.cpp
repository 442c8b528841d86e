#include "cash_flow_forecast.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include "validator.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace investcalc {

ForecastResult::ForecastResult()
    : total_revenue(0.0),
      total_expenses(0.0),
      total_net_cash_flow(0.0),
      ending_cash_balance(0.0),
      lowest_cash_balance(0.0),
      lowest_cash_month(0),
      minimum_cash_reserve(0.0),
      average_monthly_net_flow(0.0),
      is_healthy(false) {}

namespace {

const std::array<const char*, 12> MONTH_NAMES = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

constexpr double BURN_RESERVE_MONTHS = 3.0;
constexpr double EXPENSE_RESERVE_MONTHS = 2.0;

// Several events may share a month; they are summed
double amount_for_month(const std::vector<MonthlyAmount>& amounts, int month) {
    double total = 0.0;
    for (const auto& entry : amounts) {
        if (entry.month == month) {
            total += entry.amount;
        }
    }
    return total;
}

} // anonymous namespace

double seasonal_factor_for(const std::vector<double>& factors, int month) {
    size_t index = static_cast<size_t>((month - 1) % 12);
    if (index < factors.size()) {
        return factors[index];
    }
    return 1.0;
}

ForecastResult calculate_forecast(const ForecastInput& input) {
    CalculationContext ctx(engine_names::CASH_FLOW_FORECAST, "calculate_forecast");
    validate_logged(input, ctx);

    ForecastResult result;
    result.months.reserve(static_cast<size_t>(input.forecast_months));

    double cash = input.starting_cash;
    result.lowest_cash_balance = input.starting_cash;
    result.lowest_cash_month = 0;

    for (int month = 1; month <= input.forecast_months; ++month) {
        double revenue_growth = std::pow(1.0 + input.revenue_growth_rate / 100.0, month - 1);
        double expense_growth = std::pow(1.0 + input.expense_growth_rate / 100.0, month - 1);

        double revenue = input.monthly_revenue * revenue_growth
                       * seasonal_factor_for(input.seasonal_factors, month)
                       + amount_for_month(input.expected_receivables, month);
        double expenses = input.monthly_expenses * expense_growth
                        + amount_for_month(input.one_time_expenses, month);

        double net = revenue - expenses;
        cash += net;

        result.total_revenue += revenue;
        result.total_expenses += expenses;

        bool is_deficit = cash < 0.0;
        if (is_deficit) {
            result.deficit_months.push_back(month);
        }
        if (cash < result.lowest_cash_balance) {
            result.lowest_cash_balance = cash;
            result.lowest_cash_month = month;
        }

        result.months.push_back(ForecastMonth{
            month, MONTH_NAMES[static_cast<size_t>((month - 1) % 12)],
            revenue, expenses, net, cash, is_deficit
        });
    }

    result.ending_cash_balance = cash;
    result.total_net_cash_flow = result.total_revenue - result.total_expenses;
    result.average_monthly_net_flow = result.total_net_cash_flow / input.forecast_months;

    if (result.average_monthly_net_flow < 0.0) {
        result.minimum_cash_reserve = std::abs(result.average_monthly_net_flow) * BURN_RESERVE_MONTHS;
        result.runway_months = std::max(0.0, input.starting_cash) /
                               std::abs(result.average_monthly_net_flow);
    } else {
        result.minimum_cash_reserve = input.monthly_expenses * EXPENSE_RESERVE_MONTHS;
    }

    if (!result.deficit_months.empty()) {
        result.months_until_deficit = result.deficit_months.front();
    }

    result.is_healthy = result.deficit_months.empty() &&
                        result.lowest_cash_balance >= result.minimum_cash_reserve;

    Logger& logger = Logger::get_instance();
    logger.log_calculation(ctx, "total_revenue", result.total_revenue);
    logger.log_calculation(ctx, "total_expenses", result.total_expenses);
    logger.log_calculation(ctx, "ending_cash", result.ending_cash_balance);

    return result;
}

std::vector<std::string> forecast_alerts(const ForecastResult& result) {
    std::vector<std::string> alerts;

    if (result.months_until_deficit) {
        alerts.push_back("CRITICAL: Cash will go negative in month " +
                         std::to_string(*result.months_until_deficit) + ".");
        alerts.push_back("Immediate action required: reduce expenses, increase sales or secure financing.");
    }

    if (result.lowest_cash_balance < result.minimum_cash_reserve) {
        alerts.push_back("Cash reserve drops below recommended minimum of " +
                         format_amount(result.minimum_cash_reserve));
        alerts.push_back("Lowest point: " + format_amount(result.lowest_cash_balance) +
                         " in month " + std::to_string(result.lowest_cash_month));
    }

    if (result.average_monthly_net_flow < 0.0) {
        alerts.push_back("Average monthly cash burn: " +
                         format_amount(std::abs(result.average_monthly_net_flow)));
        alerts.push_back("Business is cash-flow negative. Review cost structure.");
    } else if (result.average_monthly_net_flow > 0.0) {
        alerts.push_back("Average monthly cash gain: " + format_amount(result.average_monthly_net_flow));
    }

    if (result.is_healthy) {
        alerts.push_back("Cash flow forecast looks healthy.");
    }

    return alerts;
}

} // namespace investcalc
