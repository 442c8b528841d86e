#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include "cash_flow_forecast.hpp"
#include "numeric.hpp"

using namespace investcalc;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

bool contains_alert(const std::vector<std::string>& alerts, const std::string& text) {
    return std::any_of(alerts.begin(), alerts.end(), [&](const std::string& alert) {
        return alert.find(text) != std::string::npos;
    });
}

} // anonymous namespace

TEST_CASE("Flat forecast", "[forecast]") {
    ForecastResult result = calculate_forecast(ForecastInput(50000.0, 20000.0, 15000.0, 12));

    REQUIRE(result.months.size() == 12);
    REQUIRE(result.months[0].month_name == "Jan");
    REQUIRE(result.months[11].month_name == "Dec");

    SECTION("cash accumulates the monthly net") {
        for (size_t i = 0; i < result.months.size(); ++i) {
            REQUIRE_THAT(result.months[i].net_cash_flow, WithinAbs(5000.0, 1e-9));
            REQUIRE_THAT(result.months[i].ending_cash, WithinAbs(50000.0 + 5000.0 * (i + 1), 1e-6));
        }
        REQUIRE_THAT(result.ending_cash_balance, WithinAbs(110000.0, 1e-6));
    }

    SECTION("totals") {
        REQUIRE(result.total_revenue == Approx(240000.0));
        REQUIRE(result.total_expenses == Approx(180000.0));
        REQUIRE(result.total_net_cash_flow == Approx(60000.0));
        REQUIRE(result.average_monthly_net_flow == Approx(5000.0));
    }

    SECTION("healthy with no deficit") {
        REQUIRE(result.deficit_months.empty());
        REQUIRE_FALSE(result.months_until_deficit.has_value());
        REQUIRE_FALSE(result.runway_months.has_value());
        REQUIRE(result.lowest_cash_balance == 50000.0);
        REQUIRE(result.lowest_cash_month == 0);
        REQUIRE(result.minimum_cash_reserve == Approx(30000.0));
        REQUIRE(result.is_healthy);
        REQUIRE(contains_alert(forecast_alerts(result), "looks healthy"));
    }
}

TEST_CASE("Burning forecast goes into deficit", "[forecast]") {
    ForecastResult result = calculate_forecast(ForecastInput(10000.0, 20000.0, 35000.0, 12));

    REQUIRE(result.months_until_deficit.has_value());
    REQUIRE(*result.months_until_deficit <= 2);
    REQUIRE(result.months[0].is_deficit);
    REQUIRE(result.deficit_months.size() == 12);
    REQUIRE_FALSE(result.is_healthy);

    SECTION("burn reserve and runway") {
        REQUIRE(result.average_monthly_net_flow == Approx(-15000.0));
        REQUIRE(result.minimum_cash_reserve == Approx(45000.0));
        REQUIRE(result.runway_months.has_value());
        REQUIRE(*result.runway_months == Approx(10000.0 / 15000.0));
    }

    SECTION("lowest point is the last month") {
        REQUIRE(result.lowest_cash_month == 12);
        REQUIRE(result.lowest_cash_balance == Approx(10000.0 - 15000.0 * 12));
    }

    SECTION("alerts") {
        auto alerts = forecast_alerts(result);
        REQUIRE(contains_alert(alerts, "CRITICAL: Cash will go negative in month 1."));
        REQUIRE(contains_alert(alerts, "Average monthly cash burn"));
        REQUIRE_FALSE(contains_alert(alerts, "looks healthy"));
    }
}

TEST_CASE("Growth and seasonality", "[forecast]") {
    SECTION("monthly compounding from month 2") {
        ForecastInput input(0.0, 10000.0, 5000.0, 3);
        input.revenue_growth_rate = 10.0;
        input.expense_growth_rate = 2.0;
        ForecastResult result = calculate_forecast(input);

        REQUIRE(result.months[0].revenue == Approx(10000.0));
        REQUIRE(result.months[1].revenue == Approx(11000.0));
        REQUIRE(result.months[2].revenue == Approx(12100.0));
        REQUIRE(result.months[2].expenses == Approx(5000.0 * 1.02 * 1.02));
    }

    SECTION("seasonal factors repeat every 12 months") {
        std::vector<double> factors = {0.5, 1.5};
        REQUIRE(seasonal_factor_for(factors, 1) == 0.5);
        REQUIRE(seasonal_factor_for(factors, 2) == 1.5);
        REQUIRE(seasonal_factor_for(factors, 3) == 1.0);
        REQUIRE(seasonal_factor_for(factors, 13) == 0.5);
        REQUIRE(seasonal_factor_for({}, 7) == 1.0);
    }

    SECTION("seasonality scales revenue but not expenses") {
        ForecastInput input(0.0, 10000.0, 5000.0, 2);
        input.seasonal_factors = {0.5, 2.0};
        ForecastResult result = calculate_forecast(input);
        REQUIRE(result.months[0].revenue == Approx(5000.0));
        REQUIRE(result.months[1].revenue == Approx(20000.0));
        REQUIRE(result.months[1].expenses == Approx(5000.0));
    }
}

TEST_CASE("One-time events", "[forecast]") {
    ForecastInput input(20000.0, 10000.0, 10000.0, 6);
    input.one_time_expenses = {MonthlyAmount{3, 15000.0}, MonthlyAmount{3, 10000.0}};
    input.expected_receivables = {MonthlyAmount{5, 8000.0}};
    ForecastResult result = calculate_forecast(input);

    SECTION("events in the same month are summed") {
        REQUIRE(result.months[2].expenses == Approx(35000.0));
        REQUIRE(result.months[2].ending_cash == Approx(-5000.0));
        REQUIRE(result.months[2].is_deficit);
    }

    SECTION("receivables land in their month") {
        REQUIRE(result.months[4].revenue == Approx(18000.0));
        REQUIRE(result.months[4].ending_cash == Approx(3000.0));
    }

    SECTION("deficit months are listed") {
        REQUIRE(result.deficit_months == std::vector<int>{3, 4});
        REQUIRE(*result.months_until_deficit == 3);
        REQUIRE(result.lowest_cash_month == 3);
    }
}

TEST_CASE("Invalid forecast is rejected", "[forecast]") {
    ForecastInput input(10000.0, 0.0, 5000.0, 12);
    REQUIRE_THROWS_AS(calculate_forecast(input), ValidationError);
}
