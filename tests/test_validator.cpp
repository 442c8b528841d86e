#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <string>
#include "validator.hpp"

using namespace investcalc;

namespace {

ScenarioInput valid_scenario() {
    return ScenarioInput(50000.0, 10.0, 36, 40000.0, 5.0, 15000.0, 2000.0);
}

// Field named by the ValidationError raised for input, or "" if none
template <typename Input>
std::string rejected_field(const Input& input) {
    try {
        validate(input);
    } catch (const ValidationError& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

TEST_CASE("Scenario validation", "[validator]") {
    REQUIRE(rejected_field(valid_scenario()).empty());

    SECTION("investment must be positive") {
        ScenarioInput input = valid_scenario();
        input.initial_investment = 0.0;
        REQUIRE(rejected_field(input) == "initial_investment");
    }

    SECTION("discount rate is bounded to 0-100") {
        ScenarioInput input = valid_scenario();
        input.discount_rate = -1.0;
        REQUIRE(rejected_field(input) == "discount_rate");
        input.discount_rate = 0.0;
        REQUIRE(rejected_field(input).empty());
    }

    SECTION("duration is bounded to 1-600 months") {
        ScenarioInput input = valid_scenario();
        input.project_duration = 0;
        REQUIRE(rejected_field(input) == "project_duration");
        input.project_duration = 601;
        REQUIRE(rejected_field(input) == "project_duration");
        input.project_duration = 600;
        REQUIRE(rejected_field(input).empty());
    }

    SECTION("maintenance costs must be positive") {
        ScenarioInput input = valid_scenario();
        input.maintenance_costs = 0.0;
        REQUIRE(rejected_field(input) == "maintenance_costs");
        REQUIRE_THROWS_AS(validate(input), ValidationError);
        input.maintenance_costs = -1.0;
        REQUIRE(rejected_field(input) == "maintenance_costs");
    }

    SECTION("NaN is rejected") {
        ScenarioInput input = valid_scenario();
        input.yearly_revenue = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(rejected_field(input) == "yearly_revenue");
    }

    SECTION("messages carry the engine name") {
        ScenarioInput input = valid_scenario();
        input.operating_costs = 0.0;
        REQUIRE_THROWS_WITH(validate(input), "StandardMetricsEngine: operating_costs must be greater than zero");
    }
}

TEST_CASE("Adjustment validation", "[validator]") {
    REQUIRE(rejected_field(ScenarioAdjustments(50.0, -50.0, 5.0)).empty());
    REQUIRE(rejected_field(ScenarioAdjustments(51.0, 0.0, 0.0)) == "sales_percent");
    REQUIRE(rejected_field(ScenarioAdjustments(0.0, -51.0, 0.0)) == "costs_percent");
    REQUIRE(rejected_field(ScenarioAdjustments(0.0, 0.0, 5.5)) == "discount_points");
}

TEST_CASE("Loan validation", "[validator]") {
    LoanInput loan(100000.0, 8.0, 60);
    REQUIRE(rejected_field(loan).empty());

    SECTION("zero rate is allowed") {
        loan.annual_rate = 0.0;
        REQUIRE(rejected_field(loan).empty());
    }

    SECTION("term is bounded to 360 months") {
        loan.term_months = 361;
        REQUIRE(rejected_field(loan) == "term_months");
    }

    SECTION("origination fee is bounded to 10%") {
        loan.origination_fee_percent = 12.0;
        REQUIRE(rejected_field(loan) == "origination_fee_percent");
    }

    SECTION("negative revenue is rejected") {
        loan.monthly_revenue = -5.0;
        REQUIRE(rejected_field(loan) == "monthly_revenue");
    }
}

TEST_CASE("Forecast validation", "[validator]") {
    ForecastInput forecast(10000.0, 20000.0, 18000.0, 12);
    REQUIRE(rejected_field(forecast).empty());

    SECTION("starting cash may be negative") {
        forecast.starting_cash = -5000.0;
        REQUIRE(rejected_field(forecast).empty());
    }

    SECTION("seasonal factors are bounded to 0.1-3.0") {
        forecast.seasonal_factors = {1.0, 3.5};
        REQUIRE(rejected_field(forecast) == "seasonal_factors[1]");
    }

    SECTION("at most 12 seasonal factors") {
        forecast.seasonal_factors.assign(13, 1.0);
        REQUIRE(rejected_field(forecast) == "seasonal_factors");
    }

    SECTION("events must fall inside the horizon") {
        forecast.one_time_expenses = {MonthlyAmount{13, 500.0}};
        REQUIRE(rejected_field(forecast) == "one_time_expenses[0].month");
    }

    SECTION("event amounts may not be negative") {
        forecast.expected_receivables = {MonthlyAmount{2, -1.0}};
        REQUIRE(rejected_field(forecast) == "expected_receivables[0].amount");
    }

    SECTION("horizon is bounded to 60 months") {
        forecast.forecast_months = 61;
        REQUIRE(rejected_field(forecast) == "forecast_months");
    }
}

TEST_CASE("Composite validation", "[validator]") {
    TechDebtInputs debt{30.0, 160.0, 600000.0, 2000.0};
    FrictionInputs friction{20.0, 50.0, 1000000.0, 60.0};
    EfficiencyInputs efficiency{1200000.0, 1000000.0, 90000.0, 80000.0};
    REQUIRE(rejected_field(debt).empty());
    REQUIRE(rejected_field(friction).empty());
    REQUIRE(rejected_field(efficiency).empty());

    SECTION("friction hours and cost must be positive") {
        friction.manual_hours_per_week = 0.0;
        REQUIRE(rejected_field(friction) == "manual_hours_per_week");
        friction.manual_hours_per_week = 20.0;
        friction.hourly_cost = 0.0;
        REQUIRE(rejected_field(friction) == "hourly_cost");
        REQUIRE_THROWS_AS(validate(friction), ValidationError);
    }

    SECTION("maintenance hours and incident cost must be positive") {
        debt.maintenance_hours_per_sprint = 0.0;
        REQUIRE(rejected_field(debt) == "maintenance_hours_per_sprint");
        debt.maintenance_hours_per_sprint = 30.0;
        debt.incident_cost_per_month = 0.0;
        REQUIRE(rejected_field(debt) == "incident_cost_per_month");
        REQUIRE_THROWS_AS(validate(debt), ValidationError);
    }

    SECTION("current revenue and burn must be positive") {
        efficiency.current_revenue = 0.0;
        REQUIRE(rejected_field(efficiency) == "current_revenue");
        efficiency.current_revenue = 1200000.0;
        efficiency.current_burn_rate = 0.0;
        REQUIRE(rejected_field(efficiency) == "current_burn_rate");
        REQUIRE_THROWS_AS(validate(efficiency), ValidationError);
    }

    SECTION("maintenance hours cannot exceed total hours") {
        debt.maintenance_hours_per_sprint = 200.0;
        REQUIRE(rejected_field(debt) == "maintenance_hours_per_sprint");
    }

    SECTION("previous burn must be positive") {
        efficiency.previous_burn_rate = 0.0;
        REQUIRE(rejected_field(efficiency) == "previous_burn_rate");
    }

    SECTION("automation potential is a percentage") {
        friction.automation_potential = 120.0;
        REQUIRE(rejected_field(friction) == "automation_potential");
    }
}

TEST_CASE("Break-even and pricing validation", "[validator]") {
    SECTION("price must exceed variable cost") {
        REQUIRE(rejected_field(BreakEvenInput(50000.0, 10.0, 10.0)) == "price_per_unit");
        REQUIRE(rejected_field(BreakEvenInput(50000.0, 9.0, 10.0)) == "price_per_unit");
        REQUIRE(rejected_field(BreakEvenInput(50000.0, 25.0, 10.0)).empty());
    }

    SECTION("variable cost must be positive") {
        REQUIRE(rejected_field(BreakEvenInput(50000.0, 25.0, 0.0)) == "variable_cost_per_unit");
        REQUIRE_THROWS_AS(validate(BreakEvenInput(50000.0, 25.0, 0.0)), ValidationError);
    }

    SECTION("margin is bounded to 0-99") {
        REQUIRE(rejected_field(PricingInput(25.0, 99.0)).empty());
        REQUIRE(rejected_field(PricingInput(25.0, 100.0)) == "desired_margin");
    }

    SECTION("optional pricing fields must be positive when present") {
        PricingInput pricing(25.0, 40.0);
        pricing.target_volume = 0.0;
        REQUIRE(rejected_field(pricing) == "target_volume");
    }
}
