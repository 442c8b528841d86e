#include "scenario.hpp"
#include "validator.hpp"

namespace investcalc {

// ============================================================================
// ScenarioInput Implementation
// ============================================================================

ScenarioInput::ScenarioInput()
    : initial_investment(0.0),
      discount_rate(0.0),
      project_duration(0),
      yearly_revenue(0.0),
      revenue_growth(0.0),
      operating_costs(0.0),
      maintenance_costs(0.0),
      multiplier(1.0) {}

ScenarioInput::ScenarioInput(double investment, double rate, int duration, double revenue,
                             double growth, double opex, double maintenance, double mult)
    : initial_investment(investment),
      discount_rate(rate),
      project_duration(duration),
      yearly_revenue(revenue),
      revenue_growth(growth),
      operating_costs(opex),
      maintenance_costs(maintenance),
      multiplier(mult) {}

bool ScenarioInput::operator==(const ScenarioInput& other) const {
    return initial_investment == other.initial_investment &&
           discount_rate == other.discount_rate &&
           project_duration == other.project_duration &&
           yearly_revenue == other.yearly_revenue &&
           revenue_growth == other.revenue_growth &&
           operating_costs == other.operating_costs &&
           maintenance_costs == other.maintenance_costs &&
           multiplier == other.multiplier;
}

// ============================================================================
// Scenario cases
// ============================================================================

std::string scenario_case_to_string(ScenarioCase scenario_case) {
    switch (scenario_case) {
        case ScenarioCase::Expected: return "expected";
        case ScenarioCase::Best: return "best";
        case ScenarioCase::Worst: return "worst";
    }
    return "unknown";
}

double scenario_case_multiplier(ScenarioCase scenario_case) {
    switch (scenario_case) {
        case ScenarioCase::Best: return BEST_CASE_MULTIPLIER;
        case ScenarioCase::Worst: return WORST_CASE_MULTIPLIER;
        case ScenarioCase::Expected: break;
    }
    return EXPECTED_CASE_MULTIPLIER;
}

ScenarioInput with_case(const ScenarioInput& base, ScenarioCase scenario_case) {
    ScenarioInput input = base;
    input.multiplier = scenario_case_multiplier(scenario_case);
    return input;
}

// ============================================================================
// Adjustments
// ============================================================================

ScenarioAdjustments::ScenarioAdjustments()
    : sales_percent(0.0), costs_percent(0.0), discount_points(0.0) {}

ScenarioAdjustments::ScenarioAdjustments(double sales, double costs, double discount)
    : sales_percent(sales), costs_percent(costs), discount_points(discount) {}

ScenarioInput apply_adjustments(const ScenarioInput& base, const ScenarioAdjustments& adjustments) {
    validate(adjustments);

    ScenarioInput adjusted = base;
    adjusted.yearly_revenue = base.yearly_revenue * (1.0 + adjustments.sales_percent / 100.0);
    adjusted.operating_costs = base.operating_costs * (1.0 + adjustments.costs_percent / 100.0);
    adjusted.maintenance_costs = base.maintenance_costs * (1.0 + adjustments.costs_percent / 100.0);
    adjusted.discount_rate = base.discount_rate + adjustments.discount_points;
    return adjusted;
}

} // namespace investcalc
