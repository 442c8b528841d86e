#ifndef INVESTCALC_SCENARIO_HPP
#define INVESTCALC_SCENARIO_HPP

#include <string>
#include <vector>

namespace investcalc {

// Monthly net cash flows; index 0 is month 1
using CashFlowSeries = std::vector<double>;

// ScenarioInput: assumptions for one investment case
// Rates are in percent (10.0 means 10%), costs and revenue are annual amounts.
struct ScenarioInput {
    double initial_investment;  // Up-front outlay at month 0
    double discount_rate;       // Annual discount rate (%)
    int project_duration;       // Months
    double yearly_revenue;      // Revenue in the first year
    double revenue_growth;      // Annual revenue growth (%)
    double operating_costs;     // Annual operating costs
    double maintenance_costs;   // Annual maintenance costs
    double multiplier;          // Applied to revenue only (best/worst cases)

    ScenarioInput();
    ScenarioInput(double investment, double rate, int duration, double revenue,
                  double growth, double opex, double maintenance, double mult = 1.0);

    bool operator==(const ScenarioInput& other) const;
};

// Standard planning cases
enum class ScenarioCase {
    Expected,
    Best,
    Worst
};

constexpr double EXPECTED_CASE_MULTIPLIER = 1.0;
constexpr double BEST_CASE_MULTIPLIER = 1.3;
constexpr double WORST_CASE_MULTIPLIER = 0.7;

std::string scenario_case_to_string(ScenarioCase scenario_case);
double scenario_case_multiplier(ScenarioCase scenario_case);

// Copy of base with the revenue multiplier of the given case
ScenarioInput with_case(const ScenarioInput& base, ScenarioCase scenario_case);

// What-if adjustments used by scenario comparison
struct ScenarioAdjustments {
    double sales_percent;       // -50..+50, applied to yearly revenue
    double costs_percent;       // -50..+50, applied to operating and maintenance costs
    double discount_points;     // -5..+5, added to the discount rate

    ScenarioAdjustments();
    ScenarioAdjustments(double sales, double costs, double discount);
};

// Returns an adjusted copy of base. Throws ValidationError if the
// adjustments are out of range; the resulting scenario is validated by
// the engine that consumes it.
ScenarioInput apply_adjustments(const ScenarioInput& base, const ScenarioAdjustments& adjustments);

} // namespace investcalc

#endif // INVESTCALC_SCENARIO_HPP
