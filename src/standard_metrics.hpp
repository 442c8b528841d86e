#ifndef INVESTCALC_STANDARD_METRICS_HPP
#define INVESTCALC_STANDARD_METRICS_HPP

#include "scenario.hpp"
#include <string>

namespace investcalc {

// How the IRR solver stopped. The reported IRR is the annualized last rate
// in every case; only Converged means |NPV| fell below tolerance.
enum class IrrStatus {
    Converged,
    IterationLimit,     // Iteration limit reached
    FlatDerivative,     // |dNPV/dr| below floor, stopped early
    DivergedReset       // Rate left (-0.99, 10) and was reset to the initial guess
};

std::string irr_status_to_string(IrrStatus status);

struct IrrEstimate {
    double annual_rate_percent;
    double monthly_rate;
    IrrStatus status;
    int iterations;

    bool converged() const { return status == IrrStatus::Converged; }

    IrrEstimate();
};

// Solver parameters
constexpr double IRR_INITIAL_GUESS = 0.10 / 12.0;
constexpr double IRR_TOLERANCE = 1e-4;
constexpr int IRR_MAX_ITERATIONS = 100;
constexpr double IRR_DERIVATIVE_FLOOR = 1e-10;
constexpr double IRR_MIN_RATE = -0.99;
constexpr double IRR_MAX_RATE = 10.0;

// Result of a single-scenario evaluation
struct MetricsResult {
    double roi;                         // NPV / investment * 100
    double npv;
    double irr;                         // Annualized (%)
    IrrStatus irr_status;
    int irr_iterations;
    double payback_period;              // Months; project_duration if never reached
    bool payback_achieved;
    double total_revenue;               // Revenue over the whole horizon
    double total_costs;                 // Operating + maintenance over the whole horizon
    CashFlowSeries monthly_cash_flow;
    CashFlowSeries cumulative_cash_flow;    // Starts from -investment

    MetricsResult();
};

// Monthly net cash flows for the scenario (length == project_duration)
CashFlowSeries project_cash_flows(const ScenarioInput& input);

// NPV at a monthly rate. A zero rate skips discounting entirely.
double npv_at_monthly_rate(double initial_investment, const CashFlowSeries& flows, double monthly_rate);

// NPV for an annual discount rate in percent
double calculate_npv(double initial_investment, const CashFlowSeries& flows, double annual_rate_percent);

double calculate_roi(double npv, double initial_investment);

// Fractional month at which cumulative flow (from -investment) turns
// non-negative, interpolated linearly within the crossing month.
// Returns flows.size() when never reached.
double calculate_payback_period(double initial_investment, const CashFlowSeries& flows);

// Newton-Raphson on the monthly rate
IrrEstimate solve_irr(double initial_investment, const CashFlowSeries& flows);

// Validate and evaluate one scenario
MetricsResult calculate_metrics(const ScenarioInput& input);

struct ScenarioCaseResult {
    ScenarioCase scenario_case;
    ScenarioInput input;
    MetricsResult metrics;
};

// Expected, best and worst cases of the same scenario
struct ScenarioComparison {
    ScenarioCaseResult expected;
    ScenarioCaseResult best;
    ScenarioCaseResult worst;
};

ScenarioComparison calculate_all_scenarios(const ScenarioInput& base);

// Evaluate base after applying what-if adjustments
MetricsResult calculate_with_adjustments(const ScenarioInput& base, const ScenarioAdjustments& adjustments);

} // namespace investcalc

#endif // INVESTCALC_STANDARD_METRICS_HPP
