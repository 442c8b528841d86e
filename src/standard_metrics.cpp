#include "standard_metrics.hpp"
#include "logger.hpp"
#include "validator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace investcalc {

// ============================================================================
// Result types
// ============================================================================

IrrEstimate::IrrEstimate()
    : annual_rate_percent(0.0),
      monthly_rate(0.0),
      status(IrrStatus::Converged),
      iterations(0) {}

MetricsResult::MetricsResult()
    : roi(0.0),
      npv(0.0),
      irr(0.0),
      irr_status(IrrStatus::Converged),
      irr_iterations(0),
      payback_period(0.0),
      payback_achieved(false),
      total_revenue(0.0),
      total_costs(0.0) {}

std::string irr_status_to_string(IrrStatus status) {
    switch (status) {
        case IrrStatus::Converged: return "converged";
        case IrrStatus::IterationLimit: return "iteration_limit";
        case IrrStatus::FlatDerivative: return "flat_derivative";
        case IrrStatus::DivergedReset: return "diverged_reset";
    }
    return "unknown";
}

namespace {

double annualize(double monthly_rate) {
    return (std::pow(1.0 + monthly_rate, 12) - 1.0) * 100.0;
}

double monthly_revenue_at(const ScenarioInput& input, int month_index) {
    double base = input.yearly_revenue / 12.0 * input.multiplier;
    double monthly_growth = input.revenue_growth / 100.0 / 12.0;
    return base * std::pow(1.0 + monthly_growth, month_index);
}

double monthly_costs(const ScenarioInput& input) {
    return (input.operating_costs + input.maintenance_costs) / 12.0;
}

} // anonymous namespace

// ============================================================================
// Core formulas
// ============================================================================

CashFlowSeries project_cash_flows(const ScenarioInput& input) {
    CashFlowSeries flows;
    if (input.project_duration <= 0) {
        return flows;
    }
    flows.reserve(static_cast<size_t>(input.project_duration));

    double costs = monthly_costs(input);
    for (int t = 0; t < input.project_duration; ++t) {
        flows.push_back(monthly_revenue_at(input, t) - costs);
    }
    return flows;
}

double npv_at_monthly_rate(double initial_investment, const CashFlowSeries& flows, double monthly_rate) {
    if (monthly_rate == 0.0) {
        return std::accumulate(flows.begin(), flows.end(), 0.0) - initial_investment;
    }

    double npv = -initial_investment;
    double discount = 1.0;
    for (double cf : flows) {
        discount *= (1.0 + monthly_rate);
        npv += cf / discount;
    }
    return npv;
}

double calculate_npv(double initial_investment, const CashFlowSeries& flows, double annual_rate_percent) {
    return npv_at_monthly_rate(initial_investment, flows, annual_rate_percent / 100.0 / 12.0);
}

double calculate_roi(double npv, double initial_investment) {
    return safe_divide(npv, initial_investment) * 100.0;
}

double calculate_payback_period(double initial_investment, const CashFlowSeries& flows) {
    double cumulative = -initial_investment;

    for (size_t month = 0; month < flows.size(); ++month) {
        double previous = cumulative;
        cumulative += flows[month];

        if (cumulative >= 0.0) {
            // A zero flow can only cross when previous was already 0
            double fraction = safe_divide(-previous, flows[month]);
            return static_cast<double>(month) + fraction;
        }
    }

    return static_cast<double>(flows.size());
}

IrrEstimate solve_irr(double initial_investment, const CashFlowSeries& flows) {
    IrrEstimate estimate;
    estimate.status = IrrStatus::IterationLimit;

    double rate = IRR_INITIAL_GUESS;

    for (int iteration = 0; iteration < IRR_MAX_ITERATIONS; ++iteration) {
        estimate.iterations = iteration + 1;

        double npv = -initial_investment;
        double derivative = 0.0;
        for (size_t t = 0; t < flows.size(); ++t) {
            double period = static_cast<double>(t + 1);
            double factor = std::pow(1.0 + rate, period);
            npv += flows[t] / factor;
            derivative -= period * flows[t] / (factor * (1.0 + rate));
        }

        if (std::abs(npv) < IRR_TOLERANCE) {
            estimate.status = IrrStatus::Converged;
            break;
        }

        if (std::abs(derivative) < IRR_DERIVATIVE_FLOOR) {
            estimate.status = IrrStatus::FlatDerivative;
            break;
        }

        rate -= npv / derivative;

        if (rate < IRR_MIN_RATE || rate > IRR_MAX_RATE) {
            rate = IRR_INITIAL_GUESS;
            estimate.status = IrrStatus::DivergedReset;
            break;
        }
    }

    estimate.monthly_rate = rate;
    estimate.annual_rate_percent = annualize(rate);
    return estimate;
}

// ============================================================================
// Scenario evaluation
// ============================================================================

MetricsResult calculate_metrics(const ScenarioInput& input) {
    CalculationContext ctx(engine_names::STANDARD_METRICS, "calculate_metrics");
    validate_logged(input, ctx);

    Logger& logger = Logger::get_instance();
    MetricsResult result;

    result.monthly_cash_flow = project_cash_flows(input);

    result.cumulative_cash_flow.reserve(result.monthly_cash_flow.size());
    double cumulative = -input.initial_investment;
    for (double cf : result.monthly_cash_flow) {
        cumulative += cf;
        result.cumulative_cash_flow.push_back(cumulative);
    }

    double costs = monthly_costs(input);
    for (int t = 0; t < input.project_duration; ++t) {
        result.total_revenue += monthly_revenue_at(input, t);
        result.total_costs += costs;
    }

    result.npv = calculate_npv(input.initial_investment, result.monthly_cash_flow, input.discount_rate);
    result.roi = calculate_roi(result.npv, input.initial_investment);

    result.payback_period = calculate_payback_period(input.initial_investment, result.monthly_cash_flow);
    result.payback_achieved = std::any_of(result.cumulative_cash_flow.begin(),
                                          result.cumulative_cash_flow.end(),
                                          [](double c) { return c >= 0.0; });

    IrrEstimate irr = solve_irr(input.initial_investment, result.monthly_cash_flow);
    result.irr = irr.annual_rate_percent;
    result.irr_status = irr.status;
    result.irr_iterations = irr.iterations;

    logger.log_calculation(ctx, "npv", result.npv);
    logger.log_calculation(ctx, "roi", result.roi);
    logger.log_calculation(ctx, "payback_period", result.payback_period);
    logger.log_calculation(ctx, "irr", result.irr);

    if (!irr.converged()) {
        logger.log_irr_not_converged(ctx, irr_status_to_string(irr.status), irr.iterations, irr.annual_rate_percent);
    }

    return result;
}

ScenarioComparison calculate_all_scenarios(const ScenarioInput& base) {
    ScenarioComparison comparison;

    comparison.expected.scenario_case = ScenarioCase::Expected;
    comparison.expected.input = with_case(base, ScenarioCase::Expected);
    comparison.best.scenario_case = ScenarioCase::Best;
    comparison.best.input = with_case(base, ScenarioCase::Best);
    comparison.worst.scenario_case = ScenarioCase::Worst;
    comparison.worst.input = with_case(base, ScenarioCase::Worst);

    comparison.expected.metrics = calculate_metrics(comparison.expected.input);
    comparison.best.metrics = calculate_metrics(comparison.best.input);
    comparison.worst.metrics = calculate_metrics(comparison.worst.input);

    return comparison;
}

MetricsResult calculate_with_adjustments(const ScenarioInput& base, const ScenarioAdjustments& adjustments) {
    CalculationContext ctx(engine_names::SCENARIO, "calculate_with_adjustments");
    validate_logged(adjustments, ctx);
    return calculate_metrics(apply_adjustments(base, adjustments));
}

} // namespace investcalc
