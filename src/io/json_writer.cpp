#include "json_writer.hpp"
#include "../numeric.hpp"
#include <fstream>
#include <stdexcept>

namespace investcalc {
namespace io {

namespace {

ordered_json optional_number(const std::optional<double>& value, int decimals = 2) {
    if (!value) {
        return nullptr;
    }
    return round_to(*value, decimals);
}

ordered_json rounded_series(const CashFlowSeries& series) {
    ordered_json array = ordered_json::array();
    for (double value : series) {
        array.push_back(round_currency(value));
    }
    return array;
}

ordered_json strings(const std::vector<std::string>& values) {
    ordered_json array = ordered_json::array();
    for (const auto& value : values) {
        array.push_back(value);
    }
    return array;
}

ordered_json case_to_json(const ScenarioCaseResult& result) {
    ordered_json j;
    j["case"] = scenario_case_to_string(result.scenario_case);
    j["multiplier"] = result.input.multiplier;
    j["metrics"] = to_json(result.metrics, false);
    return j;
}

ordered_json index_to_json(const IndexValue& index) {
    ordered_json j;
    j["value"] = round_ratio(index.value);
    j["rating"] = index_rating_to_string(index.rating);
    return j;
}

} // anonymous namespace

// ============================================================================
// Standard metrics
// ============================================================================

ordered_json to_json(const ScenarioInput& input) {
    ordered_json j;
    j["initial_investment"] = input.initial_investment;
    j["discount_rate"] = input.discount_rate;
    j["project_duration"] = input.project_duration;
    j["yearly_revenue"] = input.yearly_revenue;
    j["revenue_growth"] = input.revenue_growth;
    j["operating_costs"] = input.operating_costs;
    j["maintenance_costs"] = input.maintenance_costs;
    j["multiplier"] = input.multiplier;
    return j;
}

ordered_json to_json(const MetricsResult& result, bool include_series) {
    ordered_json j;
    j["roi"] = round_to(result.roi, 2);
    j["npv"] = round_currency(result.npv);
    j["irr"] = round_to(result.irr, 2);
    j["irr_status"] = irr_status_to_string(result.irr_status);
    j["irr_iterations"] = result.irr_iterations;
    j["payback_period"] = round_to(result.payback_period, 2);
    j["payback_achieved"] = result.payback_achieved;
    j["total_revenue"] = round_currency(result.total_revenue);
    j["total_costs"] = round_currency(result.total_costs);
    if (include_series) {
        j["monthly_cash_flow"] = rounded_series(result.monthly_cash_flow);
        j["cumulative_cash_flow"] = rounded_series(result.cumulative_cash_flow);
    }
    return j;
}

ordered_json to_json(const ScenarioComparison& comparison) {
    ordered_json j;
    j["expected"] = case_to_json(comparison.expected);
    j["best"] = case_to_json(comparison.best);
    j["worst"] = case_to_json(comparison.worst);
    return j;
}

// ============================================================================
// Loans
// ============================================================================

ordered_json to_json(const LoanResult& result, bool include_schedule) {
    ordered_json j;
    j["monthly_payment"] = round_currency(result.monthly_payment);
    j["total_payment"] = round_currency(result.total_payment);
    j["total_interest"] = round_currency(result.total_interest);
    j["effective_annual_rate"] = round_to(result.effective_annual_rate, 2);
    j["origination_fees"] = round_currency(result.origination_fees);
    j["total_cost_with_fees"] = round_currency(result.total_cost_with_fees);
    j["first_year_principal"] = round_currency(result.first_year_principal);
    j["first_year_interest"] = round_currency(result.first_year_interest);

    const Affordability& affordability = result.affordability;
    ordered_json afford;
    afford["debt_service_ratio"] = optional_number(affordability.debt_service_ratio);
    afford["is_affordable"] = affordability.is_affordable ? ordered_json(*affordability.is_affordable)
                                                          : ordered_json(nullptr);
    afford["max_affordable_payment"] = optional_number(affordability.max_affordable_payment);
    afford["cushion_after_payment"] = optional_number(affordability.cushion_after_payment);
    j["affordability"] = afford;

    j["payoff_summary"] = {
        {"halfway_point", result.payoff_summary.halfway_point},
        {"principal_at_halfway", round_currency(result.payoff_summary.principal_at_halfway)}
    };

    if (include_schedule) {
        ordered_json schedule = ordered_json::array();
        for (const auto& entry : result.schedule) {
            schedule.push_back({
                {"month", entry.month},
                {"payment", round_currency(entry.payment)},
                {"principal", round_currency(entry.principal)},
                {"interest", round_currency(entry.interest)},
                {"balance", round_currency(entry.balance)}
            });
        }
        j["schedule"] = schedule;
    }
    return j;
}

ordered_json to_json(const LoanComparison& comparison) {
    ordered_json options = ordered_json::array();
    for (const auto& option : comparison.options) {
        options.push_back({
            {"principal", option.input.principal},
            {"annual_rate", option.input.annual_rate},
            {"term_months", option.input.term_months},
            {"monthly_payment", round_currency(option.monthly_payment)},
            {"total_cost", round_currency(option.total_cost)}
        });
    }

    ordered_json j;
    j["options"] = options;
    j["best_option"] = comparison.best_option;
    j["savings"] = round_currency(comparison.savings);
    return j;
}

// ============================================================================
// Forecast and composite indices
// ============================================================================

ordered_json to_json(const ForecastResult& result) {
    ordered_json months = ordered_json::array();
    for (const auto& month : result.months) {
        months.push_back({
            {"month", month.month},
            {"month_name", month.month_name},
            {"revenue", round_currency(month.revenue)},
            {"expenses", round_currency(month.expenses)},
            {"net_cash_flow", round_currency(month.net_cash_flow)},
            {"ending_cash", round_currency(month.ending_cash)},
            {"is_deficit", month.is_deficit}
        });
    }

    ordered_json j;
    j["months"] = months;
    j["total_revenue"] = round_currency(result.total_revenue);
    j["total_expenses"] = round_currency(result.total_expenses);
    j["total_net_cash_flow"] = round_currency(result.total_net_cash_flow);
    j["ending_cash_balance"] = round_currency(result.ending_cash_balance);
    j["lowest_cash_balance"] = round_currency(result.lowest_cash_balance);
    j["lowest_cash_month"] = result.lowest_cash_month;
    j["deficit_months"] = result.deficit_months;
    j["months_until_deficit"] = result.months_until_deficit ? ordered_json(*result.months_until_deficit)
                                                            : ordered_json(nullptr);
    j["minimum_cash_reserve"] = round_currency(result.minimum_cash_reserve);
    j["average_monthly_net_flow"] = round_currency(result.average_monthly_net_flow);
    j["runway_months"] = optional_number(result.runway_months, 1);
    j["is_healthy"] = result.is_healthy;
    j["alerts"] = strings(forecast_alerts(result));
    return j;
}

ordered_json to_json(const CompositeResult& result) {
    ordered_json j;
    j["ofi"] = index_to_json(result.ofi);
    j["tfdi"] = index_to_json(result.tfdi);
    j["ser"] = index_to_json(result.ser);
    j["annual_manual_cost"] = round_currency(result.annual_manual_cost);
    j["automation_savings"] = optional_number(result.automation_savings);
    return j;
}

// ============================================================================
// Break-even and pricing
// ============================================================================

ordered_json to_json(const BreakEvenResult& result) {
    ordered_json j;
    j["break_even_units"] = result.break_even_units;
    j["break_even_revenue"] = round_currency(result.break_even_revenue);
    j["contribution_margin_per_unit"] = round_currency(result.contribution_margin_per_unit);
    j["contribution_margin_ratio"] = round_to(result.contribution_margin_ratio, 2);
    j["margin_of_safety"] = optional_number(result.margin_of_safety);
    j["margin_of_safety_units"] = optional_number(result.margin_of_safety_units, 0);
    j["units_per_month"] = result.units_per_month;
    j["revenue_per_month"] = round_currency(result.revenue_per_month);
    j["is_above_break_even"] = result.is_above_break_even;
    j["recommendations"] = strings(break_even_recommendations(result));
    return j;
}

ordered_json to_json(const PricingResult& result) {
    ordered_json j;
    j["minimum_price"] = round_currency(result.minimum_price);
    j["target_margin_price"] = round_currency(result.target_margin_price);
    j["markup_percentage"] = round_to(result.markup_percentage, 2);
    j["gross_profit_per_unit"] = round_currency(result.gross_profit_per_unit);
    j["break_even_price"] = optional_number(result.break_even_price);

    if (result.competitor_comparison) {
        const CompetitorComparison& comparison = *result.competitor_comparison;
        j["competitor_comparison"] = {
            {"difference", round_currency(comparison.difference)},
            {"percentage_diff", round_to(comparison.percentage_diff, 2)},
            {"position", price_position_to_string(comparison.position)}
        };
    } else {
        j["competitor_comparison"] = nullptr;
    }

    j["recommended_price"] = round_currency(result.recommended_price);
    j["recommended_price_range"] = {
        {"low", round_currency(result.recommended_price_low)},
        {"high", round_currency(result.recommended_price_high)}
    };
    j["strategies"] = {
        {"premium", round_currency(result.strategies.premium)},
        {"competitive", round_currency(result.strategies.competitive)},
        {"penetration", round_currency(result.strategies.penetration)}
    };
    return j;
}

// ============================================================================
// Sensitivity and benchmarks
// ============================================================================

ordered_json to_json(const SensitivityMatrix& matrix, const std::vector<TornadoEntry>& tornado) {
    ordered_json cells = ordered_json::array();
    for (const auto& point : matrix.points()) {
        cells.push_back({
            {"variable", sensitivity_variable_to_string(point.variable)},
            {"variation_percent", point.variation_percent},
            {"npv", round_currency(point.npv)},
            {"roi", round_to(point.roi, 2)}
        });
    }

    ordered_json bars = ordered_json::array();
    for (const auto& entry : tornado) {
        bars.push_back({
            {"variable", sensitivity_variable_to_string(entry.variable)},
            {"negative_variation", entry.negative_variation},
            {"positive_variation", entry.positive_variation},
            {"negative_impact", round_currency(entry.negative_impact)},
            {"positive_impact", round_currency(entry.positive_impact)},
            {"range", round_currency(entry.range)},
            {"impact", impact_level_to_string(entry.impact)},
            {"risk", impact_level_to_string(entry.risk)},
            {"recommendation", sensitivity_recommendation(entry)}
        });
    }

    ordered_json j;
    j["base_npv"] = round_currency(matrix.base_npv());
    j["base_roi"] = round_to(matrix.base_roi(), 2);
    j["cells"] = cells;
    j["tornado"] = bars;
    return j;
}

ordered_json to_json(const BenchmarkComparison& comparison) {
    ordered_json j;
    j["metric"] = comparison.metric;
    j["value"] = comparison.value;
    j["percentile"] = percentile_bucket_to_string(comparison.bucket);
    j["higher_is_better"] = comparison.direction == Direction::HigherIsBetter;
    j["vs_median"] = comparison.vs_median;
    j["vs_optimal"] = comparison.vs_optimal;
    j["message"] = comparison.message;
    j["benchmark"] = {
        {"p25", comparison.range.p25},
        {"median", comparison.range.median},
        {"p75", comparison.range.p75},
        {"optimal", comparison.range.optimal}
    };
    return j;
}

ordered_json to_json(const HealthScore& score) {
    ordered_json breakdown = ordered_json::array();
    for (const auto& item : score.breakdown) {
        breakdown.push_back({
            {"metric", item.metric},
            {"value", item.value},
            {"score", item.score},
            {"weight", item.weight}
        });
    }

    ordered_json j;
    j["overall_score"] = score.overall_score;
    j["category"] = score.category;
    j["breakdown"] = breakdown;
    return j;
}

ordered_json to_json(const RunnerStats& stats) {
    ordered_json j;
    j["offloaded_runs"] = stats.offloaded_runs;
    j["synchronous_runs"] = stats.synchronous_runs;
    j["timeout_count"] = stats.timeout_count;
    j["failed_runs"] = stats.failed_runs;
    j["total_execution_time_ms"] = round_to(stats.total_execution_time_ms, 2);
    return j;
}

// ============================================================================
// Output
// ============================================================================

void write_json(std::ostream& os, const ordered_json& document, bool pretty_print) {
    os << document.dump(pretty_print ? 2 : -1) << std::endl;
}

void write_json(const std::string& filepath, const ordered_json& document, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_json(file, document, pretty_print);
}

} // namespace io
} // namespace investcalc
