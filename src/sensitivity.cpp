#include "sensitivity.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include "validator.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace investcalc {

namespace {

constexpr double HIGH_IMPACT_RATIO = 0.7;
constexpr double MEDIUM_IMPACT_RATIO = 0.4;
constexpr double HIGH_RISK_RATIO = 0.5;
constexpr double MEDIUM_RISK_RATIO = 0.25;

void validate_grid(const std::vector<SensitivityVariable>& variables,
                   const std::vector<double>& variations) {
    const char* engine = engine_names::SENSITIVITY;
    if (variables.empty()) {
        throw ValidationError(engine, "variables", "must contain at least one variable");
    }
    if (variations.empty()) {
        throw ValidationError(engine, "variations", "must contain at least one variation");
    }
    for (size_t i = 0; i < variations.size(); ++i) {
        std::string field = "variations[" + std::to_string(i) + "]";
        assert_finite(variations[i], engine, field);
        if (variations[i] <= -100.0 || variations[i] > 1000.0) {
            throw ValidationError(engine, field, "must be greater than -100 and at most 1000");
        }
    }
}

ImpactLevel classify(double ratio, double high, double medium) {
    if (ratio > high) return ImpactLevel::High;
    if (ratio > medium) return ImpactLevel::Medium;
    return ImpactLevel::Low;
}

} // anonymous namespace

// ============================================================================
// Variables
// ============================================================================

std::string sensitivity_variable_to_string(SensitivityVariable variable) {
    switch (variable) {
        case SensitivityVariable::InitialInvestment: return "initial_investment";
        case SensitivityVariable::YearlyRevenue: return "yearly_revenue";
        case SensitivityVariable::OperatingCosts: return "operating_costs";
        case SensitivityVariable::MaintenanceCosts: return "maintenance_costs";
        case SensitivityVariable::DiscountRate: return "discount_rate";
    }
    return "unknown";
}

SensitivityVariable sensitivity_variable_from_string(const std::string& name) {
    if (name == "initial_investment") return SensitivityVariable::InitialInvestment;
    if (name == "yearly_revenue") return SensitivityVariable::YearlyRevenue;
    if (name == "operating_costs") return SensitivityVariable::OperatingCosts;
    if (name == "maintenance_costs") return SensitivityVariable::MaintenanceCosts;
    if (name == "discount_rate") return SensitivityVariable::DiscountRate;
    throw std::invalid_argument("Unknown sensitivity variable: " + name);
}

ScenarioInput perturb(const ScenarioInput& base, SensitivityVariable variable, double variation_percent) {
    ScenarioInput input = base;
    double factor = 1.0 + variation_percent / 100.0;

    switch (variable) {
        case SensitivityVariable::InitialInvestment: input.initial_investment *= factor; break;
        case SensitivityVariable::YearlyRevenue: input.yearly_revenue *= factor; break;
        case SensitivityVariable::OperatingCosts: input.operating_costs *= factor; break;
        case SensitivityVariable::MaintenanceCosts: input.maintenance_costs *= factor; break;
        case SensitivityVariable::DiscountRate: input.discount_rate *= factor; break;
    }
    return input;
}

std::vector<SensitivityVariable> default_sensitivity_variables() {
    return {
        SensitivityVariable::InitialInvestment,
        SensitivityVariable::YearlyRevenue,
        SensitivityVariable::OperatingCosts,
        SensitivityVariable::MaintenanceCosts
    };
}

std::vector<double> default_variations() {
    return {-30.0, -20.0, -10.0, 0.0, 10.0, 20.0, 30.0};
}

// ============================================================================
// SensitivityMatrix Implementation
// ============================================================================

SensitivityMatrix::SensitivityMatrix(const ScenarioInput& base, const MetricsResult& base_metrics,
                                     std::vector<SensitivityVariable> variables,
                                     std::vector<double> variations)
    : base_(base),
      base_npv_(base_metrics.npv),
      base_roi_(base_metrics.roi),
      variables_(std::move(variables)),
      variations_(std::move(variations)) {
    points_.reserve(variables_.size() * variations_.size());
    for (auto variable : variables_) {
        for (double variation : variations_) {
            points_.push_back(SensitivityPoint{variable, variation, 0.0, 0.0});
        }
    }
}

SensitivityPoint& SensitivityMatrix::at(size_t variable_index, size_t variation_index) {
    if (variable_index >= variables_.size() || variation_index >= variations_.size()) {
        throw std::out_of_range("Sensitivity cell index out of range");
    }
    return points_[variable_index * variations_.size() + variation_index];
}

const SensitivityPoint& SensitivityMatrix::at(size_t variable_index, size_t variation_index) const {
    if (variable_index >= variables_.size() || variation_index >= variations_.size()) {
        throw std::out_of_range("Sensitivity cell index out of range");
    }
    return points_[variable_index * variations_.size() + variation_index];
}

const SensitivityPoint& SensitivityMatrix::find(SensitivityVariable variable, double variation_percent) const {
    for (const auto& point : points_) {
        if (point.variable == variable && point.variation_percent == variation_percent) {
            return point;
        }
    }
    throw std::out_of_range("No sensitivity cell for " + sensitivity_variable_to_string(variable) +
                            " at " + format_amount(variation_percent, 1) + "%");
}

// ============================================================================
// Sweep
// ============================================================================

SensitivityMatrix run_sensitivity(
    const ScenarioInput& base,
    const std::vector<SensitivityVariable>& variables,
    const std::vector<double>& variations
) {
    CalculationContext ctx(engine_names::SENSITIVITY, "run_sensitivity");
    validate_logged(base, ctx);
    try {
        validate_grid(variables, variations);
    } catch (const ValidationError& e) {
        Logger::get_instance().log_validation_failure(ctx, e.field(), e.what());
        throw;
    }

    MetricsResult base_metrics = calculate_metrics(base);
    SensitivityMatrix matrix(base, base_metrics, variables, variations);

    const int n_cells = static_cast<int>(matrix.size());
    const size_t n_variations = variations.size();
    std::exception_ptr failure;

    // Cells write to distinct slots; the first failure is rethrown after the sweep
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int cell = 0; cell < n_cells; ++cell) {
        size_t var_idx = static_cast<size_t>(cell) / n_variations;
        size_t variation_idx = static_cast<size_t>(cell) % n_variations;
        SensitivityPoint& point = matrix.at(var_idx, variation_idx);

        try {
            MetricsResult metrics = calculate_metrics(perturb(base, point.variable, point.variation_percent));
            point.npv = metrics.npv;
            point.roi = metrics.roi;
        } catch (...) {
#ifdef HAVE_OPENMP
            #pragma omp critical
#endif
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    Logger::get_instance().log_calculation(ctx, "cells", static_cast<double>(matrix.size()));
    return matrix;
}

// ============================================================================
// Tornado
// ============================================================================

std::string impact_level_to_string(ImpactLevel level) {
    switch (level) {
        case ImpactLevel::Low: return "low";
        case ImpactLevel::Medium: return "medium";
        case ImpactLevel::High: return "high";
    }
    return "unknown";
}

std::vector<TornadoEntry> build_tornado(const SensitivityMatrix& matrix) {
    const auto& variations = matrix.variations();
    if (variations.empty()) {
        throw ValidationError(engine_names::SENSITIVITY, "variations", "must not be empty");
    }

    double most_negative = *std::min_element(variations.begin(), variations.end());
    double most_positive = *std::max_element(variations.begin(), variations.end());
    if (most_negative >= 0.0 || most_positive <= 0.0) {
        throw ValidationError(engine_names::SENSITIVITY, "variations",
                              "must include a negative and a positive variation for a tornado");
    }

    double base_npv = matrix.base_npv();
    std::vector<TornadoEntry> entries;
    entries.reserve(matrix.variables().size());

    for (auto variable : matrix.variables()) {
        TornadoEntry entry;
        entry.variable = variable;
        entry.negative_variation = most_negative;
        entry.positive_variation = most_positive;
        entry.negative_impact = matrix.find(variable, most_negative).npv - base_npv;
        entry.positive_impact = matrix.find(variable, most_positive).npv - base_npv;
        entry.range = std::abs(entry.positive_impact - entry.negative_impact);
        entry.impact = ImpactLevel::Low;
        entry.risk = ImpactLevel::Low;
        entries.push_back(entry);
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const TornadoEntry& a, const TornadoEntry& b) { return a.range > b.range; });

    double max_range = entries.front().range;
    double npv_scale = base_npv != 0.0 ? std::abs(base_npv) : 1.0;
    for (auto& entry : entries) {
        entry.impact = classify(safe_divide(entry.range, max_range), HIGH_IMPACT_RATIO, MEDIUM_IMPACT_RATIO);
        entry.risk = classify(std::abs(entry.negative_impact) / npv_scale, HIGH_RISK_RATIO, MEDIUM_RISK_RATIO);
    }

    return entries;
}

std::string sensitivity_recommendation(const TornadoEntry& entry) {
    bool high = entry.impact == ImpactLevel::High;

    switch (entry.variable) {
        case SensitivityVariable::YearlyRevenue:
            return high
                ? "Validate revenue projections with market data and plan for a conservative scenario."
                : "Monitor revenue periodically and keep projections anchored to historical trends.";
        case SensitivityVariable::OperatingCosts:
            return high
                ? "Establish strict operating cost controls and negotiate long-term supplier contracts."
                : "Review operating costs quarterly for optimization opportunities.";
        case SensitivityVariable::InitialInvestment:
            return high
                ? "Request detailed quotes and include a 15-20% contingency in the budget."
                : "Keep a 10% contingency margin on the investment budget.";
        case SensitivityVariable::MaintenanceCosts:
            return high
                ? "Set up preventive maintenance contracts and a maintenance reserve fund."
                : "Schedule regular preventive maintenance and track costs against projections.";
        case SensitivityVariable::DiscountRate:
            return high
                ? "Returns depend heavily on the cost of capital. Lock in financing terms early."
                : "Cost of capital has a moderate effect. Revisit the discount rate annually.";
    }
    return "";
}

} // namespace investcalc
