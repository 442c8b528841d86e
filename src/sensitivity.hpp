#ifndef INVESTCALC_SENSITIVITY_HPP
#define INVESTCALC_SENSITIVITY_HPP

#include "scenario.hpp"
#include "standard_metrics.hpp"
#include <string>
#include <vector>

namespace investcalc {

// Scenario fields that can be perturbed
enum class SensitivityVariable {
    InitialInvestment,
    YearlyRevenue,
    OperatingCosts,
    MaintenanceCosts,
    DiscountRate
};

std::string sensitivity_variable_to_string(SensitivityVariable variable);

// Inverse of sensitivity_variable_to_string; throws std::invalid_argument
SensitivityVariable sensitivity_variable_from_string(const std::string& name);

// Copy of base with one field multiplied by (1 + variation_percent / 100)
ScenarioInput perturb(const ScenarioInput& base, SensitivityVariable variable, double variation_percent);

std::vector<SensitivityVariable> default_sensitivity_variables();
std::vector<double> default_variations();

struct SensitivityPoint {
    SensitivityVariable variable;
    double variation_percent;
    double npv;
    double roi;
};

// Variable-major grid of perturbed results
class SensitivityMatrix {
public:
    SensitivityMatrix() = default;
    SensitivityMatrix(const ScenarioInput& base, const MetricsResult& base_metrics,
                      std::vector<SensitivityVariable> variables, std::vector<double> variations);

    const ScenarioInput& base() const { return base_; }
    double base_npv() const { return base_npv_; }
    double base_roi() const { return base_roi_; }

    const std::vector<SensitivityVariable>& variables() const { return variables_; }
    const std::vector<double>& variations() const { return variations_; }
    const std::vector<SensitivityPoint>& points() const { return points_; }

    size_t size() const { return points_.size(); }

    // Access by grid position
    SensitivityPoint& at(size_t variable_index, size_t variation_index);
    const SensitivityPoint& at(size_t variable_index, size_t variation_index) const;

    // Lookup by value; throws std::out_of_range if not in the grid
    const SensitivityPoint& find(SensitivityVariable variable, double variation_percent) const;

private:
    ScenarioInput base_;
    double base_npv_ = 0.0;
    double base_roi_ = 0.0;
    std::vector<SensitivityVariable> variables_;
    std::vector<double> variations_;
    std::vector<SensitivityPoint> points_;
};

// Recompute metrics for every (variable, variation) cell.
// Cells are independent; with OpenMP they are computed in parallel.
// Throws ValidationError for an invalid base, an empty or out-of-range
// variation list (each must be in (-100, 1000]) or a perturbed scenario
// that fails validation.
SensitivityMatrix run_sensitivity(
    const ScenarioInput& base,
    const std::vector<SensitivityVariable>& variables = default_sensitivity_variables(),
    const std::vector<double>& variations = default_variations()
);

enum class ImpactLevel {
    Low,
    Medium,
    High
};

std::string impact_level_to_string(ImpactLevel level);

// One bar of the tornado chart, measured on NPV
struct TornadoEntry {
    SensitivityVariable variable;
    double negative_variation;      // Most negative variation in the grid
    double positive_variation;      // Most positive variation in the grid
    double negative_impact;         // NPV(negative_variation) - base NPV
    double positive_impact;         // NPV(positive_variation) - base NPV
    double range;                   // |positive_impact - negative_impact|
    ImpactLevel impact;             // range relative to the widest bar
    ImpactLevel risk;               // |negative_impact| relative to |base NPV|
};

// Entries sorted descending by range. Throws ValidationError unless the
// grid has at least one negative and one positive variation.
std::vector<TornadoEntry> build_tornado(const SensitivityMatrix& matrix);

// Mitigation advice for one tornado entry
std::string sensitivity_recommendation(const TornadoEntry& entry);

} // namespace investcalc

#endif // INVESTCALC_SENSITIVITY_HPP
