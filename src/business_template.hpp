#ifndef INVESTCALC_BUSINESS_TEMPLATE_HPP
#define INVESTCALC_BUSINESS_TEMPLATE_HPP

#include "inputs.hpp"
#include <map>
#include <string>
#include <vector>

namespace investcalc {

// Healthy band of one template metric
struct TemplateBand {
    double min;
    double max;
    double optimal;
};

// Pre-configured defaults for a type of business
struct BusinessTemplate {
    std::string id;
    std::string name;
    std::string industry;           // Key into the benchmark table

    double fixed_costs;
    double price_per_unit;
    double variable_cost_per_unit;
    double desired_margin;

    std::map<std::string, TemplateBand> benchmarks;   // grossMargin, netMargin, laborCostRatio

    BusinessTemplate();
};

// Break-even input seeded from the template defaults
BreakEvenInput apply_break_even_template(const BusinessTemplate& tmpl);

// Pricing input seeded from the template: the variable cost becomes the unit cost
PricingInput apply_pricing_template(const BusinessTemplate& tmpl);

enum class HealthStatus {
    Healthy,
    Warning,
    Critical
};

std::string health_status_to_string(HealthStatus status);

struct MetricHealth {
    HealthStatus status;
    std::string message;
    TemplateBand band;
};

// Cost ratios are healthy at or below optimal, margins at or above it.
// Throws BenchmarkLookupError if the template has no band for the metric.
MetricHealth assess_metric_health(const BusinessTemplate& tmpl, const std::string& metric, double value);

class BusinessTemplateSet {
public:
    BusinessTemplateSet() = default;
    explicit BusinessTemplateSet(std::vector<BusinessTemplate> templates);

    // Throws BenchmarkLookupError for an unknown id
    const BusinessTemplate& find(const std::string& id) const;

    std::vector<const BusinessTemplate*> by_industry(const std::string& industry) const;
    std::vector<std::string> ids() const;

    size_t size() const { return templates_.size(); }
    bool empty() const { return templates_.empty(); }

private:
    std::vector<BusinessTemplate> templates_;
};

} // namespace investcalc

#endif // INVESTCALC_BUSINESS_TEMPLATE_HPP
