#include "business_template.hpp"
#include "benchmark.hpp"
#include "numeric.hpp"

namespace investcalc {

BusinessTemplate::BusinessTemplate()
    : fixed_costs(0.0),
      price_per_unit(0.0),
      variable_cost_per_unit(0.0),
      desired_margin(0.0) {}

BreakEvenInput apply_break_even_template(const BusinessTemplate& tmpl) {
    return BreakEvenInput(tmpl.fixed_costs, tmpl.price_per_unit, tmpl.variable_cost_per_unit);
}

PricingInput apply_pricing_template(const BusinessTemplate& tmpl) {
    return PricingInput(tmpl.variable_cost_per_unit, tmpl.desired_margin);
}

std::string health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Warning: return "warning";
        case HealthStatus::Critical: return "critical";
    }
    return "unknown";
}

MetricHealth assess_metric_health(const BusinessTemplate& tmpl, const std::string& metric, double value) {
    auto it = tmpl.benchmarks.find(metric);
    if (it == tmpl.benchmarks.end()) {
        throw BenchmarkLookupError("Template " + tmpl.id + " has no benchmark for " + metric);
    }

    MetricHealth health;
    health.band = it->second;
    const TemplateBand& band = health.band;
    std::string shown = format_amount(value, 1) + "%";

    if (default_direction_for(metric) == Direction::LowerIsBetter) {
        if (value <= band.optimal) {
            health.status = HealthStatus::Healthy;
            health.message = metric + " of " + shown + " is at or below optimal (" + format_amount(band.optimal, 1) + "%)";
        } else if (value <= band.max) {
            health.status = HealthStatus::Warning;
            health.message = metric + " of " + shown + " is above optimal but within range";
        } else {
            health.status = HealthStatus::Critical;
            health.message = metric + " of " + shown + " exceeds the industry maximum (" + format_amount(band.max, 1) + "%)";
        }
        return health;
    }

    if (value >= band.optimal) {
        health.status = HealthStatus::Healthy;
        health.message = metric + " of " + shown + " meets or exceeds optimal (" + format_amount(band.optimal, 1) + "%)";
    } else if (value >= band.min) {
        health.status = HealthStatus::Warning;
        health.message = metric + " of " + shown + " is below optimal but acceptable";
    } else {
        health.status = HealthStatus::Critical;
        health.message = metric + " of " + shown + " is below the industry minimum (" + format_amount(band.min, 1) + "%)";
    }
    return health;
}

// ============================================================================
// BusinessTemplateSet Implementation
// ============================================================================

BusinessTemplateSet::BusinessTemplateSet(std::vector<BusinessTemplate> templates)
    : templates_(std::move(templates)) {}

const BusinessTemplate& BusinessTemplateSet::find(const std::string& id) const {
    for (const auto& tmpl : templates_) {
        if (tmpl.id == id) {
            return tmpl;
        }
    }
    throw BenchmarkLookupError("Template not found: " + id);
}

std::vector<const BusinessTemplate*> BusinessTemplateSet::by_industry(const std::string& industry) const {
    std::vector<const BusinessTemplate*> matches;
    for (const auto& tmpl : templates_) {
        if (tmpl.industry == industry) {
            matches.push_back(&tmpl);
        }
    }
    return matches;
}

std::vector<std::string> BusinessTemplateSet::ids() const {
    std::vector<std::string> result;
    result.reserve(templates_.size());
    for (const auto& tmpl : templates_) {
        result.push_back(tmpl.id);
    }
    return result;
}

} // namespace investcalc
