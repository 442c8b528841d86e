#ifndef INVESTCALC_VALIDATOR_HPP
#define INVESTCALC_VALIDATOR_HPP

#include "inputs.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include "scenario.hpp"

namespace investcalc {

// Engine names used as the prefix of validation messages
namespace engine_names {
constexpr const char* STANDARD_METRICS = "StandardMetricsEngine";
constexpr const char* AMORTIZATION = "AmortizationEngine";
constexpr const char* CASH_FLOW_FORECAST = "CashFlowForecastEngine";
constexpr const char* COMPOSITE_INDEX = "CompositeIndexEngine";
constexpr const char* BREAK_EVEN = "BreakEvenEngine";
constexpr const char* PRICING = "PricingEngine";
constexpr const char* SENSITIVITY = "SensitivityEngine";
constexpr const char* SCENARIO = "ScenarioAdjustments";
} // namespace engine_names

// Validation entry points. Each is pure and throws ValidationError on the
// first violated rule; none of them clamps or rewrites its input.
void validate(const ScenarioInput& input);
void validate(const ScenarioAdjustments& adjustments);
void validate(const LoanInput& input);
void validate(const ForecastInput& input);
void validate(const FrictionInputs& input);
void validate(const TechDebtInputs& input);
void validate(const EfficiencyInputs& input);
void validate(const CompositeInputs& input);
void validate(const BreakEvenInput& input);
void validate(const PricingInput& input);

// Validate and report a rejection through the logger before rethrowing
template <typename Input>
void validate_logged(const Input& input, const CalculationContext& ctx) {
    try {
        validate(input);
    } catch (const ValidationError& e) {
        Logger::get_instance().log_validation_failure(ctx, e.field(), e.what());
        throw;
    }
}

} // namespace investcalc

#endif // INVESTCALC_VALIDATOR_HPP
