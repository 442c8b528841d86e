#ifndef INVESTCALC_IO_JSON_WRITER_HPP
#define INVESTCALC_IO_JSON_WRITER_HPP

#include "../amortization.hpp"
#include "../benchmark.hpp"
#include "../break_even.hpp"
#include "../calculation_runner.hpp"
#include "../cash_flow_forecast.hpp"
#include "../composite_index.hpp"
#include "../sensitivity.hpp"
#include "../standard_metrics.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace investcalc {
namespace io {

// Result documents keep field order. Numbers are rounded here and only
// here: currency to 2 decimals, composite indices to 4.
using ordered_json = nlohmann::ordered_json;

ordered_json to_json(const ScenarioInput& input);
ordered_json to_json(const MetricsResult& result, bool include_series = true);
ordered_json to_json(const ScenarioComparison& comparison);
ordered_json to_json(const LoanResult& result, bool include_schedule = true);
ordered_json to_json(const LoanComparison& comparison);
ordered_json to_json(const ForecastResult& result);
ordered_json to_json(const CompositeResult& result);
ordered_json to_json(const BreakEvenResult& result);
ordered_json to_json(const PricingResult& result);
ordered_json to_json(const SensitivityMatrix& matrix, const std::vector<TornadoEntry>& tornado);
ordered_json to_json(const BenchmarkComparison& comparison);
ordered_json to_json(const HealthScore& score);
ordered_json to_json(const RunnerStats& stats);

// Write a document to a stream (pretty_print indents by 2)
void write_json(std::ostream& os, const ordered_json& document, bool pretty_print = true);

// Write a document to a file; throws std::runtime_error if it cannot be opened
void write_json(const std::string& filepath, const ordered_json& document, bool pretty_print = true);

} // namespace io
} // namespace investcalc

#endif // INVESTCALC_IO_JSON_WRITER_HPP
