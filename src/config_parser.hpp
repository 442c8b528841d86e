/**
 * @file config_parser.hpp
 * @brief JSON request and configuration parsing
 *
 * A request file names the calculation mode and carries the input block
 * for that mode, plus optional logging, runner and output settings:
 *
 *   @code
 *   {
 *     "mode": "metrics",
 *     "logging": { "level": "DEBUG", "json": true, "file": "investcalc.log" },
 *     "runner": { "timeout_seconds": 30, "offload_threshold_months": 24 },
 *     "scenario": { "initial_investment": 50000, "discount_rate": 10, ... },
 *     "output": { "path": "result.json", "parquet": "flows.parquet" }
 *   }
 *   @endcode
 *
 * String paths support ${VAR} expansion. When parsed from a file, relative
 * paths are resolved against the file's directory.
 */

#ifndef INVESTCALC_CONFIG_PARSER_HPP
#define INVESTCALC_CONFIG_PARSER_HPP

#include "business_template.hpp"
#include "calculation_runner.hpp"
#include "inputs.hpp"
#include "logger.hpp"
#include "scenario.hpp"
#include "sensitivity.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace investcalc {

/**
 * @brief Exception thrown when a request or config file cannot be parsed
 *
 * Messages name the offending field, e.g. "Missing required field: scenario.discount_rate".
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Calculation selected by a request
 */
enum class CalculationMode {
    Metrics,
    Scenarios,
    Loan,
    LoanCompare,
    Forecast,
    Composite,
    BreakEven,
    Pricing,
    Sensitivity,
    Benchmark
};

std::string mode_to_string(CalculationMode mode);

/**
 * @throws ConfigParseError for an unknown mode name
 */
CalculationMode mode_from_string(const std::string& name);

/**
 * @brief Benchmark comparison request
 */
struct BenchmarkRequest {
    std::string table_path;                 ///< Benchmark CSV
    std::string industry;
    std::map<std::string, double> metrics;  ///< Metric name -> business value
};

/**
 * @brief A parsed request. Only the block required by the mode is guaranteed.
 */
struct CalculationRequest {
    CalculationMode mode;
    std::optional<LoggerConfig> logging;
    RunnerConfig runner;

    std::optional<ScenarioInput> scenario;
    std::optional<ScenarioAdjustments> adjustments;
    std::vector<SensitivityVariable> sensitivity_variables;
    std::vector<double> sensitivity_variations;

    std::optional<LoanInput> loan;
    std::vector<LoanInput> loans;
    std::optional<ForecastInput> forecast;
    std::optional<CompositeInputs> composite;
    std::optional<BreakEvenInput> break_even;
    std::optional<PricingInput> pricing;
    std::optional<BenchmarkRequest> benchmark;
    std::optional<BusinessTemplate> business_template;

    std::string output_path;                ///< Empty = stdout
    std::string parquet_path;               ///< Empty = no Parquet export

    CalculationRequest();
};

/**
 * @brief Parses a request from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid or
 *         a required field is missing or has the wrong type
 */
CalculationRequest parse_request_from_file(const std::string& file_path);

/**
 * @brief Parses a request from a JSON string (paths are left as given)
 */
CalculationRequest parse_request_from_string(const std::string& json_string);

/**
 * @brief Loads business templates from a JSON file ({"templates": [...]})
 */
BusinessTemplateSet parse_business_templates_from_file(const std::string& file_path);

BusinessTemplateSet parse_business_templates_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of a config file
 *
 * Absolute paths and an empty config_file_path leave the path unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace investcalc

#endif // INVESTCALC_CONFIG_PARSER_HPP
