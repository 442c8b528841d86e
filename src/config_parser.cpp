#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace investcalc {

CalculationRequest::CalculationRequest()
    : mode(CalculationMode::Metrics),
      sensitivity_variables(default_sensitivity_variables()),
      sensitivity_variations(default_variations()) {}

// ============================================================================
// Modes
// ============================================================================

namespace {

const std::map<std::string, CalculationMode>& mode_names() {
    static const std::map<std::string, CalculationMode> names = {
        {"metrics", CalculationMode::Metrics},
        {"scenarios", CalculationMode::Scenarios},
        {"loan", CalculationMode::Loan},
        {"loan-compare", CalculationMode::LoanCompare},
        {"forecast", CalculationMode::Forecast},
        {"composite", CalculationMode::Composite},
        {"break-even", CalculationMode::BreakEven},
        {"pricing", CalculationMode::Pricing},
        {"sensitivity", CalculationMode::Sensitivity},
        {"benchmark", CalculationMode::Benchmark},
    };
    return names;
}

} // anonymous namespace

std::string mode_to_string(CalculationMode mode) {
    for (const auto& [name, value] : mode_names()) {
        if (value == mode) {
            return name;
        }
    }
    return "unknown";
}

CalculationMode mode_from_string(const std::string& name) {
    auto it = mode_names().find(name);
    if (it == mode_names().end()) {
        throw ConfigParseError("Unknown mode: " + name);
    }
    return it->second;
}

// ============================================================================
// Path helpers
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        if (var_name.empty()) {
            // Lone '$' is kept as-is
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (path.empty() || config_file_path.empty() || p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

// ============================================================================
// Field helpers
// ============================================================================

namespace {

std::string qualify(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

const json& require_field(const json& j, const std::string& key, const std::string& path) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigParseError("Missing required field: " + qualify(path, key));
    }
    return j.at(key);
}

const json& require_object(const json& j, const std::string& key, const std::string& path) {
    const json& value = require_field(j, key, path);
    if (!value.is_object()) {
        throw ConfigParseError("Field " + qualify(path, key) + " must be an object");
    }
    return value;
}

double as_number(const json& value, const std::string& field) {
    if (!value.is_number()) {
        throw ConfigParseError("Field " + field + " must be a number");
    }
    return value.get<double>();
}

double number_field(const json& j, const std::string& key, const std::string& path) {
    return as_number(require_field(j, key, path), qualify(path, key));
}

int integer_field(const json& j, const std::string& key, const std::string& path) {
    const json& value = require_field(j, key, path);
    if (!value.is_number_integer()) {
        throw ConfigParseError("Field " + qualify(path, key) + " must be an integer");
    }

    // Read at full width so an oversized value fails instead of wrapping
    bool in_range = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw ConfigParseError("Field " + qualify(path, key) + " must be an integer in range");
    }
    return static_cast<int>(value.get<std::int64_t>());
}

std::optional<double> optional_number(const json& j, const std::string& key, const std::string& path) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return as_number(j.at(key), qualify(path, key));
}

double number_or(const json& j, const std::string& key, const std::string& path, double fallback) {
    return optional_number(j, key, path).value_or(fallback);
}

int integer_or(const json& j, const std::string& key, const std::string& path, int fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return integer_field(j, key, path);
}

std::string string_field(const json& j, const std::string& key, const std::string& path) {
    const json& value = require_field(j, key, path);
    if (!value.is_string()) {
        throw ConfigParseError("Field " + qualify(path, key) + " must be a string");
    }
    return value.get<std::string>();
}

bool bool_or(const json& j, const std::string& key, const std::string& path, bool fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_boolean()) {
        throw ConfigParseError("Field " + qualify(path, key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

const json& require_array(const json& j, const std::string& key, const std::string& path) {
    const json& value = require_field(j, key, path);
    if (!value.is_array()) {
        throw ConfigParseError("Field " + qualify(path, key) + " must be an array");
    }
    return value;
}

std::string path_field(const json& j, const std::string& key, const std::string& path,
                       const std::string& config_file_path) {
    return resolve_relative_path(expand_environment_variables(string_field(j, key, path)),
                                 config_file_path);
}

// ============================================================================
// Input blocks
// ============================================================================

ScenarioInput parse_scenario(const json& j, const std::string& path) {
    ScenarioInput input;
    input.initial_investment = number_field(j, "initial_investment", path);
    input.discount_rate = number_field(j, "discount_rate", path);
    input.project_duration = integer_field(j, "project_duration", path);
    input.yearly_revenue = number_field(j, "yearly_revenue", path);
    input.revenue_growth = number_or(j, "revenue_growth", path, 0.0);
    input.operating_costs = number_field(j, "operating_costs", path);
    input.maintenance_costs = number_field(j, "maintenance_costs", path);
    input.multiplier = number_or(j, "multiplier", path, 1.0);
    return input;
}

ScenarioAdjustments parse_adjustments(const json& j, const std::string& path) {
    return ScenarioAdjustments(number_or(j, "sales_percent", path, 0.0),
                               number_or(j, "costs_percent", path, 0.0),
                               number_or(j, "discount_points", path, 0.0));
}

LoanInput parse_loan(const json& j, const std::string& path) {
    LoanInput input(number_field(j, "principal", path),
                    number_field(j, "annual_rate", path),
                    integer_field(j, "term_months", path));
    input.origination_fee_percent = optional_number(j, "origination_fee_percent", path);
    input.monthly_revenue = optional_number(j, "monthly_revenue", path);
    input.monthly_expenses = optional_number(j, "monthly_expenses", path);
    return input;
}

std::vector<MonthlyAmount> parse_monthly_amounts(const json& j, const std::string& key, const std::string& path) {
    std::vector<MonthlyAmount> amounts;
    if (!j.contains(key)) {
        return amounts;
    }
    const json& array = require_array(j, key, path);
    for (size_t i = 0; i < array.size(); ++i) {
        std::string item_path = qualify(path, key) + "[" + std::to_string(i) + "]";
        amounts.push_back(MonthlyAmount{integer_field(array[i], "month", item_path),
                                        number_field(array[i], "amount", item_path)});
    }
    return amounts;
}

ForecastInput parse_forecast(const json& j, const std::string& path) {
    ForecastInput input(number_field(j, "starting_cash", path),
                        number_field(j, "monthly_revenue", path),
                        number_field(j, "monthly_expenses", path),
                        integer_or(j, "forecast_months", path, 12));
    input.revenue_growth_rate = number_or(j, "revenue_growth_rate", path, 0.0);
    input.expense_growth_rate = number_or(j, "expense_growth_rate", path, 0.0);

    if (j.contains("seasonal_factors")) {
        const json& factors = require_array(j, "seasonal_factors", path);
        for (size_t i = 0; i < factors.size(); ++i) {
            input.seasonal_factors.push_back(
                as_number(factors[i], qualify(path, "seasonal_factors") + "[" + std::to_string(i) + "]"));
        }
    }

    input.one_time_expenses = parse_monthly_amounts(j, "one_time_expenses", path);
    input.expected_receivables = parse_monthly_amounts(j, "expected_receivables", path);
    return input;
}

CompositeInputs parse_composite(const json& j, const std::string& path) {
    CompositeInputs input;

    std::string friction_path = qualify(path, "friction");
    const json& friction = require_object(j, "friction", path);
    input.friction.manual_hours_per_week = number_field(friction, "manual_hours_per_week", friction_path);
    input.friction.hourly_cost = number_field(friction, "hourly_cost", friction_path);
    input.friction.current_revenue = number_field(friction, "current_revenue", friction_path);
    input.friction.automation_potential = optional_number(friction, "automation_potential", friction_path);

    std::string debt_path = qualify(path, "tech_debt");
    const json& debt = require_object(j, "tech_debt", path);
    input.tech_debt.maintenance_hours_per_sprint = number_field(debt, "maintenance_hours_per_sprint", debt_path);
    input.tech_debt.total_dev_hours_per_sprint = number_field(debt, "total_dev_hours_per_sprint", debt_path);
    input.tech_debt.team_annual_cost = number_field(debt, "team_annual_cost", debt_path);
    input.tech_debt.incident_cost_per_month = number_field(debt, "incident_cost_per_month", debt_path);

    std::string efficiency_path = qualify(path, "efficiency");
    const json& efficiency = require_object(j, "efficiency", path);
    input.efficiency.current_revenue = number_field(efficiency, "current_revenue", efficiency_path);
    input.efficiency.previous_revenue = number_field(efficiency, "previous_revenue", efficiency_path);
    input.efficiency.current_burn_rate = number_field(efficiency, "current_burn_rate", efficiency_path);
    input.efficiency.previous_burn_rate = number_field(efficiency, "previous_burn_rate", efficiency_path);

    return input;
}

// Template defaults, when given, fill any field the block omits
BreakEvenInput parse_break_even(const json& j, const std::string& path, const BusinessTemplate* tmpl) {
    BreakEvenInput input;
    if (tmpl) {
        input = apply_break_even_template(*tmpl);
        input.fixed_costs = number_or(j, "fixed_costs", path, input.fixed_costs);
        input.price_per_unit = number_or(j, "price_per_unit", path, input.price_per_unit);
        input.variable_cost_per_unit = number_or(j, "variable_cost_per_unit", path, input.variable_cost_per_unit);
    } else {
        input.fixed_costs = number_field(j, "fixed_costs", path);
        input.price_per_unit = number_field(j, "price_per_unit", path);
        input.variable_cost_per_unit = number_field(j, "variable_cost_per_unit", path);
    }
    input.current_sales_units = optional_number(j, "current_sales_units", path);
    input.period_months = integer_or(j, "period_months", path, 12);
    return input;
}

PricingInput parse_pricing(const json& j, const std::string& path, const BusinessTemplate* tmpl) {
    PricingInput input;
    if (tmpl) {
        input = apply_pricing_template(*tmpl);
        input.cost_per_unit = number_or(j, "cost_per_unit", path, input.cost_per_unit);
        input.desired_margin = number_or(j, "desired_margin", path, input.desired_margin);
    } else {
        input.cost_per_unit = number_field(j, "cost_per_unit", path);
        input.desired_margin = number_field(j, "desired_margin", path);
    }
    input.competitor_price = optional_number(j, "competitor_price", path);
    input.target_volume = optional_number(j, "target_volume", path);
    input.fixed_costs_per_period = optional_number(j, "fixed_costs_per_period", path);
    return input;
}

BenchmarkRequest parse_benchmark(const json& j, const std::string& path, const std::string& config_file_path) {
    BenchmarkRequest request;
    request.table_path = path_field(j, "table", path, config_file_path);
    request.industry = string_field(j, "industry", path);

    const json& metrics = require_object(j, "metrics", path);
    std::string metrics_path = qualify(path, "metrics");
    for (auto it = metrics.begin(); it != metrics.end(); ++it) {
        request.metrics[it.key()] = as_number(it.value(), qualify(metrics_path, it.key()));
    }
    return request;
}

void parse_sensitivity(const json& j, CalculationRequest& request) {
    const std::string path = "sensitivity";

    if (j.contains("variables")) {
        const json& names = require_array(j, "variables", path);
        request.sensitivity_variables.clear();
        for (size_t i = 0; i < names.size(); ++i) {
            std::string field = path + ".variables[" + std::to_string(i) + "]";
            if (!names[i].is_string()) {
                throw ConfigParseError("Field " + field + " must be a string");
            }
            try {
                request.sensitivity_variables.push_back(
                    sensitivity_variable_from_string(names[i].get<std::string>()));
            } catch (const std::invalid_argument& e) {
                throw ConfigParseError("Field " + field + ": " + e.what());
            }
        }
    }

    if (j.contains("variations")) {
        const json& variations = require_array(j, "variations", path);
        request.sensitivity_variations.clear();
        for (size_t i = 0; i < variations.size(); ++i) {
            request.sensitivity_variations.push_back(
                as_number(variations[i], path + ".variations[" + std::to_string(i) + "]"));
        }
    }
}

LoggerConfig parse_logging(const json& j, const std::string& config_file_path) {
    const std::string path = "logging";
    LoggerConfig config;

    if (j.contains("level")) {
        std::string level = string_field(j, "level", path);
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("Field logging.level must be one of DEBUG, INFO, WARN, ERROR");
        }
        config.min_level = string_to_level(level);
    }
    config.enable_json = bool_or(j, "json", path, config.enable_json);
    config.enable_console = bool_or(j, "console", path, config.enable_console);
    if (j.contains("file")) {
        config.enable_file = true;
        config.log_file_path = path_field(j, "file", path, config_file_path);
    }
    return config;
}

RunnerConfig parse_runner(const json& j) {
    const std::string path = "runner";
    RunnerConfig config;

    int timeout = integer_or(j, "timeout_seconds", path, static_cast<int>(config.timeout_seconds));
    if (timeout < 0) {
        throw ConfigParseError("Field runner.timeout_seconds must not be negative");
    }
    config.timeout_seconds = static_cast<size_t>(timeout);
    config.offload_threshold_months = integer_or(j, "offload_threshold_months", path,
                                                 config.offload_threshold_months);
    config.enable_offload = bool_or(j, "enable_offload", path, config.enable_offload);
    return config;
}

BusinessTemplate parse_template(const json& j, const std::string& path) {
    BusinessTemplate tmpl;
    tmpl.id = string_field(j, "id", path);
    tmpl.name = string_field(j, "name", path);
    tmpl.industry = string_field(j, "industry", path);

    std::string defaults_path = qualify(path, "default_inputs");
    const json& defaults = require_object(j, "default_inputs", path);
    tmpl.fixed_costs = number_field(defaults, "fixed_costs", defaults_path);
    tmpl.price_per_unit = number_field(defaults, "price_per_unit", defaults_path);
    tmpl.variable_cost_per_unit = number_field(defaults, "variable_cost_per_unit", defaults_path);
    tmpl.desired_margin = number_field(defaults, "desired_margin", defaults_path);

    if (j.contains("benchmarks")) {
        std::string bands_path = qualify(path, "benchmarks");
        const json& bands = require_object(j, "benchmarks", path);
        for (auto it = bands.begin(); it != bands.end(); ++it) {
            std::string band_path = qualify(bands_path, it.key());
            tmpl.benchmarks[it.key()] = TemplateBand{
                number_field(it.value(), "min", band_path),
                number_field(it.value(), "max", band_path),
                number_field(it.value(), "optimal", band_path)
            };
        }
    }
    return tmpl;
}

BusinessTemplateSet parse_templates(const json& j) {
    const json& array = require_array(j, "templates", "");
    std::vector<BusinessTemplate> templates;
    templates.reserve(array.size());
    for (size_t i = 0; i < array.size(); ++i) {
        templates.push_back(parse_template(array[i], "templates[" + std::to_string(i) + "]"));
    }
    return BusinessTemplateSet(std::move(templates));
}

std::string read_file(const std::string& file_path, const std::string& what) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open " + what + ": " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json parse_json(const std::string& json_string) {
    try {
        return json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
}

// Mode-specific required blocks
void check_required_blocks(const CalculationRequest& request) {
    auto missing = [](const std::string& field) {
        return ConfigParseError("Missing required field: " + field);
    };

    switch (request.mode) {
        case CalculationMode::Metrics:
        case CalculationMode::Scenarios:
        case CalculationMode::Sensitivity:
            if (!request.scenario) throw missing("scenario");
            break;
        case CalculationMode::Loan:
            if (!request.loan) throw missing("loan");
            break;
        case CalculationMode::LoanCompare:
            if (request.loans.empty()) throw missing("loans");
            break;
        case CalculationMode::Forecast:
            if (!request.forecast) throw missing("forecast");
            break;
        case CalculationMode::Composite:
            if (!request.composite) throw missing("composite");
            break;
        case CalculationMode::BreakEven:
            if (!request.break_even) throw missing("break_even");
            break;
        case CalculationMode::Pricing:
            if (!request.pricing) throw missing("pricing");
            break;
        case CalculationMode::Benchmark:
            if (!request.benchmark) throw missing("benchmark");
            break;
    }
}

CalculationRequest parse_request(const json& j, const std::string& config_file_path) {
    if (!j.is_object()) {
        throw ConfigParseError("Request must be a JSON object");
    }

    CalculationRequest request;

    try {
        request.mode = mode_from_string(string_field(j, "mode", ""));

        if (j.contains("logging")) {
            request.logging = parse_logging(require_object(j, "logging", ""), config_file_path);
        }
        if (j.contains("runner")) {
            request.runner = parse_runner(require_object(j, "runner", ""));
        }

        if (j.contains("template")) {
            std::string templates_path = path_field(j, "templates_file", "", config_file_path);
            BusinessTemplateSet templates = parse_business_templates_from_file(templates_path);
            try {
                request.business_template = templates.find(string_field(j, "template", ""));
            } catch (const std::out_of_range& e) {
                throw ConfigParseError(e.what());
            }
        }
        const BusinessTemplate* tmpl = request.business_template ? &*request.business_template : nullptr;

        if (j.contains("scenario")) {
            request.scenario = parse_scenario(require_object(j, "scenario", ""), "scenario");
        }
        if (j.contains("adjustments")) {
            request.adjustments = parse_adjustments(require_object(j, "adjustments", ""), "adjustments");
        }
        if (j.contains("sensitivity")) {
            parse_sensitivity(require_object(j, "sensitivity", ""), request);
        }
        if (j.contains("loan")) {
            request.loan = parse_loan(require_object(j, "loan", ""), "loan");
        }
        if (j.contains("loans")) {
            const json& loans = require_array(j, "loans", "");
            for (size_t i = 0; i < loans.size(); ++i) {
                request.loans.push_back(parse_loan(loans[i], "loans[" + std::to_string(i) + "]"));
            }
        }
        if (j.contains("forecast")) {
            request.forecast = parse_forecast(require_object(j, "forecast", ""), "forecast");
        }
        if (j.contains("composite")) {
            request.composite = parse_composite(require_object(j, "composite", ""), "composite");
        }
        if (j.contains("break_even")) {
            request.break_even = parse_break_even(require_object(j, "break_even", ""), "break_even", tmpl);
        } else if (tmpl && request.mode == CalculationMode::BreakEven) {
            request.break_even = apply_break_even_template(*tmpl);
        }
        if (j.contains("pricing")) {
            request.pricing = parse_pricing(require_object(j, "pricing", ""), "pricing", tmpl);
        } else if (tmpl && request.mode == CalculationMode::Pricing) {
            request.pricing = apply_pricing_template(*tmpl);
        }
        if (j.contains("benchmark")) {
            request.benchmark = parse_benchmark(require_object(j, "benchmark", ""), "benchmark", config_file_path);
        }

        if (j.contains("output")) {
            const json& output = require_object(j, "output", "");
            if (output.contains("path")) {
                request.output_path = path_field(output, "path", "output", config_file_path);
            }
            if (output.contains("parquet")) {
                request.parquet_path = path_field(output, "parquet", "output", config_file_path);
            }
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    check_required_blocks(request);
    return request;
}

} // anonymous namespace

// ============================================================================
// Public entry points
// ============================================================================

CalculationRequest parse_request_from_string(const std::string& json_string) {
    return parse_request(parse_json(json_string), "");
}

CalculationRequest parse_request_from_file(const std::string& file_path) {
    return parse_request(parse_json(read_file(file_path, "request file")), file_path);
}

BusinessTemplateSet parse_business_templates_from_string(const std::string& json_string) {
    try {
        return parse_templates(parse_json(json_string));
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

BusinessTemplateSet parse_business_templates_from_file(const std::string& file_path) {
    return parse_business_templates_from_string(read_file(file_path, "templates file"));
}

} // namespace investcalc
