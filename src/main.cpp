#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <chrono>
#include <map>
#include "amortization.hpp"
#include "benchmark.hpp"
#include "break_even.hpp"
#include "calculation_runner.hpp"
#include "cash_flow_forecast.hpp"
#include "composite_index.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include "sensitivity.hpp"
#include "standard_metrics.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

using investcalc::io::ordered_json;

namespace {

struct CLIArgs {
    std::string request_path;
    std::string output_path;     // Overrides output.path in the request
    std::string parquet_path;    // Overrides output.parquet in the request
    std::string log_level;       // Overrides logging.level in the request
    bool compact = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "InvestCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --request <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --request <path>            JSON request naming the mode and its inputs\n\n";
    std::cerr << "Modes (request \"mode\" field):\n";
    std::cerr << "  metrics        ROI, NPV, IRR and payback for one scenario\n";
    std::cerr << "  scenarios      Expected, best and worst cases\n";
    std::cerr << "  loan           Payment, amortization schedule and affordability\n";
    std::cerr << "  loan-compare   Cheapest of several loan offers\n";
    std::cerr << "  forecast       Month-by-month cash position\n";
    std::cerr << "  composite      Operational friction, tech-debt drag and efficiency indices\n";
    std::cerr << "  break-even     Units and revenue needed to cover fixed costs\n";
    std::cerr << "  pricing        Price points for a target margin\n";
    std::cerr << "  sensitivity    NPV sweep and tornado ranking\n";
    std::cerr << "  benchmark      Percentile position against industry benchmarks\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Row data as Parquet (requires Apache Arrow)\n";
    std::cerr << "  --compact                   Single-line JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --request data/requests/metrics.json --output result.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--request" && i + 1 < argc) {
            args.request_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--compact") {
            args.compact = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.request_path.empty()) {
        std::cerr << "Error: --request is required\n";
        valid = false;
    } else if (!file_exists(args.request_path)) {
        std::cerr << "Error: Request file not found: " << args.request_path << "\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

ordered_json strings_to_json(const std::vector<std::string>& values) {
    ordered_json array = ordered_json::array();
    for (const auto& value : values) {
        array.push_back(value);
    }
    return array;
}

ordered_json template_to_json(const investcalc::BusinessTemplate& tmpl) {
    ordered_json j;
    j["id"] = tmpl.id;
    j["name"] = tmpl.name;
    j["industry"] = tmpl.industry;
    return j;
}

struct RunSummary {
    size_t rows_produced = 0;
    bool parquet_written = false;
};

// Runs the calculation the request names and builds its result document.
// Row data for Parquet export is written here since only the mode knows it.
ordered_json dispatch(const investcalc::CalculationRequest& request, const std::string& parquet_path,
                      RunSummary& summary) {
    using namespace investcalc;

    ordered_json document;
    document["mode"] = mode_to_string(request.mode);

    switch (request.mode) {
        case CalculationMode::Metrics: {
            ScenarioInput input = *request.scenario;
            if (request.adjustments) {
                input = apply_adjustments(input, *request.adjustments);
            }

            CalculationRunner runner(request.runner);
            CalculationResponse response = runner.run(input);
            if (!response.success) {
                std::rethrow_exception(response.error);
            }

            document["input"] = io::to_json(input);
            document["result"] = io::to_json(response.metrics);
            document["execution"] = {
                {"path", execution_path_to_string(response.path)},
                {"execution_time_ms", round_to(response.execution_time_ms, 2)}
            };
            summary.rows_produced = response.metrics.monthly_cash_flow.size();

            if (!parquet_path.empty()) {
                ParquetWriter::write_cash_flows(response.metrics, parquet_path);
                summary.parquet_written = true;
            }
            break;
        }

        case CalculationMode::Scenarios: {
            CalculationRunner runner(request.runner);
            ScenarioComparison comparison = runner.run_all_scenarios(*request.scenario);

            document["result"] = io::to_json(comparison);
            document["execution"] = io::to_json(runner.get_stats());
            summary.rows_produced = 3;

            if (!parquet_path.empty()) {
                ParquetWriter::write_cash_flows(comparison.expected.metrics, parquet_path);
                summary.parquet_written = true;
            }
            break;
        }

        case CalculationMode::Loan: {
            LoanResult result = calculate_loan(*request.loan);

            document["result"] = io::to_json(result);
            document["result"]["recommendations"] = strings_to_json(loan_recommendations(result, *request.loan));
            summary.rows_produced = result.schedule.size();

            if (!parquet_path.empty()) {
                ParquetWriter::write_schedule(result, parquet_path);
                summary.parquet_written = true;
            }
            break;
        }

        case CalculationMode::LoanCompare: {
            LoanComparison comparison = compare_loan_options(request.loans);
            document["result"] = io::to_json(comparison);
            summary.rows_produced = comparison.options.size();
            break;
        }

        case CalculationMode::Forecast: {
            ForecastResult result = calculate_forecast(*request.forecast);
            document["result"] = io::to_json(result);
            summary.rows_produced = result.months.size();

            if (!parquet_path.empty()) {
                ParquetWriter::write_forecast(result, parquet_path);
                summary.parquet_written = true;
            }
            break;
        }

        case CalculationMode::Composite: {
            document["result"] = io::to_json(calculate_composite_indices(*request.composite));
            summary.rows_produced = 3;
            break;
        }

        case CalculationMode::BreakEven: {
            if (request.business_template) {
                document["template"] = template_to_json(*request.business_template);
            }
            document["result"] = io::to_json(calculate_break_even(*request.break_even));
            summary.rows_produced = 1;
            break;
        }

        case CalculationMode::Pricing: {
            if (request.business_template) {
                document["template"] = template_to_json(*request.business_template);
            }
            PricingResult result = calculate_pricing(*request.pricing);
            document["result"] = io::to_json(result);
            document["result"]["recommendations"] = strings_to_json(pricing_recommendations(result, *request.pricing));
            summary.rows_produced = 1;
            break;
        }

        case CalculationMode::Sensitivity: {
            SensitivityMatrix matrix = run_sensitivity(*request.scenario, request.sensitivity_variables,
                                                       request.sensitivity_variations);
            document["result"] = io::to_json(matrix, build_tornado(matrix));
            summary.rows_produced = matrix.size();

            if (!parquet_path.empty()) {
                ParquetWriter::write_sensitivity(matrix, parquet_path);
                summary.parquet_written = true;
            }
            break;
        }

        case CalculationMode::Benchmark: {
            const BenchmarkRequest& benchmark = *request.benchmark;
            BenchmarkTable table = BenchmarkTable::load_from_csv(benchmark.table_path);
            const auto& known = table.metrics(benchmark.industry);
            const BusinessTemplate* tmpl = request.business_template ? &*request.business_template : nullptr;

            // Metrics the table lacks may still be rated against the template's
            // bands; anything else is an unknown metric
            std::map<std::string, double> benchmarked;
            ordered_json template_health = ordered_json::array();
            for (const auto& entry : benchmark.metrics) {
                if (known.count(entry.first) == 0 && tmpl && tmpl->benchmarks.count(entry.first) != 0) {
                    MetricHealth health = assess_metric_health(*tmpl, entry.first, entry.second);
                    template_health.push_back({
                        {"metric", entry.first},
                        {"value", entry.second},
                        {"status", health_status_to_string(health.status)},
                        {"message", health.message}
                    });
                } else {
                    benchmarked[entry.first] = entry.second;
                }
            }

            ordered_json comparisons = ordered_json::array();
            for (const auto& entry : benchmarked) {
                comparisons.push_back(io::to_json(compare_detailed(table, benchmark.industry,
                                                                   entry.first, entry.second)));
            }

            ordered_json result;
            result["industry"] = benchmark.industry;
            result["display_name"] = table.display_name(benchmark.industry);
            result["comparisons"] = comparisons;
            result["health_score"] = io::to_json(health_score(table, benchmark.industry, benchmarked));
            if (tmpl) {
                document["template"] = template_to_json(*tmpl);
                result["template_health"] = template_health;
            }

            document["result"] = result;
            summary.rows_produced = comparisons.size() + template_health.size();
            break;
        }
    }

    return document;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    investcalc::Logger& logger = investcalc::Logger::get_instance();

    try {
        auto start = std::chrono::high_resolution_clock::now();

        investcalc::CalculationRequest request = investcalc::parse_request_from_file(args.request_path);

        // Request logging settings first, CLI flags on top
        investcalc::LoggerConfig log_config = request.logging ? *request.logging : investcalc::LoggerConfig();
        if (!args.log_level.empty()) {
            log_config.min_level = investcalc::string_to_level(args.log_level);
        }
        logger.configure(log_config);

        std::string output_path = args.output_path.empty() ? request.output_path : args.output_path;
        std::string parquet_path = args.parquet_path.empty() ? request.parquet_path : args.parquet_path;

        RunSummary summary;
        ordered_json document = dispatch(request, parquet_path, summary);
        if (!parquet_path.empty() && !summary.parquet_written) {
            logger.log_warning(
                investcalc::CalculationContext("investcalc", investcalc::mode_to_string(request.mode)),
                "mode has no row data for Parquet export; skipped " + parquet_path);
        }

        auto end = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
        logger.log_run_complete(
            investcalc::CalculationContext("investcalc", investcalc::mode_to_string(request.mode)),
            elapsed_ms, summary.rows_produced);

        // Write JSON output
        if (output_path.empty()) {
            investcalc::io::write_json(std::cout, document, !args.compact);
        } else {
            investcalc::io::write_json(output_path, document, !args.compact);
            std::cerr << "Output written to: " << output_path << "\n";
        }
        if (summary.parquet_written) {
            std::cerr << "Parquet written to: " << parquet_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(investcalc::CalculationContext("investcalc", "main"), e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
