/**
 * @file calculation_runner.hpp
 * @brief Runs scenario evaluations off the calling thread with a timeout
 *
 * Long projects (project_duration >= offload threshold) are evaluated on a
 * worker thread. The request is the full ScenarioInput by value and the
 * response is either a MetricsResult or the error raised while computing
 * it. If no response arrives within the timeout the runner logs a warning
 * and evaluates the scenario synchronously instead. There is no retry.
 * A worker that timed out is still joined before its runner is destroyed.
 */

#ifndef INVESTCALC_CALCULATION_RUNNER_HPP
#define INVESTCALC_CALCULATION_RUNNER_HPP

#include "scenario.hpp"
#include "standard_metrics.hpp"
#include <exception>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace investcalc {

/**
 * @brief Runner configuration
 */
struct RunnerConfig {
    size_t timeout_seconds;          ///< Wait for an offloaded response (default: 30s)
    int offload_threshold_months;    ///< Offload when project_duration >= this (default: 24)
    bool enable_offload;             ///< false forces the synchronous path

    RunnerConfig()
        : timeout_seconds(30),
          offload_threshold_months(24),
          enable_offload(true) {}
};

/**
 * @brief How a response was produced
 */
enum class ExecutionPath {
    Synchronous,            ///< Below threshold or offload disabled
    Offloaded,              ///< Worker answered in time
    FallbackAfterTimeout    ///< Worker timed out, computed in-process
};

inline std::string execution_path_to_string(ExecutionPath path) {
    switch (path) {
        case ExecutionPath::Synchronous: return "synchronous";
        case ExecutionPath::Offloaded: return "offloaded";
        case ExecutionPath::FallbackAfterTimeout: return "fallback_after_timeout";
        default: return "unknown";
    }
}

/**
 * @brief Response to one calculation request
 */
struct CalculationResponse {
    bool success;
    MetricsResult metrics;          ///< Valid when success
    std::string error_message;      ///< Set when !success
    std::exception_ptr error;       ///< Original exception when !success
    ExecutionPath path;
    double execution_time_ms;

    CalculationResponse()
        : success(false), path(ExecutionPath::Synchronous), execution_time_ms(0.0) {}
};

/**
 * @brief Runner statistics
 */
struct RunnerStats {
    size_t offloaded_runs;
    size_t synchronous_runs;
    size_t timeout_count;
    size_t failed_runs;
    double total_execution_time_ms;

    RunnerStats()
        : offloaded_runs(0), synchronous_runs(0), timeout_count(0),
          failed_runs(0), total_execution_time_ms(0.0) {}
};

/**
 * @brief Dispatches scenario evaluations to the synchronous or offloaded path
 *
 * Usage Example:
 *   @code
 *   RunnerConfig config;
 *   config.timeout_seconds = 10;
 *
 *   CalculationRunner runner(config);
 *   CalculationResponse response = runner.run(input);
 *   if (!response.success) {
 *       std::cerr << "Error: " << response.error_message << std::endl;
 *   }
 *   @endcode
 */
class CalculationRunner {
public:
    using Calculator = std::function<MetricsResult(const ScenarioInput&)>;

    /**
     * @param config Runner configuration
     * @param calculator Evaluation function (defaults to calculate_metrics)
     */
    explicit CalculationRunner(
        const RunnerConfig& config = RunnerConfig(),
        Calculator calculator = calculate_metrics
    );

    /**
     * @brief Waits for any worker still running after a timeout
     */
    ~CalculationRunner();

    CalculationRunner(const CalculationRunner&) = delete;
    CalculationRunner& operator=(const CalculationRunner&) = delete;

    /**
     * @brief Evaluate one scenario; never throws
     */
    CalculationResponse run(const ScenarioInput& input);

    /**
     * @brief Evaluate one scenario, rethrowing the original error on failure
     */
    MetricsResult calculate(const ScenarioInput& input);

    /**
     * @brief Evaluate expected, best and worst cases concurrently
     *
     * @throws The first error raised by any case
     */
    ScenarioComparison run_all_scenarios(const ScenarioInput& base);

    bool should_offload(const ScenarioInput& input) const;

    const RunnerConfig& get_config() const { return config_; }
    const RunnerStats& get_stats() const { return stats_; }
    void reset_stats() { stats_ = RunnerStats(); }

private:
    RunnerConfig config_;
    Calculator calculator_;
    RunnerStats stats_;
    std::vector<std::future<MetricsResult>> timed_out_workers_;

    CalculationResponse run_synchronous(const ScenarioInput& input) const;
    CalculationResponse run_offloaded(const ScenarioInput& input);
};

} // namespace investcalc

#endif // INVESTCALC_CALCULATION_RUNNER_HPP
