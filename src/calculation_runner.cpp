/**
 * @file calculation_runner.cpp
 * @brief Implementation of offloaded scenario evaluation
 */

#include "calculation_runner.hpp"
#include "logger.hpp"
#include "validator.hpp"
#include <algorithm>
#include <chrono>

namespace investcalc {

CalculationRunner::CalculationRunner(const RunnerConfig& config, Calculator calculator)
    : config_(config), calculator_(std::move(calculator)) {}

CalculationRunner::~CalculationRunner() {
    for (auto& worker : timed_out_workers_) {
        worker.wait();
    }
}

bool CalculationRunner::should_offload(const ScenarioInput& input) const {
    return config_.enable_offload && input.project_duration >= config_.offload_threshold_months;
}

CalculationResponse CalculationRunner::run(const ScenarioInput& input) {
    auto start_time = std::chrono::steady_clock::now();

    CalculationResponse response = should_offload(input) ? run_offloaded(input)
                                                         : run_synchronous(input);

    auto end_time = std::chrono::steady_clock::now();
    response.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    if (response.path == ExecutionPath::Offloaded) {
        stats_.offloaded_runs++;
    } else {
        stats_.synchronous_runs++;
    }
    if (!response.success) {
        stats_.failed_runs++;
    }
    stats_.total_execution_time_ms += response.execution_time_ms;

    return response;
}

MetricsResult CalculationRunner::calculate(const ScenarioInput& input) {
    CalculationResponse response = run(input);
    if (!response.success) {
        std::rethrow_exception(response.error);
    }
    return response.metrics;
}

ScenarioComparison CalculationRunner::run_all_scenarios(const ScenarioInput& base) {
    ScenarioComparison comparison;
    comparison.expected.scenario_case = ScenarioCase::Expected;
    comparison.expected.input = with_case(base, ScenarioCase::Expected);
    comparison.best.scenario_case = ScenarioCase::Best;
    comparison.best.input = with_case(base, ScenarioCase::Best);
    comparison.worst.scenario_case = ScenarioCase::Worst;
    comparison.worst.input = with_case(base, ScenarioCase::Worst);

    // The cases share nothing, so they are evaluated concurrently
    Calculator calculator = calculator_;
    auto best = std::async(std::launch::async, [calculator, input = comparison.best.input]() {
        return calculator(input);
    });
    auto worst = std::async(std::launch::async, [calculator, input = comparison.worst.input]() {
        return calculator(input);
    });

    comparison.expected.metrics = calculate(comparison.expected.input);
    comparison.best.metrics = best.get();
    comparison.worst.metrics = worst.get();

    return comparison;
}

CalculationResponse CalculationRunner::run_synchronous(const ScenarioInput& input) const {
    CalculationResponse response;
    response.path = ExecutionPath::Synchronous;

    try {
        response.metrics = calculator_(input);
        response.success = true;
    } catch (const std::exception& e) {
        response.success = false;
        response.error_message = e.what();
        response.error = std::current_exception();
    } catch (...) {
        response.success = false;
        response.error_message = "Unknown error during calculation";
        response.error = std::current_exception();
    }
    return response;
}

CalculationResponse CalculationRunner::run_offloaded(const ScenarioInput& input) {
    // Drop workers from earlier timeouts that have since finished
    timed_out_workers_.erase(
        std::remove_if(timed_out_workers_.begin(), timed_out_workers_.end(),
                       [](const std::future<MetricsResult>& worker) {
                           return worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                       }),
        timed_out_workers_.end());

    // The worker owns copies of the request and calculator
    std::future<MetricsResult> future = std::async(std::launch::async, [calculator = calculator_, input]() {
        return calculator(input);
    });

    auto timeout_duration = std::chrono::seconds(config_.timeout_seconds);
    if (future.wait_for(timeout_duration) == std::future_status::timeout) {
        stats_.timeout_count++;
        CalculationContext ctx(engine_names::STANDARD_METRICS, "run_offloaded");
        Logger::get_instance().log_offload_timeout(ctx, config_.timeout_seconds, input.project_duration);
        timed_out_workers_.push_back(std::move(future));

        CalculationResponse response = run_synchronous(input);
        response.path = ExecutionPath::FallbackAfterTimeout;
        return response;
    }

    CalculationResponse response;
    response.path = ExecutionPath::Offloaded;
    try {
        response.metrics = future.get();
        response.success = true;
    } catch (const std::exception& e) {
        response.success = false;
        response.error_message = e.what();
        response.error = std::current_exception();
    } catch (...) {
        response.success = false;
        response.error_message = "Unknown error during calculation";
        response.error = std::current_exception();
    }
    return response;
}

} // namespace investcalc
