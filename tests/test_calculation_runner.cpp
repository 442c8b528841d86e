#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "calculation_runner.hpp"
#include "validator.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace investcalc;
using Catch::Approx;

namespace {

ScenarioInput scenario_with_duration(int months) {
    return ScenarioInput(50000.0, 10.0, months, 36000.0, 5.0, 8000.0, 2000.0);
}

MetricsResult slow_calculator(const ScenarioInput& input) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    return calculate_metrics(input);
}

MetricsResult failing_calculator(const ScenarioInput&) {
    throw ValidationError(engine_names::STANDARD_METRICS, "yearly_revenue", "rejected by test calculator");
}

MetricsResult non_standard_failure(const ScenarioInput&) {
    throw 42;
}

} // anonymous namespace

// ============================================================================
// Path selection
// ============================================================================

TEST_CASE("Offload threshold", "[runner]") {
    RunnerConfig config;
    REQUIRE(config.timeout_seconds == 30);
    REQUIRE(config.offload_threshold_months == 24);
    REQUIRE(config.enable_offload);

    CalculationRunner runner(config);
    REQUIRE_FALSE(runner.should_offload(scenario_with_duration(12)));
    REQUIRE_FALSE(runner.should_offload(scenario_with_duration(23)));
    REQUIRE(runner.should_offload(scenario_with_duration(24)));
    REQUIRE(runner.should_offload(scenario_with_duration(60)));

    config.enable_offload = false;
    CalculationRunner inline_runner(config);
    REQUIRE_FALSE(inline_runner.should_offload(scenario_with_duration(60)));
}

TEST_CASE("Short projects run synchronously", "[runner]") {
    CalculationRunner runner;
    ScenarioInput input = scenario_with_duration(12);

    CalculationResponse response = runner.run(input);

    REQUIRE(response.success);
    REQUIRE(response.path == ExecutionPath::Synchronous);
    REQUIRE(response.execution_time_ms >= 0.0);
    REQUIRE(response.metrics.npv == Approx(calculate_metrics(input).npv));
    REQUIRE(runner.get_stats().synchronous_runs == 1);
    REQUIRE(runner.get_stats().offloaded_runs == 0);
}

TEST_CASE("Long projects are offloaded", "[runner]") {
    CalculationRunner runner;
    ScenarioInput input = scenario_with_duration(36);

    CalculationResponse response = runner.run(input);

    REQUIRE(response.success);
    REQUIRE(response.path == ExecutionPath::Offloaded);
    REQUIRE(response.metrics.npv == Approx(calculate_metrics(input).npv));
    REQUIRE(response.metrics.monthly_cash_flow.size() == 36);
    REQUIRE(runner.get_stats().offloaded_runs == 1);
    REQUIRE(runner.get_stats().timeout_count == 0);
}

TEST_CASE("Timed-out offload falls back to the calling thread", "[runner]") {
    RunnerConfig config;
    config.timeout_seconds = 0;
    CalculationRunner runner(config, slow_calculator);
    ScenarioInput input = scenario_with_duration(36);

    CalculationResponse response = runner.run(input);

    REQUIRE(response.success);
    REQUIRE(response.path == ExecutionPath::FallbackAfterTimeout);
    REQUIRE(response.metrics.npv == Approx(calculate_metrics(input).npv));
    REQUIRE(runner.get_stats().timeout_count == 1);
    REQUIRE(runner.get_stats().synchronous_runs == 1);
    REQUIRE(execution_path_to_string(response.path) == "fallback_after_timeout");
}

TEST_CASE("Timed-out worker is joined before the runner goes away", "[runner]") {
    const std::thread::id caller = std::this_thread::get_id();
    std::atomic<int> finished(0);

    {
        RunnerConfig config;
        config.timeout_seconds = 0;
        // The worker outlasts the fallback computed on this thread
        CalculationRunner runner(config, [caller, &finished](const ScenarioInput& input) {
            if (std::this_thread::get_id() != caller) {
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
            }
            MetricsResult result = calculate_metrics(input);
            finished++;
            return result;
        });

        CalculationResponse response = runner.run(scenario_with_duration(36));
        REQUIRE(response.path == ExecutionPath::FallbackAfterTimeout);
        REQUIRE(finished.load() == 1);
    }

    REQUIRE(finished.load() == 2);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Calculation errors are reported, not swallowed", "[runner]") {
    CalculationRunner runner(RunnerConfig(), failing_calculator);

    SECTION("run carries the error") {
        for (int months : {12, 36}) {
            CalculationResponse response = runner.run(scenario_with_duration(months));
            REQUIRE_FALSE(response.success);
            REQUIRE(response.error_message == "StandardMetricsEngine: yearly_revenue rejected by test calculator");
            REQUIRE(response.error);
        }
        REQUIRE(runner.get_stats().failed_runs == 2);
    }

    SECTION("calculate rethrows the original exception") {
        REQUIRE_THROWS_AS(runner.calculate(scenario_with_duration(12)), ValidationError);
        REQUIRE_THROWS_AS(runner.calculate(scenario_with_duration(36)), ValidationError);
    }

    SECTION("non-standard exceptions are reported too") {
        CalculationRunner odd_runner(RunnerConfig(), non_standard_failure);
        for (int months : {12, 36}) {
            CalculationResponse response = odd_runner.run(scenario_with_duration(months));
            REQUIRE_FALSE(response.success);
            REQUIRE(response.error_message == "Unknown error during calculation");
            REQUIRE(response.error);
        }
        REQUIRE_THROWS_AS(odd_runner.calculate(scenario_with_duration(12)), int);
    }

    SECTION("invalid input through the default calculator") {
        CalculationRunner real_runner;
        ScenarioInput input = scenario_with_duration(36);
        input.initial_investment = -1.0;
        REQUIRE_THROWS_AS(real_runner.calculate(input), ValidationError);
    }
}

// ============================================================================
// Scenario cases
// ============================================================================

TEST_CASE("All three cases", "[runner]") {
    CalculationRunner runner;
    ScenarioComparison comparison = runner.run_all_scenarios(scenario_with_duration(36));

    REQUIRE(comparison.expected.scenario_case == ScenarioCase::Expected);
    REQUIRE(comparison.best.input.multiplier == BEST_CASE_MULTIPLIER);
    REQUIRE(comparison.best.metrics.npv > comparison.expected.metrics.npv);
    REQUIRE(comparison.expected.metrics.npv > comparison.worst.metrics.npv);

    SECTION("errors from any case propagate") {
        CalculationRunner failing(RunnerConfig(), failing_calculator);
        REQUIRE_THROWS_AS(failing.run_all_scenarios(scenario_with_duration(12)), ValidationError);
    }
}

TEST_CASE("Runner statistics", "[runner]") {
    CalculationRunner runner;
    runner.run(scenario_with_duration(12));
    runner.run(scenario_with_duration(36));
    runner.run(scenario_with_duration(48));

    const RunnerStats& stats = runner.get_stats();
    REQUIRE(stats.synchronous_runs == 1);
    REQUIRE(stats.offloaded_runs == 2);
    REQUIRE(stats.failed_runs == 0);
    REQUIRE(stats.total_execution_time_ms >= 0.0);

    runner.reset_stats();
    REQUIRE(runner.get_stats().synchronous_runs == 0);
    REQUIRE(runner.get_stats().offloaded_runs == 0);
}
