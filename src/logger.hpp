/**
 * @file logger.hpp
 * @brief Structured logging for the calculation engines
 *
 * One line per event, either JSON or plain text, written to stderr and/or a
 * log file. Engines emit DEBUG events for every computed metric so a run can
 * be audited; non-convergence, offload timeouts and rejected input are
 * reported at WARN.
 */

#ifndef INVESTCALC_LOGGER_HPP
#define INVESTCALC_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace investcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-metric calculation audit trail
    INFO,    ///< Run start/completion
    WARN,    ///< Approximated results, rejected input, timeouts
    ERROR    ///< Failures
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (unknown strings map to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Which engine and operation an event belongs to
 */
struct CalculationContext {
    std::string engine;      ///< e.g. "StandardMetricsEngine"
    std::string operation;   ///< e.g. "calculate_metrics"

    CalculationContext() = default;
    CalculationContext(const std::string& engine_, const std::string& operation_)
        : engine(engine_), operation(operation_) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;          ///< Minimum level to output
    bool enable_console;         ///< Log to stderr
    bool enable_file;            ///< Log to file
    std::string log_file_path;   ///< File path for logs (appended)
    bool enable_json;            ///< JSON lines vs. plain text

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("investcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Process-wide structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   CalculationContext ctx("StandardMetricsEngine", "calculate_metrics");
 *   Logger::get_instance().log_calculation(ctx, "npv", 12345.67);
 *   @endcode
 *
 * All methods are safe to call from the sensitivity workers and the
 * offload thread.
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    /**
     * @brief Record one computed metric (DEBUG)
     */
    void log_calculation(
        const CalculationContext& ctx,
        const std::string& metric,
        double value
    );

    /**
     * @brief Record rejected input (WARN)
     *
     * @param field Offending field name
     * @param message Full validation message
     */
    void log_validation_failure(
        const CalculationContext& ctx,
        const std::string& field,
        const std::string& message
    );

    /**
     * @brief Record an IRR estimate that did not converge (WARN)
     */
    void log_irr_not_converged(
        const CalculationContext& ctx,
        const std::string& status,
        int iterations,
        double estimate_percent
    );

    /**
     * @brief Record an offloaded calculation that timed out (WARN)
     */
    void log_offload_timeout(
        const CalculationContext& ctx,
        size_t timeout_seconds,
        int project_duration
    );

    /**
     * @brief Record the completion of a top-level run (INFO)
     */
    void log_run_complete(
        const CalculationContext& ctx,
        double execution_time_ms,
        size_t rows_produced
    );

    void log_warning(const CalculationContext& ctx, const std::string& warning_message);

    void log_error(const CalculationContext& ctx, const std::string& error_message);

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace investcalc

#endif // INVESTCALC_LOGGER_HPP
