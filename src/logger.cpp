/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace investcalc {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_calculation(
    const CalculationContext& ctx,
    const std::string& metric,
    double value
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "calculation";
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;
    fields["metric"] = metric;
    fields["value"] = format_number(value);

    log(LogLevel::DEBUG, "Calculated " + metric, std::move(fields));
}

void Logger::log_validation_failure(
    const CalculationContext& ctx,
    const std::string& field,
    const std::string& message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "validation_failed";
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;
    fields["field"] = field;
    fields["error_message"] = message;

    log(LogLevel::WARN, "Input rejected", std::move(fields));
}

void Logger::log_irr_not_converged(
    const CalculationContext& ctx,
    const std::string& status,
    int iterations,
    double estimate_percent
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "irr_not_converged";
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;
    fields["status"] = status;
    fields["iterations"] = std::to_string(iterations);
    fields["estimate_percent"] = format_number(estimate_percent);

    log(LogLevel::WARN, "IRR returned as best-effort estimate", std::move(fields));
}

void Logger::log_offload_timeout(
    const CalculationContext& ctx,
    size_t timeout_seconds,
    int project_duration
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "offload_timeout";
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;
    fields["timeout_seconds"] = std::to_string(timeout_seconds);
    fields["project_duration"] = std::to_string(project_duration);

    log(LogLevel::WARN, "Offloaded calculation timed out, running synchronously", std::move(fields));
}

void Logger::log_run_complete(
    const CalculationContext& ctx,
    double execution_time_ms,
    size_t rows_produced
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;
    fields["execution_time_ms"] = format_number(execution_time_ms);
    fields["rows_produced"] = std::to_string(rows_produced);

    log(LogLevel::INFO, "Run completed", std::move(fields));
}

void Logger::log_warning(const CalculationContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(const CalculationContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Calculation error", std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace investcalc
