/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace wealthcalc {

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
    std::lock_guard<std::mutex> lock(write_mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::context_fields(
    const std::string& event, const LogContext& ctx) const
{
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    if (!ctx.request_id.empty()) {
        fields["request_id"] = ctx.request_id;
    }
    if (!ctx.mode.empty()) {
        fields["mode"] = ctx.mode;
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

void Logger::log_simulation_start(const LogContext& ctx, size_t paths, int horizon,
                                  size_t asset_classes) {
    auto fields = context_fields("simulation_start", ctx);
    fields["paths"] = std::to_string(paths);
    fields["time_horizon"] = std::to_string(horizon);
    fields["asset_classes"] = std::to_string(asset_classes);
    fields["draws"] = std::to_string(paths * static_cast<size_t>(std::max(horizon, 0)) * asset_classes);

    log(LogLevel::INFO, "Starting simulation batch", fields);
}

void Logger::log_validation_failed(
    const LogContext& ctx,
    const std::vector<std::pair<std::string, std::string>>& errors)
{
    auto fields = context_fields("validation_failed", ctx);
    fields["error_count"] = std::to_string(errors.size());
    for (size_t i = 0; i < std::min(errors.size(), size_t(5)); ++i) {
        fields["error_" + std::to_string(i)] = errors[i].first + ": " + errors[i].second;
    }

    log(LogLevel::WARN, "Simulation request rejected", fields);
}

void Logger::log_simulation_complete(const LogContext& ctx, const BatchMetrics& metrics,
                                     double median_final_value,
                                     double probability_of_depletion) {
    auto fields = context_fields("simulation_complete", ctx);
    fields["paths_completed"] = std::to_string(metrics.paths_completed);
    fields["threads"] = std::to_string(metrics.threads);
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
    fields["paths_per_sec"] = std::to_string(
        metrics.execution_time_ms > 0 ? (metrics.paths_completed * 1000.0 / metrics.execution_time_ms) : 0);
    fields["median_final_value"] = std::to_string(median_final_value);
    fields["probability_of_depletion"] = std::to_string(probability_of_depletion);

    log(LogLevel::INFO, "Simulation batch completed", fields);
}

void Logger::log_simulation_cancelled(const LogContext& ctx, const BatchMetrics& metrics,
                                      const std::string& reason) {
    auto fields = context_fields("simulation_cancelled", ctx);
    fields["paths_requested"] = std::to_string(metrics.paths_requested);
    fields["paths_completed"] = std::to_string(metrics.paths_completed);
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
    fields["reason"] = reason;

    log(LogLevel::WARN, "Simulation batch cancelled", fields);
}

void Logger::log_history_recorded(const std::string& result_id, size_t history_size,
                                  const std::string& history_file) {
    std::map<std::string, std::string> fields;
    fields["event"] = "history_recorded";
    fields["result_id"] = result_id;
    fields["history_size"] = std::to_string(history_size);
    if (!history_file.empty()) {
        fields["history_file"] = history_file;
    }

    log(LogLevel::INFO, "Result recorded in history", fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    auto fields = context_fields("error", ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Simulation error", fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    auto fields = context_fields("warning", ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_info(const std::string& message,
                      const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::map<std::string, std::string>& fields) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace wealthcalc
