/**
 * @file logger.hpp
 * @brief Structured logging for the simulation engine and CLI
 *
 * The Logger provides:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output (one event per line) or plain text
 * - Batch context (request id, execution mode, phase)
 * - Batch metrics (paths completed, threads, execution time)
 *
 * Events are emitted before and after a batch, never from inside the path loop.
 */

#ifndef WEALTHCALC_LOGGER_HPP
#define WEALTHCALC_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace wealthcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information
    INFO,    ///< Batch start/end, history updates
    WARN,    ///< Non-fatal issues
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
 * @brief Parse log level from string (case-sensitive, INFO if unknown)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Context attached to every batch event
 */
struct LogContext {
    std::string request_id;     ///< Caller-supplied request id (may be empty)
    std::string mode;           ///< "sequential" or "parallel"
    std::string phase;          ///< validate, simulate, aggregate, persist

    LogContext() = default;
    LogContext(const std::string& id, const std::string& mode_)
        : request_id(id), mode(mode_) {}
};

/**
 * @brief Metrics reported when a batch finishes or stops
 */
struct BatchMetrics {
    size_t paths_requested;
    size_t paths_completed;
    int threads;
    double execution_time_ms;

    BatchMetrics()
        : paths_requested(0), paths_completed(0), threads(1), execution_time_ms(0.0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to stderr
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (appended)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("wealthcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx("run-42", "parallel");
 *   Logger::get_instance().log_simulation_start(ctx, 10000, 30, 4);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a batch
     *
     * @param paths Number of paths requested
     * @param horizon Time horizon in years
     * @param asset_classes Number of asset classes
     */
    void log_simulation_start(const LogContext& ctx, size_t paths, int horizon,
                              size_t asset_classes);

    /**
     * @brief Log a rejected request
     *
     * @param errors (kind, message) pairs in validation order
     */
    void log_validation_failed(const LogContext& ctx,
                               const std::vector<std::pair<std::string, std::string>>& errors);

    /**
     * @brief Log a completed batch with headline statistics
     */
    void log_simulation_complete(const LogContext& ctx, const BatchMetrics& metrics,
                                 double median_final_value, double probability_of_depletion);

    /**
     * @brief Log a batch stopped by cancellation or timeout
     */
    void log_simulation_cancelled(const LogContext& ctx, const BatchMetrics& metrics,
                                  const std::string& reason);

    /**
     * @brief Log a result added to the history
     */
    void log_history_recorded(const std::string& result_id, size_t history_size,
                              const std::string& history_file);

    void log_error(const LogContext& ctx, const std::string& error_message);
    void log_warning(const LogContext& ctx, const std::string& warning_message);
    void log_info(const std::string& message, const std::map<std::string, std::string>& fields = {});

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex write_mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const std::string& event, const LogContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace wealthcalc

#endif // WEALTHCALC_LOGGER_HPP
