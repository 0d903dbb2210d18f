/**
 * @file logger.hpp
 * @brief Structured logging for chart generation and ceiling persistence
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (job id, operation, phase)
 * - Per-chart metrics (months, fetches, hours)
 * - Token masking for API credentials
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef BURNCALC_LOGGER_HPP
#define BURNCALC_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace burncalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-month fetch and projection details
    INFO,    ///< Chart generation start/end, ceiling load/save
    WARN,    ///< Recoverable problems (ceiling record unreadable, empty record used)
    ERROR    ///< Failures that abort an operation
};

/**
 * @brief Convert log level to string
 */
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
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Context attached to every log event
 */
struct LogContext {
    int64_t job_id;              ///< Job the operation runs for (0 when none)
    std::string operation;       ///< Operation name (chart, ceiling, jobs)
    std::string phase;           ///< Current phase (validate, fetch, project, accrue)

    LogContext() : job_id(0) {}

    LogContext(int64_t job, const std::string& op)
        : job_id(job), operation(op) {}
};

/**
 * @brief Summary metrics of one chart generation
 */
struct ChartMetrics {
    double execution_time_ms;    ///< Wall time of the whole operation
    size_t month_count;          ///< Months on the chart axis
    size_t fetch_count;          ///< Timesheet fetches issued
    size_t entry_count;          ///< Timesheet entries received
    size_t employee_count;       ///< Distinct users who logged time
    double actual_hours;         ///< Hours from timesheets
    double projected_hours;      ///< Hours added by projection
    bool has_ceiling;            ///< Whether a ceiling series was produced

    ChartMetrics()
        : execution_time_ms(0.0), month_count(0), fetch_count(0), entry_count(0),
          employee_count(0), actual_hours(0.0), projected_hours(0.0), has_ceiling(false) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("burncalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx(42, "chart");
 *   Logger::get_instance().log_chart_start(ctx, "2025-01-01", "2025-12-31", "2025-06-30", 12);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of chart generation
     *
     * @param ctx Log context
     * @param pop_start Period of performance start (YYYY-MM-DD)
     * @param pop_end Period of performance end (YYYY-MM-DD)
     * @param query_stop Last day of actuals (YYYY-MM-DD)
     * @param month_count Months on the chart axis
     */
    void log_chart_start(
        const LogContext& ctx,
        const std::string& pop_start,
        const std::string& pop_end,
        const std::string& query_stop,
        size_t month_count
    );

    /**
     * @brief Log one completed per-month timesheet fetch
     */
    void log_month_fetched(
        const LogContext& ctx,
        const std::string& month,
        const std::string& range_start,
        const std::string& range_end,
        size_t entry_count,
        double hours
    );

    /**
     * @brief Log projected hours added to a month
     */
    void log_projection_added(
        const LogContext& ctx,
        const std::string& month,
        double hours
    );

    /**
     * @brief Log chart generation completion
     */
    void log_chart_complete(const LogContext& ctx, const ChartMetrics& metrics);

    /**
     * @brief Log a rejected request (nothing was fetched)
     */
    void log_validation_failed(const LogContext& ctx, const std::string& message);

    /**
     * @brief Log a ceiling record read from disk
     */
    void log_ceiling_loaded(
        int64_t job_id,
        const std::string& path,
        size_t release_count,
        bool legacy_format
    );

    /**
     * @brief Log a ceiling record that could not be read; an empty record is used instead
     */
    void log_ceiling_load_failed(int64_t job_id, const std::string& path, const std::string& error_message);

    /**
     * @brief Log a ceiling record written to disk
     */
    void log_ceiling_saved(int64_t job_id, const std::string& path, size_t release_count);

    /**
     * @brief Log API configuration (token is masked)
     */
    void log_api_configured(const std::string& api_url, const std::string& api_token);

    /**
     * @brief Log error with context
     */
    void log_error(const LogContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    /**
     * @brief Mask a secret, keeping the first and last 4 characters
     */
    static std::string mask_token(const std::string& token);

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace burncalc

#endif // BURNCALC_LOGGER_HPP
