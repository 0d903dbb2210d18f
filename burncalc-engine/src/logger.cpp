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

namespace burncalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
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

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
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

void Logger::log_chart_start(
    const LogContext& ctx,
    const std::string& pop_start,
    const std::string& pop_end,
    const std::string& query_stop,
    size_t month_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "chart_start";
    fields["job_id"] = std::to_string(ctx.job_id);
    fields["operation"] = ctx.operation;
    fields["pop_start"] = pop_start;
    fields["pop_end"] = pop_end;
    fields["query_stop"] = query_stop;
    fields["month_count"] = std::to_string(month_count);

    log(LogLevel::INFO, "Generating chart", fields);
}

void Logger::log_month_fetched(
    const LogContext& ctx,
    const std::string& month,
    const std::string& range_start,
    const std::string& range_end,
    size_t entry_count,
    double hours
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "month_fetched";
    fields["job_id"] = std::to_string(ctx.job_id);
    fields["phase"] = ctx.phase;
    fields["month"] = month;
    fields["range_start"] = range_start;
    fields["range_end"] = range_end;
    fields["entry_count"] = std::to_string(entry_count);
    fields["hours"] = std::to_string(hours);

    log(LogLevel::DEBUG, "Fetched timesheets", fields);
}

void Logger::log_projection_added(
    const LogContext& ctx,
    const std::string& month,
    double hours
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "projection_added";
    fields["job_id"] = std::to_string(ctx.job_id);
    fields["phase"] = ctx.phase;
    fields["month"] = month;
    fields["hours"] = std::to_string(hours);

    log(LogLevel::DEBUG, "Projected hours", fields);
}

void Logger::log_chart_complete(const LogContext& ctx, const ChartMetrics& metrics) {
    std::map<std::string, std::string> fields;
    fields["event"] = "chart_complete";
    fields["job_id"] = std::to_string(ctx.job_id);
    fields["operation"] = ctx.operation;
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
    fields["month_count"] = std::to_string(metrics.month_count);
    fields["fetch_count"] = std::to_string(metrics.fetch_count);
    fields["entry_count"] = std::to_string(metrics.entry_count);
    fields["employee_count"] = std::to_string(metrics.employee_count);
    fields["actual_hours"] = std::to_string(metrics.actual_hours);
    fields["projected_hours"] = std::to_string(metrics.projected_hours);
    fields["has_ceiling"] = metrics.has_ceiling ? "true" : "false";

    log(LogLevel::INFO, "Chart generated", fields);
}

void Logger::log_validation_failed(const LogContext& ctx, const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "validation_failed";
    fields["job_id"] = std::to_string(ctx.job_id);
    fields["operation"] = ctx.operation;
    fields["error_message"] = message;

    log(LogLevel::WARN, "Request rejected", fields);
}

void Logger::log_ceiling_loaded(
    int64_t job_id,
    const std::string& path,
    size_t release_count,
    bool legacy_format
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "ceiling_loaded";
    fields["job_id"] = std::to_string(job_id);
    fields["path"] = path;
    fields["release_count"] = std::to_string(release_count);
    fields["legacy_format"] = legacy_format ? "true" : "false";

    log(LogLevel::INFO, "Loaded ceiling record", fields);
}

void Logger::log_ceiling_load_failed(
    int64_t job_id,
    const std::string& path,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "ceiling_load_failed";
    fields["job_id"] = std::to_string(job_id);
    fields["path"] = path;
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Ceiling record unreadable, using empty record", fields);
}

void Logger::log_ceiling_saved(int64_t job_id, const std::string& path, size_t release_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "ceiling_saved";
    fields["job_id"] = std::to_string(job_id);
    fields["path"] = path;
    fields["release_count"] = std::to_string(release_count);

    log(LogLevel::INFO, "Saved ceiling record", fields);
}

void Logger::log_api_configured(const std::string& api_url, const std::string& api_token) {
    std::map<std::string, std::string> fields;
    fields["event"] = "api_configured";
    fields["api_url"] = api_url;
    fields["api_token"] = mask_token(api_token);

    log(LogLevel::INFO, "Timesheet API configured", fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["job_id"] = std::to_string(ctx.job_id);
    fields["operation"] = ctx.operation;
    fields["phase"] = ctx.phase;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Operation failed", fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["job_id"] = std::to_string(ctx.job_id);
    fields["operation"] = ctx.operation;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
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

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
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

std::string Logger::mask_token(const std::string& token) {
    if (token.size() <= 8) {
        return "***";
    }
    // Show first 4 and last 4 characters
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
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
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
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

} // namespace burncalc
