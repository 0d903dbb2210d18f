/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace burncalc;
using json = nlohmann::json;

namespace {

void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG, bool json_output = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = json_output;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

void restore_default_logger() {
    Logger::get_instance().configure(LoggerConfig());
}

} // namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;
        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Level parsing") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    }

    SECTION("set_min_level") {
        Logger& logger = Logger::get_instance();
        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
        restore_default_logger();
    }
}

TEST_CASE("Logger chart events", "[logger]") {
    const std::string path = "test_chart_events.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();

    LogContext ctx(42, "chart");
    logger.log_chart_start(ctx, "2025-01-01", "2025-03-31", "2025-01-31", 3);
    ctx.phase = "fetch";
    logger.log_month_fetched(ctx, "2025-01", "2025-01-01", "2025-01-31", 2, 15.0);

    ChartMetrics metrics;
    metrics.month_count = 3;
    metrics.fetch_count = 1;
    metrics.has_ceiling = true;
    logger.log_chart_complete(ctx, metrics);

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 3);

    json start = json::parse(lines[0]);
    REQUIRE(start["event"] == "chart_start");
    REQUIRE(start["level"] == "INFO");
    REQUIRE(start["job_id"] == "42");
    REQUIRE(start["query_stop"] == "2025-01-31");
    REQUIRE(start["month_count"] == "3");
    REQUIRE(start.contains("timestamp"));

    json fetched = json::parse(lines[1]);
    REQUIRE(fetched["event"] == "month_fetched");
    REQUIRE(fetched["level"] == "DEBUG");
    REQUIRE(fetched["phase"] == "fetch");
    REQUIRE(fetched["entry_count"] == "2");

    json complete = json::parse(lines[2]);
    REQUIRE(complete["event"] == "chart_complete");
    REQUIRE(complete["fetch_count"] == "1");
    REQUIRE(complete["has_ceiling"] == "true");

    restore_default_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger level filtering", "[logger]") {
    const std::string path = "test_level_filter.log";
    log_to_file(path, LogLevel::WARN);
    Logger& logger = Logger::get_instance();

    LogContext ctx(7, "chart");
    logger.log_projection_added(ctx, "2025-02", 152.0);
    logger.log_ceiling_saved(7, "/tmp/job_7.json", 2);
    logger.log_validation_failed(ctx, "Missing PoP");
    logger.log_error(ctx, "boom");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(json::parse(lines[0])["event"] == "validation_failed");
    REQUIRE(json::parse(lines[1])["event"] == "error");
    REQUIRE(json::parse(lines[1])["level"] == "ERROR");

    restore_default_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger ceiling events", "[logger]") {
    const std::string path = "test_ceiling_events.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();

    logger.log_ceiling_loaded(5, "/data/ceiling/job_5.json", 3, true);
    logger.log_ceiling_load_failed(5, "/data/ceiling/job_5.json", "JSON parse error");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);

    json loaded = json::parse(lines[0]);
    REQUIRE(loaded["event"] == "ceiling_loaded");
    REQUIRE(loaded["release_count"] == "3");
    REQUIRE(loaded["legacy_format"] == "true");

    json failed = json::parse(lines[1]);
    REQUIRE(failed["event"] == "ceiling_load_failed");
    REQUIRE(failed["level"] == "WARN");
    REQUIRE(failed["error_message"] == "JSON parse error");

    restore_default_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger token masking", "[logger]") {
    REQUIRE(Logger::mask_token("short") == "***");
    REQUIRE(Logger::mask_token("12345678") == "***");
    REQUIRE(Logger::mask_token("abcd_secret_wxyz") == "abcd...wxyz");

    const std::string path = "test_api_configured.log";
    log_to_file(path);
    Logger::get_instance().log_api_configured("https://time.example.com/api/v1",
                                              "very_long_secret_token_12345");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    json j = json::parse(lines[0]);
    REQUIRE(j["api_url"] == "https://time.example.com/api/v1");
    REQUIRE(j["api_token"] == "very...2345");
    REQUIRE(lines[0].find("secret") == std::string::npos);

    restore_default_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    const std::string path = "test_escape.log";
    log_to_file(path);

    Logger::get_instance().log_warning(LogContext(1, "ceiling"),
                                       "Note has \"quotes\"\nand a newline\tand a tab");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    json j = json::parse(lines[0]);
    REQUIRE(j["warning"] == "Note has \"quotes\"\nand a newline\tand a tab");

    restore_default_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger plain text output", "[logger]") {
    const std::string path = "test_plain.log";
    log_to_file(path, LogLevel::INFO, false);

    Logger::get_instance().log_ceiling_saved(3, "/data/ceiling/job_3.json", 1);

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Saved ceiling record") != std::string::npos);
    REQUIRE(lines[0].find("job_id=3") != std::string::npos);

    restore_default_logger();
    std::filesystem::remove(path);
}
