#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "chart_generator.hpp"
#include "errors.hpp"
#include "fake_timesheet_source.hpp"

using namespace burncalc;
using burncalc::testing::FakeTimesheetSource;
using burncalc::testing::make_user;
using Catch::Approx;

namespace {

ChartRequest q1_request() {
    ChartRequest request;
    request.job_id = 42;
    request.pop_start = Date(2025, 1, 1);
    request.pop_end = Date(2025, 3, 31);
    request.query_stop = Date(2025, 1, 31);
    request.today = Date(2025, 2, 15);
    return request;
}

FakeTimesheetSource q1_source() {
    FakeTimesheetSource source;
    source.users[1] = make_user(1, "Grace", "Hopper");
    source.users[2] = make_user(2, "alan", "Turing");
    source.entries[MonthKey(2025, 1)] = {
        TimesheetEntry(100, 1, 42, 36000.0),
        TimesheetEntry(101, 2, 42, 18000.0),
    };
    return source;
}

std::vector<CeilingRelease> q1_releases() {
    return {
        CeilingRelease("r1", Date(2025, 1, 15), 100.0),
        CeilingRelease("r2", Date(2025, 2, 20), -20.0),
    };
}

} // namespace

// ============================================================================
// Validation Tests
// ============================================================================

TEST_CASE("ChartRequest defaults today to the local date", "[chart]") {
    const Date before = Date::today();
    ChartRequest request;
    const Date after = Date::today();

    REQUIRE(request.job_id == 0);
    REQUIRE(request.today >= before);
    REQUIRE(request.today <= after);
    REQUIRE(request.today != Date());
}

TEST_CASE("validate_chart_request", "[chart]") {
    ChartRequest request = q1_request();
    REQUIRE_NOTHROW(validate_chart_request(request));

    SECTION("PoP start after PoP end") {
        request.pop_start = Date(2025, 4, 1);
        request.query_stop = Date(2025, 4, 30);
        try {
            validate_chart_request(request);
            FAIL("Expected validation error");
        } catch (const ChartError& e) {
            REQUIRE(e.kind() == ChartErrorKind::Validation);
            REQUIRE(std::string(e.what()) == "PoP start 2025-04-01 is after PoP end 2025-03-31");
        }
    }

    SECTION("Query stop before PoP start") {
        request.query_stop = Date(2024, 12, 31);
        try {
            validate_chart_request(request);
            FAIL("Expected validation error");
        } catch (const ChartError& e) {
            REQUIRE(e.kind() == ChartErrorKind::Validation);
            REQUIRE(std::string(e.what()) ==
                    "Query stop 2024-12-31 is before PoP start 2025-01-01");
        }
    }

    SECTION("Single-day PoP with query stop on that day") {
        request.pop_start = Date(2025, 1, 31);
        request.pop_end = Date(2025, 1, 31);
        REQUIRE_NOTHROW(validate_chart_request(request));
    }
}

TEST_CASE("generate_chart validates before fetching", "[chart]") {
    FakeTimesheetSource source = q1_source();
    ChartRequest request = q1_request();
    request.query_stop = Date(2024, 12, 1);

    REQUIRE_THROWS_AS(generate_chart(request, {}, source, source.users), ChartError);
    REQUIRE(source.calls.empty());
}

// ============================================================================
// Generation Tests
// ============================================================================

TEST_CASE("generate_chart combines actuals, projection and ceiling", "[chart]") {
    FakeTimesheetSource source = q1_source();

    ChartResult result = generate_chart(q1_request(), q1_releases(), source, source.users);

    REQUIRE(result.job_id == 42);
    REQUIRE(result.months() == std::vector<std::string>{"2025-01", "2025-02", "2025-03"});
    REQUIRE(series_values(result.monthly) == std::vector<double>{15.0, 152.0, 168.0});
    REQUIRE(series_values(result.cumulative) == std::vector<double>{15.0, 167.0, 335.0});
    REQUIRE(result.cumulative_actual == result.cumulative);

    REQUIRE(result.projected_start_index.has_value());
    REQUIRE(*result.projected_start_index == 1);

    REQUIRE(result.ceiling.has_value());
    REQUIRE(*result.ceiling == std::vector<double>{100.0, 80.0, 80.0});
    REQUIRE(*result.ceiling_75 == std::vector<double>{75.0, 60.0, 60.0});

    REQUIRE(result.employee_names == std::vector<std::string>{"alan Turing", "Grace Hopper"});
    REQUIRE(result.query_stop == Date(2025, 1, 31));
    REQUIRE(result.total_actual_hours == Approx(15.0));
    REQUIRE(result.total_projected_hours == Approx(320.0));
    REQUIRE(result.execution_time_ms >= 0.0);
}

TEST_CASE("generate_chart fetches one window per month in order", "[chart]") {
    FakeTimesheetSource source;
    ChartRequest request = q1_request();
    request.pop_start = Date(2024, 11, 15);
    request.query_stop = Date(2025, 2, 10);

    generate_chart(request, {}, source, source.users);

    REQUIRE(source.calls.size() == 4);
    REQUIRE(source.calls[0].start == Date(2024, 11, 15));
    REQUIRE(source.calls[0].end == Date(2024, 11, 30));
    REQUIRE(source.calls[1].start == Date(2024, 12, 1));
    REQUIRE(source.calls[2].start == Date(2025, 1, 1));
    REQUIRE(source.calls[3].start == Date(2025, 2, 1));
    REQUIRE(source.calls[3].end == Date(2025, 2, 10));
    for (const auto& call : source.calls) {
        REQUIRE(call.jobcode_ids == std::vector<int64_t>{42});
    }
}

TEST_CASE("generate_chart aborts on the first failed fetch", "[chart]") {
    FakeTimesheetSource source = q1_source();
    source.fail_month = MonthKey(2025, 2);

    ChartRequest request = q1_request();
    request.query_stop = Date(2025, 3, 15);

    try {
        generate_chart(request, q1_releases(), source, source.users);
        FAIL("Expected transport error");
    } catch (const ChartError& e) {
        REQUIRE(e.kind() == ChartErrorKind::Transport);
        REQUIRE(std::string(e.what()).find("2025-02") != std::string::npos);
        REQUIRE(std::string(e.what()).find("HTTP 503") != std::string::npos);
    }

    // March is never requested
    REQUIRE(source.calls.size() == 2);
}

TEST_CASE("generate_chart without projection", "[chart]") {
    FakeTimesheetSource source = q1_source();
    ChartRequest request = q1_request();
    request.query_stop = Date(2025, 3, 31);

    ChartResult result = generate_chart(request, {}, source, source.users);

    REQUIRE_FALSE(result.projected_start_index.has_value());
    REQUIRE(result.total_projected_hours == 0.0);
    REQUIRE(series_values(result.monthly) == std::vector<double>{15.0, 0.0, 0.0});
    REQUIRE_FALSE(result.ceiling.has_value());
    REQUIRE_FALSE(result.ceiling_75.has_value());
}

TEST_CASE("generate_chart axis extends to a late query stop", "[chart]") {
    FakeTimesheetSource source;
    ChartRequest request = q1_request();
    request.query_stop = Date(2025, 5, 20);
    request.today = Date(2025, 6, 1);

    ChartResult result = generate_chart(request, {}, source, source.users);

    REQUIRE(result.months().size() == 5);
    REQUIRE(result.months().back() == "2025-05");
    REQUIRE(source.calls.size() == 5);
}

TEST_CASE("generate_chart honors hours_per_day", "[chart]") {
    FakeTimesheetSource source;
    ChartOptions options;
    options.hours_per_day = 4.0;

    ChartResult result = generate_chart(q1_request(), {}, source, source.users, options);
    REQUIRE(result.total_projected_hours == Approx(160.0));
}

TEST_CASE("generate_chart skips unknown and unnamed users", "[chart]") {
    FakeTimesheetSource source = q1_source();
    User anonymous;
    anonymous.id = 3;
    source.users[3] = anonymous;
    source.entries[MonthKey(2025, 1)].push_back(TimesheetEntry(102, 3, 42, 3600.0));
    source.entries[MonthKey(2025, 1)].push_back(TimesheetEntry(103, 77, 42, 3600.0));

    ChartResult result = generate_chart(q1_request(), {}, source, source.users);

    REQUIRE(result.employee_names.size() == 2);
    REQUIRE(result.total_actual_hours == Approx(17.0));
}

// ============================================================================
// Helpers
// ============================================================================

TEST_CASE("make_chart_request requires a PoP", "[chart]") {
    CeilingRecord record;
    record.pop_start = Date(2025, 1, 1);

    try {
        make_chart_request(7, record, Date(2025, 1, 31), Date(2025, 2, 1));
        FAIL("Expected validation error");
    } catch (const ChartError& e) {
        REQUIRE(e.kind() == ChartErrorKind::Validation);
        REQUIRE(std::string(e.what()).find("Missing PoP") == 0);
    }

    record.pop_end = Date(2025, 12, 31);
    ChartRequest request = make_chart_request(7, record, Date(2025, 1, 31), Date(2025, 2, 1));
    REQUIRE(request.job_id == 7);
    REQUIRE(request.pop_end == Date(2025, 12, 31));
    REQUIRE(request.today == Date(2025, 2, 1));
}

TEST_CASE("recompute_ceiling keeps actuals", "[chart]") {
    FakeTimesheetSource source = q1_source();
    ChartResult result = generate_chart(q1_request(), {}, source, source.users);
    REQUIRE_FALSE(result.ceiling.has_value());
    const Series cumulative = result.cumulative;

    recompute_ceiling(result, q1_releases());

    REQUIRE(result.ceiling.has_value());
    REQUIRE(*result.ceiling == std::vector<double>{100.0, 80.0, 80.0});
    REQUIRE(result.cumulative == cumulative);

    recompute_ceiling(result, {});
    REQUIRE_FALSE(result.ceiling.has_value());
    REQUIRE_FALSE(result.ceiling_75.has_value());
}

TEST_CASE("default query stop and period start", "[chart]") {
    REQUIRE(default_query_stop(Date(2025, 3, 14)) == Date(2025, 2, 28));
    REQUIRE(default_query_stop(Date(2025, 1, 1)) == Date(2024, 12, 31));
    REQUIRE(default_period_start(Date(2025, 3, 14)) == Date(2025, 1, 1));
}
