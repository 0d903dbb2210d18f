#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "projection.hpp"

using namespace burncalc;
using Catch::Approx;

TEST_CASE("project_remaining_hours splits remaining working days by month", "[projection]") {
    HolidayCalendar calendar;

    // Jan 2-31: 20 working days, Feb: 19, Mar: 21
    MonthlyHours projected = project_remaining_hours(
        Date(2025, 1, 1), Date(2025, 3, 31), calendar);

    REQUIRE(projected.size() == 3);
    REQUIRE(projected[MonthKey(2025, 1)] == Approx(160.0));
    REQUIRE(projected[MonthKey(2025, 2)] == Approx(152.0));
    REQUIRE(projected[MonthKey(2025, 3)] == Approx(168.0));
}

TEST_CASE("project_remaining_hours equals working days over the whole range", "[projection]") {
    HolidayCalendar calendar;
    const Date query_stop(2025, 5, 14);
    const Date pop_end(2025, 12, 19);

    MonthlyHours projected = project_remaining_hours(query_stop, pop_end, calendar);

    double total = 0.0;
    for (const auto& [month, hours] : projected) {
        total += hours;
    }

    const int days = working_days(query_stop.add_days(1), pop_end);
    REQUIRE(total == Approx(days * 8.0));
}

TEST_CASE("project_remaining_hours honors hours_per_day", "[projection]") {
    HolidayCalendar calendar;
    ProjectionConfig config;
    config.hours_per_day = 6.0;

    MonthlyHours projected = project_remaining_hours(
        Date(2025, 2, 28), Date(2025, 3, 31), calendar, config);

    REQUIRE(projected.size() == 1);
    REQUIRE(projected[MonthKey(2025, 3)] == Approx(126.0));
}

TEST_CASE("project_remaining_hours inactive cases", "[projection]") {
    HolidayCalendar calendar;

    SECTION("PoP end equal to query stop") {
        REQUIRE(project_remaining_hours(Date(2025, 3, 31), Date(2025, 3, 31), calendar).empty());
    }

    SECTION("PoP end before query stop") {
        REQUIRE(project_remaining_hours(Date(2025, 4, 30), Date(2025, 3, 31), calendar).empty());
    }
}

TEST_CASE("project_remaining_hours starts the day after query stop", "[projection]") {
    HolidayCalendar calendar;

    SECTION("Query stop on a month end starts the next month") {
        MonthlyHours projected = project_remaining_hours(
            Date(2025, 1, 31), Date(2025, 2, 28), calendar);
        REQUIRE(projected.size() == 1);
        REQUIRE(projected.count(MonthKey(2025, 1)) == 0);
        REQUIRE(projected[MonthKey(2025, 2)] == Approx(152.0));
    }

    SECTION("Remaining days of a month that are all non-working give zero") {
        // Jan 31, 2025 is a Friday; Feb 1-2 is a weekend
        MonthlyHours projected = project_remaining_hours(
            Date(2025, 1, 31), Date(2025, 2, 2), calendar);
        REQUIRE(projected.size() == 1);
        REQUIRE(projected[MonthKey(2025, 2)] == 0.0);
    }
}

TEST_CASE("merge_hours adds onto existing buckets", "[projection]") {
    MonthlyHours actual = {
        {MonthKey(2025, 1), 100.0},
        {MonthKey(2025, 2), 40.0},
    };
    MonthlyHours projected = {
        {MonthKey(2025, 2), 80.0},
        {MonthKey(2025, 3), 168.0},
    };

    merge_hours(actual, projected);

    REQUIRE(actual.size() == 3);
    REQUIRE(actual[MonthKey(2025, 1)] == Approx(100.0));
    REQUIRE(actual[MonthKey(2025, 2)] == Approx(120.0));
    REQUIRE(actual[MonthKey(2025, 3)] == Approx(168.0));
}
