#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "series.hpp"

using namespace burncalc;
using Catch::Approx;

namespace {

std::vector<MonthKey> q1_2025() {
    return month_keys(Date(2025, 1, 1), Date(2025, 3, 31));
}

} // namespace

// ============================================================================
// Projected Start Index Tests
// ============================================================================

TEST_CASE("projected_start_index differs by query stop position relative to today",
          "[series][projected-index]") {
    const auto months = q1_2025();
    const Date query_stop(2025, 1, 15);
    const Date pop_end(2025, 3, 31);

    SECTION("Query stop in the past leaves its own month as actual") {
        auto index = projected_start_index(months, query_stop, pop_end, Date(2025, 6, 1));
        REQUIRE(index.has_value());
        REQUIRE(*index == 1);
    }

    SECTION("Query stop in the future marks the month of the next day") {
        auto index = projected_start_index(months, query_stop, pop_end, Date(2025, 1, 1));
        REQUIRE(index.has_value());
        REQUIRE(*index == 0);
    }

    SECTION("Query stop equal to today counts as past") {
        auto index = projected_start_index(months, query_stop, pop_end, query_stop);
        REQUIRE(index.has_value());
        REQUIRE(*index == 1);
    }
}

TEST_CASE("projected_start_index for a month-end query stop", "[series][projected-index]") {
    const auto months = q1_2025();
    const Date query_stop(2025, 1, 31);
    const Date pop_end(2025, 3, 31);

    REQUIRE(projected_start_index(months, query_stop, pop_end, Date(2025, 6, 1)) ==
            std::optional<size_t>(1));
    REQUIRE(projected_start_index(months, query_stop, pop_end, Date(2025, 1, 10)) ==
            std::optional<size_t>(1));
}

TEST_CASE("projected_start_index absent when PoP end does not exceed query stop",
          "[series][projected-index]") {
    const auto months = q1_2025();
    REQUIRE_FALSE(projected_start_index(months, Date(2025, 3, 31), Date(2025, 3, 31),
                                        Date(2025, 6, 1)).has_value());
    REQUIRE_FALSE(projected_start_index(months, Date(2025, 3, 31), Date(2025, 2, 28),
                                        Date(2025, 1, 1)).has_value());
}

TEST_CASE("projected_start_index absent when no month qualifies", "[series][projected-index]") {
    // Axis ends at the query-stop month
    const auto months = month_keys(Date(2025, 1, 1), Date(2025, 1, 31));
    REQUIRE_FALSE(projected_start_index(months, Date(2025, 1, 15), Date(2025, 1, 31),
                                        Date(2025, 6, 1)).has_value());
}

// ============================================================================
// Cumulative Series Tests
// ============================================================================

TEST_CASE("build_cumulative_series fills gaps and accumulates", "[series]") {
    const auto months = q1_2025();
    MonthlyHours hours = {
        {MonthKey(2025, 1), 120.0},
        {MonthKey(2025, 3), 80.0},
    };

    CumulativeSeries series = build_cumulative_series(
        months, hours, Date(2025, 3, 31), Date(2025, 3, 31), Date(2025, 6, 1));

    REQUIRE(series_months(series.monthly) ==
            std::vector<std::string>{"2025-01", "2025-02", "2025-03"});
    REQUIRE(series_values(series.monthly) == std::vector<double>{120.0, 0.0, 80.0});
    REQUIRE(series_values(series.cumulative) == std::vector<double>{120.0, 120.0, 200.0});
    REQUIRE(series.cumulative_actual == series.cumulative);
    REQUIRE_FALSE(series.projected_start_index.has_value());
}

TEST_CASE("build_cumulative_series is non-decreasing for non-negative hours", "[series]") {
    const auto months = month_keys(Date(2024, 7, 1), Date(2025, 6, 30));
    MonthlyHours hours;
    double value = 0.0;
    for (const auto& month : months) {
        hours[month] = value;
        value = value > 50.0 ? 0.0 : value + 17.5;
    }

    CumulativeSeries series = build_cumulative_series(
        months, hours, Date(2025, 3, 31), Date(2025, 6, 30), Date(2025, 4, 15));

    REQUIRE(series.cumulative.size() == months.size());
    for (size_t i = 1; i < series.cumulative.size(); ++i) {
        REQUIRE(series.cumulative[i].value >= series.cumulative[i - 1].value);
    }
    REQUIRE(series.projected_start_index == std::optional<size_t>(9));
}

TEST_CASE("build_cumulative_series with no months", "[series]") {
    CumulativeSeries series = build_cumulative_series(
        {}, {}, Date(2025, 1, 31), Date(2025, 3, 31), Date(2025, 6, 1));
    REQUIRE(series.monthly.empty());
    REQUIRE(series.cumulative.empty());
    REQUIRE_FALSE(series.projected_start_index.has_value());
}

TEST_CASE("build_cumulative_series last value equals total hours", "[series]") {
    const auto months = q1_2025();
    MonthlyHours hours = {
        {MonthKey(2025, 1), 10.25},
        {MonthKey(2025, 2), 3.5},
        {MonthKey(2025, 3), 7.0},
    };
    CumulativeSeries series = build_cumulative_series(
        months, hours, Date(2025, 1, 31), Date(2025, 3, 31), Date(2025, 6, 1));

    REQUIRE(series.cumulative.back().value == Approx(20.75));
}
