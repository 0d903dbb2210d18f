#ifndef BURNCALC_SERIES_HPP
#define BURNCALC_SERIES_HPP

#include "calendar.hpp"
#include "month_key.hpp"
#include <optional>
#include <string>
#include <vector>

namespace burncalc {

// One month of a chart series
struct SeriesPoint {
    std::string month;   // YYYY-MM
    double value;

    SeriesPoint() : value(0.0) {}
    SeriesPoint(const std::string& m, double v) : month(m), value(v) {}

    bool operator==(const SeriesPoint& other) const {
        return month == other.month && value == other.value;
    }
};

using Series = std::vector<SeriesPoint>;

// Month-aligned output of the cumulative builder
struct CumulativeSeries {
    Series monthly;                 // Hours per month (actual and/or projected)
    Series cumulative;              // Running sum of monthly
    Series cumulative_actual;       // Same running sum; kept as a separate chart layer
    std::optional<size_t> projected_start_index;   // First month drawn as projected
};

// Index of the first month considered projected, or nullopt when pop_end
// does not exceed query_stop.
//
// If query_stop is after `today`, a month is projected once it is at or past
// the month containing query_stop + 1. Otherwise (query_stop today or in the
// past) a month is projected only once it is strictly after query_stop's own
// month, so the query-stop month is never marked projected even when it
// received projected hours.
std::optional<size_t> projected_start_index(
    const std::vector<MonthKey>& months,
    const Date& query_stop,
    const Date& pop_end,
    const Date& today
);

// Builds monthly and running-total series over `months`; months missing from
// `hours` count as 0.
CumulativeSeries build_cumulative_series(
    const std::vector<MonthKey>& months,
    const MonthlyHours& hours,
    const Date& query_stop,
    const Date& pop_end,
    const Date& today
);

std::vector<std::string> series_months(const Series& series);
std::vector<double> series_values(const Series& series);

} // namespace burncalc

#endif // BURNCALC_SERIES_HPP
