#ifndef BURNCALC_PROJECTION_HPP
#define BURNCALC_PROJECTION_HPP

#include "calendar.hpp"
#include "month_key.hpp"

namespace burncalc {

// Configuration options for projection
struct ProjectionConfig {
    double hours_per_day;           // Hours billed per projected working day (default 8.0)

    ProjectionConfig();
};

// Projected hours for the remainder of the period of performance.
//
// Active only when pop_end is strictly after query_stop. For each month from
// the month containing query_stop + 1 through pop_end's month:
//   - sub-range = [max(month start, query_stop + 1), min(month end, pop_end)]
//   - if non-empty, hours = working_days(sub-range) × hours_per_day
// Months with an empty sub-range get no entry.
MonthlyHours project_remaining_hours(
    const Date& query_stop,
    const Date& pop_end,
    HolidayCalendar& calendar,
    const ProjectionConfig& config = ProjectionConfig()
);

// Adds every bucket of `from` onto `into`; existing hours are kept
void merge_hours(MonthlyHours& into, const MonthlyHours& from);

} // namespace burncalc

#endif // BURNCALC_PROJECTION_HPP
