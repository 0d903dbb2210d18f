#include "projection.hpp"
#include <algorithm>

namespace burncalc {

// ============================================================================
// ProjectionConfig Implementation
// ============================================================================

ProjectionConfig::ProjectionConfig() : hours_per_day(8.0) {}

// ============================================================================
// Projection Implementation
// ============================================================================

MonthlyHours project_remaining_hours(
    const Date& query_stop,
    const Date& pop_end,
    HolidayCalendar& calendar,
    const ProjectionConfig& config)
{
    MonthlyHours projected;
    if (!(pop_end > query_stop)) {
        return projected;
    }

    const Date first_projected_day = query_stop.add_days(1);

    for (const MonthKey& month : month_keys(first_projected_day, pop_end)) {
        const Date range_start = std::max(month.first_day(), first_projected_day);
        const Date range_end = std::min(month.last_day(), pop_end);
        if (range_start > range_end) {
            continue;
        }

        const int days = calendar.working_days(range_start, range_end);
        projected[month] += static_cast<double>(days) * config.hours_per_day;
    }

    return projected;
}

void merge_hours(MonthlyHours& into, const MonthlyHours& from) {
    for (const auto& [month, hours] : from) {
        into[month] += hours;
    }
}

} // namespace burncalc
