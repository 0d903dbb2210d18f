#ifndef BURNCALC_ACTUALS_HPP
#define BURNCALC_ACTUALS_HPP

#include "month_key.hpp"
#include "timesheet_source.hpp"
#include <set>
#include <vector>

namespace burncalc {

// Date range of one per-month timesheet fetch
struct FetchWindow {
    MonthKey month;
    Date start;
    Date end;
};

// One window per calendar month intersecting [pop_start, query_stop],
// clipped to that range. Windows are disjoint and ascending.
// Empty when query_stop is before pop_start.
std::vector<FetchWindow> actuals_fetch_windows(const Date& pop_start, const Date& query_stop);

/**
 * @brief Folds per-month timesheet batches into hour buckets
 *
 * Each batch is credited to exactly one month, so entries are never counted
 * twice as long as fetch windows are disjoint. Batches may arrive in any
 * order.
 */
class ActualsAggregator {
public:
    ActualsAggregator();

    // Adds sum(duration_seconds) / 3600 to `month` and records the user ids
    void add_month(const MonthKey& month, const std::vector<TimesheetEntry>& entries);

    const MonthlyHours& hours_by_month() const { return hours_; }
    const std::set<int64_t>& user_ids() const { return user_ids_; }

    double hours_for(const MonthKey& month) const;
    double total_hours() const;
    size_t entry_count() const { return entry_count_; }

private:
    MonthlyHours hours_;
    std::set<int64_t> user_ids_;
    size_t entry_count_;
};

} // namespace burncalc

#endif // BURNCALC_ACTUALS_HPP
