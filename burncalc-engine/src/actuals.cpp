#include "actuals.hpp"
#include <algorithm>

namespace burncalc {

namespace {
constexpr double kSecondsPerHour = 3600.0;
}

std::vector<FetchWindow> actuals_fetch_windows(const Date& pop_start, const Date& query_stop) {
    std::vector<FetchWindow> windows;
    if (query_stop < pop_start) {
        return windows;
    }

    for (const MonthKey& month : month_keys(pop_start, query_stop)) {
        FetchWindow window;
        window.month = month;
        window.start = std::max(month.first_day(), pop_start);
        window.end = std::min(month.last_day(), query_stop);
        windows.push_back(window);
    }
    return windows;
}

ActualsAggregator::ActualsAggregator() : entry_count_(0) {}

void ActualsAggregator::add_month(const MonthKey& month, const std::vector<TimesheetEntry>& entries) {
    double hours = 0.0;
    for (const auto& entry : entries) {
        hours += entry.duration_seconds / kSecondsPerHour;
        user_ids_.insert(entry.user_id);
    }
    hours_[month] += hours;
    entry_count_ += entries.size();
}

double ActualsAggregator::hours_for(const MonthKey& month) const {
    auto it = hours_.find(month);
    return it != hours_.end() ? it->second : 0.0;
}

double ActualsAggregator::total_hours() const {
    double total = 0.0;
    for (const auto& [month, hours] : hours_) {
        total += hours;
    }
    return total;
}

} // namespace burncalc
