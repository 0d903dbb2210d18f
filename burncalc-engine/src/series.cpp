#include "series.hpp"

namespace burncalc {

std::optional<size_t> projected_start_index(
    const std::vector<MonthKey>& months,
    const Date& query_stop,
    const Date& pop_end,
    const Date& today)
{
    if (!(pop_end > query_stop)) {
        return std::nullopt;
    }

    const bool query_stop_in_future = query_stop > today;
    const MonthKey boundary = query_stop_in_future
        ? MonthKey::of(query_stop.add_days(1))
        : MonthKey::of(query_stop);

    for (size_t i = 0; i < months.size(); ++i) {
        const bool projected = query_stop_in_future ? months[i] >= boundary
                                                    : months[i] > boundary;
        if (projected) {
            return i;
        }
    }
    return std::nullopt;
}

CumulativeSeries build_cumulative_series(
    const std::vector<MonthKey>& months,
    const MonthlyHours& hours,
    const Date& query_stop,
    const Date& pop_end,
    const Date& today)
{
    CumulativeSeries result;
    result.monthly.reserve(months.size());
    result.cumulative.reserve(months.size());
    result.cumulative_actual.reserve(months.size());

    double running = 0.0;
    for (const MonthKey& month : months) {
        auto it = hours.find(month);
        const double month_hours = it != hours.end() ? it->second : 0.0;
        running += month_hours;

        const std::string key = month.to_string();
        result.monthly.emplace_back(key, month_hours);
        result.cumulative.emplace_back(key, running);
        result.cumulative_actual.emplace_back(key, running);
    }

    result.projected_start_index = projected_start_index(months, query_stop, pop_end, today);
    return result;
}

std::vector<std::string> series_months(const Series& series) {
    std::vector<std::string> months;
    months.reserve(series.size());
    for (const auto& point : series) {
        months.push_back(point.month);
    }
    return months;
}

std::vector<double> series_values(const Series& series) {
    std::vector<double> values;
    values.reserve(series.size());
    for (const auto& point : series) {
        values.push_back(point.value);
    }
    return values;
}

} // namespace burncalc
