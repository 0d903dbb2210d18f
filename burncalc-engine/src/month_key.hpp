#ifndef BURNCALC_MONTH_KEY_HPP
#define BURNCALC_MONTH_KEY_HPP

#include "calendar.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace burncalc {

// Calendar month used as the bucket granularity of every series.
// Compared as (year, month); the "YYYY-MM" form only appears at interfaces.
struct MonthKey {
    int year;
    unsigned month;   // 1-12

    MonthKey();

    // Throws std::invalid_argument for a month outside 1-12
    MonthKey(int y, unsigned m);

    static MonthKey of(const Date& date);

    // Parses "YYYY-MM"; returns nullopt for anything else
    static std::optional<MonthKey> parse(const std::string& text);

    MonthKey next() const;

    Date first_day() const;
    Date last_day() const;

    // Months since year 0, for distance arithmetic
    int64_t index() const;

    std::string to_string() const;

    bool operator==(const MonthKey& other) const;
    bool operator!=(const MonthKey& other) const;
    bool operator<(const MonthKey& other) const;
    bool operator<=(const MonthKey& other) const;
    bool operator>(const MonthKey& other) const;
    bool operator>=(const MonthKey& other) const;
};

// Hours bucketed by month
using MonthlyHours = std::map<MonthKey, double>;

// Inclusive, ascending months spanning [start, end].
// Empty when start's month is after end's month.
std::vector<MonthKey> month_keys(const Date& start, const Date& end);

std::vector<std::string> to_strings(const std::vector<MonthKey>& months);

} // namespace burncalc

#endif // BURNCALC_MONTH_KEY_HPP
