#ifndef BURNCALC_CALENDAR_HPP
#define BURNCALC_CALENDAR_HPP

#include <cstdint>
#include <ctime>
#include <map>
#include <set>
#include <string>

namespace burncalc {

enum class Weekday : uint8_t {
    Sunday = 0,
    Monday = 1,
    Tuesday = 2,
    Wednesday = 3,
    Thursday = 4,
    Friday = 5,
    Saturday = 6
};

bool is_leap_year(int year);
unsigned days_in_month(int year, unsigned month);

// Civil calendar date with no time-of-day and no time zone.
// Stored as year/month/day; serial() gives days since 1970-01-01.
struct Date {
    int year;
    unsigned month;   // 1-12
    unsigned day;     // 1-31

    // 1970-01-01
    Date();

    // Throws std::invalid_argument if the components do not form a real date
    Date(int y, unsigned m, unsigned d);

    int64_t serial() const;
    static Date from_serial(int64_t days);

    Weekday weekday() const;
    bool is_weekend() const;

    Date add_days(int64_t days) const;

    // YYYY-MM-DD
    std::string to_string() const;

    // Accepts YYYY-MM-DD, optionally followed by an ISO-8601 time part
    // ("THH:MM[:SS[.fff]]"). Without a zone designator the time is local
    // and ignored. With "Z" or "+HH:MM" the timestamp is an instant and
    // the result is its date in the local time zone, so a local midnight
    // written in UTC comes back as the same day. Throws std::invalid_argument.
    static Date parse(const std::string& text);

    // Date of an instant in the local time zone
    static Date from_time_t(std::time_t time);

    // Current date in the local time zone
    static Date today();

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const;
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const;
    bool operator>(const Date& other) const;
    bool operator>=(const Date& other) const;
};

Date first_of_month(const Date& date);
Date last_of_month(const Date& date);

using HolidaySet = std::set<Date>;

// Weekend observance: Saturday -> preceding Friday, Sunday -> following Monday
Date observed_date(const Date& date);

// n-th (1-based) occurrence of a weekday in a month, e.g. 3rd Monday of January
Date nth_weekday(int year, unsigned month, Weekday weekday, unsigned n);

// Last occurrence of a weekday in a month, e.g. last Monday of May
Date last_weekday(int year, unsigned month, Weekday weekday);

// Observed U.S. federal holidays for a year.
//
// Fixed-date holidays (New Year's Day, Juneteenth, Independence Day,
// Veterans Day, Christmas) are shifted off weekends. Floating holidays:
// MLK Day, Presidents Day, Memorial Day, Labor Day, Columbus Day,
// Thanksgiving. The set belongs to `year` even when New Year's Day is
// observed on Dec 31 of the previous year.
HolidaySet federal_holidays(int year);

/**
 * @brief Working-day calendar with a per-year holiday cache
 *
 * The cache is owned by the instance; two calendars never share state.
 * Not thread-safe: use one instance per thread.
 */
class HolidayCalendar {
public:
    HolidayCalendar() = default;

    // Holiday set for a year, computed once and memoized
    const HolidaySet& holidays(int year);

    bool is_holiday(const Date& date);

    // Mon-Fri and not a holiday of its own year
    bool is_working_day(const Date& date);

    // Working days in [start, end] inclusive; 0 when start > end
    int working_days(const Date& start, const Date& end);

    size_t cached_years() const { return cache_.size(); }

private:
    std::map<int, HolidaySet> cache_;
};

// Same as HolidayCalendar::working_days with a cache scoped to this call
int working_days(const Date& start, const Date& end);

} // namespace burncalc

#endif // BURNCALC_CALENDAR_HPP
