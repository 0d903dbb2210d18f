#include "calendar.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace burncalc {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool all_digits(const std::string& text, size_t pos, size_t count) {
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Month arithmetic
// ============================================================================

bool is_leap_year(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return year % 4 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month must be between 1 and 12");
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// ============================================================================
// Date Implementation
// ============================================================================

Date::Date() : year(1970), month(1), day(1) {}

Date::Date(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {
    if (m < 1 || m > 12) {
        throw std::invalid_argument("Invalid month " + std::to_string(m));
    }
    if (d < 1 || d > days_in_month(y, m)) {
        throw std::invalid_argument("Invalid day " + std::to_string(d) + " for " +
                                    std::to_string(y) + "-" + std::to_string(m));
    }
}

int64_t Date::serial() const {
    return days_from_civil(year, month, day);
}

Date Date::from_serial(int64_t days) {
    int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d);
}

Weekday Date::weekday() const {
    const int64_t z = serial();
    // 1970-01-01 was a Thursday
    const int64_t wd = z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6;
    return static_cast<Weekday>(wd);
}

bool Date::is_weekend() const {
    Weekday wd = weekday();
    return wd == Weekday::Saturday || wd == Weekday::Sunday;
}

Date Date::add_days(int64_t days) const {
    return from_serial(serial() + days);
}

std::string Date::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-" << std::setw(2) << day;
    return oss.str();
}

Date Date::parse(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-' ||
        !all_digits(text, 0, 4) || !all_digits(text, 5, 2) || !all_digits(text, 8, 2)) {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
    }
    int y = std::stoi(text.substr(0, 4));
    unsigned m = static_cast<unsigned>(std::stoul(text.substr(5, 2)));
    unsigned d = static_cast<unsigned>(std::stoul(text.substr(8, 2)));
    Date date(y, m, d);
    if (text.size() == 10) {
        return date;
    }

    // Time part: HH:MM[:SS[.fff]] then an optional zone designator
    const std::string invalid_time =
        "Invalid timestamp (expected YYYY-MM-DDTHH:MM[:SS][Z|+HH:MM]): " + text;
    size_t pos = 11;
    if (text.size() < pos + 5 || !all_digits(text, pos, 2) || text[pos + 2] != ':' ||
        !all_digits(text, pos + 3, 2)) {
        throw std::invalid_argument(invalid_time);
    }
    const int hour = std::stoi(text.substr(pos, 2));
    const int minute = std::stoi(text.substr(pos + 3, 2));
    int second = 0;
    pos += 5;
    if (pos < text.size() && text[pos] == ':') {
        if (text.size() < pos + 3 || !all_digits(text, pos + 1, 2)) {
            throw std::invalid_argument(invalid_time);
        }
        second = std::stoi(text.substr(pos + 1, 2));
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            const size_t fraction = ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            if (pos == fraction) {
                throw std::invalid_argument(invalid_time);
            }
        }
    }
    if (hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument(invalid_time);
    }

    // No zone: wall-clock time, already local
    if (pos == text.size()) {
        return date;
    }

    int64_t offset_seconds = 0;
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
        offset_seconds = 0;
    } else if (text[pos] == '+' || text[pos] == '-') {
        const int sign = text[pos] == '-' ? -1 : 1;
        const std::string zone = text.substr(pos + 1);
        int zone_hours = 0;
        int zone_minutes = 0;
        if (zone.size() == 2 && all_digits(zone, 0, 2)) {
            zone_hours = std::stoi(zone);
        } else if (zone.size() == 4 && all_digits(zone, 0, 4)) {
            zone_hours = std::stoi(zone.substr(0, 2));
            zone_minutes = std::stoi(zone.substr(2, 2));
        } else if (zone.size() == 5 && zone[2] == ':' && all_digits(zone, 0, 2) &&
                   all_digits(zone, 3, 2)) {
            zone_hours = std::stoi(zone.substr(0, 2));
            zone_minutes = std::stoi(zone.substr(3, 2));
        } else {
            throw std::invalid_argument(invalid_time);
        }
        offset_seconds = sign * (zone_hours * 3600 + zone_minutes * 60);
    } else {
        throw std::invalid_argument(invalid_time);
    }

    // An instant: report the calendar date it falls on in the local time zone
    const int64_t utc_seconds = date.serial() * 86400 + hour * 3600 + minute * 60 + second -
                                offset_seconds;
    return from_time_t(static_cast<std::time_t>(utc_seconds));
}

Date Date::from_time_t(std::time_t time) {
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    return Date(tm_buf.tm_year + 1900, static_cast<unsigned>(tm_buf.tm_mon + 1),
                static_cast<unsigned>(tm_buf.tm_mday));
}

Date Date::today() {
    auto now = std::chrono::system_clock::now();
    return from_time_t(std::chrono::system_clock::to_time_t(now));
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator!=(const Date& other) const {
    return !(*this == other);
}

bool Date::operator<(const Date& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

bool Date::operator<=(const Date& other) const {
    return !(other < *this);
}

bool Date::operator>(const Date& other) const {
    return other < *this;
}

bool Date::operator>=(const Date& other) const {
    return !(*this < other);
}

Date first_of_month(const Date& date) {
    return Date(date.year, date.month, 1);
}

Date last_of_month(const Date& date) {
    return Date(date.year, date.month, days_in_month(date.year, date.month));
}

// ============================================================================
// Federal holidays
// ============================================================================

Date observed_date(const Date& date) {
    switch (date.weekday()) {
        case Weekday::Saturday: return date.add_days(-1);
        case Weekday::Sunday: return date.add_days(1);
        default: return date;
    }
}

Date nth_weekday(int year, unsigned month, Weekday weekday, unsigned n) {
    if (n < 1) {
        throw std::invalid_argument("Weekday ordinal must be at least 1");
    }
    Date first(year, month, 1);
    unsigned offset = (static_cast<unsigned>(weekday) + 7 -
                       static_cast<unsigned>(first.weekday())) % 7;
    unsigned day = 1 + offset + 7 * (n - 1);
    if (day > days_in_month(year, month)) {
        throw std::invalid_argument("Month has no occurrence " + std::to_string(n) +
                                    " of the requested weekday");
    }
    return Date(year, month, day);
}

Date last_weekday(int year, unsigned month, Weekday weekday) {
    Date last(year, month, days_in_month(year, month));
    unsigned diff = (static_cast<unsigned>(last.weekday()) + 7 -
                     static_cast<unsigned>(weekday)) % 7;
    return last.add_days(-static_cast<int64_t>(diff));
}

HolidaySet federal_holidays(int year) {
    HolidaySet holidays;

    // Fixed-date, observed
    holidays.insert(observed_date(Date(year, 1, 1)));     // New Year's Day
    holidays.insert(observed_date(Date(year, 6, 19)));    // Juneteenth
    holidays.insert(observed_date(Date(year, 7, 4)));     // Independence Day
    holidays.insert(observed_date(Date(year, 11, 11)));   // Veterans Day
    holidays.insert(observed_date(Date(year, 12, 25)));   // Christmas

    // Floating
    holidays.insert(nth_weekday(year, 1, Weekday::Monday, 3));     // MLK Day
    holidays.insert(nth_weekday(year, 2, Weekday::Monday, 3));     // Presidents Day
    holidays.insert(last_weekday(year, 5, Weekday::Monday));       // Memorial Day
    holidays.insert(nth_weekday(year, 9, Weekday::Monday, 1));     // Labor Day
    holidays.insert(nth_weekday(year, 10, Weekday::Monday, 2));    // Columbus Day
    holidays.insert(nth_weekday(year, 11, Weekday::Thursday, 4));  // Thanksgiving

    return holidays;
}

// ============================================================================
// HolidayCalendar Implementation
// ============================================================================

const HolidaySet& HolidayCalendar::holidays(int year) {
    auto it = cache_.find(year);
    if (it == cache_.end()) {
        it = cache_.emplace(year, federal_holidays(year)).first;
    }
    return it->second;
}

bool HolidayCalendar::is_holiday(const Date& date) {
    const HolidaySet& set = holidays(date.year);
    return set.find(date) != set.end();
}

bool HolidayCalendar::is_working_day(const Date& date) {
    return !date.is_weekend() && !is_holiday(date);
}

int HolidayCalendar::working_days(const Date& start, const Date& end) {
    if (start > end) {
        return 0;
    }

    int count = 0;
    const int64_t last = end.serial();
    for (int64_t day = start.serial(); day <= last; ++day) {
        if (is_working_day(Date::from_serial(day))) {
            ++count;
        }
    }
    return count;
}

int working_days(const Date& start, const Date& end) {
    HolidayCalendar calendar;
    return calendar.working_days(start, end);
}

} // namespace burncalc
