#include "month_key.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace burncalc {

MonthKey::MonthKey() : year(1970), month(1) {}

MonthKey::MonthKey(int y, unsigned m) : year(y), month(m) {
    if (m < 1 || m > 12) {
        throw std::invalid_argument("Month must be between 1 and 12");
    }
}

MonthKey MonthKey::of(const Date& date) {
    return MonthKey(date.year, date.month);
}

std::optional<MonthKey> MonthKey::parse(const std::string& text) {
    if (text.size() != 7 || text[4] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i != 4 && !std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    int y = std::stoi(text.substr(0, 4));
    unsigned m = static_cast<unsigned>(std::stoul(text.substr(5, 2)));
    if (m < 1 || m > 12) {
        return std::nullopt;
    }
    return MonthKey(y, m);
}

MonthKey MonthKey::next() const {
    if (month == 12) {
        return MonthKey(year + 1, 1);
    }
    return MonthKey(year, month + 1);
}

Date MonthKey::first_day() const {
    return Date(year, month, 1);
}

Date MonthKey::last_day() const {
    return Date(year, month, days_in_month(year, month));
}

int64_t MonthKey::index() const {
    return static_cast<int64_t>(year) * 12 + (month - 1);
}

std::string MonthKey::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month;
    return oss.str();
}

bool MonthKey::operator==(const MonthKey& other) const {
    return year == other.year && month == other.month;
}

bool MonthKey::operator!=(const MonthKey& other) const {
    return !(*this == other);
}

bool MonthKey::operator<(const MonthKey& other) const {
    return index() < other.index();
}

bool MonthKey::operator<=(const MonthKey& other) const {
    return index() <= other.index();
}

bool MonthKey::operator>(const MonthKey& other) const {
    return index() > other.index();
}

bool MonthKey::operator>=(const MonthKey& other) const {
    return index() >= other.index();
}

std::vector<MonthKey> month_keys(const Date& start, const Date& end) {
    std::vector<MonthKey> keys;
    MonthKey current = MonthKey::of(start);
    const MonthKey last = MonthKey::of(end);
    if (current > last) {
        return keys;
    }

    keys.reserve(static_cast<size_t>(last.index() - current.index() + 1));
    while (current <= last) {
        keys.push_back(current);
        current = current.next();
    }
    return keys;
}

std::vector<std::string> to_strings(const std::vector<MonthKey>& months) {
    std::vector<std::string> result;
    result.reserve(months.size());
    for (const auto& month : months) {
        result.push_back(month.to_string());
    }
    return result;
}

} // namespace burncalc
