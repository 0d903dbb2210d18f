#include "ceiling.hpp"
#include "errors.hpp"
#include "month_key.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>

namespace burncalc {

bool CeilingRelease::operator==(const CeilingRelease& other) const {
    return id == other.id && date == other.date && hours == other.hours && note == other.note;
}

CeilingConfig::CeilingConfig() : threshold_ratio(0.75) {}

void sort_releases(std::vector<CeilingRelease>& releases) {
    std::stable_sort(releases.begin(), releases.end(),
                     [](const CeilingRelease& a, const CeilingRelease& b) {
                         return a.date < b.date;
                     });
}

// ============================================================================
// Accrual
// ============================================================================

std::optional<CeilingSeries> accrue_ceiling(
    std::vector<CeilingRelease> releases,
    const std::vector<std::string>& month_keys,
    const CeilingConfig& config)
{
    if (releases.empty()) {
        return std::nullopt;
    }
    sort_releases(releases);

    std::vector<double> values;
    values.reserve(month_keys.size());

    double running_total = 0.0;
    size_t cursor = 0;
    const size_t n = releases.size();

    for (const auto& key : month_keys) {
        std::optional<MonthKey> month = MonthKey::parse(key);
        if (!month) {
            values.push_back(values.empty() ? 0.0 : values.back());
            continue;
        }

        const Date next_month_start = month->next().first_day();
        while (cursor < n && releases[cursor].date < next_month_start) {
            running_total += releases[cursor].hours;
            ++cursor;
        }
        values.push_back(running_total);
    }

    bool all_zero = std::all_of(values.begin(), values.end(),
                                [](double v) { return v == 0.0; });
    if (all_zero) {
        return std::nullopt;
    }

    CeilingSeries series;
    series.threshold.reserve(values.size());
    for (double v : values) {
        series.threshold.push_back(v * config.threshold_ratio);
    }
    series.ceiling = std::move(values);
    return series;
}

// ============================================================================
// Release editing
// ============================================================================

std::string generate_release_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(rng());
    }

    // RFC4122 variant + version 4
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string add_release(CeilingRecord& record, const Date& date, double hours,
                        std::optional<std::string> note) {
    CeilingRelease release(generate_release_id(), date, hours, std::move(note));
    std::string id = release.id;
    record.releases.push_back(std::move(release));
    sort_releases(record.releases);
    return id;
}

bool update_release(CeilingRecord& record, const std::string& id, const Date& date,
                    double hours, std::optional<std::string> note) {
    auto it = std::find_if(record.releases.begin(), record.releases.end(),
                           [&id](const CeilingRelease& r) { return r.id == id; });
    if (it == record.releases.end()) {
        return false;
    }
    it->date = date;
    it->hours = hours;
    it->note = std::move(note);
    sort_releases(record.releases);
    return true;
}

bool remove_release(CeilingRecord& record, const std::string& id) {
    auto it = std::find_if(record.releases.begin(), record.releases.end(),
                           [&id](const CeilingRelease& r) { return r.id == id; });
    if (it == record.releases.end()) {
        return false;
    }
    record.releases.erase(it);
    return true;
}

double total_release_hours(const std::vector<CeilingRelease>& releases) {
    double total = 0.0;
    for (const auto& release : releases) {
        total += release.hours;
    }
    return total;
}

bool is_valid_pop(const std::optional<Date>& start, const std::optional<Date>& end) {
    if (!start || !end) {
        return false;
    }
    return *start <= *end;
}

double parse_hours(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw ChartError(ChartErrorKind::Validation, "Ceiling hours must be a number");
    }
    const size_t last = text.find_last_not_of(" \t\r\n");
    const std::string trimmed = text.substr(first, last - first + 1);

    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
        throw ChartError(ChartErrorKind::Validation,
                         "Ceiling hours must be a number: '" + trimmed + "'");
    }
    return value;
}

} // namespace burncalc
