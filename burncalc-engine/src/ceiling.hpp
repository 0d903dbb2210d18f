#ifndef BURNCALC_CEILING_HPP
#define BURNCALC_CEILING_HPP

#include "calendar.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace burncalc {

// Dated, additive adjustment to a job's contractual hour ceiling.
// Hours may be negative or fractional; the release has no effect before `date`.
struct CeilingRelease {
    std::string id;
    Date date;
    double hours;
    std::optional<std::string> note;

    CeilingRelease() : hours(0.0) {}
    CeilingRelease(const std::string& id_, const Date& date_, double hours_,
                   std::optional<std::string> note_ = std::nullopt)
        : id(id_), date(date_), hours(hours_), note(std::move(note_)) {}

    bool operator==(const CeilingRelease& other) const;
};

// Period of performance plus the job's releases, sorted by date
struct CeilingRecord {
    std::optional<Date> pop_start;
    std::optional<Date> pop_end;
    std::vector<CeilingRelease> releases;

    bool empty() const { return !pop_start && !pop_end && releases.empty(); }
};

// Stepped ceiling aligned to a month axis
struct CeilingSeries {
    std::vector<double> ceiling;        // Cumulative releases to date
    std::vector<double> threshold;      // ceiling × threshold_ratio
};

struct CeilingConfig {
    double threshold_ratio;             // Warning threshold as a fraction of ceiling (default 0.75)

    CeilingConfig();
};

// Stable sort by date; releases sharing a date keep their relative order
void sort_releases(std::vector<CeilingRelease>& releases);

// Accrues releases onto a month axis.
//
// For each "YYYY-MM" key, every release dated strictly before the first day
// of the following month is added to a running total, advancing one cursor
// through the sorted releases (O(releases + months)). A malformed key
// repeats the previous value. Returns nullopt when every value is exactly 0,
// which includes an empty release list or an empty axis.
std::optional<CeilingSeries> accrue_ceiling(
    std::vector<CeilingRelease> releases,
    const std::vector<std::string>& month_keys,
    const CeilingConfig& config = CeilingConfig()
);

// ============================================================================
// Release editing
// ============================================================================

// Random RFC 4122 version 4 identifier, lowercase hex with dashes
std::string generate_release_id();

// Appends a release with a fresh id and re-sorts; returns the new id
std::string add_release(CeilingRecord& record, const Date& date, double hours,
                        std::optional<std::string> note = std::nullopt);

// Replaces date/hours/note of the release with `id`; false if not found
bool update_release(CeilingRecord& record, const std::string& id, const Date& date,
                    double hours, std::optional<std::string> note);

// Removes the release with `id`; false if not found
bool remove_release(CeilingRecord& record, const std::string& id);

double total_release_hours(const std::vector<CeilingRelease>& releases);

// True when both dates are present and start <= end
bool is_valid_pop(const std::optional<Date>& start, const std::optional<Date>& end);

// Parses user-entered hours ("40", "-12.5").
// Throws ChartError(Validation) on empty, non-numeric or non-finite input.
double parse_hours(const std::string& text);

} // namespace burncalc

#endif // BURNCALC_CEILING_HPP
