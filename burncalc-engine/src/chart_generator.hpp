#ifndef BURNCALC_CHART_GENERATOR_HPP
#define BURNCALC_CHART_GENERATOR_HPP

#include "calendar.hpp"
#include "ceiling.hpp"
#include "series.hpp"
#include "timesheet_source.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace burncalc {

// Inputs of one chart generation
struct ChartRequest {
    int64_t job_id;
    Date pop_start;
    Date pop_end;
    Date query_stop;        // Last day of actuals
    Date today;             // Clock for the projection boundary rule; local date by default

    ChartRequest() : job_id(0), today(Date::today()) {}
};

// Configuration options for chart generation
struct ChartOptions {
    double hours_per_day;               // Projected hours per working day (default 8.0)
    double ceiling_threshold_ratio;     // Warning threshold as a fraction of ceiling (default 0.75)

    ChartOptions();
};

// Result of chart generation, ready for plotting
struct ChartResult {
    int64_t job_id;

    Series cumulative;                  // Running total of monthly hours
    Series monthly;                     // Actual plus projected hours per month
    Series cumulative_actual;           // Running total; drawn as its own layer

    std::optional<std::vector<double>> ceiling;      // Stepped ceiling, aligned to months
    std::optional<std::vector<double>> ceiling_75;   // ceiling × threshold ratio

    std::optional<size_t> projected_start_index;     // First month drawn as projected
    std::vector<std::string> employee_names;         // Users who logged time, sorted
    Date query_stop;

    // Execution metrics
    double total_actual_hours;          // Hours from timesheets
    double total_projected_hours;       // Hours added by projection
    double execution_time_ms;

    ChartResult();

    std::vector<std::string> months() const { return series_months(monthly); }
};

// Rejects requests the pipeline cannot chart.
// Throws ChartError(Validation) when pop_start > pop_end or query_stop < pop_start.
void validate_chart_request(const ChartRequest& request);

// Months on the chart axis: PoP start's month through the later of the
// query-stop month and the PoP end month
std::vector<MonthKey> chart_months(const ChartRequest& request);

// Generate the burn chart for one job
//
// Steps:
//   1. Validate the request (nothing is fetched on failure)
//   2. Fetch actuals one month at a time, sequentially; any failure aborts
//      and no partial result is returned
//   3. Add projected hours for (query_stop, pop_end]
//   4. Build monthly and cumulative series
//   5. Accrue ceiling releases onto the month axis
//   6. Resolve names of users who logged time
//
// Failures are reported as ChartError. Errors thrown by `source` are
// rethrown with kind Transport.
ChartResult generate_chart(
    const ChartRequest& request,
    const std::vector<CeilingRelease>& releases,
    ITimesheetSource& source,
    const std::map<int64_t, User>& users,
    const ChartOptions& options = ChartOptions()
);

// Builds a request from a stored ceiling record.
// Throws ChartError(Validation) "Missing PoP" unless both PoP dates are set
// and ordered.
ChartRequest make_chart_request(
    int64_t job_id,
    const CeilingRecord& record,
    const Date& query_stop,
    const Date& today
);

// Replaces the ceiling series of an existing result after releases change;
// actuals are not refetched
void recompute_ceiling(
    ChartResult& result,
    const std::vector<CeilingRelease>& releases,
    const ChartOptions& options = ChartOptions()
);

// Last day of the month before `today`
Date default_query_stop(const Date& today);

// January 1 of today's year
Date default_period_start(const Date& today);

} // namespace burncalc

#endif // BURNCALC_CHART_GENERATOR_HPP
