#include "chart_generator.hpp"
#include "actuals.hpp"
#include "errors.hpp"
#include "job_tree.hpp"
#include "logger.hpp"
#include "projection.hpp"
#include <algorithm>
#include <chrono>
#include <exception>

namespace burncalc {

// ============================================================================
// ChartOptions / ChartResult Implementation
// ============================================================================

ChartOptions::ChartOptions()
    : hours_per_day(8.0),
      ceiling_threshold_ratio(0.75) {}

ChartResult::ChartResult()
    : job_id(0),
      total_actual_hours(0.0),
      total_projected_hours(0.0),
      execution_time_ms(0.0) {}

// ============================================================================
// Request Handling
// ============================================================================

void validate_chart_request(const ChartRequest& request) {
    if (request.pop_start > request.pop_end) {
        throw ChartError(ChartErrorKind::Validation,
                         "PoP start " + request.pop_start.to_string() +
                         " is after PoP end " + request.pop_end.to_string());
    }
    if (request.query_stop < request.pop_start) {
        throw ChartError(ChartErrorKind::Validation,
                         "Query stop " + request.query_stop.to_string() +
                         " is before PoP start " + request.pop_start.to_string());
    }
}

std::vector<MonthKey> chart_months(const ChartRequest& request) {
    return month_keys(request.pop_start, std::max(request.query_stop, request.pop_end));
}

ChartRequest make_chart_request(
    int64_t job_id,
    const CeilingRecord& record,
    const Date& query_stop,
    const Date& today)
{
    if (!is_valid_pop(record.pop_start, record.pop_end)) {
        throw ChartError(ChartErrorKind::Validation,
                         "Missing PoP: set a period of performance for job " +
                         std::to_string(job_id));
    }

    ChartRequest request;
    request.job_id = job_id;
    request.pop_start = *record.pop_start;
    request.pop_end = *record.pop_end;
    request.query_stop = query_stop;
    request.today = today;
    return request;
}

Date default_query_stop(const Date& today) {
    return first_of_month(today).add_days(-1);
}

Date default_period_start(const Date& today) {
    return Date(today.year, 1, 1);
}

// ============================================================================
// Chart Generation
// ============================================================================

namespace {

void apply_ceiling(ChartResult& result,
                   const std::vector<CeilingRelease>& releases,
                   const ChartOptions& options)
{
    CeilingConfig config;
    config.threshold_ratio = options.ceiling_threshold_ratio;

    auto ceiling = accrue_ceiling(releases, result.months(), config);
    if (ceiling) {
        result.ceiling = std::move(ceiling->ceiling);
        result.ceiling_75 = std::move(ceiling->threshold);
    } else {
        result.ceiling.reset();
        result.ceiling_75.reset();
    }
}

} // anonymous namespace

ChartResult generate_chart(
    const ChartRequest& request,
    const std::vector<CeilingRelease>& releases,
    ITimesheetSource& source,
    const std::map<int64_t, User>& users,
    const ChartOptions& options)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();
    LogContext ctx(request.job_id, "chart");

    ctx.phase = "validate";
    try {
        validate_chart_request(request);
    } catch (const ChartError& e) {
        logger.log_validation_failed(ctx, e.what());
        throw;
    }

    const std::vector<MonthKey> months = chart_months(request);
    logger.log_chart_start(ctx, request.pop_start.to_string(), request.pop_end.to_string(),
                           request.query_stop.to_string(), months.size());

    // Actuals: one fetch per month, strictly in order
    ctx.phase = "fetch";
    ActualsAggregator actuals;
    const std::vector<int64_t> jobcode_ids{request.job_id};
    const auto windows = actuals_fetch_windows(request.pop_start, request.query_stop);

    for (const FetchWindow& window : windows) {
        std::vector<TimesheetEntry> entries;
        try {
            entries = source.fetch_timesheets(window.start, window.end, jobcode_ids);
        } catch (const ChartError& e) {
            logger.log_error(ctx, e.what());
            throw;
        } catch (const std::exception& e) {
            const std::string message = "Failed to fetch timesheets for " +
                                        window.month.to_string() + ": " + e.what();
            logger.log_error(ctx, message);
            throw ChartError(ChartErrorKind::Transport, message);
        }

        actuals.add_month(window.month, entries);
        logger.log_month_fetched(ctx, window.month.to_string(), window.start.to_string(),
                                 window.end.to_string(), entries.size(),
                                 actuals.hours_for(window.month));
    }

    // Projection on top of actuals
    ctx.phase = "project";
    MonthlyHours hours = actuals.hours_by_month();
    HolidayCalendar calendar;
    ProjectionConfig projection_config;
    projection_config.hours_per_day = options.hours_per_day;

    const MonthlyHours projected =
        project_remaining_hours(request.query_stop, request.pop_end, calendar, projection_config);
    double projected_total = 0.0;
    for (const auto& [month, month_hours] : projected) {
        projected_total += month_hours;
        logger.log_projection_added(ctx, month.to_string(), month_hours);
    }
    merge_hours(hours, projected);

    CumulativeSeries series = build_cumulative_series(
        months, hours, request.query_stop, request.pop_end, request.today);

    ChartResult result;
    result.job_id = request.job_id;
    result.cumulative = std::move(series.cumulative);
    result.monthly = std::move(series.monthly);
    result.cumulative_actual = std::move(series.cumulative_actual);
    result.projected_start_index = series.projected_start_index;
    result.query_stop = request.query_stop;
    result.total_actual_hours = actuals.total_hours();
    result.total_projected_hours = projected_total;

    ctx.phase = "accrue";
    apply_ceiling(result, releases, options);

    result.employee_names = employee_names(actuals.user_ids(), users);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms =
        std::chrono::duration<double, std::milli>(end_time - start_time).count();

    ChartMetrics metrics;
    metrics.execution_time_ms = result.execution_time_ms;
    metrics.month_count = months.size();
    metrics.fetch_count = windows.size();
    metrics.entry_count = actuals.entry_count();
    metrics.employee_count = actuals.user_ids().size();
    metrics.actual_hours = result.total_actual_hours;
    metrics.projected_hours = result.total_projected_hours;
    metrics.has_ceiling = result.ceiling.has_value();
    logger.log_chart_complete(ctx, metrics);

    return result;
}

void recompute_ceiling(
    ChartResult& result,
    const std::vector<CeilingRelease>& releases,
    const ChartOptions& options)
{
    apply_ceiling(result, releases, options);
}

} // namespace burncalc
