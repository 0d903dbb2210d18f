#include "burn_session.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <exception>

namespace burncalc {

BurnSession::BurnSession(
    ITimesheetSource& source,
    const io::CeilingStore& store,
    ChartCache& cache,
    const ChartOptions& options)
    : source_(source),
      store_(store),
      cache_(cache),
      options_(options),
      directory_loaded_(false) {}

void BurnSession::load_directory() {
    LogContext ctx(0, "directory");
    ctx.phase = "fetch";

    std::map<int64_t, JobCode> codes;
    std::map<int64_t, User> users;
    try {
        codes = source_.fetch_job_codes();
        users = source_.fetch_users();
    } catch (const ChartError& e) {
        Logger::get_instance().log_error(ctx, e.what());
        throw;
    } catch (const std::exception& e) {
        const std::string message = std::string("Failed to load job directory: ") + e.what();
        Logger::get_instance().log_error(ctx, message);
        throw ChartError(ChartErrorKind::Transport, message);
    }

    job_codes_ = std::move(codes);
    users_ = std::move(users);
    job_tree_ = build_job_tree(job_codes_);
    directory_loaded_ = true;
}

ChartResult BurnSession::generate(int64_t job_id, const Date& query_stop, const Date& today) {
    const CeilingRecord record = store_.load_record_or_empty(job_id);

    ChartRequest request;
    try {
        request = make_chart_request(job_id, record, query_stop, today);
    } catch (const ChartError& e) {
        Logger::get_instance().log_validation_failed(LogContext(job_id, "chart"), e.what());
        throw;
    }

    return generate_for(request, record.releases);
}

ChartResult BurnSession::generate(const ChartRequest& request) {
    const CeilingRecord record = store_.load_record_or_empty(request.job_id);
    return generate_for(request, record.releases);
}

ChartResult BurnSession::generate_for(const ChartRequest& request,
                                      const std::vector<CeilingRelease>& releases) {
    // A request that cannot be charted never reaches the timesheet source
    try {
        validate_chart_request(request);
    } catch (const ChartError& e) {
        Logger::get_instance().log_validation_failed(LogContext(request.job_id, "chart"), e.what());
        throw;
    }

    if (!directory_loaded_) {
        load_directory();
    }

    ChartResult result = generate_chart(request, releases, source_, users_, options_);
    cache_.put(request.job_id, result);
    return result;
}

bool BurnSession::cached_chart(int64_t job_id, ChartResult& result) const {
    return cache_.get(job_id, result);
}

CeilingRecord BurnSession::load_ceiling(int64_t job_id) const {
    return store_.load_record(job_id);
}

void BurnSession::save_ceiling(int64_t job_id, const CeilingRecord& record) {
    store_.save_record(job_id, record);
    refresh_cached_ceiling(job_id, record.releases);
}

void BurnSession::save_releases(int64_t job_id, const std::vector<CeilingRelease>& releases) {
    store_.save_releases(job_id, releases);
    refresh_cached_ceiling(job_id, releases);
}

void BurnSession::refresh_cached_ceiling(int64_t job_id, const std::vector<CeilingRelease>& releases) {
    const ChartOptions& options = options_;
    cache_.update(job_id, [&releases, &options](ChartResult& cached) {
        recompute_ceiling(cached, releases, options);
    });
}

} // namespace burncalc
