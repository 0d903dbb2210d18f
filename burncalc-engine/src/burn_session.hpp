/**
 * @file burn_session.hpp
 * @brief Coordinates the timesheet source, ceiling store and chart cache
 *
 * A BurnSession is what a front end drives:
 * - Loading the job directory (job codes and users) once
 * - Generating charts from each job's stored PoP and releases
 * - Keeping the last chart of every job in a caller-owned cache
 * - Saving ceiling edits and refreshing the cached ceiling without refetching
 */

#ifndef BURNCALC_BURN_SESSION_HPP
#define BURNCALC_BURN_SESSION_HPP

#include "chart_cache.hpp"
#include "chart_generator.hpp"
#include "io/ceiling_store.hpp"
#include "job_tree.hpp"
#include "timesheet_source.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace burncalc {

/**
 * @brief Session state shared by the chart and ceiling operations
 *
 * Usage Example:
 *   @code
 *   timesheets::TimesheetsClient client(api_config);
 *   io::CeilingStore store;
 *   ChartCache cache;
 *   BurnSession session(client, store, cache);
 *
 *   session.load_directory();
 *   ChartResult chart = session.generate(42, default_query_stop(Date::today()), Date::today());
 *   @endcode
 */
class BurnSession {
public:
    BurnSession(
        ITimesheetSource& source,
        const io::CeilingStore& store,
        ChartCache& cache,
        const ChartOptions& options = ChartOptions()
    );

    /**
     * @brief Fetch job codes and users and build the job tree
     * @throws ChartError(Transport) if either fetch fails
     */
    void load_directory();

    bool directory_loaded() const { return directory_loaded_; }

    const std::vector<JobNode>& job_tree() const { return job_tree_; }
    const std::map<int64_t, JobCode>& job_codes() const { return job_codes_; }
    const std::map<int64_t, User>& users() const { return users_; }

    /**
     * @brief Generate a job's chart from its stored ceiling record and cache it
     *
     * The users directory is loaded first if it has not been.
     *
     * @throws ChartError(Validation) "Missing PoP" if the job has no valid PoP
     * @throws ChartError(Transport) if a fetch fails; the cache is left untouched
     */
    ChartResult generate(int64_t job_id, const Date& query_stop, const Date& today);

    /**
     * @brief Generate a chart for an explicit request, using the job's stored releases
     */
    ChartResult generate(const ChartRequest& request);

    /**
     * @brief Last chart generated for a job
     * @return true if the job has a cached chart
     */
    bool cached_chart(int64_t job_id, ChartResult& result) const;

    CeilingRecord load_ceiling(int64_t job_id) const;

    /**
     * @brief Persist a full record and refresh the cached chart's ceiling
     */
    void save_ceiling(int64_t job_id, const CeilingRecord& record);

    /**
     * @brief Persist releases (PoP kept) and refresh the cached chart's ceiling
     */
    void save_releases(int64_t job_id, const std::vector<CeilingRelease>& releases);

private:
    ITimesheetSource& source_;
    const io::CeilingStore& store_;
    ChartCache& cache_;
    ChartOptions options_;

    bool directory_loaded_;
    std::map<int64_t, JobCode> job_codes_;
    std::map<int64_t, User> users_;
    std::vector<JobNode> job_tree_;

    ChartResult generate_for(const ChartRequest& request, const std::vector<CeilingRelease>& releases);
    void refresh_cached_ceiling(int64_t job_id, const std::vector<CeilingRelease>& releases);
};

} // namespace burncalc

#endif // BURNCALC_BURN_SESSION_HPP
