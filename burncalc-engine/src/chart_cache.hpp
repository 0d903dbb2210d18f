#ifndef BURNCALC_CHART_CACHE_HPP
#define BURNCALC_CHART_CACHE_HPP

#include "chart_generator.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace burncalc {

/**
 * Chart cache statistics
 */
struct ChartCacheStats {
    size_t hits;
    size_t misses;
    size_t entries_count;
};

/**
 * Last generated chart per job
 *
 * Keys are job ids; a chart is only ever returned for the job it was
 * generated for. Entries stay until replaced, erased or cleared.
 * Thread-safe.
 */
class ChartCache {
public:
    ChartCache();

    /**
     * Store a chart, replacing any previous chart of the same job
     */
    void put(int64_t job_id, const ChartResult& result);

    /**
     * Get chart for a job
     * @param job_id Job id
     * @param result Output chart
     * @return true if cache hit, false if miss
     */
    bool get(int64_t job_id, ChartResult& result) const;

    bool contains(int64_t job_id) const;

    /**
     * Ids of jobs with a cached chart, ascending
     */
    std::vector<int64_t> jobs_with_charts() const;

    /**
     * Apply `update` to the cached chart of a job
     * @return false if the job has no cached chart
     */
    template <typename Fn>
    bool update(int64_t job_id, Fn update) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(job_id);
        if (it == entries_.end()) {
            return false;
        }
        update(it->second);
        return true;
    }

    /**
     * Remove one job's chart
     * @return true if an entry was removed
     */
    bool erase(int64_t job_id);

    /**
     * Clear all cache entries
     */
    void clear();

    ChartCacheStats get_stats() const;

private:
    mutable std::mutex mutex_;
    std::map<int64_t, ChartResult> entries_;

    // Statistics
    mutable size_t hits_;
    mutable size_t misses_;
};

} // namespace burncalc

#endif // BURNCALC_CHART_CACHE_HPP
