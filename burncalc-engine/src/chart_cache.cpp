#include "chart_cache.hpp"

namespace burncalc {

ChartCache::ChartCache()
    : hits_(0)
    , misses_(0)
{
}

void ChartCache::put(int64_t job_id, const ChartResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[job_id] = result;
}

bool ChartCache::get(int64_t job_id, ChartResult& result) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(job_id);
    if (it == entries_.end()) {
        misses_++;
        return false;
    }

    hits_++;
    result = it->second;
    return true;
}

bool ChartCache::contains(int64_t job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(job_id) > 0;
}

std::vector<int64_t> ChartCache::jobs_with_charts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int64_t> ids;
    ids.reserve(entries_.size());
    for (const auto& [job_id, result] : entries_) {
        ids.push_back(job_id);
    }
    return ids;
}

bool ChartCache::erase(int64_t job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(job_id) > 0;
}

void ChartCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

ChartCacheStats ChartCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ChartCacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.entries_count = entries_.size();
    return stats;
}

} // namespace burncalc
