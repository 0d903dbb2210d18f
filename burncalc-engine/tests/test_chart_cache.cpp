#include <catch2/catch_test_macros.hpp>
#include "chart_cache.hpp"
#include <thread>
#include <vector>

using namespace burncalc;

namespace {

ChartResult make_chart(int64_t job_id, double hours) {
    ChartResult result;
    result.job_id = job_id;
    result.monthly = {SeriesPoint("2025-01", hours)};
    result.cumulative = result.monthly;
    result.cumulative_actual = result.monthly;
    result.total_actual_hours = hours;
    return result;
}

} // namespace

TEST_CASE("ChartCache basic operations", "[chart_cache]") {
    ChartCache cache;

    SECTION("Cache miss on first access") {
        ChartResult result;
        REQUIRE_FALSE(cache.get(1, result));
        REQUIRE(cache.get_stats().misses == 1);
    }

    SECTION("Cache hit after put") {
        cache.put(1, make_chart(1, 10.0));

        ChartResult result;
        REQUIRE(cache.get(1, result));
        REQUIRE(result.job_id == 1);
        REQUIRE(result.total_actual_hours == 10.0);

        auto stats = cache.get_stats();
        REQUIRE(stats.hits == 1);
        REQUIRE(stats.entries_count == 1);
    }

    SECTION("Charts never leak between jobs") {
        cache.put(1, make_chart(1, 10.0));
        cache.put(2, make_chart(2, 20.0));

        ChartResult result;
        REQUIRE(cache.get(2, result));
        REQUIRE(result.job_id == 2);
        REQUIRE(result.total_actual_hours == 20.0);
        REQUIRE_FALSE(cache.get(3, result));
    }

    SECTION("Put replaces the previous chart of the job") {
        cache.put(1, make_chart(1, 10.0));
        cache.put(1, make_chart(1, 99.0));

        ChartResult result;
        REQUIRE(cache.get(1, result));
        REQUIRE(result.total_actual_hours == 99.0);
        REQUIRE(cache.get_stats().entries_count == 1);
    }
}

TEST_CASE("ChartCache listing and removal", "[chart_cache]") {
    ChartCache cache;
    cache.put(30, make_chart(30, 1.0));
    cache.put(4, make_chart(4, 1.0));
    cache.put(12, make_chart(12, 1.0));

    REQUIRE(cache.jobs_with_charts() == std::vector<int64_t>{4, 12, 30});
    REQUIRE(cache.contains(12));

    REQUIRE(cache.erase(12));
    REQUIRE_FALSE(cache.erase(12));
    REQUIRE_FALSE(cache.contains(12));

    cache.clear();
    REQUIRE(cache.jobs_with_charts().empty());
    auto stats = cache.get_stats();
    REQUIRE(stats.hits == 0);
    REQUIRE(stats.misses == 0);
    REQUIRE(stats.entries_count == 0);
}

TEST_CASE("ChartCache update edits in place", "[chart_cache]") {
    ChartCache cache;
    cache.put(1, make_chart(1, 10.0));

    bool updated = cache.update(1, [](ChartResult& chart) {
        chart.ceiling = std::vector<double>{100.0};
    });
    REQUIRE(updated);

    ChartResult result;
    REQUIRE(cache.get(1, result));
    REQUIRE(result.ceiling.has_value());
    REQUIRE((*result.ceiling)[0] == 100.0);

    REQUIRE_FALSE(cache.update(2, [](ChartResult&) {}));
}

TEST_CASE("ChartCache thread safety", "[chart_cache]") {
    ChartCache cache;

    SECTION("Concurrent writers on distinct jobs") {
        const int num_threads = 8;
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([&cache, i]() {
                for (int j = 0; j < 50; ++j) {
                    cache.put(i, make_chart(i, static_cast<double>(j)));
                    ChartResult result;
                    cache.get(i, result);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        REQUIRE(cache.jobs_with_charts().size() == num_threads);
        for (int i = 0; i < num_threads; ++i) {
            ChartResult result;
            REQUIRE(cache.get(i, result));
            REQUIRE(result.job_id == i);
            REQUIRE(result.total_actual_hours == 49.0);
        }
    }
}
