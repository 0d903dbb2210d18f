#ifndef BURNCALC_TESTS_FAKE_TIMESHEET_SOURCE_HPP
#define BURNCALC_TESTS_FAKE_TIMESHEET_SOURCE_HPP

#include "month_key.hpp"
#include "timesheet_source.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

namespace burncalc {
namespace testing {

// In-memory timesheet source; entries are served by the month of the
// requested window start
class FakeTimesheetSource : public ITimesheetSource {
public:
    struct Call {
        Date start;
        Date end;
        std::vector<int64_t> jobcode_ids;
    };

    std::map<int64_t, JobCode> codes;
    std::map<int64_t, User> users;
    std::map<MonthKey, std::vector<TimesheetEntry>> entries;

    std::optional<MonthKey> fail_month;
    bool fail_directory = false;

    std::vector<Call> calls;
    int directory_fetches = 0;

    std::map<int64_t, JobCode> fetch_job_codes() override {
        ++directory_fetches;
        if (fail_directory) {
            throw std::runtime_error("connection refused");
        }
        return codes;
    }

    std::map<int64_t, User> fetch_users() override {
        if (fail_directory) {
            throw std::runtime_error("connection refused");
        }
        return users;
    }

    std::vector<TimesheetEntry> fetch_timesheets(
        const Date& start,
        const Date& end,
        const std::vector<int64_t>& jobcode_ids) override
    {
        calls.push_back(Call{start, end, jobcode_ids});

        const MonthKey month = MonthKey::of(start);
        if (fail_month && *fail_month == month) {
            throw std::runtime_error("HTTP 503 from timesheet server");
        }

        auto it = entries.find(month);
        if (it == entries.end()) {
            return {};
        }
        return it->second;
    }
};

inline User make_user(int64_t id, const std::string& first, const std::string& last) {
    User user;
    user.id = id;
    user.first_name = first;
    user.last_name = last;
    return user;
}

} // namespace testing
} // namespace burncalc

#endif // BURNCALC_TESTS_FAKE_TIMESHEET_SOURCE_HPP
