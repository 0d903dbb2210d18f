/**
 * @file timesheet_source.hpp
 * @brief Abstract read interface to the remote time-tracking system
 *
 * The engine never talks to the network. Chart generation pulls job codes,
 * users and timesheet entries through this interface; the HTTP implementation
 * lives in burncalc-timesheets-lib and tests substitute an in-memory fake.
 */

#ifndef BURNCALC_TIMESHEET_SOURCE_HPP
#define BURNCALC_TIMESHEET_SOURCE_HPP

#include "calendar.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace burncalc {

/**
 * @brief Job code node; forms a forest through parent_id
 */
struct JobCode {
    int64_t id;
    std::string name;
    std::optional<int64_t> parent_id;   ///< Root when absent or 0
    std::optional<bool> active;

    JobCode() : id(0) {}
    JobCode(int64_t id_, const std::string& name_, std::optional<int64_t> parent = std::nullopt)
        : id(id_), name(name_), parent_id(parent) {}
};

/**
 * @brief Time-tracking user, used only to resolve display names
 */
struct User {
    int64_t id;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> display_name;

    User() : id(0) {}
};

/**
 * @brief One logged block of time against a job code
 */
struct TimesheetEntry {
    int64_t id;
    int64_t user_id;
    int64_t jobcode_id;
    double duration_seconds;

    TimesheetEntry() : id(0), user_id(0), jobcode_id(0), duration_seconds(0.0) {}
    TimesheetEntry(int64_t id_, int64_t user, int64_t jobcode, double seconds)
        : id(id_), user_id(user), jobcode_id(jobcode), duration_seconds(seconds) {}
};

/**
 * @brief Read operations consumed from the timesheet system
 *
 * Each call blocks until the result is decoded. Implementations report
 * failures by throwing an exception derived from std::runtime_error; they
 * must not return partial data.
 */
class ITimesheetSource {
public:
    virtual ~ITimesheetSource() = default;

    /**
     * @brief Fetch all job codes keyed by id
     */
    virtual std::map<int64_t, JobCode> fetch_job_codes() = 0;

    /**
     * @brief Fetch all users keyed by id
     */
    virtual std::map<int64_t, User> fetch_users() = 0;

    /**
     * @brief Fetch entries logged in [start, end] (inclusive) for the given job codes
     *
     * @param start First day of the range
     * @param end Last day of the range
     * @param jobcode_ids Job code filter; empty means no filter
     */
    virtual std::vector<TimesheetEntry> fetch_timesheets(
        const Date& start,
        const Date& end,
        const std::vector<int64_t>& jobcode_ids
    ) = 0;
};

} // namespace burncalc

#endif // BURNCALC_TIMESHEET_SOURCE_HPP
