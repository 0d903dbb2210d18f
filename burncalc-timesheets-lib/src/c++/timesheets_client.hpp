#pragma once

#include "api/http_client.hpp"
#include "config/api_config.hpp"
#include "errors.hpp"
#include "timesheet_source.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>

namespace burncalc {
namespace timesheets {

/**
 * Timesheet API request failed or returned an undecodable payload
 */
class TimesheetsError : public ChartError {
public:
    explicit TimesheetsError(const std::string& message)
        : ChartError(ChartErrorKind::Transport, message) {}
};

/**
 * Decode {"results": {"jobcodes": {"<id>": {...}}}} keyed by id
 * @throws TimesheetsError on malformed payloads
 */
std::map<int64_t, JobCode> decode_job_codes(const std::string& body);

/**
 * Decode {"results": {"users": {"<id>": {...}}}} keyed by id
 * @throws TimesheetsError on malformed payloads
 */
std::map<int64_t, User> decode_users(const std::string& body);

/**
 * Decode {"results": {"timesheets": {"<id>": {...}}}}, ordered by entry id
 * @throws TimesheetsError on malformed payloads
 */
std::vector<TimesheetEntry> decode_timesheets(const std::string& body);

/**
 * Timesheet API client
 *
 * Features:
 * - GET /jobcodes, /users and /timesheets with bearer authentication
 * - Date-ranged timesheet queries filtered by job code
 * - Retry with backoff on transient HTTP failures (via HttpClient)
 * - Only status 200 is accepted
 *
 * Example usage:
 *   TimesheetsClient client(resolve_api_config());
 *   auto entries = client.fetch_timesheets(Date(2025, 1, 1), Date(2025, 1, 31), {42});
 */
class TimesheetsClient : public ITimesheetSource {
public:
    /**
     * Constructor
     * @param config Validated API configuration
     * @param timeout_ms Per-request timeout (default: 30000)
     * @throws ConfigError if the configuration is invalid
     */
    explicit TimesheetsClient(const ApiConfig& config, int timeout_ms = 30000);

    /**
     * Destructor
     */
    ~TimesheetsClient() override;

    std::map<int64_t, JobCode> fetch_job_codes() override;

    std::map<int64_t, User> fetch_users() override;

    std::vector<TimesheetEntry> fetch_timesheets(
        const Date& start,
        const Date& end,
        const std::vector<int64_t>& jobcode_ids
    ) override;

    /**
     * Query parameters sent for a timesheet range
     */
    static QueryParams timesheet_query(
        const Date& start,
        const Date& end,
        const std::vector<int64_t>& jobcode_ids
    );

    void set_debug(bool debug) { http_client_->set_debug(debug); }

private:
    std::string api_token_;
    std::unique_ptr<HttpClient> http_client_;

    std::string get_body(const std::string& path, const QueryParams& params = {});
};

} // namespace timesheets
} // namespace burncalc
