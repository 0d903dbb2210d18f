#include "c++/timesheets_client.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace burncalc {
namespace timesheets {

namespace {

// results.<collection>; an empty collection may arrive as [] instead of {}
const json* find_collection(const json& root, const std::string& collection) {
    if (!root.is_object() || !root.contains("results") || !root["results"].is_object()) {
        throw TimesheetsError("Invalid API response: missing 'results' object");
    }
    const json& results = root["results"];
    if (!results.contains(collection)) {
        throw TimesheetsError("Invalid API response: missing 'results." + collection + "'");
    }
    const json& items = results[collection];
    if (items.is_array() && items.empty()) {
        return nullptr;
    }
    if (!items.is_object()) {
        throw TimesheetsError("Invalid API response: 'results." + collection + "' is not an object");
    }
    return &items;
}

std::optional<std::string> optional_string(const json& j, const char* field) {
    if (!j.contains(field) || j[field].is_null()) {
        return std::nullopt;
    }
    return j[field].get<std::string>();
}

JobCode decode_job_code(const json& j) {
    JobCode code;
    code.id = j.at("id").get<int64_t>();
    code.name = j.at("name").get<std::string>();
    if (j.contains("parent_id") && !j["parent_id"].is_null()) {
        code.parent_id = j["parent_id"].get<int64_t>();
    }
    if (j.contains("active") && !j["active"].is_null()) {
        code.active = j["active"].get<bool>();
    }
    return code;
}

User decode_user(const json& j) {
    User user;
    user.id = j.at("id").get<int64_t>();
    user.first_name = optional_string(j, "first_name");
    user.last_name = optional_string(j, "last_name");
    user.display_name = optional_string(j, "name");
    return user;
}

TimesheetEntry decode_entry(const json& j) {
    return TimesheetEntry(
        j.at("id").get<int64_t>(),
        j.at("user_id").get<int64_t>(),
        j.at("jobcode_id").get<int64_t>(),
        j.at("duration").get<double>()
    );
}

template <typename Fn>
void decode_each(const std::string& body, const std::string& collection, Fn fn) {
    try {
        json root = json::parse(body);
        const json* items = find_collection(root, collection);
        if (!items) {
            return;
        }
        for (const auto& item : items->items()) {
            fn(item.value());
        }
    } catch (const json::exception& e) {
        std::ostringstream oss;
        oss << "Failed to decode " << collection << ": " << e.what();
        throw TimesheetsError(oss.str());
    }
}

} // anonymous namespace

std::map<int64_t, JobCode> decode_job_codes(const std::string& body) {
    std::map<int64_t, JobCode> codes;
    decode_each(body, "jobcodes", [&codes](const json& j) {
        JobCode code = decode_job_code(j);
        codes[code.id] = code;
    });
    return codes;
}

std::map<int64_t, User> decode_users(const std::string& body) {
    std::map<int64_t, User> users;
    decode_each(body, "users", [&users](const json& j) {
        User user = decode_user(j);
        users[user.id] = user;
    });
    return users;
}

std::vector<TimesheetEntry> decode_timesheets(const std::string& body) {
    std::map<int64_t, TimesheetEntry> by_id;
    decode_each(body, "timesheets", [&by_id](const json& j) {
        TimesheetEntry entry = decode_entry(j);
        by_id[entry.id] = entry;
    });

    std::vector<TimesheetEntry> entries;
    entries.reserve(by_id.size());
    for (const auto& [id, entry] : by_id) {
        entries.push_back(entry);
    }
    return entries;
}

// ============================================================================
// TimesheetsClient Implementation
// ============================================================================

TimesheetsClient::TimesheetsClient(const ApiConfig& config, int timeout_ms)
    : api_token_(config.api_token)
{
    validate_api_config(config);
    http_client_ = std::make_unique<HttpClient>(config.api_url, timeout_ms);
}

TimesheetsClient::~TimesheetsClient() = default;

QueryParams TimesheetsClient::timesheet_query(
    const Date& start,
    const Date& end,
    const std::vector<int64_t>& jobcode_ids)
{
    QueryParams params;
    params["start_date"] = start.to_string();
    params["end_date"] = end.to_string();

    if (!jobcode_ids.empty()) {
        std::string csv;
        for (size_t i = 0; i < jobcode_ids.size(); ++i) {
            if (i > 0) csv += ",";
            csv += std::to_string(jobcode_ids[i]);
        }
        params["jobcode_ids"] = csv;
    }
    return params;
}

std::string TimesheetsClient::get_body(const std::string& path, const QueryParams& params) {
    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + api_token_;
    headers["Accept"] = "application/json";

    try {
        auto response = http_client_->get(path, params, headers);
        if (response.status_code != 200) {
            std::ostringstream oss;
            oss << "Unexpected response from " << path << ": HTTP " << response.status_code;
            throw TimesheetsError(oss.str());
        }
        return response.body;

    } catch (const HttpClientError& e) {
        std::ostringstream oss;
        oss << "Failed to fetch " << path << ": " << e.what();
        throw TimesheetsError(oss.str());
    }
}

std::map<int64_t, JobCode> TimesheetsClient::fetch_job_codes() {
    return decode_job_codes(get_body("/jobcodes"));
}

std::map<int64_t, User> TimesheetsClient::fetch_users() {
    return decode_users(get_body("/users"));
}

std::vector<TimesheetEntry> TimesheetsClient::fetch_timesheets(
    const Date& start,
    const Date& end,
    const std::vector<int64_t>& jobcode_ids)
{
    return decode_timesheets(get_body("/timesheets", timesheet_query(start, end, jobcode_ids)));
}

} // namespace timesheets
} // namespace burncalc
