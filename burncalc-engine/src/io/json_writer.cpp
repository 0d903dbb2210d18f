#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace burncalc {
namespace io {

namespace {

const char* weekday_name(Weekday weekday) {
    switch (weekday) {
        case Weekday::Sunday: return "Sunday";
        case Weekday::Monday: return "Monday";
        case Weekday::Tuesday: return "Tuesday";
        case Weekday::Wednesday: return "Wednesday";
        case Weekday::Thursday: return "Thursday";
        case Weekday::Friday: return "Friday";
        case Weekday::Saturday: return "Saturday";
        default: return "Unknown";
    }
}

json optional_values(const std::optional<std::vector<double>>& values) {
    if (!values) {
        return nullptr;
    }
    return *values;
}

json job_node_json(const JobNode& node) {
    json j;
    j["id"] = node.id;
    j["name"] = node.name;
    json children = json::array();
    for (const auto& child : node.children) {
        children.push_back(job_node_json(child));
    }
    j["children"] = children;
    return j;
}

void write(std::ostream& os, const json& j, bool pretty_print) {
    os << (pretty_print ? j.dump(2) : j.dump()) << "\n";
}

} // anonymous namespace

void write_chart_result_json(std::ostream& os, const ChartResult& result,
                             bool pretty_print) {
    json j;
    j["job_id"] = result.job_id;
    j["query_stop"] = result.query_stop.to_string();
    j["months"] = result.months();

    // Series
    j["monthly"] = series_values(result.monthly);
    j["cumulative"] = series_values(result.cumulative);
    j["cumulative_actual"] = series_values(result.cumulative_actual);
    j["ceiling"] = optional_values(result.ceiling);
    j["ceiling_75"] = optional_values(result.ceiling_75);

    if (result.projected_start_index) {
        j["projected_start_index"] = *result.projected_start_index;
    } else {
        j["projected_start_index"] = nullptr;
    }

    j["employee_names"] = result.employee_names;

    // Totals and execution metrics
    j["total_actual_hours"] = result.total_actual_hours;
    j["total_projected_hours"] = result.total_projected_hours;
    j["execution_time_ms"] = result.execution_time_ms;

    write(os, j, pretty_print);
}

void write_chart_result_json(const std::string& filepath, const ChartResult& result,
                             bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_chart_result_json(file, result, pretty_print);
}

void write_job_tree_json(std::ostream& os, const std::vector<JobNode>& forest,
                         bool pretty_print) {
    json j = json::array();
    for (const auto& node : forest) {
        j.push_back(job_node_json(node));
    }
    write(os, j, pretty_print);
}

void write_holidays_json(std::ostream& os, int year, const HolidaySet& holidays,
                         bool pretty_print) {
    json list = json::array();
    for (const Date& date : holidays) {
        json h;
        h["date"] = date.to_string();
        h["weekday"] = weekday_name(date.weekday());
        list.push_back(h);
    }

    json j;
    j["year"] = year;
    j["holidays"] = list;
    write(os, j, pretty_print);
}

} // namespace io
} // namespace burncalc
