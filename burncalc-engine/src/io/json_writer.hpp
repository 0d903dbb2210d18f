#ifndef BURNCALC_IO_JSON_WRITER_HPP
#define BURNCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../calendar.hpp"
#include "../chart_generator.hpp"
#include "../job_tree.hpp"

namespace burncalc {
namespace io {

// Write ChartResult to JSON format
// Series are written as parallel arrays aligned to "months"; absent ceiling
// and projection index are written as null
void write_chart_result_json(std::ostream& os, const ChartResult& result,
                             bool pretty_print = true);

// Write ChartResult to JSON file
void write_chart_result_json(const std::string& filepath, const ChartResult& result,
                             bool pretty_print = true);

// Write the job forest as nested {"id", "name", "children"} objects
void write_job_tree_json(std::ostream& os, const std::vector<JobNode>& forest,
                         bool pretty_print = true);

// Write a year's observed holidays as an array of {"date", "weekday"}
void write_holidays_json(std::ostream& os, int year, const HolidaySet& holidays,
                         bool pretty_print = true);

} // namespace io
} // namespace burncalc

#endif // BURNCALC_IO_JSON_WRITER_HPP
