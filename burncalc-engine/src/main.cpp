#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include "burn_session.hpp"
#include "calendar.hpp"
#include "ceiling.hpp"
#include "chart_cache.hpp"
#include "chart_generator.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "io/ceiling_store.hpp"
#include "io/json_writer.hpp"
#include "c++/timesheets_client.hpp"
#include "config/api_config.hpp"

namespace {

struct CLIArgs {
    std::string command;            // chart, jobs, ceiling, holidays
    std::string subcommand;         // ceiling: show, add, remove, set-pop
    std::string year;               // holidays <year>
    std::string config_path;
    std::string job;
    std::string query_stop;
    std::string pop_start;
    std::string pop_end;
    std::string today;
    std::string data_dir;
    std::string output_path;
    std::string log_level = "INFO";
    bool log_json = false;
    bool debug_http = false;
    // Release editing
    std::string release_date;
    std::string release_hours;
    std::string release_note;
    std::string release_id;
    bool help = false;
};

// Exit codes by failure category
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_VALIDATION = 2;
constexpr int EXIT_CONFIGURATION = 3;
constexpr int EXIT_TRANSPORT = 4;
constexpr int EXIT_PERSISTENCE = 5;

void print_usage(const char* program_name) {
    std::cerr << "BurnCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  chart                       Generate a job's burn chart (JSON)\n";
    std::cerr << "  jobs                        Print the job tree (JSON)\n";
    std::cerr << "  ceiling show                Print a job's ceiling record\n";
    std::cerr << "  ceiling add                 Add a ceiling release (--date, --hours, [--note])\n";
    std::cerr << "  ceiling remove              Remove a ceiling release (--id)\n";
    std::cerr << "  ceiling set-pop             Set the period of performance (--pop-start, --pop-end)\n";
    std::cerr << "  holidays <year>             List observed U.S. federal holidays\n\n";
    std::cerr << "Chart options:\n";
    std::cerr << "  --job <id>                  Job code id (required for chart and ceiling)\n";
    std::cerr << "  --query-stop <YYYY-MM-DD>   Last day of actuals (default: end of last month)\n";
    std::cerr << "  --pop-start <YYYY-MM-DD>    Period of performance start (default: stored;\n";
    std::cerr << "                              January 1 of this year when only --pop-end is given)\n";
    std::cerr << "  --pop-end <YYYY-MM-DD>      Period of performance end (default: stored)\n";
    std::cerr << "  --today <YYYY-MM-DD>        Override the current date\n\n";
    std::cerr << "Release options:\n";
    std::cerr << "  --date <YYYY-MM-DD>         Release effective date\n";
    std::cerr << "  --hours <n>                 Release hours (may be negative)\n";
    std::cerr << "  --note <text>               Optional note\n";
    std::cerr << "  --id <uuid>                 Release id (for remove)\n\n";
    std::cerr << "Configuration options:\n";
    std::cerr << "  --config <path>             API config JSON {\"API_URL\", \"API_TOKEN\"}\n";
    std::cerr << "                              (default: ~/.config/burncalc/config.json;\n";
    std::cerr << "                              BURNCALC_API_URL/BURNCALC_API_TOKEN take priority)\n";
    std::cerr << "  --data-dir <path>           Ceiling data directory (default: ~/.local/share/burncalc)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-json                  Emit logs as JSON lines\n";
    std::cerr << "  --debug-http                Trace HTTP requests (tokens redacted)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " ceiling set-pop --job 42 --pop-start 2025-01-01 --pop-end 2025-12-31\n";
    std::cerr << "  " << program_name << " ceiling add --job 42 --date 2025-01-15 --hours 100\n";
    std::cerr << "  " << program_name << " chart --job 42 --query-stop 2025-06-30 --output chart.json\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--job" && i + 1 < argc) {
            args.job = argv[++i];
        } else if (arg == "--query-stop" && i + 1 < argc) {
            args.query_stop = argv[++i];
        } else if (arg == "--pop-start" && i + 1 < argc) {
            args.pop_start = argv[++i];
        } else if (arg == "--pop-end" && i + 1 < argc) {
            args.pop_end = argv[++i];
        } else if (arg == "--today" && i + 1 < argc) {
            args.today = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            args.data_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = true;
        } else if (arg == "--debug-http") {
            args.debug_http = true;
        } else if (arg == "--date" && i + 1 < argc) {
            args.release_date = argv[++i];
        } else if (arg == "--hours" && i + 1 < argc) {
            args.release_hours = argv[++i];
        } else if (arg == "--note" && i + 1 < argc) {
            args.release_note = argv[++i];
        } else if (arg == "--id" && i + 1 < argc) {
            args.release_id = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional: command, then subcommand or year
            if (args.command.empty()) {
                args.command = arg;
            } else if (args.command == "ceiling" && args.subcommand.empty()) {
                args.subcommand = arg;
            } else if (args.command == "holidays" && args.year.empty()) {
                args.year = arg;
            } else {
                std::cerr << "Error: Unexpected argument: " << arg << "\n\n";
                return false;
            }
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool is_log_level(const std::string& level) {
    return level == "DEBUG" || level == "INFO" || level == "WARN" || level == "ERROR";
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command.empty()) {
        std::cerr << "Error: a command is required\n";
        return false;
    }

    if (args.command != "chart" && args.command != "jobs" &&
        args.command != "ceiling" && args.command != "holidays") {
        std::cerr << "Error: Unknown command: " << args.command << "\n";
        return false;
    }

    if ((args.command == "chart" || args.command == "ceiling") && args.job.empty()) {
        std::cerr << "Error: --job is required for " << args.command << "\n";
        valid = false;
    }

    if (args.command == "ceiling") {
        const std::string& sub = args.subcommand;
        if (sub != "show" && sub != "add" && sub != "remove" && sub != "set-pop") {
            std::cerr << "Error: ceiling requires one of: show, add, remove, set-pop\n";
            valid = false;
        }
        if (sub == "add" && (args.release_date.empty() || args.release_hours.empty())) {
            std::cerr << "Error: ceiling add requires --date and --hours\n";
            valid = false;
        }
        if (sub == "remove" && args.release_id.empty()) {
            std::cerr << "Error: ceiling remove requires --id\n";
            valid = false;
        }
        if (sub == "set-pop" && (args.pop_start.empty() || args.pop_end.empty())) {
            std::cerr << "Error: ceiling set-pop requires --pop-start and --pop-end\n";
            valid = false;
        }
    }

    if (args.command == "chart" && !args.pop_start.empty() && args.pop_end.empty()) {
        std::cerr << "Error: --pop-start requires --pop-end\n";
        valid = false;
    }

    if (args.command == "holidays" && args.year.empty()) {
        std::cerr << "Error: holidays requires a year\n";
        valid = false;
    }

    if (!is_log_level(args.log_level)) {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

burncalc::Date parse_date_arg(const std::string& option, const std::string& value) {
    try {
        return burncalc::Date::parse(value);
    } catch (const std::invalid_argument&) {
        throw burncalc::ChartError(burncalc::ChartErrorKind::Validation,
                                   "Invalid " + option + " (expected YYYY-MM-DD): " + value);
    }
}

int64_t parse_job_arg(const std::string& value) {
    size_t consumed = 0;
    long long id = 0;
    try {
        id = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || id <= 0) {
        throw burncalc::ChartError(burncalc::ChartErrorKind::Validation,
                                   "Invalid --job (expected a positive integer): " + value);
    }
    return static_cast<int64_t>(id);
}

int parse_year_arg(const std::string& value) {
    size_t consumed = 0;
    int year = 0;
    try {
        year = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || year < 1 || year > 9999) {
        throw burncalc::ChartError(burncalc::ChartErrorKind::Validation,
                                   "Invalid year: " + value);
    }
    return year;
}

int exit_code_for(burncalc::ChartErrorKind kind) {
    switch (kind) {
        case burncalc::ChartErrorKind::Validation: return EXIT_VALIDATION;
        case burncalc::ChartErrorKind::Configuration: return EXIT_CONFIGURATION;
        case burncalc::ChartErrorKind::Transport: return EXIT_TRANSPORT;
        case burncalc::ChartErrorKind::Persistence: return EXIT_PERSISTENCE;
        default: return EXIT_USAGE;
    }
}

// Writes to --output when given, otherwise stdout
template <typename WriteFn>
void emit(const CLIArgs& args, WriteFn write) {
    if (args.output_path.empty()) {
        write(std::cout);
        return;
    }
    std::ofstream file(args.output_path);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + args.output_path);
    }
    write(file);
    std::cerr << "Results written to " << args.output_path << "\n";
}

burncalc::Date resolve_today(const CLIArgs& args) {
    return args.today.empty() ? burncalc::Date::today() : parse_date_arg("--today", args.today);
}

// ============================================================================
// Commands
// ============================================================================

int run_holidays(const CLIArgs& args) {
    const int year = parse_year_arg(args.year);
    burncalc::HolidayCalendar calendar;
    const auto& holidays = calendar.holidays(year);
    emit(args, [&](std::ostream& os) {
        burncalc::io::write_holidays_json(os, year, holidays);
    });
    return 0;
}

int run_ceiling(const CLIArgs& args) {
    const int64_t job_id = parse_job_arg(args.job);
    burncalc::io::CeilingStore store(args.data_dir);

    // Edits start from the stored record; an unreadable file is reported, never overwritten
    burncalc::CeilingRecord record = store.load_record(job_id);

    if (args.subcommand == "add") {
        const burncalc::Date date = parse_date_arg("--date", args.release_date);
        const double hours = burncalc::parse_hours(args.release_hours);
        std::optional<std::string> note;
        if (!args.release_note.empty()) {
            note = args.release_note;
        }
        const std::string id = burncalc::add_release(record, date, hours, note);
        store.save_record(job_id, record);
        std::cerr << "Added release " << id << "\n";
    } else if (args.subcommand == "remove") {
        if (!burncalc::remove_release(record, args.release_id)) {
            throw burncalc::ChartError(burncalc::ChartErrorKind::Validation,
                                       "No release with id " + args.release_id);
        }
        store.save_record(job_id, record);
        std::cerr << "Removed release " << args.release_id << "\n";
    } else if (args.subcommand == "set-pop") {
        const burncalc::Date start = parse_date_arg("--pop-start", args.pop_start);
        const burncalc::Date end = parse_date_arg("--pop-end", args.pop_end);
        if (!burncalc::is_valid_pop(start, end)) {
            throw burncalc::ChartError(burncalc::ChartErrorKind::Validation,
                                       "PoP start must not be after PoP end");
        }
        record.pop_start = start;
        record.pop_end = end;
        store.save_record(job_id, record);
    }

    emit(args, [&](std::ostream& os) {
        os << burncalc::io::serialize_ceiling_record(record);
    });
    return 0;
}

int run_remote(const CLIArgs& args) {
    burncalc::timesheets::ApiConfig config = burncalc::timesheets::resolve_api_config(args.config_path);
    burncalc::timesheets::TimesheetsClient client(config);
    client.set_debug(args.debug_http);

    burncalc::io::CeilingStore store(args.data_dir);
    burncalc::ChartCache cache;
    burncalc::BurnSession session(client, store, cache);

    if (args.command == "jobs") {
        session.load_directory();
        emit(args, [&](std::ostream& os) {
            burncalc::io::write_job_tree_json(os, session.job_tree());
        });
        return 0;
    }

    // chart
    const int64_t job_id = parse_job_arg(args.job);
    const burncalc::Date today = resolve_today(args);
    const burncalc::Date query_stop = args.query_stop.empty()
        ? burncalc::default_query_stop(today)
        : parse_date_arg("--query-stop", args.query_stop);

    burncalc::ChartResult result;
    if (!args.pop_end.empty()) {
        burncalc::ChartRequest request;
        request.job_id = job_id;
        request.pop_start = args.pop_start.empty()
            ? burncalc::default_period_start(today)
            : parse_date_arg("--pop-start", args.pop_start);
        request.pop_end = parse_date_arg("--pop-end", args.pop_end);
        request.query_stop = query_stop;
        request.today = today;
        result = session.generate(request);
    } else {
        result = session.generate(job_id, query_stop, today);
    }

    emit(args, [&](std::ostream& os) {
        burncalc::io::write_chart_result_json(os, result);
    });
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_USAGE;
    }

    burncalc::LoggerConfig log_config;
    log_config.min_level = burncalc::string_to_level(args.log_level);
    log_config.enable_json = args.log_json;
    burncalc::Logger::get_instance().configure(log_config);

    try {
        if (args.command == "holidays") {
            return run_holidays(args);
        }
        if (args.command == "ceiling") {
            return run_ceiling(args);
        }
        return run_remote(args);

    } catch (const burncalc::ChartError& e) {
        std::cerr << "Error (" << burncalc::kind_to_string(e.kind()) << "): " << e.what() << "\n";
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
