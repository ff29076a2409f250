#include "duty_roster/roster/carry_over.hpp"
#include "duty_roster/roster/csv_io.hpp"
#include "duty_roster/roster/roster_solver.hpp"
#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
duty_roster::RosterSolver* g_current_solver = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-f] [-m] [-t SEC] [-y YEARS] [-s] [-v] [-o ROSTER.csv] [-S SUMMARY.csv]"
                 " [-u UPDATED.csv] [-H HOLIDAYS.csv] <employees.csv> <start> <end>\n";
    std::cerr << "  -f          Full-day shifts (one slot per day)\n";
    std::cerr << "  -m          Also cover weekday mornings (split scheme)\n";
    std::cerr << "  -t SEC      Solver time budget in seconds (default 10)\n";
    std::cerr << "  -y YEARS    Holiday immunity period in years (default 2)\n";
    std::cerr << "  -s          Print solver statistics to stderr\n";
    std::cerr << "  -v          Verbose mode (print model/search progress)\n";
    std::cerr << "  -o FILE     Write the roster CSV to FILE instead of stdout\n";
    std::cerr << "  -S FILE     Write the points summary CSV to FILE instead of stdout\n";
    std::cerr << "  -u FILE     Write carried-over employee records to FILE\n";
    std::cerr << "  -H FILE     Holidays CSV (Date column)\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const duty_roster::RosterSolver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: nodes=" << s.node_count
              << " fails=" << s.fail_count
              << " solutions=" << s.solution_count
              << " max_depth=" << s.max_depth
              << "\n";
}

duty_roster::Date parse_date_arg(const char* text) {
    auto date = duty_roster::Date::parse(text);
    if (!date) {
        throw std::invalid_argument(std::string("Invalid date: ") + text);
    }
    return *date;
}

template <typename Writer>
void write_output(const char* path, Writer writer) {
    if (!path) {
        writer(std::cout);
        return;
    }
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error(std::string("Cannot open file for writing: ") + path);
    }
    writer(out);
}

int main(int argc, char* argv[]) {
    duty_roster::RosterConfig config;
    const char* positional[3] = {nullptr, nullptr, nullptr};
    int positional_count = 0;
    const char* roster_path = nullptr;
    const char* summary_path = nullptr;
    const char* updated_path = nullptr;
    const char* holidays_path = nullptr;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-f") == 0) {
            config.scheme = duty_roster::ShiftScheme::FullDay;
        } else if (std::strcmp(argv[i], "-m") == 0) {
            config.cover_weekday_morning = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            config.time_limit_seconds = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "-y") == 0 && i + 1 < argc) {
            config.immunity_years = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            roster_path = argv[++i];
        } else if (std::strcmp(argv[i], "-S") == 0 && i + 1 < argc) {
            summary_path = argv[++i];
        } else if (std::strcmp(argv[i], "-u") == 0 && i + 1 < argc) {
            updated_path = argv[++i];
        } else if (std::strcmp(argv[i], "-H") == 0 && i + 1 < argc) {
            holidays_path = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && positional_count < 3) {
            positional[positional_count++] = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional_count != 3) {
        print_usage(argv[0]);
        return 1;
    }

    // ソルバー自身の時間予算が効かない場合の保険
    if (config.time_limit_seconds > 0.0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(static_cast<unsigned>(std::ceil(config.time_limit_seconds)) + 1);
    }

    try {
        auto start = parse_date_arg(positional[1]);
        auto end = parse_date_arg(positional[2]);

        auto loaded = duty_roster::load_employees(positional[0]);
        for (const auto& warning : loaded.warnings) {
            std::cerr << "% warning: " << warning << "\n";
        }

        std::set<duty_roster::Date> holidays;
        if (holidays_path) {
            std::vector<std::string> warnings;
            holidays = duty_roster::load_holidays(holidays_path, &warnings);
            for (const auto& warning : warnings) {
                std::cerr << "% warning: " << warning << "\n";
            }
        }

        duty_roster::RosterSolver solver(loaded.employees,
                                         duty_roster::date_range(start, end),
                                         holidays, config);
        solver.set_verbose(g_verbose);
        g_current_solver = &solver;

        auto outcome = solver.solve();
        g_current_solver = nullptr;
        print_stats(solver);

        std::cerr << "% status: " << duty_roster::roster_status_name(outcome.status) << "\n";
        if (!outcome.ok()) {
            for (const auto& error : outcome.errors) {
                std::cerr << error << "\n";
            }
            return 2;
        }

        write_output(roster_path, [&outcome](std::ostream& out) {
            duty_roster::write_roster_csv(out, outcome.roster);
        });
        if (!roster_path && !summary_path) {
            std::cout << "\n";
        }
        write_output(summary_path, [&outcome](std::ostream& out) {
            duty_roster::write_summary_csv(out, outcome.summary);
        });

        if (updated_path) {
            auto updated = duty_roster::apply_carry_over(solver.employees(), outcome);
            duty_roster::save_employees(updated_path, updated);
            if (g_verbose) {
                for (const auto& emp : updated) {
                    std::cerr << "% [verbose] " << emp.name << ": "
                              << duty_roster::immunity_status(emp, end.add_days(1),
                                                              config.immunity_years)
                              << "\n";
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
