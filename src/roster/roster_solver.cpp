#include "duty_roster/roster/roster_solver.hpp"
#include "duty_roster/roster/calendar.hpp"
#include "duty_roster/roster/fairness.hpp"
#include "duty_roster/roster/roster_model.hpp"
#include <iostream>
#include <stdexcept>

namespace duty_roster {

const char* const kConstraintsTooTightMessage =
    "Logic conflict: constraints (rest rules or holiday bidding) are too tight "
    "to find a fair balance.";

std::string roster_status_name(RosterStatus status) {
    switch (status) {
        case RosterStatus::Optimal: return "OPTIMAL";
        case RosterStatus::Feasible: return "FEASIBLE";
        case RosterStatus::CoverageGap: return "COVERAGE_GAP";
        case RosterStatus::Infeasible: return "INFEASIBLE";
        case RosterStatus::Timeout: return "TIMEOUT";
    }
    return "UNKNOWN";
}

RosterSolver::RosterSolver(std::vector<Employee> employees,
                           std::vector<Date> dates,
                           std::set<Date> holidays,
                           RosterConfig config)
    : employees_(std::move(employees))
    , dates_(std::move(dates))
    , holidays_(std::move(holidays))
    , config_(config) {
    std::set<std::string> names;
    for (const auto& emp : employees_) {
        if (emp.name.empty()) {
            throw std::invalid_argument("Employee name must not be empty");
        }
        if (!names.insert(emp.name).second) {
            throw std::invalid_argument("Duplicate employee name: " + emp.name);
        }
        if (emp.ytd_points < 0) {
            throw std::invalid_argument("Negative YTD points for " + emp.name);
        }
    }
    std::set<Date> seen;
    for (Date day : dates_) {
        if (!seen.insert(day).second) {
            throw std::invalid_argument("Duplicate date: " + day.to_string());
        }
    }
    if (config_.point_scale <= 0) {
        throw std::invalid_argument("point_scale must be positive");
    }
}

RosterOutcome RosterSolver::solve() {
    RosterOutcome outcome;

    Model model;
    Calendar calendar(holidays_, config_.scheme, config_.cover_weekday_morning);
    RosterModelBuilder builder(model, employees_, dates_, calendar, config_);

    builder.create_variables();

    // 候補0人の枠が1つでもあれば、ソルバーは呼ばない
    auto gaps = builder.add_coverage_constraints();
    if (!gaps.empty()) {
        outcome.status = RosterStatus::CoverageGap;
        for (const auto& gap : gaps) {
            outcome.errors.push_back(gap.message());
        }
        if (verbose_) {
            std::cerr << "% [verbose] " << gaps.size() << " uncoverable slot(s)\n";
        }
        return outcome;
    }

    builder.add_one_shift_per_day_constraints();
    builder.add_rest_constraints();
    builder.add_holiday_bid_constraints();
    auto objective = add_fairness_objective(model, employees_, builder.assignments(), config_);

    if (verbose_) {
        std::cerr << "% [verbose] model: " << model.variables().size() << " variables, "
                  << model.constraints().size() << " constraints, "
                  << builder.assignments().size() << " assignment candidates\n";
    }

    solver_.set_verbose(verbose_);
    solver_.set_time_limit(config_.time_limit_seconds);
    solver_.set_hint_solution(builder.greedy_hint(), model);

    OptimizeResult result = solver_.minimize(model, objective.spread);

    switch (result.status) {
        case SolveStatus::Optimal:
            outcome.status = RosterStatus::Optimal;
            break;
        case SolveStatus::Feasible:
            outcome.status = RosterStatus::Feasible;
            break;
        case SolveStatus::Infeasible:
            outcome.status = RosterStatus::Infeasible;
            outcome.errors.push_back(kConstraintsTooTightMessage);
            return outcome;
        case SolveStatus::Unknown:
            outcome.status = RosterStatus::Timeout;
            outcome.errors.push_back(kConstraintsTooTightMessage);
            return outcome;
    }

    auto projected = project_result(employees_, builder.assignments(), *result.solution, config_);
    outcome.roster = std::move(projected.roster);
    outcome.summary = std::move(projected.summary);
    return outcome;
}

} // namespace duty_roster
