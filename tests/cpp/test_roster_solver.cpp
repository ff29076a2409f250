#include <catch2/catch.hpp>
#include "duty_roster/model.hpp"
#include "duty_roster/roster/carry_over.hpp"
#include "duty_roster/roster/roster_model.hpp"
#include "duty_roster/roster/roster_solver.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

using namespace duty_roster;

namespace {

Date d(int y, int m, int day) {
    return Date::from_ymd(y, m, day);
}

Employee make_employee(const std::string& name, Role role = Role::Standard,
                       int64_t ytd = 0) {
    Employee emp;
    emp.name = name;
    emp.team = "Ops";
    emp.role = role;
    emp.ytd_points = ytd;
    return emp;
}

// 2026-01-05 (月) 〜 2026-01-11 (日)
std::vector<Date> first_full_week() {
    return date_range(d(2026, 1, 5), d(2026, 1, 11));
}

std::vector<Employee> mixed_team() {
    return {
        make_employee("Alice"),
        make_employee("Bob", Role::NoEvening),
        make_employee("Carol", Role::WeekendOnly),
        make_employee("Dave"),
    };
}

// 10人 × 2026年3月（祝日1日）
std::vector<Employee> month_team() {
    std::vector<Employee> team;
    for (int i = 0; i < 6; ++i) {
        team.push_back(make_employee("Standard" + std::to_string(i), Role::Standard, i));
    }
    team.push_back(make_employee("NoPm0", Role::NoEvening, 2));
    team.push_back(make_employee("NoPm1", Role::NoEvening));
    team.push_back(make_employee("Weekend0", Role::WeekendOnly, 1));
    team.push_back(make_employee("Weekend1", Role::WeekendOnly));
    return team;
}

double spread_of(const RosterOutcome& outcome) {
    double highest = outcome.summary.front().total_points;
    double lowest = highest;
    for (const auto& row : outcome.summary) {
        highest = std::max(highest, row.total_points);
        lowest = std::min(lowest, row.total_points);
    }
    return highest - lowest;
}

// 同じ日に2シフト、夜勤の翌日勤務がないことを確認
void require_roster_invariants(const std::vector<RosterRow>& roster) {
    std::map<std::pair<std::string, Date>, int> per_day;
    std::set<std::pair<std::string, Date>> evenings;
    for (const auto& row : roster) {
        per_day[{row.employee, row.date}]++;
        if (is_evening_shift(row.shift)) {
            evenings.insert({row.employee, row.date});
        }
    }
    for (const auto& [key, count] : per_day) {
        REQUIRE(count == 1);
    }
    for (const auto& [name, day] : evenings) {
        REQUIRE(per_day.count({name, day.add_days(1)}) == 0);
    }
}

size_t count_rows(const std::vector<RosterRow>& roster, Date day, Shift shift) {
    return static_cast<size_t>(std::count_if(roster.begin(), roster.end(),
        [&](const RosterRow& row) { return row.date == day && row.shift == shift; }));
}

const SummaryRow& summary_for(const RosterOutcome& outcome, const std::string& name) {
    for (const auto& row : outcome.summary) {
        if (row.employee == name) return row;
    }
    throw std::out_of_range("no summary row for " + name);
}

}  // namespace

// ============================================================================
// Model builder tests
// ============================================================================

TEST_CASE("RosterModelBuilder creates only eligible assignments", "[roster]") {
    auto employees = mixed_team();
    auto dates = first_full_week();
    Calendar calendar({}, ShiftScheme::Split);
    RosterConfig config;

    Model model;
    RosterModelBuilder builder(model, employees, dates, calendar, config);
    builder.create_variables();

    // 平日夜: Alice, Dave の2人 × 5日、土日: 午前4人 + 夜3人 × 2日
    REQUIRE(builder.assignments().size() == 10 + 14);
    REQUIRE(model.variable("Alice_2026-01-05_WEEKDAY_PM") != nullptr);
    REQUIRE(model.variable("Carol_2026-01-10_WEEKEND_PM") != nullptr);
    REQUIRE_THROWS_AS(model.variable("Bob_2026-01-05_WEEKDAY_PM"), std::out_of_range);

    auto gaps = builder.add_coverage_constraints();
    REQUIRE(gaps.empty());

    auto sat_vars = builder.day_variables(1, d(2026, 1, 10));
    REQUIRE(sat_vars.size() == 1);  // Bob は土曜午前のみ
}

TEST_CASE("Coverage gaps name every empty slot", "[roster]") {
    std::vector<Employee> employees = {make_employee("Solo", Role::WeekendOnly)};
    std::vector<Date> dates = {d(2026, 1, 5), d(2026, 1, 6)};
    Calendar calendar({}, ShiftScheme::Split);
    RosterConfig config;

    Model model;
    RosterModelBuilder builder(model, employees, dates, calendar, config);
    builder.create_variables();
    auto gaps = builder.add_coverage_constraints();

    REQUIRE(gaps.size() == 2);
    REQUIRE(gaps[0].message() ==
            "Impossible to fill: 2026-01-05 (WEEKDAY_PM). "
            "Reason: no eligible employee under current restrictions.");
    REQUIRE(gaps[1].date == d(2026, 1, 6));
}

// ============================================================================
// RosterSolver tests
// ============================================================================

TEST_CASE("Mixed roles over one week", "[roster]") {
    RosterSolver solver(mixed_team(), first_full_week(), {});
    auto outcome = solver.solve();

    REQUIRE(outcome.status == RosterStatus::Optimal);
    REQUIRE(outcome.ok());
    REQUIRE(outcome.errors.empty());
    REQUIRE(outcome.roster.size() == 9);
    require_roster_invariants(outcome.roster);

    for (Date day : date_range(d(2026, 1, 5), d(2026, 1, 9))) {
        REQUIRE(count_rows(outcome.roster, day, Shift::WeekdayPm) == 1);
    }
    for (Date day : {d(2026, 1, 10), d(2026, 1, 11)}) {
        REQUIRE(count_rows(outcome.roster, day, Shift::WeekendAm) == 1);
        REQUIRE(count_rows(outcome.roster, day, Shift::WeekendPm) == 1);
    }

    for (const auto& row : outcome.roster) {
        REQUIRE(row.day_name == row.date.weekday_name());
        if (row.employee == "Carol") {
            REQUIRE(row.date.is_weekend());
        }
        if (row.employee == "Bob") {
            REQUIRE_FALSE(is_evening_shift(row.shift));
        }
    }

    // 集計は入力順、獲得ポイントは当番表と一致
    REQUIRE(outcome.summary.size() == 4);
    REQUIRE(outcome.summary[0].employee == "Alice");
    REQUIRE(outcome.summary[3].employee == "Dave");
    double earned = 0.0;
    for (const auto& row : outcome.summary) {
        REQUIRE(row.total_points == row.starting_points + row.points_earned);
        earned += row.points_earned;
    }
    REQUIRE(earned == 5 * 1.0 + 4 * 1.5);
}

TEST_CASE("Blackout on a single date leaves it uncovered", "[roster]") {
    auto employees = mixed_team();
    for (auto& emp : employees) {
        emp.blackouts.insert(d(2026, 1, 7));
    }

    RosterSolver solver(employees, first_full_week(), {});
    auto outcome = solver.solve();

    REQUIRE(outcome.status == RosterStatus::CoverageGap);
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.roster.empty());
    REQUIRE(outcome.summary.empty());
    REQUIRE(outcome.errors.size() == 1);
    REQUIRE(outcome.errors[0].find("2026-01-07") != std::string::npos);
    REQUIRE(outcome.errors[0].find("WEEKDAY_PM") != std::string::npos);
}

TEST_CASE("Holiday bidding", "[roster]") {
    Date new_year = d(2026, 1, 1);
    RosterConfig config;
    config.scheme = ShiftScheme::FullDay;

    Employee bidder = make_employee("Xavier");
    bidder.holiday_bids.insert(new_year);
    Employee other = make_employee("Yara");

    SECTION("a single available bidder takes the holiday") {
        RosterSolver solver({other, bidder}, {new_year}, {new_year}, config);
        auto outcome = solver.solve();

        REQUIRE(outcome.ok());
        REQUIRE(outcome.roster.size() == 1);
        REQUIRE(outcome.roster[0].employee == "Xavier");
        REQUIRE(outcome.roster[0].shift == Shift::HolidayFull);
        REQUIRE(summary_for(outcome, "Xavier").points_earned == 1.5);
        REQUIRE(summary_for(outcome, "Yara").points_earned == 0.0);
    }

    SECTION("an immune bidder is ignored") {
        bidder.last_special_date = d(2025, 1, 1);
        RosterSolver solver({bidder, other}, {new_year}, {new_year}, config);
        auto outcome = solver.solve();

        REQUIRE(outcome.ok());
        REQUIRE(outcome.roster.size() == 1);
        REQUIRE(outcome.roster[0].employee == "Yara");
    }

    SECTION("a lone bidder cannot cover both split shifts") {
        RosterSolver solver({bidder, other}, {new_year}, {new_year});
        auto outcome = solver.solve();

        REQUIRE(outcome.status == RosterStatus::Infeasible);
        REQUIRE(outcome.roster.empty());
        REQUIRE(outcome.errors == std::vector<std::string>{kConstraintsTooTightMessage});
    }
}

TEST_CASE("Fairness balances year-to-date points", "[roster]") {
    std::vector<Employee> employees = {
        make_employee("A"),
        make_employee("B"),
        make_employee("C", Role::Standard, 3),
    };
    RosterSolver solver(employees, date_range(d(2026, 1, 5), d(2026, 1, 9)), {});
    auto outcome = solver.solve();

    REQUIRE(outcome.status == RosterStatus::Optimal);
    require_roster_invariants(outcome.roster);

    REQUIRE(summary_for(outcome, "C").points_earned == 0.0);
    double a = summary_for(outcome, "A").points_earned;
    double b = summary_for(outcome, "B").points_earned;
    REQUIRE(std::min(a, b) == 2.0);
    REQUIRE(std::max(a, b) == 3.0);

    double highest = 0.0;
    double lowest = 1e9;
    for (const auto& row : outcome.summary) {
        highest = std::max(highest, row.total_points);
        lowest = std::min(lowest, row.total_points);
    }
    REQUIRE(highest - lowest == 1.0);
}

TEST_CASE("Raising one employee's YTD never lowers their total", "[roster]") {
    auto dates = date_range(d(2026, 1, 5), d(2026, 1, 9));
    auto solve_with = [&](int64_t c_ytd) {
        std::vector<Employee> employees = {
            make_employee("A"),
            make_employee("B"),
            make_employee("C", Role::Standard, c_ytd),
        };
        RosterSolver solver(employees, dates, {});
        auto outcome = solver.solve();
        REQUIRE(outcome.status == RosterStatus::Optimal);
        require_roster_invariants(outcome.roster);
        return outcome;
    };

    auto base = solve_with(0);
    auto raised = solve_with(1);

    // 0 → 1 は他の2人に近づく方向なので spread は増えない
    REQUIRE(spread_of(base) == 1.0);
    REQUIRE(spread_of(raised) == 0.0);
    REQUIRE(spread_of(raised) <= spread_of(base));

    double previous = summary_for(base, "C").total_points;
    REQUIRE(summary_for(raised, "C").total_points >= previous);
    previous = summary_for(raised, "C").total_points;
    for (int64_t ytd = 2; ytd <= 4; ++ytd) {
        auto outcome = solve_with(ytd);
        double total = summary_for(outcome, "C").total_points;
        REQUIRE(total >= previous);
        REQUIRE(summary_for(outcome, "C").points_earned <=
                summary_for(raised, "C").points_earned);
        previous = total;
    }
}

TEST_CASE("Time limit", "[roster]") {
    SECTION("an expired budget on a month reports a timeout") {
        RosterConfig config;
        config.time_limit_seconds = 1e-9;
        RosterSolver solver(month_team(), date_range(d(2026, 3, 1), d(2026, 3, 31)),
                            {d(2026, 3, 17)}, config);
        auto outcome = solver.solve();

        REQUIRE(outcome.status == RosterStatus::Timeout);
        REQUIRE_FALSE(outcome.ok());
        REQUIRE(outcome.roster.empty());
        REQUIRE(outcome.errors == std::vector<std::string>{kConstraintsTooTightMessage});
    }

    SECTION("a timeout does not carry over to the next solve") {
        RosterConfig config;
        config.time_limit_seconds = 1e-9;
        RosterSolver solver(month_team(), date_range(d(2026, 3, 1), d(2026, 3, 31)),
                            {d(2026, 3, 17)}, config);
        REQUIRE(solver.solve().status == RosterStatus::Timeout);

        solver.set_time_limit(2.0);
        auto outcome = solver.solve();

        REQUIRE(outcome.ok());
        REQUIRE(outcome.errors.empty());
        require_roster_invariants(outcome.roster);
        // 平日21日 × 1 + 土日9日 × 2 + 祝日 × 2
        REQUIRE(outcome.roster.size() == 21 + 9 * 2 + 2);
    }

    SECTION("the same solver gives the same optimum twice") {
        RosterSolver solver(mixed_team(), first_full_week(), {});
        auto first = solver.solve();
        auto second = solver.solve();

        REQUIRE(first.status == RosterStatus::Optimal);
        REQUIRE(second.status == RosterStatus::Optimal);
        REQUIRE(spread_of(first) == spread_of(second));
        REQUIRE(second.roster.size() == first.roster.size());
    }
}

TEST_CASE("RosterSolver edge cases", "[roster]") {
    SECTION("empty date list yields an empty roster") {
        RosterSolver solver({make_employee("A")}, {}, {});
        auto outcome = solver.solve();
        REQUIRE(outcome.ok());
        REQUIRE(outcome.roster.empty());
        REQUIRE(outcome.summary.size() == 1);
    }

    SECTION("duplicate employee names are rejected") {
        REQUIRE_THROWS_AS(RosterSolver({make_employee("A"), make_employee("A")}, {}, {}),
                          std::invalid_argument);
    }

    SECTION("negative YTD is rejected") {
        REQUIRE_THROWS_AS(RosterSolver({make_employee("A", Role::Standard, -1)}, {}, {}),
                          std::invalid_argument);
    }

    SECTION("duplicate dates are rejected") {
        Date day = d(2026, 1, 5);
        REQUIRE_THROWS_AS(RosterSolver({make_employee("A")}, {day, day}, {}),
                          std::invalid_argument);
    }

    SECTION("stopped solver reports a timeout") {
        RosterSolver solver(mixed_team(), first_full_week(), {});
        solver.stop();
        auto outcome = solver.solve();

        REQUIRE(outcome.status == RosterStatus::Timeout);
        REQUIRE(outcome.roster.empty());
        REQUIRE(outcome.errors == std::vector<std::string>{kConstraintsTooTightMessage});
    }
}

// ============================================================================
// Carry-over tests
// ============================================================================

TEST_CASE("Carry-over updates points and holiday dates", "[roster]") {
    Date new_year = d(2026, 1, 1);
    RosterConfig config;
    config.scheme = ShiftScheme::FullDay;

    Employee bidder = make_employee("Xavier", Role::Standard, 4);
    bidder.holiday_bids.insert(new_year);
    Employee other = make_employee("Yara", Role::Standard, 7);
    other.last_special_date = d(2023, 5, 1);
    std::vector<Employee> employees = {bidder, other};

    RosterSolver solver(employees, {new_year}, {new_year}, config);
    auto outcome = solver.solve();
    REQUIRE(outcome.ok());

    auto updated = apply_carry_over(employees, outcome);
    REQUIRE(updated.size() == 2);

    // 4 + 1.5 = 5.5 → 6
    REQUIRE(updated[0].ytd_points == 6);
    REQUIRE(updated[0].last_special_date == new_year);
    REQUIRE(updated[1].ytd_points == 7);
    REQUIRE(updated[1].last_special_date == d(2023, 5, 1));

    REQUIRE(immunity_status(updated[0], d(2026, 6, 1)) == "Immune until 2028-01-01");
    REQUIRE(immunity_status(updated[1], d(2026, 6, 1)) == "Available");
}
