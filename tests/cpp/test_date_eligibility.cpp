#include <catch2/catch.hpp>
#include "duty_roster/roster/calendar.hpp"
#include "duty_roster/roster/config.hpp"
#include "duty_roster/roster/date.hpp"
#include "duty_roster/roster/eligibility.hpp"
#include "duty_roster/roster/employee.hpp"
#include <stdexcept>

using namespace duty_roster;

namespace {

Date d(int y, int m, int day) {
    return Date::from_ymd(y, m, day);
}

}  // namespace

// ============================================================================
// Date tests
// ============================================================================

TEST_CASE("Date weekday and formatting", "[date]") {
    Date monday = d(2026, 1, 5);

    REQUIRE(monday.weekday() == 0);
    REQUIRE(monday.weekday_name() == "Monday");
    REQUIRE_FALSE(monday.is_weekend());
    REQUIRE(monday.to_string() == "2026-01-05");

    REQUIRE(d(2026, 1, 10).weekday_name() == "Saturday");
    REQUIRE(d(2026, 1, 10).is_weekend());
    REQUIRE(d(2026, 1, 11).is_weekend());
    REQUIRE(d(2026, 1, 1).weekday_name() == "Thursday");
    REQUIRE(d(1970, 1, 1).serial() == 0);
    REQUIRE(d(1969, 12, 31).weekday_name() == "Wednesday");
}

TEST_CASE("Date parse", "[date]") {
    SECTION("plain and timestamped forms") {
        REQUIRE(Date::parse("2026-01-05") == d(2026, 1, 5));
        REQUIRE(Date::parse("  2026-01-05 ") == d(2026, 1, 5));
        REQUIRE(Date::parse("2026-01-05T08:30:00") == d(2026, 1, 5));
        REQUIRE(Date::parse("2026-01-05 00:00:00") == d(2026, 1, 5));
    }

    SECTION("invalid text") {
        REQUIRE_FALSE(Date::parse("").has_value());
        REQUIRE_FALSE(Date::parse("abc").has_value());
        REQUIRE_FALSE(Date::parse("2026/01/05").has_value());
        REQUIRE_FALSE(Date::parse("2026-02-30").has_value());
        REQUIRE_FALSE(Date::parse("2026-13-01").has_value());
        REQUIRE_FALSE(Date::parse("2026-01-05x").has_value());
    }

    SECTION("from_ymd rejects impossible dates") {
        REQUIRE_THROWS_AS(Date::from_ymd(2026, 2, 29), std::invalid_argument);
        REQUIRE_NOTHROW(Date::from_ymd(2024, 2, 29));
    }
}

TEST_CASE("Date arithmetic", "[date]") {
    REQUIRE(d(2026, 1, 31).add_days(1) == d(2026, 2, 1));
    REQUIRE(d(2026, 3, 1).add_days(-1) == d(2026, 2, 28));
    REQUIRE(d(2025, 6, 15).add_years(2) == d(2027, 6, 15));

    // 存在しない記念日は月末に丸める
    REQUIRE(d(2024, 2, 29).add_years(2) == d(2026, 2, 28));
    REQUIRE(d(2024, 2, 29).add_years(4) == d(2028, 2, 29));

    REQUIRE(Date::days_in_month(2024, 2) == 29);
    REQUIRE(Date::days_in_month(2100, 2) == 28);
    REQUIRE(Date::days_in_month(2000, 2) == 29);
}

TEST_CASE("date_range", "[date]") {
    auto range = date_range(d(2026, 1, 30), d(2026, 2, 2));
    REQUIRE(range.size() == 4);
    REQUIRE(range.front() == d(2026, 1, 30));
    REQUIRE(range.back() == d(2026, 2, 2));

    REQUIRE(date_range(d(2026, 1, 5), d(2026, 1, 5)).size() == 1);
    REQUIRE(date_range(d(2026, 1, 6), d(2026, 1, 5)).empty());
}

// ============================================================================
// Employee / eligibility tests
// ============================================================================

TEST_CASE("Role names", "[eligibility]") {
    REQUIRE(parse_role("Standard") == Role::Standard);
    REQUIRE(parse_role(" no-pm ") == Role::NoEvening);
    REQUIRE_FALSE(parse_role("No Evening").has_value());
    REQUIRE(parse_role("no-evening") == Role::NoEvening);
    REQUIRE(parse_role("Weekend-Only") == Role::WeekendOnly);
    REQUIRE_FALSE(parse_role("Manager").has_value());

    REQUIRE(role_name(Role::NoEvening) == "No-PM");
    REQUIRE(parse_role(role_name(Role::WeekendOnly)) == Role::WeekendOnly);
}

TEST_CASE("Holiday immunity", "[eligibility]") {
    Employee emp;
    emp.name = "Alice";
    emp.team = "Red";

    SECTION("never worked a holiday") {
        REQUIRE_FALSE(emp.immunity_end().has_value());
        REQUIRE_FALSE(emp.is_immune(d(2026, 1, 1)));
    }

    SECTION("immune for two years") {
        emp.last_special_date = d(2025, 1, 1);
        REQUIRE(emp.immunity_end() == d(2027, 1, 1));
        REQUIRE(emp.is_immune(d(2026, 12, 31)));
        REQUIRE_FALSE(emp.is_immune(d(2027, 1, 1)));
        REQUIRE_FALSE(emp.is_immune(d(2026, 1, 1), 1));
    }
}

TEST_CASE("can_work", "[eligibility]") {
    Date monday = d(2026, 1, 5);
    Date saturday = d(2026, 1, 10);
    Date new_year = d(2026, 1, 1);

    Employee standard;
    standard.name = "Standard";
    Employee no_pm;
    no_pm.name = "NoPm";
    no_pm.role = Role::NoEvening;
    Employee weekend;
    weekend.name = "Weekend";
    weekend.role = Role::WeekendOnly;

    SECTION("shift must match the day class") {
        REQUIRE(can_work(standard, monday, Shift::WeekdayPm, false));
        REQUIRE_FALSE(can_work(standard, monday, Shift::WeekendPm, false));
        REQUIRE(can_work(standard, saturday, Shift::WeekendAm, false));
        REQUIRE_FALSE(can_work(standard, new_year, Shift::WeekdayPm, true));
        REQUIRE(can_work(standard, new_year, Shift::HolidayPm, true));
    }

    SECTION("role restrictions") {
        REQUIRE_FALSE(can_work(no_pm, monday, Shift::WeekdayPm, false));
        REQUIRE(can_work(no_pm, monday, Shift::WeekdayAm, false));
        REQUIRE(can_work(no_pm, saturday, Shift::WeekendAm, false));
        REQUIRE_FALSE(can_work(no_pm, saturday, Shift::WeekendFull, false));

        REQUIRE_FALSE(can_work(weekend, monday, Shift::WeekdayPm, false));
        REQUIRE_FALSE(can_work(weekend, monday, Shift::WeekdayPmOnly, false));
        REQUIRE(can_work(weekend, saturday, Shift::WeekendPm, false));
        REQUIRE(can_work(weekend, new_year, Shift::HolidayAm, true));
    }

    SECTION("blackouts") {
        standard.blackouts.insert(monday);
        REQUIRE_FALSE(can_work(standard, monday, Shift::WeekdayPm, false));
        REQUIRE(can_work(standard, monday.add_days(1), Shift::WeekdayPm, false));
    }

    SECTION("immunity applies to holidays only") {
        standard.last_special_date = d(2025, 1, 1);
        REQUIRE_FALSE(can_work(standard, new_year, Shift::HolidayPm, true));
        REQUIRE(can_work(standard, monday, Shift::WeekdayPm, false));
        REQUIRE(can_work(standard, new_year, Shift::HolidayPm, true, 1));
    }
}

TEST_CASE("Calendar shifts", "[eligibility]") {
    Date monday = d(2026, 1, 5);
    Date saturday = d(2026, 1, 10);
    Date new_year = d(2026, 1, 1);

    SECTION("split scheme") {
        Calendar calendar({new_year}, ShiftScheme::Split);
        REQUIRE(calendar.shifts_for(monday) == std::vector<Shift>{Shift::WeekdayPm});
        REQUIRE(calendar.shifts_for(saturday) ==
                std::vector<Shift>{Shift::WeekendAm, Shift::WeekendPm});
        REQUIRE(calendar.shifts_for(new_year) ==
                std::vector<Shift>{Shift::HolidayAm, Shift::HolidayPm});
        REQUIRE(calendar.classify(new_year) == DayClass::Holiday);
    }

    SECTION("weekday mornings") {
        Calendar calendar({}, ShiftScheme::Split, true);
        REQUIRE(calendar.shifts_for(monday) ==
                std::vector<Shift>{Shift::WeekdayAm, Shift::WeekdayPm});
    }

    SECTION("full-day scheme") {
        Calendar calendar({new_year}, ShiftScheme::FullDay);
        REQUIRE(calendar.shifts_for(monday) == std::vector<Shift>{Shift::WeekdayPmOnly});
        REQUIRE(calendar.shifts_for(saturday) == std::vector<Shift>{Shift::WeekendFull});
        REQUIRE(calendar.shifts_for(new_year) == std::vector<Shift>{Shift::HolidayFull});
    }
}

TEST_CASE("Shift weights", "[eligibility]") {
    RosterConfig config;
    REQUIRE(config.weight(Shift::WeekdayPm) == 10);
    REQUIRE(config.weight(Shift::WeekendAm) == 15);
    REQUIRE(config.weight(Shift::HolidayFull) == 15);
    REQUIRE(shift_name(Shift::HolidayPm) == "PH_PM");
    REQUIRE(is_evening_shift(Shift::WeekendFull));
    REQUIRE_FALSE(is_evening_shift(Shift::HolidayAm));
}
