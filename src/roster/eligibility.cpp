#include "duty_roster/roster/eligibility.hpp"

namespace duty_roster {

bool role_permits(Role role, Shift shift) {
    switch (role) {
        case Role::Standard:
            return true;
        case Role::NoEvening:
            return !is_evening_shift(shift);
        case Role::WeekendOnly:
            return shift_class(shift) != DayClass::Weekday;
    }
    return false;
}

DayClass classify_day(Date day, bool is_holiday) {
    if (is_holiday) {
        return DayClass::Holiday;
    }
    return day.is_weekend() ? DayClass::Weekend : DayClass::Weekday;
}

bool can_work(const Employee& employee, Date day, Shift shift,
              bool is_holiday, int immunity_years) {
    if (employee.blackouts.count(day)) {
        return false;
    }

    if (is_holiday && employee.is_immune(day, immunity_years)) {
        return false;
    }

    if (shift_class(shift) != classify_day(day, is_holiday)) {
        return false;
    }

    return role_permits(employee.role, shift);
}

} // namespace duty_roster
