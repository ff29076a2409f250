#include "duty_roster/roster/shift.hpp"

namespace duty_roster {

DayClass shift_class(Shift shift) {
    switch (shift) {
        case Shift::WeekdayAm:
        case Shift::WeekdayPm:
        case Shift::WeekdayPmOnly:
            return DayClass::Weekday;
        case Shift::WeekendAm:
        case Shift::WeekendPm:
        case Shift::WeekendFull:
            return DayClass::Weekend;
        case Shift::HolidayAm:
        case Shift::HolidayPm:
        case Shift::HolidayFull:
            return DayClass::Holiday;
    }
    return DayClass::Weekday;
}

bool is_evening_shift(Shift shift) {
    switch (shift) {
        case Shift::WeekdayAm:
        case Shift::WeekendAm:
        case Shift::HolidayAm:
            return false;
        case Shift::WeekdayPm:
        case Shift::WeekendPm:
        case Shift::HolidayPm:
        case Shift::WeekdayPmOnly:
        case Shift::WeekendFull:
        case Shift::HolidayFull:
            return true;
    }
    return false;
}

std::string shift_name(Shift shift) {
    switch (shift) {
        case Shift::WeekdayAm:     return "WEEKDAY_AM";
        case Shift::WeekdayPm:     return "WEEKDAY_PM";
        case Shift::WeekendAm:     return "WEEKEND_AM";
        case Shift::WeekendPm:     return "WEEKEND_PM";
        case Shift::HolidayAm:     return "PH_AM";
        case Shift::HolidayPm:     return "PH_PM";
        case Shift::WeekdayPmOnly: return "WEEKDAY_PM_ONLY";
        case Shift::WeekendFull:   return "WEEKEND_FULL";
        case Shift::HolidayFull:   return "PH_FULL";
    }
    return "UNKNOWN";
}

std::string day_class_name(DayClass day_class) {
    switch (day_class) {
        case DayClass::Weekday: return "weekday";
        case DayClass::Weekend: return "weekend";
        case DayClass::Holiday: return "holiday";
    }
    return "unknown";
}

} // namespace duty_roster
