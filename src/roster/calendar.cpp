#include "duty_roster/roster/calendar.hpp"
#include "duty_roster/roster/eligibility.hpp"

namespace duty_roster {

Calendar::Calendar(std::set<Date> holidays, ShiftScheme scheme,
                   bool cover_weekday_morning)
    : holidays_(std::move(holidays))
    , scheme_(scheme)
    , cover_weekday_morning_(cover_weekday_morning) {}

DayClass Calendar::classify(Date day) const {
    return classify_day(day, is_holiday(day));
}

std::vector<Shift> Calendar::shifts_for(Date day) const {
    DayClass day_class = classify(day);

    if (scheme_ == ShiftScheme::FullDay) {
        switch (day_class) {
            case DayClass::Holiday: return {Shift::HolidayFull};
            case DayClass::Weekend: return {Shift::WeekendFull};
            case DayClass::Weekday: return {Shift::WeekdayPmOnly};
        }
    }

    switch (day_class) {
        case DayClass::Holiday:
            return {Shift::HolidayAm, Shift::HolidayPm};
        case DayClass::Weekend:
            return {Shift::WeekendAm, Shift::WeekendPm};
        case DayClass::Weekday:
            if (cover_weekday_morning_) {
                return {Shift::WeekdayAm, Shift::WeekdayPm};
            }
            return {Shift::WeekdayPm};
    }
    return {};
}

} // namespace duty_roster
