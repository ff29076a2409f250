/**
 * @file calendar.hpp
 * @brief 日付 -> 必要シフト集合の分類器
 */
#ifndef DUTY_ROSTER_ROSTER_CALENDAR_HPP
#define DUTY_ROSTER_ROSTER_CALENDAR_HPP

#include "duty_roster/roster/date.hpp"
#include "duty_roster/roster/shift.hpp"
#include <set>
#include <vector>

namespace duty_roster {

/**
 * @brief 祝日集合とシフト方式から、各日に埋めるべきシフトを決める
 */
class Calendar {
public:
    Calendar(std::set<Date> holidays, ShiftScheme scheme,
             bool cover_weekday_morning = false);

    bool is_holiday(Date day) const { return holidays_.count(day) > 0; }

    /**
     * @brief 日種別（祝日は週末より優先）
     */
    DayClass classify(Date day) const;

    /**
     * @brief day に埋めるべきシフト（朝 → 夜の順）
     */
    std::vector<Shift> shifts_for(Date day) const;

    ShiftScheme scheme() const { return scheme_; }
    const std::set<Date>& holidays() const { return holidays_; }

private:
    std::set<Date> holidays_;
    ShiftScheme scheme_;
    bool cover_weekday_morning_;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_CALENDAR_HPP
