/**
 * @file eligibility.hpp
 * @brief 勤務可否の判定（副作用なし）
 */
#ifndef DUTY_ROSTER_ROSTER_ELIGIBILITY_HPP
#define DUTY_ROSTER_ROSTER_ELIGIBILITY_HPP

#include "duty_roster/roster/employee.hpp"
#include "duty_roster/roster/shift.hpp"

namespace duty_roster {

/**
 * @brief 役割がシフトを許可するか
 *
 * - Standard: 全て可
 * - NoEvening: 夜勤を含むシフトは不可（日種別を問わない）
 * - WeekendOnly: 平日シフトは不可
 */
bool role_permits(Role role, Shift shift);

/**
 * @brief 日付の日種別
 */
DayClass classify_day(Date day, bool is_holiday);

/**
 * @brief employee が day の shift に入れるか
 *
 * 判定順: 休み希望日 → 祝日免除 → 日種別の一致 → 役割の制限
 *
 * @param is_holiday day が祝日か
 * @param immunity_years 祝日免除期間（年）
 */
bool can_work(const Employee& employee, Date day, Shift shift,
              bool is_holiday, int immunity_years = 2);

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_ELIGIBILITY_HPP
