/**
 * @file shift.hpp
 * @brief 勤務枠（シフト）と日種別
 */
#ifndef DUTY_ROSTER_ROSTER_SHIFT_HPP
#define DUTY_ROSTER_ROSTER_SHIFT_HPP

#include <string>

namespace duty_roster {

/**
 * @brief 日種別（祝日 > 週末 > 平日 の優先順で判定）
 */
enum class DayClass {
    Weekday,
    Weekend,
    Holiday
};

/**
 * @brief シフト粒度の方式
 */
enum class ShiftScheme {
    Split,   // 午前 / 午後
    FullDay  // 平日夜のみ / 終日
};

/**
 * @brief 勤務枠
 *
 * Split 方式: WeekdayAm ... HolidayPm
 * FullDay 方式: WeekdayPmOnly, WeekendFull, HolidayFull
 */
enum class Shift {
    WeekdayAm,
    WeekdayPm,
    WeekendAm,
    WeekendPm,
    HolidayAm,
    HolidayPm,
    WeekdayPmOnly,
    WeekendFull,
    HolidayFull
};

/**
 * @brief シフトの日種別
 */
DayClass shift_class(Shift shift);

/**
 * @brief 夜勤を含むシフトか（翌日休養ルール・No-Evening の対象）
 *
 * 終日シフトは夜を含むので true。
 */
bool is_evening_shift(Shift shift);

/**
 * @brief 出力用の識別子（"WEEKDAY_PM" など）
 */
std::string shift_name(Shift shift);

std::string day_class_name(DayClass day_class);

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_SHIFT_HPP
