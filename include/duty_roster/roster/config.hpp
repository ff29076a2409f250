/**
 * @file config.hpp
 * @brief 当番表ソルバーの設定
 */
#ifndef DUTY_ROSTER_ROSTER_CONFIG_HPP
#define DUTY_ROSTER_ROSTER_CONFIG_HPP

#include "duty_roster/roster/shift.hpp"
#include <cstdint>

namespace duty_roster {

/**
 * @brief 当番表ソルバーの設定
 *
 * ポイントは point_scale 倍の整数で扱う（既定 10 倍、0.5 点単位まで表現できる）。
 * 重みも同じスケールで指定する。
 */
struct RosterConfig {
    ShiftScheme scheme = ShiftScheme::Split;

    // Split 方式で平日午前も埋めるか
    bool cover_weekday_morning = false;

    // 祝日勤務後の免除期間（年）
    int immunity_years = 2;

    // ソルバーの制限時間（秒）
    double time_limit_seconds = 10.0;

    int64_t point_scale = 10;
    int64_t weekday_weight = 10;
    int64_t weekend_weight = 15;
    int64_t holiday_weight = 15;

    /**
     * @brief シフトの重み（スケール済み）
     */
    int64_t weight(Shift shift) const {
        switch (shift_class(shift)) {
            case DayClass::Weekday: return weekday_weight;
            case DayClass::Weekend: return weekend_weight;
            case DayClass::Holiday: return holiday_weight;
        }
        return weekday_weight;
    }
};

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_CONFIG_HPP
