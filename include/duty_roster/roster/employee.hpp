/**
 * @file employee.hpp
 * @brief 職員レコードと役割
 */
#ifndef DUTY_ROSTER_ROSTER_EMPLOYEE_HPP
#define DUTY_ROSTER_ROSTER_EMPLOYEE_HPP

#include "duty_roster/roster/date.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace duty_roster {

/**
 * @brief 役割（閉じた集合。制限は role_permits() で定義）
 */
enum class Role {
    Standard,
    NoEvening,
    WeekendOnly
};

/**
 * @brief 表示・出力用の役割名（"Standard", "No-PM", "Weekend-Only"）
 */
std::string role_name(Role role);

/**
 * @brief 役割名を解析（"No-PM" と "No-Evening" はどちらも NoEvening）
 */
std::optional<Role> parse_role(const std::string& text);

/**
 * @brief 職員
 */
struct Employee {
    std::string name;
    std::string team;
    Role role = Role::Standard;
    int64_t ytd_points = 0;
    std::set<Date> blackouts;
    std::set<Date> holiday_bids;
    std::optional<Date> last_special_date;

    /**
     * @brief 祝日免除の終了日（この日から再び祝日勤務可）
     * @return 祝日勤務歴がなければ std::nullopt
     */
    std::optional<Date> immunity_end(int years = 2) const;

    /**
     * @brief day の時点で祝日勤務を免除されているか
     */
    bool is_immune(Date day, int years = 2) const;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_EMPLOYEE_HPP
