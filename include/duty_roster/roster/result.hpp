/**
 * @file result.hpp
 * @brief 当番表・ポイント集計の出力行と、解からの射影
 */
#ifndef DUTY_ROSTER_ROSTER_RESULT_HPP
#define DUTY_ROSTER_ROSTER_RESULT_HPP

#include "duty_roster/solver.hpp"
#include "duty_roster/roster/config.hpp"
#include "duty_roster/roster/employee.hpp"
#include "duty_roster/roster/roster_model.hpp"
#include <string>
#include <vector>

namespace duty_roster {

/**
 * @brief 当番表の1行
 */
struct RosterRow {
    Date date;
    std::string day_name;
    std::string employee;
    Shift shift;
};

/**
 * @brief ポイント集計の1行
 */
struct SummaryRow {
    std::string employee;
    int64_t starting_points = 0;
    double points_earned = 0.0;
    double total_points = 0.0;
};

/**
 * @brief 射影結果
 */
struct ProjectedRoster {
    std::vector<RosterRow> roster;
    std::vector<SummaryRow> summary;
};

/**
 * @brief 解で 1 になった割当変数を当番表に、職員ごとの重み和を集計に変換
 *
 * 当番表は AssignmentMap の順（日付 → シフト → 職員）、集計は employees の順。
 */
ProjectedRoster project_result(const std::vector<Employee>& employees,
                               const AssignmentMap& assignments,
                               const Solution& solution,
                               const RosterConfig& config);

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_RESULT_HPP
