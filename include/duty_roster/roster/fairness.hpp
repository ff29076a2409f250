/**
 * @file fairness.hpp
 * @brief 公平性の目的関数（累計ポイントの最大と最小の差を最小化）
 */
#ifndef DUTY_ROSTER_ROSTER_FAIRNESS_HPP
#define DUTY_ROSTER_ROSTER_FAIRNESS_HPP

#include "duty_roster/model.hpp"
#include "duty_roster/roster/config.hpp"
#include "duty_roster/roster/employee.hpp"
#include "duty_roster/roster/roster_model.hpp"
#include <vector>

namespace duty_roster {

/**
 * @brief 目的関数を構成する補助変数
 *
 * total_e = ytd_points_e * scale + Σ weight(shift) * x  として
 * upper >= total_e, lower <= total_e, spread = upper - lower。
 * spread を最小化する。3変数とも defined var。
 */
struct FairnessObjective {
    VariablePtr upper;
    VariablePtr lower;
    VariablePtr spread;
};

/**
 * @brief 職員ごとの累計式と upper / lower / spread をモデルに追加
 */
FairnessObjective add_fairness_objective(Model& model,
                                         const std::vector<Employee>& employees,
                                         const AssignmentMap& assignments,
                                         const RosterConfig& config);

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_FAIRNESS_HPP
