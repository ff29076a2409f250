/**
 * @file carry_over.hpp
 * @brief 確定した当番表から次期の職員データを作る
 */
#ifndef DUTY_ROSTER_ROSTER_CARRY_OVER_HPP
#define DUTY_ROSTER_ROSTER_CARRY_OVER_HPP

#include "duty_roster/roster/employee.hpp"
#include "duty_roster/roster/roster_solver.hpp"
#include <string>
#include <vector>

namespace duty_roster {

/**
 * @brief 当番表の結果を職員データに反映
 *
 * ytd_points は total_points を四捨五入した値、last_special_date は
 * 当番表中で最も遅い祝日シフトの日付（なければ据え置き）。
 * 集計に現れない職員はそのまま返す。
 */
std::vector<Employee> apply_carry_over(const std::vector<Employee>& employees,
                                       const RosterOutcome& outcome);

/**
 * @brief "Available" または "Immune until YYYY-MM-DD"
 */
std::string immunity_status(const Employee& employee, Date today, int years = 2);

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_CARRY_OVER_HPP
