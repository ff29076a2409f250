/**
 * @file roster_model.hpp
 * @brief 当番表の CSP モデル構築（決定変数とハード制約）
 */
#ifndef DUTY_ROSTER_ROSTER_ROSTER_MODEL_HPP
#define DUTY_ROSTER_ROSTER_ROSTER_MODEL_HPP

#include "duty_roster/model.hpp"
#include "duty_roster/solver.hpp"
#include "duty_roster/roster/calendar.hpp"
#include "duty_roster/roster/config.hpp"
#include "duty_roster/roster/employee.hpp"
#include <map>
#include <string>
#include <vector>

namespace duty_roster {

/**
 * @brief 割当変数のキー（日付 → シフト → 職員の順で整列）
 */
struct AssignmentKey {
    Date date;
    Shift shift;
    size_t employee;  // employees 内のインデックス

    bool operator<(const AssignmentKey& other) const {
        if (date != other.date) return date < other.date;
        if (shift != other.shift) return shift < other.shift;
        return employee < other.employee;
    }
};

/**
 * @brief (日付, シフト, 職員) -> 0/1 変数。勤務不可の組は存在しない
 */
using AssignmentMap = std::map<AssignmentKey, VariablePtr>;

/**
 * @brief 誰も入れない枠
 */
struct CoverageGap {
    Date date;
    Shift shift;

    std::string message() const;
};

/**
 * @brief 当番表モデルの構築
 *
 * create_variables() を最初に呼び、以降の制約はその変数集合の上に張る。
 */
class RosterModelBuilder {
public:
    /**
     * @note 引数はすべて builder より長く生存すること
     */
    RosterModelBuilder(Model& model,
                       const std::vector<Employee>& employees,
                       const std::vector<Date>& dates,
                       const Calendar& calendar,
                       const RosterConfig& config);

    /**
     * @brief 勤務可能な (日付, シフト, 職員) ごとに 0/1 変数を作る
     */
    void create_variables();

    /**
     * @brief 各枠にちょうど1人
     * @return 候補が0人の枠（全て列挙）。空でなければモデルは解なし
     */
    std::vector<CoverageGap> add_coverage_constraints();

    /**
     * @brief 職員ごと・日ごとに高々1シフト
     */
    void add_one_shift_per_day_constraints();

    /**
     * @brief 夜勤の翌日（日付リスト上の次の日）は勤務なし
     */
    void add_rest_constraints();

    /**
     * @brief 祝日の枠に希望者がいれば、希望者の誰か1人が入る
     */
    void add_holiday_bid_constraints();

    /**
     * @brief 探索の値選択に使う貪欲割当
     *
     * 日付順に各枠を、その日まだ勤務がなく前日夜勤明けでもない候補のうち
     * 累計ポイントが最小の職員（同点は入力順）に割り当てる。
     */
    Solution greedy_hint() const;

    const AssignmentMap& assignments() const { return assignments_; }

    /**
     * @brief 職員 employee の day の全変数
     */
    std::vector<VariablePtr> day_variables(size_t employee, Date day) const;

private:
    std::vector<VariablePtr> slot_variables(Date day, Shift shift) const;

    Model& model_;
    const std::vector<Employee>& employees_;
    const std::vector<Date>& dates_;
    const Calendar& calendar_;
    const RosterConfig& config_;

    AssignmentMap assignments_;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_ROSTER_MODEL_HPP
