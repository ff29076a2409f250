/**
 * @file roster_solver.hpp
 * @brief 当番表の作成（モデル構築 → 最適化 → 射影）
 */
#ifndef DUTY_ROSTER_ROSTER_ROSTER_SOLVER_HPP
#define DUTY_ROSTER_ROSTER_ROSTER_SOLVER_HPP

#include "duty_roster/solver.hpp"
#include "duty_roster/roster/config.hpp"
#include "duty_roster/roster/employee.hpp"
#include "duty_roster/roster/result.hpp"
#include <set>
#include <string>
#include <vector>

namespace duty_roster {

/**
 * @brief 当番表作成の終了状態
 */
enum class RosterStatus {
    Optimal,      // 公平性が最適
    Feasible,     // 時間切れ。公平性は最良だが未証明
    CoverageGap,  // 候補0人の枠があり、ソルバーを呼ばずに終了
    Infeasible,   // 休養・希望・重複の制約を同時に満たせない
    Timeout       // 時間内に解が見つからなかった
};

std::string roster_status_name(RosterStatus status);

/**
 * @brief 当番表作成の結果
 *
 * 成功時は errors が空、失敗時は roster / summary が空（部分的な当番表は返さない）。
 */
struct RosterOutcome {
    RosterStatus status = RosterStatus::Infeasible;
    std::vector<RosterRow> roster;
    std::vector<SummaryRow> summary;
    std::vector<std::string> errors;

    bool ok() const {
        return status == RosterStatus::Optimal || status == RosterStatus::Feasible;
    }
};

/**
 * @brief ソルバーが解を見つけられなかった場合のメッセージ
 */
extern const char* const kConstraintsTooTightMessage;

/**
 * @brief 1回分の当番表作成
 *
 * 入力は呼び出しごとに不変。変数・制約は solve() のたびに新しく作られる。
 */
class RosterSolver {
public:
    /**
     * @throws std::invalid_argument 職員名が空・重複、YTD が負、または日付が重複している場合
     */
    RosterSolver(std::vector<Employee> employees,
                 std::vector<Date> dates,
                 std::set<Date> holidays,
                 RosterConfig config = RosterConfig{});

    RosterOutcome solve();

    /**
     * @brief 実行中の solve() を打ち切る（シグナルハンドラから呼び出し可能）
     */
    void stop() { solver_.stop(); }

    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 次回以降の solve() の制限時間（秒）
     */
    void set_time_limit(double seconds) { config_.time_limit_seconds = seconds; }

    /**
     * @brief 直近の solve() のソルバー統計
     */
    const SolverStats& stats() const { return solver_.stats(); }

    const std::vector<Employee>& employees() const { return employees_; }
    const RosterConfig& config() const { return config_; }

private:
    std::vector<Employee> employees_;
    std::vector<Date> dates_;
    std::set<Date> holidays_;
    RosterConfig config_;
    Solver solver_;
    bool verbose_ = false;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_ROSTER_SOLVER_HPP
