/**
 * @file solver.hpp
 * @brief CSPソルバークラス（境界伝播 + 深さ優先探索、branch-and-bound、時間制限）
 */
#ifndef DUTY_ROSTER_SOLVER_HPP
#define DUTY_ROSTER_SOLVER_HPP

#include "duty_roster/model.hpp"
#include <functional>
#include <map>
#include <unordered_map>
#include <atomic>
#include <chrono>
#include <optional>

namespace duty_roster {

/**
 * @brief 解を表す型
 */
using Solution = std::map<std::string, Variable::value_type>;

/**
 * @brief 解のコールバック関数型
 * @return trueを返すと探索を継続、falseで停止
 */
using SolutionCallback = std::function<bool(const Solution&)>;

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT,    // 解が存在しない
    UNKNOWN   // 不明（時間切れ・停止）
};

/**
 * @brief 最適化の終了状態
 */
enum class SolveStatus {
    Optimal,     // 探索を完了し、最良解を得た
    Feasible,    // 時間切れ。解はあるが最適性は未証明
    Infeasible,  // 探索を完了し、解が存在しない
    Unknown      // 時間切れ。解が見つからなかった
};

/**
 * @brief minimize() の結果
 */
struct OptimizeResult {
    SolveStatus status = SolveStatus::Unknown;
    std::optional<Solution> solution;
    std::optional<Variable::value_type> objective;
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;
    size_t fail_count = 0;
    size_t solution_count = 0;
    size_t max_depth = 0;
};

/**
 * @brief CSPソルバー
 *
 * - presolve: 全制約をキューに積んで固定点まで伝播
 * - 変数選択: 非 defined var を MRV（同点はインデックス順）、その後 defined var
 * - 分岐: x = v / x != v の二分岐（v は常に境界値なので区間で表せる）
 * - 値選択: ヒント解があればその値、なければ下限
 */
class Solver {
public:
    using value_type = Variable::value_type;

    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param model 解くモデル
     * @return 解が見つかればその解、なければstd::nullopt
     */
    std::optional<Solution> solve(Model& model);

    /**
     * @brief 全ての解を探索
     * @param model 解くモデル
     * @param callback 解が見つかるたびに呼ばれるコールバック
     * @return 見つかった解の数
     */
    size_t solve_all(Model& model, SolutionCallback callback);

    /**
     * @brief 目的変数を最小化（branch-and-bound）
     *
     * 解が見つかるたびに「目的変数 <= 最良値 - 1」を以降の全ノードで課す。
     * 探索後のモデルは根の境界が締められた状態になるため再利用しないこと。
     *
     * @param model 解くモデル
     * @param objective 目的変数（model に登録済み）
     */
    OptimizeResult minimize(Model& model, const VariablePtr& objective);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief ヒント解を設定（値選択の優先度に使用）
     * @param hint 変数名 -> 値のマップ
     * @param model 変数名からインデックスを解決するためのモデル
     */
    void set_hint_solution(const Solution& hint, const Model& model);

    /**
     * @brief 探索の制限時間（秒）。0以下なら無制限
     */
    void set_time_limit(double seconds) { time_limit_seconds_ = seconds; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認（時間切れでも立つ）
     */
    bool is_stopped() const { return stopped_ || timed_out_; }

    /**
     * @brief 直前の探索が制限時間で打ち切られたか（探索開始ごとにリセット）
     */
    bool timed_out() const { return timed_out_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    // ===== 探索 =====

    /**
     * @brief 再帰探索
     * @param find_all trueなら全解探索モード（コールバックがtrueを返す限り継続）
     */
    SearchResult run_search(Model& model, size_t depth,
                            const SolutionCallback& callback, bool find_all);

    /**
     * @brief 探索開始前の初期化
     */
    void start(Model& model);

    /**
     * @brief presolve（探索前の初期伝播）
     * @return 伝播成功ならtrue、矛盾が検出されたらfalse
     */
    bool presolve(Model& model);

    /**
     * @brief 伝播キューを固定点まで処理
     */
    bool process_queue(Model& model);

    /**
     * @brief branch-and-bound の上界を現在のノードに課す
     */
    bool apply_objective_bound(Model& model);

    /**
     * @brief バックトラック
     */
    void backtrack(Model& model, int save_point);

    /**
     * @brief 時間制限・停止フラグを確認
     * @return 探索を続けてよければtrue
     */
    bool check_budget();

    Solution build_solution(const Model& model) const;
    bool verify_solution(const Model& model) const;

    /**
     * @brief 次に分岐する変数を選択
     * @return 全変数が確定していれば SIZE_MAX
     */
    size_t select_variable(const Model& model) const;

    /**
     * @brief 最初に試す値を選択（必ず現在の境界値）
     */
    value_type select_value(const Model& model, size_t var_idx) const;

    // ===== メンバ変数 =====

    std::atomic<bool> stopped_{false};
    bool timed_out_ = false;
    bool verbose_ = false;

    int current_decision_ = 0;
    std::unordered_map<size_t, value_type> hint_;

    double time_limit_seconds_ = 0.0;
    std::optional<std::chrono::steady_clock::time_point> deadline_;

    // branch-and-bound
    size_t objective_idx_ = SIZE_MAX;
    std::optional<value_type> best_objective_;

    SolverStats stats_;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_SOLVER_HPP
