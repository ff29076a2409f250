#include "duty_roster/solver.hpp"
#include <algorithm>
#include <limits>
#include <iostream>

namespace duty_roster {

namespace {
// 時計の確認間隔（ノード数）
constexpr size_t kBudgetCheckInterval = 64;
}  // namespace

void Solver::start(Model& model) {
    model.build_constraint_watch_list();
    current_decision_ = 0;
    stats_ = SolverStats{};
    timed_out_ = false;
    if (time_limit_seconds_ > 0.0) {
        auto limit = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(time_limit_seconds_));
        deadline_ = std::chrono::steady_clock::now() + limit;
    } else {
        deadline_.reset();
    }
}

std::optional<Solution> Solver::solve(Model& model) {
    start(model);
    std::optional<Solution> result;

    if (!presolve(model)) {
        return std::nullopt;  // UNSAT
    }

    run_search(model, 0,
               [&result](const Solution& sol) {
                   result = sol;
                   return false;  // 最初の解で停止
               }, false);

    if (verbose_) {
        std::cerr << "% [verbose] search done: nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count << "\n";
    }
    return result;
}

size_t Solver::solve_all(Model& model, SolutionCallback callback) {
    start(model);

    if (!presolve(model)) {
        return 0;  // UNSAT
    }

    size_t count = 0;
    run_search(model, 0,
               [&count, &callback](const Solution& sol) {
                   count++;
                   return callback(sol);  // trueなら継続
               }, true);
    return count;
}

OptimizeResult Solver::minimize(Model& model, const VariablePtr& objective) {
    start(model);
    OptimizeResult result;

    objective_idx_ = objective->id();
    best_objective_.reset();

    if (!presolve(model)) {
        objective_idx_ = SIZE_MAX;
        result.status = SolveStatus::Infeasible;
        return result;
    }

    const std::string& objective_name = objective->name();
    run_search(model, 0,
               [this, &result, &objective_name](const Solution& sol) {
                   best_objective_ = sol.at(objective_name);
                   result.solution = sol;
                   result.objective = best_objective_;
                   if (verbose_) {
                       std::cerr << "% [verbose] improving solution: objective="
                                 << *best_objective_
                                 << " nodes=" << stats_.node_count << "\n";
                   }
                   return true;  // 上界を締めて探索を継続
               }, true);

    objective_idx_ = SIZE_MAX;

    bool interrupted = stopped_ || timed_out_;
    if (result.solution) {
        result.status = interrupted ? SolveStatus::Feasible : SolveStatus::Optimal;
    } else {
        result.status = interrupted ? SolveStatus::Unknown : SolveStatus::Infeasible;
    }

    if (verbose_) {
        std::cerr << "% [verbose] minimize done: nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count
                  << " solutions=" << stats_.solution_count
                  << (timed_out_ ? " (time limit)" : stopped_ ? " (stopped)" : "") << "\n";
    }
    return result;
}

SearchResult Solver::run_search(Model& model, size_t depth,
                                const SolutionCallback& callback, bool find_all) {
    // タイムアウトチェック
    if (!check_budget()) {
        return SearchResult::UNKNOWN;
    }

    // 統計更新
    stats_.node_count++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    if (!apply_objective_bound(model)) {
        stats_.fail_count++;
        return SearchResult::UNSAT;
    }

    size_t var_idx = select_variable(model);

    // 全変数が確定
    if (var_idx == SIZE_MAX) {
        if (!verify_solution(model)) {
            stats_.fail_count++;
            return SearchResult::UNSAT;
        }
        stats_.solution_count++;
        if (!callback(build_solution(model))) {
            return SearchResult::SAT;
        }
        return find_all ? SearchResult::UNSAT : SearchResult::SAT;
    }

    int save_point = current_decision_;
    value_type val = select_value(model, var_idx);
    bool val_is_min = (val == model.var_min(var_idx));

    // 分岐0: x = val、分岐1: x != val
    for (int branch = 0; branch < 2; ++branch) {
        current_decision_++;

        bool ok;
        if (branch == 0) {
            ok = model.instantiate(current_decision_, var_idx, val);
        } else if (val_is_min) {
            ok = model.set_min(current_decision_, var_idx, val + 1);
        } else {
            ok = model.set_max(current_decision_, var_idx, val - 1);
        }

        if (ok && process_queue(model)) {
            auto res = run_search(model, depth + 1, callback, find_all);
            if (res != SearchResult::UNSAT) {
                current_decision_--;
                backtrack(model, save_point);
                return res;
            }
        } else {
            // 伝播失敗時はキューに残りがある可能性があるのでクリア
            model.clear_pending_updates();
            stats_.fail_count++;
        }

        current_decision_--;
        backtrack(model, save_point);
    }

    return SearchResult::UNSAT;
}

bool Solver::presolve(Model& model) {
    if (verbose_) {
        std::cerr << "% [verbose] presolve start: " << model.constraints().size()
                  << " constraints, " << model.variables().size() << " variables\n";
    }

    model.enqueue_all_constraints();
    bool ok = process_queue(model);

    if (verbose_) {
        std::cerr << (ok ? "% [verbose] presolve done\n" : "% [verbose] presolve failed\n");
    }
    return ok;
}

bool Solver::process_queue(Model& model) {
    const auto& constraints = model.constraints();
    while (model.has_pending_updates()) {
        size_t c_idx = model.pop_pending_constraint();
        if (!constraints[c_idx]->propagate(model, current_decision_)) {
            model.clear_pending_updates();
            return false;
        }
    }
    return true;
}

bool Solver::apply_objective_bound(Model& model) {
    if (objective_idx_ == SIZE_MAX || !best_objective_) {
        return true;
    }
    if (!model.set_max(current_decision_, objective_idx_, *best_objective_ - 1)) {
        return false;
    }
    return process_queue(model);
}

void Solver::backtrack(Model& model, int save_point) {
    model.rewind_to(save_point);
}

bool Solver::check_budget() {
    if (stopped_ || timed_out_) {
        return false;
    }
    if (deadline_ && stats_.node_count % kBudgetCheckInterval == 0 &&
        std::chrono::steady_clock::now() >= *deadline_) {
        if (verbose_) {
            std::cerr << "% [verbose] time limit reached\n";
        }
        timed_out_ = true;
        return false;
    }
    return true;
}

Solution Solver::build_solution(const Model& model) const {
    Solution sol;
    const auto& variables = model.variables();
    for (size_t i = 0; i < variables.size(); ++i) {
        if (model.is_instantiated(i)) {
            sol[variables[i]->name()] = model.value(i);
        }
    }
    return sol;
}

bool Solver::verify_solution(const Model& model) const {
    for (const auto& constraint : model.constraints()) {
        auto satisfied = constraint->is_satisfied();
        if (satisfied.has_value() && !satisfied.value()) {
            return false;
        }
    }
    return true;
}

size_t Solver::select_variable(const Model& model) const {
    size_t n = model.variables().size();

    // 非 defined var: MRV、同点はインデックス順
    size_t best_idx = SIZE_MAX;
    uint64_t min_domain_size = std::numeric_limits<uint64_t>::max();
    for (size_t i = 0; i < n; ++i) {
        if (model.is_instantiated(i) || model.is_defined_var(i)) continue;
        uint64_t size = model.var_size(i);
        if (size < min_domain_size) {
            min_domain_size = size;
            best_idx = i;
            if (size == 2) break;  // これより小さい未確定ドメインはない
        }
    }
    if (best_idx != SIZE_MAX) {
        return best_idx;
    }

    // defined var: 目的変数を先に
    if (objective_idx_ != SIZE_MAX && !model.is_instantiated(objective_idx_)) {
        return objective_idx_;
    }
    for (size_t i = 0; i < n; ++i) {
        if (!model.is_instantiated(i)) {
            return i;
        }
    }
    return SIZE_MAX;
}

Solver::value_type Solver::select_value(const Model& model, size_t var_idx) const {
    value_type lo = model.var_min(var_idx);
    value_type hi = model.var_max(var_idx);

    if (!model.is_defined_var(var_idx)) {
        auto it = hint_.find(var_idx);
        if (it != hint_.end() && (it->second == lo || it->second == hi)) {
            return it->second;
        }
    }
    return lo;
}

void Solver::set_hint_solution(const Solution& hint, const Model& model) {
    hint_.clear();
    for (const auto& [name, value] : hint) {
        size_t idx = model.find_variable_index(name);
        if (idx != SIZE_MAX) {
            hint_[idx] = value;
        }
    }
}

} // namespace duty_roster
