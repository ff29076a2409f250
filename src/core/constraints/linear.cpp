#include "duty_roster/constraints/linear.hpp"
#include "duty_roster/model.hpp"
#include <unordered_map>
#include <stdexcept>

namespace duty_roster {

namespace {

// 負の被除数でも数学的な floor / ceil を返す整数除算
int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

int64_t ceil_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) == (b < 0))) {
        ++q;
    }
    return q;
}

}  // namespace

// ============================================================================
// LinearConstraint implementation
// ============================================================================

LinearConstraint::LinearConstraint(const std::vector<int64_t>& coeffs,
                                   const std::vector<VariablePtr>& vars,
                                   int64_t bound)
    : bound_(bound) {
    if (coeffs.size() != vars.size()) {
        throw std::invalid_argument("linear constraint: coefficient/variable count mismatch");
    }

    // 同一変数の係数を集約（出現順を保つ）
    std::unordered_map<Variable*, size_t> position;
    std::vector<int64_t> aggregated;
    std::vector<VariablePtr> unique_vars;
    for (size_t i = 0; i < vars.size(); ++i) {
        auto it = position.find(vars[i].get());
        if (it == position.end()) {
            position[vars[i].get()] = unique_vars.size();
            unique_vars.push_back(vars[i]);
            aggregated.push_back(coeffs[i]);
        } else {
            aggregated[it->second] += coeffs[i];
        }
    }

    // 係数が0の変数は除外
    for (size_t i = 0; i < unique_vars.size(); ++i) {
        if (aggregated[i] == 0) continue;
        vars_.push_back(unique_vars[i]);
        coeffs_.push_back(aggregated[i]);
    }
}

int64_t LinearConstraint::min_activity(const Model& model) const {
    int64_t sum = 0;
    for (size_t i = 0; i < vars_.size(); ++i) {
        size_t idx = vars_[i]->id();
        int64_t c = coeffs_[i];
        sum += c >= 0 ? c * model.var_min(idx) : c * model.var_max(idx);
    }
    return sum;
}

int64_t LinearConstraint::max_activity(const Model& model) const {
    int64_t sum = 0;
    for (size_t i = 0; i < vars_.size(); ++i) {
        size_t idx = vars_[i]->id();
        int64_t c = coeffs_[i];
        sum += c >= 0 ? c * model.var_max(idx) : c * model.var_min(idx);
    }
    return sum;
}

std::optional<int64_t> LinearConstraint::assigned_sum() const {
    int64_t sum = 0;
    for (size_t i = 0; i < vars_.size(); ++i) {
        auto value = vars_[i]->assigned_value();
        if (!value) {
            return std::nullopt;
        }
        sum += coeffs_[i] * *value;
    }
    return sum;
}

bool LinearConstraint::propagate_upper(Model& model, int save_point) {
    int64_t min_sum = min_activity(model);
    if (min_sum > bound_) {
        return false;
    }

    // 各変数について: c_i * x_i <= bound - (min_sum - 自分の最小寄与)
    for (size_t i = 0; i < vars_.size(); ++i) {
        size_t idx = vars_[i]->id();
        int64_t c = coeffs_[i];
        int64_t own_min = c >= 0 ? c * model.var_min(idx) : c * model.var_max(idx);
        int64_t slack = bound_ - (min_sum - own_min);

        if (c > 0) {
            if (!model.set_max(save_point, idx, floor_div(slack, c))) {
                return false;
            }
        } else {
            if (!model.set_min(save_point, idx, ceil_div(slack, c))) {
                return false;
            }
        }
    }
    return true;
}

bool LinearConstraint::propagate_lower(Model& model, int save_point) {
    int64_t max_sum = max_activity(model);
    if (max_sum < bound_) {
        return false;
    }

    // 各変数について: c_i * x_i >= bound - (max_sum - 自分の最大寄与)
    for (size_t i = 0; i < vars_.size(); ++i) {
        size_t idx = vars_[i]->id();
        int64_t c = coeffs_[i];
        int64_t own_max = c >= 0 ? c * model.var_max(idx) : c * model.var_min(idx);
        int64_t need = bound_ - (max_sum - own_max);

        if (c > 0) {
            if (!model.set_min(save_point, idx, ceil_div(need, c))) {
                return false;
            }
        } else {
            if (!model.set_max(save_point, idx, floor_div(need, c))) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace duty_roster
