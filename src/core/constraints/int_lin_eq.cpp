#include "duty_roster/constraints/linear.hpp"
#include "duty_roster/model.hpp"

namespace duty_roster {

// ============================================================================
// IntLinEqConstraint implementation
// ============================================================================

IntLinEqConstraint::IntLinEqConstraint(std::vector<int64_t> coeffs,
                                       std::vector<VariablePtr> vars,
                                       int64_t bound)
    : LinearConstraint(coeffs, vars, bound) {}

std::string IntLinEqConstraint::name() const {
    return "int_lin_eq";
}

std::optional<bool> IntLinEqConstraint::is_satisfied() const {
    auto sum = assigned_sum();
    if (!sum) {
        return std::nullopt;
    }
    return *sum == bound_;
}

bool IntLinEqConstraint::propagate(Model& model, int save_point) {
    if (vars_.empty()) {
        return bound_ == 0;
    }
    // 上側の絞り込みで max 側が変わるので、下側は改めて計算する
    if (!propagate_upper(model, save_point)) {
        return false;
    }
    return propagate_lower(model, save_point);
}

}  // namespace duty_roster
