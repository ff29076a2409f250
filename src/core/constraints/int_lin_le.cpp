#include "duty_roster/constraints/linear.hpp"
#include "duty_roster/model.hpp"

namespace duty_roster {

// ============================================================================
// IntLinLeConstraint implementation
// ============================================================================

IntLinLeConstraint::IntLinLeConstraint(std::vector<int64_t> coeffs,
                                       std::vector<VariablePtr> vars,
                                       int64_t bound)
    : LinearConstraint(coeffs, vars, bound) {}

std::string IntLinLeConstraint::name() const {
    return "int_lin_le";
}

std::optional<bool> IntLinLeConstraint::is_satisfied() const {
    auto sum = assigned_sum();
    if (!sum) {
        return std::nullopt;
    }
    return *sum <= bound_;
}

bool IntLinLeConstraint::propagate(Model& model, int save_point) {
    // 全ての係数が0の場合: 0 <= bound
    if (vars_.empty()) {
        return bound_ >= 0;
    }
    return propagate_upper(model, save_point);
}

}  // namespace duty_roster
