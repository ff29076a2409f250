/**
 * @file linear.hpp
 * @brief 線形制約クラス (int_lin_le, int_lin_eq)
 */
#ifndef DUTY_ROSTER_CONSTRAINTS_LINEAR_HPP
#define DUTY_ROSTER_CONSTRAINTS_LINEAR_HPP

#include "duty_roster/constraint.hpp"
#include <cstdint>
#include <vector>

namespace duty_roster {

/**
 * @brief 線形制約の共通部分
 *
 * 同一変数の係数を集約し、係数0の変数を除外した (coeffs_, vars_) を保持する。
 */
class LinearConstraint : public Constraint {
public:
    const std::vector<int64_t>& coefficients() const { return coeffs_; }

protected:
    LinearConstraint(const std::vector<int64_t>& coeffs,
                     const std::vector<VariablePtr>& vars,
                     int64_t bound);

    /**
     * @brief Σ c_i x_i の現在の下限
     */
    int64_t min_activity(const Model& model) const;

    /**
     * @brief Σ c_i x_i の現在の上限
     */
    int64_t max_activity(const Model& model) const;

    /**
     * @brief 全変数確定時の和
     * @return 未確定の変数があれば std::nullopt
     */
    std::optional<int64_t> assigned_sum() const;

    /**
     * @brief Σ c_i x_i <= bound_ 方向の境界伝播
     */
    bool propagate_upper(Model& model, int save_point);

    /**
     * @brief Σ c_i x_i >= bound_ 方向の境界伝播
     */
    bool propagate_lower(Model& model, int save_point);

    std::vector<int64_t> coeffs_;
    int64_t bound_;
};

/**
 * @brief int_lin_le制約: Σ c_i x_i <= bound
 */
class IntLinLeConstraint : public LinearConstraint {
public:
    IntLinLeConstraint(std::vector<int64_t> coeffs,
                       std::vector<VariablePtr> vars,
                       int64_t bound);

    std::string name() const override;
    std::optional<bool> is_satisfied() const override;
    bool propagate(Model& model, int save_point) override;
};

/**
 * @brief int_lin_eq制約: Σ c_i x_i == bound
 *
 * 両方向の境界伝播を行う。0/1 変数の和 == 1 では、1 つが 1 に
 * 確定すると残りは 0 に、残り1変数になるとその変数が 1 に確定する。
 */
class IntLinEqConstraint : public LinearConstraint {
public:
    IntLinEqConstraint(std::vector<int64_t> coeffs,
                       std::vector<VariablePtr> vars,
                       int64_t bound);

    std::string name() const override;
    std::optional<bool> is_satisfied() const override;
    bool propagate(Model& model, int save_point) override;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_CONSTRAINTS_LINEAR_HPP
