/**
 * @file constraint.hpp
 * @brief 制約基底クラスと全制約ヘッダのインクルード
 */
#ifndef DUTY_ROSTER_CONSTRAINT_HPP
#define DUTY_ROSTER_CONSTRAINT_HPP

#include "duty_roster/variable.hpp"
#include <vector>
#include <memory>
#include <string>
#include <optional>
#include <cstdint>

namespace duty_roster {

// Forward declaration
class Model;

/**
 * @brief 制約の基底クラス
 *
 * 伝播はキュー駆動。変数の境界が変わると、その変数を監視している
 * 制約が Model の伝播キューに積まれ、propagate() が呼ばれる。
 * propagate() は Model::set_min / set_max を通して境界を絞り込む。
 */
class Constraint {
public:
    virtual ~Constraint() = default;

    /**
     * @brief Model内のインデックスを取得
     */
    size_t model_index() const { return model_index_; }

    /**
     * @brief Model内のインデックスを設定（Model::add_constraint から呼び出される）
     */
    void set_model_index(size_t idx) { model_index_ = idx; }

    /**
     * @brief 制約の名前を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief 制約が関係する変数を取得
     */
    const std::vector<VariablePtr>& variables() const { return vars_; }

    /**
     * @brief 制約が満たされているか確認
     * @return 満たされていればtrue、違反していればfalse、
     *         未確定ならstd::nullopt
     */
    virtual std::optional<bool> is_satisfied() const = 0;

    /**
     * @brief 境界伝播を実行
     * @param model モデルへの参照
     * @param save_point バックトラック用セーブポイント
     * @return 伝播が成功すればtrue、矛盾（定義域が空）すればfalse
     */
    virtual bool propagate(Model& model, int save_point) = 0;

protected:
    Constraint() = default;

    // 制約に関与する変数
    std::vector<VariablePtr> vars_;

private:
    size_t model_index_ = SIZE_MAX;
};

using ConstraintPtr = std::shared_ptr<Constraint>;

} // namespace duty_roster

// 各制約グループのヘッダをインクルード
#include "duty_roster/constraints/linear.hpp"

#endif // DUTY_ROSTER_CONSTRAINT_HPP
