/**
 * @file variable.hpp
 * @brief CSP変数クラス
 */
#ifndef DUTY_ROSTER_VARIABLE_HPP
#define DUTY_ROSTER_VARIABLE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <memory>
#include <optional>

namespace duty_roster {

class Model;  // forward declaration

/**
 * @brief CSP変数を表すクラス
 *
 * 定義域は区間 [min, max]。Model に登録された後は、現在の境界を
 * Model の VarData から読む（探索中の値と常に一致する）。
 */
class Variable {
public:
    using value_type = int64_t;

    /**
     * @brief 変数を作成
     * @param name 変数名
     * @param min 下限
     * @param max 上限
     * @note 通常は Model::create_variable() を使用してください
     */
    Variable(std::string name, value_type min, value_type max);

    /**
     * @brief 変数のModel内IDを取得
     *
     * Model::create_variable() で設定される。
     * Model内のインデックスとして直接使用可能。
     */
    size_t id() const { return id_; }

    /**
     * @brief IDを設定（Modelから呼び出される）
     */
    void set_id(size_t id) { id_ = id; }

    /**
     * @brief 所属Modelを設定（Modelから呼び出される）
     */
    void set_model(Model* model) { model_ = model; }

    /**
     * @brief 変数名を取得
     */
    const std::string& name() const;

    /**
     * @brief 現在の下限
     */
    value_type min() const;

    /**
     * @brief 現在の上限
     */
    value_type max() const;

    /**
     * @brief 値が割り当てられているか
     */
    bool is_assigned() const { return min() == max(); }

    /**
     * @brief 割り当てられた値を取得
     */
    std::optional<value_type> assigned_value() const {
        if (is_assigned()) {
            return min();
        }
        return std::nullopt;
    }

private:
    Model* model_ = nullptr;
    size_t id_ = SIZE_MAX;
    std::string name_;
    value_type initial_min_;
    value_type initial_max_;
};

using VariablePtr = std::shared_ptr<Variable>;

} // namespace duty_roster

#endif // DUTY_ROSTER_VARIABLE_HPP
