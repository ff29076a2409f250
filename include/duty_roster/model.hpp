/**
 * @file model.hpp
 * @brief CSPモデルクラス（変数・制約管理、集中Trail、伝播キュー）
 */
#ifndef DUTY_ROSTER_MODEL_HPP
#define DUTY_ROSTER_MODEL_HPP

#include "duty_roster/var_data.hpp"
#include "duty_roster/variable.hpp"
#include "duty_roster/constraint.hpp"
#include <vector>
#include <map>
#include <string>
#include <cstdint>

namespace duty_roster {

/**
 * @brief CSPモデル
 *
 * 変数と制約を管理し、AoS形式（VarData）で変数の境界を保持する。
 * 境界の変更はすべてセーブポイント付きで Trail に記録され、
 * rewind_to() で巻き戻せる。
 */
class Model {
public:
    using value_type = Variable::value_type;

    Model() = default;
    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    // ===== 変数・制約管理 =====

    /**
     * @brief 区間ドメインの変数を作成して登録
     * @param name 変数名（モデル内で一意）
     * @param min 下限
     * @param max 上限
     * @return 作成された変数へのポインタ
     */
    VariablePtr create_variable(std::string name, value_type min, value_type max);

    /**
     * @brief 単一値（定数）変数を作成して登録
     */
    VariablePtr create_variable(std::string name, value_type value);

    /**
     * @brief 0/1 変数を作成して登録
     */
    VariablePtr create_bool_variable(std::string name);

    /**
     * @brief 変数を追加（既存の変数を登録する場合）
     * @return 変数のID（インデックス）
     * @throws std::invalid_argument 同名の変数が既にある場合
     */
    size_t add_variable(VariablePtr var);

    /**
     * @brief 制約を追加
     */
    void add_constraint(ConstraintPtr constraint);

    const std::vector<VariablePtr>& variables() const { return variables_; }
    const std::vector<ConstraintPtr>& constraints() const { return constraints_; }

    /**
     * @brief IDで変数を取得
     * @throws std::out_of_range
     */
    VariablePtr variable(size_t id) const;

    /**
     * @brief 名前で変数を取得
     * @throws std::out_of_range
     */
    VariablePtr variable(const std::string& name) const;

    /**
     * @brief 名前から変数インデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_variable_index(const std::string& name) const;

    // ===== 変数データアクセス =====

    value_type var_min(size_t var_idx) const { return var_data_[var_idx].min; }
    value_type var_max(size_t var_idx) const { return var_data_[var_idx].max; }

    /**
     * @brief 変数のドメインサイズ（区間の幅 + 1）
     */
    uint64_t var_size(size_t var_idx) const {
        return static_cast<uint64_t>(var_data_[var_idx].max - var_data_[var_idx].min) + 1;
    }

    bool is_instantiated(size_t var_idx) const { return var_data_[var_idx].min == var_data_[var_idx].max; }

    /**
     * @brief 変数の値を取得（固定されている場合）
     */
    value_type value(size_t var_idx) const { return var_data_[var_idx].min; }

    /**
     * @brief 変数が is_defined_var か
     *
     * defined var は他の変数から値が決まる補助変数で、探索では最後に扱う。
     */
    bool is_defined_var(size_t var_idx) const { return var_data_[var_idx].is_defined_var; }

    /**
     * @brief 変数を is_defined_var としてマーク
     */
    void set_defined_var(size_t var_idx);

    // ===== ドメイン操作（Trail 付き） =====

    /**
     * @brief 変数の下限を更新
     * @param save_point バックトラック用セーブポイント
     * @param var_idx 変数インデックス
     * @param new_min 新しい下限
     * @return 成功（ドメインが空でない）したらtrue
     */
    bool set_min(int save_point, size_t var_idx, value_type new_min);

    /**
     * @brief 変数の上限を更新
     */
    bool set_max(int save_point, size_t var_idx, value_type new_max);

    /**
     * @brief 変数を特定の値に固定
     * @return 成功（値がドメインに存在）したらtrue
     */
    bool instantiate(int save_point, size_t var_idx, value_type value);

    // ===== Trail 管理 =====

    /**
     * @brief 指定セーブポイントより後の変更を巻き戻す
     */
    void rewind_to(int save_point);

    // ===== 伝播キュー =====

    /**
     * @brief 制約ウォッチリストを構築（制約追加後、探索前に呼び出す）
     */
    void build_constraint_watch_list();

    /**
     * @brief 制約を伝播キューに追加（キュー内にあれば何もしない）
     */
    void enqueue_constraint(size_t constraint_idx);

    /**
     * @brief 全制約を伝播キューに追加
     */
    void enqueue_all_constraints();

    bool has_pending_updates() const { return queue_head_ < queue_.size(); }

    /**
     * @brief キューから制約を1つ取り出す
     */
    size_t pop_pending_constraint();

    /**
     * @brief 保留中の伝播をクリア
     */
    void clear_pending_updates();

private:
    void save_var_state(int save_point, size_t var_idx);
    void notify_bounds_changed(size_t var_idx);

    std::vector<VariablePtr> variables_;
    std::vector<ConstraintPtr> constraints_;
    std::map<std::string, size_t> name_to_id_;

    std::vector<VarData> var_data_;

    // 集中 Trail
    std::vector<std::pair<int, VarTrailEntry>> var_trail_;

    // 制約ウォッチリスト: 各変数に関連する制約のリスト
    std::vector<std::vector<size_t>> var_to_constraint_indices_;

    // 伝播キュー（FIFO、重複なし）
    std::vector<size_t> queue_;
    size_t queue_head_ = 0;
    std::vector<char> in_queue_;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_MODEL_HPP
