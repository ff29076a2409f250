/**
 * @file var_data.hpp
 * @brief 変数データ構造体（VarData, VarTrailEntry）
 *
 * model.hpp から分離し、Variable との循環依存を回避する。
 */
#ifndef DUTY_ROSTER_VAR_DATA_HPP
#define DUTY_ROSTER_VAR_DATA_HPP

#include <cstdint>
#include <cstddef>

namespace duty_roster {

/**
 * @brief 変数データ（AoS 構造体）
 *
 * 区間 [min, max] のみを保持する。値の穴は持たない。
 */
struct VarData {
    int64_t min;
    int64_t max;
    int last_saved_level = -1;
    bool is_defined_var = false;
};

/**
 * @brief 変数ドメイン用 Trail エントリ
 */
struct VarTrailEntry {
    size_t var_idx;
    int64_t old_min;
    int64_t old_max;
    int old_saved_level;
};

} // namespace duty_roster

#endif // DUTY_ROSTER_VAR_DATA_HPP
