#include "duty_roster/model.hpp"
#include <stdexcept>
#include <algorithm>

namespace duty_roster {

VariablePtr Model::create_variable(std::string name, value_type min, value_type max) {
    if (min > max) {
        throw std::invalid_argument("Empty domain for variable: " + name);
    }
    auto var = std::make_shared<Variable>(std::move(name), min, max);
    add_variable(var);
    return var;
}

VariablePtr Model::create_variable(std::string name, value_type value) {
    return create_variable(std::move(name), value, value);
}

VariablePtr Model::create_bool_variable(std::string name) {
    return create_variable(std::move(name), 0, 1);
}

size_t Model::add_variable(VariablePtr var) {
    if (name_to_id_.count(var->name())) {
        throw std::invalid_argument("Duplicate variable name: " + var->name());
    }
    size_t id = variables_.size();

    // set_model 前に初期境界を読む
    VarData vd;
    vd.min = var->min();
    vd.max = var->max();
    vd.last_saved_level = -1;
    vd.is_defined_var = false;
    var_data_.push_back(vd);

    var->set_id(id);
    var->set_model(this);
    name_to_id_[var->name()] = id;
    variables_.push_back(std::move(var));
    var_to_constraint_indices_.emplace_back();
    return id;
}

void Model::set_defined_var(size_t var_idx) {
    var_data_[var_idx].is_defined_var = true;
}

void Model::add_constraint(ConstraintPtr constraint) {
    size_t c_idx = constraints_.size();
    constraint->set_model_index(c_idx);
    for (const auto& var : constraint->variables()) {
        var_to_constraint_indices_[var->id()].push_back(c_idx);
    }
    constraints_.push_back(std::move(constraint));
    in_queue_.push_back(0);
}

VariablePtr Model::variable(size_t id) const {
    if (id >= variables_.size()) {
        throw std::out_of_range("Variable ID out of range");
    }
    return variables_[id];
}

VariablePtr Model::variable(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it == name_to_id_.end()) {
        throw std::out_of_range("Variable not found: " + name);
    }
    return variables_[it->second];
}

size_t Model::find_variable_index(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) return it->second;
    return SIZE_MAX;
}

void Model::save_var_state(int save_point, size_t var_idx) {
    // 同じレベルで既に保存済みならスキップ
    auto& vd = var_data_[var_idx];
    if (vd.last_saved_level == save_point) {
        return;
    }

    VarTrailEntry entry;
    entry.var_idx = var_idx;
    entry.old_min = vd.min;
    entry.old_max = vd.max;
    entry.old_saved_level = vd.last_saved_level;
    var_trail_.push_back({save_point, entry});

    vd.last_saved_level = save_point;
}

void Model::notify_bounds_changed(size_t var_idx) {
    for (size_t c_idx : var_to_constraint_indices_[var_idx]) {
        enqueue_constraint(c_idx);
    }
}

bool Model::set_min(int save_point, size_t var_idx, value_type new_min) {
    auto& vd = var_data_[var_idx];
    if (new_min <= vd.min) {
        return true;  // 変更不要
    }
    if (new_min > vd.max) {
        return false;  // ドメインが空になる
    }

    save_var_state(save_point, var_idx);
    vd.min = new_min;
    notify_bounds_changed(var_idx);
    return true;
}

bool Model::set_max(int save_point, size_t var_idx, value_type new_max) {
    auto& vd = var_data_[var_idx];
    if (new_max >= vd.max) {
        return true;  // 変更不要
    }
    if (new_max < vd.min) {
        return false;  // ドメインが空になる
    }

    save_var_state(save_point, var_idx);
    vd.max = new_max;
    notify_bounds_changed(var_idx);
    return true;
}

bool Model::instantiate(int save_point, size_t var_idx, value_type value) {
    auto& vd = var_data_[var_idx];
    if (value < vd.min || value > vd.max) {
        return false;
    }
    if (vd.min == value && vd.max == value) {
        return true;
    }

    save_var_state(save_point, var_idx);
    vd.min = value;
    vd.max = value;
    notify_bounds_changed(var_idx);
    return true;
}

void Model::rewind_to(int save_point) {
    while (!var_trail_.empty() && var_trail_.back().first > save_point) {
        const auto& entry = var_trail_.back().second;
        auto& vd = var_data_[entry.var_idx];
        vd.min = entry.old_min;
        vd.max = entry.old_max;
        vd.last_saved_level = entry.old_saved_level;
        var_trail_.pop_back();
    }
}

void Model::build_constraint_watch_list() {
    var_to_constraint_indices_.assign(variables_.size(), {});
    for (size_t c_idx = 0; c_idx < constraints_.size(); ++c_idx) {
        for (const auto& var : constraints_[c_idx]->variables()) {
            var_to_constraint_indices_[var->id()].push_back(c_idx);
        }
    }
    in_queue_.assign(constraints_.size(), 0);
    queue_.clear();
    queue_head_ = 0;
}

void Model::enqueue_constraint(size_t constraint_idx) {
    if (in_queue_[constraint_idx]) return;
    in_queue_[constraint_idx] = 1;
    queue_.push_back(constraint_idx);
}

void Model::enqueue_all_constraints() {
    for (size_t c_idx = 0; c_idx < constraints_.size(); ++c_idx) {
        enqueue_constraint(c_idx);
    }
}

size_t Model::pop_pending_constraint() {
    size_t c_idx = queue_[queue_head_++];
    in_queue_[c_idx] = 0;
    if (queue_head_ == queue_.size()) {
        queue_.clear();
        queue_head_ = 0;
    }
    return c_idx;
}

void Model::clear_pending_updates() {
    for (size_t i = queue_head_; i < queue_.size(); ++i) {
        in_queue_[queue_[i]] = 0;
    }
    queue_.clear();
    queue_head_ = 0;
}

} // namespace duty_roster
