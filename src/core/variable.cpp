#include "duty_roster/variable.hpp"
#include "duty_roster/model.hpp"

namespace duty_roster {

Variable::Variable(std::string name, value_type min, value_type max)
    : name_(std::move(name)), initial_min_(min), initial_max_(max) {}

const std::string& Variable::name() const {
    return name_;
}

Variable::value_type Variable::min() const {
    if (!model_) return initial_min_;
    return model_->var_min(id_);
}

Variable::value_type Variable::max() const {
    if (!model_) return initial_max_;
    return model_->var_max(id_);
}

} // namespace duty_roster
