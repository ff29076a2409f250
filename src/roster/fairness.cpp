#include "duty_roster/roster/fairness.hpp"
#include <algorithm>

namespace duty_roster {

FairnessObjective add_fairness_objective(Model& model,
                                         const std::vector<Employee>& employees,
                                         const AssignmentMap& assignments,
                                         const RosterConfig& config) {
    // 職員ごとの項 Σ weight * x
    std::vector<std::vector<VariablePtr>> vars(employees.size());
    std::vector<std::vector<int64_t>> weights(employees.size());
    for (const auto& [key, var] : assignments) {
        vars[key.employee].push_back(var);
        weights[key.employee].push_back(config.weight(key.shift));
    }

    // upper / lower / spread の定義域: 取りうる累計の範囲
    int64_t lowest = 0;
    int64_t highest = 0;
    std::vector<int64_t> base(employees.size());
    for (size_t e = 0; e < employees.size(); ++e) {
        base[e] = employees[e].ytd_points * config.point_scale;
        int64_t most = base[e];
        for (int64_t w : weights[e]) {
            most += w;
        }
        lowest = std::min(lowest, base[e]);
        highest = std::max(highest, most);
    }

    FairnessObjective objective;
    objective.upper = model.create_variable("fairness_upper", lowest, highest);
    objective.lower = model.create_variable("fairness_lower", lowest, highest);
    objective.spread = model.create_variable("fairness_spread", 0, highest - lowest);
    model.set_defined_var(objective.upper->id());
    model.set_defined_var(objective.lower->id());
    model.set_defined_var(objective.spread->id());

    for (size_t e = 0; e < employees.size(); ++e) {
        // base + Σ w x <= upper  ⇔  Σ w x - upper <= -base
        {
            std::vector<VariablePtr> terms = vars[e];
            std::vector<int64_t> coeffs = weights[e];
            terms.push_back(objective.upper);
            coeffs.push_back(-1);
            model.add_constraint(std::make_shared<IntLinLeConstraint>(
                std::move(coeffs), std::move(terms), -base[e]));
        }
        // lower <= base + Σ w x  ⇔  lower - Σ w x <= base
        {
            std::vector<VariablePtr> terms = vars[e];
            std::vector<int64_t> coeffs;
            coeffs.reserve(weights[e].size() + 1);
            for (int64_t w : weights[e]) {
                coeffs.push_back(-w);
            }
            terms.push_back(objective.lower);
            coeffs.push_back(1);
            model.add_constraint(std::make_shared<IntLinLeConstraint>(
                std::move(coeffs), std::move(terms), base[e]));
        }
    }

    // spread - upper + lower == 0
    model.add_constraint(std::make_shared<IntLinEqConstraint>(
        std::vector<int64_t>{1, -1, 1},
        std::vector<VariablePtr>{objective.spread, objective.upper, objective.lower},
        0));

    return objective;
}

} // namespace duty_roster
