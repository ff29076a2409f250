#include "duty_roster/roster/roster_model.hpp"
#include "duty_roster/roster/eligibility.hpp"
#include <set>

namespace duty_roster {

std::string CoverageGap::message() const {
    return "Impossible to fill: " + date.to_string() + " (" + shift_name(shift) +
           "). Reason: no eligible employee under current restrictions.";
}

RosterModelBuilder::RosterModelBuilder(Model& model,
                                       const std::vector<Employee>& employees,
                                       const std::vector<Date>& dates,
                                       const Calendar& calendar,
                                       const RosterConfig& config)
    : model_(model)
    , employees_(employees)
    , dates_(dates)
    , calendar_(calendar)
    , config_(config) {}

void RosterModelBuilder::create_variables() {
    for (Date day : dates_) {
        bool holiday = calendar_.is_holiday(day);
        for (Shift shift : calendar_.shifts_for(day)) {
            for (size_t e = 0; e < employees_.size(); ++e) {
                const auto& emp = employees_[e];
                if (!can_work(emp, day, shift, holiday, config_.immunity_years)) {
                    continue;
                }
                std::string name = emp.name + "_" + day.to_string() + "_" + shift_name(shift);
                assignments_[{day, shift, e}] = model_.create_bool_variable(std::move(name));
            }
        }
    }
}

std::vector<VariablePtr> RosterModelBuilder::slot_variables(Date day, Shift shift) const {
    std::vector<VariablePtr> vars;
    for (auto it = assignments_.lower_bound({day, shift, 0});
         it != assignments_.end() && it->first.date == day && it->first.shift == shift; ++it) {
        vars.push_back(it->second);
    }
    return vars;
}

std::vector<VariablePtr> RosterModelBuilder::day_variables(size_t employee, Date day) const {
    std::vector<VariablePtr> vars;
    for (Shift shift : calendar_.shifts_for(day)) {
        auto it = assignments_.find({day, shift, employee});
        if (it != assignments_.end()) {
            vars.push_back(it->second);
        }
    }
    return vars;
}

std::vector<CoverageGap> RosterModelBuilder::add_coverage_constraints() {
    std::vector<CoverageGap> gaps;
    for (Date day : dates_) {
        for (Shift shift : calendar_.shifts_for(day)) {
            auto vars = slot_variables(day, shift);
            if (vars.empty()) {
                gaps.push_back({day, shift});
                continue;
            }
            std::vector<int64_t> coeffs(vars.size(), 1);
            model_.add_constraint(std::make_shared<IntLinEqConstraint>(
                std::move(coeffs), std::move(vars), 1));
        }
    }
    return gaps;
}

void RosterModelBuilder::add_one_shift_per_day_constraints() {
    for (size_t e = 0; e < employees_.size(); ++e) {
        for (Date day : dates_) {
            auto vars = day_variables(e, day);
            // 変数が1つなら 0/1 のドメインで既に満たされる
            if (vars.size() < 2) continue;
            std::vector<int64_t> coeffs(vars.size(), 1);
            model_.add_constraint(std::make_shared<IntLinLeConstraint>(
                std::move(coeffs), std::move(vars), 1));
        }
    }
}

void RosterModelBuilder::add_rest_constraints() {
    if (dates_.size() < 2) return;

    for (size_t e = 0; e < employees_.size(); ++e) {
        for (size_t i = 0; i + 1 < dates_.size(); ++i) {
            Date today = dates_[i];
            Date tomorrow = dates_[i + 1];

            auto tomorrow_vars = day_variables(e, tomorrow);
            if (tomorrow_vars.empty()) continue;

            for (Shift shift : calendar_.shifts_for(today)) {
                if (!is_evening_shift(shift)) continue;
                auto it = assignments_.find({today, shift, e});
                if (it == assignments_.end()) continue;

                std::vector<VariablePtr> vars;
                vars.reserve(tomorrow_vars.size() + 1);
                vars.push_back(it->second);
                vars.insert(vars.end(), tomorrow_vars.begin(), tomorrow_vars.end());
                std::vector<int64_t> coeffs(vars.size(), 1);
                model_.add_constraint(std::make_shared<IntLinLeConstraint>(
                    std::move(coeffs), std::move(vars), 1));
            }
        }
    }
}

void RosterModelBuilder::add_holiday_bid_constraints() {
    for (Date day : dates_) {
        if (!calendar_.is_holiday(day)) continue;

        for (Shift shift : calendar_.shifts_for(day)) {
            std::vector<VariablePtr> bidder_vars;
            for (size_t e = 0; e < employees_.size(); ++e) {
                if (!employees_[e].holiday_bids.count(day)) continue;
                auto it = assignments_.find({day, shift, e});
                if (it != assignments_.end()) {
                    bidder_vars.push_back(it->second);
                }
            }
            if (bidder_vars.empty()) continue;

            std::vector<int64_t> coeffs(bidder_vars.size(), 1);
            model_.add_constraint(std::make_shared<IntLinEqConstraint>(
                std::move(coeffs), std::move(bidder_vars), 1));
        }
    }
}

Solution RosterModelBuilder::greedy_hint() const {
    Solution hint;
    for (const auto& [key, var] : assignments_) {
        hint[var->name()] = 0;
    }

    std::vector<int64_t> load(employees_.size());
    for (size_t e = 0; e < employees_.size(); ++e) {
        load[e] = employees_[e].ytd_points * config_.point_scale;
    }

    std::set<size_t> resting;  // 前日に夜勤した職員
    for (Date day : dates_) {
        bool holiday = calendar_.is_holiday(day);
        std::set<size_t> working;
        std::set<size_t> evening;

        for (Shift shift : calendar_.shifts_for(day)) {
            std::vector<size_t> candidates;
            std::vector<size_t> bidders;
            for (size_t e = 0; e < employees_.size(); ++e) {
                if (!assignments_.count({day, shift, e})) continue;
                candidates.push_back(e);
                if (holiday && employees_[e].holiday_bids.count(day)) {
                    bidders.push_back(e);
                }
            }
            if (!bidders.empty()) {
                candidates = bidders;
            }
            if (candidates.empty()) continue;

            // 制約を破らない候補を優先し、その中で累計最小
            size_t chosen = SIZE_MAX;
            bool chosen_free = false;
            for (size_t e : candidates) {
                bool free = !working.count(e) && !resting.count(e);
                if (chosen == SIZE_MAX ||
                    (free && !chosen_free) ||
                    (free == chosen_free && load[e] < load[chosen])) {
                    chosen = e;
                    chosen_free = free;
                }
            }

            hint[assignments_.at({day, shift, chosen})->name()] = 1;
            load[chosen] += config_.weight(shift);
            working.insert(chosen);
            if (is_evening_shift(shift)) {
                evening.insert(chosen);
            }
        }
        resting = std::move(evening);
    }
    return hint;
}

} // namespace duty_roster
