#include "duty_roster/roster/result.hpp"

namespace duty_roster {

ProjectedRoster project_result(const std::vector<Employee>& employees,
                               const AssignmentMap& assignments,
                               const Solution& solution,
                               const RosterConfig& config) {
    ProjectedRoster result;
    std::vector<int64_t> earned(employees.size(), 0);

    for (const auto& [key, var] : assignments) {
        auto it = solution.find(var->name());
        if (it == solution.end() || it->second != 1) continue;

        const auto& emp = employees[key.employee];
        result.roster.push_back({key.date, key.date.weekday_name(), emp.name, key.shift});
        earned[key.employee] += config.weight(key.shift);
    }

    double scale = static_cast<double>(config.point_scale);
    for (size_t e = 0; e < employees.size(); ++e) {
        SummaryRow row;
        row.employee = employees[e].name;
        row.starting_points = employees[e].ytd_points;
        row.points_earned = static_cast<double>(earned[e]) / scale;
        row.total_points = static_cast<double>(employees[e].ytd_points) + row.points_earned;
        result.summary.push_back(row);
    }
    return result;
}

} // namespace duty_roster
