#include "duty_roster/roster/carry_over.hpp"
#include <cmath>
#include <map>

namespace duty_roster {

std::vector<Employee> apply_carry_over(const std::vector<Employee>& employees,
                                       const RosterOutcome& outcome) {
    std::map<std::string, const SummaryRow*> totals;
    for (const auto& row : outcome.summary) {
        totals[row.employee] = &row;
    }

    std::map<std::string, Date> latest_special;
    for (const auto& row : outcome.roster) {
        if (shift_class(row.shift) != DayClass::Holiday) continue;
        auto it = latest_special.find(row.employee);
        if (it == latest_special.end() || it->second < row.date) {
            latest_special[row.employee] = row.date;
        }
    }

    std::vector<Employee> updated = employees;
    for (auto& emp : updated) {
        auto total = totals.find(emp.name);
        if (total != totals.end()) {
            emp.ytd_points = static_cast<int64_t>(std::llround(total->second->total_points));
        }
        auto special = latest_special.find(emp.name);
        if (special != latest_special.end()) {
            if (!emp.last_special_date || *emp.last_special_date < special->second) {
                emp.last_special_date = special->second;
            }
        }
    }
    return updated;
}

std::string immunity_status(const Employee& employee, Date today, int years) {
    if (!employee.is_immune(today, years)) {
        return "Available";
    }
    return "Immune until " + employee.immunity_end(years)->to_string();
}

} // namespace duty_roster
