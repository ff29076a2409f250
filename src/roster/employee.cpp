#include "duty_roster/roster/employee.hpp"
#include <cctype>

namespace duty_roster {

std::string role_name(Role role) {
    switch (role) {
        case Role::Standard:    return "Standard";
        case Role::NoEvening:   return "No-PM";
        case Role::WeekendOnly: return "Weekend-Only";
    }
    return "Standard";
}

std::optional<Role> parse_role(const std::string& text) {
    std::string key;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (key == "standard") return Role::Standard;
    if (key == "no-pm" || key == "no-evening") return Role::NoEvening;
    if (key == "weekend-only") return Role::WeekendOnly;
    return std::nullopt;
}

std::optional<Date> Employee::immunity_end(int years) const {
    if (!last_special_date) {
        return std::nullopt;
    }
    return last_special_date->add_years(years);
}

bool Employee::is_immune(Date day, int years) const {
    auto end = immunity_end(years);
    return end && day < *end;
}

} // namespace duty_roster
