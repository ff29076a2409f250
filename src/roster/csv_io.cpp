#include "duty_roster/roster/csv_io.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>

namespace duty_roster {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// YTD 列の上限（ポイント単位）
constexpr double kMaxYtdPoints = 1e9;

/**
 * @brief YTD 列の値（小数は切り捨て）。非数値・非有限・負・過大なら nullopt
 */
std::optional<int64_t> parse_ytd(const std::string& text) {
    double value = 0.0;
    size_t used = 0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (used != text.size() || !std::isfinite(value) || value < 0.0 ||
        value > kMaxYtdPoints) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

bool is_blank_record(const CsvRecord& record) {
    return std::all_of(record.begin(), record.end(),
                       [](const std::string& field) { return trim(field).empty(); });
}

/**
 * @brief ヘッダ行から列名 → 列番号の表を作る（大文字小文字・前後の空白を無視）
 */
std::map<std::string, size_t> index_header(const CsvRecord& header) {
    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns.emplace(lower(trim(header[i])), i);
    }
    return columns;
}

std::optional<size_t> find_column(const std::map<std::string, size_t>& columns,
                                  std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = columns.find(name);
        if (it != columns.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::string field(const CsvRecord& record, std::optional<size_t> column) {
    if (!column || *column >= record.size()) {
        return "";
    }
    return trim(record[*column]);
}

std::string quote(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string join_dates(const std::set<Date>& dates) {
    std::string out;
    for (Date d : dates) {
        if (!out.empty()) out += ';';
        out += d.to_string();
    }
    return out;
}

} // namespace

std::vector<CsvRecord> read_csv(std::istream& in) {
    std::vector<CsvRecord> records;
    CsvRecord record;
    std::string current;
    bool in_quotes = false;
    bool any = false;

    auto end_record = [&]() {
        record.push_back(std::move(current));
        current.clear();
        if (!is_blank_record(record)) {
            records.push_back(std::move(record));
        }
        record.clear();
        any = false;
    };

    char c;
    while (in.get(c)) {
        any = true;
        if (in_quotes) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get(c);
                    current += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                break;
            case ',':
                record.push_back(std::move(current));
                current.clear();
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                break;
            default:
                current += c;
                break;
        }
    }
    if (any) {
        end_record();
    }
    return records;
}

std::set<Date> parse_date_list(const std::string& text, std::vector<std::string>* warnings) {
    std::set<Date> dates;
    std::string cell = trim(text);
    std::string key = lower(cell);
    if (cell.empty() || key == "none" || key == "nan") {
        return dates;
    }

    std::string item;
    auto flush = [&]() {
        std::string clean = trim(item);
        item.clear();
        if (clean.empty()) return;
        auto date = Date::parse(clean);
        if (date) {
            dates.insert(*date);
        } else if (warnings) {
            warnings->push_back("Skipping invalid date: '" + clean + "'");
        }
    };

    for (char c : cell) {
        if (c == ';' || c == ',' || c == '\n') {
            flush();
        } else {
            item += c;
        }
    }
    flush();
    return dates;
}

EmployeeLoadResult parse_employees(std::istream& in) {
    EmployeeLoadResult result;
    auto records = read_csv(in);
    if (records.empty()) {
        throw std::runtime_error("Employees CSV is empty");
    }

    auto columns = index_header(records.front());
    auto name_col = find_column(columns, {"name"});
    if (!name_col) {
        throw std::runtime_error("Employees CSV has no 'Name' column");
    }
    auto team_col = find_column(columns, {"team"});
    auto role_col = find_column(columns, {"role"});
    auto ytd_col = find_column(columns, {"ytd"});
    auto blackout_col = find_column(columns, {"blackouts(dates)", "blackouts"});
    auto bids_col = find_column(columns, {"ph bids"});
    auto last_col = find_column(columns, {"last ph date"});

    std::set<std::string> seen;
    for (size_t row = 1; row < records.size(); ++row) {
        const auto& record = records[row];
        std::string where = "row " + std::to_string(row);

        Employee emp;
        emp.name = field(record, name_col);
        if (emp.name.empty()) {
            result.warnings.push_back("Skipping " + where + ": Name is missing.");
            continue;
        }
        emp.team = field(record, team_col);
        if (emp.team.empty()) {
            result.warnings.push_back("No team for " + emp.name + ". Skipping " + where + ".");
            continue;
        }
        if (seen.count(emp.name)) {
            result.warnings.push_back("Duplicate name " + emp.name + ". Skipping " + where + ".");
            continue;
        }

        std::string role_text = field(record, role_col);
        if (role_text.empty()) {
            emp.role = Role::Standard;
        } else if (auto role = parse_role(role_text)) {
            emp.role = *role;
        } else {
            result.warnings.push_back("Invalid role '" + role_text + "' for " + emp.name +
                                      ". Defaulting to Standard.");
            emp.role = Role::Standard;
        }

        std::string ytd_text = field(record, ytd_col);
        if (!ytd_text.empty()) {
            if (auto ytd = parse_ytd(ytd_text)) {
                emp.ytd_points = *ytd;
            } else {
                result.warnings.push_back("Invalid YTD '" + ytd_text + "' for " + emp.name +
                                          ". Using 0.");
                emp.ytd_points = 0;
            }
        }

        emp.blackouts = parse_date_list(field(record, blackout_col), &result.warnings);
        emp.holiday_bids = parse_date_list(field(record, bids_col), &result.warnings);
        auto last = parse_date_list(field(record, last_col), &result.warnings);
        if (!last.empty()) {
            emp.last_special_date = *last.rbegin();
        }

        seen.insert(emp.name);
        result.employees.push_back(std::move(emp));
    }
    return result;
}

EmployeeLoadResult load_employees(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return parse_employees(in);
}

std::set<Date> parse_holidays(std::istream& in, std::vector<std::string>* warnings) {
    std::set<Date> holidays;
    auto records = read_csv(in);
    if (records.empty()) {
        return holidays;
    }

    auto columns = index_header(records.front());
    auto date_col = find_column(columns, {"date"});
    if (!date_col) {
        throw std::runtime_error("Holidays CSV has no 'Date' column");
    }

    for (size_t row = 1; row < records.size(); ++row) {
        std::string text = field(records[row], date_col);
        if (text.empty()) continue;
        auto date = Date::parse(text);
        if (date) {
            holidays.insert(*date);
        } else if (warnings) {
            warnings->push_back("Skipping invalid holiday date: '" + text + "'");
        }
    }
    return holidays;
}

std::set<Date> load_holidays(const std::string& path, std::vector<std::string>* warnings) {
    std::ifstream in(path);
    if (!in) {
        if (warnings) {
            warnings->push_back("No holidays file at " + path + "; treating every day as a normal day.");
        }
        return {};
    }
    return parse_holidays(in, warnings);
}

void write_roster_csv(std::ostream& out, const std::vector<RosterRow>& rows) {
    out << "Date,Day,Employee,Shift\n";
    for (const auto& row : rows) {
        out << row.date.to_string() << ',' << row.day_name << ','
            << quote(row.employee) << ',' << shift_name(row.shift) << '\n';
    }
}

void write_summary_csv(std::ostream& out, const std::vector<SummaryRow>& rows) {
    out << "Employee,Starting Points,Points Earned,Total Points\n";
    auto flags = out.flags();
    auto precision = out.precision();
    out << std::fixed << std::setprecision(1);
    for (const auto& row : rows) {
        out << quote(row.employee) << ',' << row.starting_points << ','
            << row.points_earned << ',' << row.total_points << '\n';
    }
    out.flags(flags);
    out.precision(precision);
}

void write_employees_csv(std::ostream& out, const std::vector<Employee>& employees) {
    out << "Name,Team,Role,YTD,Blackouts,PH Bids,Last PH Date\n";
    for (const auto& emp : employees) {
        out << quote(emp.name) << ',' << quote(emp.team) << ',' << role_name(emp.role) << ','
            << emp.ytd_points << ',' << join_dates(emp.blackouts) << ','
            << join_dates(emp.holiday_bids) << ','
            << (emp.last_special_date ? emp.last_special_date->to_string() : "") << '\n';
    }
}

void save_employees(const std::string& path, const std::vector<Employee>& employees) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    write_employees_csv(out, employees);
}

} // namespace duty_roster
