/**
 * @file csv_io.hpp
 * @brief 職員・祝日 CSV の読み込みと、当番表・集計・職員 CSV の書き出し
 */
#ifndef DUTY_ROSTER_ROSTER_CSV_IO_HPP
#define DUTY_ROSTER_ROSTER_CSV_IO_HPP

#include "duty_roster/roster/employee.hpp"
#include "duty_roster/roster/result.hpp"
#include <iosfwd>
#include <set>
#include <string>
#include <vector>

namespace duty_roster {

using CsvRecord = std::vector<std::string>;

/**
 * @brief CSV をレコードに分割（"" エスケープ、引用符内の改行に対応）
 *
 * 空行は読み飛ばす。
 */
std::vector<CsvRecord> read_csv(std::istream& in);

/**
 * @brief ';' ',' 改行区切りの日付リストを解釈
 *
 * 空・"None"・"nan" は空集合。解釈できない項目は warnings に追記して読み飛ばす。
 */
std::set<Date> parse_date_list(const std::string& text,
                               std::vector<std::string>* warnings = nullptr);

/**
 * @brief 職員 CSV の読み込み結果
 */
struct EmployeeLoadResult {
    std::vector<Employee> employees;
    std::vector<std::string> warnings;
};

/**
 * @brief 職員 CSV を解釈
 *
 * 列はヘッダ名で対応付ける（Name, Team, Role, YTD, Blackouts, PH Bids, Last PH Date）。
 * 名前・チームのない行、重複した名前の行は警告付きで読み飛ばす。
 *
 * @throws std::runtime_error Name 列がない場合
 */
EmployeeLoadResult parse_employees(std::istream& in);

/**
 * @throws std::runtime_error ファイルを開けない場合、Name 列がない場合
 */
EmployeeLoadResult load_employees(const std::string& path);

/**
 * @brief 祝日 CSV（Date 列）を解釈
 *
 * @throws std::runtime_error Date 列がない場合
 */
std::set<Date> parse_holidays(std::istream& in, std::vector<std::string>* warnings = nullptr);

/**
 * @brief 祝日 CSV を読み込む。ファイルがなければ空集合
 */
std::set<Date> load_holidays(const std::string& path, std::vector<std::string>* warnings = nullptr);

void write_roster_csv(std::ostream& out, const std::vector<RosterRow>& rows);
void write_summary_csv(std::ostream& out, const std::vector<SummaryRow>& rows);

/**
 * @brief 職員 CSV を parse_employees と同じ列構成で書き出す
 */
void write_employees_csv(std::ostream& out, const std::vector<Employee>& employees);

/**
 * @throws std::runtime_error ファイルを開けない場合
 */
void save_employees(const std::string& path, const std::vector<Employee>& employees);

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_CSV_IO_HPP
