#include "duty_roster/roster/date.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace duty_roster {

namespace {

struct Ymd {
    int year;
    int month;
    int day;
};

// 年月日 -> 1970-01-01 からの日数（era 単位の 400 年周期で計算）
int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Ymd civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = yoe + era * 400;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    return {static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

bool parse_number(const std::string& text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

}  // namespace

bool Date::is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int Date::days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month out of range: " + std::to_string(month));
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

Date Date::from_ymd(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        throw std::invalid_argument("Invalid date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    return Date(days_from_civil(year, month, day));
}

std::optional<Date> Date::parse(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    std::string s = text.substr(begin, end - begin);

    // YYYY-MM-DD、時刻部分（"T..." / " 00:00:00"）は無視する
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }
    if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') {
        return std::nullopt;
    }

    int y = 0, m = 0, d = 0;
    if (!parse_number(s, 0, 4, y) || !parse_number(s, 5, 2, m) || !parse_number(s, 8, 2, d)) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        return std::nullopt;
    }
    return Date(days_from_civil(y, m, d));
}

int Date::year() const {
    return civil_from_days(serial_).year;
}

int Date::month() const {
    return civil_from_days(serial_).month;
}

int Date::day() const {
    return civil_from_days(serial_).day;
}

int Date::weekday() const {
    // 1970-01-01 は木曜日（= 3）
    int64_t w = (serial_ + 3) % 7;
    if (w < 0) w += 7;
    return static_cast<int>(w);
}

std::string Date::weekday_name() const {
    static const char* kNames[] = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };
    return kNames[weekday()];
}

std::string Date::to_string() const {
    auto ymd = civil_from_days(serial_);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", ymd.year, ymd.month, ymd.day);
    return buf;
}

Date Date::add_years(int years) const {
    auto ymd = civil_from_days(serial_);
    int y = ymd.year + years;
    int last_day = days_in_month(y, ymd.month);
    int d = ymd.day > last_day ? last_day : ymd.day;
    return Date(days_from_civil(y, ymd.month, d));
}

std::vector<Date> date_range(Date start, Date end) {
    std::vector<Date> dates;
    if (start > end) {
        return dates;
    }
    dates.reserve(static_cast<size_t>(end.serial() - start.serial() + 1));
    for (Date d = start; d <= end; d = d.add_days(1)) {
        dates.push_back(d);
    }
    return dates;
}

} // namespace duty_roster
