/**
 * @file date.hpp
 * @brief 暦日（時刻なし）の値型
 */
#ifndef DUTY_ROSTER_ROSTER_DATE_HPP
#define DUTY_ROSTER_ROSTER_DATE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace duty_roster {

/**
 * @brief 暦日
 *
 * 1970-01-01 からの日数で保持する（proleptic Gregorian）。
 */
class Date {
public:
    /**
     * @brief 1970-01-01
     */
    Date() = default;

    /**
     * @brief 年月日から作成
     * @throws std::invalid_argument 存在しない日付
     */
    static Date from_ymd(int year, int month, int day);

    /**
     * @brief "YYYY-MM-DD" を解析（前後の空白は無視）
     * @return 不正な書式・存在しない日付なら std::nullopt
     */
    static std::optional<Date> parse(const std::string& text);

    /**
     * @brief 月の日数
     */
    static int days_in_month(int year, int month);

    static bool is_leap_year(int year);

    int year() const;
    int month() const;
    int day() const;

    /**
     * @brief 曜日（0 = 月曜 ... 6 = 日曜）
     */
    int weekday() const;

    /**
     * @brief 土曜または日曜
     */
    bool is_weekend() const { return weekday() >= 5; }

    /**
     * @brief 英語の曜日名（"Monday" など）
     */
    std::string weekday_name() const;

    /**
     * @brief "YYYY-MM-DD"
     */
    std::string to_string() const;

    Date add_days(int64_t days) const { return Date(serial_ + days); }

    /**
     * @brief 同じ月日の n 年後（存在しなければその月の末日に丸める）
     */
    Date add_years(int years) const;

    int64_t serial() const { return serial_; }

    bool operator==(const Date& other) const { return serial_ == other.serial_; }
    bool operator!=(const Date& other) const { return serial_ != other.serial_; }
    bool operator<(const Date& other) const { return serial_ < other.serial_; }
    bool operator<=(const Date& other) const { return serial_ <= other.serial_; }
    bool operator>(const Date& other) const { return serial_ > other.serial_; }
    bool operator>=(const Date& other) const { return serial_ >= other.serial_; }

private:
    explicit Date(int64_t serial) : serial_(serial) {}

    int64_t serial_ = 0;
};

/**
 * @brief start から end までの日付（両端を含む）。start > end なら空
 */
std::vector<Date> date_range(Date start, Date end);

} // namespace duty_roster

#endif // DUTY_ROSTER_ROSTER_DATE_HPP
