#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ledgerflow::domain {

/**
 * @brief Календарная дата без времени (формат "YYYY-MM-DD")
 *
 * Используется для даты записи и границ периода.
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;

    Date(int y, int m, int d) : year(y), month(m), day(d) {
        if (!isValid(y, m, d)) {
            throw std::invalid_argument("Invalid date: " + format(y, m, d));
        }
    }

    /**
     * @brief Разобрать дату из строки "2025-12-16"
     * @throws std::invalid_argument если строка не является корректной датой
     */
    static Date fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%d");

        if (ss.fail() || str.size() != 10 || ss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
        }

        return Date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    }

    /**
     * @brief Локальная дата для момента времени
     */
    static Date fromTimePoint(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = *std::localtime(&t);
        return Date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    }

    std::string toString() const {
        return format(year, month, day);
    }

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>=(const Date& other) const { return !(*this < other); }

private:
    static bool isLeapYear(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static int daysInMonth(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeapYear(y)) {
            return 29;
        }
        return days[m - 1];
    }

    static bool isValid(int y, int m, int d) {
        return y >= 1 && y <= 9999 && m >= 1 && m <= 12 && d >= 1 && d <= daysInMonth(y, m);
    }

    static std::string format(int y, int m, int d) {
        std::ostringstream ss;
        ss << std::setfill('0') << std::setw(4) << y << "-"
           << std::setw(2) << m << "-" << std::setw(2) << d;
        return ss.str();
    }
};

} // namespace ledgerflow::domain
