#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ledgerflow::domain {

/**
 * @brief Момент записи (UTC), формат "2025-12-16 10:30:00"
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разобрать строку "YYYY-MM-DD HH:MM:SS" (UTC)
     * @throws std::invalid_argument при неверном формате
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        return Timestamp(std::chrono::system_clock::from_time_t(toUtcTime(tm)));
    }

    std::string toString() const {
        auto t = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&t);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }

private:
    // timegm без зависимости от TZ процесса (days-from-civil)
    static std::time_t toUtcTime(const std::tm& tm) {
        int y = tm.tm_year + 1900;
        int m = tm.tm_mon + 1;
        y -= m <= 2 ? 1 : 0;
        const int era = (y >= 0 ? y : y - 399) / 400;
        const int yoe = y - era * 400;
        const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + tm.tm_mday - 1;
        const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        const int64_t days = static_cast<int64_t>(era) * 146097 + doe - 719468;
        return static_cast<std::time_t>(days * 86400 + tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec);
    }
};

} // namespace ledgerflow::domain
