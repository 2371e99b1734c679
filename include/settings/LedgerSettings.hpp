#pragma once

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ledgerflow::settings {

/**
 * @brief Настройки отображения леджера
 *
 * Читает из ENV:
 * - LEDGERFLOW_TARGET_HOURS (default: 80) - цель для прогноза заработка
 * - LEDGERFLOW_RECENT_LIMIT (default: 10) - сколько последних записей показывать
 * - LEDGERFLOW_QUIET (default: 0) - не выводить служебные логи
 */
class LedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGERFLOW_TARGET_HOURS")) {
            try {
                double hours = std::stod(val);
                if (hours >= 0.0) {
                    targetHours_ = hours;
                } else {
                    std::cerr << "[LedgerSettings] Negative LEDGERFLOW_TARGET_HOURS ignored" << std::endl;
                }
            } catch (const std::exception&) {
                std::cerr << "[LedgerSettings] Invalid LEDGERFLOW_TARGET_HOURS '" << val
                          << "', using " << targetHours_ << std::endl;
            }
        }
        if (const char* val = std::getenv("LEDGERFLOW_RECENT_LIMIT")) {
            try {
                int limit = std::stoi(val);
                if (limit >= 0) {
                    recentLimit_ = static_cast<size_t>(limit);
                } else {
                    std::cerr << "[LedgerSettings] Negative LEDGERFLOW_RECENT_LIMIT ignored" << std::endl;
                }
            } catch (const std::exception&) {
                std::cerr << "[LedgerSettings] Invalid LEDGERFLOW_RECENT_LIMIT '" << val
                          << "', using " << recentLimit_ << std::endl;
            }
        }
        if (const char* val = std::getenv("LEDGERFLOW_QUIET")) {
            quiet_ = std::string(val) == "1" || std::string(val) == "true";
        }
    }

    double getTargetHours() const { return targetHours_; }
    size_t getRecentLimit() const { return recentLimit_; }
    bool isQuiet() const { return quiet_; }

private:
    double targetHours_ = 80.0;
    size_t recentLimit_ = 10;
    bool quiet_ = false;
};

} // namespace ledgerflow::settings
