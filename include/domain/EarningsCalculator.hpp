#pragma once

#include "Entry.hpp"
#include "Period.hpp"
#include "RateConfig.hpp"
#include <iomanip>
#include <sstream>
#include <string>

namespace ledgerflow::domain {

/**
 * @brief Сводка заработка по периоду
 */
struct EarningsSummary {
    double totalHours = 0.0;        ///< Часы в периоде
    double effectiveRate = 0.0;     ///< Эффективная ставка
    double actual = 0.0;            ///< Заработано по факту
    double projected = 0.0;         ///< Прогноз на targetHours
    double targetHours = 0.0;       ///< Цель в часах
    double progress = 0.0;          ///< totalHours / targetHours (0 при цели <= 0)
};

/**
 * @brief Расчёт заработка
 *
 * Без состояния: одинаковые входные данные всегда дают одинаковый
 * результат. Внутри полная точность, округление до центов только
 * при выводе (formatCurrency).
 */
class EarningsCalculator {
public:
    /**
     * @brief Фактический заработок: totalHours * effectiveHourlyRate
     */
    static double actualEarnings(const Period& period, const RateConfig& rateConfig) {
        return period.totalHours() * rateConfig.effectiveHourlyRate();
    }

    /**
     * @brief Прогноз на targetHours часов
     *
     * @return 0 при targetHours <= 0
     */
    static double projectedEarnings(
        const Period& /*period*/,
        const RateConfig& rateConfig,
        double targetHours
    ) {
        if (!(targetHours > 0.0)) {
            return 0.0;
        }
        return targetHours * rateConfig.effectiveHourlyRate();
    }

    /**
     * @brief Заработок за одну запись ("+ $X today")
     */
    static double entryEarnings(const Entry& entry, const RateConfig& rateConfig) {
        return entry.hours * rateConfig.effectiveHourlyRate();
    }

    /**
     * @brief Сводка для отображения
     *
     * @param period Активный период или nullptr, если периода нет
     */
    static EarningsSummary summarize(
        const Period* period,
        const RateConfig& rateConfig,
        double targetHours
    ) {
        EarningsSummary summary;
        summary.effectiveRate = rateConfig.effectiveHourlyRate();
        summary.targetHours = targetHours;

        if (period) {
            summary.totalHours = period->totalHours();
            summary.actual = actualEarnings(*period, rateConfig);
            summary.projected = projectedEarnings(*period, rateConfig, targetHours);
        } else {
            summary.projected = projectedEarnings(Period(), rateConfig, targetHours);
        }

        if (targetHours > 0.0) {
            summary.progress = summary.totalHours / targetHours;
        }
        return summary;
    }

    /**
     * @brief "$241.20"
     */
    static std::string formatCurrency(double amount) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << "$" << amount;
        return ss.str();
    }
};

} // namespace ledgerflow::domain
