#pragma once

#include "exceptions/LedgerException.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace ledgerflow::domain {

/**
 * @brief Конфигурация ставки: базовая ставка + средние чаевые
 *
 * Неизменяемое значение. Инвариант baseRate >= 0, avgTipRate >= 0
 * проверяется в конструкторе, поэтому некорректный RateConfig
 * создать нельзя.
 *
 * avgTipRate хранится и при includeTips == false, чтобы повторное
 * включение чаевых восстанавливало прежнее значение.
 */
class RateConfig {
public:
    static constexpr double DEFAULT_BASE_RATE = 7.00;
    static constexpr double DEFAULT_AVG_TIP_RATE = 23.15;
    static constexpr bool DEFAULT_INCLUDE_TIPS = false;

    /**
     * @brief Конфигурация по умолчанию (первый запуск)
     */
    RateConfig()
        : baseRate_(DEFAULT_BASE_RATE)
        , includeTips_(DEFAULT_INCLUDE_TIPS)
        , avgTipRate_(DEFAULT_AVG_TIP_RATE)
    {}

    /**
     * @throws InvalidRateError если ставка отрицательная или не число
     */
    RateConfig(double baseRate, bool includeTips, double avgTipRate)
        : baseRate_(baseRate)
        , includeTips_(includeTips)
        , avgTipRate_(avgTipRate)
    {
        validate(baseRate, "Base rate");
        validate(avgTipRate, "Average tip rate");
    }

    /**
     * @brief Создать новую конфигурацию ("Save & Apply")
     *
     * @return Новое значение; текущее не меняется
     * @throws InvalidRateError если хотя бы одна ставка отрицательная
     */
    static RateConfig update(double baseRate, bool includeTips, double avgTipRate) {
        return RateConfig(baseRate, includeTips, avgTipRate);
    }

    double baseRate() const { return baseRate_; }
    bool includeTips() const { return includeTips_; }
    double avgTipRate() const { return avgTipRate_; }

    /**
     * @brief Эффективная ставка в час
     *
     * baseRate, если чаевые выключены, иначе baseRate + avgTipRate.
     */
    double effectiveHourlyRate() const {
        return includeTips_ ? baseRate_ + avgTipRate_ : baseRate_;
    }

    /**
     * @brief Строка вида "Rate: $30.15/hr (Base: $7.00, Tips: $23.15)"
     */
    std::string describe() const {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2)
           << "Rate: $" << effectiveHourlyRate() << "/hr (Base: $" << baseRate_;
        if (includeTips_) {
            ss << ", Tips: $" << avgTipRate_ << ")";
        } else {
            ss << ", Tips excluded)";
        }
        return ss.str();
    }

    bool operator==(const RateConfig& other) const {
        return baseRate_ == other.baseRate_
            && includeTips_ == other.includeTips_
            && avgTipRate_ == other.avgTipRate_;
    }

    bool operator!=(const RateConfig& other) const {
        return !(*this == other);
    }

private:
    double baseRate_;
    bool includeTips_;
    double avgTipRate_;

    static void validate(double rate, const std::string& name) {
        if (!std::isfinite(rate)) {
            throw InvalidRateError(name + " must be a number");
        }
        if (rate < 0.0) {
            throw InvalidRateError(name + " cannot be negative");
        }
    }
};

} // namespace ledgerflow::domain
