#pragma once

#include "Period.hpp"
#include "RateConfig.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgerflow::domain {

/**
 * @brief Состояние леджера целиком
 *
 * Периоды в порядке создания; активный период (если есть) - последний.
 * Используется и как результат IPersistenceGateway::loadAll(),
 * и как неизменяемый снимок для читателей LedgerService.
 */
struct LedgerSnapshot {
    std::vector<Period> periods;                ///< Периоды в порядке создания
    RateConfig rateConfig;                      ///< Текущая ставка
    std::optional<std::string> activePeriodId;  ///< ID активного периода

    /**
     * @brief Активный период или nullptr
     */
    const Period* activePeriod() const {
        if (!activePeriodId || periods.empty()) {
            return nullptr;
        }
        const auto& last = periods.back();
        return last.id == *activePeriodId && last.isActive() ? &last : nullptr;
    }

    Period* activePeriod() {
        return const_cast<Period*>(static_cast<const LedgerSnapshot&>(*this).activePeriod());
    }

    size_t entryCount() const {
        size_t count = 0;
        for (const auto& period : periods) {
            count += period.entries.size();
        }
        return count;
    }
};

} // namespace ledgerflow::domain
