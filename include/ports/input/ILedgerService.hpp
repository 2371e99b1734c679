#pragma once

#include "domain/Date.hpp"
#include "domain/Entry.hpp"
#include "domain/LedgerSnapshot.hpp"
#include "domain/Period.hpp"
#include "domain/RateConfig.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ledgerflow::ports::input {

/**
 * @brief Интерфейс леджера периодов и записей
 *
 * Input Port: все изменения и запросы к состоянию. Каждое изменение
 * записано в хранилище до возврата; при ошибке записи состояние
 * в памяти не меняется и выбрасывается domain::PersistenceError.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Начать новый период
     *
     * @param startDate Дата начала (по умолчанию - сегодня)
     * @return Новый активный период
     *
     * @note Предыдущий активный период закрывается датой startDate
     * @throws domain::InvalidPeriodError если startDate раньше начала активного периода
     * @throws domain::PersistenceError
     */
    virtual domain::Period startNewPeriod(const std::optional<domain::Date>& startDate = std::nullopt) = 0;

    /**
     * @brief Записать отработанные часы в активный период
     *
     * @param date Дата работы (по умолчанию - сегодня)
     * @param hours Часы (> 0)
     * @param note Заметка
     * @return Созданная запись
     *
     * @note Если активного периода нет, он создаётся с началом date
     * @throws domain::InvalidEntryError если hours <= 0
     * @throws domain::PersistenceError
     */
    virtual domain::Entry logHours(
        const std::optional<domain::Date>& date,
        double hours,
        const std::string& note = ""
    ) = 0;

    /**
     * @brief Установить новую ставку ("Save & Apply")
     *
     * @throws domain::PersistenceError (прежняя ставка остаётся текущей)
     */
    virtual void updateRateConfig(const domain::RateConfig& newConfig) = 0;

    /**
     * @brief Удалить все периоды и сбросить ставку к значениям по умолчанию
     *
     * Идемпотентна.
     * @throws domain::PersistenceError
     */
    virtual void clearAllData() = 0;

    /**
     * @brief Активный период (копия) или nullopt
     */
    virtual std::optional<domain::Period> activePeriod() const = 0;

    /**
     * @brief Все периоды в порядке создания
     */
    virtual std::vector<domain::Period> periods() const = 0;

    /**
     * @brief Текущая ставка
     */
    virtual domain::RateConfig rateConfig() const = 0;

    /**
     * @brief Согласованный снимок периодов и ставки
     */
    virtual domain::LedgerSnapshot snapshot() const = 0;

    /**
     * @brief Последние записи, новые первыми
     *
     * @param limit Максимум записей
     * @param includeClosed Включать записи закрытых периодов
     */
    virtual std::vector<domain::Entry> recentEntries(size_t limit, bool includeClosed = false) const = 0;
};

} // namespace ledgerflow::ports::input
