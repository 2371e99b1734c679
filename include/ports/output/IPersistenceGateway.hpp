#pragma once

#include "domain/Entry.hpp"
#include "domain/LedgerSnapshot.hpp"
#include "domain/Period.hpp"
#include "domain/RateConfig.hpp"
#include <optional>
#include <string>

namespace ledgerflow::ports::output {

/**
 * @brief Интерфейс долговременного хранилища леджера
 *
 * Output Port для периодов, записей и настроек (ставка + ID активного
 * периода).
 *
 * Контракт для каждого метода:
 * - данные записаны до возврата из вызова;
 * - вызов либо применяется целиком, либо не виден после перезагрузки;
 * - ошибка сообщается исключением (наследник std::exception).
 */
class IPersistenceGateway {
public:
    virtual ~IPersistenceGateway() = default;

    /**
     * @brief Загрузить всё состояние
     *
     * Пустое хранилище - пустой список периодов и RateConfig по умолчанию.
     */
    virtual domain::LedgerSnapshot loadAll() = 0;

    /**
     * @brief Сохранить запись периода
     *
     * @param periodId ID периода-владельца
     * @param entry Новая запись
     */
    virtual void saveEntry(const std::string& periodId, const domain::Entry& entry) = 0;

    /**
     * @brief Сохранить границы периода (id, startDate, endDate)
     *
     * Upsert; записи периода не затрагиваются.
     */
    virtual void savePeriodBoundary(const domain::Period& period) = 0;

    /**
     * @brief Удалить период вместе с записями
     *
     * Используется только для компенсации неудачной операции.
     */
    virtual void removePeriod(const std::string& periodId) = 0;

    /**
     * @brief Сохранить текущую ставку
     */
    virtual void saveRateConfig(const domain::RateConfig& rateConfig) = 0;

    /**
     * @brief Сохранить ID активного периода (nullopt - активного нет)
     */
    virtual void saveActivePeriodId(const std::optional<std::string>& periodId) = 0;

    /**
     * @brief Удалить все данные и настройки
     *
     * Полная замена состояния, не слияние.
     */
    virtual void clear() = 0;
};

} // namespace ledgerflow::ports::output
