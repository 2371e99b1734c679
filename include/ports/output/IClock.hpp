#pragma once

#include "domain/Date.hpp"
#include "domain/Timestamp.hpp"

namespace ledgerflow::ports::output {

/**
 * @brief Источник текущей даты и времени
 *
 * Output Port: LedgerService не обращается к системным часам напрямую,
 * в тестах подставляется фиксированное время.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Сегодняшняя (локальная) дата
     */
    virtual domain::Date today() const = 0;

    /**
     * @brief Текущий момент
     */
    virtual domain::Timestamp now() const = 0;
};

} // namespace ledgerflow::ports::output
