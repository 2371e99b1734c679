#pragma once

#include "Date.hpp"
#include "Entry.hpp"
#include "Timestamp.hpp"
#include "exceptions/LedgerException.hpp"
#include "utils/IdGenerator.hpp"
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace ledgerflow::domain {

/**
 * @brief Рабочий период - контейнер записей с границами
 *
 * Активен, пока endDate не задан. Записи хранятся в порядке
 * добавления (не сортируются по date).
 */
struct Period {
    std::string id;                 ///< ID периода ("prd-...")
    Date startDate;                 ///< Дата начала
    std::optional<Date> endDate;    ///< Дата закрытия, nullopt - период активен
    std::vector<Entry> entries;     ///< Записи в порядке добавления

    Period() = default;

    Period(const std::string& id, const Date& startDate)
        : id(id), startDate(startDate) {}

    bool isActive() const {
        return !endDate.has_value();
    }

    /**
     * @brief Добавить запись
     *
     * @return Созданная запись с новым ID
     * @throws InvalidEntryError если hours <= 0 или период закрыт
     */
    Entry addEntry(
        const Date& date,
        double hours,
        const std::string& note,
        const Timestamp& loggedAt = Timestamp::now()
    ) {
        validateEntry(hours);

        Entry entry(
            utils::IdGenerator::generate(utils::IdGenerator::ENTRY_PREFIX),
            date,
            hours,
            note,
            loggedAt
        );
        entries.push_back(entry);
        return entry;
    }

    /**
     * @brief Проверить, что запись с такими часами можно добавить
     * @throws InvalidEntryError
     */
    void validateEntry(double hours) const {
        if (!isActive()) {
            throw InvalidEntryError("Period " + id + " is closed");
        }
        if (!std::isfinite(hours) || hours <= 0.0) {
            throw InvalidEntryError("Hours must be a positive number");
        }
    }

    /**
     * @brief Закрыть период
     * @throws InvalidPeriodError если уже закрыт или endDate раньше startDate
     */
    void close(const Date& end) {
        if (!isActive()) {
            throw InvalidPeriodError("Period " + id + " is already closed");
        }
        if (end < startDate) {
            throw InvalidPeriodError("Period cannot end (" + end.toString()
                + ") before it starts (" + startDate.toString() + ")");
        }
        endDate = end;
    }

    double totalHours() const {
        double total = 0.0;
        for (const auto& entry : entries) {
            total += entry.hours;
        }
        return total;
    }
};

} // namespace ledgerflow::domain
