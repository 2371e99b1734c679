#pragma once

#include "Date.hpp"
#include "Timestamp.hpp"
#include <string>

namespace ledgerflow::domain {

/**
 * @brief Запись об отработанных часах
 *
 * Принадлежит ровно одному периоду и удаляется вместе с ним.
 */
struct Entry {
    std::string id;         ///< ID записи ("ent-...")
    Date date;              ///< Дата работы (по умолчанию сегодня)
    double hours = 0.0;     ///< Количество часов (> 0)
    std::string note;       ///< Заметка, пустая строка = без заметки
    Timestamp loggedAt;     ///< Когда запись была сделана

    Entry() = default;

    Entry(
        const std::string& id,
        const Date& date,
        double hours,
        const std::string& note,
        const Timestamp& loggedAt
    ) : id(id), date(date), hours(hours), note(note), loggedAt(loggedAt) {}

    bool hasNote() const {
        return !note.empty();
    }
};

} // namespace ledgerflow::domain
