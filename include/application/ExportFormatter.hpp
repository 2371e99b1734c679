#pragma once

#include "domain/Period.hpp"
#include "domain/RateConfig.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>

namespace ledgerflow::application {

/**
 * @brief Текстовый отчёт для экспорта данных
 *
 * Формат:
 * @code
 * LedgerFlow Data Export
 * Generated: 2025-12-16 18:30:00
 * Rate: $30.15/hr (Base: $7.00, Tips: $23.15)
 * ==================================================
 * Period,Date,Hours,Note,Logged_At
 * 2025-12-01,2025-12-01,5,opening shift,2025-12-01 22:10:00
 * @endcode
 *
 * Строки упорядочены по дате начала периода, затем по дате записи.
 */
class ExportFormatter {
public:
    static constexpr const char* TITLE = "LedgerFlow Data Export";
    static constexpr const char* HEADER = "Period,Date,Hours,Note,Logged_At";
    static constexpr size_t SEPARATOR_WIDTH = 50;

    static std::string format(
        const std::vector<domain::Period>& periods,
        const domain::RateConfig& rateConfig,
        const domain::Timestamp& generatedAt
    );

    /**
     * @brief Часы без лишних нулей: 5, 2.5, 0.25
     */
    static std::string formatHours(double hours);

    /**
     * @brief Экранирование поля CSV (запятая, кавычка, перевод строки)
     */
    static std::string escapeField(const std::string& value);
};

} // namespace ledgerflow::application
