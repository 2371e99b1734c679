#pragma once

#include "domain/Entry.hpp"
#include "domain/Period.hpp"
#include "domain/RateConfig.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ledgerflow::adapters::secondary {

/**
 * @brief Настройки в хранилище: ставка + ID активного периода
 */
struct StoredSettings {
    domain::RateConfig rateConfig;
    std::optional<std::string> activePeriodId;
};

/**
 * @brief JSON-представление доменных объектов для хранилищ
 *
 * Ключи настроек совместимы с ledgerflow_settings.json:
 * "base_rate", "use_tips", "avg_tips", "active_period_id".
 *
 * Функции *FromJson выбрасывают nlohmann::json::exception при неверной
 * структуре, std::invalid_argument при неверной дате и
 * domain::InvalidRateError при отрицательной ставке.
 */
namespace json_codec {

nlohmann::json entryToJson(const domain::Entry& entry);
domain::Entry entryFromJson(const nlohmann::json& j);

/**
 * @brief Период вместе с записями
 */
nlohmann::json periodToJson(const domain::Period& period);
domain::Period periodFromJson(const nlohmann::json& j);

nlohmann::json settingsToJson(const StoredSettings& settings);

/**
 * @brief Отсутствующие ключи заменяются значениями по умолчанию
 */
StoredSettings settingsFromJson(const nlohmann::json& j);

} // namespace json_codec

} // namespace ledgerflow::adapters::secondary
