#pragma once

#include "ports/output/IPersistenceGateway.hpp"
#include "LedgerJson.hpp"
#include <filesystem>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerflow::adapters::secondary {

/**
 * @brief Локальное файловое хранилище леджера (JSON)
 *
 * Два файла в каталоге данных:
 * - ledgerflow.json - периоды и записи;
 * - ledgerflow_settings.json - ставка и ID активного периода.
 *
 * Каждый вызов перезаписывает затронутый файл через временный файл
 * и rename, поэтому после перезагрузки виден либо старый, либо новый
 * вариант целиком.
 *
 * Повреждённый файл переименовывается в *.corrupt. Для настроек
 * используются значения по умолчанию. Если повреждён файл данных,
 * в *.corrupt уходят оба файла и loadAll() выбрасывает исключение.
 *
 * clear() удаляет файлы только после того, как оба переименованы
 * в *.cleared; при ошибке переименования файлы возвращаются на место.
 */
class JsonFilePersistenceGateway : public ports::output::IPersistenceGateway {
public:
    static constexpr const char* DATA_FILE = "ledgerflow.json";
    static constexpr const char* SETTINGS_FILE = "ledgerflow_settings.json";
    static constexpr const char* CORRUPT_SUFFIX = ".corrupt";
    static constexpr const char* CLEARED_SUFFIX = ".cleared";

    explicit JsonFilePersistenceGateway(std::filesystem::path dataDir);

    domain::LedgerSnapshot loadAll() override;
    void saveEntry(const std::string& periodId, const domain::Entry& entry) override;
    void savePeriodBoundary(const domain::Period& period) override;
    void removePeriod(const std::string& periodId) override;
    void saveRateConfig(const domain::RateConfig& rateConfig) override;
    void saveActivePeriodId(const std::optional<std::string>& periodId) override;
    void clear() override;

    std::filesystem::path dataFilePath() const { return dataDir_ / DATA_FILE; }
    std::filesystem::path settingsFilePath() const { return dataDir_ / SETTINGS_FILE; }

private:
    std::filesystem::path dataDir_;
    mutable std::mutex mutex_;

    bool loaded_ = false;
    nlohmann::json periods_ = nlohmann::json::array();  ///< Кэш содержимого ledgerflow.json
    StoredSettings settings_;                           ///< Кэш ledgerflow_settings.json

    void ensureLoaded();
    void loadPeriods();
    void loadSettings();

    void writePeriods(const nlohmann::json& periods);
    void writeSettings(const StoredSettings& settings);

    static nlohmann::json::iterator findPeriod(nlohmann::json& periods, const std::string& periodId);
    static void writeAtomically(const std::filesystem::path& path, const nlohmann::json& content);
    static std::filesystem::path clearedPath(const std::filesystem::path& path);
    static void restoreCleared(const std::vector<std::filesystem::path>& cleared);
    static void quarantine(const std::filesystem::path& path);
};

} // namespace ledgerflow::adapters::secondary
