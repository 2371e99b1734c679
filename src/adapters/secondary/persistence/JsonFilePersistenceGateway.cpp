#include "adapters/secondary/persistence/JsonFilePersistenceGateway.hpp"
#include "domain/exceptions/LedgerException.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace ledgerflow::adapters::secondary {

namespace fs = std::filesystem;

JsonFilePersistenceGateway::JsonFilePersistenceGateway(fs::path dataDir)
    : dataDir_(std::move(dataDir))
{
    std::cout << "[JsonFilePersistence] Data directory: " << dataDir_.string() << std::endl;
}

// ============================================================================
// Загрузка
// ============================================================================

domain::LedgerSnapshot JsonFilePersistenceGateway::loadAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    loaded_ = false;
    periods_ = nlohmann::json::array();
    settings_ = StoredSettings();

    loadSettings();
    loadPeriods();
    loaded_ = true;

    domain::LedgerSnapshot snapshot;
    for (const auto& p : periods_) {
        snapshot.periods.push_back(json_codec::periodFromJson(p));
    }
    snapshot.rateConfig = settings_.rateConfig;
    snapshot.activePeriodId = settings_.activePeriodId;

    std::cout << "[JsonFilePersistence] Loaded " << snapshot.periods.size() << " periods" << std::endl;
    return snapshot;
}

void JsonFilePersistenceGateway::ensureLoaded() {
    if (loaded_) {
        return;
    }
    loadSettings();
    loadPeriods();
    loaded_ = true;
}

void JsonFilePersistenceGateway::loadPeriods() {
    const fs::path path = dataFilePath();
    if (!fs::exists(path)) {
        periods_ = nlohmann::json::array();
        return;
    }

    try {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("cannot open " + path.string());
        }

        auto doc = nlohmann::json::parse(in);
        nlohmann::json periods = doc.at("periods");
        if (!periods.is_array()) {
            throw std::runtime_error("\"periods\" is not an array");
        }

        // Проверяем структуру до того, как принять документ
        for (const auto& p : periods) {
            json_codec::periodFromJson(p);
        }
        periods_ = std::move(periods);

    } catch (const std::exception& e) {
        std::cerr << "[JsonFilePersistence] Data file is corrupt: " << e.what() << std::endl;
        quarantine(path);
        periods_ = nlohmann::json::array();

        // Ставка и ID активного периода относятся к потерянным данным:
        // после сбоя на диске должен остаться пустой леджер по умолчанию
        if (fs::exists(settingsFilePath())) {
            quarantine(settingsFilePath());
        }
        settings_ = StoredSettings();
        throw std::runtime_error("Corrupt data file " + path.string() + ": " + e.what());
    }
}

void JsonFilePersistenceGateway::loadSettings() {
    const fs::path path = settingsFilePath();
    if (!fs::exists(path)) {
        settings_ = StoredSettings();
        return;
    }

    try {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("cannot open " + path.string());
        }
        settings_ = json_codec::settingsFromJson(nlohmann::json::parse(in));

    } catch (const std::exception& e) {
        std::cerr << "[JsonFilePersistence] Settings file is corrupt, defaults will be used: "
                  << e.what() << std::endl;
        quarantine(path);
        settings_ = StoredSettings();
    }
}

// ============================================================================
// Запись
// ============================================================================

void JsonFilePersistenceGateway::saveEntry(const std::string& periodId, const domain::Entry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    nlohmann::json periods = periods_;
    auto period = findPeriod(periods, periodId);
    if (period == periods.end()) {
        throw std::runtime_error("Period not found: " + periodId);
    }

    auto& entries = (*period)["entries"];
    bool replaced = false;
    for (auto& e : entries) {
        if (e.at("id") == entry.id) {
            e = json_codec::entryToJson(entry);
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        entries.push_back(json_codec::entryToJson(entry));
    }

    writePeriods(periods);
}

void JsonFilePersistenceGateway::savePeriodBoundary(const domain::Period& period) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    nlohmann::json periods = periods_;
    auto existing = findPeriod(periods, period.id);

    domain::Period boundary(period.id, period.startDate);
    boundary.endDate = period.endDate;
    nlohmann::json boundaryJson = json_codec::periodToJson(boundary);

    if (existing != periods.end()) {
        (*existing)["start_date"] = boundaryJson["start_date"];
        (*existing)["end_date"] = boundaryJson["end_date"];
    } else {
        periods.push_back(boundaryJson);
    }

    writePeriods(periods);
}

void JsonFilePersistenceGateway::removePeriod(const std::string& periodId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    nlohmann::json periods = periods_;
    auto existing = findPeriod(periods, periodId);
    if (existing == periods.end()) {
        return;
    }
    periods.erase(existing);

    writePeriods(periods);
}

void JsonFilePersistenceGateway::saveRateConfig(const domain::RateConfig& rateConfig) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    StoredSettings settings = settings_;
    settings.rateConfig = rateConfig;
    writeSettings(settings);
}

void JsonFilePersistenceGateway::saveActivePeriodId(const std::optional<std::string>& periodId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    StoredSettings settings = settings_;
    settings.activePeriodId = periodId;
    writeSettings(settings);
}

void JsonFilePersistenceGateway::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Сначала оба файла переименовываются в *.cleared; если второй
    // rename не удался, первый возвращается на место
    std::vector<fs::path> cleared;
    for (const fs::path& path : {dataFilePath(), settingsFilePath()}) {
        if (!fs::exists(path)) {
            continue;
        }

        std::error_code ec;
        fs::rename(path, clearedPath(path), ec);
        if (ec) {
            const std::string reason = ec.message();
            restoreCleared(cleared);
            throw std::runtime_error("Failed to clear " + path.string() + ": " + reason);
        }
        cleared.push_back(path);
    }

    for (const auto& path : cleared) {
        std::error_code ec;
        fs::remove(clearedPath(path), ec);
        if (ec) {
            std::cerr << "[JsonFilePersistence] Could not remove " << clearedPath(path).string()
                      << ": " << ec.message() << std::endl;
        }
    }

    periods_ = nlohmann::json::array();
    settings_ = StoredSettings();
    loaded_ = true;

    std::cout << "[JsonFilePersistence] Storage cleared" << std::endl;
}

// ============================================================================
// Вспомогательные
// ============================================================================

void JsonFilePersistenceGateway::writePeriods(const nlohmann::json& periods) {
    nlohmann::json doc;
    doc["version"] = 1;
    doc["periods"] = periods;

    writeAtomically(dataFilePath(), doc);
    periods_ = periods;
}

void JsonFilePersistenceGateway::writeSettings(const StoredSettings& settings) {
    writeAtomically(settingsFilePath(), json_codec::settingsToJson(settings));
    settings_ = settings;
}

nlohmann::json::iterator JsonFilePersistenceGateway::findPeriod(
    nlohmann::json& periods,
    const std::string& periodId
) {
    for (auto it = periods.begin(); it != periods.end(); ++it) {
        if ((*it).at("id") == periodId) {
            return it;
        }
    }
    return periods.end();
}

void JsonFilePersistenceGateway::writeAtomically(const fs::path& path, const nlohmann::json& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Failed to create " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open " + tmp.string() + " for writing");
        }
        out << content.dump(2) << std::endl;
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed to write " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + reason);
    }
}

fs::path JsonFilePersistenceGateway::clearedPath(const fs::path& path) {
    fs::path cleared = path;
    cleared += CLEARED_SUFFIX;
    return cleared;
}

void JsonFilePersistenceGateway::restoreCleared(const std::vector<fs::path>& cleared) {
    for (auto it = cleared.rbegin(); it != cleared.rend(); ++it) {
        std::error_code ec;
        fs::rename(clearedPath(*it), *it, ec);
        if (ec) {
            std::cerr << "[JsonFilePersistence] Could not restore " << it->string()
                      << ": " << ec.message() << std::endl;
        }
    }
}

void JsonFilePersistenceGateway::quarantine(const fs::path& path) {
    fs::path backup = path;
    backup += CORRUPT_SUFFIX;

    std::error_code ec;
    fs::rename(path, backup, ec);
    if (ec) {
        std::cerr << "[JsonFilePersistence] Could not rename " << path.string()
                  << ": " << ec.message() << std::endl;
        return;
    }
    std::cerr << "[JsonFilePersistence] Corrupt file renamed to " << backup.string() << std::endl;
}

} // namespace ledgerflow::adapters::secondary
