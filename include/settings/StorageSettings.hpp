#pragma once

#include "settings/IStorageSettings.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

namespace ledgerflow::settings {

/**
 * @brief Настройки хранилища из ENV
 *
 * - LEDGERFLOW_STORAGE: json (default) | memory | postgres
 * - LEDGERFLOW_DATA_DIR: каталог JSON-файлов (default: $HOME/.ledgerflow)
 */
class StorageSettings : public IStorageSettings {
public:
    StorageKind getKind() const override {
        const char* kind = std::getenv("LEDGERFLOW_STORAGE");
        if (!kind) {
            return StorageKind::JSON;
        }

        const std::string value(kind);
        if (value == "json") return StorageKind::JSON;
        if (value == "memory") return StorageKind::MEMORY;
        if (value == "postgres") return StorageKind::POSTGRES;

        std::cerr << "[StorageSettings] Unknown LEDGERFLOW_STORAGE '" << value
                  << "', using json" << std::endl;
        return StorageKind::JSON;
    }

    std::string getDataDir() const override {
        if (const char* dir = std::getenv("LEDGERFLOW_DATA_DIR")) {
            return dir;
        }
        if (const char* home = std::getenv("HOME")) {
            return std::string(home) + "/.ledgerflow";
        }
        return ".";
    }
};

} // namespace ledgerflow::settings
