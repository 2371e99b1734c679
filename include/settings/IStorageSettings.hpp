#pragma once

#include <string>

namespace ledgerflow::settings {

/**
 * @brief Тип хранилища леджера
 */
enum class StorageKind {
    JSON,       ///< Локальные JSON-файлы (по умолчанию)
    MEMORY,     ///< В памяти процесса
    POSTGRES    ///< PostgreSQL
};

class IStorageSettings {
public:
    virtual ~IStorageSettings() = default;

    virtual StorageKind getKind() const = 0;
    virtual std::string getDataDir() const = 0;
};

} // namespace ledgerflow::settings
