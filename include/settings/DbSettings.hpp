#pragma once

#include <cstdlib>
#include <string>

namespace ledgerflow::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * Читает параметры из переменных окружения; используются только
 * при LEDGERFLOW_STORAGE=postgres.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("LEDGERFLOW_DB_HOST", "localhost");
        port_ = getEnvOrDefault("LEDGERFLOW_DB_PORT", "5432");
        name_ = getEnvOrDefault("LEDGERFLOW_DB_NAME", "ledgerflow");
        user_ = getEnvOrDefault("LEDGERFLOW_DB_USER", "ledgerflow");
        password_ = getEnvOrDefault("LEDGERFLOW_DB_PASSWORD", "");
    }

    std::string getHost() const { return host_; }
    std::string getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }

    std::string getConnectionString() const {
        std::string conn = "host=" + host_ + " port=" + port_ +
                           " dbname=" + name_ + " user=" + user_;
        if (!password_.empty()) {
            conn += " password=" + password_;
        }
        return conn;
    }

private:
    std::string host_;
    std::string port_;
    std::string name_;
    std::string user_;
    std::string password_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace ledgerflow::settings
