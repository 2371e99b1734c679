#pragma once

#include <memory>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

// Forward declarations
namespace ledgerflow::ports::output {
    class IPersistenceGateway;
}

namespace ledgerflow::settings {
    class IStorageSettings;
    class LedgerSettings;
}

namespace ledgerflow::adapters::primary {
    class CommandRouter;
}

/**
 * @class LedgerFlowApp
 * @brief Приложение LedgerFlow (CLI)
 *
 * Template Method в run():
 * 1. loadEnvironment() - настройки из ENV, перенаправление логов
 * 2. configureInjection() - Boost.DI и регистрация команд
 * 3. execute() - выполнение одной команды
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: обработчики команд CLI
 * - Secondary Adapters: JsonFile/InMemory/Postgres хранилище, SystemClock
 *
 * Вывод для пользователя идёт в stdout, служебные логи ([Tag] ...)
 * в stderr; при LEDGERFLOW_QUIET=1 служебные логи отключаются.
 */
class LedgerFlowApp
{
public:
    LedgerFlowApp();
    ~LedgerFlowApp();

    LedgerFlowApp(const LedgerFlowApp&) = delete;
    LedgerFlowApp& operator=(const LedgerFlowApp&) = delete;

    /**
     * @return Код завершения процесса
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Настроить Boost.DI контейнер и зарегистрировать команды
     *
     * 1. Output Ports -> Secondary Adapters (хранилище по LEDGERFLOW_STORAGE)
     * 2. Input Port -> LedgerService
     * 3. Обработчики команд с автоматическим разрешением зависимостей
     */
    void configureInjection();

    int execute();

private:
    std::shared_ptr<ledgerflow::ports::output::IPersistenceGateway> createGateway() const;

    std::vector<std::string> args_;
    std::shared_ptr<ledgerflow::settings::IStorageSettings> storageSettings_;
    std::shared_ptr<ledgerflow::settings::LedgerSettings> ledgerSettings_;
    std::unique_ptr<ledgerflow::adapters::primary::CommandRouter> router_;

    std::streambuf* stdoutBuffer_;  ///< Исходный буфер std::cout
    std::ostream out_;              ///< Вывод команд (stdout)
};
