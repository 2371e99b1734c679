#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace ledgerflow::adapters::primary {

/**
 * @brief Обработчик одной команды CLI
 *
 * Primary Adapter: разбирает аргументы, вызывает Input Port
 * и печатает результат в out.
 */
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    /**
     * @brief Выполнить команду
     *
     * @param args Аргументы после имени команды
     * @param out Поток для вывода пользователю
     * @return Код завершения (0 - успех)
     *
     * @throws UsageError при неверных аргументах
     * @throws domain::LedgerException при отказе леджера
     */
    virtual int handle(const std::vector<std::string>& args, std::ostream& out) = 0;

    /**
     * @brief Строка синтаксиса для справки ("log <hours> [--date YYYY-MM-DD] ...")
     */
    virtual std::string usage() const = 0;

    /**
     * @brief Краткое описание для справки
     */
    virtual std::string description() const = 0;
};

} // namespace ledgerflow::adapters::primary
