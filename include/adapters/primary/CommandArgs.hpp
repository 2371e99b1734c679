#pragma once

#include "domain/Date.hpp"
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledgerflow::adapters::primary {

/**
 * @brief Неверный синтаксис команды (код завершения 2)
 */
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Разобранные аргументы команды
 *
 * "--name value" для опций со значением, "--name" для флагов,
 * всё остальное - позиционные аргументы в исходном порядке.
 */
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    /**
     * @throws UsageError для неизвестной опции или опции без значения
     */
    static CommandArgs parse(
        const std::vector<std::string>& raw,
        const std::set<std::string>& valueOptions,
        const std::set<std::string>& flagOptions = {}
    ) {
        CommandArgs parsed;

        for (size_t i = 0; i < raw.size(); ++i) {
            const std::string& arg = raw[i];

            if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
                parsed.positional.push_back(arg);
                continue;
            }

            if (valueOptions.count(arg)) {
                if (i + 1 >= raw.size()) {
                    throw UsageError("Option " + arg + " requires a value");
                }
                parsed.options[arg] = raw[++i];
            } else if (flagOptions.count(arg)) {
                parsed.flags.insert(arg);
            } else {
                throw UsageError("Unknown option: " + arg);
            }
        }

        return parsed;
    }

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool hasFlag(const std::string& name) const {
        return flags.count(name) > 0;
    }

    /**
     * @brief Проверить, что позиционных аргументов не больше max
     */
    void expectPositionalAtMost(size_t max) const {
        if (positional.size() > max) {
            throw UsageError("Unexpected argument: " + positional[max]);
        }
    }

    /**
     * @brief Разобрать число целиком ("2.5"); "2.5h" - ошибка
     * @throws UsageError
     */
    static double parseNumber(const std::string& what, const std::string& value) {
        size_t pos = 0;
        double number = 0.0;
        try {
            number = std::stod(value, &pos);
        } catch (const std::exception&) {
            throw UsageError("Invalid " + what + ": " + value);
        }
        if (pos != value.size()) {
            throw UsageError("Invalid " + what + ": " + value);
        }
        return number;
    }

    /**
     * @brief Разобрать дату "YYYY-MM-DD"
     * @throws UsageError
     */
    static domain::Date parseDate(const std::string& value) {
        try {
            return domain::Date::fromString(value);
        } catch (const std::invalid_argument& e) {
            throw UsageError(e.what());
        }
    }

    static std::optional<domain::Date> optionalDate(const std::optional<std::string>& value) {
        if (!value) {
            return std::nullopt;
        }
        return parseDate(*value);
    }
};

} // namespace ledgerflow::adapters::primary
