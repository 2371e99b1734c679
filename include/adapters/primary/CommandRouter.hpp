#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ledgerflow::adapters::primary {

/**
 * @brief Диспетчер команд CLI
 *
 * Коды завершения:
 * - 0 - успех;
 * - 1 - ошибка леджера или хранилища (сообщение в err);
 * - 2 - неверный синтаксис (сообщение и usage в err).
 */
class CommandRouter {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_ERROR = 1;
    static constexpr int EXIT_USAGE = 2;

    void registerHandler(const std::string& command, std::shared_ptr<ICommandHandler> handler) {
        handlers_[command] = std::move(handler);
    }

    size_t size() const {
        return handlers_.size();
    }

    /**
     * @param argv Аргументы без имени программы: {"log", "5", "--note", "x"}
     */
    int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err) const {
        if (argv.empty()) {
            printHelp(err);
            return EXIT_USAGE;
        }

        const std::string& command = argv[0];
        if (command == "help" || command == "--help" || command == "-h") {
            printHelp(out);
            return EXIT_OK;
        }

        auto it = handlers_.find(command);
        if (it == handlers_.end()) {
            err << "Unknown command: " << command << "\n";
            printHelp(err);
            return EXIT_USAGE;
        }

        const std::vector<std::string> args(argv.begin() + 1, argv.end());
        const auto& handler = it->second;

        try {
            return handler->handle(args, out);
        } catch (const domain::LedgerException& e) {
            err << "Error: " << e.what() << "\n";
            return EXIT_ERROR;
        } catch (const std::invalid_argument& e) {
            err << "Usage error: " << e.what() << "\n";
            err << "Usage: ledgerflow " << handler->usage() << "\n";
            return EXIT_USAGE;
        } catch (const std::exception& e) {
            err << "Error: " << e.what() << "\n";
            return EXIT_ERROR;
        }
    }

    void printHelp(std::ostream& out) const {
        out << "Usage: ledgerflow <command> [args]\n\nCommands:\n";
        for (const auto& item : handlers_) {
            out << "  " << item.second->usage() << "\n";
            out << "      " << item.second->description() << "\n";
        }
        out << "  help\n      Show this message\n";
    }

private:
    std::map<std::string, std::shared_ptr<ICommandHandler>> handlers_;
};

} // namespace ledgerflow::adapters::primary
