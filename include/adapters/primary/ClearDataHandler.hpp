#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "ports/input/ILedgerService.hpp"
#include <iostream>
#include <memory>

namespace ledgerflow::adapters::primary {

/**
 * @brief clear --yes
 *
 * Удаляет все периоды и сбрасывает ставку. Без --yes ничего не делает.
 */
class ClearDataHandler : public ICommandHandler {
public:
    explicit ClearDataHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger))
    {
        std::cout << "[ClearDataHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) override {
        auto parsed = CommandArgs::parse(args, {}, {"--yes"});
        parsed.expectPositionalAtMost(0);

        if (!parsed.hasFlag("--yes")) {
            throw UsageError("This deletes all periods, entries and settings; confirm with --yes");
        }

        ledger_->clearAllData();
        out << "All data cleared\n";
        return 0;
    }

    std::string usage() const override {
        return "clear --yes";
    }

    std::string description() const override {
        return "Delete all periods, entries and settings";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledgerflow::adapters::primary
