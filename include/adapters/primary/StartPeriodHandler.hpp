#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "ports/input/ILedgerService.hpp"
#include <iostream>
#include <memory>

namespace ledgerflow::adapters::primary {

/**
 * @brief new-period [--date YYYY-MM-DD]
 */
class StartPeriodHandler : public ICommandHandler {
public:
    explicit StartPeriodHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger))
    {
        std::cout << "[StartPeriodHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) override {
        auto parsed = CommandArgs::parse(args, {"--date"});
        parsed.expectPositionalAtMost(0);

        const auto startDate = CommandArgs::optionalDate(parsed.option("--date"));
        const auto previous = ledger_->activePeriod();

        domain::Period period = ledger_->startNewPeriod(startDate);

        if (previous) {
            out << "Closed period started " << previous->startDate.toString()
                << " (" << previous->id << ")\n";
        }
        out << "Started new period on " << period.startDate.toString()
            << " (" << period.id << ")\n";
        return 0;
    }

    std::string usage() const override {
        return "new-period [--date YYYY-MM-DD]";
    }

    std::string description() const override {
        return "Close the active period and start a new one";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledgerflow::adapters::primary
