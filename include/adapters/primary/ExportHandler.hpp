#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "application/ExportFormatter.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include <iostream>
#include <memory>

namespace ledgerflow::adapters::primary {

/**
 * @brief export - текстовый отчёт по всем периодам
 */
class ExportHandler : public ICommandHandler {
public:
    ExportHandler(
        std::shared_ptr<ports::input::ILedgerService> ledger,
        std::shared_ptr<ports::output::IClock> clock
    ) : ledger_(std::move(ledger))
      , clock_(std::move(clock))
    {
        std::cout << "[ExportHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) override {
        auto parsed = CommandArgs::parse(args, {});
        parsed.expectPositionalAtMost(0);

        const auto snapshot = ledger_->snapshot();
        out << application::ExportFormatter::format(snapshot.periods, snapshot.rateConfig, clock_->now());
        return 0;
    }

    std::string usage() const override {
        return "export";
    }

    std::string description() const override {
        return "Print all periods and entries as CSV";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace ledgerflow::adapters::primary
