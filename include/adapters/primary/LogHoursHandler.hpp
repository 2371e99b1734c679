#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "application/ExportFormatter.hpp"
#include "domain/EarningsCalculator.hpp"
#include "ports/input/ILedgerService.hpp"
#include <iostream>
#include <memory>

namespace ledgerflow::adapters::primary {

/**
 * @brief log <hours> [--date YYYY-MM-DD] [--note TEXT]
 *
 * Записывает часы в активный период (создаёт период, если его нет)
 * и показывает заработок за запись: "+ $150.75 today".
 */
class LogHoursHandler : public ICommandHandler {
public:
    explicit LogHoursHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger))
    {
        std::cout << "[LogHoursHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) override {
        auto parsed = CommandArgs::parse(args, {"--date", "--note"});
        if (parsed.positional.empty()) {
            throw UsageError("Missing <hours>");
        }
        parsed.expectPositionalAtMost(1);

        const double hours = CommandArgs::parseNumber("hours", parsed.positional[0]);
        const auto date = CommandArgs::optionalDate(parsed.option("--date"));
        const std::string note = parsed.option("--note").value_or("");

        domain::Entry entry = ledger_->logHours(date, hours, note);
        const double earned = domain::EarningsCalculator::entryEarnings(entry, ledger_->rateConfig());

        out << "Logged " << application::ExportFormatter::formatHours(entry.hours)
            << "h on " << entry.date.toString();
        if (entry.hasNote()) {
            out << " (" << entry.note << ")";
        }
        out << "\n";
        out << "+ " << domain::EarningsCalculator::formatCurrency(earned) << " today\n";
        return 0;
    }

    std::string usage() const override {
        return "log <hours> [--date YYYY-MM-DD] [--note TEXT]";
    }

    std::string description() const override {
        return "Log worked hours into the active period";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledgerflow::adapters::primary
