#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "application/ExportFormatter.hpp"
#include "domain/EarningsCalculator.hpp"
#include "ports/input/ILedgerService.hpp"
#include "settings/LedgerSettings.hpp"
#include <cmath>
#include <iostream>
#include <memory>

namespace ledgerflow::adapters::primary {

/**
 * @brief entries [--limit N] [--all]
 *
 * Последние записи, новые первыми. Без --all - только активный период.
 */
class EntriesHandler : public ICommandHandler {
public:
    EntriesHandler(
        std::shared_ptr<ports::input::ILedgerService> ledger,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : ledger_(std::move(ledger))
      , settings_(std::move(settings))
    {
        std::cout << "[EntriesHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) override {
        auto parsed = CommandArgs::parse(args, {"--limit"}, {"--all"});
        parsed.expectPositionalAtMost(0);

        size_t limit = settings_->getRecentLimit();
        if (auto value = parsed.option("--limit")) {
            const double number = CommandArgs::parseNumber("limit", *value);
            if (number < 0 || std::floor(number) != number) {
                throw UsageError("Limit must be a non-negative integer: " + *value);
            }
            limit = static_cast<size_t>(number);
        }

        const auto entries = ledger_->recentEntries(limit, parsed.hasFlag("--all"));
        if (entries.empty()) {
            out << "No entries\n";
            return 0;
        }

        const domain::RateConfig rateConfig = ledger_->rateConfig();
        for (const auto& entry : entries) {
            out << entry.date.toString() << "  "
                << application::ExportFormatter::formatHours(entry.hours) << "h  "
                << domain::EarningsCalculator::formatCurrency(
                       domain::EarningsCalculator::entryEarnings(entry, rateConfig));
            if (entry.hasNote()) {
                out << "  " << entry.note;
            }
            out << "\n";
        }
        return 0;
    }

    std::string usage() const override {
        return "entries [--limit N] [--all]";
    }

    std::string description() const override {
        return "List recent entries, newest first";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace ledgerflow::adapters::primary
