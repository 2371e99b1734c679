#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "domain/RateConfig.hpp"
#include "ports/input/ILedgerService.hpp"
#include <iostream>
#include <memory>

namespace ledgerflow::adapters::primary {

/**
 * @brief Просмотр и изменение ставки
 *
 * - rate - текущая ставка
 * - rate set [--base X] [--tips Y] [--include-tips|--exclude-tips]
 *
 * Не указанные значения остаются прежними, avgTipRate сохраняется
 * и при выключенных чаевых.
 */
class RateConfigHandler : public ICommandHandler {
public:
    explicit RateConfigHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger))
    {
        std::cout << "[RateConfigHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) override {
        auto parsed = CommandArgs::parse(
            args,
            {"--base", "--tips"},
            {"--include-tips", "--exclude-tips"}
        );

        if (parsed.positional.empty()) {
            if (!parsed.options.empty() || !parsed.flags.empty()) {
                throw UsageError("Options require 'rate set'");
            }
            out << ledger_->rateConfig().describe() << "\n";
            return 0;
        }

        if (parsed.positional[0] != "set") {
            throw UsageError("Unknown rate subcommand: " + parsed.positional[0]);
        }
        parsed.expectPositionalAtMost(1);
        handleSet(parsed, out);
        return 0;
    }

    std::string usage() const override {
        return "rate [set [--base X] [--tips Y] [--include-tips|--exclude-tips]]";
    }

    std::string description() const override {
        return "Show or change the hourly rate";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;

    void handleSet(const CommandArgs& parsed, std::ostream& out) {
        if (parsed.options.empty() && parsed.flags.empty()) {
            throw UsageError("Nothing to set");
        }
        if (parsed.hasFlag("--include-tips") && parsed.hasFlag("--exclude-tips")) {
            throw UsageError("--include-tips and --exclude-tips are mutually exclusive");
        }

        const domain::RateConfig current = ledger_->rateConfig();

        double baseRate = current.baseRate();
        if (auto value = parsed.option("--base")) {
            baseRate = CommandArgs::parseNumber("base rate", *value);
        }

        double avgTipRate = current.avgTipRate();
        if (auto value = parsed.option("--tips")) {
            avgTipRate = CommandArgs::parseNumber("tip rate", *value);
        }

        bool includeTips = current.includeTips();
        if (parsed.hasFlag("--include-tips")) {
            includeTips = true;
        } else if (parsed.hasFlag("--exclude-tips")) {
            includeTips = false;
        }

        // InvalidRateError здесь - до любой записи
        const auto updated = domain::RateConfig::update(baseRate, includeTips, avgTipRate);
        ledger_->updateRateConfig(updated);

        out << "Saved. " << updated.describe() << "\n";
    }
};

} // namespace ledgerflow::adapters::primary
