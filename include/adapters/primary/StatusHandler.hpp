#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/CommandArgs.hpp"
#include "application/ExportFormatter.hpp"
#include "domain/EarningsCalculator.hpp"
#include "ports/input/ILedgerService.hpp"
#include "settings/LedgerSettings.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace ledgerflow::adapters::primary {

/**
 * @brief status [--target HOURS]
 *
 * Сводка по активному периоду: часы, ставка, заработок по факту
 * и прогноз на целевое количество часов.
 */
class StatusHandler : public ICommandHandler {
public:
    StatusHandler(
        std::shared_ptr<ports::input::ILedgerService> ledger,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : ledger_(std::move(ledger))
      , settings_(std::move(settings))
    {
        std::cout << "[StatusHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) override {
        auto parsed = CommandArgs::parse(args, {"--target"});
        parsed.expectPositionalAtMost(0);

        double targetHours = settings_->getTargetHours();
        if (auto target = parsed.option("--target")) {
            targetHours = CommandArgs::parseNumber("target", *target);
        }

        // Один снимок: период и ставка согласованы между собой
        const domain::LedgerSnapshot snapshot = ledger_->snapshot();
        const domain::Period* active = snapshot.activePeriod();
        const auto summary = domain::EarningsCalculator::summarize(active, snapshot.rateConfig, targetHours);

        if (active) {
            out << "Period: started " << active->startDate.toString()
                << " (" << active->entries.size() << " entries)\n";
        } else {
            out << "Period: none (log hours or run new-period to start one)\n";
        }

        out << "Hours: " << application::ExportFormatter::formatHours(summary.totalHours)
            << " / " << application::ExportFormatter::formatHours(summary.targetHours)
            << " (" << formatPercent(summary.progress) << ")\n";

        out << snapshot.rateConfig.describe() << "\n";
        out << "Earned: " << domain::EarningsCalculator::formatCurrency(summary.actual) << "\n";
        out << "Projected: " << domain::EarningsCalculator::formatCurrency(summary.projected)
            << " at " << application::ExportFormatter::formatHours(summary.targetHours) << "h\n";
        return 0;
    }

    std::string usage() const override {
        return "status [--target HOURS]";
    }

    std::string description() const override {
        return "Show hours and earnings of the active period";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static std::string formatPercent(double ratio) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
        return ss.str();
    }
};

} // namespace ledgerflow::adapters::primary
