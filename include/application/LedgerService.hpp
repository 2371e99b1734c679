#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IPersistenceGateway.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace ledgerflow::application {

/**
 * @brief Леджер периодов и записей
 *
 * Реализует ILedgerService, координирует работу между:
 * - IPersistenceGateway (запись каждого изменения до возврата)
 * - IClock (дата по умолчанию для записей и границ периодов)
 *
 * Состояние хранится как неизменяемый снимок (copy-on-write):
 * - изменения сериализуются writeMutex_, применяются к копии снимка,
 *   записываются в хранилище и только после успешной записи
 *   публикуются;
 * - читатели берут shared_ptr на текущий снимок под shared_lock и
 *   не блокируют друг друга.
 *
 * При ошибке записи уже выполненные шаги компенсируются в обратном
 * порядке, опубликованный снимок не меняется.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::IPersistenceGateway> gateway,
        std::shared_ptr<ports::output::IClock> clock
    ) : gateway_(std::move(gateway))
      , clock_(std::move(clock))
    {
        state_ = std::make_shared<const domain::LedgerSnapshot>(loadInitialState());
        std::cout << "[LedgerService] Created: " << state_->periods.size() << " periods, "
                  << state_->entryCount() << " entries" << std::endl;
    }

    // ========================================================================
    // Изменения
    // ========================================================================

    domain::Period startNewPeriod(const std::optional<domain::Date>& startDate = std::nullopt) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto current = currentState();
        auto next = std::make_shared<domain::LedgerSnapshot>(*current);
        const domain::Date start = startDate.value_or(clock_->today());

        std::vector<WriteStep> steps;
        domain::Period created = openPeriod(*current, *next, start, steps);

        runSteps(steps);
        publish(std::move(next));

        std::cout << "[LedgerService] Started period " << created.id
                  << " on " << created.startDate.toString() << std::endl;
        return created;
    }

    domain::Entry logHours(
        const std::optional<domain::Date>& date,
        double hours,
        const std::string& note = ""
    ) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto current = currentState();
        auto next = std::make_shared<domain::LedgerSnapshot>(*current);
        const domain::Date day = date.value_or(clock_->today());

        std::vector<WriteStep> steps;
        if (!next->activePeriod()) {
            openPeriod(*current, *next, day, steps);
        }

        // Валидация в Period::addEntry, до любых записей
        domain::Period* active = next->activePeriod();
        domain::Entry entry = active->addEntry(day, hours, note, clock_->now());

        const std::string periodId = active->id;
        steps.push_back({
            "save entry",
            [this, periodId, entry]() { gateway_->saveEntry(periodId, entry); },
            nullptr
        });

        runSteps(steps);
        publish(std::move(next));

        std::cout << "[LedgerService] Logged " << entry.hours << "h on "
                  << entry.date.toString() << " (period " << periodId << ")" << std::endl;
        return entry;
    }

    void updateRateConfig(const domain::RateConfig& newConfig) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto next = std::make_shared<domain::LedgerSnapshot>(*currentState());
        next->rateConfig = newConfig;

        runSteps({{
            "save rate config",
            [this, newConfig]() { gateway_->saveRateConfig(newConfig); },
            nullptr
        }});
        publish(std::move(next));

        std::cout << "[LedgerService] " << newConfig.describe() << std::endl;
    }

    void clearAllData() override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        runSteps({{
            "clear storage",
            [this]() { gateway_->clear(); },
            nullptr
        }});
        publish(std::make_shared<domain::LedgerSnapshot>());

        std::cout << "[LedgerService] All data cleared" << std::endl;
    }

    // ========================================================================
    // Запросы
    // ========================================================================

    std::optional<domain::Period> activePeriod() const override {
        auto state = currentState();
        const domain::Period* active = state->activePeriod();
        if (!active) {
            return std::nullopt;
        }
        return *active;
    }

    std::vector<domain::Period> periods() const override {
        return currentState()->periods;
    }

    domain::RateConfig rateConfig() const override {
        return currentState()->rateConfig;
    }

    domain::LedgerSnapshot snapshot() const override {
        return *currentState();
    }

    std::vector<domain::Entry> recentEntries(size_t limit, bool includeClosed = false) const override {
        auto state = currentState();
        std::vector<domain::Entry> result;

        for (auto period = state->periods.rbegin(); period != state->periods.rend(); ++period) {
            if (!includeClosed && !period->isActive()) {
                continue;
            }
            for (auto entry = period->entries.rbegin(); entry != period->entries.rend(); ++entry) {
                if (result.size() >= limit) {
                    return result;
                }
                result.push_back(*entry);
            }
        }

        return result;
    }

private:
    /**
     * @brief Шаг записи в хранилище с компенсирующим действием
     */
    struct WriteStep {
        std::string name;
        std::function<void()> apply;
        std::function<void()> undo;     ///< nullptr - компенсация не нужна
    };

    std::shared_ptr<ports::output::IPersistenceGateway> gateway_;
    std::shared_ptr<ports::output::IClock> clock_;

    std::mutex writeMutex_;
    mutable std::shared_mutex stateMutex_;
    std::shared_ptr<const domain::LedgerSnapshot> state_;

    std::shared_ptr<const domain::LedgerSnapshot> currentState() const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        return state_;
    }

    void publish(std::shared_ptr<const domain::LedgerSnapshot> next) {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        state_ = std::move(next);
    }

    /**
     * @brief Закрыть активный период (если есть) и открыть новый в next
     *
     * Добавляет в steps записи: новый период, граница предыдущего,
     * ID активного периода.
     *
     * @throws domain::InvalidPeriodError если start раньше начала активного периода
     */
    domain::Period openPeriod(
        const domain::LedgerSnapshot& current,
        domain::LedgerSnapshot& next,
        const domain::Date& start,
        std::vector<WriteStep>& steps
    ) {
        const domain::Period* previous = current.activePeriod();

        if (domain::Period* active = next.activePeriod()) {
            active->close(start);
        }

        domain::Period created(utils::IdGenerator::generate(utils::IdGenerator::PERIOD_PREFIX), start);
        next.periods.push_back(created);
        next.activePeriodId = created.id;

        steps.push_back({
            "save new period",
            [this, created]() { gateway_->savePeriodBoundary(created); },
            [this, id = created.id]() { gateway_->removePeriod(id); }
        });

        if (previous) {
            domain::Period reopened = *previous;
            domain::Period closed = *previous;
            closed.endDate = start;
            steps.push_back({
                "close period " + previous->id,
                [this, closed]() { gateway_->savePeriodBoundary(closed); },
                [this, reopened]() { gateway_->savePeriodBoundary(reopened); }
            });
        }

        const std::optional<std::string> previousActiveId = current.activePeriodId;
        steps.push_back({
            "save active period id",
            [this, id = created.id]() { gateway_->saveActivePeriodId(id); },
            [this, previousActiveId]() { gateway_->saveActivePeriodId(previousActiveId); }
        });

        return created;
    }

    /**
     * @brief Выполнить шаги записи; при ошибке откатить выполненные
     * @throws domain::PersistenceError
     */
    void runSteps(const std::vector<WriteStep>& steps) {
        for (size_t i = 0; i < steps.size(); ++i) {
            try {
                steps[i].apply();
            } catch (const std::exception& e) {
                std::cerr << "[LedgerService] " << steps[i].name << " failed: " << e.what() << std::endl;
                rollback(steps, i);
                throw domain::PersistenceError("Failed to " + steps[i].name + ": " + e.what());
            }
        }
    }

    void rollback(const std::vector<WriteStep>& steps, size_t failedIndex) {
        for (size_t i = failedIndex; i-- > 0;) {
            if (!steps[i].undo) {
                continue;
            }
            try {
                steps[i].undo();
            } catch (const std::exception& e) {
                std::cerr << "[LedgerService] Rollback of '" << steps[i].name
                          << "' failed: " << e.what() << std::endl;
            }
        }
    }

    /**
     * @brief Загрузить состояние; при ошибке - пустой леджер
     */
    domain::LedgerSnapshot loadInitialState() {
        domain::LedgerSnapshot loaded;
        try {
            loaded = gateway_->loadAll();
        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] Failed to load ledger, starting empty: " << e.what() << std::endl;
            return domain::LedgerSnapshot();
        }

        repairActivePeriod(loaded);
        return loaded;
    }

    /**
     * @brief Восстановить инвариант "не более одного активного периода, и он последний"
     */
    static void repairActivePeriod(domain::LedgerSnapshot& snapshot) {
        auto& periods = snapshot.periods;

        for (size_t i = 0; i + 1 < periods.size(); ++i) {
            if (periods[i].isActive()) {
                periods[i].endDate = std::max(periods[i].startDate, periods[i + 1].startDate);
                std::cerr << "[LedgerService] Warning: period " << periods[i].id
                          << " was open but not last, treating as closed on "
                          << periods[i].endDate->toString() << std::endl;
            }
        }

        if (!periods.empty() && periods.back().isActive()) {
            if (snapshot.activePeriodId != periods.back().id) {
                std::cerr << "[LedgerService] Warning: active period id mismatch, using "
                          << periods.back().id << std::endl;
                snapshot.activePeriodId = periods.back().id;
            }
        } else {
            snapshot.activePeriodId.reset();
        }
    }
};

} // namespace ledgerflow::application
