/**
 * @file LedgerServiceTest.cpp
 * @brief Unit tests for LedgerService
 */

#include <gtest/gtest.h>
#include "application/LedgerService.hpp"
#include "adapters/secondary/persistence/InMemoryPersistenceGateway.hpp"
#include "domain/EarningsCalculator.hpp"
#include "../mocks/FailingPersistenceGateway.hpp"
#include "../mocks/FixedClock.hpp"

#include <atomic>
#include <thread>

using namespace ledgerflow;
using namespace ledgerflow::application;
using namespace ledgerflow::domain;
using namespace ledgerflow::tests;

class LedgerServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway_ = std::make_shared<FailingPersistenceGateway>();
        clock_ = std::make_shared<FixedClock>();
        ledger_ = std::make_shared<LedgerService>(gateway_, clock_);
    }

    // Новый сервис поверх того же хранилища ("перезапуск")
    std::shared_ptr<LedgerService> reload() {
        return std::make_shared<LedgerService>(gateway_, clock_);
    }

    std::shared_ptr<FailingPersistenceGateway> gateway_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<LedgerService> ledger_;
};

// ============================================================================
// START NEW PERIOD
// ============================================================================

TEST_F(LedgerServiceTest, StartNewPeriod_FirstCall_CreatesEmptyActivePeriod) {
    Period period = ledger_->startNewPeriod();

    EXPECT_EQ(period.id.rfind("prd-", 0), 0u);
    EXPECT_EQ(period.startDate, Date(2025, 12, 16));
    EXPECT_TRUE(period.isActive());
    EXPECT_TRUE(period.entries.empty());

    auto active = ledger_->activePeriod();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->id, period.id);
    EXPECT_EQ(ledger_->periods().size(), 1u);
}

TEST_F(LedgerServiceTest, StartNewPeriod_ClosesPreviousAndLeavesExactlyOneActive) {
    Period first = ledger_->startNewPeriod(Date(2025, 12, 1));
    ledger_->logHours(Date(2025, 12, 2), 4.0);
    Period second = ledger_->startNewPeriod(Date(2025, 12, 15));

    auto periods = ledger_->periods();
    ASSERT_EQ(periods.size(), 2u);
    EXPECT_EQ(periods[0].id, first.id);
    ASSERT_TRUE(periods[0].endDate.has_value());
    EXPECT_EQ(*periods[0].endDate, Date(2025, 12, 15));
    EXPECT_DOUBLE_EQ(periods[0].totalHours(), 4.0);

    EXPECT_EQ(periods[1].id, second.id);
    EXPECT_TRUE(periods[1].isActive());

    int activeCount = 0;
    for (const auto& p : periods) {
        activeCount += p.isActive() ? 1 : 0;
    }
    EXPECT_EQ(activeCount, 1);
    EXPECT_EQ(ledger_->activePeriod()->id, second.id);
}

TEST_F(LedgerServiceTest, StartNewPeriod_DefaultsToClockToday) {
    ledger_->startNewPeriod(Date(2025, 12, 1));
    clock_->setToday(Date(2025, 12, 20));

    ledger_->startNewPeriod();

    auto periods = ledger_->periods();
    EXPECT_EQ(*periods[0].endDate, Date(2025, 12, 20));
    EXPECT_EQ(periods[1].startDate, Date(2025, 12, 20));
}

TEST_F(LedgerServiceTest, StartNewPeriod_BeforeActiveStart_ThrowsAndWritesNothing) {
    Period first = ledger_->startNewPeriod(Date(2025, 12, 10));
    const int writesBefore = gateway_->callCount("savePeriodBoundary");

    EXPECT_THROW(ledger_->startNewPeriod(Date(2025, 12, 1)), InvalidPeriodError);

    EXPECT_EQ(gateway_->callCount("savePeriodBoundary"), writesBefore);
    ASSERT_EQ(ledger_->periods().size(), 1u);
    EXPECT_EQ(ledger_->activePeriod()->id, first.id);
}

TEST_F(LedgerServiceTest, StartNewPeriod_IsDurable) {
    Period first = ledger_->startNewPeriod(Date(2025, 12, 1));
    Period second = ledger_->startNewPeriod(Date(2025, 12, 15));

    auto reloaded = reload();

    auto periods = reloaded->periods();
    ASSERT_EQ(periods.size(), 2u);
    EXPECT_EQ(periods[0].id, first.id);
    EXPECT_EQ(*periods[0].endDate, Date(2025, 12, 15));
    ASSERT_TRUE(reloaded->activePeriod().has_value());
    EXPECT_EQ(reloaded->activePeriod()->id, second.id);
}

// ============================================================================
// LOG HOURS
// ============================================================================

TEST_F(LedgerServiceTest, LogHours_NoActivePeriod_StartsOneImplicitly) {
    Entry entry = ledger_->logHours(Date(2025, 12, 3), 5.0, "first");

    auto active = ledger_->activePeriod();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->startDate, Date(2025, 12, 3));
    ASSERT_EQ(active->entries.size(), 1u);
    EXPECT_EQ(active->entries[0].id, entry.id);
    EXPECT_EQ(entry.note, "first");
}

TEST_F(LedgerServiceTest, LogHours_DefaultsDateAndLoggedAtToClock) {
    Entry entry = ledger_->logHours(std::nullopt, 2.0);

    EXPECT_EQ(entry.date, Date(2025, 12, 16));
    EXPECT_EQ(entry.loggedAt, clock_->now());
    EXPECT_FALSE(entry.hasNote());
}

TEST_F(LedgerServiceTest, LogHours_TotalHoursEqualsSumOfLogged) {
    ledger_->startNewPeriod(Date(2025, 12, 1));
    const double hours[] = {1.0, 2.5, 8.0, 0.25, 3.0};
    double expected = 0.0;
    for (double h : hours) {
        ledger_->logHours(Date(2025, 12, 2), h);
        expected += h;
    }

    EXPECT_DOUBLE_EQ(ledger_->activePeriod()->totalHours(), expected);
}

TEST_F(LedgerServiceTest, LogHours_ZeroHours_ThrowsAndStateUnchanged) {
    ledger_->startNewPeriod(Date(2025, 12, 1));
    ledger_->logHours(Date(2025, 12, 2), 3.0);

    EXPECT_THROW(ledger_->logHours(Date(2025, 12, 2), 0.0), InvalidEntryError);

    EXPECT_EQ(ledger_->activePeriod()->entries.size(), 1u);
    EXPECT_DOUBLE_EQ(ledger_->activePeriod()->totalHours(), 3.0);
    EXPECT_EQ(gateway_->callCount("saveEntry"), 1);
}

TEST_F(LedgerServiceTest, LogHours_InvalidWithoutActivePeriod_CreatesNoPeriod) {
    EXPECT_THROW(ledger_->logHours(Date(2025, 12, 2), -1.0), InvalidEntryError);

    EXPECT_TRUE(ledger_->periods().empty());
    EXPECT_FALSE(ledger_->activePeriod().has_value());
    EXPECT_EQ(gateway_->inner().periodCount(), 0u);
}

TEST_F(LedgerServiceTest, LogHours_TypicalShiftScenario) {
    ledger_->updateRateConfig(RateConfig::update(7.00, true, 23.15));
    ledger_->startNewPeriod(Date(2025, 12, 1));
    ledger_->logHours(Date(2025, 12, 1), 5.0);
    ledger_->logHours(Date(2025, 12, 2), 3.0);

    auto snapshot = ledger_->snapshot();
    const Period* active = snapshot.activePeriod();
    ASSERT_NE(active, nullptr);

    EXPECT_NEAR(snapshot.rateConfig.effectiveHourlyRate(), 30.15, 1e-9);
    EXPECT_DOUBLE_EQ(active->totalHours(), 8.0);
    EXPECT_EQ(EarningsCalculator::formatCurrency(
                  EarningsCalculator::actualEarnings(*active, snapshot.rateConfig)),
              "$241.20");
}

// ============================================================================
// RATE CONFIG
// ============================================================================

TEST_F(LedgerServiceTest, UpdateRateConfig_RoundTripsThroughStorage) {
    RateConfig config = RateConfig::update(15.5, true, 4.25);

    ledger_->updateRateConfig(config);

    EXPECT_EQ(ledger_->rateConfig(), config);
    EXPECT_EQ(gateway_->loadAll().rateConfig, config);
    EXPECT_EQ(reload()->rateConfig(), config);
}

TEST_F(LedgerServiceTest, UpdateRateConfig_InvalidRate_KeepsPrevious) {
    RateConfig previous = RateConfig::update(10.0, false, 2.0);
    ledger_->updateRateConfig(previous);

    EXPECT_THROW(ledger_->updateRateConfig(RateConfig::update(-1.0, false, 2.0)), InvalidRateError);

    EXPECT_EQ(ledger_->rateConfig(), previous);
    EXPECT_EQ(gateway_->callCount("saveRateConfig"), 1);
}

TEST_F(LedgerServiceTest, UpdateRateConfig_AppliesToActivePeriodEarnings) {
    ledger_->logHours(Date(2025, 12, 2), 10.0);

    ledger_->updateRateConfig(RateConfig::update(20.0, false, 0.0));

    auto snapshot = ledger_->snapshot();
    EXPECT_NEAR(EarningsCalculator::actualEarnings(*snapshot.activePeriod(), snapshot.rateConfig), 200.0, 1e-9);
}

// ============================================================================
// CLEAR ALL DATA
// ============================================================================

TEST_F(LedgerServiceTest, ClearAllData_RemovesEverythingAndResetsRate) {
    ledger_->updateRateConfig(RateConfig::update(20.0, true, 5.0));
    ledger_->logHours(Date(2025, 12, 2), 4.0);
    ledger_->startNewPeriod(Date(2025, 12, 10));

    ledger_->clearAllData();

    EXPECT_TRUE(ledger_->periods().empty());
    EXPECT_FALSE(ledger_->activePeriod().has_value());
    EXPECT_EQ(ledger_->rateConfig(), RateConfig());

    auto reloaded = reload();
    EXPECT_TRUE(reloaded->periods().empty());
    EXPECT_EQ(reloaded->rateConfig(), RateConfig());
}

TEST_F(LedgerServiceTest, ClearAllData_IsIdempotent) {
    ledger_->logHours(Date(2025, 12, 2), 4.0);

    ledger_->clearAllData();
    auto once = ledger_->snapshot();
    ledger_->clearAllData();
    auto twice = ledger_->snapshot();

    EXPECT_TRUE(twice.periods.empty());
    EXPECT_EQ(once.periods.size(), twice.periods.size());
    EXPECT_EQ(once.rateConfig, twice.rateConfig);
    EXPECT_EQ(once.activePeriodId, twice.activePeriodId);
}

// ============================================================================
// RECENT ENTRIES
// ============================================================================

TEST_F(LedgerServiceTest, RecentEntries_NewestFirstAndCapped) {
    ledger_->startNewPeriod(Date(2025, 12, 1));
    for (int i = 1; i <= 12; ++i) {
        ledger_->logHours(Date(2025, 12, i), static_cast<double>(i));
    }

    auto recent = ledger_->recentEntries(10);

    ASSERT_EQ(recent.size(), 10u);
    EXPECT_DOUBLE_EQ(recent.front().hours, 12.0);
    EXPECT_DOUBLE_EQ(recent.back().hours, 3.0);
}

TEST_F(LedgerServiceTest, RecentEntries_ZeroLimit_IsEmpty) {
    ledger_->logHours(Date(2025, 12, 2), 1.0);

    EXPECT_TRUE(ledger_->recentEntries(0).empty());
}

TEST_F(LedgerServiceTest, RecentEntries_ClosedPeriodsOnlyWhenRequested) {
    ledger_->startNewPeriod(Date(2025, 12, 1));
    ledger_->logHours(Date(2025, 12, 2), 1.0);
    ledger_->startNewPeriod(Date(2025, 12, 15));
    ledger_->logHours(Date(2025, 12, 16), 2.0);

    auto activeOnly = ledger_->recentEntries(10);
    ASSERT_EQ(activeOnly.size(), 1u);
    EXPECT_DOUBLE_EQ(activeOnly[0].hours, 2.0);

    auto all = ledger_->recentEntries(10, true);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_DOUBLE_EQ(all[0].hours, 2.0);
    EXPECT_DOUBLE_EQ(all[1].hours, 1.0);
}

// ============================================================================
// WRITE FAILURES & ROLLBACK
// ============================================================================

TEST_F(LedgerServiceTest, LogHours_SaveFails_ThrowsPersistenceErrorStateUnchanged) {
    ledger_->startNewPeriod(Date(2025, 12, 1));
    ledger_->logHours(Date(2025, 12, 2), 3.0);
    gateway_->failOn("saveEntry");

    EXPECT_THROW(ledger_->logHours(Date(2025, 12, 3), 4.0), PersistenceError);

    EXPECT_DOUBLE_EQ(ledger_->activePeriod()->totalHours(), 3.0);
    EXPECT_EQ(gateway_->inner().entryCount(), 1u);
}

TEST_F(LedgerServiceTest, LogHours_ImplicitPeriod_SaveFails_RemovesPeriodFromStorage) {
    gateway_->failOn("saveEntry");

    EXPECT_THROW(ledger_->logHours(Date(2025, 12, 3), 4.0), PersistenceError);

    EXPECT_TRUE(ledger_->periods().empty());
    EXPECT_EQ(gateway_->inner().periodCount(), 0u);
    EXPECT_FALSE(gateway_->inner().loadAll().activePeriodId.has_value());
}

TEST_F(LedgerServiceTest, StartNewPeriod_ActiveIdSaveFails_RestoresPreviousPeriod) {
    Period first = ledger_->startNewPeriod(Date(2025, 12, 1));
    gateway_->failOn("saveActivePeriodId");

    EXPECT_THROW(ledger_->startNewPeriod(Date(2025, 12, 15)), PersistenceError);

    // Память
    ASSERT_EQ(ledger_->periods().size(), 1u);
    EXPECT_EQ(ledger_->activePeriod()->id, first.id);

    // Хранилище
    gateway_->reset();
    auto stored = gateway_->loadAll();
    ASSERT_EQ(stored.periods.size(), 1u);
    EXPECT_EQ(stored.periods[0].id, first.id);
    EXPECT_TRUE(stored.periods[0].isActive());
    EXPECT_EQ(stored.activePeriodId, first.id);
}

TEST_F(LedgerServiceTest, StartNewPeriod_CloseFails_RemovesNewPeriod) {
    Period first = ledger_->startNewPeriod(Date(2025, 12, 1));
    // 1-й вызов - сам первый период, 2-й - новый период, 3-й - закрытие
    gateway_->failOnCall("savePeriodBoundary", 3);

    EXPECT_THROW(ledger_->startNewPeriod(Date(2025, 12, 15)), PersistenceError);

    EXPECT_EQ(ledger_->periods().size(), 1u);
    auto stored = gateway_->inner().loadAll();
    ASSERT_EQ(stored.periods.size(), 1u);
    EXPECT_EQ(stored.periods[0].id, first.id);
    EXPECT_TRUE(stored.periods[0].isActive());
}

TEST_F(LedgerServiceTest, UpdateRateConfig_SaveFails_KeepsPrevious) {
    gateway_->failOn("saveRateConfig");

    EXPECT_THROW(ledger_->updateRateConfig(RateConfig::update(99.0, true, 1.0)), PersistenceError);

    EXPECT_EQ(ledger_->rateConfig(), RateConfig());
}

TEST_F(LedgerServiceTest, ClearAllData_StorageFails_StateUnchanged) {
    ledger_->logHours(Date(2025, 12, 2), 4.0);
    gateway_->failOn("clear");

    EXPECT_THROW(ledger_->clearAllData(), PersistenceError);

    EXPECT_EQ(ledger_->periods().size(), 1u);
    EXPECT_DOUBLE_EQ(ledger_->activePeriod()->totalHours(), 4.0);
}

TEST_F(LedgerServiceTest, PersistenceError_CarriesAdapterReason) {
    gateway_->failOn("saveRateConfig");

    try {
        ledger_->updateRateConfig(RateConfig());
        FAIL() << "Expected PersistenceError";
    } catch (const PersistenceError& e) {
        EXPECT_NE(std::string(e.what()).find("injected saveRateConfig failure"), std::string::npos);
    }
}

// ============================================================================
// LOADING
// ============================================================================

TEST_F(LedgerServiceTest, Load_Failure_StartsEmptyWithDefaults) {
    gateway_->inner().saveRateConfig(RateConfig::update(50.0, false, 0.0));
    gateway_->failOn("loadAll");

    auto ledger = reload();

    EXPECT_TRUE(ledger->periods().empty());
    EXPECT_EQ(ledger->rateConfig(), RateConfig());
}

TEST_F(LedgerServiceTest, Load_SeveralOpenPeriods_RepairsToSingleActive) {
    auto& store = gateway_->inner();
    store.savePeriodBoundary(Period("prd-a", Date(2025, 11, 1)));
    store.savePeriodBoundary(Period("prd-b", Date(2025, 11, 15)));
    store.savePeriodBoundary(Period("prd-c", Date(2025, 12, 1)));
    store.saveActivePeriodId(std::string("prd-a"));

    auto ledger = reload();

    auto periods = ledger->periods();
    ASSERT_EQ(periods.size(), 3u);
    EXPECT_EQ(*periods[0].endDate, Date(2025, 11, 15));
    EXPECT_EQ(*periods[1].endDate, Date(2025, 12, 1));
    EXPECT_TRUE(periods[2].isActive());
    EXPECT_EQ(ledger->activePeriod()->id, "prd-c");
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(LedgerServiceTest, ConcurrentLogHours_NoLostEntries) {
    ledger_->startNewPeriod(Date(2025, 12, 1));

    const int threadCount = 4;
    const int perThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < perThread; ++i) {
                ledger_->logHours(Date(2025, 12, 2), 1.0);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_DOUBLE_EQ(ledger_->activePeriod()->totalHours(), threadCount * perThread);
    EXPECT_EQ(gateway_->inner().entryCount(), static_cast<size_t>(threadCount * perThread));
}

TEST_F(LedgerServiceTest, ConcurrentReaders_SeeConsistentSnapshots) {
    ledger_->startNewPeriod(Date(2025, 12, 1));
    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};

    std::thread reader([&]() {
        while (!done) {
            auto snapshot = ledger_->snapshot();
            const Period* active = snapshot.activePeriod();
            if (!active) {
                ++inconsistent;
                continue;
            }
            // Каждая запись - 1 час, значит сумма совпадает с числом записей
            if (active->totalHours() != static_cast<double>(active->entries.size())) {
                ++inconsistent;
            }
        }
    });

    for (int i = 0; i < 200; ++i) {
        ledger_->logHours(Date(2025, 12, 2), 1.0);
    }
    done = true;
    reader.join();

    EXPECT_EQ(inconsistent.load(), 0);
}
