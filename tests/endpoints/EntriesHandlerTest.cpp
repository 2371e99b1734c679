/**
 * @file EntriesHandlerTest.cpp
 * @brief Unit-тесты для EntriesHandler
 *
 * entries [--limit N] [--all]
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/EntriesHandler.hpp"
#include "../mocks/MockLedgerService.hpp"

#include <sstream>

using namespace ledgerflow;
using namespace ledgerflow::adapters::primary;
using ledgerflow::tests::MockLedgerService;
using ::testing::_;
using ::testing::Return;

class EntriesHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockLedger_ = std::make_shared<MockLedgerService>();
        settings_ = std::make_shared<settings::LedgerSettings>();
        handler_ = std::make_unique<EntriesHandler>(mockLedger_, settings_);

        ON_CALL(*mockLedger_, rateConfig()).WillByDefault(Return(domain::RateConfig(10.0, false, 0.0)));
    }

    domain::Entry createEntry(int day, double hours, const std::string& note = "")
    {
        return domain::Entry("ent-" + std::to_string(day), domain::Date(2025, 12, day), hours, note,
                             domain::Timestamp::fromString("2025-12-16 18:30:00"));
    }

    std::shared_ptr<MockLedgerService> mockLedger_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::unique_ptr<EntriesHandler> handler_;
    std::ostringstream out_;
};

TEST_F(EntriesHandlerTest, Handle_DefaultLimitFromSettings)
{
    EXPECT_CALL(*mockLedger_, recentEntries(settings_->getRecentLimit(), false))
        .WillOnce(Return(std::vector<domain::Entry>{createEntry(3, 2.0, "bar"), createEntry(2, 5.0)}));
    EXPECT_CALL(*mockLedger_, rateConfig());

    int code = handler_->handle({}, out_);

    EXPECT_EQ(code, 0);
    EXPECT_EQ(out_.str(),
        "2025-12-03  2h  $20.00  bar\n"
        "2025-12-02  5h  $50.00\n");
}

TEST_F(EntriesHandlerTest, Handle_LimitAndAll_PassedToLedger)
{
    EXPECT_CALL(*mockLedger_, recentEntries(3u, true))
        .WillOnce(Return(std::vector<domain::Entry>{}));

    handler_->handle({"--limit", "3", "--all"}, out_);

    EXPECT_EQ(out_.str(), "No entries\n");
}

TEST_F(EntriesHandlerTest, Handle_BadLimit_ThrowsUsageError)
{
    EXPECT_CALL(*mockLedger_, recentEntries(_, _)).Times(0);

    EXPECT_THROW(handler_->handle({"--limit", "-1"}, out_), UsageError);
    EXPECT_THROW(handler_->handle({"--limit", "2.5"}, out_), UsageError);
    EXPECT_THROW(handler_->handle({"--limit"}, out_), UsageError);
}
