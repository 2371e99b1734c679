/**
 * @file RateConfigTest.cpp
 * @brief Unit tests for RateConfig
 */

#include <gtest/gtest.h>
#include "domain/RateConfig.hpp"

#include <limits>

using namespace ledgerflow::domain;

// ============================================================================
// DEFAULTS & EFFECTIVE RATE
// ============================================================================

TEST(RateConfigTest, Default_MatchesInitialSettings) {
    RateConfig config;

    EXPECT_DOUBLE_EQ(config.baseRate(), 7.00);
    EXPECT_DOUBLE_EQ(config.avgTipRate(), 23.15);
    EXPECT_FALSE(config.includeTips());
    EXPECT_DOUBLE_EQ(config.effectiveHourlyRate(), 7.00);
}

TEST(RateConfigTest, EffectiveRate_WithTips_AddsAverageTips) {
    RateConfig config(7.00, true, 23.15);

    EXPECT_NEAR(config.effectiveHourlyRate(), 30.15, 1e-9);
}

TEST(RateConfigTest, EffectiveRate_WithoutTips_IgnoresTipRate) {
    RateConfig config(12.50, false, 99.0);

    EXPECT_DOUBLE_EQ(config.effectiveHourlyRate(), 12.50);
    EXPECT_DOUBLE_EQ(config.avgTipRate(), 99.0);  // сохраняется
}

TEST(RateConfigTest, ZeroRates_AreValid) {
    RateConfig config = RateConfig::update(0.0, true, 0.0);

    EXPECT_DOUBLE_EQ(config.effectiveHourlyRate(), 0.0);
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST(RateConfigTest, Update_NegativeBaseRate_Throws) {
    EXPECT_THROW(RateConfig::update(-1.0, false, 10.0), InvalidRateError);
}

TEST(RateConfigTest, Update_NegativeTipRate_Throws) {
    EXPECT_THROW(RateConfig::update(7.0, true, -0.01), InvalidRateError);
}

TEST(RateConfigTest, Update_NegativeTipRateWithTipsOff_StillThrows) {
    EXPECT_THROW(RateConfig::update(7.0, false, -5.0), InvalidRateError);
}

TEST(RateConfigTest, Update_NonFiniteRate_Throws) {
    EXPECT_THROW(RateConfig::update(std::numeric_limits<double>::quiet_NaN(), false, 0.0), InvalidRateError);
    EXPECT_THROW(RateConfig::update(7.0, true, std::numeric_limits<double>::infinity()), InvalidRateError);
}

TEST(RateConfigTest, Update_RejectedValue_LeavesPreviousUntouched) {
    RateConfig current(10.0, true, 5.0);

    try {
        current = RateConfig::update(-3.0, true, 5.0);
        FAIL() << "Expected InvalidRateError";
    } catch (const InvalidRateError&) {
    }

    EXPECT_EQ(current, RateConfig(10.0, true, 5.0));
}

// ============================================================================
// DESCRIBE & EQUALITY
// ============================================================================

TEST(RateConfigTest, Describe_WithTips) {
    EXPECT_EQ(RateConfig(7.0, true, 23.15).describe(),
              "Rate: $30.15/hr (Base: $7.00, Tips: $23.15)");
}

TEST(RateConfigTest, Describe_TipsExcluded) {
    EXPECT_EQ(RateConfig().describe(), "Rate: $7.00/hr (Base: $7.00, Tips excluded)");
}

TEST(RateConfigTest, Equality_ComparesAllFields) {
    EXPECT_EQ(RateConfig(7.0, false, 1.0), RateConfig(7.0, false, 1.0));
    EXPECT_NE(RateConfig(7.0, false, 1.0), RateConfig(7.0, false, 2.0));
    EXPECT_NE(RateConfig(7.0, false, 1.0), RateConfig(7.0, true, 1.0));
}
