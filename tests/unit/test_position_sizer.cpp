// ============================================================================
// MERIDIAN - Position Sizer Unit Tests
// ============================================================================

#include "meridian/risk/position_sizer.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace meridian;
using namespace meridian::risk;

class PositionSizerTest : public ::testing::Test {
protected:
    PositionSizer sizer;
    AccountTierTable tiers = AccountTierTable::defaults();
};

// ============================================================================
// Sizing
// ============================================================================

TEST_F(PositionSizerTest, MiniTierClampsToMaxLot) {
    const auto& tier = tiers.tier_for(1000.0);
    ASSERT_EQ(tier.label, "mini");

    // 1000 * 1.5% / (15 pips * 1.0) = 1.0 lots, capped at 0.05
    const auto r = sizer.size(1000.0, tier, 15.0, 1.0);
    ASSERT_TRUE(r.approved()) << r.reason;
    EXPECT_NEAR(r.lots, 0.05, 1e-12);
    EXPECT_NEAR(r.risk_amount, 0.05 * 15.0 * 1.0, 1e-12);
}

TEST_F(PositionSizerTest, InfiniteStopSizesToZero) {
    const auto& tier = tiers.tier_for(1000.0);
    EXPECT_DOUBLE_EQ(PositionSizer::raw_lots(1000.0, 0.015,
                                             std::numeric_limits<double>::infinity(), 1.0,
                                             tier.max_lot),
                     0.0);

    const auto r = sizer.size(1000.0, tier, std::numeric_limits<double>::infinity(), 1.0);
    EXPECT_FALSE(r.approved());
    EXPECT_DOUBLE_EQ(r.lots, 0.0);
}

TEST_F(PositionSizerTest, FormulaBelowCap) {
    const auto& tier = tiers.tier_for(50000.0);  // professional, 0.5%
    // 50000 * 0.005 / (25 * 10) = 1.0 lots, exactly the cap
    EXPECT_NEAR(PositionSizer::raw_lots(50000.0, 0.005, 25.0, 10.0, tier.max_lot), 1.0, 1e-12);

    // 20000 * 0.005 / (25 * 10) = 0.4 lots
    const auto r = sizer.size(20000.0, tier, 25.0, 10.0);
    ASSERT_TRUE(r.approved());
    EXPECT_NEAR(r.lots, 0.4, 1e-9);
}

TEST_F(PositionSizerTest, FloorsToLotStep) {
    const auto& tier = tiers.tier_for(5000.0);  // standard, 1%, cap 0.2
    // 5000 * 0.01 / (30 * 10) = 0.1667 -> 0.16
    const auto r = sizer.size(5000.0, tier, 30.0, 10.0);
    ASSERT_TRUE(r.approved());
    EXPECT_NEAR(r.lots, 0.16, 1e-9);
}

TEST_F(PositionSizerTest, BelowMinimumIsUntradeable) {
    const auto& tier = tiers.tier_for(50.0);  // nano, 1%
    // 50 * 0.01 / (20 * 10) = 0.0025
    const auto r = sizer.size(50.0, tier, 20.0, 10.0);
    EXPECT_EQ(r.decision, SizingDecision::Untradeable);
    EXPECT_DOUBLE_EQ(r.lots, 0.0);
}

TEST_F(PositionSizerTest, InvalidInputs) {
    const auto& tier = tiers.tier_for(1000.0);
    EXPECT_EQ(sizer.size(0.0, tier, 15.0, 1.0).decision, SizingDecision::InvalidInput);
    EXPECT_EQ(sizer.size(-10.0, tier, 15.0, 1.0).decision, SizingDecision::InvalidInput);
    EXPECT_EQ(sizer.size(1000.0, tier, 0.0, 1.0).decision, SizingDecision::InvalidInput);
    EXPECT_EQ(sizer.size(1000.0, tier, 15.0, 0.0).decision, SizingDecision::InvalidInput);
    EXPECT_EQ(sizer.size(std::numeric_limits<double>::quiet_NaN(), tier, 15.0, 1.0).decision,
              SizingDecision::InvalidInput);
}

TEST_F(PositionSizerTest, RawLotsNeverNegativeOrNan) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (double equity : {-1.0, 0.0, nan, 1e6}) {
        for (double stop : {-5.0, 0.0, nan, 10.0}) {
            const double lots = PositionSizer::raw_lots(equity, 0.01, stop, 10.0, 1.0);
            EXPECT_FALSE(std::isnan(lots));
            EXPECT_GE(lots, 0.0);
            EXPECT_LE(lots, 1.0);
        }
    }
}

TEST_F(PositionSizerTest, RiskLevelCapsTierRisk) {
    const auto& micro = tiers.tier_for(300.0);  // 2%
    EXPECT_DOUBLE_EQ(PositionSizer::effective_risk(micro, std::nullopt), 0.02);
    EXPECT_DOUBLE_EQ(PositionSizer::effective_risk(micro, RiskLevel::Low), 0.01);
    EXPECT_DOUBLE_EQ(PositionSizer::effective_risk(micro, RiskLevel::High), 0.02);
}

// ============================================================================
// Spread Gate
// ============================================================================

TEST_F(PositionSizerTest, SpreadAboveAverageMultiple) {
    EXPECT_TRUE(sizer.check_spread(1.4, 1.0, 5.0).approved());
    const auto r = sizer.check_spread(1.6, 1.0, 5.0);
    EXPECT_EQ(r.decision, SizingDecision::SpreadTooWide);
}

TEST_F(PositionSizerTest, SpreadAboveStrategyLimit) {
    EXPECT_EQ(sizer.check_spread(2.5, std::nullopt, 2.0).decision, SizingDecision::SpreadTooWide);
    EXPECT_TRUE(sizer.check_spread(1.5, std::nullopt, 2.0).approved());
}

TEST_F(PositionSizerTest, SpreadInvalid) {
    EXPECT_EQ(sizer.check_spread(-1.0, 1.0, 2.0).decision, SizingDecision::InvalidInput);
}

// ============================================================================
// Stop Distance
// ============================================================================

TEST_F(PositionSizerTest, FixedStop) {
    strategy::StopLossSpec spec;
    spec.method = strategy::StopLossMethod::Fixed;
    spec.fixed_pips = 12.0;
    EXPECT_DOUBLE_EQ(*stop_distance_pips(spec, {}, test::eurusd(), 1.1), 12.0);
}

TEST_F(PositionSizerTest, AtrStop) {
    strategy::StopLossSpec spec;
    spec.method = strategy::StopLossMethod::Atr;
    spec.atr_multiplier = 1.5;

    std::vector<Bar> bars;
    for (size_t i = 0; i < 60; ++i) {
        bars.push_back(test::make_bar(i, 1.1000, 1.1010, 1.0990, 1.1000));
    }
    // ATR 20 pips * 1.5
    EXPECT_NEAR(*stop_distance_pips(spec, bars, test::eurusd(), 1.1), 30.0, 1e-6);
    EXPECT_FALSE(stop_distance_pips(spec, {}, test::eurusd(), 1.1).has_value());
}

TEST_F(PositionSizerTest, StructureStopAddsBuffer) {
    strategy::StopLossSpec spec;
    spec.method = strategy::StopLossMethod::Structure;
    spec.structure_buffer_pips = 3.0;
    EXPECT_NEAR(*stop_distance_pips(spec, {}, test::eurusd(), 1.1020, 1.1000), 23.0, 1e-6);
}
