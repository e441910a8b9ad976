// ============================================================================
// MERIDIAN - Strategy Selector Unit Tests
// ============================================================================

#include "meridian/strategy/strategy_selector.hpp"

#include <gtest/gtest.h>

using namespace meridian;
using namespace meridian::market;
using namespace meridian::strategy;

namespace {

MarketCondition condition(Trend trend, Volatility v = Volatility::Low,
                          Liquidity l = Liquidity::High, double confidence = 80.0) {
    MarketCondition c;
    c.symbol = Symbol("EURUSD");
    c.trend = trend;
    c.volatility = v;
    c.liquidity = l;
    c.confidence = confidence;
    c.status = ConditionStatus::Ok;
    return c;
}

RegimeWeights weights(double ranging, double trending) {
    RegimeWeights w;
    w.ranging = ranging;
    w.trending = trending;
    return w;
}

Strategy named(const std::string& name, RegimeWeights w, bool enabled = true) {
    return Strategy(name, MovingAverageCrossParams{}, w, RiskParams{}, enabled);
}

}  // namespace

class StrategySelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog.add(named("trend_follower", weights(1, 9)));
        catalog.add(named("mean_reverter", weights(9, 2)));
    }

    StrategySelector selector;
    StrategyCatalog catalog;
};

TEST_F(StrategySelectorTest, TrendingPicksTrendFollower) {
    const auto sel = selector.select(condition(Trend::Bullish), catalog);
    ASSERT_TRUE(sel.selected());
    EXPECT_EQ(sel.strategy->name(), "trend_follower");
    EXPECT_EQ(sel.ranking.size(), 2u);
    EXPECT_FALSE(sel.reason.empty());
}

TEST_F(StrategySelectorTest, RangingPicksMeanReverter) {
    const auto sel = selector.select(condition(Trend::Ranging), catalog);
    ASSERT_TRUE(sel.selected());
    EXPECT_EQ(sel.strategy->name(), "mean_reverter");
}

TEST_F(StrategySelectorTest, UnknownTrendSelectsNothing) {
    const auto sel = selector.select(condition(Trend::Unknown), catalog);
    EXPECT_FALSE(sel.selected());
    EXPECT_TRUE(sel.ranking.empty());
    EXPECT_NE(sel.reason.find("unknown"), std::string::npos);
}

TEST_F(StrategySelectorTest, LowConfidenceSelectsNothing) {
    const auto sel = selector.select(
        condition(Trend::Bullish, Volatility::Low, Liquidity::High, 59.9), catalog);
    EXPECT_FALSE(sel.selected());
    EXPECT_NE(sel.reason.find("confidence"), std::string::npos);
}

TEST_F(StrategySelectorTest, ScoreIsAxisWeightedAverage) {
    RegimeWeights w;
    w.trending = 8;
    w.high_volatility = 6;
    w.low_liquidity = 4;
    w.bullish = 7;
    const auto s = named("candidate", w);

    const auto c = condition(Trend::Bullish, Volatility::High, Liquidity::Low);
    EXPECT_NEAR(selector.score(c, s), 0.4 * 8 + 0.3 * 6 + 0.2 * 4 + 0.1 * 7, 1e-12);
}

TEST_F(StrategySelectorTest, MediumBucketsAverageHighAndLow) {
    RegimeWeights w;
    w.ranging = 6;
    w.high_volatility = 8;
    w.low_volatility = 2;
    w.high_liquidity = 10;
    w.low_liquidity = 0;
    w.bullish = 4;
    w.bearish = 6;
    const auto s = named("candidate", w);

    const auto c = condition(Trend::Ranging, Volatility::Medium, Liquidity::Medium);
    EXPECT_NEAR(selector.score(c, s), 0.4 * 6 + 0.3 * 5 + 0.2 * 5 + 0.1 * 5, 1e-12);
}

TEST_F(StrategySelectorTest, ChoppyUsesWeakerTrendBucket) {
    const auto s = named("candidate", weights(3, 9));
    const auto choppy = selector.score(condition(Trend::Choppy), s);
    const auto ranging = selector.score(condition(Trend::Ranging), s);
    EXPECT_DOUBLE_EQ(choppy, ranging);
}

TEST_F(StrategySelectorTest, TiesKeepDeclarationOrder) {
    StrategyCatalog twins;
    twins.add(named("first", weights(5, 5)));
    twins.add(named("second", weights(5, 5)));

    const auto sel = selector.select(condition(Trend::Bullish), twins);
    ASSERT_TRUE(sel.selected());
    EXPECT_EQ(sel.strategy->name(), "first");
}

TEST_F(StrategySelectorTest, DisabledStrategiesAreSkipped) {
    StrategyCatalog mixed;
    mixed.add(named("off", weights(1, 10), false));
    mixed.add(named("on", weights(1, 3)));

    const auto sel = selector.select(condition(Trend::Bullish), mixed);
    ASSERT_TRUE(sel.selected());
    EXPECT_EQ(sel.strategy->name(), "on");
    EXPECT_EQ(sel.ranking.size(), 1u);
}

TEST_F(StrategySelectorTest, NothingAboveMinimumScore) {
    SelectorConfig config;
    config.min_score = 9.5;
    StrategySelector picky(config);

    const auto sel = picky.select(condition(Trend::Bullish), catalog);
    EXPECT_FALSE(sel.selected());
    EXPECT_EQ(sel.ranking.size(), 2u);
}

TEST_F(StrategySelectorTest, EmptyCatalog) {
    const auto sel = selector.select(condition(Trend::Bullish), StrategyCatalog{});
    EXPECT_FALSE(sel.selected());
    EXPECT_EQ(sel.reason, "no enabled strategy");
}

TEST_F(StrategySelectorTest, ShippedCatalogAlwaysSelectsForKnownRegimes) {
    const auto shipped = StrategyCatalog::with_defaults();
    for (auto trend : {Trend::Bullish, Trend::Bearish, Trend::Ranging, Trend::Choppy}) {
        for (auto vol : {Volatility::Low, Volatility::Medium, Volatility::High}) {
            const auto sel = selector.select(condition(trend, vol), shipped);
            EXPECT_TRUE(sel.selected()) << to_string(trend) << "/" << to_string(vol);
        }
    }
}
