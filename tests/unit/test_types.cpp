// ============================================================================
// MERIDIAN - Core Types Unit Tests
// ============================================================================

#include "meridian/core/clock.hpp"
#include "meridian/core/errors.hpp"
#include "meridian/core/types.hpp"

#include <gtest/gtest.h>

#include <unordered_map>

using namespace meridian;

// ============================================================================
// Symbol Tests
// ============================================================================

TEST(SymbolTest, Construction) {
    Symbol s("EURUSD");
    EXPECT_EQ(s.view(), "EURUSD");
    EXPECT_EQ(s.size(), 6u);
    EXPECT_FALSE(s.empty());
}

TEST(SymbolTest, SyntheticNamesWithSpaces) {
    Symbol s("Volatility 100 Index");
    EXPECT_EQ(s.str(), "Volatility 100 Index");
}

TEST(SymbolTest, Truncation) {
    Symbol s("THIS SYMBOL NAME IS FAR LONGER THAN ANY BROKER USES");
    EXPECT_EQ(s.size(), Symbol::MAX_LENGTH);
}

TEST(SymbolTest, EqualityAndOrdering) {
    Symbol a("AUDUSD");
    Symbol b("EURUSD");

    EXPECT_EQ(a, Symbol("AUDUSD"));
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
}

TEST(SymbolTest, UsableAsMapKey) {
    std::unordered_map<Symbol, int> counts;
    counts[Symbol("EURUSD")] = 1;
    counts[Symbol("EURUSD")] += 1;
    counts[Symbol("GBPUSD")] = 5;

    EXPECT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[Symbol("EURUSD")], 2);
}

// ============================================================================
// Direction / Quote Tests
// ============================================================================

TEST(DirectionTest, OppositeAndSign) {
    EXPECT_EQ(opposite(Direction::Long), Direction::Short);
    EXPECT_EQ(opposite(Direction::Short), Direction::Long);
    EXPECT_DOUBLE_EQ(sign(Direction::Long), 1.0);
    EXPECT_DOUBLE_EQ(sign(Direction::Short), -1.0);
}

TEST(QuoteTest, LongBuysAskSellsBid) {
    Quote q;
    q.bid = 1.1000;
    q.ask = 1.1002;

    EXPECT_DOUBLE_EQ(q.entry_price(Direction::Long), 1.1002);
    EXPECT_DOUBLE_EQ(q.exit_price(Direction::Long), 1.1000);
    EXPECT_DOUBLE_EQ(q.entry_price(Direction::Short), 1.1000);
    EXPECT_DOUBLE_EQ(q.exit_price(Direction::Short), 1.1002);
    EXPECT_DOUBLE_EQ(q.mid(), 1.1001);
}

// ============================================================================
// SignalStrength Tests
// ============================================================================

TEST(SignalStrengthTest, Clamping) {
    SignalStrength strong_bullish{2.0};
    EXPECT_DOUBLE_EQ(strong_bullish.value(), 1.0);

    SignalStrength strong_bearish{-2.0};
    EXPECT_DOUBLE_EQ(strong_bearish.value(), -1.0);
}

TEST(SignalStrengthTest, Direction) {
    EXPECT_TRUE(SignalStrength{0.5}.is_bullish());
    EXPECT_TRUE(SignalStrength{-0.5}.is_bearish());
    EXPECT_TRUE(SignalStrength{0.0}.is_neutral());
}

// ============================================================================
// Time Tests
// ============================================================================

TEST(TimestampTest, EpochConversion) {
    int64_t epoch_ms = 1700000000000;
    EXPECT_EQ(to_epoch_ms(from_epoch_ms(epoch_ms)), epoch_ms);
}

TEST(TimestampTest, UtcDayBoundary) {
    // 2024-01-01T23:59:59.999Z and 2024-01-02T00:00:00Z
    const auto before = from_epoch_ms(1704153599999);
    const auto after = from_epoch_ms(1704153600000);
    EXPECT_EQ(utc_day(after), utc_day(before) + 1);
}

TEST(ManualClockTest, SetAndAdvance) {
    ManualClock clock(from_epoch_ms(1000));
    EXPECT_EQ(to_epoch_ms(clock.now()), 1000);

    clock.advance(std::chrono::seconds(2));
    EXPECT_EQ(to_epoch_ms(clock.now()), 3000);

    clock.set(from_epoch_ms(50));
    EXPECT_EQ(to_epoch_ms(clock.now()), 50);
}

// ============================================================================
// Risk Event Tests
// ============================================================================

TEST(RiskEventTest, AttentionKinds) {
    EXPECT_TRUE(requires_attention(RiskEventKind::ExecutionFatal));
    EXPECT_TRUE(requires_attention(RiskEventKind::CircuitBreakerTripped));
    EXPECT_FALSE(requires_attention(RiskEventKind::AdmissionRejected));
    EXPECT_FALSE(requires_attention(RiskEventKind::ExecutionTimeout));
}

TEST(RiskEventTest, KindNames) {
    EXPECT_EQ(to_string(RiskEventKind::CircuitBreakerReset), "CircuitBreakerReset");
    EXPECT_EQ(to_string(RiskEventKind::ClassificationDegraded), "ClassificationDegraded");
}
