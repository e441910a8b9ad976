// ============================================================================
// MERIDIAN - Risk Ledger Unit Tests
// ============================================================================

#include "meridian/risk/risk_ledger.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace meridian;
using namespace meridian::risk;

class RiskLedgerTest : public ::testing::Test {
protected:
    RiskLedgerTest()
        : clock(from_epoch_ms(test::T0_MS) + std::chrono::hours(9)),
          ledger(LedgerConfig{}, AccountTierTable::defaults(), 1000.0, clock, &events) {}

    PositionRisk position(uint64_t id, double risk, const char* symbol = "EURUSD") {
        return PositionRisk{id, Symbol(symbol), Direction::Long, risk};
    }

    ManualClock clock;
    RiskEventLog events;
    RiskLedger ledger;
    Symbol eurusd{"EURUSD"};
};

// ============================================================================
// Drawdown Breaker
// ============================================================================

TEST_F(RiskLedgerTest, FifteenPercentDrawdownBlocksUntilReset) {
    ledger.update_equity(850.0);

    EXPECT_TRUE(ledger.halted());
    EXPECT_EQ(ledger.can_admit_new_trade(eurusd).code, AdmissionCode::DrawdownBreaker);
    EXPECT_EQ(ledger.record_open(position(1, 1.0)).code, AdmissionCode::DrawdownBreaker);
    EXPECT_EQ(events.count(RiskEventKind::CircuitBreakerTripped), 1u);

    const auto snap = ledger.snapshot();
    EXPECT_TRUE(snap.drawdown_breaker);
    EXPECT_NEAR(snap.current_drawdown_percent, 15.0, 1e-9);

    ledger.reset_drawdown_breaker();
    EXPECT_FALSE(ledger.halted());
    EXPECT_TRUE(ledger.can_admit_new_trade(eurusd).admitted());
    EXPECT_DOUBLE_EQ(ledger.snapshot().high_water_mark, 850.0);
    EXPECT_EQ(events.count(RiskEventKind::CircuitBreakerReset), 1u);
}

TEST_F(RiskLedgerTest, DrawdownBelowLimitAdmits) {
    ledger.update_equity(860.0);
    EXPECT_FALSE(ledger.halted());
    EXPECT_TRUE(ledger.can_admit_new_trade(eurusd).admitted());
}

TEST_F(RiskLedgerTest, DrawdownBreakerClearsWithHysteresis) {
    ledger.update_equity(850.0);
    ASSERT_TRUE(ledger.halted());

    // 14% is inside the hysteresis band
    ledger.update_equity(860.0);
    EXPECT_TRUE(ledger.halted());

    // 11.5% is below 15% - 3%
    ledger.update_equity(885.0);
    EXPECT_FALSE(ledger.halted());
    EXPECT_EQ(events.count(RiskEventKind::CircuitBreakerReset), 1u);
}

TEST_F(RiskLedgerTest, HighWaterMarkFollowsNewPeaks) {
    ledger.update_equity(1200.0);
    ledger.update_equity(1020.0);  // exactly 15% off the peak
    EXPECT_TRUE(ledger.halted());
    EXPECT_DOUBLE_EQ(ledger.snapshot().high_water_mark, 1200.0);
}

TEST_F(RiskLedgerTest, InvalidEquityIgnored) {
    ledger.update_equity(std::numeric_limits<double>::quiet_NaN());
    ledger.update_equity(-5.0);
    EXPECT_DOUBLE_EQ(ledger.equity(), 1000.0);
}

// ============================================================================
// Daily Loss
// ============================================================================

TEST_F(RiskLedgerTest, DailyLossLatchesUntilRollover) {
    ASSERT_TRUE(ledger.record_open(position(1, 20.0)).admitted());
    ledger.record_close(1, -50.0);

    EXPECT_EQ(ledger.can_admit_new_trade(eurusd).code, AdmissionCode::DailyLossLimit);
    EXPECT_TRUE(ledger.snapshot().daily_loss_limit_breached);

    // Still the same UTC day
    clock.advance(std::chrono::hours(14));
    EXPECT_TRUE(ledger.halted());

    clock.advance(std::chrono::hours(1));
    EXPECT_FALSE(ledger.halted());

    const auto snap = ledger.snapshot();
    EXPECT_DOUBLE_EQ(snap.daily_realized_pnl, 0.0);
    EXPECT_DOUBLE_EQ(snap.day_start_equity, 950.0);
    EXPECT_EQ(snap.trading_day, utc_day(clock.now()));
    EXPECT_EQ(events.count(RiskEventKind::CircuitBreakerReset), 1u);
}

TEST_F(RiskLedgerTest, ProfitsOffsetLosses) {
    ASSERT_TRUE(ledger.record_open(position(1, 10.0)).admitted());
    ledger.record_close(1, 30.0);
    ASSERT_TRUE(ledger.record_open(position(2, 10.0)).admitted());
    ledger.record_close(2, -60.0);

    EXPECT_DOUBLE_EQ(ledger.snapshot().daily_realized_pnl, -30.0);
    EXPECT_FALSE(ledger.halted());
}

// ============================================================================
// Performance Summary
// ============================================================================

TEST_F(RiskLedgerTest, PerformanceSummaryFromClosedTrades) {
    ASSERT_TRUE(ledger.record_open(position(1, 5.0)).admitted());
    ledger.record_close(1, 30.0);
    ASSERT_TRUE(ledger.record_open(position(2, 5.0)).admitted());
    ledger.record_close(2, -10.0);
    ASSERT_TRUE(ledger.record_open(position(3, 5.0)).admitted());
    ledger.record_close(3, 0.0);

    // Partial leg and final leg make one trade: +4 - 2 = +2
    ASSERT_TRUE(ledger.record_open(position(4, 5.0)).admitted());
    ledger.record_partial_close(4, 0.5, 4.0);
    ledger.record_close(4, -2.0);

    const auto perf = ledger.snapshot().performance;
    EXPECT_EQ(perf.trades, 4u);
    EXPECT_EQ(perf.wins, 2u);
    EXPECT_EQ(perf.losses, 1u);
    EXPECT_DOUBLE_EQ(perf.gross_profit, 32.0);
    EXPECT_DOUBLE_EQ(perf.gross_loss, 10.0);
    EXPECT_DOUBLE_EQ(perf.win_rate(), 50.0);
    EXPECT_DOUBLE_EQ(perf.average_win(), 16.0);
    EXPECT_DOUBLE_EQ(perf.average_loss(), 10.0);
    EXPECT_DOUBLE_EQ(perf.average_pnl(), 5.5);
    EXPECT_DOUBLE_EQ(perf.profit_factor(), 3.2);
}

TEST_F(RiskLedgerTest, PerformanceSummaryEmptyAndLossless) {
    EXPECT_EQ(ledger.snapshot().performance.trades, 0u);
    EXPECT_DOUBLE_EQ(ledger.snapshot().performance.win_rate(), 0.0);

    ASSERT_TRUE(ledger.record_open(position(1, 5.0)).admitted());
    ledger.record_close(1, 12.0);
    EXPECT_DOUBLE_EQ(ledger.snapshot().performance.profit_factor(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.snapshot().performance.win_rate(), 100.0);

    // Unknown ids are not trades
    ledger.record_close(99, -3.0);
    EXPECT_EQ(ledger.snapshot().performance.trades, 1u);
}

TEST_F(RiskLedgerTest, ReleaseFreesReservationWithoutTrade) {
    ASSERT_TRUE(ledger.record_open(position(1, 20.0)).admitted());
    ledger.release(1);

    const auto snap = ledger.snapshot();
    EXPECT_DOUBLE_EQ(snap.open_risk, 0.0);
    EXPECT_TRUE(snap.open_positions_by_instrument.empty());
    EXPECT_EQ(snap.performance.trades, 0u);
    EXPECT_DOUBLE_EQ(snap.daily_realized_pnl, 0.0);
}

// ============================================================================
// Admission Limits
// ============================================================================

TEST_F(RiskLedgerTest, InstrumentLimitFromTier) {
    // 1000 is the mini tier: 5 trades per instrument
    for (uint64_t id = 1; id <= 5; ++id) {
        ASSERT_TRUE(ledger.record_open(position(id, 1.0)).admitted());
    }
    EXPECT_EQ(ledger.record_open(position(6, 1.0)).code, AdmissionCode::InstrumentLimit);
    EXPECT_TRUE(ledger.record_open(position(7, 1.0, "GBPUSD")).admitted());

    ledger.record_close(1, 0.0);
    EXPECT_TRUE(ledger.record_open(position(8, 1.0)).admitted());
    EXPECT_EQ(ledger.snapshot().open_positions_by_instrument.at(eurusd), 5u);
}

TEST_F(RiskLedgerTest, PendingRiskCountsAgainstDailyBudget) {
    ASSERT_TRUE(ledger.record_open(position(1, 30.0)).admitted());
    EXPECT_EQ(ledger.record_open(position(2, 25.0, "GBPUSD")).code,
              AdmissionCode::DailyRiskBudget);

    // Half closed at breakeven releases half the risk
    ledger.record_partial_close(1, 0.5, 0.0);
    EXPECT_DOUBLE_EQ(ledger.snapshot().open_risk, 15.0);
    EXPECT_TRUE(ledger.record_open(position(2, 25.0, "GBPUSD")).admitted());
}

TEST_F(RiskLedgerTest, RealizedLossConsumesBudget) {
    ASSERT_TRUE(ledger.record_open(position(1, 10.0)).admitted());
    ledger.record_close(1, -30.0);
    EXPECT_EQ(ledger.record_open(position(2, 25.0)).code, AdmissionCode::DailyRiskBudget);
    EXPECT_TRUE(ledger.record_open(position(3, 20.0)).admitted());
}

TEST_F(RiskLedgerTest, RejectsDuplicateAndInvalid) {
    ASSERT_TRUE(ledger.record_open(position(1, 5.0)).admitted());
    EXPECT_EQ(ledger.record_open(position(1, 5.0)).code, AdmissionCode::Duplicate);
    EXPECT_EQ(ledger.record_open(position(2, -1.0)).code, AdmissionCode::InvalidRisk);
    EXPECT_EQ(ledger.record_open(position(3, std::numeric_limits<double>::infinity())).code,
              AdmissionCode::InvalidRisk);
}

TEST_F(RiskLedgerTest, TierFollowsEquity) {
    EXPECT_EQ(ledger.current_tier().label, "mini");
    ledger.update_equity(5000.0);
    EXPECT_EQ(ledger.current_tier().label, "standard");
    EXPECT_EQ(ledger.snapshot().tier, "standard");
}

TEST_F(RiskLedgerTest, OpenRiskGroupedByResolver) {
    RiskLedger grouped(LedgerConfig{}, AccountTierTable::defaults(), 1000.0, clock, nullptr,
                       [](const Symbol& s) {
                           return s.view().ends_with("USD") ? std::string("usd") : s.str();
                       });
    ASSERT_TRUE(grouped.record_open(position(1, 5.0, "EURUSD")).admitted());
    ASSERT_TRUE(grouped.record_open(position(2, 7.0, "GBPUSD")).admitted());
    ASSERT_TRUE(grouped.record_open(position(3, 2.0, "USDJPY")).admitted());

    const auto snap = grouped.snapshot();
    EXPECT_DOUBLE_EQ(snap.open_risk_by_group.at("usd"), 12.0);
    EXPECT_DOUBLE_EQ(snap.open_risk_by_group.at("USDJPY"), 2.0);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(RiskLedgerTest, ConcurrentOpensNeverExceedBudget) {
    constexpr int THREADS = 8;
    constexpr int ATTEMPTS = 20;
    std::atomic<int> admitted{0};
    std::vector<std::thread> workers;

    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t] {
            const std::string symbol = "SYM" + std::to_string(t);
            for (int i = 0; i < ATTEMPTS; ++i) {
                const uint64_t id = static_cast<uint64_t>(t * ATTEMPTS + i + 1);
                const PositionRisk p{id, Symbol(symbol), Direction::Long, 10.0};
                if (ledger.record_open(p).admitted()) admitted.fetch_add(1);
            }
        });
    }
    for (auto& w : workers) w.join();

    // Budget is 5% of 1000
    EXPECT_EQ(admitted.load(), 5);
    EXPECT_LE(ledger.snapshot().open_risk, 50.0 + 1e-9);
}

TEST_F(RiskLedgerTest, ConcurrentClosesAccumulateExactly) {
    for (uint64_t id = 1; id <= 4; ++id) {
        const std::string symbol = "SYM" + std::to_string(id);
        ASSERT_TRUE(ledger.record_open(PositionRisk{id, Symbol(symbol), Direction::Short, 5.0})
                        .admitted());
    }

    std::vector<std::thread> workers;
    for (uint64_t id = 1; id <= 4; ++id) {
        workers.emplace_back([&, id] { ledger.record_close(id, 2.5); });
    }
    for (auto& w : workers) w.join();

    const auto snap = ledger.snapshot();
    EXPECT_DOUBLE_EQ(snap.daily_realized_pnl, 10.0);
    EXPECT_DOUBLE_EQ(snap.equity, 1010.0);
    EXPECT_DOUBLE_EQ(snap.open_risk, 0.0);
    EXPECT_TRUE(snap.open_positions_by_instrument.empty());
}
