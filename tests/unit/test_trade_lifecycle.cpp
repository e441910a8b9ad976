// ============================================================================
// MERIDIAN - Trade Lifecycle Unit Tests
// ============================================================================

#include "meridian/order/trade_lifecycle_manager.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace meridian;
using namespace meridian::order;
using execution::ExecutionStatus;

class TradeLifecycleTest : public ::testing::Test {
protected:
    TradeLifecycleTest()
        : clock(from_epoch_ms(test::T0_MS) + std::chrono::hours(9)),
          ledger(risk::LedgerConfig{}, risk::AccountTierTable::defaults(), 10000.0, clock,
                 &events),
          manager(LifecycleConfig{}, broker, ledger, events, stats, clock) {
        broker.set_fill_price(1.1000);
    }

    /// 0.1 lots with a 20 pip stop, half closed at 1R, final target at 2R
    Position make_position(Direction direction = Direction::Long) {
        Position p;
        p.id = manager.next_id();
        p.symbol = eurusd;
        p.strategy = "moving_average_cross";
        p.direction = direction;
        p.size = 0.1;
        p.stop_pips = 20.0;
        p.tp1_ratio = 1.0;
        p.tp1_fraction = 0.5;
        p.risk_reward_ratio = 2.0;
        p.risk_amount = 20.0;
        p.arm_levels(1.1000);
        return p;
    }

    /// Reserve risk and hand the position over, as the engine does
    uint64_t submit(Direction direction = Direction::Long) {
        auto p = make_position(direction);
        const uint64_t id = p.id;
        const auto d = ledger.record_open(
            risk::PositionRisk{p.id, p.symbol, p.direction, p.risk_amount});
        EXPECT_TRUE(d.admitted()) << d.reason;
        manager.submit_entry(std::move(p));
        return id;
    }

    void tick(double bid, double ask) { manager.process(eurusd, test::make_quote(eurusd, bid, ask)); }

    Symbol eurusd{"EURUSD"};
    ManualClock clock;
    risk::RiskEventLog events;
    execution::ExecutionStats stats;
    risk::RiskLedger ledger;
    test::ScriptedExecutionClient broker;
    TradeLifecycleManager manager;
};

// ============================================================================
// Entry
// ============================================================================

TEST_F(TradeLifecycleTest, FillRearmsLevelsFromFillPrice) {
    broker.set_fill_price(1.1002);
    const auto id = submit();

    const auto p = manager.find(id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->status, PositionStatus::Open);
    EXPECT_EQ(p->ticket, 100u);
    EXPECT_DOUBLE_EQ(p->entry_price, 1.1002);
    EXPECT_NEAR(p->stop_loss, 1.0982, 1e-9);
    EXPECT_NEAR(p->take_profit_1, 1.1022, 1e-9);
    EXPECT_NEAR(p->take_profit_2, 1.1042, 1e-9);
    EXPECT_EQ(p->ageing_deadline, clock.now() + std::chrono::minutes(120));

    const auto sent = broker.opens();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].client_id, id);
    EXPECT_NEAR(sent[0].stop_loss, 1.0980, 1e-9);
}

TEST_F(TradeLifecycleTest, RejectedEntryReleasesRisk) {
    broker.script_open(ExecutionStatus::Rejected);
    const auto id = submit();

    const auto p = manager.find(id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->status, PositionStatus::Closed);
    EXPECT_EQ(p->close_reason, CloseReason::EntryFailed);
    EXPECT_EQ(manager.active_count(), 0u);
    EXPECT_DOUBLE_EQ(ledger.snapshot().open_risk, 0.0);
    EXPECT_EQ(stats.snapshot().rejections, 1u);
    // Never filled, so not a trade
    EXPECT_EQ(ledger.snapshot().performance.trades, 0u);
}

TEST_F(TradeLifecycleTest, EntryTimeoutRetriesAfterDelayThenEscalates) {
    broker.set_default(ExecutionStatus::Timeout);
    const auto id = submit();
    EXPECT_EQ(broker.open_calls(), 1u);

    // Retry delay not yet elapsed
    tick(1.1000, 1.1001);
    EXPECT_EQ(broker.open_calls(), 1u);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::PendingEntry);

    clock.advance(std::chrono::seconds(1));
    tick(1.1000, 1.1001);
    EXPECT_EQ(broker.open_calls(), 2u);

    clock.advance(std::chrono::seconds(1));
    tick(1.1000, 1.1001);
    EXPECT_EQ(broker.open_calls(), 3u);

    const auto p = manager.find(id);
    EXPECT_EQ(p->status, PositionStatus::Closed);
    EXPECT_EQ(p->close_reason, CloseReason::EntryFailed);
    EXPECT_TRUE(p->fatal);

    EXPECT_EQ(events.count(RiskEventKind::ExecutionTimeout), 2u);
    EXPECT_EQ(events.count(RiskEventKind::ExecutionFatal), 1u);
    EXPECT_EQ(stats.snapshot().retries, 2u);
    EXPECT_EQ(stats.snapshot().fatal_escalations, 1u);
    EXPECT_DOUBLE_EQ(ledger.snapshot().open_risk, 0.0);
}

TEST_F(TradeLifecycleTest, EveryPendingEntryReachesClosedUnderTimeouts) {
    broker.set_default(ExecutionStatus::Timeout);
    std::vector<uint64_t> ids;
    for (int i = 0; i < 5; ++i) ids.push_back(submit(i % 2 == 0 ? Direction::Long : Direction::Short));

    for (int cycle = 0; cycle < 10; ++cycle) {
        clock.advance(std::chrono::milliseconds(400));
        tick(1.1000, 1.1001);
    }

    EXPECT_EQ(manager.active_count(), 0u);
    for (auto id : ids) {
        const auto p = manager.find(id);
        ASSERT_TRUE(p.has_value());
        EXPECT_EQ(p->status, PositionStatus::Closed);
        EXPECT_EQ(p->close_reason, CloseReason::EntryFailed);
    }
    EXPECT_EQ(broker.open_calls(), 15u);
    EXPECT_DOUBLE_EQ(ledger.snapshot().open_risk, 0.0);
}

// ============================================================================
// Exits
// ============================================================================

TEST_F(TradeLifecycleTest, StopLossClosesAtBid) {
    const auto id = submit();
    broker.set_fill_price(1.0979);
    tick(1.0979, 1.0980);

    const auto p = manager.find(id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->status, PositionStatus::Closed);
    EXPECT_EQ(p->close_reason, CloseReason::StopLoss);
    // 21 pips * 10 per lot * 0.1 lots
    EXPECT_NEAR(p->realized_pnl, -21.0, 1e-6);
    EXPECT_NEAR(ledger.snapshot().daily_realized_pnl, -21.0, 1e-6);
    EXPECT_DOUBLE_EQ(ledger.snapshot().open_risk, 0.0);
}

TEST_F(TradeLifecycleTest, ShortStopUsesAsk) {
    const auto id = submit(Direction::Short);
    // Short stop sits at 1.1020; bid alone crossing it does not trigger
    tick(1.1019, 1.1019);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Open);

    broker.set_fill_price(1.1021);
    tick(1.1019, 1.1021);
    EXPECT_EQ(manager.find(id)->close_reason, CloseReason::StopLoss);
}

TEST_F(TradeLifecycleTest, FirstTargetClosesHalfAndTrails) {
    const auto id = submit();

    broker.set_fill_price(1.1021);
    tick(1.1021, 1.1022);

    auto p = manager.find(id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->status, PositionStatus::Open);
    EXPECT_TRUE(p->tp1_hit);
    EXPECT_NEAR(p->size, 0.05, 1e-9);
    EXPECT_NEAR(p->realized_pnl, 10.5, 1e-6);
    EXPECT_TRUE(p->trailing_active);
    EXPECT_GT(p->stop_loss, p->entry_price);
    EXPECT_NEAR(ledger.snapshot().open_risk, 10.0, 1e-9);

    ASSERT_EQ(broker.closes().size(), 1u);
    EXPECT_NEAR(broker.closes()[0].second, 0.05, 1e-9);

    broker.set_fill_price(1.1042);
    tick(1.1042, 1.1043);

    p = manager.find(id);
    EXPECT_EQ(p->status, PositionStatus::Closed);
    EXPECT_EQ(p->close_reason, CloseReason::TakeProfit);
    EXPECT_NEAR(p->realized_pnl, 10.5 + 21.0, 1e-6);
    EXPECT_NEAR(ledger.snapshot().daily_realized_pnl, 31.5, 1e-6);

    // Both legs count as one winning trade
    const auto perf = ledger.snapshot().performance;
    EXPECT_EQ(perf.trades, 1u);
    EXPECT_EQ(perf.wins, 1u);
    EXPECT_NEAR(perf.gross_profit, 31.5, 1e-6);
}

TEST_F(TradeLifecycleTest, TrailingStopNeverLoosens) {
    const auto id = submit();
    broker.set_fill_price(1.1030);
    tick(1.1030, 1.1031);
    const double trailed = manager.find(id)->stop_loss;
    EXPECT_NEAR(trailed, 1.1010, 1e-9);

    tick(1.1015, 1.1016);
    EXPECT_DOUBLE_EQ(manager.find(id)->stop_loss, trailed);
}

TEST_F(TradeLifecycleTest, AgedPositionClosed) {
    const auto id = submit();
    clock.advance(std::chrono::minutes(119));
    tick(1.1000, 1.1001);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Open);

    clock.advance(std::chrono::minutes(1));
    tick(1.1000, 1.1001);
    const auto p = manager.find(id);
    EXPECT_EQ(p->status, PositionStatus::Closed);
    EXPECT_EQ(p->close_reason, CloseReason::Aged);
}

TEST_F(TradeLifecycleTest, ReevaluationOppositeSignalCloses) {
    const auto id = submit();
    EXPECT_TRUE(manager.due_for_reevaluation(eurusd).empty());

    clock.advance(std::chrono::minutes(30));
    tick(1.1000, 1.1001);
    ASSERT_EQ(manager.due_for_reevaluation(eurusd).size(), 1u);

    // Same direction keeps it open and resets the deadline
    manager.complete_reevaluation(id, Direction::Long);
    EXPECT_TRUE(manager.due_for_reevaluation(eurusd).empty());
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Open);

    clock.advance(std::chrono::minutes(30));
    tick(1.1000, 1.1001);
    manager.complete_reevaluation(id, Direction::Short);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Closing);

    tick(1.1000, 1.1001);
    EXPECT_EQ(manager.find(id)->close_reason, CloseReason::StrategyReversal);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Closed);
}

TEST_F(TradeLifecycleTest, RequestCloseOnlyForOpen) {
    EXPECT_FALSE(manager.request_close(999, CloseReason::Manual));

    const auto id = submit();
    EXPECT_TRUE(manager.request_close(id, CloseReason::Manual));
    EXPECT_FALSE(manager.request_close(id, CloseReason::Manual));

    tick(1.1000, 1.1001);
    EXPECT_EQ(manager.find(id)->close_reason, CloseReason::Manual);
    EXPECT_FALSE(manager.request_close(id, CloseReason::Manual));
}

TEST_F(TradeLifecycleTest, FailedClosesEscalateAndKeepForcing) {
    const auto id = submit();
    broker.set_default(ExecutionStatus::Timeout);
    ASSERT_TRUE(manager.request_close(id, CloseReason::Manual));

    tick(1.1000, 1.1001);
    clock.advance(std::chrono::seconds(1));
    tick(1.1000, 1.1001);
    clock.advance(std::chrono::seconds(1));
    tick(1.1000, 1.1001);

    // Third failure escalates and immediately forces another close
    EXPECT_EQ(broker.close_calls(), 4u);
    EXPECT_EQ(events.count(RiskEventKind::ExecutionTimeout), 2u);
    EXPECT_EQ(events.count(RiskEventKind::ExecutionFatal), 1u);
    ASSERT_EQ(manager.fatal_positions().size(), 1u);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Closing);
    EXPECT_EQ(stats.snapshot().forced_closes, 1u);

    broker.set_default(ExecutionStatus::Filled);
    clock.advance(std::chrono::seconds(1));
    tick(1.1000, 1.1001);

    EXPECT_EQ(manager.find(id)->status, PositionStatus::Closed);
    EXPECT_TRUE(manager.fatal_positions().empty());
    EXPECT_EQ(stats.snapshot().forced_closes, 2u);
    EXPECT_DOUBLE_EQ(ledger.snapshot().open_risk, 0.0);
}

TEST_F(TradeLifecycleTest, RejectedCloseIsRetried) {
    const auto id = submit();
    broker.script_close(ExecutionStatus::Rejected);
    ASSERT_TRUE(manager.request_close(id, CloseReason::Manual));

    tick(1.1000, 1.1001);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Closing);

    clock.advance(std::chrono::seconds(1));
    tick(1.1000, 1.1001);
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Closed);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(TradeLifecycleTest, ExposuresCoverPendingAndOpen) {
    submit(Direction::Long);
    broker.set_default(ExecutionStatus::Timeout);
    submit(Direction::Short);

    const auto exposures = manager.exposures();
    EXPECT_EQ(exposures.size(), 2u);
    EXPECT_EQ(manager.active_positions().size(), 2u);
    EXPECT_EQ(manager.active_positions()[1].status, PositionStatus::PendingEntry);
}

TEST_F(TradeLifecycleTest, OtherInstrumentsUntouched) {
    const auto id = submit();
    manager.process(Symbol("GBPUSD"), test::make_quote(Symbol("GBPUSD"), 1.0, 1.0001));
    EXPECT_EQ(manager.find(id)->status, PositionStatus::Open);
}
