#pragma once
// ============================================================================
// MERIDIAN - Position
// ============================================================================
// Lifecycle record owned by the TradeLifecycleManager
// pendingEntry -> open -> closing -> closed
// ============================================================================

#include "meridian/core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace meridian::order {

enum class PositionStatus : uint8_t { PendingEntry, Open, Closing, Closed };

enum class CloseReason : uint8_t {
    None,
    TakeProfit,
    StopLoss,
    Aged,
    Manual,
    StrategyReversal,
    EntryFailed
};

[[nodiscard]] constexpr std::string_view to_string(PositionStatus s) noexcept {
    switch (s) {
        case PositionStatus::PendingEntry: return "pending_entry";
        case PositionStatus::Open: return "open";
        case PositionStatus::Closing: return "closing";
        case PositionStatus::Closed: return "closed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(CloseReason r) noexcept {
    switch (r) {
        case CloseReason::None: return "none";
        case CloseReason::TakeProfit: return "take_profit";
        case CloseReason::StopLoss: return "stop_loss";
        case CloseReason::Aged: return "aged";
        case CloseReason::Manual: return "manual";
        case CloseReason::StrategyReversal: return "strategy_reversal";
        case CloseReason::EntryFailed: return "entry_failed";
    }
    return "unknown";
}

struct Position {
    uint64_t id = 0;
    Symbol symbol;
    std::string strategy;
    Direction direction = Direction::Long;
    PositionStatus status = PositionStatus::PendingEntry;
    CloseReason close_reason = CloseReason::None;

    // Sizing
    double size = 0.0;           // Lots still open
    double initial_size = 0.0;
    double risk_amount = 0.0;    // Reserved in the risk ledger
    double pip_size = 0.0001;
    double pip_value_per_lot = 10.0;

    // Levels. Re-armed from the fill price on entry
    double entry_price = 0.0;    // Reference price until filled
    double stop_pips = 0.0;
    double stop_loss = 0.0;
    double take_profit_1 = 0.0;  // 0 when a single target is used
    double take_profit_2 = 0.0;
    double tp1_ratio = 0.0;      // Multiple of risk, 0 = no partial target
    double tp1_fraction = 0.0;   // Share of size closed at take_profit_1
    double risk_reward_ratio = 2.0;
    bool tp1_hit = false;
    bool trailing_active = false;
    double best_price = 0.0;

    // Time
    Timestamp created_at;
    Timestamp opened_at;
    Timestamp ageing_deadline;
    Timestamp re_evaluation_deadline;
    Timestamp closed_at;
    bool needs_reevaluation = false;

    // Execution
    uint64_t ticket = 0;
    uint32_t attempts = 0;       // For the current pending request
    Timestamp next_attempt_at;
    bool fatal = false;          // Retries exhausted, escalated
    bool in_flight = false;      // Broker request outstanding

    // Result
    double exit_price = 0.0;
    double realized_pnl = 0.0;   // Includes partial closes

    [[nodiscard]] bool active() const noexcept { return status != PositionStatus::Closed; }

    /// Account-currency P&L of closing `lots` at `price`
    [[nodiscard]] double pnl_at(double price, double lots) const noexcept {
        if (pip_size <= 0.0) return 0.0;
        return (price - entry_price) / pip_size * pip_value_per_lot * lots * sign(direction);
    }

    /// Set stop and targets around `entry` from the stored distances
    void arm_levels(double entry) noexcept {
        entry_price = entry;
        best_price = entry;
        const double s = sign(direction);
        const double risk = stop_pips * pip_size;
        stop_loss = entry - s * risk;
        take_profit_1 = tp1_ratio > 0.0 ? entry + s * tp1_ratio * risk : 0.0;
        take_profit_2 = entry + s * risk_reward_ratio * risk;
    }
};

}  // namespace meridian::order
