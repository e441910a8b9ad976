#pragma once
// ============================================================================
// MERIDIAN - Risk Ledger
// ============================================================================
// The only mutable shared trading state: open risk per position, daily
// realized P&L, equity high-water mark, and the two circuit breakers.
// Every operation runs under one mutex; record_open is the authoritative
// admission check so concurrent instruments cannot over-commit the budget
// ============================================================================

#include "meridian/core/clock.hpp"
#include "meridian/core/types.hpp"
#include "meridian/risk/account_tier.hpp"
#include "meridian/risk/risk_events.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meridian::risk {

// ============================================================================
// Configuration
// ============================================================================

struct LedgerConfig {
    double max_daily_risk = 0.05;       // Open risk + realized loss, fraction of day-start equity
    double daily_loss_limit = 0.05;     // Realized loss fraction latching the daily breaker
    double max_drawdown = 0.15;         // Drawdown from the high-water mark tripping the breaker
    double drawdown_hysteresis = 0.03;  // Breaker clears at max_drawdown - hysteresis
};

// ============================================================================
// Types
// ============================================================================

/// Risk contribution of one pending or open position
struct PositionRisk {
    uint64_t id = 0;
    Symbol symbol;
    Direction direction = Direction::Long;
    double risk_amount = 0.0;  // Account currency at stake to the stop
};

enum class AdmissionCode : uint8_t {
    Admitted,
    DailyLossLimit,
    DrawdownBreaker,
    InstrumentLimit,
    DailyRiskBudget,
    Duplicate,
    InvalidRisk
};

[[nodiscard]] constexpr std::string_view to_string(AdmissionCode c) noexcept {
    switch (c) {
        case AdmissionCode::Admitted: return "admitted";
        case AdmissionCode::DailyLossLimit: return "daily_loss_limit";
        case AdmissionCode::DrawdownBreaker: return "drawdown_breaker";
        case AdmissionCode::InstrumentLimit: return "instrument_limit";
        case AdmissionCode::DailyRiskBudget: return "daily_risk_budget";
        case AdmissionCode::Duplicate: return "duplicate";
        case AdmissionCode::InvalidRisk: return "invalid_risk";
    }
    return "unknown";
}

struct LedgerDecision {
    AdmissionCode code = AdmissionCode::Admitted;
    std::string reason;

    [[nodiscard]] bool admitted() const noexcept { return code == AdmissionCode::Admitted; }
};

/// Closed-trade statistics since start. A trade's P&L includes its partial closes
struct PerformanceSummary {
    uint64_t trades = 0;
    uint64_t wins = 0;    // P&L > 0
    uint64_t losses = 0;  // P&L < 0
    double gross_profit = 0.0;
    double gross_loss = 0.0;  // Positive magnitude

    void add(double pnl) noexcept {
        ++trades;
        if (pnl > 0.0) {
            ++wins;
            gross_profit += pnl;
        } else if (pnl < 0.0) {
            ++losses;
            gross_loss -= pnl;
        }
    }

    [[nodiscard]] double net_pnl() const noexcept { return gross_profit - gross_loss; }

    /// 0-100
    [[nodiscard]] double win_rate() const noexcept {
        return trades == 0 ? 0.0 : 100.0 * static_cast<double>(wins) / static_cast<double>(trades);
    }

    [[nodiscard]] double average_win() const noexcept {
        return wins == 0 ? 0.0 : gross_profit / static_cast<double>(wins);
    }

    [[nodiscard]] double average_loss() const noexcept {
        return losses == 0 ? 0.0 : gross_loss / static_cast<double>(losses);
    }

    [[nodiscard]] double average_pnl() const noexcept {
        return trades == 0 ? 0.0 : net_pnl() / static_cast<double>(trades);
    }

    /// 0 while there are no losses
    [[nodiscard]] double profit_factor() const noexcept {
        return gross_loss <= 0.0 ? 0.0 : gross_profit / gross_loss;
    }
};

struct LedgerSnapshot {
    double daily_realized_pnl = 0.0;
    bool daily_loss_limit_breached = false;
    bool drawdown_breaker = false;
    double current_drawdown_percent = 0.0;  // 0-100
    double equity = 0.0;
    double day_start_equity = 0.0;
    double high_water_mark = 0.0;
    double open_risk = 0.0;
    std::map<Symbol, size_t> open_positions_by_instrument;
    std::map<std::string, double> open_risk_by_group;
    int64_t trading_day = 0;  // Days since epoch, UTC
    std::string tier;
    PerformanceSummary performance;

    [[nodiscard]] bool halted() const noexcept {
        return daily_loss_limit_breached || drawdown_breaker;
    }
};

// ============================================================================
// Ledger
// ============================================================================

class RiskLedger {
public:
    /// Maps an instrument to its correlation group name for risk aggregation
    using GroupResolver = std::function<std::string(const Symbol&)>;

    RiskLedger(const LedgerConfig& config, AccountTierTable tiers, double initial_equity,
               const IClock& clock, RiskEventLog* events = nullptr,
               GroupResolver groups = nullptr);

    RiskLedger(const RiskLedger&) = delete;
    RiskLedger& operator=(const RiskLedger&) = delete;

    /// Advisory pre-check before sizing. record_open re-checks atomically
    [[nodiscard]] LedgerDecision can_admit_new_trade(const Symbol& symbol);

    /// Reserve the position's risk if every limit still holds
    [[nodiscard]] LedgerDecision record_open(const PositionRisk& position);

    /// Realize part of a position: its open risk shrinks by the closed fraction
    void record_partial_close(uint64_t id, double closed_fraction, double realized_pnl);

    /// Release the position and fold its realized P&L into the daily aggregates
    void record_close(uint64_t id, double realized_pnl);

    /// Drop the reservation of an entry that never filled. Not counted as a trade
    void release(uint64_t id);

    /// Mark equity from the account-info query
    void update_equity(double equity);

    /// Operator reset of the drawdown breaker; rebases the high-water mark
    void reset_drawdown_breaker();

    [[nodiscard]] LedgerSnapshot snapshot();

    [[nodiscard]] bool halted();
    [[nodiscard]] double equity() const;
    [[nodiscard]] AccountTier current_tier() const;
    [[nodiscard]] const LedgerConfig& config() const { return config_; }

private:
    // All *_locked helpers require mutex_ held
    void roll_day_locked(Timestamp now, std::vector<RiskEvent>& events);
    void evaluate_drawdown_locked(Timestamp now, std::vector<RiskEvent>& events);
    void evaluate_daily_loss_locked(Timestamp now, std::vector<RiskEvent>& events);
    [[nodiscard]] LedgerDecision check_limits_locked(const Symbol& symbol) const;
    [[nodiscard]] double drawdown_locked() const noexcept;
    [[nodiscard]] double open_risk_locked() const noexcept;

    void publish(std::vector<RiskEvent>& events);

    LedgerConfig config_;
    AccountTierTable tiers_;
    const IClock& clock_;
    RiskEventLog* events_;
    GroupResolver groups_;

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, PositionRisk> open_;
    std::unordered_map<Symbol, size_t> open_count_;
    double equity_;
    double day_start_equity_;
    double high_water_mark_;
    double daily_realized_pnl_ = 0.0;
    std::unordered_map<uint64_t, double> booked_;  // Partial-close P&L per open position
    PerformanceSummary performance_;
    int64_t trading_day_;
    bool daily_breaker_ = false;
    bool drawdown_breaker_ = false;
};

}  // namespace meridian::risk
