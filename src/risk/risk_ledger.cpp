// ============================================================================
// MERIDIAN - Risk Ledger Implementation
// ============================================================================

#include "meridian/risk/risk_ledger.hpp"

#include "meridian/utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace meridian::risk {

namespace {

// Equity ratios are not exact in binary; 850 / 1000 is a 15% drawdown
constexpr double DRAWDOWN_EPSILON = 1e-9;

}  // namespace

RiskLedger::RiskLedger(const LedgerConfig& config, AccountTierTable tiers, double initial_equity,
                       const IClock& clock, RiskEventLog* events, GroupResolver groups)
    : config_(config),
      tiers_(std::move(tiers)),
      clock_(clock),
      events_(events),
      groups_(std::move(groups)),
      equity_(std::isfinite(initial_equity) ? std::max(initial_equity, 0.0) : 0.0),
      day_start_equity_(equity_),
      high_water_mark_(equity_),
      trading_day_(utc_day(clock.now())) {
    if (!groups_) {
        groups_ = [](const Symbol& s) { return s.str(); };
    }
}

// ============================================================================
// Admission
// ============================================================================

LedgerDecision RiskLedger::can_admit_new_trade(const Symbol& symbol) {
    std::vector<RiskEvent> events;
    LedgerDecision decision;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll_day_locked(clock_.now(), events);
        decision = check_limits_locked(symbol);
    }
    publish(events);
    return decision;
}

LedgerDecision RiskLedger::record_open(const PositionRisk& position) {
    std::vector<RiskEvent> events;
    LedgerDecision decision;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll_day_locked(clock_.now(), events);

        if (!std::isfinite(position.risk_amount) || position.risk_amount < 0.0) {
            decision = {AdmissionCode::InvalidRisk, "risk amount must be finite and >= 0"};
        } else if (open_.contains(position.id)) {
            decision = {AdmissionCode::Duplicate,
                        fmt::format("position {} already recorded", position.id)};
        } else {
            decision = check_limits_locked(position.symbol);
        }

        if (decision.admitted()) {
            const double budget = config_.max_daily_risk * day_start_equity_;
            const double committed = open_risk_locked() + std::max(0.0, -daily_realized_pnl_);
            if (committed + position.risk_amount > budget + 1e-9) {
                decision = {AdmissionCode::DailyRiskBudget,
                            fmt::format("risk {:.2f} + committed {:.2f} exceeds daily budget {:.2f}",
                                        position.risk_amount, committed, budget)};
            }
        }

        if (decision.admitted()) {
            open_.emplace(position.id, position);
            ++open_count_[position.symbol];
        }
    }
    publish(events);

    if (decision.admitted()) {
        LOG_DEBUG("[LEDGER] Opened #{} {} {} risk {:.2f}", position.id, position.symbol.view(),
                  to_string(position.direction), position.risk_amount);
    }
    return decision;
}

LedgerDecision RiskLedger::check_limits_locked(const Symbol& symbol) const {
    if (daily_breaker_) {
        return {AdmissionCode::DailyLossLimit,
                fmt::format("daily loss limit breached ({:.2f})", daily_realized_pnl_)};
    }
    if (drawdown_breaker_ || drawdown_locked() >= config_.max_drawdown - DRAWDOWN_EPSILON) {
        return {AdmissionCode::DrawdownBreaker,
                fmt::format("drawdown {:.2f}% at or above limit {:.2f}%",
                            drawdown_locked() * 100.0, config_.max_drawdown * 100.0)};
    }

    const auto& tier = tiers_.tier_for(equity_);
    auto it = open_count_.find(symbol);
    const size_t count = it == open_count_.end() ? 0 : it->second;
    if (count >= tier.max_trades) {
        return {AdmissionCode::InstrumentLimit,
                fmt::format("{} open on {}, {} tier allows {}", count, symbol.view(), tier.label,
                            tier.max_trades)};
    }
    return {AdmissionCode::Admitted, "ok"};
}

// ============================================================================
// Position Updates
// ============================================================================

void RiskLedger::record_partial_close(uint64_t id, double closed_fraction, double realized_pnl) {
    std::vector<RiskEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        roll_day_locked(now, events);

        auto it = open_.find(id);
        if (it != open_.end()) {
            const double keep = 1.0 - std::clamp(closed_fraction, 0.0, 1.0);
            it->second.risk_amount *= keep;
            if (std::isfinite(realized_pnl)) booked_[id] += realized_pnl;
        }
        if (std::isfinite(realized_pnl)) {
            daily_realized_pnl_ += realized_pnl;
            equity_ += realized_pnl;
            high_water_mark_ = std::max(high_water_mark_, equity_);
        }
        evaluate_daily_loss_locked(now, events);
        evaluate_drawdown_locked(now, events);
    }
    publish(events);
}

void RiskLedger::record_close(uint64_t id, double realized_pnl) {
    std::vector<RiskEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        roll_day_locked(now, events);

        auto it = open_.find(id);
        if (it == open_.end()) {
            LOG_WARN("[LEDGER] Close for unknown position #{}", id);
        } else {
            auto count = open_count_.find(it->second.symbol);
            if (count != open_count_.end() && --count->second == 0) {
                open_count_.erase(count);
            }
            open_.erase(it);

            double trade_pnl = std::isfinite(realized_pnl) ? realized_pnl : 0.0;
            if (auto booked = booked_.find(id); booked != booked_.end()) {
                trade_pnl += booked->second;
                booked_.erase(booked);
            }
            performance_.add(trade_pnl);
        }

        if (std::isfinite(realized_pnl)) {
            daily_realized_pnl_ += realized_pnl;
            equity_ += realized_pnl;
            high_water_mark_ = std::max(high_water_mark_, equity_);
        }
        evaluate_daily_loss_locked(now, events);
        evaluate_drawdown_locked(now, events);
    }
    publish(events);
}

void RiskLedger::release(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_.find(id);
    if (it == open_.end()) return;
    auto count = open_count_.find(it->second.symbol);
    if (count != open_count_.end() && --count->second == 0) {
        open_count_.erase(count);
    }
    open_.erase(it);
    booked_.erase(id);
    LOG_DEBUG("[LEDGER] Released #{} without a fill", id);
}

void RiskLedger::update_equity(double equity) {
    if (!std::isfinite(equity) || equity < 0.0) return;

    std::vector<RiskEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        roll_day_locked(now, events);
        equity_ = equity;
        high_water_mark_ = std::max(high_water_mark_, equity_);
        evaluate_drawdown_locked(now, events);
    }
    publish(events);
}

void RiskLedger::reset_drawdown_breaker() {
    std::vector<RiskEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (drawdown_breaker_) {
            events.push_back(RiskEvent{RiskEventKind::CircuitBreakerReset, Symbol{}, 0,
                                       fmt::format("drawdown breaker reset by operator at {:.2f}%",
                                                   drawdown_locked() * 100.0),
                                       clock_.now()});
        }
        drawdown_breaker_ = false;
        high_water_mark_ = equity_;
    }
    publish(events);
}

// ============================================================================
// Breakers
// ============================================================================

void RiskLedger::roll_day_locked(Timestamp now, std::vector<RiskEvent>& events) {
    const int64_t day = utc_day(now);
    if (day <= trading_day_) return;

    trading_day_ = day;
    daily_realized_pnl_ = 0.0;
    day_start_equity_ = equity_;
    if (daily_breaker_) {
        daily_breaker_ = false;
        events.push_back(RiskEvent{RiskEventKind::CircuitBreakerReset, Symbol{}, 0,
                                   "daily loss limit cleared by UTC day rollover", now});
    }
}

void RiskLedger::evaluate_daily_loss_locked(Timestamp now, std::vector<RiskEvent>& events) {
    if (daily_breaker_) return;
    const double limit = config_.daily_loss_limit * day_start_equity_;
    if (daily_realized_pnl_ < 0.0 && -daily_realized_pnl_ >= limit) {
        daily_breaker_ = true;
        events.push_back(RiskEvent{RiskEventKind::CircuitBreakerTripped, Symbol{}, 0,
                                   fmt::format("daily realized loss {:.2f} reached limit {:.2f}",
                                               -daily_realized_pnl_, limit),
                                   now});
    }
}

void RiskLedger::evaluate_drawdown_locked(Timestamp now, std::vector<RiskEvent>& events) {
    const double dd = drawdown_locked();
    if (!drawdown_breaker_ && dd >= config_.max_drawdown - DRAWDOWN_EPSILON) {
        drawdown_breaker_ = true;
        events.push_back(RiskEvent{RiskEventKind::CircuitBreakerTripped, Symbol{}, 0,
                                   fmt::format("drawdown {:.2f}% reached limit {:.2f}%", dd * 100.0,
                                               config_.max_drawdown * 100.0),
                                   now});
    } else if (drawdown_breaker_ && dd <= config_.max_drawdown - config_.drawdown_hysteresis) {
        drawdown_breaker_ = false;
        events.push_back(RiskEvent{RiskEventKind::CircuitBreakerReset, Symbol{}, 0,
                                   fmt::format("drawdown recovered to {:.2f}%", dd * 100.0), now});
    }
}

double RiskLedger::drawdown_locked() const noexcept {
    if (high_water_mark_ <= 0.0) return 0.0;
    return std::max(0.0, 1.0 - equity_ / high_water_mark_);
}

double RiskLedger::open_risk_locked() const noexcept {
    double total = 0.0;
    for (const auto& [id, p] : open_) total += p.risk_amount;
    return total;
}

void RiskLedger::publish(std::vector<RiskEvent>& events) {
    if (events_ == nullptr) return;
    for (auto& e : events) events_->record(std::move(e));
}

// ============================================================================
// Queries
// ============================================================================

LedgerSnapshot RiskLedger::snapshot() {
    std::vector<RiskEvent> events;
    LedgerSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll_day_locked(clock_.now(), events);

        s.daily_realized_pnl = daily_realized_pnl_;
        s.daily_loss_limit_breached = daily_breaker_;
        s.drawdown_breaker = drawdown_breaker_;
        s.current_drawdown_percent = drawdown_locked() * 100.0;
        s.equity = equity_;
        s.day_start_equity = day_start_equity_;
        s.high_water_mark = high_water_mark_;
        s.open_risk = open_risk_locked();
        s.trading_day = trading_day_;
        s.tier = tiers_.tier_for(equity_).label;
        s.performance = performance_;
        for (const auto& [symbol, count] : open_count_) {
            s.open_positions_by_instrument[symbol] = count;
        }
        for (const auto& [id, p] : open_) {
            s.open_risk_by_group[groups_(p.symbol)] += p.risk_amount;
        }
    }
    publish(events);
    return s;
}

bool RiskLedger::halted() {
    std::vector<RiskEvent> events;
    bool halted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll_day_locked(clock_.now(), events);
        halted = daily_breaker_ || drawdown_breaker_;
    }
    publish(events);
    return halted;
}

double RiskLedger::equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return equity_;
}

AccountTier RiskLedger::current_tier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiers_.tier_for(equity_);
}

}  // namespace meridian::risk
