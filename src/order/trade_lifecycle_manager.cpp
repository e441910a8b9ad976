// ============================================================================
// MERIDIAN - Trade Lifecycle Manager Implementation
// ============================================================================
// Broker calls are made without holding mutex_; in_flight marks a position
// whose request is outstanding so no second request is issued for it
// ============================================================================

#include "meridian/order/trade_lifecycle_manager.hpp"

#include "meridian/utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace meridian::order {

TradeLifecycleManager::TradeLifecycleManager(const LifecycleConfig& config,
                                             execution::IExecutionClient& client,
                                             risk::RiskLedger& ledger,
                                             risk::RiskEventLog& events,
                                             execution::ExecutionStats& stats,
                                             const IClock& clock)
    : config_(config),
      client_(client),
      ledger_(ledger),
      events_(events),
      stats_(stats),
      clock_(clock) {}

// ============================================================================
// Broker Calls
// ============================================================================

execution::ExecutionResult TradeLifecycleManager::call_open(const execution::OpenRequest& request) {
    execution::ExecutionResult result;
    try {
        result = client_.open_position(request, config_.request_timeout);
    } catch (const std::exception& e) {
        LOG_ERROR("[LIFECYCLE] open_position threw for #{}: {}", request.client_id, e.what());
        result.status = execution::ExecutionStatus::Timeout;
        result.message = e.what();
    }
    stats_.record(result.status);
    return result;
}

execution::ExecutionResult TradeLifecycleManager::call_close(uint64_t ticket, double size) {
    execution::ExecutionResult result;
    try {
        result = client_.close_position(ticket, size, config_.request_timeout);
    } catch (const std::exception& e) {
        LOG_ERROR("[LIFECYCLE] close_position threw for ticket {}: {}", ticket, e.what());
        result.status = execution::ExecutionStatus::Timeout;
        result.message = e.what();
    }
    stats_.record(result.status);
    return result;
}

// ============================================================================
// Entry
// ============================================================================

void TradeLifecycleManager::submit_entry(Position position) {
    const uint64_t id = position.id;
    register_entry(std::move(position));
    attempt_entry(id);
}

void TradeLifecycleManager::register_entry(Position position) {
    std::lock_guard<std::mutex> lock(mutex_);
    position.status = PositionStatus::PendingEntry;
    position.created_at = clock_.now();
    position.next_attempt_at = position.created_at;
    position.attempts = 0;
    position.in_flight = false;
    position.initial_size = position.size;
    const uint64_t id = position.id;
    positions_.emplace(id, std::move(position));
}

void TradeLifecycleManager::attempt_entry(uint64_t id) {
    execution::OpenRequest request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) return;
        auto& p = it->second;
        if (p.status != PositionStatus::PendingEntry || p.in_flight) return;
        request.symbol = p.symbol;
        request.direction = p.direction;
        request.size = p.size;
        request.stop_loss = p.stop_loss;
        request.take_profit = p.take_profit_2;
        request.client_id = p.id;
        p.in_flight = true;
        ++p.attempts;
    }

    const auto result = call_open(request);

    std::optional<Position> failed;
    bool fatal = false;
    bool retry = false;
    uint32_t attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) return;
        auto& p = it->second;
        p.in_flight = false;
        attempts = p.attempts;
        const auto now = clock_.now();

        switch (result.status) {
            case execution::ExecutionStatus::Filled:
                p.status = PositionStatus::Open;
                p.ticket = result.ticket;
                if (result.size > 0.0) p.size = result.size;
                p.initial_size = p.size;
                p.arm_levels(result.price > 0.0 ? result.price : p.entry_price);
                p.opened_at = now;
                p.ageing_deadline = now + config_.position_aging;
                p.re_evaluation_deadline = now + config_.re_evaluation_interval;
                p.attempts = 0;
                LOG_INFO("[LIFECYCLE] #{} {} {} {:.2f} lots filled at {:.5f} (SL {:.5f} TP {:.5f})",
                         p.id, p.symbol.view(), to_string(p.direction), p.size, p.entry_price,
                         p.stop_loss, p.take_profit_2);
                break;

            case execution::ExecutionStatus::Rejected:
                LOG_WARN("[LIFECYCLE] #{} {} entry rejected: {}", p.id, p.symbol.view(),
                         result.message);
                p.status = PositionStatus::Closed;
                p.close_reason = CloseReason::EntryFailed;
                p.closed_at = now;
                failed = std::move(p);
                positions_.erase(it);
                break;

            case execution::ExecutionStatus::Timeout:
                if (p.attempts >= config_.retry_attempts) {
                    fatal = true;
                    p.fatal = true;
                    p.status = PositionStatus::Closed;
                    p.close_reason = CloseReason::EntryFailed;
                    p.closed_at = now;
                    failed = std::move(p);
                    positions_.erase(it);
                } else {
                    retry = true;
                    p.next_attempt_at = now + config_.retry_delay;
                }
                break;
        }
    }

    if (retry) {
        stats_.record_retry();
        events_.record(RiskEventKind::ExecutionTimeout, request.symbol, id,
                       fmt::format("entry attempt {}/{} timed out: {}", attempts,
                                   config_.retry_attempts, result.message),
                       clock_.now());
    }
    if (fatal) {
        stats_.record_fatal();
        events_.record(RiskEventKind::ExecutionFatal, request.symbol, id,
                       fmt::format("entry unconfirmed after {} attempts, abandoned", attempts),
                       clock_.now());
    }
    if (failed) {
        finalize(std::move(*failed), 0.0, false);
    }
}

// ============================================================================
// Monitoring
// ============================================================================

void TradeLifecycleManager::process(const Symbol& symbol, const Quote& quote) {
    std::vector<uint64_t> entries;
    std::vector<std::pair<uint64_t, double>> partials;
    std::vector<uint64_t> closes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        for (auto& [id, p] : positions_) {
            if (p.symbol != symbol || p.in_flight) continue;
            switch (p.status) {
                case PositionStatus::PendingEntry:
                    if (now >= p.next_attempt_at) entries.push_back(id);
                    break;
                case PositionStatus::Open: {
                    const double lots = evaluate_open_locked(p, quote, now);
                    if (p.status == PositionStatus::Closing) {
                        closes.push_back(id);
                    } else if (lots > 0.0) {
                        partials.emplace_back(id, lots);
                    }
                    break;
                }
                case PositionStatus::Closing:
                    if (now >= p.next_attempt_at) closes.push_back(id);
                    break;
                case PositionStatus::Closed:
                    break;
            }
        }
    }

    for (auto id : entries) attempt_entry(id);
    for (const auto& [id, lots] : partials) attempt_partial(id, lots);
    for (auto id : closes) attempt_close(id);
}

double TradeLifecycleManager::evaluate_open_locked(Position& p, const Quote& quote, Timestamp now) {
    const double price = quote.exit_price(p.direction);
    if (!std::isfinite(price) || price <= 0.0) return 0.0;
    const double s = sign(p.direction);

    if (s * (price - p.stop_loss) <= 0.0) {
        begin_close_locked(p, CloseReason::StopLoss, now);
        return 0.0;
    }
    if (s * (price - p.take_profit_2) >= 0.0) {
        begin_close_locked(p, CloseReason::TakeProfit, now);
        return 0.0;
    }
    if (now >= p.ageing_deadline) {
        begin_close_locked(p, CloseReason::Aged, now);
        return 0.0;
    }
    if (now >= p.re_evaluation_deadline) {
        p.needs_reevaluation = true;
    }

    // Trailing stop ratchets toward price, never away
    if (s * (price - p.best_price) > 0.0) p.best_price = price;
    if (config_.trailing_enabled && p.stop_pips > 0.0) {
        const double favorable = s * (p.best_price - p.entry_price);
        if (!p.trailing_active &&
            favorable >= config_.trailing_activation_ratio * p.stop_pips * p.pip_size) {
            p.trailing_active = true;
            LOG_DEBUG("[LIFECYCLE] #{} trailing stop active", p.id);
        }
        if (p.trailing_active) {
            const double candidate = p.best_price - s * config_.trail_distance_pips * p.pip_size;
            if (s * (candidate - p.stop_loss) > 0.0) p.stop_loss = candidate;
        }
    }

    if (p.take_profit_1 > 0.0 && !p.tp1_hit && s * (price - p.take_profit_1) >= 0.0) {
        double lots = p.size * p.tp1_fraction;
        if (config_.lot_step > 0.0) {
            lots = std::floor(lots / config_.lot_step + 1e-9) * config_.lot_step;
        }
        if (lots <= 0.0 || lots >= p.size - 1e-9) {
            // Too small to split; ride the full size to the final target
            p.tp1_hit = true;
            return 0.0;
        }
        return lots;
    }
    return 0.0;
}

void TradeLifecycleManager::attempt_partial(uint64_t id, double lots) {
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) return;
        auto& p = it->second;
        if (p.status != PositionStatus::Open || p.in_flight || p.tp1_hit) return;
        ticket = p.ticket;
        p.in_flight = true;
    }

    const auto result = call_close(ticket, lots);

    double fraction = 0.0;
    double pnl = 0.0;
    Symbol symbol;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) return;
        auto& p = it->second;
        p.in_flight = false;
        symbol = p.symbol;
        if (result.filled() && p.size > 0.0) {
            const double closed = std::min(result.size > 0.0 ? result.size : lots, p.size);
            fraction = closed / p.size;
            pnl = p.pnl_at(result.price, closed);
            p.size -= closed;
            p.realized_pnl += pnl;
            p.risk_amount *= 1.0 - fraction;
            p.tp1_hit = true;
            LOG_INFO("[LIFECYCLE] #{} first target: closed {:.2f} lots, P&L {:.2f}", id, closed, pnl);
        }
    }

    if (fraction > 0.0) {
        ledger_.record_partial_close(id, fraction, pnl);
    } else if (result.status == execution::ExecutionStatus::Timeout) {
        events_.record(RiskEventKind::ExecutionTimeout, symbol, id,
                       "partial close timed out, retrying next cycle", clock_.now());
    }
}

// ============================================================================
// Exit
// ============================================================================

void TradeLifecycleManager::begin_close_locked(Position& p, CloseReason reason, Timestamp now) {
    p.status = PositionStatus::Closing;
    p.close_reason = reason;
    p.attempts = 0;
    p.next_attempt_at = now;
    p.needs_reevaluation = false;
    LOG_INFO("[LIFECYCLE] #{} {} closing: {}", p.id, p.symbol.view(), to_string(reason));
}

bool TradeLifecycleManager::request_close(uint64_t id, CloseReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || it->second.status != PositionStatus::Open) return false;
    begin_close_locked(it->second, reason, clock_.now());
    return true;
}

void TradeLifecycleManager::attempt_close(uint64_t id) {
    uint64_t ticket = 0;
    double size = 0.0;
    bool forced = false;
    Symbol symbol;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) return;
        auto& p = it->second;
        if (p.status != PositionStatus::Closing || p.in_flight) return;
        ticket = p.ticket;
        size = p.size;
        forced = p.fatal;
        symbol = p.symbol;
        p.in_flight = true;
        ++p.attempts;
    }

    if (forced) stats_.record_forced_close();
    const auto result = call_close(ticket, size);

    std::optional<Position> done;
    double final_leg = 0.0;
    bool escalate = false;
    uint32_t attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) return;
        auto& p = it->second;
        p.in_flight = false;
        attempts = p.attempts;
        const auto now = clock_.now();

        if (result.filled()) {
            final_leg = p.pnl_at(result.price, p.size);
            p.realized_pnl += final_leg;
            p.exit_price = result.price;
            p.size = 0.0;
            p.status = PositionStatus::Closed;
            p.closed_at = now;
            done = std::move(p);
            positions_.erase(it);
        } else {
            if (!p.fatal && p.attempts >= config_.retry_attempts) {
                p.fatal = true;
                escalate = true;
            }
            p.next_attempt_at = now + config_.retry_delay;
        }
    }

    if (done) {
        LOG_INFO("[LIFECYCLE] #{} {} closed ({}) at {:.5f}, P&L {:.2f}", id, symbol.view(),
                 to_string(done->close_reason), done->exit_price, done->realized_pnl);
        finalize(std::move(*done), final_leg, true);
        return;
    }

    if (escalate) {
        stats_.record_fatal();
        events_.record(RiskEventKind::ExecutionFatal, symbol, id,
                       fmt::format("close unconfirmed after {} attempts: {}; forcing market close",
                                   attempts, result.message),
                       clock_.now());
        attempt_close(id);
        return;
    }

    if (!forced) {
        stats_.record_retry();
        events_.record(RiskEventKind::ExecutionTimeout, symbol, id,
                       fmt::format("close attempt {}/{} failed ({}): {}", attempts,
                                   config_.retry_attempts, execution::to_string(result.status),
                                   result.message),
                       clock_.now());
    }
}

void TradeLifecycleManager::finalize(Position closed, double final_leg_pnl, bool filled) {
    if (filled) {
        ledger_.record_close(closed.id, final_leg_pnl);
    } else {
        ledger_.release(closed.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    archive_.push_back(std::move(closed));
    while (archive_.size() > config_.archive_capacity) {
        archive_.pop_front();
    }
}

// ============================================================================
// Re-evaluation
// ============================================================================

std::vector<Position> TradeLifecycleManager::due_for_reevaluation(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    for (const auto& [id, p] : positions_) {
        if (p.symbol == symbol && p.status == PositionStatus::Open && p.needs_reevaluation) {
            out.push_back(p);
        }
    }
    return out;
}

void TradeLifecycleManager::complete_reevaluation(uint64_t id, std::optional<Direction> signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || it->second.status != PositionStatus::Open) return;
    auto& p = it->second;
    const auto now = clock_.now();
    p.needs_reevaluation = false;
    p.re_evaluation_deadline = now + config_.re_evaluation_interval;
    if (signal && *signal == opposite(p.direction)) {
        begin_close_locked(p, CloseReason::StrategyReversal, now);
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Position> TradeLifecycleManager::find(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it != positions_.end()) return it->second;
    for (const auto& p : archive_) {
        if (p.id == id) return p;
    }
    return std::nullopt;
}

std::vector<Position> TradeLifecycleManager::active_positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [id, p] : positions_) out.push_back(p);
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    return out;
}

std::vector<Position> TradeLifecycleManager::archived_positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {archive_.begin(), archive_.end()};
}

std::vector<Position> TradeLifecycleManager::fatal_positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    for (const auto& [id, p] : positions_) {
        if (p.fatal) out.push_back(p);
    }
    return out;
}

std::vector<risk::OpenExposure> TradeLifecycleManager::exposures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<risk::OpenExposure> out;
    out.reserve(positions_.size());
    for (const auto& [id, p] : positions_) {
        out.push_back(risk::OpenExposure{p.symbol, p.direction});
    }
    return out;
}

size_t TradeLifecycleManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

}  // namespace meridian::order
