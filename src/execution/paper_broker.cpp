// ============================================================================
// MERIDIAN - Paper Broker Implementation
// ============================================================================

#include "meridian/execution/paper_broker.hpp"

#include "meridian/utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace meridian::execution {

PaperBroker::PaperBroker(PaperBrokerConfig config, const IClock& clock)
    : config_(std::move(config)),
      clock_(clock),
      rng_(config_.seed),
      balance_(config_.initial_balance) {
    const auto now = clock_.now();
    const auto step = std::chrono::duration_cast<Duration>(config_.bar_interval);
    for (const auto& instrument : config_.instruments) {
        Series series{instrument, {}};
        const auto n = static_cast<int64_t>(config_.history_bars);
        for (int64_t i = n; i > 0; --i) {
            series.bars.push_back(next_bar(series, now - step * i));
        }
        series_.emplace(instrument.spec.symbol, std::move(series));
    }
    LOG_INFO("[PAPER] Broker ready: {} instruments, balance {:.2f}", series_.size(), balance_);
}

// ============================================================================
// Price Simulation
// ============================================================================

Bar PaperBroker::next_bar(Series& series, Timestamp open_time) {
    const auto& inst = series.instrument;
    const double pip = inst.spec.pip_size;
    const double open = series.bars.empty() ? inst.start_price : series.bars.back().close;

    std::normal_distribution<double> move(0.0, inst.volatility_pips * pip);
    std::uniform_real_distribution<double> wick(0.0, 0.5 * inst.volatility_pips * pip);
    std::lognormal_distribution<double> volume(0.0, 0.3);
    std::uniform_real_distribution<double> spread(0.8, 1.2);

    Bar bar;
    bar.open_time = open_time;
    bar.open = open;
    bar.close = std::max(open + move(rng_), pip);
    bar.high = std::max(bar.open, bar.close) + wick(rng_);
    bar.low = std::max(std::min(bar.open, bar.close) - wick(rng_), pip * 0.5);
    bar.volume = inst.volume * volume(rng_);
    bar.spread = inst.spread_pips * spread(rng_);
    return bar;
}

void PaperBroker::advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto step = std::chrono::duration_cast<Duration>(config_.bar_interval);
    for (auto& [symbol, series] : series_) {
        const auto open_time = series.bars.empty() ? clock_.now() : series.bars.back().open_time + step;
        series.bars.push_back(next_bar(series, open_time));
        while (series.bars.size() > config_.history_bars) {
            series.bars.pop_front();
        }
    }
}

Quote PaperBroker::quote_locked(const Series& series) const {
    const auto& last = series.bars.back();
    const double half = 0.5 * last.spread * series.instrument.spec.pip_size;
    Quote q;
    q.symbol = series.instrument.spec.symbol;
    q.time = clock_.now();
    q.bid = last.close - half;
    q.ask = last.close + half;
    return q;
}

bool PaperBroker::roll(double probability) {
    if (probability <= 0.0) return false;
    std::uniform_real_distribution<double> u(0.0, 1.0);
    return u(rng_) < probability;
}

// ============================================================================
// Feed
// ============================================================================

std::optional<Quote> PaperBroker::quote(const Symbol& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(symbol);
    if (it == series_.end() || it->second.bars.empty()) return std::nullopt;
    return quote_locked(it->second);
}

std::vector<Bar> PaperBroker::bars(const Symbol& symbol, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(symbol);
    if (it == series_.end()) return {};
    const auto& bars = it->second.bars;
    const size_t n = std::min(count, bars.size());
    return {bars.end() - static_cast<std::ptrdiff_t>(n), bars.end()};
}

// ============================================================================
// Execution
// ============================================================================

ExecutionResult PaperBroker::open_position(const OpenRequest& request,
                                           std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecutionResult result;

    if (roll(config_.timeout_probability)) {
        result.status = ExecutionStatus::Timeout;
        result.message = fmt::format("no confirmation within {}ms", timeout.count());
        return result;
    }
    auto it = series_.find(request.symbol);
    if (it == series_.end()) {
        result.message = fmt::format("unknown instrument {}", request.symbol.view());
        return result;
    }
    if (!(request.size > 0.0) || roll(config_.reject_probability)) {
        result.message = "order rejected";
        return result;
    }

    const Quote q = quote_locked(it->second);
    const uint64_t ticket = next_ticket_++;
    tickets_.emplace(ticket, Ticket{request.symbol, request.direction, request.size,
                                    q.entry_price(request.direction),
                                    it->second.instrument.spec.pip_size,
                                    it->second.instrument.spec.pip_value_per_lot});

    result.status = ExecutionStatus::Filled;
    result.ticket = ticket;
    result.price = q.entry_price(request.direction);
    result.size = request.size;
    result.message = "filled";
    return result;
}

ExecutionResult PaperBroker::close_position(uint64_t ticket, double size,
                                            std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecutionResult result;

    if (roll(config_.timeout_probability)) {
        result.status = ExecutionStatus::Timeout;
        result.message = fmt::format("no confirmation within {}ms", timeout.count());
        return result;
    }
    auto it = tickets_.find(ticket);
    if (it == tickets_.end()) {
        result.message = fmt::format("unknown ticket {}", ticket);
        return result;
    }

    auto& t = it->second;
    const Quote q = quote_locked(series_.at(t.symbol));
    const double closed = std::clamp(size, 0.0, t.size);
    const double exit = q.exit_price(t.direction);
    balance_ += (exit - t.entry) / t.pip_size * t.pip_value_per_lot * closed * sign(t.direction);

    result.status = ExecutionStatus::Filled;
    result.ticket = ticket;
    result.price = exit;
    result.size = closed;
    result.message = "filled";

    t.size -= closed;
    if (t.size <= 1e-9) tickets_.erase(it);
    return result;
}

std::optional<AccountInfo> PaperBroker::account_info() {
    std::lock_guard<std::mutex> lock(mutex_);
    double unrealized = 0.0;
    for (const auto& [id, t] : tickets_) {
        const Quote q = quote_locked(series_.at(t.symbol));
        unrealized += (q.exit_price(t.direction) - t.entry) / t.pip_size * t.pip_value_per_lot *
                      t.size * sign(t.direction);
    }
    return AccountInfo{balance_, balance_ + unrealized};
}

void PaperBroker::set_timeout_probability(double p) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.timeout_probability = std::clamp(p, 0.0, 1.0);
}

void PaperBroker::set_reject_probability(double p) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.reject_probability = std::clamp(p, 0.0, 1.0);
}

size_t PaperBroker::open_tickets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickets_.size();
}

}  // namespace meridian::execution
