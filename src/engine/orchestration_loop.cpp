// ============================================================================
// MERIDIAN - Orchestration Loop Implementation
// ============================================================================

#include "meridian/engine/orchestration_loop.hpp"

#include "meridian/utils/logger.hpp"

#include <boost/asio/post.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <utility>

namespace meridian::engine {

namespace net = boost::asio;

std::string_view to_string(CycleOutcome outcome) noexcept {
    switch (outcome) {
        case CycleOutcome::Pending: return "pending";
        case CycleOutcome::Inactive: return "inactive";
        case CycleOutcome::Halted: return "halted";
        case CycleOutcome::NoQuote: return "no_quote";
        case CycleOutcome::ClassificationDegraded: return "classification_degraded";
        case CycleOutcome::NoStrategy: return "no_strategy";
        case CycleOutcome::NoSignal: return "no_signal";
        case CycleOutcome::LedgerRejected: return "ledger_rejected";
        case CycleOutcome::CorrelationRejected: return "correlation_rejected";
        case CycleOutcome::SpreadRejected: return "spread_rejected";
        case CycleOutcome::SizingRejected: return "sizing_rejected";
        case CycleOutcome::Submitted: return "submitted";
        case CycleOutcome::Error: return "error";
    }
    return "unknown";
}

OrchestrationLoop::OrchestrationLoop(const EngineConfig& config,
                                     std::vector<InstrumentSpec> instruments,
                                     EngineContext context)
    : config_(config),
      instruments_(std::move(instruments)),
      ctx_(context),
      pool_(std::max<size_t>(config.worker_threads, 1)),
      enabled_(config.start_enabled) {
    for (const auto& spec : instruments_) {
        active_[spec.symbol] = true;
        InstrumentStatus status;
        status.spec = spec;
        status_[spec.symbol] = std::move(status);
    }
    LOG_INFO("[ENGINE] {} instruments, {} strategies, {} workers", instruments_.size(),
             ctx_.catalog->size(), std::max<size_t>(config.worker_threads, 1));
}

OrchestrationLoop::~OrchestrationLoop() {
    pool_.join();
}

// ============================================================================
// Cycle
// ============================================================================

void OrchestrationLoop::run_cycle() {
    SCOPED_TIMER("engine cycle");

    refresh_account();
    refresh_correlation();

    std::vector<std::future<InstrumentStatus>> pending;
    pending.reserve(instruments_.size());
    for (const auto& spec : instruments_) {
        auto task = std::make_shared<std::packaged_task<InstrumentStatus()>>(
            [this, &spec] { return evaluate(spec); });
        pending.push_back(task->get_future());
        net::post(pool_, [task] { (*task)(); });
    }

    std::vector<InstrumentStatus> results;
    results.reserve(pending.size());
    for (auto& f : pending) {
        results.push_back(f.get());
    }

    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& s : results) {
            s.active = active_[s.spec.symbol];
            status_[s.spec.symbol] = std::move(s);
        }
        callback = status_callback_;
    }
    cycles_.fetch_add(1);

    if (callback) {
        callback(status());
    }
}

void OrchestrationLoop::run_forever(const std::atomic<bool>& running, uint64_t max_cycles) {
    LOG_INFO("[ENGINE] Loop started (interval {}ms)", config_.cycle_interval.count());
    uint64_t done = 0;
    while (running.load()) {
        run_cycle();
        if (max_cycles != 0 && ++done >= max_cycles) break;

        const auto wake = std::chrono::steady_clock::now() + config_.cycle_interval;
        while (running.load() && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    LOG_INFO("[ENGINE] Loop stopped after {} cycles", cycles_.load());
}

void OrchestrationLoop::refresh_account() {
    try {
        if (auto info = ctx_.client.account_info()) {
            ctx_.ledger.update_equity(info->equity);
        } else {
            LOG_WARN("[ENGINE] Account info unavailable, keeping last equity");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[ENGINE] Account info failed: {}", e.what());
    }
}

void OrchestrationLoop::refresh_correlation() {
    const auto now = ctx_.clock.now();
    if (!ctx_.correlation.needs_refresh(now)) return;
    try {
        std::unordered_map<Symbol, std::vector<double>> closes;
        const size_t count = ctx_.correlation.config().history_bars;
        for (const auto& spec : instruments_) {
            const auto bars = ctx_.feed.bars(spec.symbol, count);
            auto& series = closes[spec.symbol];
            series.reserve(bars.size());
            for (const auto& b : bars) series.push_back(b.close);
        }
        ctx_.correlation.update(closes, now);
    } catch (const std::exception& e) {
        LOG_ERROR("[ENGINE] Correlation refresh failed: {}", e.what());
    }
}

// ============================================================================
// Per-Instrument Evaluation
// ============================================================================

InstrumentStatus OrchestrationLoop::evaluate(const InstrumentSpec& spec) {
    InstrumentStatus status;
    status.spec = spec;
    status.updated_at = ctx_.clock.now();
    try {
        return evaluate_impl(spec, std::move(status));
    } catch (const std::exception& e) {
        LOG_ERROR("[ENGINE] {} cycle failed: {}", spec.symbol.view(), e.what());
        InstrumentStatus failed;
        failed.spec = spec;
        failed.updated_at = ctx_.clock.now();
        failed.outcome = CycleOutcome::Error;
        failed.detail = e.what();
        return failed;
    }
}

void OrchestrationLoop::reject(InstrumentStatus& status, CycleOutcome outcome, std::string reason) {
    ctx_.events.record(RiskEventKind::AdmissionRejected, status.spec.symbol, 0,
                       fmt::format("{}: {}", to_string(outcome), reason), ctx_.clock.now());
    status.outcome = outcome;
    status.detail = std::move(reason);
}

InstrumentStatus OrchestrationLoop::evaluate_impl(const InstrumentSpec& spec,
                                                  InstrumentStatus status) {
    const auto& symbol = spec.symbol;
    const auto now = ctx_.clock.now();

    // 1. Quote, spread history, and management of what is already open
    const auto quote = ctx_.feed.quote(symbol);
    if (!quote || !(quote->ask >= quote->bid) || quote->bid <= 0.0) {
        status.outcome = CycleOutcome::NoQuote;
        status.detail = "no valid quote";
        return status;
    }
    const double spread_pips = (quote->ask - quote->bid) / spec.pip_size;
    const auto average_spread = ctx_.spreads.average(symbol);
    ctx_.spreads.update(symbol, spread_pips);

    ctx_.lifecycle.process(symbol, *quote);

    // 2. Regime
    const auto& catalog = *ctx_.catalog;
    const size_t needed = std::max(ctx_.classifier.min_bars(), catalog.max_min_bars());
    const auto bars = ctx_.feed.bars(symbol, needed);
    const auto condition = ctx_.classifier.classify(symbol, bars, now);
    status.condition = condition;

    reevaluate_positions(spec, bars);

    if (!enabled_.load() || !is_active(symbol)) {
        status.outcome = CycleOutcome::Inactive;
        status.detail = enabled_.load() ? "instrument disabled" : "trading stopped";
        return status;
    }
    if (condition.degraded()) {
        ctx_.events.record(RiskEventKind::ClassificationDegraded, symbol, 0,
                           fmt::format("{} ({} bars)", market::to_string(condition.status),
                                       bars.size()),
                           now);
        status.outcome = CycleOutcome::ClassificationDegraded;
        status.detail = std::string(market::to_string(condition.status));
        return status;
    }
    if (ctx_.ledger.halted()) {
        status.outcome = CycleOutcome::Halted;
        status.detail = "circuit breaker latched";
        return status;
    }

    // 3. Strategy and signal
    const auto selection = ctx_.selector.select(condition, catalog);
    if (!selection.selected()) {
        status.outcome = CycleOutcome::NoStrategy;
        status.detail = selection.reason;
        return status;
    }
    const auto& strat = *selection.strategy;
    status.strategy = strat.name();
    status.strategy_score = selection.score;

    const auto signal = strat.generate_signal(bars, spec);
    if (!signal) {
        status.outcome = CycleOutcome::NoSignal;
        status.detail = selection.reason;
        return status;
    }

    // 4. Admission
    const auto pre = ctx_.ledger.can_admit_new_trade(symbol);
    if (!pre.admitted()) {
        reject(status, CycleOutcome::LedgerRejected, pre.reason);
        return status;
    }

    // Early look at correlation; the binding check runs again at commit
    const auto corr = ctx_.correlation.can_open(symbol, signal->direction,
                                                ctx_.lifecycle.exposures());
    if (!corr.allowed) {
        reject(status, CycleOutcome::CorrelationRejected, corr.reason);
        return status;
    }

    const auto spread_check = ctx_.sizer.check_spread(spread_pips, average_spread,
                                                      strat.risk().max_spread_pips);
    if (!spread_check.approved()) {
        reject(status, CycleOutcome::SpreadRejected, spread_check.reason);
        return status;
    }

    // 5. Stop and size
    const double entry = quote->entry_price(signal->direction);
    const auto stop_pips = risk::stop_distance_pips(strat.risk().stop_loss, bars, spec, entry,
                                                    signal->structure_level);
    if (!stop_pips) {
        reject(status, CycleOutcome::SizingRejected, "no valid stop distance");
        return status;
    }

    std::optional<risk::RiskLevel> level;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level = risk_level_;
    }
    const auto sizing = ctx_.sizer.size(ctx_.ledger.equity(), ctx_.ledger.current_tier(),
                                        *stop_pips, spec.pip_value_per_lot, level);
    if (!sizing.approved()) {
        reject(status, CycleOutcome::SizingRejected, sizing.reason);
        return status;
    }

    // 6. Commit: reserve risk, then hand over to the lifecycle
    order::Position position;
    position.id = ctx_.lifecycle.next_id();
    position.symbol = symbol;
    position.strategy = strat.name();
    position.direction = signal->direction;
    position.size = sizing.lots;
    position.risk_amount = sizing.risk_amount;
    position.pip_size = spec.pip_size;
    position.pip_value_per_lot = spec.pip_value_per_lot;
    position.stop_pips = *stop_pips;
    position.risk_reward_ratio = strat.risk().risk_reward_ratio;
    if (strat.risk().take_profit.method == strategy::TakeProfitMethod::Multiple) {
        position.tp1_ratio = strat.risk().take_profit.tp1_ratio;
        position.tp1_fraction = strat.risk().take_profit.tp1_size;
    }
    position.arm_levels(entry);

    const uint64_t id = position.id;
    {
        // Exposure read, correlation check, ledger reservation and pending
        // registration form one step across all workers
        std::lock_guard<std::mutex> commit(commit_mutex_);

        // Halt may have been requested while this instrument was being evaluated
        if (!enabled_.load()) {
            status.outcome = CycleOutcome::Inactive;
            status.detail = "trading stopped";
            return status;
        }
        const auto binding = ctx_.correlation.can_open(symbol, signal->direction,
                                                       ctx_.lifecycle.exposures());
        if (!binding.allowed) {
            reject(status, CycleOutcome::CorrelationRejected, binding.reason);
            return status;
        }
        const auto committed = ctx_.ledger.record_open(
            risk::PositionRisk{id, symbol, position.direction, position.risk_amount});
        if (!committed.admitted()) {
            reject(status, CycleOutcome::LedgerRejected, committed.reason);
            return status;
        }

        LOG_INFO("[ENGINE] {} {} via {} ({:.2f} lots, stop {:.1f} pips, risk {:.2f})",
                 symbol.view(), to_string(position.direction), strat.name(), position.size,
                 position.stop_pips, position.risk_amount);
        ctx_.lifecycle.register_entry(std::move(position));
    }

    // Broker round trip happens outside the commit section
    ctx_.lifecycle.attempt_entry(id);

    status.outcome = CycleOutcome::Submitted;
    status.detail = selection.reason;
    return status;
}

void OrchestrationLoop::reevaluate_positions(const InstrumentSpec& spec,
                                             std::span<const Bar> bars) {
    for (const auto& p : ctx_.lifecycle.due_for_reevaluation(spec.symbol)) {
        std::optional<Direction> direction;
        if (const auto* strat = ctx_.catalog->find(p.strategy)) {
            if (auto signal = strat->generate_signal(bars, spec)) {
                direction = signal->direction;
            }
        }
        ctx_.lifecycle.complete_reevaluation(p.id, direction);
    }
}

// ============================================================================
// Commands
// ============================================================================

void OrchestrationLoop::start_trading(std::optional<std::vector<Symbol>> instruments,
                                      std::optional<risk::RiskLevel> level) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (instruments) {
            for (auto& [symbol, active] : active_) {
                active = std::find(instruments->begin(), instruments->end(), symbol) !=
                         instruments->end();
            }
            for (const auto& symbol : *instruments) {
                if (!active_.contains(symbol)) {
                    LOG_WARN("[ENGINE] start_trading: unknown instrument {}", symbol.view());
                }
            }
        }
        risk_level_ = level;
    }
    enabled_.store(true);
    LOG_INFO("[ENGINE] Trading started{}",
             level ? fmt::format(" (risk level {})", risk::to_string(*level)) : std::string{});
}

void OrchestrationLoop::stop_trading() {
    enabled_.store(false);
    LOG_INFO("[ENGINE] Trading stopped, managing {} open positions",
             ctx_.lifecycle.active_count());
}

bool OrchestrationLoop::toggle_instrument(const Symbol& symbol, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(symbol);
    if (it == active_.end()) return false;
    it->second = active;
    status_[symbol].active = active;
    LOG_INFO("[ENGINE] {} {}", symbol.view(), active ? "enabled" : "disabled");
    return true;
}

bool OrchestrationLoop::is_active(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(symbol);
    return it != active_.end() && it->second;
}

void OrchestrationLoop::on_status(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_callback_ = std::move(callback);
}

// ============================================================================
// Status
// ============================================================================

StatusSnapshot OrchestrationLoop::status() const {
    StatusSnapshot s;
    s.trading_enabled = enabled_.load();
    s.cycles = cycles_.load();
    s.generated_at = ctx_.clock.now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.risk_level = risk_level_;
        s.instruments.reserve(instruments_.size());
        for (const auto& spec : instruments_) {
            auto it = status_.find(spec.symbol);
            if (it != status_.end()) s.instruments.push_back(it->second);
        }
    }
    s.ledger = ctx_.ledger.snapshot();
    s.circuit_breaker = s.ledger.halted();
    s.positions = ctx_.lifecycle.active_positions();
    s.fatal_positions = ctx_.lifecycle.fatal_positions();
    s.recent_events = ctx_.events.recent(config_.status_event_count);
    s.execution = ctx_.stats.snapshot();
    return s;
}

}  // namespace meridian::engine
