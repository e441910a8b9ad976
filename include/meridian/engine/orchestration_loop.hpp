#pragma once
// ============================================================================
// MERIDIAN - Orchestration Loop
// ============================================================================
// One evaluation cycle per instrument per tick, instruments evaluated in
// parallel on a worker pool:
//
//   quote -> lifecycle.process -> classify -> select -> signal
//         -> ledger pre-check -> correlation -> spread -> stop/size
//         -> [commit: correlation -> ledger.record_open -> register]
//         -> lifecycle.attempt_entry
//
// The operator commands only flip enablement flags. Stopping trading puts
// the loop in close-only mode: open positions keep being managed
// ============================================================================

#include "meridian/core/clock.hpp"
#include "meridian/execution/execution_client.hpp"
#include "meridian/market/condition_classifier.hpp"
#include "meridian/market/spread_tracker.hpp"
#include "meridian/order/trade_lifecycle_manager.hpp"
#include "meridian/risk/correlation_manager.hpp"
#include "meridian/risk/position_sizer.hpp"
#include "meridian/risk/risk_events.hpp"
#include "meridian/risk/risk_ledger.hpp"
#include "meridian/strategy/strategy_catalog.hpp"
#include "meridian/strategy/strategy_selector.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meridian::engine {

// ============================================================================
// Configuration
// ============================================================================

struct EngineConfig {
    std::chrono::milliseconds cycle_interval{1000};
    size_t worker_threads = 4;
    size_t status_event_count = 50;  // Recent risk events in the status feed
    bool start_enabled = true;
};

// ============================================================================
// Status Feed
// ============================================================================

enum class CycleOutcome : uint8_t {
    Pending,              // Not evaluated yet
    Inactive,             // Trading stopped or instrument toggled off
    Halted,               // Circuit breaker latched
    NoQuote,
    ClassificationDegraded,
    NoStrategy,           // Benign: nothing suits the regime
    NoSignal,
    LedgerRejected,
    CorrelationRejected,
    SpreadRejected,
    SizingRejected,
    Submitted,
    Error
};

[[nodiscard]] std::string_view to_string(CycleOutcome outcome) noexcept;

struct InstrumentStatus {
    InstrumentSpec spec;
    bool active = true;
    std::optional<market::MarketCondition> condition;
    std::string strategy;  // Selected this cycle, empty if none
    double strategy_score = 0.0;
    CycleOutcome outcome = CycleOutcome::Pending;
    std::string detail;
    Timestamp updated_at;
};

struct StatusSnapshot {
    bool trading_enabled = false;
    std::optional<risk::RiskLevel> risk_level;
    bool circuit_breaker = false;
    uint64_t cycles = 0;
    std::vector<InstrumentStatus> instruments;
    risk::LedgerSnapshot ledger;
    std::vector<order::Position> positions;
    std::vector<order::Position> fatal_positions;  // Need operator attention
    std::vector<RiskEvent> recent_events;
    execution::ExecutionStatsSnapshot execution;
    Timestamp generated_at;
};

// ============================================================================
// Collaborators
// ============================================================================

/// Everything the loop drives. The loop owns none of it
struct EngineContext {
    execution::IMarketDataFeed& feed;
    execution::IExecutionClient& client;
    market::ConditionClassifier& classifier;
    strategy::CatalogPtr catalog;
    const strategy::StrategySelector& selector;
    risk::CorrelationManager& correlation;
    const risk::PositionSizer& sizer;
    market::SpreadTracker& spreads;
    risk::RiskLedger& ledger;
    order::TradeLifecycleManager& lifecycle;
    risk::RiskEventLog& events;
    execution::ExecutionStats& stats;
    const IClock& clock;
};

// ============================================================================
// Loop
// ============================================================================

class OrchestrationLoop {
public:
    using StatusCallback = std::function<void(const StatusSnapshot&)>;

    OrchestrationLoop(const EngineConfig& config, std::vector<InstrumentSpec> instruments,
                      EngineContext context);
    ~OrchestrationLoop();

    OrchestrationLoop(const OrchestrationLoop&) = delete;
    OrchestrationLoop& operator=(const OrchestrationLoop&) = delete;

    /// Evaluate every instrument once and wait for all of them
    void run_cycle();

    /// Cycle until `running` turns false or `max_cycles` cycles complete (0 = unbounded)
    void run_forever(const std::atomic<bool>& running, uint64_t max_cycles = 0);

    // ========================================================================
    // Commands
    // ========================================================================

    /// Enable entries, optionally restricting instruments and capping risk
    void start_trading(std::optional<std::vector<Symbol>> instruments = std::nullopt,
                       std::optional<risk::RiskLevel> level = std::nullopt);

    /// Close-only mode: no new entries, open positions still managed
    void stop_trading();

    /// False if the instrument is not configured
    bool toggle_instrument(const Symbol& symbol, bool active);

    // ========================================================================
    // Status
    // ========================================================================

    [[nodiscard]] StatusSnapshot status() const;
    [[nodiscard]] bool trading_enabled() const noexcept { return enabled_.load(); }
    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_.load(); }

    void on_status(StatusCallback callback);

private:
    InstrumentStatus evaluate(const InstrumentSpec& spec);
    InstrumentStatus evaluate_impl(const InstrumentSpec& spec, InstrumentStatus status);

    void refresh_account();
    void refresh_correlation();
    void reevaluate_positions(const InstrumentSpec& spec, std::span<const Bar> bars);
    void reject(InstrumentStatus& status, CycleOutcome outcome, std::string reason);

    [[nodiscard]] bool is_active(const Symbol& symbol) const;

    EngineConfig config_;
    std::vector<InstrumentSpec> instruments_;
    EngineContext ctx_;

    boost::asio::thread_pool pool_;

    std::atomic<bool> enabled_;
    std::atomic<uint64_t> cycles_{0};

    // Serializes admission commits across workers
    std::mutex commit_mutex_;

    mutable std::mutex mutex_;
    std::unordered_map<Symbol, bool> active_;
    std::unordered_map<Symbol, InstrumentStatus> status_;
    std::optional<risk::RiskLevel> risk_level_;
    StatusCallback status_callback_;
};

}  // namespace meridian::engine
