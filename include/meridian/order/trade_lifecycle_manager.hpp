#pragma once
// ============================================================================
// MERIDIAN - Trade Lifecycle Manager
// ============================================================================
// Drives every position from pendingEntry to closed. Tick-driven: each
// process() call makes at most one broker attempt per position, so a slow
// or unresponsive venue never blocks other instruments. Timed-out requests
// are retried after retry_delay; exhausting retries raises ExecutionFatal
// and, for exits, keeps forcing market closes until one fills
// ============================================================================

#include "meridian/core/clock.hpp"
#include "meridian/execution/execution_client.hpp"
#include "meridian/order/position.hpp"
#include "meridian/risk/correlation_manager.hpp"
#include "meridian/risk/risk_events.hpp"
#include "meridian/risk/risk_ledger.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace meridian::order {

struct LifecycleConfig {
    std::chrono::minutes position_aging{120};
    std::chrono::minutes re_evaluation_interval{30};
    uint32_t retry_attempts = 3;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds request_timeout{5000};

    // Trailing stop
    bool trailing_enabled = true;
    double trailing_activation_ratio = 1.0;  // Favorable move in multiples of initial risk
    double trail_distance_pips = 20.0;

    double lot_step = 0.01;       // Partial closes are floored to this
    size_t archive_capacity = 500;
};

class TradeLifecycleManager {
public:
    TradeLifecycleManager(const LifecycleConfig& config,
                          execution::IExecutionClient& client,
                          risk::RiskLedger& ledger,
                          risk::RiskEventLog& events,
                          execution::ExecutionStats& stats,
                          const IClock& clock);

    TradeLifecycleManager(const TradeLifecycleManager&) = delete;
    TradeLifecycleManager& operator=(const TradeLifecycleManager&) = delete;

    [[nodiscard]] uint64_t next_id() noexcept { return next_id_.fetch_add(1); }

    /// Take ownership of an admitted position (risk already reserved in the
    /// ledger) and make the first entry attempt
    void submit_entry(Position position);

    /// Track an admitted position as pendingEntry without contacting the broker
    void register_entry(Position position);

    /// One entry attempt for a pendingEntry position; no-op otherwise
    void attempt_entry(uint64_t id);

    /// One monitoring step for every active position on the instrument
    void process(const Symbol& symbol, const Quote& quote);

    /// Move an open position to closing. False if it is not open
    bool request_close(uint64_t id, CloseReason reason);

    /// Open positions whose re-evaluation deadline passed
    [[nodiscard]] std::vector<Position> due_for_reevaluation(const Symbol& symbol) const;

    /// Result of re-running the strategy: an opposite signal closes the position
    void complete_reevaluation(uint64_t id, std::optional<Direction> signal);

    [[nodiscard]] std::optional<Position> find(uint64_t id) const;
    [[nodiscard]] std::vector<Position> active_positions() const;
    [[nodiscard]] std::vector<Position> archived_positions() const;
    [[nodiscard]] std::vector<Position> fatal_positions() const;
    [[nodiscard]] std::vector<risk::OpenExposure> exposures() const;
    [[nodiscard]] size_t active_count() const;

    [[nodiscard]] const LifecycleConfig& config() const { return config_; }

private:
    void attempt_close(uint64_t id);
    void attempt_partial(uint64_t id, double lots);

    /// Evaluate exits on an open position. Requires mutex_ held.
    /// Returns the lots to close at the first target, 0 if none
    double evaluate_open_locked(Position& p, const Quote& quote, Timestamp now);

    void begin_close_locked(Position& p, CloseReason reason, Timestamp now);

    /// Fold a finished position into the ledger and the archive. Unfilled
    /// entries only release their reservation
    void finalize(Position closed, double final_leg_pnl, bool filled);

    execution::ExecutionResult call_open(const execution::OpenRequest& request);
    execution::ExecutionResult call_close(uint64_t ticket, double size);

    LifecycleConfig config_;
    execution::IExecutionClient& client_;
    risk::RiskLedger& ledger_;
    risk::RiskEventLog& events_;
    execution::ExecutionStats& stats_;
    const IClock& clock_;

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, Position> positions_;
    std::deque<Position> archive_;
    std::atomic<uint64_t> next_id_{1};
};

}  // namespace meridian::order
