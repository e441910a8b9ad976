#pragma once
// ============================================================================
// MERIDIAN - Risk Event Log
// ============================================================================
// Bounded, thread-safe history of risk events for the status feed.
// Every recorded event is also logged at a level matching its severity
// ============================================================================

#include "meridian/core/errors.hpp"

#include <deque>
#include <mutex>
#include <vector>

namespace meridian::risk {

class RiskEventLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit RiskEventLog(size_t capacity = DEFAULT_CAPACITY);

    void record(RiskEvent event);
    void record(RiskEventKind kind, const Symbol& symbol, uint64_t position_id,
                std::string message, Timestamp timestamp);

    /// Most recent events, oldest first
    [[nodiscard]] std::vector<RiskEvent> recent(size_t max_count = DEFAULT_CAPACITY) const;

    /// Number of events of a kind ever recorded (not bounded by capacity)
    [[nodiscard]] size_t count(RiskEventKind kind) const;

    [[nodiscard]] size_t size() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<RiskEvent> events_;
    size_t counts_[6] = {};
};

}  // namespace meridian::risk
