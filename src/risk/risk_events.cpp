// ============================================================================
// MERIDIAN - Risk Event Log Implementation
// ============================================================================

#include "meridian/risk/risk_events.hpp"

#include "meridian/utils/logger.hpp"

#include <algorithm>
#include <utility>

namespace meridian::risk {

RiskEventLog::RiskEventLog(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

void RiskEventLog::record(RiskEventKind kind, const Symbol& symbol, uint64_t position_id,
                          std::string message, Timestamp timestamp) {
    record(RiskEvent{kind, symbol, position_id, std::move(message), timestamp});
}

void RiskEventLog::record(RiskEvent event) {
    constexpr const char* fmt = "[RISK] {} {} #{}: {}";
    const auto kind = to_string(event.kind);
    switch (event.kind) {
        case RiskEventKind::ClassificationDegraded:
            LOG_DEBUG(fmt, kind, event.symbol.view(), event.position_id, event.message);
            break;
        case RiskEventKind::AdmissionRejected:
        case RiskEventKind::CircuitBreakerReset:
            LOG_INFO(fmt, kind, event.symbol.view(), event.position_id, event.message);
            break;
        case RiskEventKind::ExecutionTimeout:
            LOG_WARN(fmt, kind, event.symbol.view(), event.position_id, event.message);
            break;
        case RiskEventKind::CircuitBreakerTripped:
            LOG_ERROR(fmt, kind, event.symbol.view(), event.position_id, event.message);
            break;
        case RiskEventKind::ExecutionFatal:
            LOG_CRITICAL(fmt, kind, event.symbol.view(), event.position_id, event.message);
            break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[static_cast<size_t>(event.kind)];
    events_.push_back(std::move(event));
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::vector<RiskEvent> RiskEventLog::recent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(max_count, events_.size());
    return {events_.end() - static_cast<std::ptrdiff_t>(n), events_.end()};
}

size_t RiskEventLog::count(RiskEventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_[static_cast<size_t>(kind)];
}

size_t RiskEventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace meridian::risk
