#pragma once
// ============================================================================
// MERIDIAN - Error Taxonomy
// ============================================================================
// Hot-path failures are values (RiskEvent), not exceptions.
// ConfigError is the only exception type and never escapes past startup.
// ============================================================================

#include "meridian/core/types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace meridian {

/// Thrown by the configuration loader on invalid or inconsistent values
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class RiskEventKind : uint8_t {
    ClassificationDegraded,  // Insufficient or malformed data, safe "unknown"
    AdmissionRejected,       // Correlation / spread / drawdown / sizing rule failed
    ExecutionTimeout,        // Broker did not confirm in time, will retry
    ExecutionFatal,          // Retries exhausted on a money-touching request
    CircuitBreakerTripped,   // Daily loss or drawdown limit latched
    CircuitBreakerReset      // Latch cleared by day rollover, recovery or operator
};

[[nodiscard]] constexpr std::string_view to_string(RiskEventKind kind) noexcept {
    switch (kind) {
        case RiskEventKind::ClassificationDegraded: return "ClassificationDegraded";
        case RiskEventKind::AdmissionRejected: return "AdmissionRejected";
        case RiskEventKind::ExecutionTimeout: return "ExecutionTimeout";
        case RiskEventKind::ExecutionFatal: return "ExecutionFatal";
        case RiskEventKind::CircuitBreakerTripped: return "CircuitBreakerTripped";
        case RiskEventKind::CircuitBreakerReset: return "CircuitBreakerReset";
    }
    return "Unknown";
}

/// Whether the dashboard must surface the event as needing attention
[[nodiscard]] constexpr bool requires_attention(RiskEventKind kind) noexcept {
    return kind == RiskEventKind::ExecutionFatal ||
           kind == RiskEventKind::CircuitBreakerTripped;
}

struct RiskEvent {
    RiskEventKind kind = RiskEventKind::AdmissionRejected;
    Symbol symbol;
    uint64_t position_id = 0;  // 0 when not tied to a position
    std::string message;
    Timestamp timestamp;
};

}  // namespace meridian
