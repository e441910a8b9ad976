#pragma once
// ============================================================================
// MERIDIAN - Broker Interfaces
// ============================================================================
// Market data feed and order execution collaborators. Every execution call
// carries a timeout; implementations must return within it
// ============================================================================

#include "meridian/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::execution {

// ============================================================================
// Market Data
// ============================================================================

class IMarketDataFeed {
public:
    virtual ~IMarketDataFeed() = default;

    /// Current bid/ask, nullopt when the instrument is not quoted
    [[nodiscard]] virtual std::optional<Quote> quote(const Symbol& symbol) = 0;

    /// Most recent `count` closed bars, oldest first
    [[nodiscard]] virtual std::vector<Bar> bars(const Symbol& symbol, size_t count) = 0;
};

// ============================================================================
// Execution
// ============================================================================

enum class ExecutionStatus : uint8_t { Filled, Timeout, Rejected };

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus s) noexcept {
    switch (s) {
        case ExecutionStatus::Filled: return "filled";
        case ExecutionStatus::Timeout: return "timeout";
        case ExecutionStatus::Rejected: return "rejected";
    }
    return "unknown";
}

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Rejected;
    uint64_t ticket = 0;  // Broker-side id of the fill
    double price = 0.0;
    double size = 0.0;
    std::string message;

    [[nodiscard]] bool filled() const noexcept { return status == ExecutionStatus::Filled; }
};

struct OpenRequest {
    Symbol symbol;
    Direction direction = Direction::Long;
    double size = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    uint64_t client_id = 0;  // Lifecycle position id, for idempotent retries
};

struct AccountInfo {
    double balance = 0.0;
    double equity = 0.0;
};

class IExecutionClient {
public:
    virtual ~IExecutionClient() = default;

    virtual ExecutionResult open_position(const OpenRequest& request,
                                          std::chrono::milliseconds timeout) = 0;

    /// Close `size` lots of the ticket at market
    virtual ExecutionResult close_position(uint64_t ticket, double size,
                                           std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual std::optional<AccountInfo> account_info() = 0;
};

// ============================================================================
// Statistics
// ============================================================================

struct ExecutionStatsSnapshot {
    uint64_t fills = 0;
    uint64_t rejections = 0;
    uint64_t timeouts = 0;
    uint64_t retries = 0;
    uint64_t fatal_escalations = 0;
    uint64_t forced_closes = 0;
};

class ExecutionStats {
public:
    void record(ExecutionStatus status) noexcept {
        switch (status) {
            case ExecutionStatus::Filled: fills_.fetch_add(1, std::memory_order_relaxed); break;
            case ExecutionStatus::Timeout: timeouts_.fetch_add(1, std::memory_order_relaxed); break;
            case ExecutionStatus::Rejected: rejections_.fetch_add(1, std::memory_order_relaxed); break;
        }
    }

    void record_retry() noexcept { retries_.fetch_add(1, std::memory_order_relaxed); }
    void record_fatal() noexcept { fatal_.fetch_add(1, std::memory_order_relaxed); }
    void record_forced_close() noexcept { forced_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] ExecutionStatsSnapshot snapshot() const noexcept {
        return {fills_.load(std::memory_order_relaxed), rejections_.load(std::memory_order_relaxed),
                timeouts_.load(std::memory_order_relaxed), retries_.load(std::memory_order_relaxed),
                fatal_.load(std::memory_order_relaxed), forced_.load(std::memory_order_relaxed)};
    }

private:
    std::atomic<uint64_t> fills_{0};
    std::atomic<uint64_t> rejections_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> fatal_{0};
    std::atomic<uint64_t> forced_{0};
};

}  // namespace meridian::execution
