#pragma once
// ============================================================================
// MERIDIAN - Spread Tracker
// ============================================================================
// Per-instrument exponential average of the quoted spread (pips)
// ============================================================================

#include "meridian/core/types.hpp"

#include <cmath>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace meridian::market {

class SpreadTracker {
public:
    static constexpr double DECAY = 0.95;  // Weight of the running average

    /// Fold a new observation in. First sample seeds the average
    double update(const Symbol& symbol, double spread_pips) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!std::isfinite(spread_pips) || spread_pips < 0.0) {
            auto it = averages_.find(symbol);
            return it == averages_.end() ? 0.0 : it->second;
        }
        auto [it, inserted] = averages_.try_emplace(symbol, spread_pips);
        if (!inserted) {
            it->second = DECAY * it->second + (1.0 - DECAY) * spread_pips;
        }
        return it->second;
    }

    [[nodiscard]] std::optional<double> average(const Symbol& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = averages_.find(symbol);
        if (it == averages_.end()) return std::nullopt;
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Symbol, double> averages_;
};

}  // namespace meridian::market
