#pragma once
// ============================================================================
// MERIDIAN - Market Condition
// ============================================================================
// Immutable regime label produced by the classifier, plus its TTL cache entry
// ============================================================================

#include "meridian/core/types.hpp"

#include <cstdint>
#include <string_view>

namespace meridian::market {

enum class Trend : uint8_t { Bullish, Bearish, Ranging, Choppy, Unknown };
enum class Volatility : uint8_t { Low, Medium, High, Unknown };
enum class Liquidity : uint8_t { Low, Medium, High, Unknown };

/// Why a condition looks the way it does
enum class ConditionStatus : uint8_t {
    Ok,
    InsufficientData,  // Window shorter than the trend lookback
    MalformedInput,    // Non-finite or inconsistent OHLC values
    LowConfidence      // Classified, but below the trading floor
};

[[nodiscard]] constexpr std::string_view to_string(Trend t) noexcept {
    switch (t) {
        case Trend::Bullish: return "bullish";
        case Trend::Bearish: return "bearish";
        case Trend::Ranging: return "ranging";
        case Trend::Choppy: return "choppy";
        case Trend::Unknown: return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(Volatility v) noexcept {
    switch (v) {
        case Volatility::Low: return "low";
        case Volatility::Medium: return "medium";
        case Volatility::High: return "high";
        case Volatility::Unknown: return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(Liquidity l) noexcept {
    switch (l) {
        case Liquidity::Low: return "low";
        case Liquidity::Medium: return "medium";
        case Liquidity::High: return "high";
        case Liquidity::Unknown: return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(ConditionStatus s) noexcept {
    switch (s) {
        case ConditionStatus::Ok: return "ok";
        case ConditionStatus::InsufficientData: return "insufficient_data";
        case ConditionStatus::MalformedInput: return "malformed_input";
        case ConditionStatus::LowConfidence: return "low_confidence";
    }
    return "unknown";
}

struct MarketCondition {
    Symbol symbol;
    Trend trend = Trend::Unknown;
    Volatility volatility = Volatility::Unknown;
    Liquidity liquidity = Liquidity::Unknown;
    double confidence = 0.0;  // 0-100
    Timestamp computed_at;
    ConditionStatus status = ConditionStatus::InsufficientData;

    // Raw measurements behind the labels
    double trend_strength = 0.0;   // 0-1, normalized ADX
    double normalized_atr = 0.0;   // ATR as percent of mean close
    double volume_ratio = 0.0;     // Recent / baseline liquidity ratio

    /// Classification degraded to "unknown" for lack of usable data
    [[nodiscard]] bool degraded() const noexcept {
        return status == ConditionStatus::InsufficientData ||
               status == ConditionStatus::MalformedInput;
    }

    [[nodiscard]] bool tradable() const noexcept { return trend != Trend::Unknown; }
};

/// Cache entry. Staleness is a pure function of the caller's clock
struct CachedCondition {
    MarketCondition value;
    Timestamp computed_at;

    [[nodiscard]] bool is_stale(Timestamp now, Duration ttl) const noexcept {
        return now < computed_at || now - computed_at >= ttl;
    }
};

}  // namespace meridian::market
