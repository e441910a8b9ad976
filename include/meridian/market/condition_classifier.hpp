#pragma once
// ============================================================================
// MERIDIAN - Market Condition Classifier
// ============================================================================
// OHLCV window -> {trend, volatility, liquidity, confidence}
// Degrades to "unknown" with zero confidence instead of failing
// ============================================================================

#include "meridian/core/types.hpp"
#include "meridian/market/market_condition.hpp"

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace meridian::market {

// ============================================================================
// Configuration
// ============================================================================

/// Relative weight of each sub-score in the final confidence
struct ConditionWeights {
    double trend = 0.4;
    double volatility = 0.3;
    double liquidity = 0.2;
    double price_action = 0.1;

    [[nodiscard]] double sum() const noexcept {
        return trend + volatility + liquidity + price_action;
    }
};

struct ClassifierConfig {
    size_t trend_lookback = 100;            // Bars analysed for trend
    size_t volatility_window = 20;          // Bars for ATR / recent volume
    size_t adx_period = 14;
    double adx_strong_level = 40.0;         // ADX mapped to strength 1.0
    double trend_strength_threshold = 0.6;  // Normalized strength for a directional trend
    double liquidity_threshold = 0.4;       // Ratio below which liquidity is low
    double volatility_low = 0.4;            // Max ATR % of price for "low"
    double volatility_medium = 0.8;         // Max ATR % of price for "medium"
    double min_trading_confidence = 0.6;    // Fraction, compared against confidence / 100
    std::chrono::seconds cache_expiry{300};
    ConditionWeights weights;
};

// ============================================================================
// Classifier
// ============================================================================

class ConditionClassifier {
public:
    explicit ConditionClassifier(const ClassifierConfig& config = ClassifierConfig{});

    /// Cached classification. A fresh cache entry short-circuits the computation
    MarketCondition classify(const Symbol& symbol, std::span<const Bar> bars, Timestamp now);

    /// Uncached classification. Never throws
    [[nodiscard]] MarketCondition compute(const Symbol& symbol,
                                          std::span<const Bar> bars,
                                          Timestamp now) const noexcept;

    /// Fresh cached condition, if any
    [[nodiscard]] std::optional<MarketCondition> cached(const Symbol& symbol, Timestamp now) const;

    /// Most recent condition per symbol regardless of age (status feed)
    [[nodiscard]] std::vector<MarketCondition> latest() const;

    void invalidate(const Symbol& symbol);
    void clear();

    [[nodiscard]] const ClassifierConfig& config() const { return config_; }

    /// Smallest window the classifier accepts
    [[nodiscard]] size_t min_bars() const noexcept;

private:
    [[nodiscard]] MarketCondition compute_impl(const Symbol& symbol,
                                               std::span<const Bar> bars,
                                               Timestamp now) const;

    [[nodiscard]] Volatility bucket_volatility(double normalized_atr) const noexcept;
    [[nodiscard]] Liquidity bucket_liquidity(double ratio) const noexcept;
    [[nodiscard]] double confidence_for(const MarketCondition& c, double price_action) const noexcept;

    ClassifierConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<Symbol, CachedCondition> cache_;
};

}  // namespace meridian::market
