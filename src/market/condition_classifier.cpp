// ============================================================================
// MERIDIAN - Market Condition Classifier Implementation
// ============================================================================

#include "meridian/market/condition_classifier.hpp"

#include "meridian/indicators/atr.hpp"
#include "meridian/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <mutex>

namespace meridian::market {

namespace {

bool is_well_formed(const Bar& bar) noexcept {
    const bool finite = std::isfinite(bar.open) && std::isfinite(bar.high) &&
                        std::isfinite(bar.low) && std::isfinite(bar.close) &&
                        std::isfinite(bar.volume) && std::isfinite(bar.spread);
    if (!finite) return false;
    if (bar.low <= 0.0 || bar.high < bar.low) return false;
    if (bar.open < bar.low || bar.open > bar.high) return false;
    if (bar.close < bar.low || bar.close > bar.high) return false;
    return bar.volume >= 0.0 && bar.spread >= 0.0;
}

double mean_of(std::span<const Bar> bars, double Bar::*field) noexcept {
    if (bars.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& b : bars) sum += b.*field;
    return sum / static_cast<double>(bars.size());
}

MarketCondition degraded(const Symbol& symbol, Timestamp now, ConditionStatus status) {
    MarketCondition c;
    c.symbol = symbol;
    c.computed_at = now;
    c.status = status;
    return c;
}

}  // namespace

ConditionClassifier::ConditionClassifier(const ClassifierConfig& config) : config_(config) {}

size_t ConditionClassifier::min_bars() const noexcept {
    return std::max({config_.trend_lookback,
                     config_.volatility_window + 1,
                     2 * config_.adx_period + 1});
}

// ============================================================================
// Cache
// ============================================================================

MarketCondition ConditionClassifier::classify(const Symbol& symbol,
                                              std::span<const Bar> bars,
                                              Timestamp now) {
    {
        std::shared_lock lock(mutex_);
        auto it = cache_.find(symbol);
        if (it != cache_.end() && !it->second.is_stale(now, config_.cache_expiry)) {
            return it->second.value;
        }
    }

    MarketCondition fresh = compute(symbol, bars, now);

    // Degraded results are not cached: the next good window is used at once
    std::unique_lock lock(mutex_);
    if (fresh.degraded()) {
        cache_.erase(symbol);
    } else {
        cache_[symbol] = CachedCondition{fresh, now};
    }
    return fresh;
}

std::optional<MarketCondition> ConditionClassifier::cached(const Symbol& symbol,
                                                           Timestamp now) const {
    std::shared_lock lock(mutex_);
    auto it = cache_.find(symbol);
    if (it == cache_.end() || it->second.is_stale(now, config_.cache_expiry)) {
        return std::nullopt;
    }
    return it->second.value;
}

std::vector<MarketCondition> ConditionClassifier::latest() const {
    std::shared_lock lock(mutex_);
    std::vector<MarketCondition> out;
    out.reserve(cache_.size());
    for (const auto& [symbol, entry] : cache_) {
        out.push_back(entry.value);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.symbol < b.symbol;
    });
    return out;
}

void ConditionClassifier::invalidate(const Symbol& symbol) {
    std::unique_lock lock(mutex_);
    cache_.erase(symbol);
}

void ConditionClassifier::clear() {
    std::unique_lock lock(mutex_);
    cache_.clear();
}

// ============================================================================
// Classification
// ============================================================================

MarketCondition ConditionClassifier::compute(const Symbol& symbol,
                                             std::span<const Bar> bars,
                                             Timestamp now) const noexcept {
    try {
        return compute_impl(symbol, bars, now);
    } catch (const std::exception& e) {
        LOG_ERROR("[CLASSIFIER] {} classification failed: {}", symbol.view(), e.what());
        return degraded(symbol, now, ConditionStatus::MalformedInput);
    }
}

MarketCondition ConditionClassifier::compute_impl(const Symbol& symbol,
                                                  std::span<const Bar> bars,
                                                  Timestamp now) const {
    if (bars.size() < min_bars()) {
        LOG_DEBUG("[CLASSIFIER] {} has {} bars, needs {}", symbol.view(), bars.size(), min_bars());
        return degraded(symbol, now, ConditionStatus::InsufficientData);
    }

    const auto window = bars.last(std::max(config_.trend_lookback, min_bars()));
    for (const auto& bar : window) {
        if (!is_well_formed(bar)) {
            LOG_DEBUG("[CLASSIFIER] {} window contains a malformed bar", symbol.view());
            return degraded(symbol, now, ConditionStatus::MalformedInput);
        }
    }
    const auto recent = window.last(config_.volatility_window);
    if (recent.empty()) {
        return degraded(symbol, now, ConditionStatus::InsufficientData);
    }

    MarketCondition c;
    c.symbol = symbol;
    c.computed_at = now;
    c.status = ConditionStatus::Ok;

    // ------------------------------------------------------------------
    // Volatility: ATR over the short window relative to price
    // ------------------------------------------------------------------
    indicators::ATR atr(config_.volatility_window);
    for (const auto& bar : window.last(config_.volatility_window + 1)) {
        atr.update(bar);
    }
    const double mean_close = mean_of(recent, &Bar::close);
    c.normalized_atr = mean_close > 0.0 ? 100.0 * atr.value() / mean_close : 0.0;
    c.volatility = bucket_volatility(c.normalized_atr);

    // ------------------------------------------------------------------
    // Liquidity: recent volume (and spread) against the window baseline
    // ------------------------------------------------------------------
    const double base_volume = mean_of(window, &Bar::volume);
    if (base_volume > 0.0) {
        double ratio = mean_of(recent, &Bar::volume) / base_volume;
        const double base_spread = mean_of(window, &Bar::spread);
        const double recent_spread = mean_of(recent, &Bar::spread);
        if (base_spread > 0.0 && recent_spread > 0.0) {
            // Widening spreads thin liquidity
            ratio /= recent_spread / base_spread;
        }
        c.volume_ratio = ratio;
        c.liquidity = bucket_liquidity(ratio);
    }

    // ------------------------------------------------------------------
    // Trend: ADX strength with +DI / -DI direction
    // ------------------------------------------------------------------
    indicators::ADX adx(config_.adx_period);
    for (const auto& bar : window) {
        adx.update(bar);
    }
    c.trend_strength = std::clamp(adx.value() / config_.adx_strong_level, 0.0, 1.0);
    if (c.trend_strength >= config_.trend_strength_threshold) {
        c.trend = adx.plus_di() >= adx.minus_di() ? Trend::Bullish : Trend::Bearish;
    } else if (c.volatility == Volatility::High) {
        c.trend = Trend::Choppy;
    } else {
        c.trend = Trend::Ranging;
    }

    // ------------------------------------------------------------------
    // Price action: agreement of recent candle bodies with the label
    // ------------------------------------------------------------------
    double ups = 0.0;
    double downs = 0.0;
    for (const auto& bar : recent) {
        if (bar.close > bar.open) ups += 1.0;
        else if (bar.close < bar.open) downs += 1.0;
    }
    const auto n = static_cast<double>(recent.size());
    const double balance = 1.0 - std::abs(ups - downs) / n;
    double price_action = 0.0;
    switch (c.trend) {
        case Trend::Bullish: price_action = ups / n; break;
        case Trend::Bearish: price_action = downs / n; break;
        case Trend::Ranging: price_action = balance; break;
        case Trend::Choppy: price_action = 0.5 * balance; break;
        case Trend::Unknown: break;
    }

    c.confidence = confidence_for(c, price_action);

    if (c.confidence < config_.min_trading_confidence * 100.0) {
        LOG_DEBUG("[CLASSIFIER] {} {} below confidence floor ({:.1f})",
                  symbol.view(), to_string(c.trend), c.confidence);
        c.trend = Trend::Unknown;
        c.status = ConditionStatus::LowConfidence;
    }
    return c;
}

Volatility ConditionClassifier::bucket_volatility(double normalized_atr) const noexcept {
    if (!std::isfinite(normalized_atr)) return Volatility::Unknown;
    if (normalized_atr < config_.volatility_low) return Volatility::Low;
    if (normalized_atr < config_.volatility_medium) return Volatility::Medium;
    return Volatility::High;
}

Liquidity ConditionClassifier::bucket_liquidity(double ratio) const noexcept {
    if (!std::isfinite(ratio)) return Liquidity::Unknown;
    if (ratio < config_.liquidity_threshold) return Liquidity::Low;
    if (ratio < 1.0) return Liquidity::Medium;
    return Liquidity::High;
}

double ConditionClassifier::confidence_for(const MarketCondition& c,
                                           double price_action) const noexcept {
    double trend_score = 0.0;
    switch (c.trend) {
        case Trend::Bullish:
        case Trend::Bearish: trend_score = c.trend_strength; break;
        case Trend::Ranging: trend_score = 1.0 - c.trend_strength; break;
        case Trend::Choppy: trend_score = 0.5 * (1.0 - c.trend_strength); break;
        case Trend::Unknown: break;
    }

    double volatility_score = 0.0;
    switch (c.volatility) {
        case Volatility::Low: volatility_score = 1.0; break;
        case Volatility::Medium: volatility_score = 0.7; break;
        case Volatility::High: volatility_score = 0.4; break;
        case Volatility::Unknown: break;
    }

    double liquidity_score = 0.0;
    switch (c.liquidity) {
        case Liquidity::High: liquidity_score = 1.0; break;
        case Liquidity::Medium: liquidity_score = 0.7; break;
        case Liquidity::Low: liquidity_score = 0.3; break;
        case Liquidity::Unknown: break;
    }

    const auto& w = config_.weights;
    const double total = w.sum();
    if (total <= 0.0) return 0.0;

    const double weighted = w.trend * trend_score + w.volatility * volatility_score +
                            w.liquidity * liquidity_score + w.price_action * price_action;
    const double confidence = 100.0 * weighted / total;
    if (!std::isfinite(confidence)) return 0.0;
    return std::clamp(confidence, 0.0, 100.0);
}

}  // namespace meridian::market
