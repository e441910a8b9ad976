// ============================================================================
// MERIDIAN - Strategy Selector Implementation
// ============================================================================

#include "meridian/strategy/strategy_selector.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace meridian::strategy {

using market::Liquidity;
using market::Trend;
using market::Volatility;

namespace {

double trend_bucket(Trend trend, const RegimeWeights& w) noexcept {
    switch (trend) {
        case Trend::Bullish:
        case Trend::Bearish: return w.trending;
        case Trend::Ranging: return w.ranging;
        case Trend::Choppy: return std::min(w.ranging, w.trending);
        case Trend::Unknown: break;
    }
    return 0.0;
}

double volatility_bucket(Volatility v, const RegimeWeights& w) noexcept {
    switch (v) {
        case Volatility::High: return w.high_volatility;
        case Volatility::Low: return w.low_volatility;
        case Volatility::Medium:
        case Volatility::Unknown: break;
    }
    return 0.5 * (w.high_volatility + w.low_volatility);
}

double liquidity_bucket(Liquidity l, const RegimeWeights& w) noexcept {
    switch (l) {
        case Liquidity::High: return w.high_liquidity;
        case Liquidity::Low: return w.low_liquidity;
        case Liquidity::Medium:
        case Liquidity::Unknown: break;
    }
    return 0.5 * (w.high_liquidity + w.low_liquidity);
}

double direction_bucket(Trend trend, const RegimeWeights& w) noexcept {
    switch (trend) {
        case Trend::Bullish: return w.bullish;
        case Trend::Bearish: return w.bearish;
        default: break;
    }
    return 0.5 * (w.bullish + w.bearish);
}

}  // namespace

StrategySelector::StrategySelector(const SelectorConfig& config) : config_(config) {}

double StrategySelector::score(const market::MarketCondition& condition,
                               const Strategy& strategy) const noexcept {
    const auto& a = config_.axis_weights;
    const double total = a.sum();
    if (total <= 0.0) return 0.0;

    const auto& w = strategy.weights();
    const double weighted = a.trend * trend_bucket(condition.trend, w) +
                            a.volatility * volatility_bucket(condition.volatility, w) +
                            a.liquidity * liquidity_bucket(condition.liquidity, w) +
                            a.price_action * direction_bucket(condition.trend, w);
    return weighted / total;
}

Selection StrategySelector::select(const market::MarketCondition& condition,
                                   const StrategyCatalog& catalog) const {
    Selection result;

    if (condition.trend == Trend::Unknown) {
        result.reason = fmt::format("trend unknown ({})", market::to_string(condition.status));
        return result;
    }
    if (condition.confidence < config_.min_confidence * 100.0) {
        result.reason = fmt::format("confidence {:.1f} below floor {:.1f}",
                                    condition.confidence, config_.min_confidence * 100.0);
        return result;
    }

    for (const auto& s : catalog) {
        if (!s.enabled()) continue;
        const double sc = score(condition, s);
        result.ranking.push_back(RankedStrategy{&s, sc});
        // Strict comparison keeps the earliest declared strategy on ties
        if (sc > config_.min_score && (result.strategy == nullptr || sc > result.score)) {
            result.strategy = &s;
            result.score = sc;
        }
    }

    if (result.strategy == nullptr) {
        result.reason = result.ranking.empty() ? "no enabled strategy"
                                               : "no strategy above minimum score";
    } else {
        result.reason = fmt::format("{} scored {:.2f} for {}/{}/{}", result.strategy->name(),
                                    result.score, market::to_string(condition.trend),
                                    market::to_string(condition.volatility),
                                    market::to_string(condition.liquidity));
    }
    return result;
}

}  // namespace meridian::strategy
