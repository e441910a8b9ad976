#pragma once
// ============================================================================
// MERIDIAN - Strategy Selector
// ============================================================================
// Pure ranking of catalog strategies against a classified regime
// ============================================================================

#include "meridian/market/condition_classifier.hpp"
#include "meridian/market/market_condition.hpp"
#include "meridian/strategy/strategy_catalog.hpp"

#include <string>
#include <vector>

namespace meridian::strategy {

struct SelectorConfig {
    market::ConditionWeights axis_weights;  // trend, volatility, liquidity, direction
    double min_confidence = 0.6;            // Fraction of 100, same floor as the classifier
    double min_score = 0.0;                 // Winner must score strictly above this
};

struct RankedStrategy {
    const Strategy* strategy = nullptr;
    double score = 0.0;
};

struct Selection {
    const Strategy* strategy = nullptr;  // nullptr = no strategy this cycle
    double score = 0.0;
    std::vector<RankedStrategy> ranking;  // Enabled strategies, declaration order
    std::string reason;

    [[nodiscard]] bool selected() const noexcept { return strategy != nullptr; }
};

class StrategySelector {
public:
    explicit StrategySelector(const SelectorConfig& config = SelectorConfig{});

    [[nodiscard]] Selection select(const market::MarketCondition& condition,
                                   const StrategyCatalog& catalog) const;

    /// Weighted regime score of one strategy (0-10)
    [[nodiscard]] double score(const market::MarketCondition& condition,
                               const Strategy& strategy) const noexcept;

    [[nodiscard]] const SelectorConfig& config() const { return config_; }

private:
    SelectorConfig config_;
};

}  // namespace meridian::strategy
