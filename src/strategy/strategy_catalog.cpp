// ============================================================================
// MERIDIAN - Strategy Catalog Implementation
// ============================================================================

#include "meridian/strategy/strategy_catalog.hpp"

#include "meridian/core/errors.hpp"

#include <algorithm>
#include <utility>

namespace meridian::strategy {

void StrategyCatalog::add(Strategy strategy) {
    strategy.validate();
    if (find(strategy.name()) != nullptr) {
        throw ConfigError("duplicate strategy '" + strategy.name() + "'");
    }
    strategies_.push_back(std::move(strategy));
}

const Strategy* StrategyCatalog::find(std::string_view name) const noexcept {
    for (const auto& s : strategies_) {
        if (s.name() == name) return &s;
    }
    return nullptr;
}

size_t StrategyCatalog::max_min_bars() const {
    size_t bars = 0;
    for (const auto& s : strategies_) {
        if (s.enabled()) bars = std::max(bars, s.min_bars());
    }
    return bars;
}

// ============================================================================
// Shipped Defaults
// ============================================================================

namespace {

RiskParams atr_risk(double multiplier, double rr, double max_spread) {
    RiskParams r;
    r.stop_loss.method = StopLossMethod::Atr;
    r.stop_loss.atr_multiplier = multiplier;
    r.risk_reward_ratio = rr;
    r.max_spread_pips = max_spread;
    return r;
}

RegimeWeights regime(double ranging, double trending, double high_vol, double low_vol,
                     double bullish, double bearish) {
    RegimeWeights w;
    w.ranging = ranging;
    w.trending = trending;
    w.high_volatility = high_vol;
    w.low_volatility = low_vol;
    w.bullish = bullish;
    w.bearish = bearish;
    return w;
}

}  // namespace

StrategyCatalog StrategyCatalog::with_defaults() {
    StrategyCatalog catalog;

    {
        RiskParams risk;
        risk.stop_loss.method = StopLossMethod::Fixed;
        risk.stop_loss.fixed_pips = 5.0;
        risk.risk_reward_ratio = 2.0;  // 10 pip target on a 5 pip stop
        risk.max_spread_pips = 2.0;
        catalog.add(Strategy("moving_average_cross", MovingAverageCrossParams{},
                             regime(3, 8, 6, 5, 7, 7), risk));
    }
    {
        RiskParams risk;
        risk.stop_loss.method = StopLossMethod::Fixed;
        risk.stop_loss.fixed_pips = 8.0;
        risk.risk_reward_ratio = 1.875;  // 15 pip target on an 8 pip stop
        risk.max_spread_pips = 2.0;
        catalog.add(Strategy("bollinger_breakout", BollingerBreakoutParams{},
                             regime(4, 6, 8, 3, 6, 6), risk));
    }

    catalog.add(Strategy("break_and_retest", BreakAndRetestParams{},
                         regime(9, 5, 4, 8, 7, 7), atr_risk(0.5, 2.0, 1.5)));

    {
        RiskParams risk = atr_risk(1.0, 1.5, 2.0);
        risk.stop_loss.method = StopLossMethod::Structure;
        catalog.add(Strategy("break_of_structure", BreakOfStructureParams{},
                             regime(4, 9, 7, 5, 8, 8), risk));
    }
    {
        RiskParams risk = atr_risk(1.0, 2.0, 2.0);
        risk.stop_loss.method = StopLossMethod::Structure;
        catalog.add(Strategy("fair_value_gap", FairValueGapParams{},
                             regime(7, 8, 8, 6, 7, 7), risk));
    }

    catalog.add(Strategy("jhook_pattern", JHookParams{}, regime(3, 9, 7, 5, 8, 8),
                         atr_risk(1.0, 2.0, 2.0)));
    catalog.add(Strategy("ma_rsi_combo", MaRsiComboParams{}, regime(4, 8, 5, 6, 7, 7),
                         atr_risk(1.2, 2.0, 3.0)));
    catalog.add(Strategy("stochastic_cross", StochasticCrossParams{}, regime(8, 4, 5, 6, 6, 6),
                         atr_risk(1.2, 1.8, 2.5)));

    {
        BreakAndRetestParams p;
        p.lookback = 100;
        p.confirmation_bars = 2;
        p.max_retest_bars = 20;
        p.retest_max_pips = 3.0;
        catalog.add(Strategy("bnr_strategy", p, regime(9, 5, 4, 8, 7, 7),
                             atr_risk(1.5, 2.0, 2.0)));
    }
    {
        JHookParams p;
        p.trend_pips = 15.0;
        p.reversal_pips = 8.0;
        p.consolidation_min = 3;
        p.consolidation_max = 10;
        catalog.add(Strategy("jhook_strategy", p, regime(3, 9, 7, 5, 8, 8),
                             atr_risk(1.2, 2.2, 2.0)));
    }

    return catalog;
}

}  // namespace meridian::strategy
