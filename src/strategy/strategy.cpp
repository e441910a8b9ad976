// ============================================================================
// MERIDIAN - Strategy Definition Implementation
// ============================================================================
// Load-time validation and warm-up requirements per parameter kind
// ============================================================================

#include "meridian/strategy/strategy.hpp"

#include "meridian/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace meridian::strategy {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class Validator {
public:
    explicit Validator(const std::string& name) : name_(name) {}

    void positive(double value, const char* field) const {
        if (!(std::isfinite(value) && value > 0.0)) {
            fail(field, "must be > 0");
        }
    }

    void period(size_t value, const char* field) const {
        if (value == 0) fail(field, "must be >= 1");
    }

    void in_range(double value, double lo, double hi, const char* field) const {
        if (!(std::isfinite(value) && value >= lo && value <= hi)) {
            fail(field, "out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
        }
    }

    void less(double a, double b, const char* field) const {
        if (!(a < b)) fail(field, "inconsistent bounds");
    }

    [[noreturn]] void fail(const char* field, const std::string& why) const {
        throw ConfigError("strategy '" + name_ + "': " + field + " " + why);
    }

private:
    const std::string& name_;
};

}  // namespace

std::string_view kind_name(const StrategyParams& params) noexcept {
    return std::visit(overloaded{
        [](const MovingAverageCrossParams&) { return std::string_view{"moving_average_cross"}; },
        [](const BollingerBreakoutParams&) { return std::string_view{"bollinger_breakout"}; },
        [](const BreakAndRetestParams&) { return std::string_view{"break_and_retest"}; },
        [](const BreakOfStructureParams&) { return std::string_view{"break_of_structure"}; },
        [](const FairValueGapParams&) { return std::string_view{"fair_value_gap"}; },
        [](const JHookParams&) { return std::string_view{"jhook"}; },
        [](const MaRsiComboParams&) { return std::string_view{"ma_rsi_combo"}; },
        [](const StochasticCrossParams&) { return std::string_view{"stochastic_cross"}; },
    }, params);
}

Strategy::Strategy(std::string name, StrategyParams params, RegimeWeights weights,
                   RiskParams risk, bool enabled)
    : name_(std::move(name)),
      params_(std::move(params)),
      weights_(weights),
      risk_(risk),
      enabled_(enabled) {}

// ============================================================================
// Validation
// ============================================================================

void Strategy::validate() const {
    const Validator v(name_);

    if (name_.empty()) {
        throw ConfigError("strategy with empty name");
    }

    // Regime weights
    v.in_range(weights_.ranging, 0.0, 10.0, "weights.ranging_market");
    v.in_range(weights_.trending, 0.0, 10.0, "weights.trending_market");
    v.in_range(weights_.high_volatility, 0.0, 10.0, "weights.high_volatility");
    v.in_range(weights_.low_volatility, 0.0, 10.0, "weights.low_volatility");
    v.in_range(weights_.high_liquidity, 0.0, 10.0, "weights.high_liquidity");
    v.in_range(weights_.low_liquidity, 0.0, 10.0, "weights.low_liquidity");
    v.in_range(weights_.bullish, 0.0, 10.0, "weights.bullish_market");
    v.in_range(weights_.bearish, 0.0, 10.0, "weights.bearish_market");

    // Risk parameters
    v.positive(risk_.risk_reward_ratio, "risk_reward_ratio");
    v.positive(risk_.max_spread_pips, "max_spread_pips");
    v.positive(risk_.stop_loss.fixed_pips, "stop_loss.fixed_pips");
    v.positive(risk_.stop_loss.atr_multiplier, "atr_multiplier");
    v.period(risk_.stop_loss.atr_period, "atr_period");
    v.in_range(risk_.stop_loss.structure_buffer_pips, 0.0, 1000.0, "structure_buffer_pips");
    if (risk_.take_profit.method == TakeProfitMethod::Multiple) {
        v.positive(risk_.take_profit.tp1_ratio, "take_profit.tp1_ratio");
        v.less(risk_.take_profit.tp1_ratio, risk_.risk_reward_ratio, "take_profit.tp1_ratio");
        v.in_range(risk_.take_profit.tp1_size, 0.01, 0.99, "take_profit.tp1_size");
    }

    // Kind-specific parameters
    std::visit(overloaded{
        [&](const MovingAverageCrossParams& p) {
            v.period(p.fast_period, "fast_ma_period");
            v.period(p.slow_period, "slow_ma_period");
            v.less(static_cast<double>(p.fast_period), static_cast<double>(p.slow_period),
                   "fast_ma_period");
        },
        [&](const BollingerBreakoutParams& p) {
            v.period(p.bb_period, "bb_period");
            v.positive(p.bb_std, "bb_std");
            v.period(p.rsi_period, "rsi_period");
            v.less(p.rsi_oversold, p.rsi_overbought, "rsi_oversold");
        },
        [&](const BreakAndRetestParams& p) {
            v.period(p.lookback, "lookback_periods");
            v.period(p.confirmation_bars, "confirmation_bars");
            v.period(p.max_retest_bars, "max_retest_bars");
            v.positive(p.min_breakout_pips, "min_breakout_pips");
            v.positive(p.retest_max_pips, "retest_max_pips");
            v.positive(p.volume_threshold, "volume_threshold");
            if (p.confirmation_bars >= p.max_retest_bars) {
                v.fail("confirmation_bars", "must be below max_retest_bars");
            }
        },
        [&](const BreakOfStructureParams& p) {
            v.period(p.lookback, "lookback_periods");
            v.positive(p.min_swing_pips, "min_swing_size_pips");
            v.period(p.trend_ema_period, "trend_ema_period");
            v.positive(p.volume_threshold, "volume_threshold");
        },
        [&](const FairValueGapParams& p) {
            v.positive(p.min_gap_pips, "min_gap_size_pips");
            v.less(p.min_gap_pips, p.max_gap_pips, "min_gap_size_pips");
            v.period(p.gap_validity_bars, "gap_validity_periods");
            v.in_range(p.mitigation_threshold, 0.0, 1.0, "mitigation_threshold");
            v.period(p.trend_ema_period, "trend_ema_period");
        },
        [&](const JHookParams& p) {
            v.period(p.lookback, "lookback_period");
            v.positive(p.trend_pips, "trend_strength");
            v.positive(p.reversal_pips, "reversal_strength");
            v.period(p.consolidation_min, "consolidation_bars_min");
            if (p.consolidation_min > p.consolidation_max) {
                v.fail("consolidation_bars_min", "exceeds consolidation_bars_max");
            }
            v.in_range(p.fib_min, 0.0, 1.0, "fib_retracement_min");
            v.in_range(p.fib_max, 0.0, 1.0, "fib_retracement_max");
            v.less(p.fib_min, p.fib_max, "fib_retracement_min");
            if (p.consolidation_max + 3 > p.lookback) {
                v.fail("lookback_period", "too short for the consolidation window");
            }
        },
        [&](const MaRsiComboParams& p) {
            v.period(p.ema_period, "ema_period");
            v.period(p.rsi_period, "rsi_period");
            v.less(p.rsi_oversold, p.rsi_overbought, "rsi_oversold");
        },
        [&](const StochasticCrossParams& p) {
            v.period(p.k_period, "k_period");
            v.period(p.d_period, "d_period");
            v.period(p.slowing, "slowing");
            v.less(p.oversold, p.overbought, "oversold");
            v.period(p.trend_ema_period, "trend_ema_period");
        },
    }, params_);
}

// ============================================================================
// Warm-up
// ============================================================================

size_t Strategy::min_bars() const {
    const size_t base = std::visit(overloaded{
        [](const MovingAverageCrossParams& p) { return p.slow_period + 2; },
        [](const BollingerBreakoutParams& p) {
            return std::max(p.bb_period, p.rsi_period + 1) + 1;
        },
        [](const BreakAndRetestParams& p) { return p.lookback + p.max_retest_bars + 1; },
        [](const BreakOfStructureParams& p) {
            return std::max(p.lookback + 2, p.use_trend_filter ? p.trend_ema_period : size_t{0});
        },
        [](const FairValueGapParams& p) {
            return std::max(p.gap_validity_bars + 3,
                            p.use_trend_filter ? p.trend_ema_period : size_t{0});
        },
        [](const JHookParams& p) { return p.lookback + 1; },
        [](const MaRsiComboParams& p) { return std::max(p.ema_period, p.rsi_period + 2); },
        [](const StochasticCrossParams& p) {
            const size_t osc = p.k_period + p.slowing + 2 * p.d_period + 2;
            return std::max(osc, p.trend_filter ? p.trend_ema_period : size_t{0});
        },
    }, params_);

    // Stop placement needs its own ATR history
    return std::max(base, risk_.stop_loss.atr_period + 1);
}

}  // namespace meridian::strategy
