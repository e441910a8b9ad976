#pragma once
// ============================================================================
// MERIDIAN - Strategy Definition
// ============================================================================
// A strategy is read-only configuration: typed parameters (one struct per
// kind), a regime suitability table and risk parameters
// ============================================================================

#include "meridian/core/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace meridian::strategy {

// ============================================================================
// Per-Kind Parameters
// ============================================================================

struct MovingAverageCrossParams {
    size_t fast_period = 5;
    size_t slow_period = 20;
    bool use_ema = true;           // false = SMA
    bool use_confirmation = true;  // Close must sit beyond the fast MA
};

struct BollingerBreakoutParams {
    size_t bb_period = 20;
    double bb_std = 2.0;
    size_t rsi_period = 14;
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;
    bool use_rsi_filter = true;
};

struct BreakAndRetestParams {
    size_t lookback = 50;             // Bars defining the support/resistance range
    size_t confirmation_bars = 2;     // Consecutive closes beyond the level
    double min_breakout_pips = 10.0;
    double retest_max_pips = 5.0;     // Max distance from the level for a retest
    size_t max_retest_bars = 20;      // Breakout must be this recent
    bool volume_confirmation = true;
    double volume_threshold = 1.5;    // Breakout volume vs range average
};

struct BreakOfStructureParams {
    size_t lookback = 20;
    double min_swing_pips = 5.0;
    bool use_trend_filter = true;
    size_t trend_ema_period = 50;
    bool volume_filter = true;
    double volume_threshold = 1.3;
};

struct FairValueGapParams {
    double min_gap_pips = 5.0;
    double max_gap_pips = 30.0;
    size_t gap_validity_bars = 50;
    double mitigation_threshold = 0.5;  // Fraction of the gap price must fill
    bool use_trend_filter = true;
    size_t trend_ema_period = 50;
};

struct JHookParams {
    size_t lookback = 50;
    double trend_pips = 10.0;         // Minimum impulse leg
    double reversal_pips = 5.0;       // Minimum pullback leg
    size_t consolidation_min = 3;
    size_t consolidation_max = 10;
    double fib_min = 0.382;
    double fib_max = 0.618;
};

struct MaRsiComboParams {
    size_t ema_period = 50;
    size_t rsi_period = 14;
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;
};

struct StochasticCrossParams {
    size_t k_period = 14;
    size_t d_period = 3;
    size_t slowing = 3;
    double overbought = 80.0;
    double oversold = 20.0;
    bool trend_filter = true;
    size_t trend_ema_period = 100;
};

using StrategyParams = std::variant<MovingAverageCrossParams,
                                    BollingerBreakoutParams,
                                    BreakAndRetestParams,
                                    BreakOfStructureParams,
                                    FairValueGapParams,
                                    JHookParams,
                                    MaRsiComboParams,
                                    StochasticCrossParams>;

[[nodiscard]] std::string_view kind_name(const StrategyParams& params) noexcept;

// ============================================================================
// Risk Parameters
// ============================================================================

enum class StopLossMethod : uint8_t { Fixed, Atr, Structure };
enum class TakeProfitMethod : uint8_t { Fixed, Multiple };

struct StopLossSpec {
    StopLossMethod method = StopLossMethod::Atr;
    double fixed_pips = 15.0;
    double atr_multiplier = 1.5;
    size_t atr_period = 14;
    double structure_buffer_pips = 3.0;
};

/// Final target always sits at risk_reward_ratio x risk
struct TakeProfitSpec {
    TakeProfitMethod method = TakeProfitMethod::Multiple;
    double tp1_ratio = 1.0;   // First target at 1.0 x risk
    double tp1_size = 0.5;    // Fraction closed at the first target
};

struct RiskParams {
    StopLossSpec stop_loss;
    TakeProfitSpec take_profit;
    double risk_reward_ratio = 2.0;
    double max_spread_pips = 2.0;
};

// ============================================================================
// Regime Suitability (0-10 per bucket)
// ============================================================================

struct RegimeWeights {
    double ranging = 5.0;
    double trending = 5.0;
    double high_volatility = 5.0;
    double low_volatility = 5.0;
    double high_liquidity = 5.0;
    double low_liquidity = 5.0;
    double bullish = 5.0;
    double bearish = 5.0;
};

// ============================================================================
// Strategy
// ============================================================================

class Strategy {
public:
    Strategy(std::string name, StrategyParams params, RegimeWeights weights,
             RiskParams risk, bool enabled = true);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const StrategyParams& params() const { return params_; }
    [[nodiscard]] const RegimeWeights& weights() const { return weights_; }
    [[nodiscard]] const RiskParams& risk() const { return risk_; }
    [[nodiscard]] bool enabled() const { return enabled_; }
    [[nodiscard]] std::string_view kind() const { return kind_name(params_); }

    /// Throws ConfigError describing the first invalid field
    void validate() const;

    /// Bars required before generate_signal can fire
    [[nodiscard]] size_t min_bars() const;

    /// Entry signal on the most recent bar, if the setup is present
    [[nodiscard]] std::optional<TradingSignal> generate_signal(std::span<const Bar> bars,
                                                               const InstrumentSpec& spec) const;

private:
    std::string name_;
    StrategyParams params_;
    RegimeWeights weights_;
    RiskParams risk_;
    bool enabled_;
};

}  // namespace meridian::strategy
