// ============================================================================
// MERIDIAN - Signal Generator Implementation
// ============================================================================
// One detector per parameter kind. Every detector only looks at the closed
// bars it is given and fires on the most recent one
// ============================================================================

#include "meridian/strategy/strategy.hpp"

#include "meridian/indicators/bollinger.hpp"
#include "meridian/indicators/ema.hpp"
#include "meridian/indicators/rsi.hpp"
#include "meridian/indicators/stochastic.hpp"

#include <algorithm>
#include <cmath>

namespace meridian::strategy {

namespace {

using Bars = std::span<const Bar>;

TradingSignal make_signal(const InstrumentSpec& spec, const Bar& last, Direction direction,
                          double strength, double structure_level = 0.0) {
    TradingSignal s;
    s.symbol = spec.symbol;
    s.direction = direction;
    s.strength = SignalStrength{direction == Direction::Long ? std::abs(strength)
                                                             : -std::abs(strength)};
    s.timestamp = last.open_time;
    s.reference_price = last.close;
    s.structure_level = structure_level;
    return s;
}

double ema_of_closes(Bars bars, size_t period) {
    indicators::EMA ema(period);
    for (const auto& b : bars) ema.update(b.close);
    return ema.value();
}

double mean_volume(Bars bars) {
    if (bars.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& b : bars) sum += b.volume;
    return sum / static_cast<double>(bars.size());
}

double highest_high(Bars bars) {
    double h = bars.front().high;
    for (const auto& b : bars) h = std::max(h, b.high);
    return h;
}

double lowest_low(Bars bars) {
    double l = bars.front().low;
    for (const auto& b : bars) l = std::min(l, b.low);
    return l;
}

/// Map a distance in pips to a 0..1 strength, saturating at `full_pips`
double pip_strength(double pips, double full_pips) {
    if (full_pips <= 0.0) return 1.0;
    return std::clamp(std::abs(pips) / full_pips, 0.1, 1.0);
}

// ============================================================================
// Moving Average Cross
// ============================================================================

template <typename MA>
std::optional<TradingSignal> ma_cross(const MovingAverageCrossParams& p, Bars bars,
                                      const InstrumentSpec& spec) {
    MA fast(p.fast_period);
    MA slow(p.slow_period);
    double prev_fast = 0.0;
    double prev_slow = 0.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        if (i + 1 == bars.size()) {
            prev_fast = fast.value();
            prev_slow = slow.value();
        }
        fast.update(bars[i].close);
        slow.update(bars[i].close);
    }
    if (!slow.is_ready()) return std::nullopt;

    const auto& last = bars.back();
    const double gap_pips = (fast.value() - slow.value()) / spec.pip_size;

    if (prev_fast <= prev_slow && fast.value() > slow.value()) {
        if (p.use_confirmation && last.close <= fast.value()) return std::nullopt;
        return make_signal(spec, last, Direction::Long, pip_strength(gap_pips, 5.0));
    }
    if (prev_fast >= prev_slow && fast.value() < slow.value()) {
        if (p.use_confirmation && last.close >= fast.value()) return std::nullopt;
        return make_signal(spec, last, Direction::Short, pip_strength(gap_pips, 5.0));
    }
    return std::nullopt;
}

std::optional<TradingSignal> detect(const MovingAverageCrossParams& p, Bars bars,
                                    const InstrumentSpec& spec) {
    if (bars.size() < p.slow_period + 2) return std::nullopt;
    if (p.use_ema) return ma_cross<indicators::EMA>(p, bars, spec);
    return ma_cross<indicators::SMA>(p, bars, spec);
}

// ============================================================================
// Bollinger Breakout
// ============================================================================

std::optional<TradingSignal> detect(const BollingerBreakoutParams& p, Bars bars,
                                    const InstrumentSpec& spec) {
    indicators::BollingerBands bb(p.bb_period, p.bb_std);
    indicators::RSI rsi(p.rsi_period);
    double prev_upper = 0.0;
    double prev_lower = 0.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        if (i + 1 == bars.size()) {
            prev_upper = bb.upper_band();
            prev_lower = bb.lower_band();
        }
        bb.update(bars[i].close);
        rsi.update(bars[i].close);
    }
    if (bars.size() < 2 || !bb.is_ready() || prev_upper == 0.0) return std::nullopt;

    const auto& last = bars.back();
    const double prev_close = bars[bars.size() - 2].close;
    const double strength = std::clamp(std::abs(bb.percent_b() - 0.5), 0.1, 1.0);

    // Fresh close outside the band, momentum direction
    if (last.close > bb.upper_band() && prev_close <= prev_upper) {
        if (p.use_rsi_filter && rsi.value() >= p.rsi_overbought) return std::nullopt;
        return make_signal(spec, last, Direction::Long, strength, bb.value());
    }
    if (last.close < bb.lower_band() && prev_close >= prev_lower) {
        if (p.use_rsi_filter && rsi.value() <= p.rsi_oversold) return std::nullopt;
        return make_signal(spec, last, Direction::Short, strength, bb.value());
    }
    return std::nullopt;
}

// ============================================================================
// Break and Retest
// ============================================================================

std::optional<TradingSignal> detect(const BreakAndRetestParams& p, Bars bars,
                                    const InstrumentSpec& spec) {
    const size_t n = bars.size();
    if (n < p.lookback + p.max_retest_bars + 1) return std::nullopt;

    const size_t recent_begin = n - 1 - p.max_retest_bars;
    const Bars range = bars.subspan(recent_begin - p.lookback, p.lookback);
    const double resistance = highest_high(range);
    const double support = lowest_low(range);
    const double avg_volume = mean_volume(range);
    const double breakout = p.min_breakout_pips * spec.pip_size;
    const double zone = p.retest_max_pips * spec.pip_size;
    const auto& last = bars.back();

    auto volume_ok = [&](const Bar& b) {
        return !p.volume_confirmation || avg_volume <= 0.0 ||
               b.volume >= p.volume_threshold * avg_volume;
    };

    // Earliest confirmed breakout that held until the retest bar
    auto find_breakout = [&](auto beyond) -> bool {
        for (size_t b = recent_begin; b + p.confirmation_bars < n; ++b) {
            if (!volume_ok(bars[b])) continue;
            bool confirmed = true;
            for (size_t k = b; k < b + p.confirmation_bars; ++k) {
                if (!beyond(bars[k].close, breakout)) {
                    confirmed = false;
                    break;
                }
            }
            if (!confirmed) continue;
            bool held = true;
            for (size_t k = b + p.confirmation_bars; k + 1 < n; ++k) {
                if (!beyond(bars[k].close, 0.0)) {
                    held = false;
                    break;
                }
            }
            if (held) return true;
        }
        return false;
    };

    const bool broke_up = find_breakout([&](double close, double margin) {
        return close > resistance + margin;
    });
    if (broke_up && last.low <= resistance + zone && last.close > resistance) {
        const double strength = pip_strength((last.close - resistance) / spec.pip_size,
                                             p.retest_max_pips);
        return make_signal(spec, last, Direction::Long, strength, resistance);
    }

    const bool broke_down = find_breakout([&](double close, double margin) {
        return close < support - margin;
    });
    if (broke_down && last.high >= support - zone && last.close < support) {
        const double strength = pip_strength((support - last.close) / spec.pip_size,
                                             p.retest_max_pips);
        return make_signal(spec, last, Direction::Short, strength, support);
    }
    return std::nullopt;
}

// ============================================================================
// Break of Structure
// ============================================================================

std::optional<TradingSignal> detect(const BreakOfStructureParams& p, Bars bars,
                                    const InstrumentSpec& spec) {
    const size_t n = bars.size();
    if (n < p.lookback + 2) return std::nullopt;

    const Bars swing = bars.subspan(n - 1 - p.lookback, p.lookback);
    const double swing_high = highest_high(swing);
    const double swing_low = lowest_low(swing);
    if ((swing_high - swing_low) / spec.pip_size < p.min_swing_pips) return std::nullopt;

    const auto& last = bars.back();
    const double prev_close = bars[n - 2].close;
    if (p.volume_filter && last.volume < p.volume_threshold * mean_volume(swing)) {
        return std::nullopt;
    }

    const double trend_ema = p.use_trend_filter ? ema_of_closes(bars, p.trend_ema_period) : 0.0;
    const Bars pullback = swing.last(std::max<size_t>(3, p.lookback / 4));

    if (last.close > swing_high && prev_close <= swing_high) {
        if (p.use_trend_filter && last.close <= trend_ema) return std::nullopt;
        const double strength = pip_strength((last.close - swing_high) / spec.pip_size,
                                             p.min_swing_pips);
        return make_signal(spec, last, Direction::Long, strength, lowest_low(pullback));
    }
    if (last.close < swing_low && prev_close >= swing_low) {
        if (p.use_trend_filter && last.close >= trend_ema) return std::nullopt;
        const double strength = pip_strength((swing_low - last.close) / spec.pip_size,
                                             p.min_swing_pips);
        return make_signal(spec, last, Direction::Short, strength, highest_high(pullback));
    }
    return std::nullopt;
}

// ============================================================================
// Fair Value Gap
// ============================================================================

std::optional<TradingSignal> detect(const FairValueGapParams& p, Bars bars,
                                    const InstrumentSpec& spec) {
    const size_t n = bars.size();
    if (n < p.gap_validity_bars + 3) return std::nullopt;

    const auto& last = bars.back();
    const double trend_ema = p.use_trend_filter ? ema_of_closes(bars, p.trend_ema_period) : 0.0;
    const size_t oldest = n - 1 - p.gap_validity_bars;

    // Most recent gap first; gap bar i must close before the last bar
    for (size_t i = n - 2; i >= std::max<size_t>(2, oldest); --i) {
        // Bullish gap: candle i-2 high below candle i low
        {
            const double bottom = bars[i - 2].high;
            const double top = bars[i].low;
            const double size_pips = (top - bottom) / spec.pip_size;
            if (top > bottom && size_pips >= p.min_gap_pips && size_pips <= p.max_gap_pips) {
                const double fill_level = top - p.mitigation_threshold * (top - bottom);
                bool untouched = true;
                for (size_t k = i + 1; k + 1 < n; ++k) {
                    if (bars[k].low <= fill_level || bars[k].close < bottom) {
                        untouched = false;
                        break;
                    }
                }
                if (untouched && last.low <= fill_level && last.close > bottom &&
                    (!p.use_trend_filter || last.close > trend_ema)) {
                    return make_signal(spec, last, Direction::Long,
                                       pip_strength(size_pips, p.max_gap_pips), bottom);
                }
            }
        }
        // Bearish gap: candle i-2 low above candle i high
        {
            const double top = bars[i - 2].low;
            const double bottom = bars[i].high;
            const double size_pips = (top - bottom) / spec.pip_size;
            if (top > bottom && size_pips >= p.min_gap_pips && size_pips <= p.max_gap_pips) {
                const double fill_level = bottom + p.mitigation_threshold * (top - bottom);
                bool untouched = true;
                for (size_t k = i + 1; k + 1 < n; ++k) {
                    if (bars[k].high >= fill_level || bars[k].close > top) {
                        untouched = false;
                        break;
                    }
                }
                if (untouched && last.high >= fill_level && last.close < top &&
                    (!p.use_trend_filter || last.close < trend_ema)) {
                    return make_signal(spec, last, Direction::Short,
                                       pip_strength(size_pips, p.max_gap_pips), top);
                }
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// J-Hook
// ============================================================================

std::optional<TradingSignal> detect(const JHookParams& p, Bars bars, const InstrumentSpec& spec) {
    const size_t n = bars.size();
    if (n < p.lookback + 1) return std::nullopt;

    const Bars w = bars.subspan(n - 1 - p.lookback, p.lookback);
    const auto& last = bars.back();
    const double pip = spec.pip_size;

    auto consolidation_ok = [&](size_t pullback_index) {
        const size_t count = w.size() - 1 - pullback_index;
        return count >= p.consolidation_min && count <= p.consolidation_max;
    };

    // Bullish: impulse up A -> H, pullback to P, break of the consolidation high
    {
        const auto h_it = std::max_element(w.begin(), w.end(),
                                           [](const Bar& a, const Bar& b) { return a.high < b.high; });
        const auto h = static_cast<size_t>(h_it - w.begin());
        if (h >= 1 && h + 1 < w.size()) {
            const Bars before = w.first(h);
            const Bars after = w.subspan(h + 1);
            const auto a_it = std::min_element(before.begin(), before.end(),
                                               [](const Bar& x, const Bar& y) { return x.low < y.low; });
            const auto p_it = std::min_element(after.begin(), after.end(),
                                               [](const Bar& x, const Bar& y) { return x.low < y.low; });
            const double high = w[h].high;
            const double impulse = high - a_it->low;
            const double pullback = high - p_it->low;
            const size_t p_index = h + 1 + static_cast<size_t>(p_it - after.begin());
            if (impulse / pip >= p.trend_pips && pullback / pip >= p.reversal_pips &&
                impulse > 0.0) {
                const double retracement = pullback / impulse;
                if (retracement >= p.fib_min && retracement <= p.fib_max &&
                    consolidation_ok(p_index)) {
                    const double box_high = highest_high(w.subspan(p_index));
                    if (last.close > box_high) {
                        return make_signal(spec, last, Direction::Long,
                                           pip_strength(impulse / pip, 2.0 * p.trend_pips),
                                           p_it->low);
                    }
                }
            }
        }
    }

    // Bearish: impulse down A -> L, pullback to P, break of the consolidation low
    {
        const auto l_it = std::min_element(w.begin(), w.end(),
                                           [](const Bar& a, const Bar& b) { return a.low < b.low; });
        const auto l = static_cast<size_t>(l_it - w.begin());
        if (l >= 1 && l + 1 < w.size()) {
            const Bars before = w.first(l);
            const Bars after = w.subspan(l + 1);
            const auto a_it = std::max_element(before.begin(), before.end(),
                                               [](const Bar& x, const Bar& y) { return x.high < y.high; });
            const auto p_it = std::max_element(after.begin(), after.end(),
                                               [](const Bar& x, const Bar& y) { return x.high < y.high; });
            const double low = w[l].low;
            const double impulse = a_it->high - low;
            const double pullback = p_it->high - low;
            const size_t p_index = l + 1 + static_cast<size_t>(p_it - after.begin());
            if (impulse / pip >= p.trend_pips && pullback / pip >= p.reversal_pips &&
                impulse > 0.0) {
                const double retracement = pullback / impulse;
                if (retracement >= p.fib_min && retracement <= p.fib_max &&
                    consolidation_ok(p_index)) {
                    const double box_low = lowest_low(w.subspan(p_index));
                    if (last.close < box_low) {
                        return make_signal(spec, last, Direction::Short,
                                           pip_strength(impulse / pip, 2.0 * p.trend_pips),
                                           p_it->high);
                    }
                }
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// MA + RSI Combo
// ============================================================================

std::optional<TradingSignal> detect(const MaRsiComboParams& p, Bars bars,
                                    const InstrumentSpec& spec) {
    if (bars.size() < std::max(p.ema_period, p.rsi_period + 2)) return std::nullopt;

    indicators::EMA ema(p.ema_period);
    indicators::RSI rsi(p.rsi_period);
    double prev_rsi = 50.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        if (i + 1 == bars.size()) prev_rsi = rsi.value();
        ema.update(bars[i].close);
        rsi.update(bars[i].close);
    }
    if (!rsi.is_ready() || !ema.is_ready()) return std::nullopt;

    const auto& last = bars.back();
    const double r = rsi.value();

    // Momentum turning back in the direction of the trend, away from extremes
    if (last.close > ema.value() && prev_rsi < 50.0 && r >= 50.0 && r < p.rsi_overbought) {
        return make_signal(spec, last, Direction::Long, (r - 50.0) / (p.rsi_overbought - 50.0),
                           ema.value());
    }
    if (last.close < ema.value() && prev_rsi > 50.0 && r <= 50.0 && r > p.rsi_oversold) {
        return make_signal(spec, last, Direction::Short, (50.0 - r) / (50.0 - p.rsi_oversold),
                           ema.value());
    }
    return std::nullopt;
}

// ============================================================================
// Stochastic Cross
// ============================================================================

std::optional<TradingSignal> detect(const StochasticCrossParams& p, Bars bars,
                                    const InstrumentSpec& spec) {
    indicators::Stochastic stoch(p.k_period, p.d_period, p.slowing);
    for (const auto& b : bars) stoch.update(b);
    if (!stoch.is_ready()) return std::nullopt;

    const auto& last = bars.back();
    const double trend_ema = p.trend_filter ? ema_of_closes(bars, p.trend_ema_period) : 0.0;

    const bool cross_up = stoch.previous_k() <= stoch.previous_d() && stoch.k() > stoch.d();
    const bool cross_down = stoch.previous_k() >= stoch.previous_d() && stoch.k() < stoch.d();

    if (cross_up && stoch.previous_k() < p.oversold) {
        if (p.trend_filter && last.close <= trend_ema) return std::nullopt;
        return make_signal(spec, last, Direction::Long, (p.oversold - stoch.previous_k()) / p.oversold);
    }
    if (cross_down && stoch.previous_k() > p.overbought) {
        if (p.trend_filter && last.close >= trend_ema) return std::nullopt;
        return make_signal(spec, last, Direction::Short,
                           (stoch.previous_k() - p.overbought) / (100.0 - p.overbought));
    }
    return std::nullopt;
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

std::optional<TradingSignal> Strategy::generate_signal(std::span<const Bar> bars,
                                                       const InstrumentSpec& spec) const {
    if (!enabled_ || bars.empty() || spec.pip_size <= 0.0) return std::nullopt;
    return std::visit([&](const auto& p) { return detect(p, bars, spec); }, params_);
}

}  // namespace meridian::strategy
