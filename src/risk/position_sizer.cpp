// ============================================================================
// MERIDIAN - Position Sizer Implementation
// ============================================================================

#include "meridian/risk/position_sizer.hpp"

#include "meridian/indicators/atr.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace meridian::risk {

PositionSizer::PositionSizer(const SizingConfig& config) : config_(config) {}

double PositionSizer::raw_lots(double equity, double risk_fraction, double stop_pips,
                               double pip_value_per_lot, double max_lot) noexcept {
    if (!std::isfinite(equity) || !std::isfinite(risk_fraction) ||
        !std::isfinite(pip_value_per_lot) || !std::isfinite(max_lot)) {
        return 0.0;
    }
    if (equity <= 0.0 || risk_fraction <= 0.0 || pip_value_per_lot <= 0.0 || max_lot <= 0.0) {
        return 0.0;
    }
    // An infinitely wide stop sizes to nothing
    if (std::isnan(stop_pips) || stop_pips <= 0.0 || std::isinf(stop_pips)) return 0.0;

    const double lots = (equity * risk_fraction) / (stop_pips * pip_value_per_lot);
    if (!std::isfinite(lots)) return 0.0;
    return std::clamp(lots, 0.0, max_lot);
}

double PositionSizer::effective_risk(const AccountTier& tier,
                                     std::optional<RiskLevel> level) noexcept {
    if (!level) return tier.risk_percent;
    return std::min(tier.risk_percent, risk_cap(*level));
}

SizingResult PositionSizer::size(double equity, const AccountTier& tier, double stop_pips,
                                 double pip_value_per_lot, std::optional<RiskLevel> level) const {
    SizingResult result;
    result.stop_pips = stop_pips;

    if (!std::isfinite(equity) || equity <= 0.0 || !std::isfinite(pip_value_per_lot) ||
        pip_value_per_lot <= 0.0 || std::isnan(stop_pips) || stop_pips <= 0.0) {
        result.decision = SizingDecision::InvalidInput;
        result.reason = fmt::format("invalid sizing input: equity={} stop={} pip_value={}",
                                    equity, stop_pips, pip_value_per_lot);
        return result;
    }

    const double risk = effective_risk(tier, level);
    const double raw = raw_lots(equity, risk, stop_pips, pip_value_per_lot, tier.max_lot);

    // Floor to the broker's lot step; the epsilon absorbs binary rounding (0.05 / 0.01)
    double lots = 0.0;
    if (config_.lot_step > 0.0) {
        lots = std::floor(raw / config_.lot_step + 1e-9) * config_.lot_step;
    } else {
        lots = raw;
    }
    lots = std::min(lots, tier.max_lot);

    if (lots < config_.min_lot - 1e-12 || lots <= 0.0) {
        result.decision = SizingDecision::Untradeable;
        result.lots = 0.0;
        result.reason = fmt::format("size {:.4f} lots below minimum {:.2f} ({} tier, {:.1f} pip stop)",
                                    raw, config_.min_lot, tier.label, stop_pips);
        return result;
    }

    result.decision = SizingDecision::Approved;
    result.lots = lots;
    result.risk_amount = lots * stop_pips * pip_value_per_lot;
    result.reason = fmt::format("{:.2f} lots, {} tier at {:.2f}% risk", lots, tier.label,
                                risk * 100.0);
    return result;
}

SizingResult PositionSizer::check_spread(double spread_pips, std::optional<double> average_pips,
                                         double max_spread_pips) const {
    SizingResult result;
    if (!std::isfinite(spread_pips) || spread_pips < 0.0) {
        result.decision = SizingDecision::InvalidInput;
        result.reason = "invalid spread";
        return result;
    }
    if (max_spread_pips > 0.0 && spread_pips > max_spread_pips) {
        result.decision = SizingDecision::SpreadTooWide;
        result.reason = fmt::format("spread {:.2f} pips above strategy limit {:.2f}",
                                    spread_pips, max_spread_pips);
        return result;
    }
    if (average_pips && *average_pips > 0.0 &&
        spread_pips > *average_pips * config_.max_spread_multiplier) {
        result.decision = SizingDecision::SpreadTooWide;
        result.reason = fmt::format("spread {:.2f} pips above {:.1f}x average {:.2f}", spread_pips,
                                    config_.max_spread_multiplier, *average_pips);
        return result;
    }
    result.decision = SizingDecision::Approved;
    result.reason = "spread ok";
    return result;
}

// ============================================================================
// Stop Distance
// ============================================================================

namespace {

std::optional<double> atr_stop(const strategy::StopLossSpec& spec, std::span<const Bar> bars,
                               const InstrumentSpec& instrument) {
    indicators::ATR atr(spec.atr_period);
    for (const auto& bar : bars.last(std::min(bars.size(), spec.atr_period * 3 + 1))) {
        atr.update(bar);
    }
    if (!atr.is_ready()) return std::nullopt;
    return atr.value() * spec.atr_multiplier / instrument.pip_size;
}

}  // namespace

std::optional<double> stop_distance_pips(const strategy::StopLossSpec& spec,
                                         std::span<const Bar> bars,
                                         const InstrumentSpec& instrument, double entry_price,
                                         double structure_level) {
    if (!(instrument.pip_size > 0.0)) return std::nullopt;

    std::optional<double> pips;
    switch (spec.method) {
        case strategy::StopLossMethod::Fixed:
            pips = spec.fixed_pips;
            break;
        case strategy::StopLossMethod::Atr:
            pips = atr_stop(spec, bars, instrument);
            break;
        case strategy::StopLossMethod::Structure:
            if (structure_level > 0.0 && std::isfinite(entry_price)) {
                pips = std::abs(entry_price - structure_level) / instrument.pip_size +
                       spec.structure_buffer_pips;
            } else {
                pips = atr_stop(spec, bars, instrument);
            }
            break;
    }

    if (!pips || !std::isfinite(*pips) || *pips <= 0.0) return std::nullopt;
    return pips;
}

}  // namespace meridian::risk
