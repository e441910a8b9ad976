#pragma once
// ============================================================================
// MERIDIAN - Position Sizer
// ============================================================================
// Equity, tier and stop distance -> lot size, plus the spread gate
// size = equity * risk / (stop_pips * pip_value_per_lot), clamped to the tier
// ============================================================================

#include "meridian/core/types.hpp"
#include "meridian/risk/account_tier.hpp"
#include "meridian/strategy/strategy.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace meridian::risk {

struct SizingConfig {
    double max_spread_multiplier = 1.5;  // Reject when spread > average * multiplier
    double lot_step = 0.01;
    double min_lot = 0.01;
};

enum class SizingDecision : uint8_t {
    Approved,
    Untradeable,    // Rounds below the minimum lot
    SpreadTooWide,
    InvalidInput    // Non-finite or non-positive equity / stop / pip value
};

[[nodiscard]] constexpr std::string_view to_string(SizingDecision d) noexcept {
    switch (d) {
        case SizingDecision::Approved: return "approved";
        case SizingDecision::Untradeable: return "untradeable";
        case SizingDecision::SpreadTooWide: return "spread_too_wide";
        case SizingDecision::InvalidInput: return "invalid_input";
    }
    return "unknown";
}

struct SizingResult {
    SizingDecision decision = SizingDecision::InvalidInput;
    double lots = 0.0;
    double risk_amount = 0.0;  // Account currency lost if the stop is hit
    double stop_pips = 0.0;
    std::string reason;

    [[nodiscard]] bool approved() const noexcept { return decision == SizingDecision::Approved; }
};

class PositionSizer {
public:
    explicit PositionSizer(const SizingConfig& config = SizingConfig{});

    /// Unrounded lot size clamped to [0, tier.max_lot]. Never negative or NaN
    [[nodiscard]] static double raw_lots(double equity, double risk_fraction,
                                         double stop_pips, double pip_value_per_lot,
                                         double max_lot) noexcept;

    /// Per-trade risk fraction after the operator's risk level cap
    [[nodiscard]] static double effective_risk(const AccountTier& tier,
                                               std::optional<RiskLevel> level) noexcept;

    [[nodiscard]] SizingResult size(double equity, const AccountTier& tier, double stop_pips,
                                    double pip_value_per_lot,
                                    std::optional<RiskLevel> level = std::nullopt) const;

    /// Spread gate against the running average and the strategy's own limit
    [[nodiscard]] SizingResult check_spread(double spread_pips, std::optional<double> average_pips,
                                            double max_spread_pips) const;

    [[nodiscard]] const SizingConfig& config() const { return config_; }

private:
    SizingConfig config_;
};

// ============================================================================
// Stop Distance
// ============================================================================

/// Stop distance in pips for the strategy's stop-loss method.
/// Structure stops fall back to ATR when the signal carries no level
[[nodiscard]] std::optional<double> stop_distance_pips(const strategy::StopLossSpec& spec,
                                                       std::span<const Bar> bars,
                                                       const InstrumentSpec& instrument,
                                                       double entry_price,
                                                       double structure_level = 0.0);

}  // namespace meridian::risk
