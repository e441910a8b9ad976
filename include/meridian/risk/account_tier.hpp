#pragma once
// ============================================================================
// MERIDIAN - Account Tiers
// ============================================================================
// Balance-range buckets selecting lot cap, per-trade risk and trade count.
// Intervals are half-open [min, max); the last tier is unbounded
// ============================================================================

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::risk {

struct AccountTier {
    std::string label;
    double min_balance = 0.0;
    double max_balance = std::numeric_limits<double>::infinity();
    double max_lot = 0.01;
    double risk_percent = 0.01;   // Fraction of equity risked per trade
    size_t max_trades = 1;        // Concurrent trades per instrument

    [[nodiscard]] bool contains(double equity) const noexcept {
        return equity >= min_balance && equity < max_balance;
    }
};

/// Operator-selected cap on the per-trade risk fraction
enum class RiskLevel : uint8_t { Low, Medium, High };

[[nodiscard]] constexpr double risk_cap(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Low: return 0.01;
        case RiskLevel::Medium: return 0.02;
        case RiskLevel::High: return 0.05;
    }
    return 0.01;
}

[[nodiscard]] constexpr std::string_view to_string(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
    }
    return "low";
}

[[nodiscard]] std::optional<RiskLevel> parse_risk_level(std::string_view name) noexcept;

class AccountTierTable {
public:
    /// Throws ConfigError unless the tiers partition [0, +inf) in order
    explicit AccountTierTable(std::vector<AccountTier> tiers);

    /// Tier containing the equity. Negative or NaN equity maps to the first tier
    [[nodiscard]] const AccountTier& tier_for(double equity) const noexcept;

    [[nodiscard]] const std::vector<AccountTier>& tiers() const { return tiers_; }

    /// nano / micro / mini / standard / professional
    [[nodiscard]] static AccountTierTable defaults();

private:
    std::vector<AccountTier> tiers_;
};

}  // namespace meridian::risk
