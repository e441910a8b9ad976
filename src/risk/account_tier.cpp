// ============================================================================
// MERIDIAN - Account Tiers Implementation
// ============================================================================

#include "meridian/risk/account_tier.hpp"

#include "meridian/core/errors.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cmath>
#include <utility>

namespace meridian::risk {

std::optional<RiskLevel> parse_risk_level(std::string_view name) noexcept {
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "low") return RiskLevel::Low;
    if (lower == "medium") return RiskLevel::Medium;
    if (lower == "high") return RiskLevel::High;
    return std::nullopt;
}

AccountTierTable::AccountTierTable(std::vector<AccountTier> tiers) : tiers_(std::move(tiers)) {
    if (tiers_.empty()) {
        throw ConfigError("account_tiers: at least one tier required");
    }
    if (tiers_.front().min_balance != 0.0) {
        throw ConfigError(fmt::format("account_tiers.{}: first tier must start at 0",
                                      tiers_.front().label));
    }
    for (size_t i = 0; i < tiers_.size(); ++i) {
        const auto& t = tiers_[i];
        if (!(t.max_balance > t.min_balance)) {
            throw ConfigError(fmt::format("account_tiers.{}: empty balance range", t.label));
        }
        if (!(t.max_lot > 0.0) || !std::isfinite(t.max_lot)) {
            throw ConfigError(fmt::format("account_tiers.{}: max_lot must be > 0", t.label));
        }
        if (!(t.risk_percent > 0.0 && t.risk_percent < 1.0)) {
            throw ConfigError(fmt::format("account_tiers.{}: risk_percent out of (0, 1)", t.label));
        }
        if (t.max_trades == 0) {
            throw ConfigError(fmt::format("account_tiers.{}: max_trades must be >= 1", t.label));
        }
        if (i + 1 < tiers_.size()) {
            if (tiers_[i + 1].min_balance != t.max_balance) {
                throw ConfigError(fmt::format("account_tiers.{}: gap or overlap with {}",
                                              t.label, tiers_[i + 1].label));
            }
        } else if (!std::isinf(t.max_balance)) {
            throw ConfigError(fmt::format("account_tiers.{}: last tier must be unbounded",
                                          t.label));
        }
    }
}

const AccountTier& AccountTierTable::tier_for(double equity) const noexcept {
    if (!(equity >= 0.0)) return tiers_.front();
    for (const auto& t : tiers_) {
        if (t.contains(equity)) return t;
    }
    return tiers_.back();
}

AccountTierTable AccountTierTable::defaults() {
    constexpr double inf = std::numeric_limits<double>::infinity();
    return AccountTierTable({
        {"nano", 0.0, 100.0, 0.01, 0.01, 1},
        {"micro", 100.0, 500.0, 0.01, 0.02, 3},
        {"mini", 500.0, 2000.0, 0.05, 0.015, 5},
        {"standard", 2000.0, 10000.0, 0.2, 0.01, 7},
        {"professional", 10000.0, inf, 1.0, 0.005, 10},
    });
}

}  // namespace meridian::risk
