#pragma once
// ============================================================================
// MERIDIAN - Strategy Catalog
// ============================================================================
// Ordered registry of named strategies. Built once at startup and shared
// read-only; declaration order is the selector's tie-break
// ============================================================================

#include "meridian/strategy/strategy.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace meridian::strategy {

class StrategyCatalog {
public:
    StrategyCatalog() = default;

    /// Validates and appends. Throws ConfigError on invalid or duplicate names
    void add(Strategy strategy);

    [[nodiscard]] const Strategy* find(std::string_view name) const noexcept;

    [[nodiscard]] const std::vector<Strategy>& strategies() const { return strategies_; }
    [[nodiscard]] size_t size() const noexcept { return strategies_.size(); }
    [[nodiscard]] bool empty() const noexcept { return strategies_.empty(); }

    auto begin() const { return strategies_.begin(); }
    auto end() const { return strategies_.end(); }

    /// Largest warm-up among enabled strategies
    [[nodiscard]] size_t max_min_bars() const;

    /// The shipped set of ten strategies with their regime tables
    [[nodiscard]] static StrategyCatalog with_defaults();

private:
    std::vector<Strategy> strategies_;
};

using CatalogPtr = std::shared_ptr<const StrategyCatalog>;

}  // namespace meridian::strategy
