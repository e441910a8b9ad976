#pragma once
// ============================================================================
// MERIDIAN - Application Configuration
// ============================================================================
// Aggregate of every module's configuration, loaded once at startup from
// YAML. Missing keys keep their defaults; invalid values throw ConfigError
// ============================================================================

#include "meridian/engine/orchestration_loop.hpp"
#include "meridian/execution/paper_broker.hpp"
#include "meridian/market/condition_classifier.hpp"
#include "meridian/order/trade_lifecycle_manager.hpp"
#include "meridian/risk/account_tier.hpp"
#include "meridian/risk/correlation_manager.hpp"
#include "meridian/risk/position_sizer.hpp"
#include "meridian/risk/risk_ledger.hpp"
#include "meridian/strategy/strategy_catalog.hpp"
#include "meridian/strategy/strategy_selector.hpp"
#include "meridian/utils/logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace meridian::config {

struct AppConfig {
    utils::LogConfig logging;

    // Instruments with their simulated feed parameters
    execution::PaperBrokerConfig paper;

    market::ClassifierConfig classifier;
    strategy::SelectorConfig selector;
    strategy::StrategyCatalog catalog;

    std::vector<risk::AccountTier> tiers;
    risk::LedgerConfig ledger;
    risk::SizingConfig sizing;
    risk::CorrelationConfig correlation;
    std::optional<risk::RiskLevel> risk_level;

    order::LifecycleConfig lifecycle;
    engine::EngineConfig engine;

    [[nodiscard]] std::vector<InstrumentSpec> instruments() const;
};

/// Shipped defaults: seven forex pairs and five synthetic indices
[[nodiscard]] AppConfig default_config();

/// Parse a YAML file. Throws ConfigError naming the offending key
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Parse YAML text (tests, embedded configs)
[[nodiscard]] AppConfig load_config_from_string(const std::string& yaml);

/// Cross-field checks shared by both loaders
void validate(const AppConfig& config);

}  // namespace meridian::config
