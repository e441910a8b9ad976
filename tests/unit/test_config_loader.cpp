// ============================================================================
// MERIDIAN - Config Loader Unit Tests
// ============================================================================

#include "meridian/config/config.hpp"
#include "meridian/core/errors.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace meridian;
using namespace meridian::config;

TEST(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
    const auto config = load_config_from_string("{}");

    EXPECT_EQ(config.instruments().size(), 12u);
    EXPECT_EQ(config.catalog.size(), 10u);
    EXPECT_EQ(config.tiers.size(), 5u);
    EXPECT_FALSE(config.risk_level.has_value());
    EXPECT_DOUBLE_EQ(config.ledger.max_drawdown, 0.15);
    EXPECT_EQ(config.lifecycle.position_aging, std::chrono::minutes(120));
    EXPECT_EQ(config.correlation.groups.size(), risk::CorrelationConfig::default_groups().size());
    EXPECT_DOUBLE_EQ(config.selector.min_confidence, 0.6);
}

TEST(ConfigLoaderTest, RiskManagementOverrides) {
    const auto config = load_config_from_string(R"(
risk_management:
  max_drawdown_percent: 0.2
  drawdown_hysteresis: 0.05
  risk_level: Medium
  position_aging_hours: 4
  re_evaluation_interval_minutes: 15
  max_correlation_exposure: 3
  lot_step: 0.1
  take_profit:
    trailing:
      enabled: false
      trail_distance_pips: 35
)");

    EXPECT_DOUBLE_EQ(config.ledger.max_drawdown, 0.2);
    EXPECT_DOUBLE_EQ(config.ledger.drawdown_hysteresis, 0.05);
    EXPECT_EQ(config.risk_level, risk::RiskLevel::Medium);
    EXPECT_EQ(config.lifecycle.position_aging, std::chrono::hours(4));
    EXPECT_EQ(config.lifecycle.re_evaluation_interval, std::chrono::minutes(15));
    EXPECT_EQ(config.correlation.max_correlated_exposure, 3u);
    EXPECT_DOUBLE_EQ(config.lifecycle.lot_step, 0.1);
    EXPECT_FALSE(config.lifecycle.trailing_enabled);
    EXPECT_DOUBLE_EQ(config.lifecycle.trail_distance_pips, 35.0);
}

TEST(ConfigLoaderTest, AccountTiersReplaceDefaults) {
    const auto config = load_config_from_string(R"(
risk_management:
  account_tiers:
    small: { min_balance: 0, max_balance: 1000, max_lot: 0.1, risk_percent: 0.02, max_trades: 2 }
    large: { min_balance: 1000, max_lot: 2.0, risk_percent: 0.01, max_trades: 8 }
)");

    ASSERT_EQ(config.tiers.size(), 2u);
    const risk::AccountTierTable table(config.tiers);
    EXPECT_EQ(table.tier_for(500.0).label, "small");
    EXPECT_EQ(table.tier_for(5000.0).label, "large");
    EXPECT_EQ(table.tier_for(5000.0).max_trades, 8u);
}

TEST(ConfigLoaderTest, InvalidValuesRejected) {
    EXPECT_THROW(load_config_from_string("risk_management: { max_daily_risk: 1.5 }"), ConfigError);
    EXPECT_THROW(load_config_from_string("risk_management: { max_drawdown_percent: abc }"),
                 ConfigError);
    EXPECT_THROW(load_config_from_string("risk_management: { risk_level: extreme }"), ConfigError);
    EXPECT_THROW(load_config_from_string("executor: { retry_attempts: 0 }"), ConfigError);
    EXPECT_THROW(load_config_from_string(
                     "market_condition_detector: { volatility_categories: { low: 0.9, medium: 0.5 } }"),
                 ConfigError);
    EXPECT_THROW(load_config_from_string("correlation: { high_correlation_threshold: 1.5 }"),
                 ConfigError);
}

TEST(ConfigLoaderTest, TierGapRejected) {
    EXPECT_THROW(load_config_from_string(R"(
risk_management:
  account_tiers:
    a: { min_balance: 0, max_balance: 100 }
    b: { min_balance: 200 }
)"),
                 ConfigError);
}

TEST(ConfigLoaderTest, MalformedYamlRejected) {
    EXPECT_THROW(load_config_from_string("engine: [1, 2"), ConfigError);
}

TEST(ConfigLoaderTest, MissingFileRejected) {
    EXPECT_THROW(load_config("/nonexistent/meridian.yaml"), ConfigError);
}

// ============================================================================
// Instruments
// ============================================================================

TEST(ConfigLoaderTest, InstrumentsParsed) {
    const auto config = load_config_from_string(R"(
trading:
  instruments:
    - { symbol: "EURUSD", pip_size: 0.0001, pip_value_per_lot: 10, start_price: 1.1 }
    - { symbol: "Step Index", category: synthetic, pip_size: 0.1, pip_value_per_lot: 1, start_price: 8000 }
)");

    const auto specs = config.instruments();
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_EQ(specs[0].symbol, Symbol("EURUSD"));
    EXPECT_EQ(specs[0].category, InstrumentCategory::Forex);
    EXPECT_EQ(specs[1].category, InstrumentCategory::Synthetic);
    EXPECT_DOUBLE_EQ(specs[1].pip_size, 0.1);
    EXPECT_DOUBLE_EQ(config.paper.instruments[1].start_price, 8000.0);
}

TEST(ConfigLoaderTest, BadInstrumentsRejected) {
    EXPECT_THROW(load_config_from_string(R"(
trading:
  instruments:
    - { symbol: "EURUSD", start_price: 1.1 }
    - { symbol: "EURUSD", start_price: 1.1 }
)"),
                 ConfigError);
    EXPECT_THROW(load_config_from_string(
                     "trading: { instruments: [ { symbol: X, category: crypto, start_price: 1 } ] }"),
                 ConfigError);
    EXPECT_THROW(load_config_from_string(
                     "trading: { instruments: [ { symbol: X, pip_size: 0, start_price: 1 } ] }"),
                 ConfigError);
    EXPECT_THROW(load_config_from_string("trading: { instruments: [ { pip_size: 0.1 } ] }"),
                 ConfigError);
    EXPECT_THROW(load_config_from_string("trading: { instruments: [] }"), ConfigError);
}

// ============================================================================
// Strategies
// ============================================================================

TEST(ConfigLoaderTest, StrategiesSectionReplacesCatalog) {
    const auto config = load_config_from_string(R"(
strategies:
  moving_average_cross:
    fast_ma_period: 3
    slow_ma_period: 12
    ma_type: sma
    stop_loss_pips: 7
  stochastic_cross:
    enabled: false
)");

    ASSERT_EQ(config.catalog.size(), 2u);
    const auto* cross = config.catalog.find("moving_average_cross");
    ASSERT_NE(cross, nullptr);
    const auto& params = std::get<strategy::MovingAverageCrossParams>(cross->params());
    EXPECT_EQ(params.fast_period, 3u);
    EXPECT_EQ(params.slow_period, 12u);
    EXPECT_FALSE(params.use_ema);
    EXPECT_EQ(cross->risk().stop_loss.method, strategy::StopLossMethod::Fixed);
    EXPECT_DOUBLE_EQ(cross->risk().stop_loss.fixed_pips, 7.0);

    EXPECT_FALSE(config.catalog.find("stochastic_cross")->enabled());
}

TEST(ConfigLoaderTest, CustomStrategyNeedsKind) {
    EXPECT_THROW(load_config_from_string("strategies: { my_scalper: { fast_ma_period: 3 } }"),
                 ConfigError);

    const auto config = load_config_from_string(R"(
risk_management:
  stop_loss: { default_strategy: fixed, fixed_sl_pips: 12 }
strategies:
  my_scalper: { kind: stochastic_cross, k_period: 9 }
)");
    const auto* s = config.catalog.find("my_scalper");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->kind(), "stochastic_cross");
    EXPECT_EQ(std::get<strategy::StochasticCrossParams>(s->params()).k_period, 9u);
    EXPECT_EQ(s->risk().stop_loss.method, strategy::StopLossMethod::Fixed);
    EXPECT_DOUBLE_EQ(s->risk().stop_loss.fixed_pips, 12.0);
}

TEST(ConfigLoaderTest, InvalidStrategyParametersRejected) {
    EXPECT_THROW(load_config_from_string(
                     "strategies: { moving_average_cross: { fast_ma_period: 30, slow_ma_period: 10 } }"),
                 ConfigError);
    EXPECT_THROW(load_config_from_string(
                     "strategies: { moving_average_cross: { stop_loss_method: magic } }"),
                 ConfigError);
}

TEST(ConfigLoaderTest, SelectorWeightsMustNameStrategies) {
    const auto config = load_config_from_string(R"(
strategy_selector:
  min_score: 2.5
  strategy_weights:
    break_and_retest: { ranging_market: 10, bullish_market: 1 }
)");
    EXPECT_DOUBLE_EQ(config.selector.min_score, 2.5);
    const auto& w = config.catalog.find("break_and_retest")->weights();
    EXPECT_DOUBLE_EQ(w.ranging, 10.0);
    EXPECT_DOUBLE_EQ(w.bullish, 1.0);

    EXPECT_THROW(load_config_from_string(
                     "strategy_selector: { strategy_weights: { martingale: { ranging_market: 5 } } }"),
                 ConfigError);
}

TEST(ConfigLoaderTest, ClassifierSettingsFeedSelector) {
    const auto config = load_config_from_string(R"(
market_condition_detector:
  min_trading_confidence: 0.7
  cache_expiry_seconds: 60
  condition_weighting: { trend: 1, volatility: 1, liquidity: 1, price_action: 1 }
)");
    EXPECT_EQ(config.classifier.cache_expiry, std::chrono::seconds(60));
    EXPECT_DOUBLE_EQ(config.selector.min_confidence, 0.7);
    EXPECT_DOUBLE_EQ(config.selector.axis_weights.trend, 1.0);
}

TEST(ConfigLoaderTest, LoggingSection) {
    const auto config = load_config_from_string(R"(
logging: { level: debug, file: "", async: true, queue_size: 1024 }
)");
    EXPECT_EQ(config.logging.level, utils::LogLevel::Debug);
    EXPECT_TRUE(config.logging.log_file.empty());
    EXPECT_TRUE(config.logging.async);
    EXPECT_EQ(config.logging.queue_size, 1024u);
}

// ============================================================================
// Shipped File
// ============================================================================

TEST(ConfigLoaderTest, ShippedConfigLoads) {
    const auto config = load_config(std::string(MERIDIAN_CONFIG_DIR) + "/meridian.yaml");

    EXPECT_EQ(config.instruments().size(), 12u);
    EXPECT_EQ(config.catalog.size(), 10u);
    EXPECT_DOUBLE_EQ(config.paper.timeout_probability, 0.02);

    const auto* cross = config.catalog.find("moving_average_cross");
    ASSERT_NE(cross, nullptr);
    EXPECT_DOUBLE_EQ(cross->risk().stop_loss.fixed_pips, 5.0);
    EXPECT_DOUBLE_EQ(cross->weights().trending, 8.0);

    const auto* jhook = config.catalog.find("jhook_strategy");
    ASSERT_NE(jhook, nullptr);
    EXPECT_DOUBLE_EQ(jhook->risk().risk_reward_ratio, 2.2);
    EXPECT_DOUBLE_EQ(std::get<strategy::JHookParams>(jhook->params()).reversal_pips, 8.0);
}
