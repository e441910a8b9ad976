// ============================================================================
// MERIDIAN - Configuration Loader
// ============================================================================

#include "meridian/config/config.hpp"

#include "meridian/core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <utility>

namespace meridian::config {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

execution::PaperInstrument forex(std::string_view symbol, double price, double pip_size,
                                 double pip_value, double spread) {
    execution::PaperInstrument i;
    i.spec = InstrumentSpec{Symbol{symbol}, InstrumentCategory::Forex, pip_size, pip_value};
    i.start_price = price;
    i.volatility_pips = 4.0;
    i.spread_pips = spread;
    i.volume = 1000.0;
    return i;
}

execution::PaperInstrument synthetic(std::string_view symbol, double price, double pip_size,
                                     double volatility_pips) {
    execution::PaperInstrument i;
    i.spec = InstrumentSpec{Symbol{symbol}, InstrumentCategory::Synthetic, pip_size, 1.0};
    i.start_price = price;
    i.volatility_pips = volatility_pips;
    i.spread_pips = 5.0;
    i.volume = 500.0;
    return i;
}

// ============================================================================
// Parameter Readers
// ============================================================================

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    if (!node[key]) return;
    try {
        out = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("{}: {}", key, e.what()));
    }
}

template <typename Rep, typename Period>
void read_duration(const YAML::Node& node, const char* key,
                   std::chrono::duration<Rep, Period>& out) {
    Rep count = out.count();
    read(node, key, count);
    out = std::chrono::duration<Rep, Period>(count);
}

std::optional<strategy::StrategyParams> params_for_kind(std::string_view kind) {
    if (kind == "moving_average_cross") return strategy::MovingAverageCrossParams{};
    if (kind == "bollinger_breakout") return strategy::BollingerBreakoutParams{};
    if (kind == "break_and_retest") return strategy::BreakAndRetestParams{};
    if (kind == "break_of_structure") return strategy::BreakOfStructureParams{};
    if (kind == "fair_value_gap") return strategy::FairValueGapParams{};
    if (kind == "jhook") return strategy::JHookParams{};
    if (kind == "ma_rsi_combo") return strategy::MaRsiComboParams{};
    if (kind == "stochastic_cross") return strategy::StochasticCrossParams{};
    return std::nullopt;
}

void read_params(const YAML::Node& n, strategy::StrategyParams& params) {
    std::visit(overloaded{
        [&](strategy::MovingAverageCrossParams& p) {
            read(n, "fast_ma_period", p.fast_period);
            read(n, "slow_ma_period", p.slow_period);
            if (n["ma_type"]) p.use_ema = n["ma_type"].as<std::string>(std::string("ema")) != "sma";
            read(n, "use_confirmation", p.use_confirmation);
        },
        [&](strategy::BollingerBreakoutParams& p) {
            read(n, "bb_period", p.bb_period);
            read(n, "bb_std", p.bb_std);
            read(n, "rsi_period", p.rsi_period);
            read(n, "rsi_overbought", p.rsi_overbought);
            read(n, "rsi_oversold", p.rsi_oversold);
            read(n, "use_rsi_filter", p.use_rsi_filter);
        },
        [&](strategy::BreakAndRetestParams& p) {
            read(n, "sr_lookback_periods", p.lookback);
            read(n, "lookback_periods", p.lookback);
            read(n, "confirmation_candles", p.confirmation_bars);
            read(n, "confirmation_bars", p.confirmation_bars);
            read(n, "min_breakout_pips", p.min_breakout_pips);
            read(n, "retest_max_pips", p.retest_max_pips);
            read(n, "max_retest_bars", p.max_retest_bars);
            read(n, "volume_confirmation", p.volume_confirmation);
            read(n, "min_volume_increase", p.volume_threshold);
            read(n, "volume_threshold", p.volume_threshold);
        },
        [&](strategy::BreakOfStructureParams& p) {
            read(n, "lookback_periods", p.lookback);
            read(n, "min_swing_size_pips", p.min_swing_pips);
            read(n, "use_trend_filter", p.use_trend_filter);
            read(n, "trend_ema_period", p.trend_ema_period);
            read(n, "volume_filter", p.volume_filter);
            read(n, "volume_threshold", p.volume_threshold);
        },
        [&](strategy::FairValueGapParams& p) {
            read(n, "min_gap_size_pips", p.min_gap_pips);
            read(n, "max_gap_size_pips", p.max_gap_pips);
            read(n, "gap_validity_periods", p.gap_validity_bars);
            read(n, "mitigation_threshold", p.mitigation_threshold);
            read(n, "use_trend_filter", p.use_trend_filter);
            read(n, "trend_ema_period", p.trend_ema_period);
        },
        [&](strategy::JHookParams& p) {
            read(n, "lookback_period", p.lookback);
            read(n, "trend_strength", p.trend_pips);
            read(n, "reversal_strength", p.reversal_pips);
            read(n, "consolidation_bars", p.consolidation_min);
            read(n, "consolidation_bars_min", p.consolidation_min);
            read(n, "consolidation_bars_max", p.consolidation_max);
            read(n, "fib_retracement_min", p.fib_min);
            read(n, "fib_retracement_max", p.fib_max);
        },
        [&](strategy::MaRsiComboParams& p) {
            read(n, "ema_period", p.ema_period);
            read(n, "rsi_period", p.rsi_period);
            read(n, "rsi_overbought", p.rsi_overbought);
            read(n, "rsi_oversold", p.rsi_oversold);
        },
        [&](strategy::StochasticCrossParams& p) {
            read(n, "k_period", p.k_period);
            read(n, "d_period", p.d_period);
            read(n, "slowing", p.slowing);
            read(n, "overbought", p.overbought);
            read(n, "oversold", p.oversold);
            read(n, "trend_filter", p.trend_filter);
            read(n, "trend_ema_period", p.trend_ema_period);
        },
    }, params);
}

strategy::StopLossMethod parse_stop_method(const std::string& name, const std::string& where) {
    if (name == "fixed") return strategy::StopLossMethod::Fixed;
    if (name == "atr") return strategy::StopLossMethod::Atr;
    if (name == "structure") return strategy::StopLossMethod::Structure;
    throw ConfigError(fmt::format("{}: unknown stop-loss method '{}'", where, name));
}

strategy::TakeProfitMethod parse_tp_method(const std::string& name, const std::string& where) {
    if (name == "fixed") return strategy::TakeProfitMethod::Fixed;
    if (name == "multiple") return strategy::TakeProfitMethod::Multiple;
    throw ConfigError(fmt::format("{}: unknown take-profit method '{}'", where, name));
}

void read_risk_defaults(const YAML::Node& rm, strategy::RiskParams& risk) {
    if (const auto sl = rm["stop_loss"]) {
        if (sl["default_strategy"]) {
            risk.stop_loss.method = parse_stop_method(sl["default_strategy"].as<std::string>(),
                                                      "risk_management.stop_loss");
        }
        read(sl, "fixed_sl_pips", risk.stop_loss.fixed_pips);
        read(sl, "atr_multiplier", risk.stop_loss.atr_multiplier);
        read(sl, "structure_buffer_pips", risk.stop_loss.structure_buffer_pips);
    }
    if (const auto tp = rm["take_profit"]) {
        if (tp["default_strategy"]) {
            risk.take_profit.method = parse_tp_method(tp["default_strategy"].as<std::string>(),
                                                      "risk_management.take_profit");
        }
        read(tp, "risk_reward_ratio", risk.risk_reward_ratio);
        if (const auto multiple = tp["multiple"]) {
            read(multiple, "tp1_ratio", risk.take_profit.tp1_ratio);
            read(multiple, "tp1_size", risk.take_profit.tp1_size);
        }
    }
}

void read_risk(const YAML::Node& n, strategy::RiskParams& risk, const std::string& where) {
    if (n["stop_loss_method"]) {
        risk.stop_loss.method = parse_stop_method(n["stop_loss_method"].as<std::string>(), where);
    }
    if (n["stop_loss_pips"]) {
        risk.stop_loss.method = strategy::StopLossMethod::Fixed;
        read(n, "stop_loss_pips", risk.stop_loss.fixed_pips);
    }
    read(n, "atr_period", risk.stop_loss.atr_period);
    read(n, "atr_multiplier", risk.stop_loss.atr_multiplier);
    read(n, "structure_buffer_pips", risk.stop_loss.structure_buffer_pips);
    if (n["take_profit_method"]) {
        risk.take_profit.method = parse_tp_method(n["take_profit_method"].as<std::string>(), where);
    }
    read(n, "tp1_ratio", risk.take_profit.tp1_ratio);
    read(n, "tp1_size", risk.take_profit.tp1_size);
    read(n, "risk_reward_ratio", risk.risk_reward_ratio);
    read(n, "max_spread_pips", risk.max_spread_pips);
}

void read_weights(const YAML::Node& n, strategy::RegimeWeights& w) {
    read(n, "ranging_market", w.ranging);
    read(n, "trending_market", w.trending);
    read(n, "high_volatility", w.high_volatility);
    read(n, "low_volatility", w.low_volatility);
    read(n, "high_liquidity", w.high_liquidity);
    read(n, "low_liquidity", w.low_liquidity);
    read(n, "bullish_market", w.bullish);
    read(n, "bearish_market", w.bearish);
}

std::string kind_for(const std::string& name, const YAML::Node& node) {
    if (node["kind"]) return node["kind"].as<std::string>();
    if (name == "bnr_strategy") return "break_and_retest";
    if (name == "jhook_pattern" || name == "jhook_strategy") return "jhook";
    return name;
}

// ============================================================================
// Sections
// ============================================================================

void load_logging(const YAML::Node& n, utils::LogConfig& log) {
    if (n["level"]) log.level = utils::parse_log_level(n["level"].as<std::string>());
    read(n, "file", log.log_file);
    read(n, "pattern", log.pattern);
    read(n, "console", log.console);
    read(n, "async", log.async);
    read(n, "queue_size", log.queue_size);
    read(n, "flush_interval_ms", log.flush_interval_ms);
    read(n, "max_file_size_mb", log.max_file_size_mb);
    read(n, "max_files", log.max_files);
}

void load_instruments(const YAML::Node& n, std::vector<execution::PaperInstrument>& out) {
    std::vector<execution::PaperInstrument> parsed;
    for (const auto& item : n) {
        if (!item["symbol"]) throw ConfigError("trading.instruments: entry without symbol");
        const auto name = item["symbol"].as<std::string>();
        if (name.empty() || name.size() > Symbol::MAX_LENGTH) {
            throw ConfigError(fmt::format("trading.instruments: invalid symbol '{}'", name));
        }

        execution::PaperInstrument inst;
        inst.spec.symbol = Symbol{name};
        const auto category = item["category"].as<std::string>(std::string("forex"));
        if (category == "forex") {
            inst.spec.category = InstrumentCategory::Forex;
        } else if (category == "synthetic") {
            inst.spec.category = InstrumentCategory::Synthetic;
        } else {
            throw ConfigError(fmt::format("trading.instruments.{}: unknown category '{}'", name,
                                          category));
        }
        read(item, "pip_size", inst.spec.pip_size);
        read(item, "pip_value_per_lot", inst.spec.pip_value_per_lot);
        read(item, "start_price", inst.start_price);
        read(item, "volatility_pips", inst.volatility_pips);
        read(item, "spread_pips", inst.spread_pips);
        read(item, "volume", inst.volume);

        if (!(inst.spec.pip_size > 0.0) || !(inst.spec.pip_value_per_lot > 0.0) ||
            !(inst.start_price > 0.0)) {
            throw ConfigError(fmt::format(
                "trading.instruments.{}: pip_size, pip_value_per_lot and start_price must be > 0",
                name));
        }
        const bool duplicate = std::any_of(parsed.begin(), parsed.end(), [&](const auto& p) {
            return p.spec.symbol == inst.spec.symbol;
        });
        if (duplicate) {
            throw ConfigError(fmt::format("trading.instruments: duplicate symbol '{}'", name));
        }
        parsed.push_back(std::move(inst));
    }
    out = std::move(parsed);
}

void load_risk_management(const YAML::Node& n, AppConfig& config,
                          strategy::RiskParams& risk_defaults) {
    read(n, "max_daily_risk", config.ledger.max_daily_risk);
    read(n, "daily_loss_limit", config.ledger.daily_loss_limit);
    read(n, "max_drawdown_percent", config.ledger.max_drawdown);
    read(n, "drawdown_hysteresis", config.ledger.drawdown_hysteresis);
    read(n, "max_spread_multiplier", config.sizing.max_spread_multiplier);
    read(n, "lot_step", config.sizing.lot_step);
    read(n, "min_lot", config.sizing.min_lot);
    config.lifecycle.lot_step = config.sizing.lot_step;

    if (n["max_correlation_exposure"]) {
        config.correlation.max_correlated_exposure = n["max_correlation_exposure"].as<size_t>();
    }
    if (n["risk_level"]) {
        const auto name = n["risk_level"].as<std::string>();
        config.risk_level = risk::parse_risk_level(name);
        if (!config.risk_level) {
            throw ConfigError(fmt::format("risk_management.risk_level: unknown level '{}'", name));
        }
    }

    int64_t aging_hours = 2;
    read(n, "position_aging_hours", aging_hours);
    config.lifecycle.position_aging = std::chrono::hours(aging_hours);
    read_duration(n, "re_evaluation_interval_minutes", config.lifecycle.re_evaluation_interval);

    if (const auto take_profit = n["take_profit"]) {
        if (const auto trailing = take_profit["trailing"]) {
            read(trailing, "enabled", config.lifecycle.trailing_enabled);
            read(trailing, "activation_ratio", config.lifecycle.trailing_activation_ratio);
            read(trailing, "trail_distance_pips", config.lifecycle.trail_distance_pips);
        }
    }

    read_risk_defaults(n, risk_defaults);

    if (const auto tiers = n["account_tiers"]) {
        std::vector<risk::AccountTier> parsed;
        double previous_max = 0.0;
        for (const auto& entry : tiers) {
            risk::AccountTier tier;
            tier.label = entry.first.as<std::string>();
            const auto& t = entry.second;
            tier.min_balance = t["min_balance"].as<double>(previous_max);
            tier.max_balance = t["max_balance"].as<double>(std::numeric_limits<double>::infinity());
            read(t, "max_lot", tier.max_lot);
            read(t, "risk_percent", tier.risk_percent);
            read(t, "max_trades", tier.max_trades);
            previous_max = tier.max_balance;
            parsed.push_back(std::move(tier));
        }
        std::sort(parsed.begin(), parsed.end(),
                  [](const auto& a, const auto& b) { return a.min_balance < b.min_balance; });
        config.tiers = std::move(parsed);
    }
}

void load_correlation(const YAML::Node& n, risk::CorrelationConfig& c) {
    read(n, "high_correlation_threshold", c.high_threshold);
    read(n, "medium_correlation_threshold", c.medium_threshold);
    read_duration(n, "correlation_update_hours", c.update_interval);
    read(n, "max_age_intervals", c.max_age_intervals);
    read(n, "min_samples", c.min_samples);
    read(n, "history_bars", c.history_bars);
    read(n, "max_correlated_exposure", c.max_correlated_exposure);
    read(n, "max_same_direction_exposure", c.max_same_direction_exposure);

    if (const auto groups = n["predefined_correlation_groups"]) {
        c.groups.clear();
        for (const auto& entry : groups) {
            risk::CorrelationGroup group;
            group.name = entry.first.as<std::string>();
            for (const auto& member : entry.second) {
                group.members.emplace_back(member.as<std::string>());
            }
            c.groups.push_back(std::move(group));
        }
    }
}

void load_classifier(const YAML::Node& n, market::ClassifierConfig& c) {
    read(n, "trend_lookback", c.trend_lookback);
    read(n, "volatility_window", c.volatility_window);
    read(n, "adx_period", c.adx_period);
    read(n, "adx_strong_level", c.adx_strong_level);
    read(n, "liquidity_threshold", c.liquidity_threshold);
    read(n, "trend_strength_threshold", c.trend_strength_threshold);
    read(n, "min_trading_confidence", c.min_trading_confidence);
    read_duration(n, "cache_expiry_seconds", c.cache_expiry);
    if (const auto v = n["volatility_categories"]) {
        read(v, "low", c.volatility_low);
        read(v, "medium", c.volatility_medium);
    }
    if (const auto w = n["condition_weighting"]) {
        read(w, "trend", c.weights.trend);
        read(w, "volatility", c.weights.volatility);
        read(w, "liquidity", c.weights.liquidity);
        read(w, "price_action", c.weights.price_action);
    }
}

strategy::StrategyCatalog load_strategies(const YAML::Node& strategies, const YAML::Node& weights,
                                          const strategy::RiskParams& risk_defaults) {
    const auto shipped = strategy::StrategyCatalog::with_defaults();
    strategy::StrategyCatalog catalog;

    for (const auto& entry : strategies) {
        const auto name = entry.first.as<std::string>();
        const auto& node = entry.second;
        const auto kind = kind_for(name, node);

        auto params = params_for_kind(kind);
        if (!params) {
            throw ConfigError(fmt::format("strategies.{}: unknown strategy kind '{}'", name, kind));
        }

        strategy::RegimeWeights regime;
        strategy::RiskParams risk = risk_defaults;
        if (const auto* base = shipped.find(name); base != nullptr && base->kind() == kind) {
            *params = base->params();
            regime = base->weights();
            risk = base->risk();
        }

        read_params(node, *params);
        read_risk(node, risk, "strategies." + name);
        if (weights[name]) {
            read_weights(weights[name], regime);
        }
        const bool enabled = node["enabled"].as<bool>(true);

        catalog.add(strategy::Strategy(name, std::move(*params), regime, risk, enabled));
    }

    // Weight tables must refer to configured strategies
    for (const auto& entry : weights) {
        const auto name = entry.first.as<std::string>();
        if (catalog.find(name) == nullptr) {
            throw ConfigError(fmt::format(
                "strategy_selector.strategy_weights.{}: no such strategy", name));
        }
    }
    return catalog;
}

AppConfig parse(const YAML::Node& root) {
    AppConfig config = default_config();

    if (const auto n = root["logging"]) load_logging(n, config.logging);
    if (const auto n = root["trading"]) {
        if (n["instruments"]) load_instruments(n["instruments"], config.paper.instruments);
    }

    strategy::RiskParams risk_defaults;
    if (const auto n = root["risk_management"]) load_risk_management(n, config, risk_defaults);
    if (const auto n = root["correlation"]) load_correlation(n, config.correlation);
    if (const auto n = root["market_condition_detector"]) load_classifier(n, config.classifier);

    // Selection uses the classifier's axis weights and confidence floor
    config.selector.axis_weights = config.classifier.weights;
    config.selector.min_confidence = config.classifier.min_trading_confidence;

    YAML::Node weights(YAML::NodeType::Map);
    if (const auto n = root["strategy_selector"]) {
        read(n, "min_score", config.selector.min_score);
        if (n["strategy_weights"]) weights = YAML::Clone(n["strategy_weights"]);
    }
    if (const auto n = root["strategies"]) {
        config.catalog = load_strategies(n, weights, risk_defaults);
    }

    if (const auto n = root["executor"]) {
        read(n, "retry_attempts", config.lifecycle.retry_attempts);
        read_duration(n, "retry_delay_ms", config.lifecycle.retry_delay);
        read_duration(n, "request_timeout_ms", config.lifecycle.request_timeout);
    }
    if (const auto n = root["paper_broker"]) {
        read(n, "initial_balance", config.paper.initial_balance);
        read_duration(n, "bar_interval_seconds", config.paper.bar_interval);
        read(n, "history_bars", config.paper.history_bars);
        read(n, "seed", config.paper.seed);
        read(n, "timeout_probability", config.paper.timeout_probability);
        read(n, "reject_probability", config.paper.reject_probability);
    }
    if (const auto n = root["engine"]) {
        read_duration(n, "cycle_interval_ms", config.engine.cycle_interval);
        read(n, "worker_threads", config.engine.worker_threads);
        read(n, "status_event_count", config.engine.status_event_count);
        read(n, "start_enabled", config.engine.start_enabled);
    }

    validate(config);
    return config;
}

void require(bool condition, const std::string& message) {
    if (!condition) throw ConfigError(message);
}

}  // namespace

// ============================================================================
// Public Interface
// ============================================================================

std::vector<InstrumentSpec> AppConfig::instruments() const {
    std::vector<InstrumentSpec> out;
    out.reserve(paper.instruments.size());
    for (const auto& i : paper.instruments) out.push_back(i.spec);
    return out;
}

AppConfig default_config() {
    AppConfig config;
    config.paper.instruments = {
        forex("EURUSD", 1.0850, 0.0001, 10.0, 1.0),
        forex("GBPUSD", 1.2700, 0.0001, 10.0, 1.2),
        forex("USDJPY", 150.00, 0.01, 6.7, 1.0),
        forex("AUDUSD", 0.6600, 0.0001, 10.0, 1.2),
        forex("USDCAD", 1.3600, 0.0001, 7.4, 1.5),
        forex("EURGBP", 0.8550, 0.0001, 12.7, 1.5),
        forex("EURJPY", 162.00, 0.01, 6.7, 1.8),
        synthetic("Volatility 75 Index", 500.0, 0.01, 150.0),
        synthetic("Volatility 100 Index", 1000.0, 0.01, 300.0),
        synthetic("Crash 1000 Index", 5000.0, 0.01, 200.0),
        synthetic("Boom 500 Index", 5000.0, 0.01, 200.0),
        synthetic("Step Index", 8000.0, 0.1, 10.0),
    };
    config.catalog = strategy::StrategyCatalog::with_defaults();
    config.tiers = risk::AccountTierTable::defaults().tiers();
    config.correlation.groups = risk::CorrelationConfig::default_groups();
    config.selector.axis_weights = config.classifier.weights;
    config.selector.min_confidence = config.classifier.min_trading_confidence;
    return config;
}

AppConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("{}: {}", path, e.what()));
    }
    return parse(root);
}

AppConfig load_config_from_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("invalid YAML: {}", e.what()));
    }
    return parse(root);
}

void validate(const AppConfig& config) {
    // Tier partition is checked by the table itself
    static_cast<void>(risk::AccountTierTable(config.tiers));

    const auto& w = config.classifier.weights;
    require(w.trend >= 0.0 && w.volatility >= 0.0 && w.liquidity >= 0.0 && w.price_action >= 0.0,
            "market_condition_detector.condition_weighting: weights must be >= 0");
    require(w.sum() > 0.0, "market_condition_detector.condition_weighting: weights sum to 0");
    require(config.classifier.trend_lookback > 0 && config.classifier.volatility_window > 0 &&
                config.classifier.adx_period > 0,
            "market_condition_detector: lookbacks must be >= 1");
    require(config.classifier.volatility_low < config.classifier.volatility_medium,
            "market_condition_detector.volatility_categories: low must be below medium");
    require(config.classifier.min_trading_confidence >= 0.0 &&
                config.classifier.min_trading_confidence <= 1.0,
            "market_condition_detector.min_trading_confidence out of [0, 1]");

    const auto& l = config.ledger;
    require(l.max_daily_risk > 0.0 && l.max_daily_risk <= 1.0,
            "risk_management.max_daily_risk out of (0, 1]");
    require(l.daily_loss_limit > 0.0 && l.daily_loss_limit <= 1.0,
            "risk_management.daily_loss_limit out of (0, 1]");
    require(l.max_drawdown > 0.0 && l.max_drawdown < 1.0,
            "risk_management.max_drawdown_percent out of (0, 1)");
    require(l.drawdown_hysteresis >= 0.0 && l.drawdown_hysteresis < l.max_drawdown,
            "risk_management.drawdown_hysteresis must be below max_drawdown_percent");
    require(config.sizing.max_spread_multiplier >= 1.0,
            "risk_management.max_spread_multiplier must be >= 1");
    require(config.sizing.lot_step > 0.0 && config.sizing.min_lot > 0.0,
            "risk_management.lot_step and min_lot must be > 0");

    const auto& c = config.correlation;
    require(c.high_threshold > 0.0 && c.high_threshold <= 1.0,
            "correlation.high_correlation_threshold out of (0, 1]");
    require(c.medium_threshold <= c.high_threshold,
            "correlation.medium_correlation_threshold above high threshold");
    require(c.min_samples >= 2, "correlation.min_samples must be >= 2");
    require(c.max_age_intervals >= 1, "correlation.max_age_intervals must be >= 1");
    require(c.max_correlated_exposure >= 1 && c.max_same_direction_exposure >= 1,
            "correlation exposure limits must be >= 1");

    require(config.lifecycle.retry_attempts >= 1, "executor.retry_attempts must be >= 1");
    require(config.lifecycle.request_timeout.count() > 0, "executor.request_timeout_ms must be > 0");
    require(!config.paper.instruments.empty(), "trading.instruments: no instruments configured");
    require(!config.catalog.empty(), "strategies: no strategies configured");
    require(config.paper.timeout_probability >= 0.0 && config.paper.timeout_probability <= 1.0,
            "paper_broker.timeout_probability out of [0, 1]");
}

}  // namespace meridian::config
