// ============================================================================
// MERIDIAN - Multi-Instrument Trading Engine
// ============================================================================
// Regime-adaptive strategy selection with portfolio risk control
//
// Architecture:
//   [Feed] --bars/quotes--> [Classifier] --> [Selector] --> [Strategy]
//                                                              │
//                            ┌─────────────────────────────────▼──┐
//                            │ Ledger → Correlation → Spread/Size │
//                            └─────────────────┬──────────────────┘
//                                              ▼
//                                 [Lifecycle] --> [Execution]
// ============================================================================

#include "meridian/config/config.hpp"
#include "meridian/core/clock.hpp"
#include "meridian/core/errors.hpp"
#include "meridian/engine/orchestration_loop.hpp"
#include "meridian/execution/paper_broker.hpp"
#include "meridian/market/condition_classifier.hpp"
#include "meridian/market/spread_tracker.hpp"
#include "meridian/order/trade_lifecycle_manager.hpp"
#include "meridian/risk/correlation_manager.hpp"
#include "meridian/risk/position_sizer.hpp"
#include "meridian/risk/risk_events.hpp"
#include "meridian/risk/risk_ledger.hpp"
#include "meridian/strategy/strategy_selector.hpp"
#include "meridian/utils/logger.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int signal) {
        std::cout << "\n[SIGNAL] Received " << signal << ", stopping...\n";
        g_running = false;
    }

    constexpr uint64_t STATUS_EVERY_CYCLES = 10;

    void usage(const char* program) {
        std::cout << "Usage: " << program << " [--config PATH] [--cycles N] [--stopped]\n"
                  << "  --config PATH   YAML configuration (default config/meridian.yaml)\n"
                  << "  --cycles N      Stop after N cycles (default: run until signalled)\n"
                  << "  --stopped       Start in close-only mode\n";
    }
}

using namespace meridian;

// ============================================================================
// Engine Wiring
// ============================================================================

class MeridianEngine {
public:
    explicit MeridianEngine(const config::AppConfig& config) : config_(config) {
        broker_ = std::make_unique<execution::PaperBroker>(config.paper, clock_);
        classifier_ = std::make_unique<market::ConditionClassifier>(config.classifier);
        catalog_ = std::make_shared<const strategy::StrategyCatalog>(config.catalog);
        selector_ = std::make_unique<strategy::StrategySelector>(config.selector);
        correlation_ = std::make_unique<risk::CorrelationManager>(config.correlation);
        sizer_ = std::make_unique<risk::PositionSizer>(config.sizing);

        // Ledger aggregates open risk per correlation group
        auto* correlation = correlation_.get();
        ledger_ = std::make_unique<risk::RiskLedger>(
            config.ledger, risk::AccountTierTable(config.tiers), config.paper.initial_balance,
            clock_, &events_, [correlation](const Symbol& symbol) {
                return correlation->group_of(symbol).value_or(symbol.str());
            });

        lifecycle_ = std::make_unique<order::TradeLifecycleManager>(
            config.lifecycle, *broker_, *ledger_, events_, stats_, clock_);

        engine::EngineContext ctx{*broker_, *broker_, *classifier_, catalog_,
                                  *selector_, *correlation_, *sizer_, spreads_,
                                  *ledger_, *lifecycle_, events_, stats_, clock_};
        loop_ = std::make_unique<engine::OrchestrationLoop>(config.engine, config.instruments(),
                                                             ctx);

        loop_->on_status([this](const engine::StatusSnapshot& status) { on_cycle(status); });
    }

    void start(bool trading) {
        std::cout << "========================================\n";
        std::cout << "  MERIDIAN - Adaptive Multi-Instrument\n";
        std::cout << "  Mode:        PAPER\n";
        std::cout << "  Instruments: " << config_.paper.instruments.size() << "\n";
        std::cout << "  Strategies:  " << catalog_->size() << "\n";
        std::cout << "  Balance:     $" << std::fixed << std::setprecision(2)
                  << config_.paper.initial_balance << "\n";
        std::cout << "  Tier:        " << ledger_->current_tier().label << "\n";
        if (config_.risk_level) {
            std::cout << "  Risk Level:  " << risk::to_string(*config_.risk_level) << "\n";
        }
        std::cout << "========================================\n\n";

        if (trading) {
            loop_->start_trading(std::nullopt, config_.risk_level);
        } else {
            loop_->stop_trading();
        }
        std::cout << "[INFO] Press Ctrl+C to stop\n\n";
    }

    void run(uint64_t max_cycles) {
        loop_->run_forever(g_running, max_cycles);
    }

    void stop() {
        loop_->stop_trading();
        print_summary(loop_->status());
    }

private:
    void on_cycle(const engine::StatusSnapshot& status) {
        // Paper feed closes one bar per cycle
        broker_->advance();

        if (status.cycles % STATUS_EVERY_CYCLES != 0) return;
        size_t submitted = 0;
        for (const auto& inst : status.instruments) {
            if (inst.outcome == engine::CycleOutcome::Submitted) ++submitted;
        }
        LOG_INFO("[STATUS] cycle={} equity={:.2f} dd={:.2f}% open={} submitted={} trades={} "
                 "win={:.1f}% breaker={}",
                 status.cycles, status.ledger.equity, status.ledger.current_drawdown_percent,
                 status.positions.size(), submitted, status.ledger.performance.trades,
                 status.ledger.performance.win_rate(), status.circuit_breaker);
    }

    void print_summary(const engine::StatusSnapshot& status) const {
        const auto& l = status.ledger;
        std::cout << "\n=== Meridian Session Summary ===\n";
        std::cout << "Cycles:            " << status.cycles << "\n";
        std::cout << "Equity:            $" << std::fixed << std::setprecision(2) << l.equity
                  << "\n";
        std::cout << "High-Water Mark:   $" << l.high_water_mark << "\n";
        std::cout << "Drawdown:          " << l.current_drawdown_percent << "%\n";
        std::cout << "Daily PnL:         $" << l.daily_realized_pnl << "\n";
        std::cout << "Open Positions:    " << status.positions.size() << "\n";
        std::cout << "Fatal Positions:   " << status.fatal_positions.size() << "\n";
        std::cout << "------- Performance -------\n";
        std::cout << "Trades:            " << l.performance.trades << " (" << l.performance.wins
                  << "W/" << l.performance.losses << "L)\n";
        std::cout << "Win Rate:          " << l.performance.win_rate() << "%\n";
        std::cout << "Avg Win:           $" << l.performance.average_win() << "\n";
        std::cout << "Avg Loss:          $" << l.performance.average_loss() << "\n";
        std::cout << "Profit Factor:     " << l.performance.profit_factor() << "\n";
        std::cout << "------- Execution -------\n";
        std::cout << "Fills:             " << status.execution.fills << "\n";
        std::cout << "Rejections:        " << status.execution.rejections << "\n";
        std::cout << "Timeouts:          " << status.execution.timeouts << "\n";
        std::cout << "Retries:           " << status.execution.retries << "\n";
        std::cout << "Forced Closes:     " << status.execution.forced_closes << "\n";
        std::cout << "------- Risk Events -------\n";
        for (const auto kind : {RiskEventKind::AdmissionRejected, RiskEventKind::CircuitBreakerTripped,
                                RiskEventKind::CircuitBreakerReset, RiskEventKind::ExecutionTimeout,
                                RiskEventKind::ExecutionFatal,
                                RiskEventKind::ClassificationDegraded}) {
            std::cout << std::left << std::setw(24) << to_string(kind) << std::right
                      << events_.count(kind) << "\n";
        }
        std::cout << "================================\n";
    }

    config::AppConfig config_;
    SystemClock clock_;
    risk::RiskEventLog events_;
    execution::ExecutionStats stats_;
    market::SpreadTracker spreads_;

    std::unique_ptr<execution::PaperBroker> broker_;
    std::unique_ptr<market::ConditionClassifier> classifier_;
    strategy::CatalogPtr catalog_;
    std::unique_ptr<strategy::StrategySelector> selector_;
    std::unique_ptr<risk::CorrelationManager> correlation_;
    std::unique_ptr<risk::PositionSizer> sizer_;
    std::unique_ptr<risk::RiskLedger> ledger_;
    std::unique_ptr<order::TradeLifecycleManager> lifecycle_;
    std::unique_ptr<engine::OrchestrationLoop> loop_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = "config/meridian.yaml";
    uint64_t max_cycles = 0;
    bool trading = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--cycles" && i + 1 < argc) {
            try {
                max_cycles = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "[ERROR] --cycles expects a number\n";
                return 2;
            }
        } else if (arg == "--stopped") {
            trading = false;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    std::cout << "[INFO] Loading config from: " << config_path << "\n";
    config::AppConfig config;
    try {
        config = config::load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    utils::Logger::initialize(config.logging);

    try {
        MeridianEngine engine(config);
        engine.start(trading && config.engine.start_enabled);
        engine.run(max_cycles);
        engine.stop();
    } catch (const std::exception& e) {
        LOG_CRITICAL("[MAIN] Unhandled exception: {}", e.what());
        std::cerr << "\n[CRITICAL] Unhandled Exception: " << e.what() << "\n";
        utils::Logger::shutdown();
        return 1;
    }

    utils::Logger::shutdown();
    return 0;
}
