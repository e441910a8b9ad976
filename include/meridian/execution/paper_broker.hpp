#pragma once
// ============================================================================
// MERIDIAN - Paper Broker
// ============================================================================
// In-process feed and execution venue. Prices follow a seeded random walk,
// fills are immediate at the quoted side, and timeouts or rejections can be
// injected with a fixed probability
// ============================================================================

#include "meridian/core/clock.hpp"
#include "meridian/execution/execution_client.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

namespace meridian::execution {

struct PaperInstrument {
    InstrumentSpec spec;
    double start_price = 1.0;
    double volatility_pips = 4.0;  // Std-dev of one bar's close-to-close move
    double spread_pips = 1.0;
    double volume = 1000.0;        // Mean bar volume
};

struct PaperBrokerConfig {
    double initial_balance = 1000.0;
    std::chrono::seconds bar_interval{300};
    size_t history_bars = 500;
    uint64_t seed = 42;
    double timeout_probability = 0.0;  // Per execution request
    double reject_probability = 0.0;
    std::vector<PaperInstrument> instruments;
};

class PaperBroker final : public IMarketDataFeed, public IExecutionClient {
public:
    PaperBroker(PaperBrokerConfig config, const IClock& clock);

    // IMarketDataFeed
    [[nodiscard]] std::optional<Quote> quote(const Symbol& symbol) override;
    [[nodiscard]] std::vector<Bar> bars(const Symbol& symbol, size_t count) override;

    // IExecutionClient
    ExecutionResult open_position(const OpenRequest& request,
                                  std::chrono::milliseconds timeout) override;
    ExecutionResult close_position(uint64_t ticket, double size,
                                   std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::optional<AccountInfo> account_info() override;

    /// Close one bar on every instrument
    void advance();

    void set_timeout_probability(double p);
    void set_reject_probability(double p);

    [[nodiscard]] size_t open_tickets() const;

private:
    struct Series {
        PaperInstrument instrument;
        std::deque<Bar> bars;
    };

    struct Ticket {
        Symbol symbol;
        Direction direction = Direction::Long;
        double size = 0.0;
        double entry = 0.0;
        double pip_size = 0.0001;
        double pip_value_per_lot = 10.0;
    };

    Bar next_bar(Series& series, Timestamp open_time);
    [[nodiscard]] Quote quote_locked(const Series& series) const;
    [[nodiscard]] bool roll(double probability);

    PaperBrokerConfig config_;
    const IClock& clock_;

    mutable std::mutex mutex_;
    std::mt19937_64 rng_;
    std::unordered_map<Symbol, Series> series_;
    std::unordered_map<uint64_t, Ticket> tickets_;
    uint64_t next_ticket_ = 1;
    double balance_;
};

}  // namespace meridian::execution
