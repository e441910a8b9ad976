#pragma once
// ============================================================================
// MERIDIAN - Core Types
// ============================================================================
// Fundamental type definitions shared by every module
// Prices are quoted doubles; distances are expressed in pips
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace meridian {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Get current wall-clock timestamp
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

/// Days since epoch in UTC, used for daily risk rollover
[[nodiscard]] inline int64_t utc_day(Timestamp ts) noexcept {
    return std::chrono::floor<std::chrono::days>(ts).time_since_epoch().count();
}

// ============================================================================
// Instrument Symbol
// ============================================================================

/// Instrument symbol (e.g., "EURUSD", "Volatility 75 Index")
/// Fixed inline storage so symbols copy without allocation
class Symbol {
public:
    static constexpr size_t MAX_LENGTH = 31;

    Symbol() noexcept : length_(0) { data_[0] = '\0'; }

    explicit Symbol(std::string_view symbol) noexcept {
        length_ = static_cast<uint8_t>(std::min(symbol.size(), MAX_LENGTH));
        std::copy_n(symbol.data(), length_, data_);
        data_[length_] = '\0';
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, length_};
    }

    [[nodiscard]] std::string str() const { return std::string(view()); }
    [[nodiscard]] const char* c_str() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    bool operator==(const Symbol& other) const noexcept {
        return view() == other.view();
    }

    bool operator!=(const Symbol& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Symbol& other) const noexcept {
        return view() < other.view();
    }

private:
    char data_[MAX_LENGTH + 1];
    uint8_t length_;
};

// ============================================================================
// Trading Types
// ============================================================================

/// Position direction
enum class Direction : uint8_t {
    Long = 0,
    Short = 1
};

[[nodiscard]] constexpr Direction opposite(Direction d) noexcept {
    return d == Direction::Long ? Direction::Short : Direction::Long;
}

/// +1 for long, -1 for short
[[nodiscard]] constexpr double sign(Direction d) noexcept {
    return d == Direction::Long ? 1.0 : -1.0;
}

[[nodiscard]] constexpr std::string_view to_string(Direction d) noexcept {
    return d == Direction::Long ? "long" : "short";
}

/// Instrument family, drives default pip conventions and correlation groups
enum class InstrumentCategory : uint8_t {
    Forex = 0,
    Synthetic = 1
};

/// Static per-instrument trading conventions
struct InstrumentSpec {
    Symbol symbol;
    InstrumentCategory category = InstrumentCategory::Forex;
    double pip_size = 0.0001;        // Price increment of one pip
    double pip_value_per_lot = 10.0; // Account currency per pip per 1.0 lot
};

// ============================================================================
// Market Data Structures
// ============================================================================

/// OHLCV bar with the average spread observed during the bar (pips)
struct Bar {
    Timestamp open_time;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double spread = 0.0;
};

/// Top of book
struct Quote {
    Symbol symbol;
    Timestamp time;
    double bid = 0.0;
    double ask = 0.0;

    [[nodiscard]] double mid() const noexcept { return (bid + ask) * 0.5; }

    /// Price a position of the given direction exits at
    [[nodiscard]] double exit_price(Direction d) const noexcept {
        return d == Direction::Long ? bid : ask;
    }

    /// Price a position of the given direction enters at
    [[nodiscard]] double entry_price(Direction d) const noexcept {
        return d == Direction::Long ? ask : bid;
    }
};

// ============================================================================
// Signal Types
// ============================================================================

/// Trading signal strength (-1.0 to +1.0)
/// Positive = bullish, Negative = bearish
class SignalStrength {
public:
    constexpr SignalStrength() noexcept : value_(0.0) {}
    constexpr explicit SignalStrength(double value) noexcept
        : value_(value < -1.0 ? -1.0 : (value > 1.0 ? 1.0 : value)) {}

    [[nodiscard]] constexpr double value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool is_bullish() const noexcept { return value_ > 0.0; }
    [[nodiscard]] constexpr bool is_bearish() const noexcept { return value_ < 0.0; }
    [[nodiscard]] constexpr bool is_neutral() const noexcept { return value_ == 0.0; }

private:
    double value_;
};

/// Entry signal produced by a strategy
struct TradingSignal {
    Symbol symbol;
    Direction direction = Direction::Long;
    SignalStrength strength;
    Timestamp timestamp;
    double reference_price = 0.0;   // Close of the signalling bar
    double structure_level = 0.0;   // Swing level invalidating the setup (0 if none)
};

}  // namespace meridian

// ============================================================================
// Hash specializations for use with containers
// ============================================================================
template <>
struct std::hash<meridian::Symbol> {
    size_t operator()(const meridian::Symbol& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};
