#pragma once
// ============================================================================
// MERIDIAN - Correlation Manager
// ============================================================================
// Rolling Pearson correlation of log returns across instruments, published
// as an immutable snapshot. Pairs without enough history fall back to
// predefined group membership, and the fallback is reported, not hidden
// ============================================================================

#include "meridian/core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meridian::risk {

// ============================================================================
// Configuration
// ============================================================================

struct CorrelationGroup {
    std::string name;
    std::vector<Symbol> members;
};

struct CorrelationConfig {
    double high_threshold = 0.7;
    double medium_threshold = 0.5;
    std::chrono::hours update_interval{12};
    size_t max_age_intervals = 3;            // Unrefreshed measurements expire after this many intervals
    size_t min_samples = 30;                 // Aligned returns needed for a measurement
    size_t history_bars = 500;               // Closes requested per instrument on refresh
    size_t max_correlated_exposure = 2;      // Open trades at |c| >= high, new one included
    size_t max_same_direction_exposure = 5;  // Effective same-direction trades, new one included
    std::vector<CorrelationGroup> groups;

    /// Shipped groups (major USD, JPY crosses, synthetic index families)
    [[nodiscard]] static std::vector<CorrelationGroup> default_groups();
};

// ============================================================================
// Results
// ============================================================================

enum class CorrelationSource : uint8_t {
    Self,             // A == B
    Measured,         // From return series
    PredefinedGroup,  // Same group, no measurement available
    None              // Unrelated and unmeasured, treated as 0
};

[[nodiscard]] constexpr std::string_view to_string(CorrelationSource s) noexcept {
    switch (s) {
        case CorrelationSource::Self: return "self";
        case CorrelationSource::Measured: return "measured";
        case CorrelationSource::PredefinedGroup: return "group";
        case CorrelationSource::None: return "none";
    }
    return "none";
}

struct Correlation {
    double coefficient = 0.0;
    CorrelationSource source = CorrelationSource::None;
};

struct CorrelationEntry {
    Symbol a;
    Symbol b;
    double coefficient = 0.0;
    Timestamp last_updated;
};

/// An open or pending position as seen by the admission check
struct OpenExposure {
    Symbol symbol;
    Direction direction = Direction::Long;
};

struct AdmissionDecision {
    bool allowed = true;
    std::string reason;
    size_t correlated_count = 0;      // Existing positions at |c| >= high
    size_t same_direction_count = 0;  // Existing positions in the same effective direction
};

// ============================================================================
// Manager
// ============================================================================

class CorrelationManager {
public:
    explicit CorrelationManager(CorrelationConfig config = CorrelationConfig{});

    /// Recompute the matrix from close series and publish it
    void update(const std::unordered_map<Symbol, std::vector<double>>& closes, Timestamp now);

    /// Seed or override one measured pair (operators, tests)
    void set_correlation(const Symbol& a, const Symbol& b, double coefficient, Timestamp now);

    [[nodiscard]] bool needs_refresh(Timestamp now) const;

    /// Symmetric, 1.0 on the diagonal
    [[nodiscard]] Correlation correlation(const Symbol& a, const Symbol& b) const;

    [[nodiscard]] AdmissionDecision can_open(const Symbol& symbol, Direction direction,
                                             std::span<const OpenExposure> open) const;

    [[nodiscard]] std::optional<std::string> group_of(const Symbol& symbol) const;

    /// Measured pairs in the current snapshot
    [[nodiscard]] std::vector<CorrelationEntry> entries() const;

    [[nodiscard]] const CorrelationConfig& config() const { return config_; }

    [[nodiscard]] static std::vector<double> log_returns(std::span<const double> closes);

    /// Pearson coefficient over the common tail of two series; nullopt if undefined
    [[nodiscard]] static std::optional<double> pearson(std::span<const double> x,
                                                       std::span<const double> y);

private:
    using PairKey = std::pair<Symbol, Symbol>;

    struct Snapshot {
        std::map<PairKey, CorrelationEntry> entries;
        std::optional<Timestamp> refreshed_at;
    };

    [[nodiscard]] static PairKey key(const Symbol& a, const Symbol& b) {
        return a < b ? PairKey{a, b} : PairKey{b, a};
    }

    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;

    CorrelationConfig config_;
    std::unordered_map<Symbol, std::string> group_index_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace meridian::risk
