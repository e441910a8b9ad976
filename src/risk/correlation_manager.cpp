// ============================================================================
// MERIDIAN - Correlation Manager Implementation
// ============================================================================

#include "meridian/risk/correlation_manager.hpp"

#include "meridian/utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace meridian::risk {

namespace {

std::vector<Symbol> symbols(std::initializer_list<std::string_view> names) {
    std::vector<Symbol> out;
    out.reserve(names.size());
    for (auto n : names) out.emplace_back(n);
    return out;
}

}  // namespace

std::vector<CorrelationGroup> CorrelationConfig::default_groups() {
    return {
        {"major_usd_pairs", symbols({"EURUSD", "GBPUSD", "AUDUSD", "NZDUSD"})},
        {"jpy_pairs", symbols({"USDJPY", "EURJPY", "GBPJPY", "AUDJPY"})},
        {"volatility_indices", symbols({"Volatility 10 Index", "Volatility 25 Index",
                                        "Volatility 50 Index", "Volatility 75 Index",
                                        "Volatility 100 Index"})},
        {"crash_indices", symbols({"Crash 300 Index", "Crash 500 Index", "Crash 1000 Index"})},
        {"boom_indices", symbols({"Boom 300 Index", "Boom 500 Index", "Boom 1000 Index"})},
        {"step_indices", symbols({"Step Index"})},
        {"jump_indices", symbols({"Jump 10 Index", "Jump 25 Index", "Jump 50 Index",
                                  "Jump 75 Index", "Jump 100 Index"})},
    };
}

CorrelationManager::CorrelationManager(CorrelationConfig config)
    : config_(std::move(config)), snapshot_(std::make_shared<const Snapshot>()) {
    for (const auto& group : config_.groups) {
        for (const auto& member : group.members) {
            // First group wins for instruments listed twice
            group_index_.try_emplace(member, group.name);
        }
    }
}

std::shared_ptr<const CorrelationManager::Snapshot> CorrelationManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

// ============================================================================
// Statistics
// ============================================================================

std::vector<double> CorrelationManager::log_returns(std::span<const double> closes) {
    std::vector<double> out;
    if (closes.size() < 2) return out;
    out.reserve(closes.size() - 1);
    for (size_t i = 1; i < closes.size(); ++i) {
        if (closes[i - 1] > 0.0 && closes[i] > 0.0) {
            out.push_back(std::log(closes[i] / closes[i - 1]));
        } else {
            out.push_back(0.0);
        }
    }
    return out;
}

std::optional<double> CorrelationManager::pearson(std::span<const double> x,
                                                  std::span<const double> y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return std::nullopt;
    x = x.last(n);
    y = y.last(n);

    double mean_x = 0.0;
    double mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double cov = 0.0;
    double var_x = 0.0;
    double var_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }
    if (var_x <= 0.0 || var_y <= 0.0) return std::nullopt;

    const double r = cov / std::sqrt(var_x * var_y);
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}

// ============================================================================
// Matrix Maintenance
// ============================================================================

void CorrelationManager::update(const std::unordered_map<Symbol, std::vector<double>>& closes,
                                Timestamp now) {
    std::vector<std::pair<Symbol, std::vector<double>>> returns;
    returns.reserve(closes.size());
    for (const auto& [symbol, series] : closes) {
        returns.emplace_back(symbol, log_returns(series));
    }
    std::sort(returns.begin(), returns.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    auto next = std::make_shared<Snapshot>();
    next->refreshed_at = now;
    size_t measured = 0;
    for (size_t i = 0; i < returns.size(); ++i) {
        for (size_t j = i + 1; j < returns.size(); ++j) {
            const auto& [a, ra] = returns[i];
            const auto& [b, rb] = returns[j];
            if (std::min(ra.size(), rb.size()) < config_.min_samples) continue;
            const auto r = pearson(ra, rb);
            if (!r) continue;
            next->entries[key(a, b)] = CorrelationEntry{key(a, b).first, key(a, b).second, *r, now};
            ++measured;
        }
    }

    // Pairs that could not be refreshed keep their last measurement until it expires
    const auto max_age = config_.update_interval * static_cast<int64_t>(config_.max_age_intervals);
    size_t expired = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [k, entry] : snapshot_->entries) {
            if (next->entries.count(k) != 0) continue;
            if (now - entry.last_updated > max_age) {
                ++expired;
                continue;
            }
            next->entries.emplace(k, entry);
        }
        snapshot_ = std::move(next);
    }

    LOG_INFO("[CORRELATION] Refreshed {} pairs across {} instruments ({} expired)", measured,
             returns.size(), expired);
}

void CorrelationManager::set_correlation(const Symbol& a, const Symbol& b, double coefficient,
                                         Timestamp now) {
    if (a == b || !std::isfinite(coefficient)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<Snapshot>(*snapshot_);
    const auto k = key(a, b);
    next->entries[k] = CorrelationEntry{k.first, k.second, std::clamp(coefficient, -1.0, 1.0), now};
    snapshot_ = std::move(next);
}

bool CorrelationManager::needs_refresh(Timestamp now) const {
    const auto snap = snapshot();
    if (!snap->refreshed_at) return true;
    return now - *snap->refreshed_at >= config_.update_interval;
}

// ============================================================================
// Queries
// ============================================================================

Correlation CorrelationManager::correlation(const Symbol& a, const Symbol& b) const {
    if (a == b) return {1.0, CorrelationSource::Self};

    const auto snap = snapshot();
    auto it = snap->entries.find(key(a, b));
    if (it != snap->entries.end()) {
        return {it->second.coefficient, CorrelationSource::Measured};
    }

    const auto ga = group_of(a);
    const auto gb = group_of(b);
    if (ga && gb && *ga == *gb) {
        LOG_DEBUG("[CORRELATION] {}/{} unmeasured, using group '{}' estimate {:.2f}",
                  a.view(), b.view(), *ga, config_.high_threshold);
        return {config_.high_threshold, CorrelationSource::PredefinedGroup};
    }
    return {0.0, CorrelationSource::None};
}

std::optional<std::string> CorrelationManager::group_of(const Symbol& symbol) const {
    auto it = group_index_.find(symbol);
    if (it == group_index_.end()) return std::nullopt;
    return it->second;
}

std::vector<CorrelationEntry> CorrelationManager::entries() const {
    const auto snap = snapshot();
    std::vector<CorrelationEntry> out;
    out.reserve(snap->entries.size());
    for (const auto& [k, entry] : snap->entries) out.push_back(entry);
    return out;
}

AdmissionDecision CorrelationManager::can_open(const Symbol& symbol, Direction direction,
                                               std::span<const OpenExposure> open) const {
    AdmissionDecision decision;

    for (const auto& position : open) {
        const auto c = correlation(symbol, position.symbol);
        if (std::abs(c.coefficient) >= config_.high_threshold) {
            ++decision.correlated_count;
        }
        // A short in a negatively correlated pair is the same bet as a long here
        Direction effective = position.direction;
        if (c.coefficient <= -config_.high_threshold) effective = opposite(effective);
        if (effective == direction) ++decision.same_direction_count;
    }

    if (decision.correlated_count + 1 > config_.max_correlated_exposure) {
        decision.allowed = false;
        decision.reason = fmt::format("{} correlated open positions, limit {}",
                                      decision.correlated_count, config_.max_correlated_exposure);
        return decision;
    }
    if (decision.same_direction_count + 1 > config_.max_same_direction_exposure) {
        decision.allowed = false;
        decision.reason = fmt::format("{} {} positions already open, limit {}",
                                      decision.same_direction_count, to_string(direction),
                                      config_.max_same_direction_exposure);
        return decision;
    }
    decision.reason = "ok";
    return decision;
}

}  // namespace meridian::risk
