#pragma once
// ============================================================================
// MERIDIAN - Indicator Base Class
// ============================================================================
// CRTP base shared by all streaming indicators. Periods are runtime values
// because every lookback is configurable per strategy
// ============================================================================

#include "meridian/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <vector>

namespace meridian::indicators {

// ============================================================================
// Indicator Concept
// ============================================================================

template <typename T, typename Input = double>
concept Indicator = requires(T indicator, const Input& input) {
    { indicator.update(input) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

// ============================================================================
// CRTP Base Class
// ============================================================================

/// Input is double for close-price indicators and Bar for range indicators
template <typename Derived, typename Input = double>
class IndicatorBase {
public:
    void update(const Input& input) {
        static_cast<Derived*>(this)->update_impl(input);
    }

    [[nodiscard]] double value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    [[nodiscard]] bool is_ready() const {
        return static_cast<const Derived*>(this)->is_ready_impl();
    }

    void reset() {
        static_cast<Derived*>(this)->reset_impl();
    }

    [[nodiscard]] size_t period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    IndicatorBase() = default;
    ~IndicatorBase() = default;
};

// ============================================================================
// Rolling Window for Historical Data
// ============================================================================

class RollingWindow {
public:
    explicit RollingWindow(size_t capacity)
        : buffer_(capacity == 0 ? 1 : capacity, 0.0), size_(0), index_(0) {}

    void push(double value) {
        buffer_[index_] = value;
        index_ = (index_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) {
            ++size_;
        }
    }

    /// i=0 is the most recent value
    [[nodiscard]] double operator[](size_t i) const {
        if (i >= size_) return 0.0;
        const size_t cap = buffer_.size();
        return buffer_[(index_ + cap - 1 - i) % cap];
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t capacity() const { return buffer_.size(); }
    [[nodiscard]] bool is_full() const { return size_ == buffer_.size(); }

    void reset() {
        size_ = 0;
        index_ = 0;
    }

    [[nodiscard]] double sum() const {
        double s = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            s += (*this)[i];
        }
        return s;
    }

    [[nodiscard]] double mean() const {
        if (size_ == 0) return 0.0;
        return sum() / static_cast<double>(size_);
    }

    /// Population standard deviation
    [[nodiscard]] double std_dev() const {
        if (size_ < 2) return 0.0;
        const double m = mean();
        double variance = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            const double diff = (*this)[i] - m;
            variance += diff * diff;
        }
        return std::sqrt(variance / static_cast<double>(size_));
    }

    [[nodiscard]] double max() const {
        double m = (*this)[0];
        for (size_t i = 1; i < size_; ++i) m = std::max(m, (*this)[i]);
        return m;
    }

    [[nodiscard]] double min() const {
        double m = (*this)[0];
        for (size_t i = 1; i < size_; ++i) m = std::min(m, (*this)[i]);
        return m;
    }

private:
    std::vector<double> buffer_;
    size_t size_;
    size_t index_;
};

/// Wilder true range of a bar against the previous close
[[nodiscard]] inline double true_range(const Bar& bar, double prev_close) noexcept {
    const double hl = bar.high - bar.low;
    const double hc = std::abs(bar.high - prev_close);
    const double lc = std::abs(bar.low - prev_close);
    return std::max(hl, std::max(hc, lc));
}

}  // namespace meridian::indicators
