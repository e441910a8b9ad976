#pragma once
// ============================================================================
// MERIDIAN - Stochastic Oscillator
// ============================================================================
// Slow stochastic: raw %K over k_period, smoothed by `slowing`, %D = SMA(%K)
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

namespace meridian::indicators {

class Stochastic : public IndicatorBase<Stochastic, Bar> {
public:
    Stochastic(size_t k_period = 14, size_t d_period = 3, size_t slowing = 3)
        : k_period_(k_period == 0 ? 1 : k_period),
          highs_(k_period_),
          lows_(k_period_),
          slow_k_(slowing),
          d_(d_period) {}

    void update_impl(const Bar& bar) {
        highs_.push(bar.high);
        lows_.push(bar.low);
        if (!highs_.is_full()) return;

        const double hh = highs_.max();
        const double ll = lows_.min();
        const double raw_k = hh > ll ? 100.0 * (bar.close - ll) / (hh - ll) : 50.0;

        slow_k_.update(raw_k);
        if (slow_k_.is_ready()) {
            prev_k_ = k_;
            prev_d_ = d_.value();
            k_ = slow_k_.value();
            d_.update(k_);
            ++ready_count_;
        }
    }

    /// %K
    [[nodiscard]] double value_impl() const { return k_; }
    [[nodiscard]] double k() const { return k_; }
    [[nodiscard]] double d() const { return d_.value(); }
    [[nodiscard]] double previous_k() const { return prev_k_; }
    [[nodiscard]] double previous_d() const { return prev_d_; }

    /// %D is ready and a previous %K/%D pair exists for cross detection
    [[nodiscard]] bool is_ready_impl() const { return d_.is_ready() && ready_count_ > d_.period(); }

    void reset_impl() {
        highs_.reset();
        lows_.reset();
        slow_k_.reset();
        d_.reset();
        k_ = prev_k_ = prev_d_ = 50.0;
        ready_count_ = 0;
    }

    [[nodiscard]] size_t period_impl() const { return k_period_; }

private:
    size_t k_period_;
    RollingWindow highs_;
    RollingWindow lows_;
    SMA slow_k_;
    SMA d_;
    double k_ = 50.0;
    double prev_k_ = 50.0;
    double prev_d_ = 50.0;
    size_t ready_count_ = 0;
};

}  // namespace meridian::indicators
