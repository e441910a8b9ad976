#pragma once
// ============================================================================
// MERIDIAN - ATR and ADX
// ============================================================================
// Wilder's Average True Range and Average Directional Index (+DI / -DI)
// Both consume full bars
// ============================================================================

#include "indicator_base.hpp"

#include <cmath>

namespace meridian::indicators {

// ============================================================================
// ATR
// ============================================================================

class ATR : public IndicatorBase<ATR, Bar> {
public:
    explicit ATR(size_t period = 14) : period_(period == 0 ? 1 : period) { reset_impl(); }

    void update_impl(const Bar& bar) {
        if (!has_prev_) {
            prev_close_ = bar.close;
            has_prev_ = true;
            return;
        }

        const double tr = true_range(bar, prev_close_);
        prev_close_ = bar.close;
        ++count_;

        const auto n = static_cast<double>(period_);
        if (count_ <= period_) {
            tr_sum_ += tr;
            atr_ = tr_sum_ / static_cast<double>(count_);
        } else {
            atr_ = (atr_ * (n - 1.0) + tr) / n;
        }
    }

    [[nodiscard]] double value_impl() const { return atr_; }
    [[nodiscard]] bool is_ready_impl() const { return count_ >= period_; }

    void reset_impl() {
        has_prev_ = false;
        prev_close_ = 0.0;
        count_ = 0;
        tr_sum_ = 0.0;
        atr_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_; }

private:
    size_t period_;
    bool has_prev_ = false;
    double prev_close_ = 0.0;
    size_t count_ = 0;
    double tr_sum_ = 0.0;
    double atr_ = 0.0;
};

// ============================================================================
// ADX
// ============================================================================

/// Trend strength 0-100. Needs roughly 2 * period bars before it is ready
class ADX : public IndicatorBase<ADX, Bar> {
public:
    explicit ADX(size_t period = 14) : period_(period == 0 ? 1 : period) { reset_impl(); }

    void update_impl(const Bar& bar) {
        if (!has_prev_) {
            prev_ = bar;
            has_prev_ = true;
            return;
        }

        const double up_move = bar.high - prev_.high;
        const double down_move = prev_.low - bar.low;
        const double plus_dm = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        const double minus_dm = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;
        const double tr = true_range(bar, prev_.close);
        prev_ = bar;
        ++count_;

        const auto n = static_cast<double>(period_);
        if (count_ <= period_) {
            // Initial sums
            tr_smooth_ += tr;
            plus_smooth_ += plus_dm;
            minus_smooth_ += minus_dm;
            if (count_ < period_) return;
        } else {
            tr_smooth_ = tr_smooth_ - tr_smooth_ / n + tr;
            plus_smooth_ = plus_smooth_ - plus_smooth_ / n + plus_dm;
            minus_smooth_ = minus_smooth_ - minus_smooth_ / n + minus_dm;
        }

        plus_di_ = tr_smooth_ > 0.0 ? 100.0 * plus_smooth_ / tr_smooth_ : 0.0;
        minus_di_ = tr_smooth_ > 0.0 ? 100.0 * minus_smooth_ / tr_smooth_ : 0.0;
        const double di_sum = plus_di_ + minus_di_;
        const double dx = di_sum > 0.0 ? 100.0 * std::abs(plus_di_ - minus_di_) / di_sum : 0.0;

        ++dx_count_;
        if (dx_count_ <= period_) {
            dx_sum_ += dx;
            adx_ = dx_sum_ / static_cast<double>(dx_count_);
        } else {
            adx_ = (adx_ * (n - 1.0) + dx) / n;
        }
    }

    [[nodiscard]] double value_impl() const { return adx_; }
    [[nodiscard]] double plus_di() const { return plus_di_; }
    [[nodiscard]] double minus_di() const { return minus_di_; }
    [[nodiscard]] bool is_ready_impl() const { return dx_count_ >= period_; }

    void reset_impl() {
        has_prev_ = false;
        prev_ = Bar{};
        count_ = 0;
        dx_count_ = 0;
        tr_smooth_ = 0.0;
        plus_smooth_ = 0.0;
        minus_smooth_ = 0.0;
        plus_di_ = 0.0;
        minus_di_ = 0.0;
        dx_sum_ = 0.0;
        adx_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_; }

private:
    size_t period_;
    bool has_prev_ = false;
    Bar prev_{};
    size_t count_ = 0;
    size_t dx_count_ = 0;
    double tr_smooth_ = 0.0;
    double plus_smooth_ = 0.0;
    double minus_smooth_ = 0.0;
    double plus_di_ = 0.0;
    double minus_di_ = 0.0;
    double dx_sum_ = 0.0;
    double adx_ = 0.0;
};

}  // namespace meridian::indicators
