#pragma once
// ============================================================================
// MERIDIAN - Bollinger Bands
// ============================================================================
// SMA middle band with standard deviation envelopes
// ============================================================================

#include "indicator_base.hpp"

namespace meridian::indicators {

class BollingerBands : public IndicatorBase<BollingerBands> {
public:
    explicit BollingerBands(size_t period = 20, double std_multiplier = 2.0)
        : period_(period == 0 ? 1 : period), multiplier_(std_multiplier), window_(period_) {
        reset_impl();
    }

    void update_impl(double price) {
        window_.push(price);
        latest_price_ = price;
        ++count_;

        if (count_ >= period_) {
            middle_ = window_.mean();
            const double sd = window_.std_dev();
            upper_ = middle_ + multiplier_ * sd;
            lower_ = middle_ - multiplier_ * sd;
        }
    }

    /// Middle band (SMA)
    [[nodiscard]] double value_impl() const { return middle_; }
    [[nodiscard]] double upper_band() const { return upper_; }
    [[nodiscard]] double lower_band() const { return lower_; }

    /// %B: 0 = at lower band, 1 = at upper band
    [[nodiscard]] double percent_b() const {
        if (upper_ == lower_) return 0.5;
        return (latest_price_ - lower_) / (upper_ - lower_);
    }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= period_; }

    void reset_impl() {
        window_.reset();
        count_ = 0;
        middle_ = 0.0;
        upper_ = 0.0;
        lower_ = 0.0;
        latest_price_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_; }

private:
    size_t period_;
    double multiplier_;
    RollingWindow window_;
    size_t count_ = 0;
    double middle_ = 0.0;
    double upper_ = 0.0;
    double lower_ = 0.0;
    double latest_price_ = 0.0;
};

}  // namespace meridian::indicators
