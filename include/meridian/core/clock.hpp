#pragma once
// ============================================================================
// MERIDIAN - Clock
// ============================================================================
// Injectable time source. Live code uses SystemClock; tests and replays
// drive a ManualClock so TTLs, deadlines and day rollover are deterministic
// ============================================================================

#include "meridian/core/types.hpp"

#include <atomic>

namespace meridian {

class IClock {
public:
    virtual ~IClock() = default;

    /// Current time. Must be safe to call from any thread
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] Timestamp now() const override { return ::meridian::now(); }
};

class ManualClock final : public IClock {
public:
    explicit ManualClock(Timestamp start = from_epoch_ms(0)) noexcept
        : ticks_(start.time_since_epoch().count()) {}

    [[nodiscard]] Timestamp now() const override {
        return Timestamp{Duration{ticks_.load(std::memory_order_acquire)}};
    }

    void set(Timestamp ts) noexcept {
        ticks_.store(ts.time_since_epoch().count(), std::memory_order_release);
    }

    void advance(Duration d) noexcept {
        ticks_.fetch_add(d.count(), std::memory_order_acq_rel);
    }

private:
    std::atomic<Duration::rep> ticks_;
};

}  // namespace meridian
