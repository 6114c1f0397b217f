#pragma once

/// @file include/olend/clock.hpp
/// @brief Host-supplied monotonic logical clock.
///
/// Every elapsed-time check in the core (staleness, breaker windows,
/// recovery timeouts) reads `Clock::now()`. The core never consults the
/// wall clock on its own.

#include "olend/types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>

namespace olend {

class Clock {
public:
    virtual ~Clock() = default;

    /// Milliseconds on a monotonic timeline.
    [[nodiscard]] virtual Timestamp now() const = 0;
};

/// Clock driven explicitly by the host or a test. Never moves backwards.
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) noexcept : now_(start) {}

    [[nodiscard]] Timestamp now() const override { return now_.load(std::memory_order_acquire); }

    /// Moves to `t`; earlier values are ignored. Returns the resulting time.
    Timestamp set(Timestamp t) noexcept {
        Timestamp current = now_.load(std::memory_order_relaxed);
        while (t > current &&
               !now_.compare_exchange_weak(current, t, std::memory_order_acq_rel)) {
        }
        return std::max(t, current);
    }

    Timestamp advance(Timestamp delta_ms) noexcept {
        return now_.fetch_add(delta_ms, std::memory_order_acq_rel) + delta_ms;
    }

private:
    std::atomic<Timestamp> now_;
};

/// Milliseconds since an unspecified epoch, from std::chrono::steady_clock.
class SteadyClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override {
        const auto since = std::chrono::steady_clock::now().time_since_epoch();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::milliseconds>(since).count());
    }
};

} // namespace olend
