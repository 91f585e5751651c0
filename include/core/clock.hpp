#pragma once

#include <chrono>
#include <mutex>

namespace shedq {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::nanoseconds;

// Re-check interval for waits on a clock that does not follow real time
inline constexpr std::chrono::milliseconds kClockPollInterval{5};

/**
 * @brief Time source consumed by the queue and request contexts
 *
 * Substitutable so tests can drive time by hand.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    /**
     * @brief True if now() tracks std::chrono::steady_clock
     *
     * Waiters may then sleep until an exact TimePoint. Other clocks are
     * re-checked every kClockPollInterval.
     */
    [[nodiscard]] virtual bool follows_real_time() const { return false; }
};

/// Real monotonic clock.
class SystemClock final : public IClock {
public:
    [[nodiscard]] TimePoint now() const override;
    [[nodiscard]] bool follows_real_time() const override { return true; }
};

/**
 * @brief Clock that only moves when told to
 *
 * Thread-safe: tests advance it from one thread while watcher threads
 * and contexts read it.
 */
class ManualClock final : public IClock {
public:
    ManualClock();
    explicit ManualClock(TimePoint start);

    [[nodiscard]] TimePoint now() const override;

    void advance(Duration d);
    void set(TimePoint t);

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace shedq
