#include "core/clock.hpp"

namespace shedq {

TimePoint SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

// Starts well away from the epoch so "now - d" never underflows in tests
ManualClock::ManualClock()
    : now_(TimePoint{} + std::chrono::hours(24)) {}

ManualClock::ManualClock(TimePoint start)
    : now_(start) {}

TimePoint ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualClock::advance(Duration d) {
    std::lock_guard lock(mutex_);
    now_ += d;
}

void ManualClock::set(TimePoint t) {
    std::lock_guard lock(mutex_);
    now_ = t;
}

} // namespace shedq
