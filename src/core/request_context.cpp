#include "core/request_context.hpp"

namespace shedq {

RequestContext::RequestContext(std::shared_ptr<IClock> clock,
                               std::optional<TimePoint> deadline)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      deadline_(deadline) {}

std::shared_ptr<RequestContext> RequestContext::background(std::shared_ptr<IClock> clock) {
    return std::make_shared<RequestContext>(std::move(clock));
}

std::shared_ptr<RequestContext> RequestContext::with_deadline(
    std::shared_ptr<IClock> clock, TimePoint deadline) {
    return std::make_shared<RequestContext>(std::move(clock), deadline);
}

std::shared_ptr<RequestContext> RequestContext::with_timeout(
    std::shared_ptr<IClock> clock, Duration timeout) {
    auto* raw = clock.get();
    const TimePoint deadline = (raw ? raw->now() : std::chrono::steady_clock::now()) + timeout;
    return std::make_shared<RequestContext>(std::move(clock), deadline);
}

std::optional<ContextError> RequestContext::err() const {
    {
        std::lock_guard lock(mutex_);
        if (cancelled_) return ContextError::CANCELLED;
    }
    if (expired()) return ContextError::DEADLINE_EXCEEDED;
    return std::nullopt;
}

bool RequestContext::is_cancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

void RequestContext::cancel() {
    {
        std::lock_guard lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
    }
    cv_.notify_all();
    // Runs registered stop_callbacks on this thread; mutex_ must not be held
    done_.request_stop();
}

bool RequestContext::expired() const {
    return deadline_.has_value() && clock_->now() >= *deadline_;
}

bool RequestContext::wait_done(std::stop_token stop) const {
    std::unique_lock lock(mutex_);

    if (!deadline_) {
        // Only cancel() can end this wait; returns false if stop fired first
        return cv_.wait(lock, stop, [this] { return cancelled_; });
    }

    const auto cancelled = [this] { return cancelled_; };
    while (!stop.stop_requested()) {
        if (cancelled_ || expired()) return true;
        if (clock_->follows_real_time()) {
            cv_.wait_until(lock, stop, *deadline_, cancelled);
        } else {
            cv_.wait_for(lock, stop, kClockPollInterval, cancelled);
        }
    }
    return false;
}

} // namespace shedq
