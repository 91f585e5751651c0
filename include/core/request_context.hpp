#pragma once

#include "core/clock.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

namespace shedq {

enum class ContextError : uint8_t {
    CANCELLED,
    DEADLINE_EXCEEDED
};

inline const char* context_error_to_string(ContextError err) {
    switch (err) {
        case ContextError::CANCELLED:         return "cancelled";
        case ContextError::DEADLINE_EXCEEDED: return "deadline exceeded";
        default:                              return "unknown";
    }
}

/**
 * @brief Cancellable request context, as seen by the queue
 *
 * None of these may block; the queue calls err() and deadline() while
 * holding its lock and registers stop_callbacks on done_token().
 * done_token() fires on explicit cancellation only. Deadline expiry is
 * observed by comparing deadline() against the clock.
 */
class IRequestContext {
public:
    virtual ~IRequestContext() = default;

    /// nullopt while the request is still live.
    [[nodiscard]] virtual std::optional<ContextError> err() const = 0;

    [[nodiscard]] virtual std::optional<TimePoint> deadline() const = 0;

    [[nodiscard]] virtual std::stop_token done_token() const = 0;
};

/**
 * @brief Default context implementation
 *
 * Done once cancel() is called or once the owning clock reaches the
 * deadline. Deadline expiry is judged against the injected clock, so a
 * ManualClock controls it.
 */
class RequestContext final : public IRequestContext {
public:
    explicit RequestContext(std::shared_ptr<IClock> clock,
                            std::optional<TimePoint> deadline = std::nullopt);

    [[nodiscard]] static std::shared_ptr<RequestContext> background(
        std::shared_ptr<IClock> clock);

    [[nodiscard]] static std::shared_ptr<RequestContext> with_deadline(
        std::shared_ptr<IClock> clock, TimePoint deadline);

    [[nodiscard]] static std::shared_ptr<RequestContext> with_timeout(
        std::shared_ptr<IClock> clock, Duration timeout);

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    [[nodiscard]] std::optional<ContextError> err() const override;
    [[nodiscard]] std::optional<TimePoint> deadline() const override { return deadline_; }
    [[nodiscard]] std::stop_token done_token() const override { return done_.get_token(); }

    /**
     * @brief Block until the context is done or stop is requested
     *
     * Sleeps until the exact deadline on a real-time clock; other clocks
     * are re-checked every kClockPollInterval.
     *
     * @return true if the context is done, false if woken by stop
     */
    bool wait_done(std::stop_token stop) const;

    /// Idempotent. Fires done_token() and wakes every wait_done() caller.
    void cancel();

    [[nodiscard]] bool is_cancelled() const;

private:
    [[nodiscard]] bool expired() const;

    std::shared_ptr<IClock> clock_;
    const std::optional<TimePoint> deadline_;
    std::stop_source done_;

    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;
    bool cancelled_ = false;
};

} // namespace shedq
