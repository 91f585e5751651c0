#pragma once

#include "core/clock.hpp"
#include "core/request_context.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

namespace shedq {

/**
 * @brief Turns element cancellation into queue shed passes
 *
 * One background thread per queue, however many elements are buffered.
 * Each watched element gets a registration holding a stop_callback on its
 * context's done_token() and its pending deadline. The thread runs a shed
 * pass whenever:
 * - request_shed() is called (inserts do while deadlines are registered,
 *   to catch elements that are unviable on arrival),
 * - a registered context is cancelled, or
 * - a registered deadline is reached on the queue clock.
 * Requests arriving while a pass runs are coalesced into the next pass.
 *
 * Registrations are dropped with unwatch() as soon as an element leaves
 * the queue, so nothing is kept alive for removed elements.
 *
 * Lock order: callers may hold the queue lock while a context cancel
 * reaches request_shed(), so mutex_ is never held while calling the shed
 * callback or destroying a stop_callback.
 */
class WatcherSet {
public:
    using ShedFn = std::function<void()>;
    using WatchId = uint64_t;

    WatcherSet(std::shared_ptr<IClock> clock, ShedFn shed);
    ~WatcherSet();

    // Non-copyable, non-movable (callbacks and the thread capture this)
    WatcherSet(const WatcherSet&) = delete;
    WatcherSet& operator=(const WatcherSet&) = delete;

    [[nodiscard]] WatchId watch(std::shared_ptr<const IRequestContext> context);

    void unwatch(WatchId id);
    void unwatch(const std::vector<WatchId>& ids);

    void request_shed();

    /// Registered elements.
    [[nodiscard]] size_t active() const;

    /// True if any registered context carries a deadline.
    [[nodiscard]] bool has_deadlines() const;

    /// Join the thread and drop every registration. Idempotent.
    void stop();

private:
    struct ShedRequest {
        WatcherSet* owner;
        void operator()() const { owner->request_shed(); }
    };

    struct Registration {
        std::shared_ptr<const IRequestContext> context;
        bool has_deadline;
        std::optional<TimePoint> pending_deadline;   // cleared once reached
        std::unique_ptr<std::stop_callback<ShedRequest>> on_done;
    };

    void watch_loop(std::stop_token stop);
    void run_shed();
    [[nodiscard]] std::optional<TimePoint> next_deadline_locked() const;
    void clear_reached_deadlines_locked(TimePoint now);

    std::shared_ptr<IClock> clock_;
    ShedFn shed_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::unordered_map<WatchId, Registration> registrations_;
    size_t deadline_count_ = 0;
    WatchId next_id_ = 1;
    bool shed_requested_ = false;
    bool deadlines_changed_ = false;

    std::jthread thread_;   // last: starts once everything above exists
};

} // namespace shedq
