#pragma once

#include "core/clock.hpp"
#include "core/criticality.hpp"
#include "core/request_context.hpp"
#include "core/utils.hpp"
#include "queue/queue_config.hpp"
#include "queue/shed_planner.hpp"
#include "queue/timing_estimator.hpp"
#include "queue/watcher_set.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace shedq {

/**
 * @brief FIFO admission queue that sheds work it cannot serve in time
 *
 * Elements leave in arrival order. Every remove() and every watcher
 * wake-up runs a shed pass (see plan_shed) that:
 * - drops elements whose context is already done, and
 * - once the dequeue rate is known, drops elements that would miss their
 *   deadline, filling projected service slots from the highest
 *   criticality down so low tiers are sacrificed first.
 * A shed element is told exactly once through its cancel callback.
 *
 * Thread-safety: one mutex guards the buffer, timing state and counters.
 * Cancel callbacks run with that mutex held and must not call back into
 * the queue. Cancellation and deadlines are watched by a single WatcherSet
 * thread per queue; each buffered element holds one registration there.
 *
 * @tparam T  Payload type (must be move-constructible)
 */
template<typename T>
    requires std::is_move_constructible_v<T>
class SheddingQueue {
public:
    using CancelFn = std::function<void()>;

    struct Stats {
        uint64_t inserted;
        uint64_t removed;
        uint64_t shed_dead;
        uint64_t shed_late;
        size_t length;
        size_t active_watchers;
        Duration expected_wait;
    };

    /**
     * @throws ConfigError if timing_history <= 2 * discard_outliers
     */
    explicit SheddingQueue(QueueConfig config = {})
        : config_(resolve_queue_config(std::move(config))),
          timing_(config_.timing_history, config_.discard_outliers, config_.clock->now()),
          watchers_(config_.clock, [this] { shed(); }) {
        utils::log::info(std::format("Shedding queue: created (timing_history={}, discard_outliers={})",
                                     config_.timing_history, config_.discard_outliers));
    }

    /// Stops the watcher; elements still buffered are dropped without cancel().
    ~SheddingQueue() {
        watchers_.stop();
    }

    SheddingQueue(const SheddingQueue&) = delete;
    SheddingQueue& operator=(const SheddingQueue&) = delete;

    /**
     * @brief Append an element at the tail and register it for watching
     *
     * @param context  Request context; null is treated as a context that
     *                 never ends and has no deadline
     * @param crit     Importance tier used when shedding
     * @param value    Payload handed back by remove()
     * @param cancel   Invoked once if the element is shed
     *
     * The element is registered before it becomes visible, so a failure
     * leaves neither a buffered element nor a registration behind.
     */
    void insert(std::shared_ptr<const IRequestContext> context, Criticality crit,
                T value, CancelFn cancel) {
        if (!context) {
            context = RequestContext::background(config_.clock);
        }

        const WatcherSet::WatchId watch_id = watchers_.watch(context);
        try {
            std::lock_guard lock(mutex_);
            buffer_.push_back(Element{
                .context = context,
                .cancel = std::move(cancel),
                .criticality = crit,
                .value = std::move(value),
                .enqueued_at = config_.clock->now(),
                .watch_id = watch_id,
            });
            ++inserted_;
        } catch (...) {
            watchers_.unwatch(watch_id);
            throw;
        }
        // A context that finished before the push fired its callback too
        // early. Without deadlines an arrival cannot make anything late.
        if (context->err() || watchers_.has_deadlines()) {
            watchers_.request_shed();
        }
    }

    /**
     * @brief Shed, then pop the head
     * @return The head payload, or nullopt if nothing is left after shedding
     */
    [[nodiscard]] std::optional<T> remove() {
        std::optional<T> result;
        ShedOutcome outcome;
        {
            std::lock_guard lock(mutex_);
            outcome = shed_locked();
            if (!buffer_.empty()) {
                Element head = std::move(buffer_.front());
                buffer_.pop_front();
                outcome.released.push_back(head.watch_id);
                timing_.record_dequeue(config_.clock->now());
                ++removed_;
                result.emplace(std::move(head.value));
            }
        }
        watchers_.unwatch(outcome.released);
        log_shed(outcome);
        return result;
    }

    /// Current buffer size as of the last shed pass.
    [[nodiscard]] size_t len() const {
        std::lock_guard lock(mutex_);
        return buffer_.size();
    }

    /// Run one shed pass now.
    void shed() {
        ShedOutcome outcome;
        {
            std::lock_guard lock(mutex_);
            outcome = shed_locked();
        }
        watchers_.unwatch(outcome.released);
        log_shed(outcome);
    }

    /// Estimated service time per element; zero until the window is full.
    [[nodiscard]] Duration expected_wait() const {
        std::lock_guard lock(mutex_);
        return timing_.expected_wait();
    }

    /// Elements currently registered with the watcher.
    [[nodiscard]] size_t active_watchers() const { return watchers_.active(); }

    [[nodiscard]] Stats get_stats() const {
        Stats stats{};
        {
            std::lock_guard lock(mutex_);
            stats.inserted = inserted_;
            stats.removed = removed_;
            stats.shed_dead = shed_dead_;
            stats.shed_late = shed_late_;
            stats.length = buffer_.size();
            stats.expected_wait = timing_.expected_wait();
        }
        stats.active_watchers = watchers_.active();
        return stats;
    }

    [[nodiscard]] const QueueConfig& config() const { return config_; }

private:
    struct Element {
        std::shared_ptr<const IRequestContext> context;
        CancelFn cancel;
        Criticality criticality;
        T value;
        TimePoint enqueued_at;
        WatcherSet::WatchId watch_id;   // released once the element leaves
    };

    struct ShedOutcome {
        size_t dead = 0;
        size_t late = 0;
        size_t remaining = 0;
        Duration expected_wait{0};
        std::vector<WatcherSet::WatchId> released;   // unwatched after unlock
    };

    // Caller holds mutex_
    ShedOutcome shed_locked() {
        ShedOutcome outcome;
        outcome.expected_wait = timing_.expected_wait();

        const TimePoint now = config_.clock->now();
        std::vector<ShedCandidate> candidates;
        candidates.reserve(buffer_.size());
        for (const auto& e : buffer_) {
            candidates.push_back(ShedCandidate{
                .criticality = e.criticality,
                .deadline = e.context->deadline(),
                .terminated = e.context->err().has_value(),
            });
        }

        const ShedPlan plan = plan_shed(candidates, now, outcome.expected_wait);
        if (plan.empty()) {
            outcome.remaining = buffer_.size();
            return outcome;
        }

        std::deque<Element> kept;
        for (size_t i = 0; i < buffer_.size(); ++i) {
            if (plan.verdicts[i] == ShedVerdict::KEEP) {
                kept.push_back(std::move(buffer_[i]));
            } else {
                outcome.released.push_back(buffer_[i].watch_id);
                notify_shed(buffer_[i], plan.verdicts[i]);
            }
        }
        buffer_.swap(kept);

        shed_dead_ += plan.dead;
        shed_late_ += plan.late;
        outcome.dead = plan.dead;
        outcome.late = plan.late;
        outcome.remaining = buffer_.size();
        return outcome;
    }

    void notify_shed(Element& e, ShedVerdict verdict) {
        if (!e.cancel) return;
        try {
            e.cancel();
        } catch (const std::exception& ex) {
            utils::log::warn(std::format("Shedding queue: cancel callback for {} element ({}) threw: {}",
                                         shed_verdict_to_string(verdict),
                                         criticality_to_string(e.criticality), ex.what()));
        }
    }

    void log_shed(const ShedOutcome& outcome) const {
        if (outcome.dead + outcome.late == 0) return;
        if (!utils::log::enabled(utils::log::Level::DEBUG)) return;
        utils::log::debug(std::format("Shedding queue: shed {} dead, {} late (expected_wait={}, remaining={})",
                                      outcome.dead, outcome.late,
                                      utils::format_ms(outcome.expected_wait), outcome.remaining));
    }

    const QueueConfig config_;

    mutable std::mutex mutex_;
    std::deque<Element> buffer_;
    mutable TimingEstimator timing_;

    uint64_t inserted_ = 0;
    uint64_t removed_ = 0;
    uint64_t shed_dead_ = 0;
    uint64_t shed_late_ = 0;

    WatcherSet watchers_;
};

} // namespace shedq
