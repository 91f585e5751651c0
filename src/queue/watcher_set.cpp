#include "queue/watcher_set.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace shedq {

WatcherSet::WatcherSet(std::shared_ptr<IClock> clock, ShedFn shed)
    : clock_(std::move(clock)),
      shed_(std::move(shed)) {
    thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
}

WatcherSet::~WatcherSet() {
    stop();
}

WatcherSet::WatchId WatcherSet::watch(std::shared_ptr<const IRequestContext> context) {
    const auto deadline = context->deadline();

    // Built outside mutex_: fires immediately if the context is already done
    auto on_done = std::make_unique<std::stop_callback<ShedRequest>>(
        context->done_token(), ShedRequest{this});

    std::lock_guard lock(mutex_);
    const WatchId id = next_id_++;
    registrations_.emplace(id, Registration{
        .context = std::move(context),
        .has_deadline = deadline.has_value(),
        .pending_deadline = deadline,
        .on_done = std::move(on_done),
    });
    if (deadline) {
        ++deadline_count_;
        deadlines_changed_ = true;
        cv_.notify_one();
    }
    return id;
}

void WatcherSet::unwatch(WatchId id) {
    unwatch(std::vector<WatchId>{id});
}

void WatcherSet::unwatch(const std::vector<WatchId>& ids) {
    if (ids.empty()) return;

    std::vector<Registration> released;
    released.reserve(ids.size());
    {
        std::lock_guard lock(mutex_);
        for (const WatchId id : ids) {
            auto node = registrations_.extract(id);
            if (!node.empty()) {
                if (node.mapped().has_deadline) --deadline_count_;
                released.push_back(std::move(node.mapped()));
            }
        }
    }
    // stop_callback destructors run here, outside mutex_
}

void WatcherSet::request_shed() {
    {
        std::lock_guard lock(mutex_);
        shed_requested_ = true;
    }
    cv_.notify_one();
}

size_t WatcherSet::active() const {
    std::lock_guard lock(mutex_);
    return registrations_.size();
}

bool WatcherSet::has_deadlines() const {
    std::lock_guard lock(mutex_);
    return deadline_count_ > 0;
}

void WatcherSet::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }

    std::unordered_map<WatchId, Registration> released;
    {
        std::lock_guard lock(mutex_);
        released.swap(registrations_);
        deadline_count_ = 0;
    }
}

void WatcherSet::watch_loop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    const auto woken = [this] { return shed_requested_ || deadlines_changed_; };

    while (!stop.stop_requested()) {
        if (shed_requested_) {
            shed_requested_ = false;
            lock.unlock();
            run_shed();
            lock.lock();
            continue;
        }

        deadlines_changed_ = false;
        const auto next = next_deadline_locked();
        if (!next) {
            cv_.wait(lock, stop, woken);
            continue;
        }

        const TimePoint now = clock_->now();
        if (now >= *next) {
            clear_reached_deadlines_locked(now);
            shed_requested_ = true;
            continue;
        }

        if (clock_->follows_real_time()) {
            cv_.wait_until(lock, stop, *next, woken);
        } else {
            cv_.wait_for(lock, stop, kClockPollInterval, woken);
        }
    }
}

void WatcherSet::run_shed() {
    try {
        shed_();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Queue watcher: shed pass failed: {}", e.what()));
    }
}

std::optional<TimePoint> WatcherSet::next_deadline_locked() const {
    std::optional<TimePoint> next;
    for (const auto& [id, reg] : registrations_) {
        if (reg.pending_deadline && (!next || *reg.pending_deadline < *next)) {
            next = reg.pending_deadline;
        }
    }
    return next;
}

void WatcherSet::clear_reached_deadlines_locked(TimePoint now) {
    for (auto& [id, reg] : registrations_) {
        if (reg.pending_deadline && *reg.pending_deadline <= now) {
            reg.pending_deadline.reset();
        }
    }
}

} // namespace shedq
