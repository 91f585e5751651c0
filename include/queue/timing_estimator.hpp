#pragma once

#include "core/clock.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>

namespace shedq {

/**
 * @brief Rolling trimmed-mean estimate of per-item service time
 *
 * Each dequeue records the interval since the previous one (the first is
 * measured from construction). Once the window holds history_size samples
 * the estimate is the mean of the window after dropping discard_outliers
 * samples from each end of the sorted order. Until then it is zero,
 * which callers treat as "unknown".
 *
 * Recomputation is lazy and memoized on the dequeue generation.
 * Not thread-safe; the owning queue serializes access.
 */
class TimingEstimator {
public:
    TimingEstimator(size_t history_size, size_t discard_outliers, TimePoint start);

    void record_dequeue(TimePoint now);

    /// Zero until the window is full.
    [[nodiscard]] Duration expected_wait();

    [[nodiscard]] bool warmed_up() const { return intervals_.size() >= history_size_; }
    [[nodiscard]] size_t sample_count() const { return intervals_.size(); }
    [[nodiscard]] TimePoint last_dequeue_at() const { return last_dequeue_at_; }
    [[nodiscard]] TimePoint expected_wait_computed_at() const { return expected_wait_computed_at_; }
    [[nodiscard]] const std::deque<Duration>& intervals() const { return intervals_; }

private:
    void recompute();

    const size_t history_size_;
    const size_t discard_outliers_;

    TimePoint last_dequeue_at_;
    std::deque<Duration> intervals_;
    uint64_t dequeue_generation_ = 0;

    Duration expected_wait_{0};
    uint64_t computed_generation_ = 0;
    TimePoint expected_wait_computed_at_{};
};

} // namespace shedq
