#include "queue/timing_estimator.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace shedq {

TimingEstimator::TimingEstimator(size_t history_size, size_t discard_outliers, TimePoint start)
    : history_size_(history_size),
      discard_outliers_(discard_outliers),
      last_dequeue_at_(start) {}

void TimingEstimator::record_dequeue(TimePoint now) {
    const Duration interval = now - last_dequeue_at_;
    last_dequeue_at_ = now;

    while (intervals_.size() >= history_size_) {
        intervals_.pop_front();
    }
    intervals_.push_back(interval);
    ++dequeue_generation_;
}

Duration TimingEstimator::expected_wait() {
    if (intervals_.size() < history_size_) {
        // Not enough data yet: disables deadline-based shedding
        expected_wait_ = Duration::zero();
        return expected_wait_;
    }
    if (computed_generation_ != dequeue_generation_) {
        recompute();
    }
    return expected_wait_;
}

void TimingEstimator::recompute() {
    std::vector<Duration> sorted(intervals_.begin(), intervals_.end());
    std::sort(sorted.begin(), sorted.end());

    const auto first = sorted.begin() + static_cast<std::ptrdiff_t>(discard_outliers_);
    const auto last = sorted.end() - static_cast<std::ptrdiff_t>(discard_outliers_);
    const auto count = static_cast<Duration::rep>(last - first);

    const Duration total = std::accumulate(first, last, Duration::zero());
    expected_wait_ = count > 0 ? total / count : Duration::zero();
    computed_generation_ = dequeue_generation_;
    expected_wait_computed_at_ = last_dequeue_at_;
}

} // namespace shedq
