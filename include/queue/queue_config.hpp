#pragma once

#include "core/clock.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace shedq {

/**
 * @brief Queue construction parameters
 *
 * timing_history must exceed 2 * discard_outliers, otherwise the trimmed
 * window is empty. A null clock means the real system clock.
 */
struct QueueConfig {
    std::shared_ptr<IClock> clock;
    size_t timing_history = 100;   // dequeue intervals kept for the estimate
    size_t discard_outliers = 1;   // dropped from each end before averaging
};

/// Empty when the config is usable.
[[nodiscard]] std::vector<std::string> validate_queue_config(const QueueConfig& config);

/**
 * @brief Validate and fill in defaults
 * @throws ConfigError when validation fails
 */
[[nodiscard]] QueueConfig resolve_queue_config(QueueConfig config);

} // namespace shedq
