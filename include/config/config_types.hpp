#pragma once

#include "core/clock.hpp"
#include "queue/queue_config.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace shedq {

/// [queue] as written in the file; signed so negatives reach validation.
struct QueueSettings {
    int64_t timing_history = 100;
    int64_t discard_outliers = 1;
};

struct LoggingConfig {
    std::string level = "info";   // debug | info | warn | error
};

/**
 * @brief Everything a shedq.toml file can set
 */
struct ShedqConfig {
    QueueSettings queue;
    LoggingConfig logging;

    /**
     * @brief Queue construction settings for a validated config
     * @param clock  Time source; null selects the system clock
     */
    [[nodiscard]] QueueConfig queue_config(std::shared_ptr<IClock> clock = nullptr) const {
        QueueConfig cfg;
        cfg.clock = std::move(clock);
        cfg.timing_history = static_cast<size_t>(queue.timing_history);
        cfg.discard_outliers = static_cast<size_t>(queue.discard_outliers);
        return cfg;
    }
};

} // namespace shedq
