#include "queue/queue_config.hpp"
#include "core/error.hpp"

#include <format>

namespace shedq {

std::vector<std::string> validate_queue_config(const QueueConfig& config) {
    std::vector<std::string> errors;

    if (config.timing_history <= 2 * config.discard_outliers) {
        errors.push_back(std::format(
            "queue.timing_history ({}) must be greater than 2 * queue.discard_outliers ({})",
            config.timing_history, config.discard_outliers));
    }

    return errors;
}

QueueConfig resolve_queue_config(QueueConfig config) {
    const auto errors = validate_queue_config(config);
    if (!errors.empty()) {
        std::string combined = "Invalid queue config:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        throw ConfigError(combined);
    }
    if (!config.clock) {
        config.clock = std::make_shared<SystemClock>();
    }
    return config;
}

} // namespace shedq
