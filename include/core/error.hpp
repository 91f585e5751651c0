#pragma once

#include <stdexcept>
#include <string>

namespace shedq {

/**
 * @brief Invalid queue tuning detected at construction
 *
 * Treated as fatal misconfiguration: the queue refuses to exist rather
 * than run with a window that cannot produce a trimmed mean.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace shedq
