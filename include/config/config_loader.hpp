#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace shedq {

/**
 * @brief Loads queue and logging settings from TOML
 *
 *   [queue]
 *   timing_history = 100
 *   discard_outliers = 1
 *
 *   [logging]
 *   level = "info"
 *
 * Missing sections and keys keep their defaults. Never throws: parse and
 * validation failures come back in LoadResult.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ShedqConfig config;

        static LoadResult ok(ShedqConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to shedq.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    [[nodiscard]] static std::vector<std::string> validate_config(const ShedqConfig& config);

    /// Set the process-wide log threshold. Returns false for an unknown level.
    static bool apply_logging(const LoggingConfig& logging);

private:
    static LoadResult validate_and_return(ShedqConfig config);
};

} // namespace shedq
