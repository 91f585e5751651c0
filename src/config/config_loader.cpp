#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <format>

namespace shedq {

namespace {

QueueSettings extract_queue(const toml::table& root) {
    QueueSettings cfg;
    const auto* q = root["queue"].as_table();
    if (!q) return cfg;

    cfg.timing_history = (*q)["timing_history"].value<int64_t>().value_or(cfg.timing_history);
    cfg.discard_outliers = (*q)["discard_outliers"].value<int64_t>().value_or(cfg.discard_outliers);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* l = root["logging"].as_table();
    if (!l) return cfg;

    cfg.level = (*l)["level"].value_or(cfg.level);
    return cfg;
}

ShedqConfig extract_all_sections(const toml::table& tbl) {
    ShedqConfig config;
    config.queue = extract_queue(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ShedqConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        utils::log::error(combined);
        return LoadResult::error(std::move(combined));
    }
    utils::log::debug(std::format("Config loaded: timing_history={}, discard_outliers={}, log_level={}",
                                  config.queue.timing_history, config.queue.discard_outliers,
                                  config.logging.level));
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = toml::parse_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        auto message = std::format("Failed to load config: {}", e.what());
        utils::log::error(message);
        return LoadResult::error(std::move(message));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        auto message = std::format("Failed to parse config: {}", e.what());
        utils::log::error(message);
        return LoadResult::error(std::move(message));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const ShedqConfig& config) {
    std::vector<std::string> errors;

    bool counts_valid = true;
    if (config.queue.timing_history < 0) {
        errors.push_back(std::format("queue.timing_history must be >= 0, got {}",
                                     config.queue.timing_history));
        counts_valid = false;
    }
    if (config.queue.discard_outliers < 0) {
        errors.push_back(std::format("queue.discard_outliers must be >= 0, got {}",
                                     config.queue.discard_outliers));
        counts_valid = false;
    }
    // Window check only makes sense once both counts are representable
    if (counts_valid) {
        auto window_errors = validate_queue_config(config.queue_config());
        errors.insert(errors.end(), window_errors.begin(), window_errors.end());
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got \"{}\"",
            config.logging.level));
    }

    return errors;
}

bool ConfigLoader::apply_logging(const LoggingConfig& logging) {
    const auto level = utils::log::parse_level(logging.level);
    if (!level) return false;
    utils::log::set_level(*level);
    return true;
}

} // namespace shedq
