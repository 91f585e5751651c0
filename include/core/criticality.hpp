#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>

namespace shedq {

/**
 * @brief Importance tier of a queued request
 *
 * Totally ordered; higher tiers are kept in preference to lower ones
 * when the queue cannot serve everything before its deadline.
 *   CRITICAL_PLUS  - user-facing, never shed while capacity remains
 *   CRITICAL       - default for interactive traffic
 *   SHEDDABLE_PLUS - may be shed, retried by the caller
 *   SHEDDABLE      - batch/background work, first to go
 */
enum class Criticality : uint8_t {
    SHEDDABLE = 0,
    SHEDDABLE_PLUS = 1,
    CRITICAL = 2,
    CRITICAL_PLUS = 3
};

inline constexpr std::string_view kCriticalityCriticalPlus  = "critical_plus";
inline constexpr std::string_view kCriticalityCritical      = "critical";
inline constexpr std::string_view kCriticalitySheddablePlus = "sheddable_plus";
inline constexpr std::string_view kCriticalitySheddable     = "sheddable";

/**
 * @brief Parse criticality name (O(1) hash lookup)
 * @return Criticality, defaults to CRITICAL if unrecognized
 */
inline Criticality parse_criticality(std::string_view str) {
    static const std::unordered_map<std::string_view, Criticality> kMap = {
        {kCriticalityCriticalPlus,  Criticality::CRITICAL_PLUS},
        {kCriticalityCritical,      Criticality::CRITICAL},
        {kCriticalitySheddablePlus, Criticality::SHEDDABLE_PLUS},
        {kCriticalitySheddable,     Criticality::SHEDDABLE},
    };
    const auto it = kMap.find(str);
    return (it != kMap.end()) ? it->second : Criticality::CRITICAL;
}

inline const char* criticality_to_string(Criticality crit) {
    switch (crit) {
        case Criticality::SHEDDABLE:      return "sheddable";
        case Criticality::SHEDDABLE_PLUS: return "sheddable_plus";
        case Criticality::CRITICAL:       return "critical";
        case Criticality::CRITICAL_PLUS:  return "critical_plus";
        default:                          return "critical";
    }
}

} // namespace shedq
