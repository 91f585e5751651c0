#pragma once

#include "core/clock.hpp"
#include "core/criticality.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace shedq {

/**
 * @brief What the planner needs to know about one buffered element
 *
 * Candidates are passed in buffer (arrival) order.
 */
struct ShedCandidate {
    Criticality criticality = Criticality::CRITICAL;
    std::optional<TimePoint> deadline;
    bool terminated = false;   // context already done
};

enum class ShedVerdict : uint8_t {
    KEEP,
    DEAD,   // context terminated before the pass
    LATE    // would miss its deadline at its projected slot
};

inline const char* shed_verdict_to_string(ShedVerdict v) {
    switch (v) {
        case ShedVerdict::KEEP: return "keep";
        case ShedVerdict::DEAD: return "dead";
        case ShedVerdict::LATE: return "late";
        default:                return "keep";
    }
}

struct ShedPlan {
    std::vector<ShedVerdict> verdicts;   // parallel to the candidates
    size_t dead = 0;
    size_t late = 0;

    [[nodiscard]] size_t shed_count() const { return dead + late; }
    [[nodiscard]] bool empty() const { return shed_count() == 0; }
};

/**
 * @brief Decide which buffered elements a shed pass removes
 *
 * Phase 1 marks every terminated candidate DEAD.
 *
 * Phase 2 runs only when expected_wait > 0. Survivors are stable-sorted
 * by criticality descending (arrival order breaks ties) and walked with a
 * slot counter k: an element whose deadline is before now + k * expected_wait
 * is LATE and takes no slot, anything else takes slot k and k advances.
 * More critical work therefore always claims the earliest slots and lower
 * tiers only get what is left.
 *
 * The plan never reorders anything; the caller keeps the KEEP elements in
 * their original order.
 */
[[nodiscard]] ShedPlan plan_shed(std::span<const ShedCandidate> candidates,
                                 TimePoint now,
                                 Duration expected_wait);

} // namespace shedq
