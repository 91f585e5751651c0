#include "queue/shed_planner.hpp"

#include <algorithm>

namespace shedq {

ShedPlan plan_shed(std::span<const ShedCandidate> candidates,
                   TimePoint now,
                   Duration expected_wait) {
    ShedPlan plan;
    plan.verdicts.assign(candidates.size(), ShedVerdict::KEEP);

    // Phase 1: drop anything already dead
    std::vector<size_t> live;
    live.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].terminated) {
            plan.verdicts[i] = ShedVerdict::DEAD;
            ++plan.dead;
        } else {
            live.push_back(i);
        }
    }

    if (expected_wait <= Duration::zero()) {
        return plan;
    }

    // Phase 2: project completion times, most critical first
    std::stable_sort(live.begin(), live.end(), [&](size_t a, size_t b) {
        return candidates[a].criticality > candidates[b].criticality;
    });

    int64_t slot = 0;
    for (const size_t i : live) {
        const TimePoint projected = now + slot * expected_wait;
        const auto& deadline = candidates[i].deadline;
        if (deadline && *deadline < projected) {
            plan.verdicts[i] = ShedVerdict::LATE;
            ++plan.late;
            continue;
        }
        ++slot;
    }

    return plan;
}

} // namespace shedq
