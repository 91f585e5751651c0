#include <catch2/catch_test_macros.hpp>
#include "queue/shed_planner.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace shedq;
using namespace std::chrono_literals;

namespace {

const TimePoint kNow = TimePoint{} + std::chrono::hours(1);

ShedCandidate item(Criticality crit, std::optional<TimePoint> deadline = std::nullopt,
                   bool terminated = false) {
    return ShedCandidate{.criticality = crit, .deadline = deadline, .terminated = terminated};
}

} // anonymous namespace

TEST_CASE("ShedPlanner: empty input yields empty plan", "[shed_planner]") {
    const std::vector<ShedCandidate> none;
    const auto plan = plan_shed(none, kNow, 200ms);
    CHECK(plan.verdicts.empty());
    CHECK(plan.empty());
}

TEST_CASE("ShedPlanner: terminated contexts are always dropped", "[shed_planner]") {
    const std::vector<ShedCandidate> items = {
        item(Criticality::CRITICAL),
        item(Criticality::CRITICAL_PLUS, std::nullopt, true),
        item(Criticality::SHEDDABLE),
    };

    const auto plan = plan_shed(items, kNow, Duration::zero());
    CHECK(plan.verdicts[0] == ShedVerdict::KEEP);
    CHECK(plan.verdicts[1] == ShedVerdict::DEAD);
    CHECK(plan.verdicts[2] == ShedVerdict::KEEP);
    CHECK(plan.dead == 1);
    CHECK(plan.late == 0);
}

TEST_CASE("ShedPlanner: no deadline shedding while the estimate is cold", "[shed_planner]") {
    // Deadline already one hour away from being reachable, but no rate estimate yet
    const std::vector<ShedCandidate> items = {
        item(Criticality::SHEDDABLE, kNow),
        item(Criticality::SHEDDABLE, kNow + 1ns),
        item(Criticality::SHEDDABLE, kNow + 1ns),
    };

    const auto plan = plan_shed(items, kNow, Duration::zero());
    CHECK(plan.empty());
}

TEST_CASE("ShedPlanner: element past its projected slot is late", "[shed_planner]") {
    // Slots at +0, +200, +400; the third deadline is +150
    const std::vector<ShedCandidate> items = {
        item(Criticality::CRITICAL),
        item(Criticality::CRITICAL),
        item(Criticality::CRITICAL, kNow + 150ms),
    };

    const auto plan = plan_shed(items, kNow, 200ms);
    CHECK(plan.verdicts[0] == ShedVerdict::KEEP);
    CHECK(plan.verdicts[1] == ShedVerdict::KEEP);
    CHECK(plan.verdicts[2] == ShedVerdict::LATE);
    CHECK(plan.late == 1);
}

TEST_CASE("ShedPlanner: deadline equal to projection is kept", "[shed_planner]") {
    const std::vector<ShedCandidate> items = {
        item(Criticality::CRITICAL),
        item(Criticality::CRITICAL, kNow + 200ms),
    };

    const auto plan = plan_shed(items, kNow, 200ms);
    CHECK(plan.empty());
}

TEST_CASE("ShedPlanner: higher criticality claims the earliest slot", "[shed_planner]") {
    // The late arrival is more critical, so it is projected at slot 0 and
    // pushes the sheddable item with the +300ms deadline to slot 2 (+400ms)
    const std::vector<ShedCandidate> items = {
        item(Criticality::SHEDDABLE),
        item(Criticality::SHEDDABLE, kNow + 300ms),
        item(Criticality::CRITICAL_PLUS, kNow + 50ms),
    };

    const auto plan = plan_shed(items, kNow, 200ms);
    CHECK(plan.verdicts[0] == ShedVerdict::KEEP);
    CHECK(plan.verdicts[1] == ShedVerdict::LATE);
    CHECK(plan.verdicts[2] == ShedVerdict::KEEP);
}

TEST_CASE("ShedPlanner: shed elements do not consume a slot", "[shed_planner]") {
    const std::vector<ShedCandidate> items = {
        item(Criticality::CRITICAL),
        item(Criticality::CRITICAL, kNow + 10ms),    // slot 1 at +100: late
        item(Criticality::CRITICAL, kNow + 100ms),   // takes slot 1 instead
    };

    const auto plan = plan_shed(items, kNow, 100ms);
    CHECK(plan.verdicts[1] == ShedVerdict::LATE);
    CHECK(plan.verdicts[2] == ShedVerdict::KEEP);
}

TEST_CASE("ShedPlanner: dead elements do not consume a slot", "[shed_planner]") {
    const std::vector<ShedCandidate> items = {
        item(Criticality::CRITICAL, std::nullopt, true),
        item(Criticality::CRITICAL, kNow),
    };

    const auto plan = plan_shed(items, kNow, 100ms);
    CHECK(plan.verdicts[0] == ShedVerdict::DEAD);
    CHECK(plan.verdicts[1] == ShedVerdict::KEEP);
    CHECK(plan.shed_count() == 1);
}

TEST_CASE("ShedPlanner: ties keep arrival order", "[shed_planner]") {
    // Same tier and same deadline: the earlier arrival gets the slot
    const std::vector<ShedCandidate> items = {
        item(Criticality::CRITICAL),
        item(Criticality::SHEDDABLE, kNow + 150ms),
        item(Criticality::SHEDDABLE, kNow + 150ms),
    };

    const auto plan = plan_shed(items, kNow, 100ms);
    CHECK(plan.verdicts[1] == ShedVerdict::KEEP);
    CHECK(plan.verdicts[2] == ShedVerdict::LATE);
}

TEST_CASE("ShedPlanner: raising criticality never causes shedding", "[shed_planner]") {
    const Criticality tiers[] = {
        Criticality::SHEDDABLE, Criticality::SHEDDABLE_PLUS,
        Criticality::CRITICAL, Criticality::CRITICAL_PLUS,
    };

    // The last element competes against a fixed mix of other tiers
    bool shed_at_lower = true;
    for (const auto tier : tiers) {
        const std::vector<ShedCandidate> items = {
            item(Criticality::CRITICAL_PLUS),
            item(Criticality::CRITICAL),
            item(Criticality::SHEDDABLE_PLUS),
            item(tier, kNow + 250ms),
        };
        const auto plan = plan_shed(items, kNow, 100ms);
        const bool shed = plan.verdicts[3] != ShedVerdict::KEEP;

        // Once kept at some tier, every higher tier keeps it too
        if (!shed_at_lower) {
            CHECK_FALSE(shed);
        }
        shed_at_lower = shed;
    }
    CHECK_FALSE(shed_at_lower);
}

TEST_CASE("ShedPlanner: lower tier goes first at equal deadlines", "[shed_planner]") {
    const std::vector<ShedCandidate> items = {
        item(Criticality::CRITICAL),
        item(Criticality::SHEDDABLE, kNow + 150ms),
        item(Criticality::CRITICAL, kNow + 150ms),
    };

    const auto plan = plan_shed(items, kNow, 100ms);
    CHECK(plan.verdicts[1] == ShedVerdict::LATE);
    CHECK(plan.verdicts[2] == ShedVerdict::KEEP);
}

TEST_CASE("Criticality: tiers are ordered and parse by name", "[criticality]") {
    CHECK(Criticality::SHEDDABLE < Criticality::SHEDDABLE_PLUS);
    CHECK(Criticality::SHEDDABLE_PLUS < Criticality::CRITICAL);
    CHECK(Criticality::CRITICAL < Criticality::CRITICAL_PLUS);

    CHECK(parse_criticality("critical_plus") == Criticality::CRITICAL_PLUS);
    CHECK(parse_criticality("sheddable") == Criticality::SHEDDABLE);
    CHECK(parse_criticality("bogus") == Criticality::CRITICAL);
    CHECK(std::string(criticality_to_string(Criticality::SHEDDABLE_PLUS)) == "sheddable_plus");
}
