// Maps a skill's raw point total to its effective level under the skill's activation rule.
#pragma once

#include <cstdint>

#include <z3++.h>

#include "../../engine/solver/SolverSession.h"
#include "../catalog/Catalog.h"

namespace Loadout {

// Reference semantics of the activation rules on plain integers.
//  standard: min(raw, max)
//  group:    0 below the threshold, min(raw, max) from it
//  series:   level of the last step whose threshold is <= raw, 0 below the first
int effectiveLevel(const SkillDef& skill, int raw);

class SkillAggregator {
public:
    explicit SkillAggregator(Forge::Solver::SolverSession& session);

    // Returns an Int variable tied to `raw` (Int, 0..rawUpperBound) by the skill's activation rule.
    z3::expr effectiveLevel(const SkillDef& skill, const z3::expr& raw, std::int64_t rawUpperBound);

private:
    z3::expr capped(const z3::expr& raw, int maxLevel);

    Forge::Solver::SolverSession& session_;
};

}  // namespace Loadout
