#include "SkillAggregator.h"

#include <algorithm>
#include <string>

namespace Loadout {

int effectiveLevel(const SkillDef& skill, int raw) {
    const int value = std::max(raw, 0);
    const int cappedValue = std::min(value, skill.maxLevel);
    if (const auto* group = std::get_if<GroupActivation>(&skill.activation)) {
        return value >= group->threshold ? cappedValue : 0;
    }
    if (const auto* series = std::get_if<SeriesActivation>(&skill.activation)) {
        int level = 0;
        for (const auto& step : series->steps) {
            if (value >= step.threshold) level = step.level;
        }
        return std::min(level, skill.maxLevel);
    }
    return cappedValue;
}

SkillAggregator::SkillAggregator(Forge::Solver::SolverSession& session) : session_(session) {}

z3::expr SkillAggregator::capped(const z3::expr& raw, int maxLevel) {
    z3::expr max = session_.constant(maxLevel);
    return z3::ite(raw < max, raw, max);
}

z3::expr SkillAggregator::effectiveLevel(const SkillDef& skill, const z3::expr& raw, std::int64_t rawUpperBound) {
    const std::string prefix = "skill_" + skill.id;
    z3::expr effective = session_.intVar(prefix + "_effective", 0, skill.maxLevel);

    if (const auto* group = std::get_if<GroupActivation>(&skill.activation)) {
        // active <=> raw >= threshold, so the two branches below can never both apply.
        z3::expr active = session_.boolVar(prefix + "_active");
        session_.require(active == (raw >= session_.constant(group->threshold)));
        session_.require(effective == z3::ite(active, capped(raw, skill.maxLevel), session_.constant(0)));
        return effective;
    }

    if (const auto* series = std::get_if<SeriesActivation>(&skill.activation)) {
        // Half-open intervals [lo, hi) over 0..rawUpperBound, one indicator each; the first covers
        // the points below the lowest threshold, the last is open-ended.
        std::vector<int> lows{0};
        std::vector<int> levels{0};
        for (const auto& step : series->steps) {
            lows.push_back(step.threshold);
            levels.push_back(std::min(step.level, skill.maxLevel));
        }

        z3::expr_vector indicators(session_.context());
        for (std::size_t i = 0; i < lows.size(); ++i) {
            z3::expr inside = session_.boolVar(prefix + "_interval_" + std::to_string(i));
            z3::expr condition = raw >= session_.constant(lows[i]);
            if (i + 1 < lows.size()) condition = condition && raw < session_.constant(lows[i + 1]);
            session_.require(inside == condition);
            session_.require(z3::implies(inside, effective == session_.constant(levels[i])));
            indicators.push_back(inside);
        }
        session_.require(z3::atmost(indicators, 1));
        session_.require(z3::atleast(indicators, 1));
        session_.require(raw <= session_.constant(std::max<std::int64_t>(rawUpperBound, 0)));
        return effective;
    }

    session_.require(effective == capped(raw, skill.maxLevel));
    return effective;
}

}  // namespace Loadout
