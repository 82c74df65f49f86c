#include "ObjectiveComposer.h"

#include <algorithm>
#include <limits>

#include "../../engine/solver/ConditionalSum.h"

namespace Loadout {

namespace {
constexpr std::int64_t kInt64Max = std::numeric_limits<std::int64_t>::max();

std::optional<std::int64_t> checkedMul(std::int64_t a, std::int64_t b) {
    if (a < 0 || b < 0) return std::nullopt;
    if (a != 0 && b > kInt64Max / a) return std::nullopt;
    return a * b;
}

std::optional<std::int64_t> checkedAdd(std::int64_t a, std::int64_t b) {
    if (a < 0 || b < 0 || b > kInt64Max - a) return std::nullopt;
    return a + b;
}
}  // namespace

std::optional<ObjectiveScales> deriveScales(std::int64_t primaryMax,
                                            const std::array<std::int64_t, kMaxSlotSize>& maxFreeSlots,
                                            std::int64_t tertiaryMax) {
    ObjectiveScales scales{};
    scales.primaryMax = primaryMax;
    scales.tertiaryMax = tertiaryMax;

    // Weight of size s exceeds the best total reachable with all smaller sizes, and the
    // weights strictly grow with size even when a size has no slots at all.
    std::int64_t below = 0;
    for (std::size_t t = 0; t < scales.slotWeights.size(); ++t) {
        const std::int64_t previous = t == 0 ? 0 : scales.slotWeights[t - 1];
        auto weight = checkedAdd(std::max(below, previous), 1);
        if (!weight) return std::nullopt;
        scales.slotWeights[t] = *weight;
        auto contribution = checkedMul(*weight, maxFreeSlots[t]);
        if (!contribution) return std::nullopt;
        auto next = checkedAdd(below, *contribution);
        if (!next) return std::nullopt;
        below = *next;
    }
    scales.secondaryMax = below;

    auto secondaryScale = checkedAdd(tertiaryMax, 1);
    if (!secondaryScale) return std::nullopt;
    scales.secondaryScale = *secondaryScale;

    auto secondarySpan = checkedAdd(scales.secondaryMax, 1);
    if (!secondarySpan) return std::nullopt;
    auto primaryScale = checkedMul(*secondarySpan, scales.secondaryScale);
    if (!primaryScale) return std::nullopt;
    scales.primaryScale = *primaryScale;

    // The total must stay representable: primaryMax * primaryScale + (primaryScale - 1).
    auto top = checkedMul(primaryMax, scales.primaryScale);
    if (!top || !checkedAdd(*top, scales.primaryScale - 1)) return std::nullopt;
    return scales;
}

ObjectiveComposer::ObjectiveComposer(Forge::Solver::SolverSession& session) : session_(session) {}

std::optional<ComposedObjective> ObjectiveComposer::compose(const LoadoutModel& model,
                                                            const OptimizationRequest& request,
                                                            std::string& error) {
    z3::context& ctx = session_.context();

    Forge::Solver::ConditionalSum primary(ctx);
    std::int64_t primaryMax = 0;
    for (const auto& r : request.skills) {
        const SkillVars* vars = model.findSkill(r.skillId);
        if (!vars || r.weight <= 0) continue;
        z3::expr level = vars->effective;
        int reachable = vars->skill->maxLevel;
        if (r.levelCap) {
            // Applied after activation: levels past the cap earn nothing here.
            z3::expr cap = session_.constant(*r.levelCap);
            level = z3::ite(level < cap, level, cap);
            reachable = std::min(reachable, *r.levelCap);
        }
        primary.addScaled(level, r.weight);
        std::optional<std::int64_t> sum;
        if (auto term = checkedMul(r.weight, reachable)) sum = checkedAdd(primaryMax, *term);
        if (!sum) {
            error = "requested skill weights overflow the objective range";
            return std::nullopt;
        }
        primaryMax = *sum;
    }

    std::array<std::int64_t, kMaxSlotSize> maxFree{};
    for (int size = 1; size <= kMaxSlotSize; ++size) {
        maxFree[static_cast<std::size_t>(size - 1)] = model.slots->maxFreeSlots(size);
    }

    Forge::Solver::ConditionalSum tertiary(ctx);
    std::int64_t tertiaryMax = 0;
    for (const auto& s : model.skills) {
        tertiary.addScaled(s.effective, 1);
        tertiaryMax += s.skill->maxLevel;
    }

    auto scales = deriveScales(primaryMax, maxFree, tertiaryMax);
    if (!scales) {
        error = "objective range does not fit in 64 bits for this catalog";
        return std::nullopt;
    }

    Forge::Solver::ConditionalSum secondary(ctx);
    for (int size = 1; size <= kMaxSlotSize; ++size) {
        secondary.addScaled(model.slots->freeSlots(size), scales->slotWeights[static_cast<std::size_t>(size - 1)]);
    }

    z3::expr primaryExpr = primary.build();
    z3::expr secondaryExpr = secondary.build();
    z3::expr tertiaryExpr = tertiary.build();

    Forge::Solver::ConditionalSum total(ctx);
    total.addScaled(primaryExpr, scales->primaryScale);
    total.addScaled(secondaryExpr, scales->secondaryScale);
    total.addScaled(tertiaryExpr, 1);

    return ComposedObjective{primaryExpr, secondaryExpr, tertiaryExpr, total.build(), *scales};
}

}  // namespace Loadout
