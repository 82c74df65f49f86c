// Single scalar objective made of three strictly prioritized terms:
//   primary   sum of weight * effective level over requested skills (capped per request)
//   secondary free slots weighted so one free slot of a size beats any number of smaller ones
//   tertiary  sum of effective levels over every skill
// Scales come from the model's own bounds, so no amount of a lower term can outweigh one unit
// of a higher term.
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include <z3++.h>

#include "../../engine/solver/SolverSession.h"
#include "ModelBuilder.h"
#include "Request.h"

namespace Loadout {

struct ObjectiveScales {
    std::array<std::int64_t, kMaxSlotSize> slotWeights{};  // index = slot size - 1
    std::int64_t primaryMax{0};
    std::int64_t secondaryMax{0};
    std::int64_t tertiaryMax{0};
    std::int64_t primaryScale{1};
    std::int64_t secondaryScale{1};
};

// Nullopt when the combined objective range does not fit in a signed 64-bit integer.
std::optional<ObjectiveScales> deriveScales(std::int64_t primaryMax,
                                            const std::array<std::int64_t, kMaxSlotSize>& maxFreeSlots,
                                            std::int64_t tertiaryMax);

struct ComposedObjective {
    z3::expr primary;
    z3::expr secondary;
    z3::expr tertiary;
    z3::expr total;
    ObjectiveScales scales;
};

class ObjectiveComposer {
public:
    explicit ObjectiveComposer(Forge::Solver::SolverSession& session);

    std::optional<ComposedObjective> compose(const LoadoutModel& model,
                                             const OptimizationRequest& request,
                                             std::string& error);

private:
    Forge::Solver::SolverSession& session_;
};

}  // namespace Loadout
