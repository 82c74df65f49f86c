// Decoded result of one optimization run.
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../catalog/Catalog.h"

namespace Loadout {

struct JewelPlacement {
    std::string jewelId;
    std::string holderId;  // piece or weapon carrying the slot
    SlotPool pool{SlotPool::Armor};
    int slotIndex{0};      // index into the holder's jewelSlots
    int slotSize{1};
    int jewelSize{1};
};

struct SkillLevel {
    std::string skillId;
    int rawPoints{0};
    int level{0};  // effective level after activation rules and the skill's maximum
};

struct Solution {
    std::array<std::string, kBodySlotCount> pieces{};  // piece id per body slot
    std::optional<std::string> charm;
    std::string weapon;
    std::vector<JewelPlacement> jewels;
    std::vector<SkillLevel> skills;  // requested skills and any skill with points, in catalog order
    std::array<int, kMaxSlotSize> freeSlots{};  // index = slot size - 1, both pools
    bool optimal{false};

    const std::string& piece(BodySlot slot) const { return pieces[static_cast<std::size_t>(slot)]; }
    int levelOf(std::string_view skillId) const;
};

enum class SolveStatus {
    Optimal,
    Feasible,  // time limit reached; best assignment found so far
    CatalogInconsistency,
    Infeasible,
    Timeout,  // time limit reached with nothing to report
    Cancelled,
    SolverInternalError
};

const char* solveStatusName(SolveStatus status);

struct SolveResult {
    SolveStatus status{SolveStatus::SolverInternalError};
    std::optional<Solution> solution;
    std::string message;
    double solveSeconds{0.0};

    bool ok() const { return solution.has_value(); }
};

}  // namespace Loadout
