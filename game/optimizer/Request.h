// What the player asks for: weighted skills plus a weapon filter.
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Loadout {

struct SkillRequest {
    std::string skillId;
    int weight{1};                // >= 0; 0 means no preference beyond bonus accounting
    std::optional<int> levelCap;  // levels above this earn nothing in the primary objective
};

// Empty fields match everything. When both are set a weapon must satisfy both.
struct WeaponFilter {
    std::string weaponClass;
    std::vector<std::string> weaponIds;
};

struct OptimizationRequest {
    std::vector<SkillRequest> skills;
    WeaponFilter weapon;
};

}  // namespace Loadout
