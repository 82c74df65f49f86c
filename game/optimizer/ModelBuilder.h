// Turns a catalog and a request into decision variables and constraints.
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <z3++.h>

#include "../../engine/solver/SolverSession.h"
#include "../catalog/Catalog.h"
#include "Request.h"
#include "SlotAllocator.h"

namespace Loadout {

struct PieceChoice {
    const EquipmentPiece* piece;
    z3::expr selected;
};

struct CharmChoice {
    const Charm* charm;
    z3::expr selected;
};

struct WeaponChoice {
    const Weapon* weapon;
    z3::expr selected;  // literal true when the filter leaves a single weapon
};

struct SkillVars {
    const SkillDef* skill;
    z3::expr raw;
    z3::expr effective;
    std::int64_t rawUpperBound;
};

struct LoadoutModel {
    std::array<std::vector<PieceChoice>, kBodySlotCount> pieces;
    std::vector<CharmChoice> charms;
    std::vector<WeaponChoice> weapons;
    std::vector<SkillVars> skills;  // one per catalog skill, catalog order
    std::unique_ptr<SlotAllocator> slots;

    const SkillVars* findSkill(std::string_view id) const;
};

// Weapons passing the filter, in catalog order.
std::vector<const Weapon*> filterWeapons(const Catalog& catalog, const WeaponFilter& filter);

// Request-level consistency: known skills, no duplicates, non-negative weights and caps,
// and a weapon filter that matches at least one weapon.
std::vector<std::string> validateRequest(const Catalog& catalog, const OptimizationRequest& request);

class ModelBuilder {
public:
    ModelBuilder(const Catalog& catalog, Forge::Solver::SolverSession& session);

    // Returns nullopt and fills `issues` when the catalog or the request is inconsistent.
    // Unreachable skill levels are never an error here.
    std::optional<LoadoutModel> build(const OptimizationRequest& request, std::vector<std::string>& issues);

private:
    void addPieces(LoadoutModel& model);
    void addCharms(LoadoutModel& model);
    void addWeapons(LoadoutModel& model, const std::vector<const Weapon*>& candidates);
    void addSkills(LoadoutModel& model);
    std::int64_t rawUpperBound(const LoadoutModel& model, const std::string& skillId) const;
    void exactlyOne(const z3::expr_vector& literals);

    const Catalog& catalog_;
    Forge::Solver::SolverSession& session_;
};

}  // namespace Loadout
