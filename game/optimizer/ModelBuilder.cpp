#include "ModelBuilder.h"

#include <algorithm>
#include <map>
#include <set>

#include "../../engine/core/Logger.h"
#include "../../engine/solver/ConditionalSum.h"
#include "SkillAggregator.h"

namespace Loadout {

namespace {
int pointsFor(const SkillPoints& points, const std::string& skillId) {
    auto it = points.find(skillId);
    return it == points.end() ? 0 : std::max(it->second, 0);
}
}  // namespace

const SkillVars* LoadoutModel::findSkill(std::string_view id) const {
    auto it = std::find_if(skills.begin(), skills.end(), [id](const SkillVars& s) { return s.skill->id == id; });
    return it == skills.end() ? nullptr : &*it;
}

std::vector<const Weapon*> filterWeapons(const Catalog& catalog, const WeaponFilter& filter) {
    std::vector<const Weapon*> out;
    for (const auto& w : catalog.weapons) {
        if (!filter.weaponClass.empty() && w.weaponClass != filter.weaponClass) continue;
        if (!filter.weaponIds.empty() &&
            std::find(filter.weaponIds.begin(), filter.weaponIds.end(), w.id) == filter.weaponIds.end()) {
            continue;
        }
        out.push_back(&w);
    }
    return out;
}

std::vector<std::string> validateRequest(const Catalog& catalog, const OptimizationRequest& request) {
    std::vector<std::string> issues;
    std::set<std::string> seen;
    for (const auto& r : request.skills) {
        if (!findSkill(catalog, r.skillId)) {
            issues.push_back("request references unknown skill '" + r.skillId + "'");
        }
        if (!seen.insert(r.skillId).second) {
            issues.push_back("skill '" + r.skillId + "' requested more than once");
        }
        if (r.weight < 0) {
            issues.push_back("skill '" + r.skillId + "' has a negative weight");
        }
        if (r.levelCap && *r.levelCap < 0) {
            issues.push_back("skill '" + r.skillId + "' has a negative level cap");
        }
    }
    if (filterWeapons(catalog, request.weapon).empty()) {
        std::string filter = request.weapon.weaponClass.empty() ? "any class" : "class '" + request.weapon.weaponClass + "'";
        for (const auto& id : request.weapon.weaponIds) filter += ", id '" + id + "'";
        issues.push_back("weapon filter (" + filter + ") matches no weapon");
    }
    return issues;
}

ModelBuilder::ModelBuilder(const Catalog& catalog, Forge::Solver::SolverSession& session)
    : catalog_(catalog), session_(session) {}

std::optional<LoadoutModel> ModelBuilder::build(const OptimizationRequest& request, std::vector<std::string>& issues) {
    issues = validateCatalog(catalog_);
    const auto requestIssues = validateRequest(catalog_, request);
    issues.insert(issues.end(), requestIssues.begin(), requestIssues.end());
    if (!issues.empty()) return std::nullopt;

    LoadoutModel model;
    model.slots = std::make_unique<SlotAllocator>(session_);
    addPieces(model);
    addCharms(model);
    addWeapons(model, filterWeapons(catalog_, request.weapon));
    addSkills(model);

    Forge::logDebug("Model built: " + std::to_string(session_.variableCount()) + " variables, " +
                    std::to_string(session_.constraintCount()) + " constraints");
    return model;
}

void ModelBuilder::exactlyOne(const z3::expr_vector& literals) {
    session_.require(z3::atmost(literals, 1));
    session_.require(z3::atleast(literals, 1));
}

void ModelBuilder::addPieces(LoadoutModel& model) {
    for (std::size_t i = 0; i < kBodySlotCount; ++i) {
        const auto slot = static_cast<BodySlot>(i);
        z3::expr_vector literals(session_.context());
        for (const EquipmentPiece* piece : piecesForSlot(catalog_, slot)) {
            z3::expr selected = session_.boolVar(std::string("use_") + bodySlotName(slot) + "_" + piece->id);
            literals.push_back(selected);
            model.pieces[i].push_back(PieceChoice{piece, selected});
            model.slots->addHolder(SlotPool::Armor, bodySlotName(slot), piece->id, piece->jewelSlots, selected);
        }
        exactlyOne(literals);
    }
}

void ModelBuilder::addCharms(LoadoutModel& model) {
    if (catalog_.charms.empty()) return;
    z3::expr_vector literals(session_.context());
    for (const auto& charm : catalog_.charms) {
        z3::expr selected = session_.boolVar("use_charm_" + charm.id);
        literals.push_back(selected);
        model.charms.push_back(CharmChoice{&charm, selected});
    }
    session_.require(z3::atmost(literals, 1));
}

void ModelBuilder::addWeapons(LoadoutModel& model, const std::vector<const Weapon*>& candidates) {
    if (candidates.size() == 1) {
        const Weapon* weapon = candidates.front();
        z3::expr fixed = session_.context().bool_val(true);
        model.weapons.push_back(WeaponChoice{weapon, fixed});
        model.slots->addHolder(SlotPool::Weapon, "weapon", weapon->id, weapon->jewelSlots, fixed);
        return;
    }
    z3::expr_vector literals(session_.context());
    for (const Weapon* weapon : candidates) {
        z3::expr selected = session_.boolVar("use_weapon_" + weapon->id);
        literals.push_back(selected);
        model.weapons.push_back(WeaponChoice{weapon, selected});
        model.slots->addHolder(SlotPool::Weapon, "weapon", weapon->id, weapon->jewelSlots, selected);
    }
    exactlyOne(literals);
}

void ModelBuilder::addSkills(LoadoutModel& model) {
    std::map<std::string, Forge::Solver::ConditionalSum> sums;
    for (const auto& skill : catalog_.skills) sums.emplace(skill.id, Forge::Solver::ConditionalSum(session_.context()));

    const auto grant = [&sums](const SkillPoints& points, const z3::expr& selected) {
        for (const auto& [skillId, value] : points) {
            auto it = sums.find(skillId);
            if (it != sums.end()) it->second.addSelected(selected, value);
        }
    };
    for (const auto& choices : model.pieces) {
        for (const auto& c : choices) grant(c.piece->skills, c.selected);
    }
    for (const auto& c : model.charms) grant(c.charm->skills, c.selected);
    for (const auto& c : model.weapons) grant(c.weapon->skills, c.selected);

    // Jewels only enter the model through their usage counts; placements are bounded by capacity.
    for (const auto& jewel : catalog_.jewels) {
        z3::expr usage = model.slots->addJewel(jewel);
        for (const auto& [skillId, value] : jewel.skills) {
            auto it = sums.find(skillId);
            if (it != sums.end()) it->second.addScaled(usage, value);
        }
    }
    model.slots->finalize();

    SkillAggregator aggregator(session_);
    for (const auto& skill : catalog_.skills) {
        const std::int64_t bound = rawUpperBound(model, skill.id);
        z3::expr raw = session_.intVar("skill_" + skill.id + "_raw", 0, bound);
        session_.require(raw == sums.at(skill.id).build());
        z3::expr effective = aggregator.effectiveLevel(skill, raw, bound);
        model.skills.push_back(SkillVars{&skill, raw, effective, bound});
    }
}

std::int64_t ModelBuilder::rawUpperBound(const LoadoutModel& model, const std::string& skillId) const {
    std::int64_t bound = 0;
    for (const auto& choices : model.pieces) {
        int best = 0;
        for (const auto& c : choices) best = std::max(best, pointsFor(c.piece->skills, skillId));
        bound += best;
    }
    int bestCharm = 0;
    for (const auto& c : model.charms) bestCharm = std::max(bestCharm, pointsFor(c.charm->skills, skillId));
    int bestWeapon = 0;
    for (const auto& c : model.weapons) bestWeapon = std::max(bestWeapon, pointsFor(c.weapon->skills, skillId));
    bound += bestCharm + bestWeapon;

    for (std::size_t p = 0; p < kSlotPoolCount; ++p) {
        const auto pool = static_cast<SlotPool>(p);
        int bestJewel = 0;
        for (const auto& j : catalog_.jewels) {
            if (j.pool == pool) bestJewel = std::max(bestJewel, pointsFor(j.skills, skillId));
        }
        bound += static_cast<std::int64_t>(bestJewel) * model.slots->maxJewels(pool);
    }
    return bound;
}

}  // namespace Loadout
