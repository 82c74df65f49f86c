#include "Catalog.h"

#include <algorithm>
#include <set>

namespace Loadout {

SkillKind SkillDef::kind() const {
    if (std::holds_alternative<GroupActivation>(activation)) return SkillKind::Group;
    if (std::holds_alternative<SeriesActivation>(activation)) return SkillKind::Series;
    return SkillKind::Standard;
}

const char* bodySlotName(BodySlot slot) {
    switch (slot) {
        case BodySlot::Head:
            return "head";
        case BodySlot::Chest:
            return "chest";
        case BodySlot::Arms:
            return "arms";
        case BodySlot::Waist:
            return "waist";
        case BodySlot::Legs:
            return "legs";
        default:
            return "unknown";
    }
}

std::optional<BodySlot> parseBodySlot(std::string_view name) {
    if (name == "head") return BodySlot::Head;
    if (name == "chest") return BodySlot::Chest;
    if (name == "arms") return BodySlot::Arms;
    if (name == "waist") return BodySlot::Waist;
    if (name == "legs") return BodySlot::Legs;
    return std::nullopt;
}

const char* slotPoolName(SlotPool pool) {
    return pool == SlotPool::Weapon ? "weapon" : "armor";
}

std::optional<SlotPool> parseSlotPool(std::string_view name) {
    if (name == "armor") return SlotPool::Armor;
    if (name == "weapon") return SlotPool::Weapon;
    return std::nullopt;
}

const SkillDef* findSkill(const Catalog& catalog, std::string_view id) {
    auto it = std::find_if(catalog.skills.begin(), catalog.skills.end(),
                           [id](const SkillDef& s) { return s.id == id; });
    return it == catalog.skills.end() ? nullptr : &*it;
}

std::vector<const EquipmentPiece*> piecesForSlot(const Catalog& catalog, BodySlot slot) {
    std::vector<const EquipmentPiece*> out;
    for (const auto& p : catalog.pieces) {
        if (p.slot == slot) out.push_back(&p);
    }
    return out;
}

int countSlots(const std::vector<int>& slots, int size) {
    return static_cast<int>(std::count(slots.begin(), slots.end(), size));
}

namespace {
void checkPoints(const Catalog& catalog,
                 const std::string& owner,
                 const SkillPoints& points,
                 std::vector<std::string>& issues) {
    for (const auto& [skillId, value] : points) {
        if (!findSkill(catalog, skillId)) {
            issues.push_back(owner + " references unknown skill '" + skillId + "'");
        }
        if (value < 0) {
            issues.push_back(owner + " grants negative points to '" + skillId + "'");
        }
    }
}

void checkSlots(const std::string& owner, const std::vector<int>& slots, std::vector<std::string>& issues) {
    for (int size : slots) {
        if (size < 1 || size > kMaxSlotSize) {
            issues.push_back(owner + " has a jewel slot of invalid size " + std::to_string(size));
        }
    }
}

void checkUnique(const std::string& kind,
                 const std::string& id,
                 std::set<std::string>& seen,
                 std::vector<std::string>& issues) {
    if (id.empty()) {
        issues.push_back(kind + " with an empty id");
    } else if (!seen.insert(id).second) {
        issues.push_back("duplicate " + kind + " id '" + id + "'");
    }
}

void checkSkill(const SkillDef& skill, std::vector<std::string>& issues) {
    const std::string owner = "skill '" + skill.id + "'";
    if (skill.maxLevel <= 0) {
        issues.push_back(owner + " has a non-positive maximum level");
    }
    if (const auto* group = std::get_if<GroupActivation>(&skill.activation)) {
        if (group->threshold <= 0) issues.push_back(owner + " has a non-positive group threshold");
    }
    if (const auto* series = std::get_if<SeriesActivation>(&skill.activation)) {
        if (series->steps.empty()) issues.push_back(owner + " is a series with no steps");
        for (std::size_t i = 0; i < series->steps.size(); ++i) {
            const auto& step = series->steps[i];
            if (step.threshold <= 0) issues.push_back(owner + " has a non-positive series threshold");
            if (step.level < 0 || step.level > skill.maxLevel) {
                issues.push_back(owner + " has a series level outside 0.." + std::to_string(skill.maxLevel));
            }
            if (i > 0) {
                const auto& prev = series->steps[i - 1];
                if (step.threshold <= prev.threshold) {
                    issues.push_back(owner + " has series thresholds that are not strictly increasing");
                }
                if (step.level < prev.level) {
                    issues.push_back(owner + " has decreasing series levels");
                }
            }
        }
    }
}
}  // namespace

std::vector<std::string> validateCatalog(const Catalog& catalog) {
    std::vector<std::string> issues;

    std::set<std::string> skillIds;
    for (const auto& s : catalog.skills) {
        checkUnique("skill", s.id, skillIds, issues);
        checkSkill(s, issues);
    }

    std::set<std::string> pieceIds;
    for (const auto& p : catalog.pieces) {
        checkUnique("piece", p.id, pieceIds, issues);
        const std::string owner = "piece '" + p.id + "'";
        if (p.slot == BodySlot::Count) issues.push_back(owner + " has no body slot");
        checkPoints(catalog, owner, p.skills, issues);
        checkSlots(owner, p.jewelSlots, issues);
        int groupGrants = 0;
        for (const auto& [skillId, value] : p.skills) {
            const SkillDef* def = findSkill(catalog, skillId);
            if (def && def->kind() == SkillKind::Group && value > 0) ++groupGrants;
        }
        if (groupGrants > 1) issues.push_back(owner + " grants more than one group skill");
    }
    for (std::size_t i = 0; i < kBodySlotCount; ++i) {
        const auto slot = static_cast<BodySlot>(i);
        if (piecesForSlot(catalog, slot).empty()) {
            issues.push_back(std::string("no candidate pieces for body slot ") + bodySlotName(slot));
        }
    }

    std::set<std::string> charmIds;
    for (const auto& c : catalog.charms) {
        checkUnique("charm", c.id, charmIds, issues);
        checkPoints(catalog, "charm '" + c.id + "'", c.skills, issues);
    }

    std::set<std::string> weaponIds;
    for (const auto& w : catalog.weapons) {
        checkUnique("weapon", w.id, weaponIds, issues);
        const std::string owner = "weapon '" + w.id + "'";
        // Pieces and weapons both hold sockets and are told apart by id.
        if (pieceIds.count(w.id) > 0) issues.push_back(owner + " shares its id with a piece");
        checkPoints(catalog, owner, w.skills, issues);
        checkSlots(owner, w.jewelSlots, issues);
    }

    std::set<std::string> jewelIds;
    for (const auto& j : catalog.jewels) {
        checkUnique("jewel", j.id, jewelIds, issues);
        const std::string owner = "jewel '" + j.id + "'";
        if (j.size < 1 || j.size > kMaxSlotSize) {
            issues.push_back(owner + " has invalid size " + std::to_string(j.size));
        }
        if (j.pool == SlotPool::Count) issues.push_back(owner + " has no slot pool");
        checkPoints(catalog, owner, j.skills, issues);
    }
    return issues;
}

}  // namespace Loadout
