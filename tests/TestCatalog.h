// Small hand-built catalogs shared by the optimizer tests.
#pragma once

#include <random>
#include <string>
#include <utility>
#include <vector>

#include "../game/catalog/Catalog.h"

namespace TestCatalog {

using namespace Loadout;

inline SkillDef standardSkill(const std::string& id, int maxLevel) {
    SkillDef s{};
    s.id = id;
    s.name = id;
    s.maxLevel = maxLevel;
    s.activation = StandardActivation{};
    return s;
}

inline SkillDef groupSkill(const std::string& id, int maxLevel, int threshold) {
    SkillDef s = standardSkill(id, maxLevel);
    s.activation = GroupActivation{threshold};
    return s;
}

inline SkillDef seriesSkill(const std::string& id, int maxLevel, std::vector<SeriesStep> steps) {
    SkillDef s = standardSkill(id, maxLevel);
    s.activation = SeriesActivation{std::move(steps)};
    return s;
}

inline EquipmentPiece piece(const std::string& id, BodySlot slot, SkillPoints skills = {}, std::vector<int> slots = {}) {
    EquipmentPiece p{};
    p.id = id;
    p.name = id;
    p.slot = slot;
    p.skills = std::move(skills);
    p.jewelSlots = std::move(slots);
    return p;
}

inline Jewel jewel(const std::string& id, int size, SkillPoints skills, SlotPool pool = SlotPool::Armor) {
    Jewel j{};
    j.id = id;
    j.name = id;
    j.size = size;
    j.pool = pool;
    j.skills = std::move(skills);
    return j;
}

inline Weapon weapon(const std::string& id, const std::string& weaponClass, SkillPoints skills = {}, std::vector<int> slots = {}) {
    Weapon w{};
    w.id = id;
    w.name = id;
    w.weaponClass = weaponClass;
    w.skills = std::move(skills);
    w.jewelSlots = std::move(slots);
    return w;
}

// One bare piece per body slot and a single bare sword: every test adds what it needs on top.
inline Catalog bare() {
    Catalog c;
    for (std::size_t i = 0; i < kBodySlotCount; ++i) {
        const auto slot = static_cast<BodySlot>(i);
        c.pieces.push_back(piece(std::string("bare_") + bodySlotName(slot), slot));
    }
    c.weapons.push_back(weapon("test_sword", "sword"));
    return c;
}

// Seeded random catalog large enough that a full optimality proof takes far longer than a second:
// 60 pieces per body slot, 80 charms, 12 weapons and 60 jewels over 40 skills.
inline Catalog sprawling(unsigned seed) {
    std::mt19937 rng(seed);
    const auto roll = [&rng](int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng); };

    Catalog c;
    std::vector<std::string> standard;
    for (int i = 0; i < 32; ++i) {
        standard.push_back("skill_" + std::to_string(i));
        c.skills.push_back(standardSkill(standard.back(), roll(3, 7)));
    }
    std::vector<std::string> groups;
    for (int i = 0; i < 4; ++i) {
        groups.push_back("set_" + std::to_string(i));
        c.skills.push_back(groupSkill(groups.back(), 3, 2));
    }
    for (int i = 0; i < 4; ++i) {
        c.skills.push_back(seriesSkill("series_" + std::to_string(i), 3, {{2, 1}, {3, 2}, {5, 3}}));
    }
    const auto anySkill = [&]() -> std::string {
        const int pick = roll(0, 35);
        return pick < 32 ? standard[static_cast<std::size_t>(pick)] : "series_" + std::to_string(pick - 32);
    };
    const auto someSlots = [&]() {
        std::vector<int> slots;
        const int count = roll(0, 3);
        for (int k = 0; k < count; ++k) slots.push_back(roll(1, 3));
        return slots;
    };

    for (std::size_t s = 0; s < kBodySlotCount; ++s) {
        const auto slot = static_cast<BodySlot>(s);
        for (int i = 0; i < 60; ++i) {
            SkillPoints points;
            points[anySkill()] += roll(1, 2);
            points[anySkill()] += roll(1, 2);
            if (roll(0, 2) == 0) points[groups[static_cast<std::size_t>(roll(0, 3))]] = 1;
            c.pieces.push_back(piece(std::string(bodySlotName(slot)) + "_" + std::to_string(i), slot, points, someSlots()));
        }
    }
    for (int i = 0; i < 80; ++i) {
        Charm charm{};
        charm.id = "charm_" + std::to_string(i);
        charm.name = charm.id;
        charm.skills[anySkill()] += roll(1, 3);
        charm.skills[anySkill()] += roll(1, 2);
        c.charms.push_back(charm);
    }
    for (int i = 0; i < 12; ++i) {
        c.weapons.push_back(weapon("blade_" + std::to_string(i), "long_sword", {{anySkill(), roll(1, 2)}}, someSlots()));
    }
    for (int i = 0; i < 60; ++i) {
        const SlotPool pool = i % 6 == 0 ? SlotPool::Weapon : SlotPool::Armor;
        c.jewels.push_back(jewel("gem_" + std::to_string(i), roll(1, 3), {{anySkill(), roll(1, 2)}}, pool));
    }
    return c;
}

}  // namespace TestCatalog
