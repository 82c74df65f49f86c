// Jewel placement: size compatibility, per-size capacity, slot pools and socket decoding.
#include <cassert>
#include <set>
#include <utility>

#include "../engine/solver/SolverSession.h"
#include "../game/optimizer/SlotAllocator.h"
#include "TestCatalog.h"

using namespace Loadout;
using Forge::Solver::SessionStatus;
using Forge::Solver::SolverSession;

int main() {
    // One size-3 slot: a size-3 and a size-1 jewel compete for it, so at most one is placed.
    {
        const Jewel big = TestCatalog::jewel("critical_jewel", 3, {{"critical_boost", 1}});
        const Jewel small = TestCatalog::jewel("attack_jewel", 1, {{"attack_boost", 1}});
        SolverSession session;
        SlotAllocator slots(session);
        slots.addHolder(SlotPool::Armor, "head", "helm", {3}, session.context().bool_val(true));
        z3::expr bigUsed = slots.addJewel(big);
        z3::expr smallUsed = slots.addJewel(small);
        slots.finalize();
        session.maximize(bigUsed + smallUsed);
        assert(session.solve({}) == SessionStatus::Optimal);
        assert(session.intValue(bigUsed) + session.intValue(smallUsed) == 1);
        assert(session.intValue(slots.freeSlots(3)) == 0);
    }

    // Demanding both is infeasible.
    {
        const Jewel big = TestCatalog::jewel("critical_jewel", 3, {{"critical_boost", 1}});
        const Jewel small = TestCatalog::jewel("attack_jewel", 1, {{"attack_boost", 1}});
        SolverSession session;
        SlotAllocator slots(session);
        slots.addHolder(SlotPool::Armor, "head", "helm", {3}, session.context().bool_val(true));
        z3::expr bigUsed = slots.addJewel(big);
        z3::expr smallUsed = slots.addJewel(small);
        slots.finalize();
        session.require(bigUsed >= 1);
        session.require(smallUsed >= 1);
        assert(session.solve({}) == SessionStatus::Infeasible);
    }

    // A jewel never fits a smaller slot.
    {
        const Jewel big = TestCatalog::jewel("critical_jewel", 3, {{"critical_boost", 1}});
        SolverSession session;
        SlotAllocator slots(session);
        slots.addHolder(SlotPool::Armor, "head", "helm", {1, 2, 2}, session.context().bool_val(true));
        z3::expr used = slots.addJewel(big);
        slots.finalize();
        session.maximize(used);
        assert(session.solve({}) == SessionStatus::Optimal);
        assert(session.intValue(used) == 0);
        assert(session.intValue(slots.freeSlots(1)) == 1);
        assert(session.intValue(slots.freeSlots(2)) == 2);
    }

    // Supply is unlimited: one jewel type can fill every compatible slot.
    {
        const Jewel small = TestCatalog::jewel("attack_jewel", 1, {{"attack_boost", 1}});
        SolverSession session;
        SlotAllocator slots(session);
        slots.addHolder(SlotPool::Armor, "head", "helm", {1, 2, 3}, session.context().bool_val(true));
        slots.addHolder(SlotPool::Armor, "legs", "greaves", {1, 1}, session.context().bool_val(true));
        z3::expr used = slots.addJewel(small);
        slots.finalize();
        session.maximize(used);
        assert(session.solve({}) == SessionStatus::Optimal);
        assert(session.intValue(used) == 5);
        for (int size = 1; size <= kMaxSlotSize; ++size) assert(session.intValue(slots.freeSlots(size)) == 0);
    }

    // Weapon jewels only go into weapon slots and armor jewels only into armor slots.
    {
        const Jewel armorJewel = TestCatalog::jewel("attack_jewel", 1, {{"attack_boost", 1}});
        const Jewel weaponJewel = TestCatalog::jewel("expert_jewel", 1, {{"critical_boost", 1}}, SlotPool::Weapon);
        SolverSession session;
        SlotAllocator slots(session);
        slots.addHolder(SlotPool::Weapon, "weapon", "sword", {3, 3}, session.context().bool_val(true));
        z3::expr armorUsed = slots.addJewel(armorJewel);
        z3::expr weaponUsed = slots.addJewel(weaponJewel);
        slots.finalize();
        session.maximize(armorUsed + weaponUsed);
        assert(session.solve({}) == SessionStatus::Optimal);
        assert(session.intValue(armorUsed) == 0);
        assert(session.intValue(weaponUsed) == 2);
        assert(session.intValue(slots.available(SlotPool::Armor, 3)) == 0);
        assert(session.intValue(slots.available(SlotPool::Weapon, 3)) == 2);
    }

    // Slots of an unselected holder are unavailable; bounds only count one holder per group.
    {
        const Jewel small = TestCatalog::jewel("attack_jewel", 1, {{"attack_boost", 1}});
        SolverSession session;
        SlotAllocator slots(session);
        z3::expr useA = session.boolVar("use_a");
        z3::expr useB = session.boolVar("use_b");
        slots.addHolder(SlotPool::Armor, "head", "helm_a", {2, 2}, useA);
        slots.addHolder(SlotPool::Armor, "head", "helm_b", {2}, useB);
        assert(slots.maxAvailable(SlotPool::Armor, 2) == 2);
        assert(slots.maxJewels(SlotPool::Armor) == 2);
        z3::expr used = slots.addJewel(small);
        slots.finalize();
        session.require(!useA);
        session.require(useB);
        session.maximize(used);
        assert(session.solve({}) == SessionStatus::Optimal);
        assert(session.intValue(used) == 1);
        assert(session.intValue(slots.available(SlotPool::Armor, 2)) == 1);
    }

    // Decoded placements occupy distinct compatible sockets on selected holders.
    {
        const Jewel big = TestCatalog::jewel("critical_jewel", 3, {{"critical_boost", 1}});
        const Jewel small = TestCatalog::jewel("attack_jewel", 1, {{"attack_boost", 1}});
        SolverSession session;
        SlotAllocator slots(session);
        z3::expr useHelm = session.boolVar("use_helm");
        slots.addHolder(SlotPool::Armor, "head", "helm", {1, 3, 2}, useHelm);
        slots.addHolder(SlotPool::Armor, "chest", "mail", {3}, session.context().bool_val(true));
        z3::expr bigUsed = slots.addJewel(big);
        z3::expr smallUsed = slots.addJewel(small);
        slots.finalize();
        session.require(useHelm);
        session.require(bigUsed == 2);
        session.maximize(smallUsed);
        assert(session.solve({}) == SessionStatus::Optimal);
        assert(session.intValue(smallUsed) == 2);

        const auto placements = slots.decodePlacements(session);
        assert(placements.size() == 4);
        std::set<std::pair<std::string, int>> sockets;
        for (const auto& p : placements) {
            assert(p.jewelSize <= p.slotSize);
            assert(sockets.insert({p.holderId, p.slotIndex}).second);
        }
        for (int size = 1; size <= kMaxSlotSize; ++size) assert(session.intValue(slots.freeSlots(size)) == 0);
    }

    return 0;
}
