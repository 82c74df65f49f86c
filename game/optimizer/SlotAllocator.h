// Jewel placement model: how many of each jewel go into slots of each size, per slot pool.
//
// A jewel of size s may sit in any slot of size >= s and every slot holds at most one jewel,
// so for each pool and slot size t the placements into size-t slots (by jewels of any size
// <= t) may not exceed the size-t slots carried by the selected holders. Jewel supply is
// unlimited. Leaving every slot empty is always feasible.
#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <z3++.h>

#include "../../engine/solver/ConditionalSum.h"
#include "../../engine/solver/SolverSession.h"
#include "../catalog/Catalog.h"
#include "Solution.h"

namespace Loadout {

class SlotAllocator {
public:
    explicit SlotAllocator(Forge::Solver::SolverSession& session);

    // Registers a piece or weapon whose slots become available when `selected` holds.
    // Holders sharing `exclusiveGroup` are never selected together; the group is only used
    // to bound slot counts.
    void addHolder(SlotPool pool,
                   const std::string& exclusiveGroup,
                   const std::string& holderId,
                   const std::vector<int>& slotSizes,
                   const z3::expr& selected);

    // Creates the per-size placement variables for a jewel and returns its total usage (Int).
    // All holders must be registered first.
    z3::expr addJewel(const Jewel& jewel);

    // Adds the capacity constraints. Call once, after every holder and jewel.
    void finalize();

    z3::expr available(SlotPool pool, int slotSize) const;
    // Slots of this size left empty, over both pools.
    z3::expr freeSlots(int slotSize) const;

    // Upper bound on slots of this size a single loadout can carry.
    std::int64_t maxAvailable(SlotPool pool, int slotSize) const;
    std::int64_t maxFreeSlots(int slotSize) const;
    // Upper bound on the number of jewels a loadout can hold in a pool.
    std::int64_t maxJewels(SlotPool pool) const;

    // Per-size placement counts of a jewel in the solved model.
    std::array<int, kMaxSlotSize> placedCounts(const Forge::Solver::SolverSession& solved,
                                               std::size_t jewelIndex) const;
    // Assigns solved placements to concrete sockets on the selected holders.
    std::vector<JewelPlacement> decodePlacements(const Forge::Solver::SolverSession& solved) const;

private:
    struct Holder {
        SlotPool pool{SlotPool::Armor};
        std::string id;
        std::vector<int> slotSizes;
        z3::expr selected;
    };

    struct JewelVars {
        const Jewel* jewel{nullptr};
        // Index = slot size - 1; empty where the jewel does not fit.
        std::array<std::optional<z3::expr>, kMaxSlotSize> placed{};
    };

    static std::size_t tierIndex(int slotSize) { return static_cast<std::size_t>(slotSize - 1); }
    static std::size_t poolIndex(SlotPool pool) { return static_cast<std::size_t>(pool); }

    Forge::Solver::SolverSession& session_;
    std::vector<Holder> holders_;
    std::vector<JewelVars> jewels_;
    // Largest slot count of each size per exclusive group, indexed [pool][size - 1].
    std::array<std::array<std::map<std::string, int>, kMaxSlotSize>, kSlotPoolCount> groupMaxima_{};
    std::array<std::array<std::optional<z3::expr>, kMaxSlotSize>, kSlotPoolCount> available_{};
    std::array<std::optional<z3::expr>, kMaxSlotSize> free_{};
    bool finalized_{false};
};

}  // namespace Loadout
