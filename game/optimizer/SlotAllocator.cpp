#include "SlotAllocator.h"

#include <algorithm>
#include <utility>

namespace Loadout {

SlotAllocator::SlotAllocator(Forge::Solver::SolverSession& session) : session_(session) {}

void SlotAllocator::addHolder(SlotPool pool,
                              const std::string& exclusiveGroup,
                              const std::string& holderId,
                              const std::vector<int>& slotSizes,
                              const z3::expr& selected) {
    holders_.push_back(Holder{pool, holderId, slotSizes, selected});
    for (int size = 1; size <= kMaxSlotSize; ++size) {
        int& best = groupMaxima_[poolIndex(pool)][tierIndex(size)][exclusiveGroup];
        best = std::max(best, countSlots(slotSizes, size));
    }
}

z3::expr SlotAllocator::addJewel(const Jewel& jewel) {
    JewelVars vars{};
    vars.jewel = &jewel;
    Forge::Solver::ConditionalSum usage(session_.context());
    for (int size = std::max(jewel.size, 1); size <= kMaxSlotSize; ++size) {
        z3::expr placed = session_.intVar("jewel_" + jewel.id + "_in_size" + std::to_string(size), 0,
                                          maxAvailable(jewel.pool, size));
        usage.addScaled(placed, 1);
        vars.placed[tierIndex(size)] = placed;
    }
    jewels_.push_back(std::move(vars));
    return usage.build();
}

void SlotAllocator::finalize() {
    if (finalized_) return;
    finalized_ = true;

    std::array<Forge::Solver::ConditionalSum, kMaxSlotSize> freeSums{
        Forge::Solver::ConditionalSum(session_.context()), Forge::Solver::ConditionalSum(session_.context()),
        Forge::Solver::ConditionalSum(session_.context())};

    for (std::size_t p = 0; p < kSlotPoolCount; ++p) {
        const auto pool = static_cast<SlotPool>(p);
        for (int size = 1; size <= kMaxSlotSize; ++size) {
            Forge::Solver::ConditionalSum slots(session_.context());
            for (const auto& h : holders_) {
                if (h.pool == pool) slots.addSelected(h.selected, countSlots(h.slotSizes, size));
            }
            z3::expr avail = session_.intVar(std::string("slots_") + slotPoolName(pool) + "_size" + std::to_string(size),
                                             0, maxAvailable(pool, size));
            session_.require(avail == slots.build());
            available_[p][tierIndex(size)] = avail;

            Forge::Solver::ConditionalSum used(session_.context());
            for (const auto& j : jewels_) {
                if (j.jewel->pool == pool && j.placed[tierIndex(size)]) used.addScaled(*j.placed[tierIndex(size)], 1);
            }
            z3::expr usedExpr = used.build();
            session_.require(usedExpr <= avail);

            freeSums[tierIndex(size)].addScaled(avail, 1);
            freeSums[tierIndex(size)].addScaled(usedExpr, -1);
        }
    }

    for (int size = 1; size <= kMaxSlotSize; ++size) {
        z3::expr unused = session_.intVar("free_slots_size" + std::to_string(size), 0, maxFreeSlots(size));
        session_.require(unused == freeSums[tierIndex(size)].build());
        free_[tierIndex(size)] = unused;
    }
}

z3::expr SlotAllocator::available(SlotPool pool, int slotSize) const {
    const auto& v = available_[poolIndex(pool)][tierIndex(slotSize)];
    return v ? *v : session_.context().int_val(0);
}

z3::expr SlotAllocator::freeSlots(int slotSize) const {
    const auto& v = free_[tierIndex(slotSize)];
    return v ? *v : session_.context().int_val(0);
}

std::int64_t SlotAllocator::maxAvailable(SlotPool pool, int slotSize) const {
    std::int64_t total = 0;
    for (const auto& [group, count] : groupMaxima_[poolIndex(pool)][tierIndex(slotSize)]) total += count;
    return total;
}

std::int64_t SlotAllocator::maxFreeSlots(int slotSize) const {
    std::int64_t total = 0;
    for (std::size_t p = 0; p < kSlotPoolCount; ++p) total += maxAvailable(static_cast<SlotPool>(p), slotSize);
    return total;
}

std::int64_t SlotAllocator::maxJewels(SlotPool pool) const {
    std::int64_t total = 0;
    for (int size = 1; size <= kMaxSlotSize; ++size) total += maxAvailable(pool, size);
    return total;
}

std::array<int, kMaxSlotSize> SlotAllocator::placedCounts(const Forge::Solver::SolverSession& solved,
                                                          std::size_t jewelIndex) const {
    std::array<int, kMaxSlotSize> counts{};
    const auto& vars = jewels_.at(jewelIndex);
    for (std::size_t t = 0; t < counts.size(); ++t) {
        if (vars.placed[t]) counts[t] = static_cast<int>(solved.intValue(*vars.placed[t]));
    }
    return counts;
}

std::vector<JewelPlacement> SlotAllocator::decodePlacements(const Forge::Solver::SolverSession& solved) const {
    struct Socket {
        const Holder* holder;
        int index;
    };

    std::vector<JewelPlacement> out;
    for (std::size_t p = 0; p < kSlotPoolCount; ++p) {
        const auto pool = static_cast<SlotPool>(p);
        for (int size = kMaxSlotSize; size >= 1; --size) {
            std::vector<Socket> sockets;
            for (const auto& h : holders_) {
                if (h.pool != pool || !solved.boolValue(h.selected)) continue;
                for (std::size_t i = 0; i < h.slotSizes.size(); ++i) {
                    if (h.slotSizes[i] == size) sockets.push_back({&h, static_cast<int>(i)});
                }
            }

            std::size_t next = 0;
            for (std::size_t j = 0; j < jewels_.size(); ++j) {
                const Jewel& jewel = *jewels_[j].jewel;
                if (jewel.pool != pool) continue;
                const int count = placedCounts(solved, j)[tierIndex(size)];
                for (int k = 0; k < count && next < sockets.size(); ++k, ++next) {
                    JewelPlacement placement{};
                    placement.jewelId = jewel.id;
                    placement.holderId = sockets[next].holder->id;
                    placement.pool = pool;
                    placement.slotIndex = sockets[next].index;
                    placement.slotSize = size;
                    placement.jewelSize = jewel.size;
                    out.push_back(std::move(placement));
                }
            }
        }
    }
    return out;
}

}  // namespace Loadout
