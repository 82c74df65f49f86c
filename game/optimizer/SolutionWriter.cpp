#include "SolutionWriter.h"

#include <nlohmann/json.hpp>

namespace Loadout {

std::string solveResultToJson(const SolveResult& result, int indent) {
    nlohmann::json j;
    j["status"] = solveStatusName(result.status);
    j["solveSeconds"] = result.solveSeconds;
    if (!result.message.empty()) j["message"] = result.message;
    if (!result.solution) return j.dump(indent);

    const Solution& s = *result.solution;
    nlohmann::json out;
    out["optimal"] = s.optimal;
    nlohmann::json pieces = nlohmann::json::object();
    for (std::size_t i = 0; i < kBodySlotCount; ++i) {
        pieces[bodySlotName(static_cast<BodySlot>(i))] = s.pieces[i];
    }
    out["pieces"] = pieces;
    out["charm"] = s.charm ? nlohmann::json(*s.charm) : nlohmann::json(nullptr);
    out["weapon"] = s.weapon;

    nlohmann::json jewels = nlohmann::json::array();
    for (const auto& p : s.jewels) {
        jewels.push_back({{"jewel", p.jewelId},
                          {"holder", p.holderId},
                          {"pool", slotPoolName(p.pool)},
                          {"slot", p.slotIndex},
                          {"slotSize", p.slotSize}});
    }
    out["jewels"] = jewels;

    nlohmann::json skills = nlohmann::json::array();
    for (const auto& sk : s.skills) {
        skills.push_back({{"skill", sk.skillId}, {"points", sk.rawPoints}, {"level", sk.level}});
    }
    out["skills"] = skills;
    out["freeSlots"] = s.freeSlots;
    j["solution"] = out;
    return j.dump(indent);
}

}  // namespace Loadout
