#include "LoadoutSolver.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <utility>

#include <z3++.h>

#include "../../engine/core/Logger.h"
#include "../../engine/solver/SolverSession.h"
#include "ModelBuilder.h"
#include "ObjectiveComposer.h"
#include "SkillAggregator.h"

namespace Loadout {

namespace {
std::string joinIssues(const std::vector<std::string>& issues) {
    std::ostringstream out;
    for (std::size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) out << "; ";
        out << issues[i];
    }
    return out.str();
}

Solution decode(const LoadoutModel& model,
                const OptimizationRequest& request,
                const Forge::Solver::SolverSession& session) {
    std::set<std::string> requested;
    for (const auto& r : request.skills) requested.insert(r.skillId);

    Solution solution{};
    for (std::size_t i = 0; i < kBodySlotCount; ++i) {
        for (const auto& c : model.pieces[i]) {
            if (session.boolValue(c.selected)) solution.pieces[i] = c.piece->id;
        }
    }
    for (const auto& c : model.charms) {
        if (session.boolValue(c.selected)) solution.charm = c.charm->id;
    }
    for (const auto& c : model.weapons) {
        if (session.boolValue(c.selected)) solution.weapon = c.weapon->id;
    }
    solution.jewels = model.slots->decodePlacements(session);
    for (const auto& s : model.skills) {
        const int raw = static_cast<int>(session.intValue(s.raw));
        if (raw <= 0 && requested.count(s.skill->id) == 0) continue;
        solution.skills.push_back(SkillLevel{s.skill->id, raw, static_cast<int>(session.intValue(s.effective))});
    }
    for (int size = 1; size <= kMaxSlotSize; ++size) {
        solution.freeSlots[static_cast<std::size_t>(size - 1)] =
            static_cast<int>(session.intValue(model.slots->freeSlots(size)));
    }
    return solution;
}

template <typename T>
const T* findById(const std::vector<T>& items, const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(), [&id](const T& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

void addPoints(std::map<std::string, int>& totals, const SkillPoints& points, int times = 1) {
    for (const auto& [skillId, value] : points) totals[skillId] += value * times;
}
}  // namespace

LoadoutSolver::LoadoutSolver(const Catalog& catalog, SolverConfig config)
    : catalog_(catalog), config_(std::move(config)) {}

SolveResult LoadoutSolver::solve(const OptimizationRequest& request, Forge::CancellationToken* token) const {
    SolveResult result{};
    try {
        Forge::Solver::SolverSession session;

        ModelBuilder builder(catalog_, session);
        std::vector<std::string> issues;
        std::optional<LoadoutModel> model = builder.build(request, issues);
        if (!model) {
            result.status = SolveStatus::CatalogInconsistency;
            result.message = joinIssues(issues);
            Forge::logWarn("Catalog inconsistency: " + result.message);
            return result;
        }

        ObjectiveComposer composer(session);
        std::string error;
        std::optional<ComposedObjective> objective = composer.compose(*model, request, error);
        if (!objective) {
            result.status = SolveStatus::CatalogInconsistency;
            result.message = error;
            Forge::logWarn("Catalog inconsistency: " + error);
            return result;
        }
        session.maximize(objective->total);

        if (config_.logModelStats) {
            Forge::logDebug("Objective scales: primary x" + std::to_string(objective->scales.primaryScale) +
                            ", secondary x" + std::to_string(objective->scales.secondaryScale) + ", slot weights " +
                            std::to_string(objective->scales.slotWeights[0]) + "/" +
                            std::to_string(objective->scales.slotWeights[1]) + "/" +
                            std::to_string(objective->scales.slotWeights[2]));
        }

        Forge::Solver::SessionLimits limits{};
        limits.timeLimitSeconds = config_.timeLimitSeconds;
        const Forge::Solver::SessionStatus status = session.solve(limits, token);
        result.solveSeconds = session.solveSeconds();

        switch (status) {
            case Forge::Solver::SessionStatus::Optimal:
            case Forge::Solver::SessionStatus::Feasible:
                break;
            case Forge::Solver::SessionStatus::Infeasible:
                result.status = SolveStatus::Infeasible;
                result.message = "model admits no assignment; the empty loadout should always be feasible";
                Forge::logError(result.message);
                return result;
            case Forge::Solver::SessionStatus::Timeout:
                result.status = SolveStatus::Timeout;
                result.message = "time limit reached before any loadout was found";
                Forge::logWarn(result.message);
                return result;
            case Forge::Solver::SessionStatus::Cancelled:
                result.status = SolveStatus::Cancelled;
                result.message = "solve cancelled";
                Forge::logInfo(result.message);
                return result;
            case Forge::Solver::SessionStatus::Error:
            default:
                result.status = SolveStatus::SolverInternalError;
                result.message = "solver failure: " + session.failureReason();
                Forge::logError(result.message);
                return result;
        }

        Solution solution = decode(*model, request, session);
        solution.optimal = status == Forge::Solver::SessionStatus::Optimal;

        const auto violations = verifySolution(catalog_, request, solution);
        if (!violations.empty()) {
            result.status = SolveStatus::SolverInternalError;
            result.message = "decoded loadout breaks equipment rules: " + joinIssues(violations);
            Forge::logError(result.message);
            return result;
        }

        result.status = solution.optimal ? SolveStatus::Optimal : SolveStatus::Feasible;
        result.solution = std::move(solution);
        std::ostringstream summary;
        summary << "Solve finished (" << solveStatusName(result.status) << ") in " << result.solveSeconds << "s";
        Forge::logInfo(summary.str());
        return result;
    } catch (const z3::exception& e) {
        result.status = SolveStatus::SolverInternalError;
        result.solution.reset();
        result.message = std::string("solver failure: ") + e.msg();
        Forge::logError(result.message);
        return result;
    }
}

std::vector<std::string> verifySolution(const Catalog& catalog,
                                        const OptimizationRequest& request,
                                        const Solution& solution) {
    std::vector<std::string> issues;
    std::map<std::string, int> points;
    // Socket capacity per selected holder: holder id -> slot sizes.
    std::map<std::string, std::pair<SlotPool, const std::vector<int>*>> holders;

    for (std::size_t i = 0; i < kBodySlotCount; ++i) {
        const auto slot = static_cast<BodySlot>(i);
        const EquipmentPiece* piece = findById(catalog.pieces, solution.pieces[i]);
        if (!piece) {
            issues.push_back(std::string("no piece selected for ") + bodySlotName(slot));
            continue;
        }
        if (piece->slot != slot) {
            issues.push_back("piece '" + piece->id + "' does not belong to " + bodySlotName(slot));
        }
        addPoints(points, piece->skills);
        holders[piece->id] = {SlotPool::Armor, &piece->jewelSlots};
    }

    if (solution.charm) {
        const Charm* charm = findById(catalog.charms, *solution.charm);
        if (!charm) {
            issues.push_back("unknown charm '" + *solution.charm + "'");
        } else {
            addPoints(points, charm->skills);
        }
    }

    const auto candidates = filterWeapons(catalog, request.weapon);
    auto weaponIt = std::find_if(candidates.begin(), candidates.end(),
                                 [&solution](const Weapon* w) { return w->id == solution.weapon; });
    if (weaponIt == candidates.end()) {
        issues.push_back("weapon '" + solution.weapon + "' is not allowed by the filter");
    } else {
        addPoints(points, (*weaponIt)->skills);
        holders[(*weaponIt)->id] = {SlotPool::Weapon, &(*weaponIt)->jewelSlots};
    }

    std::set<std::pair<std::string, int>> occupied;
    std::array<int, kMaxSlotSize> used{};
    for (const auto& placement : solution.jewels) {
        const Jewel* jewel = findById(catalog.jewels, placement.jewelId);
        auto holder = holders.find(placement.holderId);
        if (!jewel) {
            issues.push_back("unknown jewel '" + placement.jewelId + "'");
            continue;
        }
        if (holder == holders.end()) {
            issues.push_back("jewel '" + jewel->id + "' placed on unselected holder '" + placement.holderId + "'");
            continue;
        }
        const auto& [pool, sizes] = holder->second;
        if (placement.slotIndex < 0 || placement.slotIndex >= static_cast<int>(sizes->size())) {
            issues.push_back("jewel '" + jewel->id + "' placed in missing socket of '" + placement.holderId + "'");
            continue;
        }
        const int slotSize = (*sizes)[static_cast<std::size_t>(placement.slotIndex)];
        if (jewel->size > slotSize) {
            issues.push_back("jewel '" + jewel->id + "' is larger than its socket");
        }
        if (jewel->pool != pool) {
            issues.push_back("jewel '" + jewel->id + "' placed in a " + slotPoolName(pool) + " socket");
        }
        if (!occupied.insert({placement.holderId, placement.slotIndex}).second) {
            issues.push_back("socket " + std::to_string(placement.slotIndex) + " of '" + placement.holderId +
                             "' holds more than one jewel");
        }
        ++used[static_cast<std::size_t>(std::clamp(slotSize, 1, kMaxSlotSize) - 1)];
        addPoints(points, jewel->skills);
    }

    std::array<int, kMaxSlotSize> total{};
    for (const auto& [id, holder] : holders) {
        for (int size : *holder.second) {
            if (size >= 1 && size <= kMaxSlotSize) ++total[static_cast<std::size_t>(size - 1)];
        }
    }
    for (std::size_t t = 0; t < total.size(); ++t) {
        if (solution.freeSlots[t] != total[t] - used[t]) {
            issues.push_back("free size-" + std::to_string(t + 1) + " socket count does not match placements");
        }
    }

    for (const auto& skill : catalog.skills) {
        auto it = points.find(skill.id);
        const int raw = it == points.end() ? 0 : it->second;
        const int expected = effectiveLevel(skill, raw);
        const auto reported = std::find_if(solution.skills.begin(), solution.skills.end(),
                                           [&skill](const SkillLevel& s) { return s.skillId == skill.id; });
        const int reportedRaw = reported == solution.skills.end() ? 0 : reported->rawPoints;
        const int reportedLevel = reported == solution.skills.end() ? 0 : reported->level;
        if (reportedRaw != raw || reportedLevel != expected) {
            issues.push_back("skill '" + skill.id + "' reported at " + std::to_string(reportedLevel) + " (" +
                             std::to_string(reportedRaw) + " pts), expected " + std::to_string(expected) + " (" +
                             std::to_string(raw) + " pts)");
        }
    }
    return issues;
}

}  // namespace Loadout
