#include "Solution.h"

#include <algorithm>

namespace Loadout {

int Solution::levelOf(std::string_view skillId) const {
    auto it = std::find_if(skills.begin(), skills.end(), [skillId](const SkillLevel& s) { return s.skillId == skillId; });
    return it == skills.end() ? 0 : it->level;
}

const char* solveStatusName(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:
            return "optimal";
        case SolveStatus::Feasible:
            return "feasible";
        case SolveStatus::CatalogInconsistency:
            return "catalog_inconsistency";
        case SolveStatus::Infeasible:
            return "infeasible";
        case SolveStatus::Timeout:
            return "timeout";
        case SolveStatus::Cancelled:
            return "cancelled";
        case SolveStatus::SolverInternalError:
        default:
            return "solver_internal_error";
    }
}

}  // namespace Loadout
