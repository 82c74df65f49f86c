// Entry point of the optimizer: one stateless solve per request against a read-only catalog.
#pragma once

#include <string>
#include <vector>

#include "../../engine/core/CancellationToken.h"
#include "../catalog/Catalog.h"
#include "../config/SolverConfig.h"
#include "Request.h"
#include "Solution.h"

namespace Loadout {

class LoadoutSolver {
public:
    // The catalog must outlive the solver. Concurrent solve() calls are safe.
    explicit LoadoutSolver(const Catalog& catalog, SolverConfig config = {});

    // Builds the model, solves it and decodes the assignment. A cancelled token yields
    // SolveStatus::Cancelled with no solution.
    SolveResult solve(const OptimizationRequest& request, Forge::CancellationToken* token = nullptr) const;

    const SolverConfig& config() const { return config_; }

private:
    const Catalog& catalog_;
    SolverConfig config_;
};

// Independent check of a solution against the game rules: one piece per body slot, at most one
// charm, a weapon from the filter, jewels in compatible free sockets of selected holders, and
// reported skill levels matching the points actually granted. Empty result means valid.
std::vector<std::string> verifySolution(const Catalog& catalog,
                                        const OptimizationRequest& request,
                                        const Solution& solution);

}  // namespace Loadout
