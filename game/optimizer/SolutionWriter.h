// JSON view of a solve result for the command-line host.
#pragma once

#include <string>

#include "Solution.h"

namespace Loadout {

std::string solveResultToJson(const SolveResult& result, int indent = 2);

}  // namespace Loadout
