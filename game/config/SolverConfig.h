// Tunables for a solve, loaded from JSON (data/solver.json) with defaults for missing keys.
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../../engine/core/Logger.h"

namespace Loadout {

struct SolverConfig {
    double timeLimitSeconds{30.0};  // > 0; the best assignment so far is kept when it expires
    Forge::LogLevel minLogLevel{Forge::LogLevel::Info};
    bool logModelStats{true};
};

// Parses a JSON document; nullopt when it is not valid JSON or not an object.
std::optional<SolverConfig> parseSolverConfig(std::string_view text);
std::optional<SolverConfig> loadSolverConfig(const std::string& path);

}  // namespace Loadout
