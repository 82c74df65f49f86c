#include "SolverConfig.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace Loadout {

namespace {
constexpr double kMinTimeLimitSeconds = 0.01;
}

std::optional<SolverConfig> parseSolverConfig(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::exception& e) {
        Forge::logWarn(std::string("Solver config is not valid JSON: ") + e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        Forge::logWarn("Solver config must be a JSON object");
        return std::nullopt;
    }

    SolverConfig cfg{};
    try {
        cfg.timeLimitSeconds = j.value("timeLimitSeconds", cfg.timeLimitSeconds);
        if (!(cfg.timeLimitSeconds >= kMinTimeLimitSeconds)) {
            Forge::logWarn("timeLimitSeconds must be positive; clamping");
            cfg.timeLimitSeconds = kMinTimeLimitSeconds;
        }
        if (j.contains("logLevel")) cfg.minLogLevel = Forge::parseLogLevel(j["logLevel"].get<std::string>());
        cfg.logModelStats = j.value("logModelStats", cfg.logModelStats);
    } catch (const nlohmann::json::exception& e) {
        Forge::logWarn(std::string("Solver config has a mistyped field: ") + e.what());
        return std::nullopt;
    }
    return cfg;
}

std::optional<SolverConfig> loadSolverConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Forge::logWarn("Failed to open solver config " + path);
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseSolverConfig(buffer.str());
}

}  // namespace Loadout
