#include <iostream>
#include <string>

#include "../engine/core/Logger.h"
#include "../game/catalog/CatalogLoaders.h"
#include "../game/config/SolverConfig.h"
#include "../game/optimizer/LoadoutSolver.h"
#include "../game/optimizer/SolutionWriter.h"

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <catalog.json> <request.json> [solver.json]\n";
        return 2;
    }

    Loadout::SolverConfig config{};
    if (argc > 3) {
        auto loaded = Loadout::loadSolverConfig(argv[3]);
        if (loaded) {
            config = *loaded;
        } else {
            Forge::logWarn("Failed to load solver config; using defaults.");
        }
    }
    Forge::Logger::setMinLevel(config.minLogLevel);

    auto catalog = Loadout::loadCatalog(argv[1]);
    if (!catalog) {
        Forge::logError(std::string("Could not read catalog ") + argv[1]);
        return 1;
    }
    auto request = Loadout::loadRequest(argv[2]);
    if (!request) {
        Forge::logError(std::string("Could not read request ") + argv[2]);
        return 1;
    }

    Loadout::LoadoutSolver solver(*catalog, config);
    const Loadout::SolveResult result = solver.solve(*request);
    std::cout << Loadout::solveResultToJson(result) << '\n';
    return result.ok() ? 0 : 1;
}
