// JSON readers used by the command-line host; the optimizer itself never touches files.
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../optimizer/Request.h"
#include "Catalog.h"

namespace Loadout {

// Nullopt on malformed JSON or mistyped fields (the reason is logged). Unknown body slots,
// skill kinds and pools are reported as warnings and the entry is skipped.
std::optional<Catalog> parseCatalog(std::string_view text);
std::optional<Catalog> loadCatalog(const std::string& path);

std::optional<OptimizationRequest> parseRequest(std::string_view text);
std::optional<OptimizationRequest> loadRequest(const std::string& path);

}  // namespace Loadout
