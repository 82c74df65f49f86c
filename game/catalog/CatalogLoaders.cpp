#include "CatalogLoaders.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Loadout {

using nlohmann::json;

namespace {
std::optional<json> parseDocument(std::string_view text, const char* what) {
    try {
        json j = json::parse(text.begin(), text.end());
        if (!j.is_object()) {
            Forge::logWarn(std::string(what) + " must be a JSON object");
            return std::nullopt;
        }
        return j;
    } catch (const json::exception& e) {
        Forge::logWarn(std::string(what) + " is not valid JSON: " + e.what());
        return std::nullopt;
    }
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Forge::logWarn("Failed to open " + path);
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

SkillPoints readPoints(const json& j) {
    SkillPoints points;
    if (!j.is_object()) return points;
    for (const auto& kv : j.items()) points[kv.key()] = kv.value().get<int>();
    return points;
}

std::vector<int> readSlots(const json& j) {
    std::vector<int> slots;
    if (!j.is_array()) return slots;
    for (const auto& v : j) slots.push_back(v.get<int>());
    return slots;
}

std::optional<SkillDef> readSkill(const json& j) {
    SkillDef s{};
    s.id = j.at("id").get<std::string>();
    s.name = j.value("name", s.id);
    s.maxLevel = j.value("maxLevel", s.maxLevel);
    const std::string kind = j.value("kind", std::string("standard"));
    if (kind == "standard") {
        s.activation = StandardActivation{};
    } else if (kind == "group") {
        s.activation = GroupActivation{j.at("threshold").get<int>()};
    } else if (kind == "series") {
        SeriesActivation series{};
        for (const auto& step : j.at("steps")) {
            series.steps.push_back(SeriesStep{step.at("threshold").get<int>(), step.at("level").get<int>()});
        }
        s.activation = std::move(series);
    } else {
        Forge::logWarn("Unknown skill kind '" + kind + "' for skill " + s.id + "; skipping.");
        return std::nullopt;
    }
    return s;
}
}  // namespace

std::optional<Catalog> parseCatalog(std::string_view text) {
    auto doc = parseDocument(text, "Catalog");
    if (!doc) return std::nullopt;
    const json& j = *doc;

    Catalog catalog;
    try {
        for (const auto& entry : j.value("skills", json::array())) {
            if (auto skill = readSkill(entry)) catalog.skills.push_back(std::move(*skill));
        }
        for (const auto& entry : j.value("pieces", json::array())) {
            EquipmentPiece p{};
            p.id = entry.at("id").get<std::string>();
            p.name = entry.value("name", p.id);
            const std::string slot = entry.at("slot").get<std::string>();
            auto parsed = parseBodySlot(slot);
            if (!parsed) {
                Forge::logWarn("Unknown body slot '" + slot + "' for piece " + p.id + "; skipping.");
                continue;
            }
            p.slot = *parsed;
            if (entry.contains("skills")) p.skills = readPoints(entry["skills"]);
            if (entry.contains("jewelSlots")) p.jewelSlots = readSlots(entry["jewelSlots"]);
            catalog.pieces.push_back(std::move(p));
        }
        for (const auto& entry : j.value("charms", json::array())) {
            Charm c{};
            c.id = entry.at("id").get<std::string>();
            c.name = entry.value("name", c.id);
            if (entry.contains("skills")) c.skills = readPoints(entry["skills"]);
            catalog.charms.push_back(std::move(c));
        }
        for (const auto& entry : j.value("weapons", json::array())) {
            Weapon w{};
            w.id = entry.at("id").get<std::string>();
            w.name = entry.value("name", w.id);
            w.weaponClass = entry.value("class", std::string());
            if (entry.contains("skills")) w.skills = readPoints(entry["skills"]);
            if (entry.contains("jewelSlots")) w.jewelSlots = readSlots(entry["jewelSlots"]);
            catalog.weapons.push_back(std::move(w));
        }
        for (const auto& entry : j.value("jewels", json::array())) {
            Jewel jw{};
            jw.id = entry.at("id").get<std::string>();
            jw.name = entry.value("name", jw.id);
            jw.size = entry.value("size", jw.size);
            const std::string pool = entry.value("pool", std::string("armor"));
            auto parsed = parseSlotPool(pool);
            if (!parsed) {
                Forge::logWarn("Unknown slot pool '" + pool + "' for jewel " + jw.id + "; skipping.");
                continue;
            }
            jw.pool = *parsed;
            if (entry.contains("skills")) jw.skills = readPoints(entry["skills"]);
            catalog.jewels.push_back(std::move(jw));
        }
    } catch (const json::exception& e) {
        Forge::logWarn(std::string("Catalog has a malformed entry: ") + e.what());
        return std::nullopt;
    }

    Forge::logInfo("Loaded catalog: " + std::to_string(catalog.skills.size()) + " skills, " +
                   std::to_string(catalog.pieces.size()) + " pieces, " + std::to_string(catalog.charms.size()) +
                   " charms, " + std::to_string(catalog.weapons.size()) + " weapons, " +
                   std::to_string(catalog.jewels.size()) + " jewels");
    return catalog;
}

std::optional<Catalog> loadCatalog(const std::string& path) {
    auto text = readFile(path);
    if (!text) return std::nullopt;
    return parseCatalog(*text);
}

std::optional<OptimizationRequest> parseRequest(std::string_view text) {
    auto doc = parseDocument(text, "Request");
    if (!doc) return std::nullopt;
    const json& j = *doc;

    OptimizationRequest request;
    try {
        for (const auto& entry : j.value("skills", json::array())) {
            SkillRequest r{};
            r.skillId = entry.at("id").get<std::string>();
            r.weight = entry.value("weight", r.weight);
            if (entry.contains("levelCap") && !entry["levelCap"].is_null()) {
                r.levelCap = entry["levelCap"].get<int>();
            }
            request.skills.push_back(std::move(r));
        }
        if (j.contains("weapon")) {
            const auto& w = j["weapon"];
            request.weapon.weaponClass = w.value("class", std::string());
            if (w.contains("ids")) {
                for (const auto& id : w["ids"]) request.weapon.weaponIds.push_back(id.get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        Forge::logWarn(std::string("Request has a malformed entry: ") + e.what());
        return std::nullopt;
    }
    return request;
}

std::optional<OptimizationRequest> loadRequest(const std::string& path) {
    auto text = readFile(path);
    if (!text) return std::nullopt;
    return parseRequest(*text);
}

}  // namespace Loadout
