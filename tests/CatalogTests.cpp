// Catalog validation, JSON loaders, solver config and result serialization.
#include <cassert>
#include <string>
#include <vector>

#include "../game/catalog/CatalogLoaders.h"
#include "../game/config/SolverConfig.h"
#include "../game/optimizer/SolutionWriter.h"
#include "TestCatalog.h"

using namespace Loadout;

namespace {
bool mentions(const std::vector<std::string>& issues, const std::string& needle) {
    for (const auto& issue : issues) {
        if (issue.find(needle) != std::string::npos) return true;
    }
    return false;
}

const char* kCatalogJson = R"({
  "skills": [
    {"id": "attack_boost", "name": "Attack Boost", "maxLevel": 5},
    {"id": "rey_dau_set", "maxLevel": 4, "kind": "group", "threshold": 2},
    {"id": "guardian_series", "maxLevel": 2, "kind": "series",
     "steps": [{"threshold": 2, "level": 1}, {"threshold": 4, "level": 2}]},
    {"id": "mystery", "kind": "cosmic"}
  ],
  "pieces": [
    {"id": "rey_helm", "slot": "head", "skills": {"rey_dau_set": 1}, "jewelSlots": [2, 1]},
    {"id": "rey_mail", "slot": "chest", "skills": {"attack_boost": 1}},
    {"id": "rey_vambraces", "slot": "arms"},
    {"id": "rey_coil", "slot": "waist"},
    {"id": "rey_greaves", "slot": "legs", "jewelSlots": [3]},
    {"id": "tail_cape", "slot": "tail"}
  ],
  "charms": [{"id": "power_charm", "skills": {"attack_boost": 2}}],
  "weapons": [{"id": "rey_great_sword", "class": "great_sword", "jewelSlots": [3, 1]}],
  "jewels": [
    {"id": "attack_jewel", "size": 1, "skills": {"attack_boost": 1}},
    {"id": "expert_jewel", "size": 3, "pool": "weapon", "skills": {"attack_boost": 2}}
  ]
})";
}  // namespace

int main() {
    // Loader: every section is read, unknown kinds and body slots are skipped.
    {
        auto catalog = parseCatalog(kCatalogJson);
        assert(catalog.has_value());
        assert(catalog->skills.size() == 3);
        assert(catalog->pieces.size() == 5);
        assert(catalog->charms.size() == 1);
        assert(catalog->weapons.size() == 1);
        assert(catalog->jewels.size() == 2);

        const SkillDef* group = findSkill(*catalog, "rey_dau_set");
        assert(group && group->kind() == SkillKind::Group);
        assert(std::get<GroupActivation>(group->activation).threshold == 2);
        const SkillDef* series = findSkill(*catalog, "guardian_series");
        assert(series && series->kind() == SkillKind::Series);
        assert(std::get<SeriesActivation>(series->activation).steps.size() == 2);

        assert(catalog->pieces[0].jewelSlots == std::vector<int>({2, 1}));
        assert(catalog->weapons[0].weaponClass == "great_sword");
        assert(catalog->jewels[1].pool == SlotPool::Weapon);
        assert(validateCatalog(*catalog).empty());
    }

    // Loader: malformed input is rejected rather than half-read.
    {
        assert(!parseCatalog("{ not json").has_value());
        assert(!parseCatalog("[1, 2, 3]").has_value());
        assert(!parseCatalog(R"({"pieces": [{"slot": "head"}]})").has_value());
        assert(!parseCatalog(R"({"skills": [{"id": "x", "maxLevel": "five"}]})").has_value());
    }

    // Request loader with caps and a weapon filter.
    {
        auto request = parseRequest(R"({
          "skills": [{"id": "attack_boost", "weight": 3, "levelCap": 4}, {"id": "rey_dau_set"}],
          "weapon": {"class": "great_sword", "ids": ["rey_great_sword"]}
        })");
        assert(request.has_value());
        assert(request->skills.size() == 2);
        assert(request->skills[0].weight == 3);
        assert(request->skills[0].levelCap == 4);
        assert(request->skills[1].weight == 1);
        assert(!request->skills[1].levelCap.has_value());
        assert(request->weapon.weaponClass == "great_sword");
        assert(request->weapon.weaponIds.size() == 1);
        assert(!parseRequest(R"({"skills": [{"weight": 2}]})").has_value());
    }

    // Validation: references and shapes.
    {
        Catalog c = TestCatalog::bare();
        c.skills.push_back(TestCatalog::groupSkill("set_a", 3, 2));
        c.skills.push_back(TestCatalog::groupSkill("set_b", 3, 2));
        c.skills.push_back(TestCatalog::seriesSkill("series_bad", 2, {{3, 1}, {3, 2}}));
        c.skills.push_back(TestCatalog::seriesSkill("series_drop", 3, {{1, 2}, {3, 1}}));
        c.pieces.push_back(TestCatalog::piece("double_set", BodySlot::Head, {{"set_a", 1}, {"set_b", 1}}));
        c.pieces.push_back(TestCatalog::piece("dangling", BodySlot::Chest, {{"ghost", 1}}));
        c.pieces.push_back(TestCatalog::piece("bad_socket", BodySlot::Arms, {}, {4}));
        c.pieces.push_back(TestCatalog::piece("bare_head", BodySlot::Head));
        c.jewels.push_back(TestCatalog::jewel("huge_jewel", 5, {}));

        const auto issues = validateCatalog(c);
        assert(mentions(issues, "more than one group skill"));
        assert(mentions(issues, "unknown skill 'ghost'"));
        assert(mentions(issues, "not strictly increasing"));
        assert(mentions(issues, "decreasing series levels"));
        assert(mentions(issues, "invalid size 4"));
        assert(mentions(issues, "duplicate piece id 'bare_head'"));
        assert(mentions(issues, "huge_jewel"));
    }

    // Validation: every body slot needs at least one candidate.
    {
        Catalog c = TestCatalog::bare();
        c.pieces.erase(c.pieces.begin() + static_cast<long>(BodySlot::Waist));
        assert(mentions(validateCatalog(c), "body slot waist"));
    }

    // Solver config: defaults, overrides and clamping.
    {
        auto defaults = parseSolverConfig("{}");
        assert(defaults.has_value());
        assert(defaults->timeLimitSeconds == 30.0);
        assert(defaults->minLogLevel == Forge::LogLevel::Info);

        auto cfg = parseSolverConfig(R"({"timeLimitSeconds": 5, "logLevel": "debug", "logModelStats": false})");
        assert(cfg.has_value());
        assert(cfg->timeLimitSeconds == 5.0);
        assert(cfg->minLogLevel == Forge::LogLevel::Debug);
        assert(!cfg->logModelStats);

        auto clamped = parseSolverConfig(R"({"timeLimitSeconds": -1})");
        assert(clamped.has_value() && clamped->timeLimitSeconds > 0.0);
        assert(!parseSolverConfig(R"({"timeLimitSeconds": "soon"})").has_value());
    }

    // Result JSON carries the status, and the loadout only when there is one.
    {
        SolveResult failed{};
        failed.status = SolveStatus::Cancelled;
        failed.message = "solve cancelled";
        const std::string text = solveResultToJson(failed);
        assert(text.find("\"cancelled\"") != std::string::npos);
        assert(text.find("\"solution\"") == std::string::npos);

        SolveResult solved{};
        solved.status = SolveStatus::Optimal;
        Solution s{};
        s.pieces[static_cast<std::size_t>(BodySlot::Head)] = "rey_helm";
        s.weapon = "rey_great_sword";
        s.skills.push_back(SkillLevel{"attack_boost", 3, 3});
        s.optimal = true;
        solved.solution = s;
        const std::string out = solveResultToJson(solved);
        assert(out.find("\"optimal\"") != std::string::npos);
        assert(out.find("rey_helm") != std::string::npos);
        assert(out.find("attack_boost") != std::string::npos);
    }

    return 0;
}
