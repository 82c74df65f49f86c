// Read-only equipment catalog: skills, armor pieces, charms, weapons and jewels.
#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Loadout {

enum class BodySlot { Head = 0, Chest, Arms, Waist, Legs, Count };

constexpr std::size_t kBodySlotCount = static_cast<std::size_t>(BodySlot::Count);

// Which holders a jewel may be socketed into.
enum class SlotPool { Armor = 0, Weapon, Count };

constexpr std::size_t kSlotPoolCount = static_cast<std::size_t>(SlotPool::Count);

// Jewel and slot sizes run 1..kMaxSlotSize; a slot accepts any jewel not larger than itself.
constexpr int kMaxSlotSize = 3;

// Activation rules. Kind-specific data lives only on the matching alternative.
struct StandardActivation {};

struct GroupActivation {
    int threshold{1};  // raw points needed before the skill does anything
};

struct SeriesStep {
    int threshold{0};
    int level{0};
};

struct SeriesActivation {
    std::vector<SeriesStep> steps;  // thresholds strictly increasing, levels non-decreasing
};

using SkillActivation = std::variant<StandardActivation, GroupActivation, SeriesActivation>;

enum class SkillKind { Standard, Group, Series };

struct SkillDef {
    std::string id;
    std::string name;
    int maxLevel{1};
    SkillActivation activation{};

    SkillKind kind() const;
};

// Skill id -> raw points. Ordered so model construction is deterministic.
using SkillPoints = std::map<std::string, int>;

struct EquipmentPiece {
    std::string id;
    std::string name;
    BodySlot slot{BodySlot::Head};
    SkillPoints skills;
    std::vector<int> jewelSlots;  // slot sizes, in socket order
};

struct Charm {
    std::string id;
    std::string name;
    SkillPoints skills;
};

struct Weapon {
    std::string id;
    std::string name;
    std::string weaponClass;
    SkillPoints skills;
    std::vector<int> jewelSlots;
};

struct Jewel {
    std::string id;
    std::string name;
    int size{1};
    SlotPool pool{SlotPool::Armor};
    SkillPoints skills;
};

struct Catalog {
    std::vector<SkillDef> skills;
    std::vector<EquipmentPiece> pieces;
    std::vector<Charm> charms;
    std::vector<Weapon> weapons;
    std::vector<Jewel> jewels;
};

const char* bodySlotName(BodySlot slot);
std::optional<BodySlot> parseBodySlot(std::string_view name);
const char* slotPoolName(SlotPool pool);
std::optional<SlotPool> parseSlotPool(std::string_view name);

const SkillDef* findSkill(const Catalog& catalog, std::string_view id);
std::vector<const EquipmentPiece*> piecesForSlot(const Catalog& catalog, BodySlot slot);

// Number of slots of exactly `size` in an inventory.
int countSlots(const std::vector<int>& slots, int size);

// Referential and shape checks needed before a model can be built. Empty result means consistent.
std::vector<std::string> validateCatalog(const Catalog& catalog);

}  // namespace Loadout
