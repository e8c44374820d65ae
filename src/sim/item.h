#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// Simulation Item subsystem
// Responsible for: defining the item kinds that flow through the factory and their export values.
// Should NOT do: buffering, transport logic, or serialization.
namespace tinyfactory::sim {

enum class ItemKind : std::uint8_t {
    IronOre = 0,
    IronPlate = 1,
    Gear = 2,
    CopperOre = 3,
    CopperPlate = 4,
    Circuit = 5
};

inline constexpr std::size_t kItemKindCount = 6;

inline constexpr std::array<ItemKind, kItemKindCount> kAllItemKinds = {
    ItemKind::IronOre,
    ItemKind::IronPlate,
    ItemKind::Gear,
    ItemKind::CopperOre,
    ItemKind::CopperPlate,
    ItemKind::Circuit
};

inline constexpr std::size_t itemIndex(ItemKind item) {
    return static_cast<std::size_t>(item);
}

// Money credited when an Exporter consumes one unit.
inline constexpr std::uint64_t exportValue(ItemKind item) {
    switch (item) {
    case ItemKind::IronOre: return 1;
    case ItemKind::IronPlate: return 5;
    case ItemKind::Gear: return 20;
    case ItemKind::CopperOre: return 2;
    case ItemKind::CopperPlate: return 6;
    case ItemKind::Circuit: return 40;
    }
    return 0;
}

inline constexpr const char* itemName(ItemKind item) {
    switch (item) {
    case ItemKind::IronOre: return "IronOre";
    case ItemKind::IronPlate: return "IronPlate";
    case ItemKind::Gear: return "Gear";
    case ItemKind::CopperOre: return "CopperOre";
    case ItemKind::CopperPlate: return "CopperPlate";
    case ItemKind::Circuit: return "Circuit";
    }
    return "Unknown";
}

static_assert(exportValue(ItemKind::IronPlate) > exportValue(ItemKind::IronOre));
static_assert(exportValue(ItemKind::Gear) > exportValue(ItemKind::IronPlate));
static_assert(exportValue(ItemKind::CopperPlate) > exportValue(ItemKind::CopperOre));
static_assert(exportValue(ItemKind::Circuit) > exportValue(ItemKind::CopperPlate));

} // namespace tinyfactory::sim
