#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "sim/item.h"
#include "sim/item_buffer.h"

// Simulation Machine subsystem
// Responsible for: machine kinds, their static cost/recipe tables, and per-machine buffered state.
// Should NOT do: per-tick processing, routing, or grid placement.
namespace tinyfactory::sim {

enum class MachineKind : std::uint8_t {
    Miner = 0,
    Smelter = 1,
    Assembler = 2,
    Exporter = 3,
    Fabricator = 4
};

inline constexpr std::size_t kMachineKindCount = 5;

inline constexpr std::array<MachineKind, kMachineKindCount> kAllMachineKinds = {
    MachineKind::Miner,
    MachineKind::Smelter,
    MachineKind::Assembler,
    MachineKind::Exporter,
    MachineKind::Fabricator
};

enum class MinerMode : std::uint8_t {
    Iron = 0,
    Copper = 1
};

struct MachineSpec {
    const char* name = "";
    std::uint64_t cost = 0;
    std::uint32_t recipeTime = 1;
    // Only recipes with a single fixed ingredient/product set these.
    std::optional<ItemKind> fixedInput;
    std::optional<ItemKind> fixedOutput;
    bool hasInputPort = true;
    bool hasOutputPort = true;
};

inline constexpr std::size_t machineIndex(MachineKind kind) {
    return static_cast<std::size_t>(kind);
}

inline constexpr MachineSpec machineSpec(MachineKind kind) {
    switch (kind) {
    case MachineKind::Miner:
        return MachineSpec{"Miner", 10, 10, std::nullopt, std::nullopt, false, true};
    case MachineKind::Smelter:
        return MachineSpec{"Smelter", 25, 15, std::nullopt, std::nullopt, true, true};
    case MachineKind::Assembler:
        return MachineSpec{"Assembler", 50, 20, ItemKind::IronPlate, ItemKind::Gear, true, true};
    case MachineKind::Exporter:
        return MachineSpec{"Exporter", 15, 5, std::nullopt, std::nullopt, true, false};
    case MachineKind::Fabricator:
        return MachineSpec{"Fabricator", 75, 25, std::nullopt, ItemKind::Circuit, true, true};
    }
    return MachineSpec{};
}

inline constexpr std::uint64_t machineCost(MachineKind kind) {
    return machineSpec(kind).cost;
}

inline constexpr std::uint32_t recipeTime(MachineKind kind) {
    return machineSpec(kind).recipeTime;
}

inline constexpr const char* machineName(MachineKind kind) {
    return machineSpec(kind).name;
}

// Input port filter used by belts deciding whether to feed a machine.
inline constexpr bool machineAcceptsItem(MachineKind kind, ItemKind item) {
    switch (kind) {
    case MachineKind::Exporter:
        return true;
    case MachineKind::Smelter:
        return item == ItemKind::IronOre || item == ItemKind::CopperOre;
    case MachineKind::Assembler:
        return item == machineSpec(kind).fixedInput;
    case MachineKind::Fabricator:
        return item == ItemKind::IronPlate || item == ItemKind::CopperPlate;
    case MachineKind::Miner:
        return false;
    }
    return false;
}

inline constexpr std::optional<ItemKind> smeltedItem(ItemKind ore) {
    switch (ore) {
    case ItemKind::IronOre: return ItemKind::IronPlate;
    case ItemKind::CopperOre: return ItemKind::CopperPlate;
    default: return std::nullopt;
    }
}

inline constexpr ItemKind minedItem(MinerMode mode) {
    return mode == MinerMode::Copper ? ItemKind::CopperOre : ItemKind::IronOre;
}

inline constexpr MinerMode toggledMinerMode(MinerMode mode) {
    return mode == MinerMode::Iron ? MinerMode::Copper : MinerMode::Iron;
}

inline constexpr const char* minerModeName(MinerMode mode) {
    return mode == MinerMode::Copper ? "Copper" : "Iron";
}

struct MachineStats {
    std::uint64_t itemsProduced = 0;
    std::uint64_t revenueEarned = 0;
    std::uint64_t activeTicks = 0;
    std::uint64_t totalTicks = 0;
};

class Machine {
public:
    static constexpr std::size_t kMaxBuffer = ItemBuffer::kDefaultCapacity;

    explicit Machine(MachineKind kindIn);

    double utilization() const;
    MachineSpec spec() const;

    MachineKind kind = MachineKind::Miner;
    MinerMode minerMode = MinerMode::Iron;
    ItemBuffer inputBuffer{kMaxBuffer};
    ItemBuffer outputBuffer{kMaxBuffer};
    std::uint32_t progress = 0;
    MachineStats stats{};
};

inline Machine::Machine(MachineKind kindIn) : kind(kindIn) {}

inline double Machine::utilization() const {
    if (stats.totalTicks == 0) {
        return 0.0;
    }
    return static_cast<double>(stats.activeTicks) / static_cast<double>(stats.totalTicks);
}

inline MachineSpec Machine::spec() const {
    return machineSpec(kind);
}

} // namespace tinyfactory::sim
