#pragma once

#include <array>
#include <cstdint>

#include "sim/item.h"

// Simulation Economy subsystem
// Responsible for: money and lifetime production/export totals for one factory session.
// Should NOT do: decide prices (see item.h / machine.h tables) or validate placement.
namespace tinyfactory::sim {

struct Economy {
    std::uint64_t money = 0;
    std::uint64_t totalExported = 0;
    std::uint64_t totalMoneyEarned = 0;
    std::uint64_t lastExportValue = 0;
    // Ticks left on the export highlight; the display layer only reads it.
    std::uint32_t exportFlash = 0;
    std::array<std::uint64_t, kItemKindCount> producedCount{};

    bool canAfford(std::uint64_t cost) const { return money >= cost; }

    // Money is unsigned and never goes negative: spending fails instead.
    bool trySpend(std::uint64_t cost) {
        if (!canAfford(cost)) {
            return false;
        }
        money -= cost;
        return true;
    }

    void refund(std::uint64_t amount) { money += amount; }

    void recordProduced(ItemKind item) { ++producedCount[itemIndex(item)]; }

    std::uint64_t produced(ItemKind item) const { return producedCount[itemIndex(item)]; }

    void recordExport(std::uint64_t value, std::uint32_t flashTicks) {
        money += value;
        totalMoneyEarned += value;
        ++totalExported;
        lastExportValue = value;
        exportFlash = flashTicks;
    }

    void decayExportFlash() {
        if (exportFlash > 0) {
            --exportFlash;
        }
    }
};

} // namespace tinyfactory::sim
