#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

// Simulation FactoryConfig subsystem
// Responsible for: tunable session parameters and clamping them into supported ranges.
// Should NOT do: read files or environment variables.
namespace tinyfactory::sim {

struct FactoryConfig {
    std::int32_t gridWidth = 40;
    std::int32_t gridHeight = 30;
    std::uint64_t startingMoney = 50;
    std::size_t messageLogCapacity = 30;
    std::uint64_t beltCost = 2;
    std::uint64_t beltRefund = 1;
    std::uint32_t ticksPerSecond = 10;
    std::uint32_t exportFlashTicks = 10;
};

inline FactoryConfig sanitizeFactoryConfig(const FactoryConfig& config) {
    FactoryConfig clamped = config;
    clamped.gridWidth = std::clamp<std::int32_t>(clamped.gridWidth, 4, 256);
    clamped.gridHeight = std::clamp<std::int32_t>(clamped.gridHeight, 4, 256);
    clamped.messageLogCapacity = std::clamp<std::size_t>(clamped.messageLogCapacity, 1u, 1024u);
    clamped.beltCost = std::max<std::uint64_t>(clamped.beltCost, 1u);
    clamped.beltRefund = std::min(clamped.beltRefund, clamped.beltCost);
    clamped.ticksPerSecond = std::clamp<std::uint32_t>(clamped.ticksPerSecond, 1u, 240u);
    clamped.exportFlashTicks = std::min<std::uint32_t>(clamped.exportFlashTicks, 600u);
    return clamped;
}

} // namespace tinyfactory::sim
