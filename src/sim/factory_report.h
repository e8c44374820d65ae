#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "core/grid2.h"
#include "sim/economy.h"
#include "sim/factory_grid.h"
#include "sim/machine.h"

// Simulation FactoryReport subsystem
// Responsible for: read-only statistics derived from the grid and economy for display or logs.
// Should NOT do: mutate any session state.
namespace tinyfactory::sim {

class FactoryState;

enum class MachineStatus : std::uint8_t {
    Idle = 0,
    Working = 1,
    Blocked = 2
};

struct KindStats {
    std::uint32_t count = 0;
    std::uint64_t totalProduced = 0;
    std::uint64_t totalRevenue = 0;
    double averageUtilization = 0.0;
    std::uint32_t working = 0;
    std::uint32_t idle = 0;
    std::uint32_t blocked = 0;
};

using FactoryKindStats = std::array<KindStats, kMachineKindCount>;

const char* machineStatusName(MachineStatus status);
MachineStatus classifyMachine(const Machine& machine);

// Full output with nowhere to put it: no belt anywhere on the perimeter.
bool isOutputBlocked(const FactoryGrid& grid, const core::Cell2i& anchor);

FactoryKindStats collectKindStats(const FactoryGrid& grid);

// Money earned per simulated second; 0 until something has been sold.
double incomeRatePerSecond(const Economy& economy, std::uint64_t totalTicks, std::uint32_t ticksPerSecond);

std::string summarizeFactory(const FactoryState& state);

} // namespace tinyfactory::sim
