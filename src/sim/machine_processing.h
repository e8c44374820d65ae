#pragma once

#include <cstdint>

#include "sim/economy.h"
#include "sim/factory_grid.h"
#include "sim/machine.h"

// Simulation MachineProcessing subsystem
// Responsible for: advancing every machine's recipe by one tick.
// Should NOT do: move items between cells; belts and output distribution do that.
namespace tinyfactory::sim {

struct MachineProcessingResult {
    std::uint32_t itemsProduced = 0;
    std::uint32_t itemsExported = 0;
    std::uint64_t revenue = 0;
};

// Runs one tick of a single machine. Returns true when it completed a cycle.
bool stepMachine(Machine& machine, Economy& economy, std::uint32_t exportFlashTicks);

// Row-major pass over all machine anchors.
MachineProcessingResult processMachines(FactoryGrid& grid, Economy& economy, std::uint32_t exportFlashTicks);

} // namespace tinyfactory::sim
