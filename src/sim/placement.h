#pragma once

#include <cstdint>

#include "core/grid2.h"
#include "sim/factory_state.h"
#include "sim/machine.h"

// Simulation Placement subsystem
// Responsible for: validating and applying player build/delete commands against money and grid space.
// Should NOT do: advance simulation time or decide which tool is selected.
namespace tinyfactory::sim {

// Applies the active tool at the cursor. Returns false and leaves the session unchanged on failure.
bool place(FactoryState& state);

bool placeMachineAt(FactoryState& state, const core::Cell2i& anchor, MachineKind kind);
bool placeBeltAtCursor(FactoryState& state);
bool deleteAt(FactoryState& state, const core::Cell2i& cell);

// Flips Iron/Copper on the Miner under the cursor. Returns false for anything else.
bool toggleMinerMode(FactoryState& state);

// Right -> Down -> Left -> Up -> Right.
void rotateBelt(FactoryState& state);

void moveCursor(FactoryState& state, std::int32_t dx, std::int32_t dy);

} // namespace tinyfactory::sim
