#pragma once

#include <cstdint>
#include <optional>

#include "core/grid2.h"
#include "sim/factory_grid.h"

// Simulation OutputDistribution subsystem
// Responsible for: pushing finished machine output onto adjacent empty belts.
// Should NOT do: move items that are already on belts.
namespace tinyfactory::sim {

// A belt is an input belt for a machine when straight-on travel from it lands in that machine.
bool isInputBeltFor(const Belt& belt, const core::Cell2i& beltCell, const core::Cell2i& anchor);

// Source direction a belt at `beltCell` records when it receives output from the machine at `anchor`.
core::Direction directionTowardFootprint(const core::Cell2i& beltCell, const core::Cell2i& anchor);

// First perimeter belt that can take one output item from the machine at `anchor`.
std::optional<core::Cell2i> findOutputBelt(const FactoryGrid& grid, const core::Cell2i& anchor);

// Returns the number of items placed on belts.
std::uint32_t distributeOutputs(FactoryGrid& grid);

} // namespace tinyfactory::sim
