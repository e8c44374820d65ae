#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/grid2.h"
#include "sim/factory_grid.h"

// Simulation BeltRouting subsystem
// Responsible for: moving items already on belts one cell per tick, feeding machines first.
// Should NOT do: take items out of machines (see output_distribution) or run recipes.
namespace tinyfactory::sim {

// Candidate directions for one belt, tried in order.
struct RouteCandidates {
    std::array<core::Direction, 4> directions{};
    std::size_t count = 0;
};

enum class BeltIntentKind : std::uint8_t {
    FeedMachine = 0,
    MoveToBelt = 1
};

struct BeltIntent {
    BeltIntentKind kind = BeltIntentKind::MoveToBelt;
    core::Cell2i from{};
    // Destination belt, or the machine anchor for feeds.
    core::Cell2i to{};
    core::Direction direction = core::Direction::Right;
};

struct BeltRoutingResult {
    std::uint32_t fedToMachines = 0;
    std::uint32_t movedOnBelts = 0;
    std::uint32_t droppedConflicts = 0;
    std::uint32_t stalled = 0;
};

// Forward then the two perpendiculars when a source is known (never the source itself);
// Right, Down, Left, Up otherwise.
RouteCandidates routeCandidates(std::optional<core::Direction> source);

// Pass 1: read-only snapshot of what every loaded belt wants to do this tick.
// `stalled` (optional) receives the number of loaded belts with no viable direction.
std::vector<BeltIntent> collectBeltIntents(const FactoryGrid& grid, std::uint32_t* stalled = nullptr);

// Pass 2: feeds first, then belt moves; first intent per destination wins.
BeltRoutingResult applyBeltIntents(FactoryGrid& grid, const std::vector<BeltIntent>& intents);

BeltRoutingResult routeBelts(FactoryGrid& grid);

} // namespace tinyfactory::sim
