#pragma once

#include <optional>

#include "core/grid2.h"
#include "sim/item.h"

// Simulation Belt subsystem
// Responsible for: a single-slot transport tile that remembers where its last item came from.
// Should NOT do: choose routes (see belt_routing) or own machine state.
namespace tinyfactory::sim {

struct Belt {
    std::optional<ItemKind> item;
    // Points from this belt toward the cell the current (or most recent) item came from.
    // Kept after the item leaves; output distribution reads it to spot input belts.
    std::optional<core::Direction> source;

    bool hasItem() const { return item.has_value(); }

    // Cell an item on this belt would move to when travelling straight on.
    std::optional<core::Cell2i> forwardCell(const core::Cell2i& self) const {
        if (!source) {
            return std::nullopt;
        }
        return core::neighborCell(self, core::oppositeDirection(*source));
    }
};

} // namespace tinyfactory::sim
