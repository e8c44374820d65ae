#include "sim/output_distribution.h"

#include "core/log.h"

namespace tinyfactory::sim {

bool isInputBeltFor(const Belt& belt, const core::Cell2i& beltCell, const core::Cell2i& anchor) {
    const std::optional<core::Cell2i> forward = belt.forwardCell(beltCell);
    return forward && FactoryGrid::footprintContains(anchor, *forward);
}

// Left and right columns (corners included) resolve horizontally.
core::Direction directionTowardFootprint(const core::Cell2i& beltCell, const core::Cell2i& anchor) {
    if (beltCell.x < anchor.x) {
        return core::Direction::Right;
    }
    if (beltCell.x >= anchor.x + FactoryGrid::kMachineSize) {
        return core::Direction::Left;
    }
    if (beltCell.y < anchor.y) {
        return core::Direction::Down;
    }
    return core::Direction::Up;
}

std::optional<core::Cell2i> findOutputBelt(const FactoryGrid& grid, const core::Cell2i& anchor) {
    for (const core::Cell2i& cell : grid.perimeterCells(anchor)) {
        const Belt* belt = grid.beltAt(cell);
        if (belt == nullptr || belt->hasItem()) {
            continue;
        }
        if (isInputBeltFor(*belt, cell, anchor)) {
            continue;
        }
        return cell;
    }
    return std::nullopt;
}

std::uint32_t distributeOutputs(FactoryGrid& grid) {
    std::uint32_t placed = 0;
    for (const core::Cell2i& anchor : grid.machineAnchors()) {
        Machine* machine = grid.machineAt(anchor);
        if (machine == nullptr || machine->kind == MachineKind::Exporter || machine->outputBuffer.empty()) {
            continue;
        }

        const std::optional<core::Cell2i> target = findOutputBelt(grid, anchor);
        if (!target) {
            continue;
        }

        Belt* belt = grid.beltAt(*target);
        const std::optional<ItemKind> item = machine->outputBuffer.popFront();
        if (belt == nullptr || !item) {
            continue;
        }
        belt->item = *item;
        belt->source = directionTowardFootprint(*target, anchor);
        ++placed;
        TF_LOGT("output") << machineName(machine->kind) << " at (" << anchor.x << "," << anchor.y
                          << ") pushed " << itemName(*item) << " to (" << target->x << "," << target->y << ")";
    }
    return placed;
}

} // namespace tinyfactory::sim
