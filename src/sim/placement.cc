#include "sim/placement.h"

#include <optional>
#include <string>

#include "core/log.h"

namespace tinyfactory::sim {
namespace {

std::string cellText(const core::Cell2i& cell) {
    return "(" + std::to_string(cell.x) + "," + std::to_string(cell.y) + ")";
}

void logPlacementHint(FactoryState& state, const core::Cell2i& anchor, MachineKind kind) {
    if (state.grid().hasAdjacentBelt(anchor)) {
        return;
    }
    const MachineSpec spec = machineSpec(kind);
    const std::string name = spec.name;
    if (!spec.hasInputPort) {
        state.addLog("Hint: place a belt next to the " + name + " to carry its output");
    } else if (!spec.hasOutputPort) {
        state.addLog("Hint: run a belt into the " + name + " to sell items");
    } else {
        state.addLog("Hint: the " + name + " needs an input belt and an output belt");
    }
}

} // namespace

bool placeMachineAt(FactoryState& state, const core::Cell2i& anchor, MachineKind kind) {
    const MachineSpec spec = machineSpec(kind);
    FactoryGrid& grid = state.grid();

    if (!grid.canPlaceMachine(anchor)) {
        state.addLog(std::string("No room for a ") + spec.name + " at " + cellText(anchor) + " (needs 2x2)");
        return false;
    }
    if (!state.economy().trySpend(spec.cost)) {
        state.addLog(std::string("Insufficient funds: ") + spec.name + " costs $" + std::to_string(spec.cost));
        return false;
    }
    if (!grid.placeMachine(anchor, kind)) {
        state.economy().refund(spec.cost);
        return false;
    }

    state.addLog(std::string("Placed ") + spec.name + " (-$" + std::to_string(spec.cost) + ")");
    TF_LOGI("placement") << spec.name << " placed at " << cellText(anchor)
                         << ", money=" << state.economy().money;
    logPlacementHint(state, anchor, kind);
    return true;
}

bool placeBeltAtCursor(FactoryState& state) {
    const core::Cell2i cell = state.cursor();
    const std::uint64_t cost = state.config().beltCost;

    if (!state.grid().isEmpty(cell)) {
        return false;
    }
    if (!state.economy().trySpend(cost)) {
        state.addLog("Insufficient funds: Belt costs $" + std::to_string(cost));
        return false;
    }
    if (!state.grid().placeBelt(cell)) {
        state.economy().refund(cost);
        return false;
    }

    const core::Direction direction = state.beltDirection();
    state.addLog(std::string("Placed Belt ") + core::directionArrow(direction));
    TF_LOGD("placement") << "belt placed at " << cellText(cell);

    // Laying a straight run only needs repeated place() calls.
    const core::Cell2i step = core::directionDelta(direction);
    state.moveCursor(step.x, step.y);
    return true;
}

bool deleteAt(FactoryState& state, const core::Cell2i& cell) {
    FactoryGrid& grid = state.grid();

    if (grid.anchorOf(cell)) {
        const std::optional<MachineKind> removed = grid.removeMachine(cell);
        if (!removed) {
            return false;
        }
        const std::uint64_t refund = machineCost(*removed) / 2;
        state.economy().refund(refund);
        state.addLog(std::string("Removed ") + machineName(*removed) + " (+$" + std::to_string(refund) + ")");
        TF_LOGI("placement") << machineName(*removed) << " removed at " << cellText(cell)
                             << ", money=" << state.economy().money;
        return true;
    }

    if (grid.removeBelt(cell)) {
        const std::uint64_t refund = state.config().beltRefund;
        state.economy().refund(refund);
        state.addLog("Removed Belt (+$" + std::to_string(refund) + ")");
        return true;
    }

    return false;
}

bool place(FactoryState& state) {
    const PlacementTool tool = state.tool();
    switch (tool) {
    case PlacementTool::None:
        return false;
    case PlacementTool::Delete:
        return deleteAt(state, state.cursor());
    case PlacementTool::Belt:
        return placeBeltAtCursor(state);
    case PlacementTool::Miner:
    case PlacementTool::Smelter:
    case PlacementTool::Assembler:
    case PlacementTool::Exporter:
    case PlacementTool::Fabricator:
        break;
    }

    const std::optional<MachineKind> kind = machineKindForTool(tool);
    if (!kind) {
        return false;
    }
    return placeMachineAt(state, state.cursor(), *kind);
}

bool toggleMinerMode(FactoryState& state) {
    Machine* machine = state.grid().machineCovering(state.cursor());
    if (machine == nullptr || machine->kind != MachineKind::Miner) {
        return false;
    }
    machine->minerMode = toggledMinerMode(machine->minerMode);
    state.addLog(std::string("Miner mode: ") + minerModeName(machine->minerMode));
    return true;
}

void rotateBelt(FactoryState& state) {
    state.setBeltDirection(core::rotateClockwise(state.beltDirection()));
}

void moveCursor(FactoryState& state, std::int32_t dx, std::int32_t dy) {
    state.moveCursor(dx, dy);
}

} // namespace tinyfactory::sim
