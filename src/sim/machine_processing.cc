#include "sim/machine_processing.h"

#include <optional>

#include "core/log.h"

namespace tinyfactory::sim {
namespace {

// Outcome of inspecting the input buffer before advancing progress.
struct RecipeCheck {
    bool ready = false;
    std::optional<ItemKind> output;
};

RecipeCheck checkRecipe(const Machine& machine) {
    RecipeCheck check{};
    switch (machine.kind) {
    case MachineKind::Miner:
        check.ready = true;
        check.output = minedItem(machine.minerMode);
        break;
    case MachineKind::Smelter: {
        const std::optional<ItemKind> head = machine.inputBuffer.front();
        if (head) {
            check.output = smeltedItem(*head);
            check.ready = check.output.has_value();
        }
        break;
    }
    case MachineKind::Assembler: {
        const MachineSpec spec = machine.spec();
        check.ready = machine.inputBuffer.front() == spec.fixedInput;
        check.output = spec.fixedOutput;
        break;
    }
    case MachineKind::Fabricator:
        check.ready = machine.inputBuffer.contains(ItemKind::IronPlate) &&
                      machine.inputBuffer.contains(ItemKind::CopperPlate);
        check.output = machine.spec().fixedOutput;
        break;
    case MachineKind::Exporter:
        check.ready = !machine.inputBuffer.empty();
        break;
    }
    return check;
}

void consumeInputs(Machine& machine) {
    switch (machine.kind) {
    case MachineKind::Smelter:
    case MachineKind::Assembler:
        machine.inputBuffer.popFront();
        break;
    case MachineKind::Fabricator:
        machine.inputBuffer.removeFirst(ItemKind::IronPlate);
        machine.inputBuffer.removeFirst(ItemKind::CopperPlate);
        break;
    case MachineKind::Miner:
    case MachineKind::Exporter:
        break;
    }
}

bool completeExport(Machine& machine, Economy& economy, std::uint32_t exportFlashTicks) {
    const std::optional<ItemKind> item = machine.inputBuffer.popFront();
    if (!item) {
        return false;
    }
    const std::uint64_t value = exportValue(*item);
    economy.recordExport(value, exportFlashTicks);
    machine.stats.revenueEarned += value;
    ++machine.stats.itemsProduced;
    TF_LOGT("machines") << "exported " << itemName(*item) << " for $" << value;
    return true;
}

} // namespace

bool stepMachine(Machine& machine, Economy& economy, std::uint32_t exportFlashTicks) {
    ++machine.stats.totalTicks;

    const RecipeCheck check = checkRecipe(machine);
    bool produced = false;

    if (!check.ready) {
        // Missing or unusable input drops work in flight; the input itself stays put.
        machine.progress = 0;
    } else if (machine.spec().hasOutputPort && machine.outputBuffer.full()) {
        // Full output only pauses the cycle.
    } else {
        ++machine.progress;
        if (machine.progress >= recipeTime(machine.kind)) {
            machine.progress = 0;
            if (machine.kind == MachineKind::Exporter) {
                produced = completeExport(machine, economy, exportFlashTicks);
            } else if (check.output) {
                consumeInputs(machine);
                machine.outputBuffer.push(*check.output);
                economy.recordProduced(*check.output);
                ++machine.stats.itemsProduced;
                produced = true;
            }
        }
    }

    if (machine.progress != 0 || produced) {
        ++machine.stats.activeTicks;
    }
    return produced;
}

MachineProcessingResult processMachines(FactoryGrid& grid, Economy& economy, std::uint32_t exportFlashTicks) {
    MachineProcessingResult result{};
    for (const core::Cell2i& anchor : grid.machineAnchors()) {
        Machine* machine = grid.machineAt(anchor);
        if (machine == nullptr) {
            continue;
        }
        const std::uint64_t moneyBefore = economy.totalMoneyEarned;
        if (!stepMachine(*machine, economy, exportFlashTicks)) {
            continue;
        }
        if (machine->kind == MachineKind::Exporter) {
            ++result.itemsExported;
            result.revenue += economy.totalMoneyEarned - moneyBefore;
        } else {
            ++result.itemsProduced;
        }
    }
    return result;
}

} // namespace tinyfactory::sim
