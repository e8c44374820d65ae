#include "sim/factory_report.h"

#include <cstdio>
#include <sstream>

#include "sim/factory_state.h"

namespace tinyfactory::sim {

const char* machineStatusName(MachineStatus status) {
    switch (status) {
    case MachineStatus::Idle: return "idle";
    case MachineStatus::Working: return "working";
    case MachineStatus::Blocked: return "blocked";
    }
    return "unknown";
}

MachineStatus classifyMachine(const Machine& machine) {
    if (machine.kind != MachineKind::Exporter && machine.outputBuffer.full()) {
        return MachineStatus::Blocked;
    }
    if (machine.progress > 0) {
        return MachineStatus::Working;
    }
    return MachineStatus::Idle;
}

bool isOutputBlocked(const FactoryGrid& grid, const core::Cell2i& anchor) {
    const Machine* machine = grid.machineAt(anchor);
    if (machine == nullptr || machine->kind == MachineKind::Exporter || !machine->outputBuffer.full()) {
        return false;
    }
    return !grid.hasAdjacentBelt(anchor);
}

FactoryKindStats collectKindStats(const FactoryGrid& grid) {
    FactoryKindStats stats{};
    for (const core::Cell2i& anchor : grid.machineAnchors()) {
        const Machine* machine = grid.machineAt(anchor);
        if (machine == nullptr) {
            continue;
        }
        KindStats& entry = stats[machineIndex(machine->kind)];
        ++entry.count;
        entry.totalProduced += machine->stats.itemsProduced;
        entry.totalRevenue += machine->stats.revenueEarned;
        entry.averageUtilization += machine->utilization();
        switch (classifyMachine(*machine)) {
        case MachineStatus::Blocked: ++entry.blocked; break;
        case MachineStatus::Working: ++entry.working; break;
        case MachineStatus::Idle: ++entry.idle; break;
        }
    }
    for (KindStats& entry : stats) {
        if (entry.count > 0) {
            entry.averageUtilization /= static_cast<double>(entry.count);
        }
    }
    return stats;
}

double incomeRatePerSecond(const Economy& economy, std::uint64_t totalTicks, std::uint32_t ticksPerSecond) {
    if (totalTicks == 0 || ticksPerSecond == 0 || economy.totalMoneyEarned == 0) {
        return 0.0;
    }
    const double seconds = static_cast<double>(totalTicks) / static_cast<double>(ticksPerSecond);
    return static_cast<double>(economy.totalMoneyEarned) / seconds;
}

std::string summarizeFactory(const FactoryState& state) {
    const Economy& economy = state.economy();
    const double rate = incomeRatePerSecond(economy, state.totalTicks(), state.config().ticksPerSecond);

    char rateText[32]{};
    if (rate >= 1.0) {
        std::snprintf(rateText, sizeof(rateText), "%.1f", rate);
    } else {
        std::snprintf(rateText, sizeof(rateText), "%.2f", rate);
    }

    std::ostringstream out;
    out << "tick=" << state.totalTicks()
        << " money=$" << economy.money
        << " exported=" << economy.totalExported
        << " earned=$" << economy.totalMoneyEarned
        << " income=$" << rateText << "/s"
        << " machines=" << state.grid().machineCount()
        << " belts=" << state.grid().beltCount()
        << " inTransit=" << state.grid().itemsOnBelts();
    return out.str();
}

} // namespace tinyfactory::sim
