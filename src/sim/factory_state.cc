#include "sim/factory_state.h"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "core/log.h"
#include "sim/belt_routing.h"
#include "sim/machine_processing.h"
#include "sim/output_distribution.h"

namespace tinyfactory::sim {

std::optional<MachineKind> machineKindForTool(PlacementTool tool) {
    switch (tool) {
    case PlacementTool::Miner: return MachineKind::Miner;
    case PlacementTool::Smelter: return MachineKind::Smelter;
    case PlacementTool::Assembler: return MachineKind::Assembler;
    case PlacementTool::Exporter: return MachineKind::Exporter;
    case PlacementTool::Fabricator: return MachineKind::Fabricator;
    case PlacementTool::None:
    case PlacementTool::Belt:
    case PlacementTool::Delete:
        return std::nullopt;
    }
    return std::nullopt;
}

PlacementTool toolForMachineKind(MachineKind kind) {
    switch (kind) {
    case MachineKind::Miner: return PlacementTool::Miner;
    case MachineKind::Smelter: return PlacementTool::Smelter;
    case MachineKind::Assembler: return PlacementTool::Assembler;
    case MachineKind::Exporter: return PlacementTool::Exporter;
    case MachineKind::Fabricator: return PlacementTool::Fabricator;
    }
    return PlacementTool::None;
}

const char* toolName(PlacementTool tool) {
    switch (tool) {
    case PlacementTool::None: return "None";
    case PlacementTool::Miner: return "Miner";
    case PlacementTool::Smelter: return "Smelter";
    case PlacementTool::Assembler: return "Assembler";
    case PlacementTool::Exporter: return "Exporter";
    case PlacementTool::Fabricator: return "Fabricator";
    case PlacementTool::Belt: return "Belt";
    case PlacementTool::Delete: return "Delete";
    }
    return "Unknown";
}

FactoryState::FactoryState() : FactoryState(FactoryConfig{}) {}

FactoryState::FactoryState(const FactoryConfig& config)
    : m_config(sanitizeFactoryConfig(config)),
      m_grid(m_config.gridWidth, m_config.gridHeight),
      m_messages(m_config.messageLogCapacity) {
    m_economy.money = m_config.startingMoney;
    addLog("Welcome to Tiny Factory!");
    TF_LOGD("factory") << "session created (grid=" << m_grid.width() << "x" << m_grid.height()
                       << ", money=" << m_economy.money << ")";
}

void FactoryState::tick(std::uint32_t deltaTicks) {
    for (std::uint32_t i = 0; i < deltaTicks; ++i) {
        tickOnce();
    }
    // Unsigned wrap-around is intended for the animation counter.
    m_animFrame += deltaTicks;
}

void FactoryState::tickOnce() {
    m_economy.decayExportFlash();
    const MachineProcessingResult machines = processMachines(m_grid, m_economy, m_config.exportFlashTicks);
    const BeltRoutingResult belts = routeBelts(m_grid);
    const std::uint32_t pushed = distributeOutputs(m_grid);
    ++m_totalTicks;

    TF_LOGT("factory") << "tick " << m_totalTicks
                       << " produced=" << machines.itemsProduced
                       << " exported=" << machines.itemsExported
                       << " fed=" << belts.fedToMachines
                       << " moved=" << belts.movedOnBelts
                       << " stalled=" << belts.stalled
                       << " pushed=" << pushed;
}

void FactoryState::addLog(std::string message) {
    TF_LOGD("factory") << message;
    m_messages.push(std::move(message));
}

void FactoryState::moveCursor(std::int32_t dx, std::int32_t dy) {
    // Widen before adding so extreme deltas clamp instead of wrapping.
    const std::int64_t x = std::clamp<std::int64_t>(std::int64_t{m_cursor.x} + dx, 0, m_grid.width() - 1);
    const std::int64_t y = std::clamp<std::int64_t>(std::int64_t{m_cursor.y} + dy, 0, m_grid.height() - 1);
    m_cursor = core::Cell2i{static_cast<std::int32_t>(x), static_cast<std::int32_t>(y)};
}

FactoryGrid& FactoryState::grid() {
    return m_grid;
}

const FactoryGrid& FactoryState::grid() const {
    return m_grid;
}

Economy& FactoryState::economy() {
    return m_economy;
}

const Economy& FactoryState::economy() const {
    return m_economy;
}

const MessageLog& FactoryState::messages() const {
    return m_messages;
}

const FactoryConfig& FactoryState::config() const {
    return m_config;
}

core::Cell2i FactoryState::cursor() const {
    return m_cursor;
}

void FactoryState::setCursor(const core::Cell2i& cell) {
    m_cursor.x = std::clamp(cell.x, 0, m_grid.width() - 1);
    m_cursor.y = std::clamp(cell.y, 0, m_grid.height() - 1);
}

PlacementTool FactoryState::tool() const {
    return m_tool;
}

void FactoryState::setTool(PlacementTool tool) {
    m_tool = tool;
}

core::Direction FactoryState::beltDirection() const {
    return m_beltDirection;
}

void FactoryState::setBeltDirection(core::Direction direction) {
    m_beltDirection = direction;
}

std::uint32_t FactoryState::animFrame() const {
    return m_animFrame;
}

std::uint64_t FactoryState::totalTicks() const {
    return m_totalTicks;
}

} // namespace tinyfactory::sim
