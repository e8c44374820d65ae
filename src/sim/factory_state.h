#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/grid2.h"
#include "sim/economy.h"
#include "sim/factory_config.h"
#include "sim/factory_grid.h"
#include "sim/machine.h"
#include "sim/message_log.h"

// Simulation FactoryState subsystem
// Responsible for: the single aggregate that owns a factory session and runs its tick pipeline.
// Should NOT do: map keys or taps to commands, draw anything, or persist state.
namespace tinyfactory::sim {

enum class PlacementTool : std::uint8_t {
    None = 0,
    Miner,
    Smelter,
    Assembler,
    Exporter,
    Fabricator,
    Belt,
    Delete
};

std::optional<MachineKind> machineKindForTool(PlacementTool tool);
PlacementTool toolForMachineKind(MachineKind kind);
const char* toolName(PlacementTool tool);

class FactoryState {
public:
    FactoryState();
    explicit FactoryState(const FactoryConfig& config);

    // Each step runs machines, then belts, then output distribution.
    void tick(std::uint32_t deltaTicks);

    void addLog(std::string message);
    void moveCursor(std::int32_t dx, std::int32_t dy);

    FactoryGrid& grid();
    const FactoryGrid& grid() const;
    Economy& economy();
    const Economy& economy() const;
    const MessageLog& messages() const;
    const FactoryConfig& config() const;

    core::Cell2i cursor() const;
    void setCursor(const core::Cell2i& cell);
    PlacementTool tool() const;
    void setTool(PlacementTool tool);
    core::Direction beltDirection() const;
    void setBeltDirection(core::Direction direction);

    std::uint32_t animFrame() const;
    std::uint64_t totalTicks() const;

private:
    void tickOnce();

    FactoryConfig m_config{};
    FactoryGrid m_grid;
    Economy m_economy{};
    MessageLog m_messages;
    core::Cell2i m_cursor{};
    PlacementTool m_tool = PlacementTool::None;
    core::Direction m_beltDirection = core::Direction::Right;
    std::uint32_t m_animFrame = 0;
    std::uint64_t m_totalTicks = 0;
};

} // namespace tinyfactory::sim
