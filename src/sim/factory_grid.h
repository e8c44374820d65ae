#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "core/grid2.h"
#include "sim/belt.h"
#include "sim/machine.h"

// Simulation FactoryGrid subsystem
// Responsible for: owning the fixed-size cell arena and keeping 2x2 machine footprints consistent.
// Should NOT do: tick processing, money handling, or player-facing messages.
namespace tinyfactory::sim {

struct EmptyCell {};

// Non-anchor cell of a machine footprint. Holds coordinates, never a reference.
struct MachinePart {
    core::Cell2i anchor{};
};

using Cell = std::variant<EmptyCell, Machine, MachinePart, Belt>;

class FactoryGrid {
public:
    static constexpr std::int32_t kDefaultWidth = 40;
    static constexpr std::int32_t kDefaultHeight = 30;
    static constexpr std::int32_t kMachineSize = 2;

    FactoryGrid();
    FactoryGrid(std::int32_t width, std::int32_t height);

    std::int32_t width() const;
    std::int32_t height() const;
    bool inBounds(const core::Cell2i& cell) const;

    const Cell& cellAt(const core::Cell2i& cell) const;
    bool isEmpty(const core::Cell2i& cell) const;

    std::optional<core::Cell2i> anchorOf(const core::Cell2i& cell) const;
    Machine* machineAt(const core::Cell2i& anchor);
    const Machine* machineAt(const core::Cell2i& anchor) const;
    Machine* machineCovering(const core::Cell2i& cell);
    const Machine* machineCovering(const core::Cell2i& cell) const;
    Belt* beltAt(const core::Cell2i& cell);
    const Belt* beltAt(const core::Cell2i& cell) const;

    static std::array<core::Cell2i, 4> footprintCells(const core::Cell2i& anchor);
    static bool footprintContains(const core::Cell2i& anchor, const core::Cell2i& cell);
    std::vector<core::Cell2i> perimeterCells(const core::Cell2i& anchor) const;
    bool hasAdjacentBelt(const core::Cell2i& anchor) const;

    bool canPlaceMachine(const core::Cell2i& anchor) const;
    bool placeMachine(const core::Cell2i& anchor, MachineKind kind);
    std::optional<MachineKind> removeMachine(const core::Cell2i& cell);
    bool placeBelt(const core::Cell2i& cell);
    bool removeBelt(const core::Cell2i& cell);
    void clear();

    std::vector<core::Cell2i> machineAnchors() const;
    std::size_t machineCount() const;
    std::size_t beltCount() const;
    std::size_t itemsOnBelts() const;

private:
    std::size_t linearIndex(const core::Cell2i& cell) const;
    Cell& mutableCellAt(const core::Cell2i& cell);

    std::int32_t m_width = kDefaultWidth;
    std::int32_t m_height = kDefaultHeight;
    std::vector<Cell> m_cells;
};

} // namespace tinyfactory::sim
