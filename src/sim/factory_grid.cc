#include "sim/factory_grid.h"

#include <algorithm>

namespace tinyfactory::sim {

FactoryGrid::FactoryGrid() : FactoryGrid(kDefaultWidth, kDefaultHeight) {}

FactoryGrid::FactoryGrid(std::int32_t width, std::int32_t height)
    : m_width(std::max(width, kMachineSize)),
      m_height(std::max(height, kMachineSize)),
      m_cells(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height), EmptyCell{}) {}

std::int32_t FactoryGrid::width() const {
    return m_width;
}

std::int32_t FactoryGrid::height() const {
    return m_height;
}

bool FactoryGrid::inBounds(const core::Cell2i& cell) const {
    return cell.x >= 0 && cell.x < m_width && cell.y >= 0 && cell.y < m_height;
}

std::size_t FactoryGrid::linearIndex(const core::Cell2i& cell) const {
    return static_cast<std::size_t>(cell.y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(cell.x);
}

const Cell& FactoryGrid::cellAt(const core::Cell2i& cell) const {
    static const Cell kOutOfBounds{EmptyCell{}};
    if (!inBounds(cell)) {
        return kOutOfBounds;
    }
    return m_cells[linearIndex(cell)];
}

Cell& FactoryGrid::mutableCellAt(const core::Cell2i& cell) {
    return m_cells[linearIndex(cell)];
}

bool FactoryGrid::isEmpty(const core::Cell2i& cell) const {
    return inBounds(cell) && std::holds_alternative<EmptyCell>(m_cells[linearIndex(cell)]);
}

std::optional<core::Cell2i> FactoryGrid::anchorOf(const core::Cell2i& cell) const {
    if (!inBounds(cell)) {
        return std::nullopt;
    }
    const Cell& value = m_cells[linearIndex(cell)];
    if (std::holds_alternative<Machine>(value)) {
        return cell;
    }
    if (const MachinePart* part = std::get_if<MachinePart>(&value)) {
        return part->anchor;
    }
    return std::nullopt;
}

Machine* FactoryGrid::machineAt(const core::Cell2i& anchor) {
    if (!inBounds(anchor)) {
        return nullptr;
    }
    return std::get_if<Machine>(&mutableCellAt(anchor));
}

const Machine* FactoryGrid::machineAt(const core::Cell2i& anchor) const {
    if (!inBounds(anchor)) {
        return nullptr;
    }
    return std::get_if<Machine>(&m_cells[linearIndex(anchor)]);
}

Machine* FactoryGrid::machineCovering(const core::Cell2i& cell) {
    const std::optional<core::Cell2i> anchor = anchorOf(cell);
    if (!anchor) {
        return nullptr;
    }
    return machineAt(*anchor);
}

const Machine* FactoryGrid::machineCovering(const core::Cell2i& cell) const {
    const std::optional<core::Cell2i> anchor = anchorOf(cell);
    if (!anchor) {
        return nullptr;
    }
    return machineAt(*anchor);
}

Belt* FactoryGrid::beltAt(const core::Cell2i& cell) {
    if (!inBounds(cell)) {
        return nullptr;
    }
    return std::get_if<Belt>(&mutableCellAt(cell));
}

const Belt* FactoryGrid::beltAt(const core::Cell2i& cell) const {
    if (!inBounds(cell)) {
        return nullptr;
    }
    return std::get_if<Belt>(&m_cells[linearIndex(cell)]);
}

std::array<core::Cell2i, 4> FactoryGrid::footprintCells(const core::Cell2i& anchor) {
    return {
        anchor,
        anchor + core::Cell2i{1, 0},
        anchor + core::Cell2i{0, 1},
        anchor + core::Cell2i{1, 1}
    };
}

bool FactoryGrid::footprintContains(const core::Cell2i& anchor, const core::Cell2i& cell) {
    return cell.x >= anchor.x && cell.x < anchor.x + kMachineSize &&
           cell.y >= anchor.y && cell.y < anchor.y + kMachineSize;
}

// Order: top row, bottom row, left column, right column, then corners.
// Output distribution picks the first qualifying belt, so this order is observable.
std::vector<core::Cell2i> FactoryGrid::perimeterCells(const core::Cell2i& anchor) const {
    const int ax = anchor.x;
    const int ay = anchor.y;
    const std::array<core::Cell2i, 12> candidates = {{
        {ax, ay - 1}, {ax + 1, ay - 1},
        {ax, ay + 2}, {ax + 1, ay + 2},
        {ax - 1, ay}, {ax - 1, ay + 1},
        {ax + 2, ay}, {ax + 2, ay + 1},
        {ax - 1, ay - 1}, {ax + 2, ay - 1},
        {ax - 1, ay + 2}, {ax + 2, ay + 2}
    }};

    std::vector<core::Cell2i> cells;
    cells.reserve(candidates.size());
    for (const core::Cell2i& candidate : candidates) {
        if (inBounds(candidate)) {
            cells.push_back(candidate);
        }
    }
    return cells;
}

bool FactoryGrid::hasAdjacentBelt(const core::Cell2i& anchor) const {
    for (const core::Cell2i& cell : perimeterCells(anchor)) {
        if (beltAt(cell) != nullptr) {
            return true;
        }
    }
    return false;
}

bool FactoryGrid::canPlaceMachine(const core::Cell2i& anchor) const {
    for (const core::Cell2i& cell : footprintCells(anchor)) {
        if (!isEmpty(cell)) {
            return false;
        }
    }
    return true;
}

bool FactoryGrid::placeMachine(const core::Cell2i& anchor, MachineKind kind) {
    // Validate all four cells before writing any of them.
    if (!canPlaceMachine(anchor)) {
        return false;
    }

    const std::array<core::Cell2i, 4> cells = footprintCells(anchor);
    mutableCellAt(cells[0]) = Machine(kind);
    for (std::size_t i = 1; i < cells.size(); ++i) {
        mutableCellAt(cells[i]) = MachinePart{anchor};
    }
    return true;
}

std::optional<MachineKind> FactoryGrid::removeMachine(const core::Cell2i& cell) {
    const std::optional<core::Cell2i> anchor = anchorOf(cell);
    if (!anchor) {
        return std::nullopt;
    }
    const Machine* machine = machineAt(*anchor);
    if (machine == nullptr) {
        return std::nullopt;
    }

    const MachineKind kind = machine->kind;
    for (const core::Cell2i& footprintCell : footprintCells(*anchor)) {
        if (inBounds(footprintCell)) {
            mutableCellAt(footprintCell) = EmptyCell{};
        }
    }
    return kind;
}

bool FactoryGrid::placeBelt(const core::Cell2i& cell) {
    if (!isEmpty(cell)) {
        return false;
    }
    mutableCellAt(cell) = Belt{};
    return true;
}

bool FactoryGrid::removeBelt(const core::Cell2i& cell) {
    if (beltAt(cell) == nullptr) {
        return false;
    }
    mutableCellAt(cell) = EmptyCell{};
    return true;
}

void FactoryGrid::clear() {
    std::fill(m_cells.begin(), m_cells.end(), Cell{EmptyCell{}});
}

std::vector<core::Cell2i> FactoryGrid::machineAnchors() const {
    std::vector<core::Cell2i> anchors;
    for (std::int32_t y = 0; y < m_height; ++y) {
        for (std::int32_t x = 0; x < m_width; ++x) {
            const core::Cell2i cell{x, y};
            if (std::holds_alternative<Machine>(m_cells[linearIndex(cell)])) {
                anchors.push_back(cell);
            }
        }
    }
    return anchors;
}

std::size_t FactoryGrid::machineCount() const {
    return static_cast<std::size_t>(std::count_if(m_cells.begin(), m_cells.end(), [](const Cell& cell) {
        return std::holds_alternative<Machine>(cell);
    }));
}

std::size_t FactoryGrid::beltCount() const {
    return static_cast<std::size_t>(std::count_if(m_cells.begin(), m_cells.end(), [](const Cell& cell) {
        return std::holds_alternative<Belt>(cell);
    }));
}

std::size_t FactoryGrid::itemsOnBelts() const {
    return static_cast<std::size_t>(std::count_if(m_cells.begin(), m_cells.end(), [](const Cell& cell) {
        const Belt* belt = std::get_if<Belt>(&cell);
        return belt != nullptr && belt->hasItem();
    }));
}

} // namespace tinyfactory::sim
