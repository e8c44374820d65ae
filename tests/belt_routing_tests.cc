#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "sim/belt_routing.h"
#include "sim/factory_grid.h"

namespace {

using tinyfactory::core::Cell2i;
using tinyfactory::core::Direction;
using tinyfactory::sim::ItemKind;

tinyfactory::sim::Belt* PlaceBelt(
    tinyfactory::sim::FactoryGrid& grid,
    const Cell2i& cell,
    std::optional<ItemKind> item = std::nullopt,
    std::optional<Direction> source = std::nullopt) {
    EXPECT_TRUE(grid.placeBelt(cell));
    tinyfactory::sim::Belt* belt = grid.beltAt(cell);
    belt->item = item;
    belt->source = source;
    return belt;
}

std::optional<ItemKind> ItemAt(const tinyfactory::sim::FactoryGrid& grid, const Cell2i& cell) {
    const tinyfactory::sim::Belt* belt = grid.beltAt(cell);
    if (belt == nullptr) {
        return std::nullopt;
    }
    return belt->item;
}

} // namespace

TEST(SimBeltRoutingTest, FreshItemsTryRightDownLeftUp) {
    using namespace tinyfactory;

    const sim::RouteCandidates candidates = sim::routeCandidates(std::nullopt);
    ASSERT_EQ(candidates.count, 4u);
    EXPECT_EQ(candidates.directions[0], Direction::Right);
    EXPECT_EQ(candidates.directions[1], Direction::Down);
    EXPECT_EQ(candidates.directions[2], Direction::Left);
    EXPECT_EQ(candidates.directions[3], Direction::Up);
}

TEST(SimBeltRoutingTest, KnownSourceTriesForwardThenPerpendiculars) {
    using namespace tinyfactory;

    const sim::RouteCandidates fromLeft = sim::routeCandidates(Direction::Left);
    ASSERT_EQ(fromLeft.count, 3u);
    EXPECT_EQ(fromLeft.directions[0], Direction::Right);
    EXPECT_EQ(fromLeft.directions[1], Direction::Down);
    EXPECT_EQ(fromLeft.directions[2], Direction::Up);

    const sim::RouteCandidates fromAbove = sim::routeCandidates(Direction::Up);
    ASSERT_EQ(fromAbove.count, 3u);
    EXPECT_EQ(fromAbove.directions[0], Direction::Down);
    EXPECT_EQ(fromAbove.directions[1], Direction::Right);
    EXPECT_EQ(fromAbove.directions[2], Direction::Left);

    for (const core::Direction source : core::kAllDirections) {
        const sim::RouteCandidates candidates = sim::routeCandidates(source);
        for (std::size_t i = 0; i < candidates.count; ++i) {
            EXPECT_NE(candidates.directions[i], source);
        }
    }
}

TEST(SimBeltRoutingTest, FreshItemMovesRightAndRemembersSource) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    PlaceBelt(grid, Cell2i{3, 3}, ItemKind::IronOre);
    PlaceBelt(grid, Cell2i{4, 3});
    PlaceBelt(grid, Cell2i{3, 4});

    const sim::BeltRoutingResult result = sim::routeBelts(grid);
    EXPECT_EQ(result.movedOnBelts, 1u);
    EXPECT_FALSE(ItemAt(grid, Cell2i{3, 3}).has_value());
    EXPECT_EQ(ItemAt(grid, Cell2i{4, 3}), ItemKind::IronOre);
    EXPECT_EQ(grid.beltAt(Cell2i{4, 3})->source, Direction::Left);
    EXPECT_FALSE(ItemAt(grid, Cell2i{3, 4}).has_value());
}

TEST(SimBeltRoutingTest, ItemNeverReturnsToItsSourceCell) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    PlaceBelt(grid, Cell2i{2, 3});
    PlaceBelt(grid, Cell2i{3, 3}, ItemKind::Gear, Direction::Left);
    PlaceBelt(grid, Cell2i{3, 4});

    sim::routeBelts(grid);
    EXPECT_FALSE(ItemAt(grid, Cell2i{2, 3}).has_value());
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 4}), ItemKind::Gear);
    EXPECT_EQ(grid.beltAt(Cell2i{3, 4})->source, Direction::Up);
}

TEST(SimBeltRoutingTest, DeadEndKeepsItemInPlace) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    PlaceBelt(grid, Cell2i{2, 3});
    PlaceBelt(grid, Cell2i{3, 3}, ItemKind::Gear, Direction::Left);

    const sim::BeltRoutingResult result = sim::routeBelts(grid);
    EXPECT_EQ(result.stalled, 1u);
    EXPECT_EQ(result.movedOnBelts, 0u);
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 3}), ItemKind::Gear);
    EXPECT_FALSE(ItemAt(grid, Cell2i{2, 3}).has_value());
}

TEST(SimBeltRoutingTest, FeedsAcceptingMachineAndKeepsFlowHint) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    ASSERT_TRUE(grid.placeMachine(Cell2i{4, 3}, sim::MachineKind::Smelter));
    PlaceBelt(grid, Cell2i{3, 4}, ItemKind::CopperOre, Direction::Left);

    const sim::BeltRoutingResult result = sim::routeBelts(grid);
    EXPECT_EQ(result.fedToMachines, 1u);

    const sim::Belt* belt = grid.beltAt(Cell2i{3, 4});
    EXPECT_FALSE(belt->hasItem());
    EXPECT_EQ(belt->source, Direction::Left);
    EXPECT_EQ(grid.machineAt(Cell2i{4, 3})->inputBuffer.front(), ItemKind::CopperOre);
}

TEST(SimBeltRoutingTest, RejectingMachineIsSkippedForNextDirection) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    ASSERT_TRUE(grid.placeMachine(Cell2i{4, 3}, sim::MachineKind::Assembler));
    PlaceBelt(grid, Cell2i{3, 3}, ItemKind::IronOre, Direction::Left);
    PlaceBelt(grid, Cell2i{3, 4});

    sim::routeBelts(grid);
    EXPECT_TRUE(grid.machineAt(Cell2i{4, 3})->inputBuffer.empty());
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 4}), ItemKind::IronOre);
}

TEST(SimBeltRoutingTest, MinerNeverAcceptsItems) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    ASSERT_TRUE(grid.placeMachine(Cell2i{4, 3}, sim::MachineKind::Miner));
    PlaceBelt(grid, Cell2i{3, 3}, ItemKind::IronOre, Direction::Left);

    sim::routeBelts(grid);
    EXPECT_TRUE(grid.machineAt(Cell2i{4, 3})->inputBuffer.empty());
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 3}), ItemKind::IronOre);
}

TEST(SimBeltRoutingTest, FullInputBufferBlocksFeed) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    ASSERT_TRUE(grid.placeMachine(Cell2i{4, 3}, sim::MachineKind::Exporter));
    sim::Machine* exporter = grid.machineAt(Cell2i{4, 3});
    while (exporter->inputBuffer.push(ItemKind::IronOre)) {
    }
    PlaceBelt(grid, Cell2i{3, 3}, ItemKind::Gear, Direction::Left);

    const sim::BeltRoutingResult result = sim::routeBelts(grid);
    EXPECT_EQ(result.fedToMachines, 0u);
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 3}), ItemKind::Gear);
    EXPECT_EQ(exporter->inputBuffer.size(), sim::Machine::kMaxBuffer);
}

TEST(SimBeltRoutingTest, FirstRowMajorIntentWinsSharedDestination) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    PlaceBelt(grid, Cell2i{4, 3}, ItemKind::IronOre, Direction::Up);
    PlaceBelt(grid, Cell2i{3, 4}, ItemKind::Gear, Direction::Left);
    PlaceBelt(grid, Cell2i{4, 4});

    const sim::BeltRoutingResult result = sim::routeBelts(grid);
    EXPECT_EQ(result.movedOnBelts, 1u);
    EXPECT_EQ(result.droppedConflicts, 1u);
    EXPECT_EQ(ItemAt(grid, Cell2i{4, 4}), ItemKind::IronOre);
    EXPECT_FALSE(ItemAt(grid, Cell2i{4, 3}).has_value());
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 4}), ItemKind::Gear);
    EXPECT_EQ(grid.itemsOnBelts(), 2u);
}

TEST(SimBeltRoutingTest, TwoMachinesRacingForLastInputSlot) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    ASSERT_TRUE(grid.placeMachine(Cell2i{4, 4}, sim::MachineKind::Exporter));
    sim::Machine* exporter = grid.machineAt(Cell2i{4, 4});
    for (std::size_t i = 0; i + 1 < sim::Machine::kMaxBuffer; ++i) {
        ASSERT_TRUE(exporter->inputBuffer.push(ItemKind::IronOre));
    }
    PlaceBelt(grid, Cell2i{4, 3}, ItemKind::Gear, Direction::Up);
    PlaceBelt(grid, Cell2i{3, 4}, ItemKind::Circuit, Direction::Left);

    const sim::BeltRoutingResult result = sim::routeBelts(grid);
    EXPECT_EQ(result.fedToMachines, 1u);
    EXPECT_EQ(result.droppedConflicts, 1u);
    EXPECT_EQ(exporter->inputBuffer.items().back(), ItemKind::Gear);
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 4}), ItemKind::Circuit);
}

TEST(SimBeltRoutingTest, ItemsAdvanceOneCellPerTick) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 3);
    PlaceBelt(grid, Cell2i{0, 0}, ItemKind::IronPlate, Direction::Left);
    for (int x = 1; x < 6; ++x) {
        PlaceBelt(grid, Cell2i{x, 0});
    }

    sim::routeBelts(grid);
    EXPECT_EQ(ItemAt(grid, Cell2i{1, 0}), ItemKind::IronPlate);
    EXPECT_EQ(grid.itemsOnBelts(), 1u);

    sim::routeBelts(grid);
    EXPECT_EQ(ItemAt(grid, Cell2i{2, 0}), ItemKind::IronPlate);
    EXPECT_EQ(grid.itemsOnBelts(), 1u);
}

TEST(SimBeltRoutingTest, QueuedItemWaitsForSnapshotSpace) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 3);
    PlaceBelt(grid, Cell2i{1, 0}, ItemKind::IronOre, Direction::Left);
    PlaceBelt(grid, Cell2i{2, 0}, ItemKind::Gear, Direction::Left);
    PlaceBelt(grid, Cell2i{3, 0});

    const sim::BeltRoutingResult result = sim::routeBelts(grid);
    EXPECT_EQ(result.movedOnBelts, 1u);
    EXPECT_EQ(result.stalled, 1u);
    EXPECT_EQ(ItemAt(grid, Cell2i{1, 0}), ItemKind::IronOre);
    EXPECT_FALSE(ItemAt(grid, Cell2i{2, 0}).has_value());
    EXPECT_EQ(ItemAt(grid, Cell2i{3, 0}), ItemKind::Gear);
}

TEST(SimBeltRoutingTest, RoutingConservesItems) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(8, 8);
    ASSERT_TRUE(grid.placeMachine(Cell2i{6, 6}, sim::MachineKind::Exporter));
    // Square loop with a spur into the exporter.
    const std::vector<Cell2i> loop = {
        {1, 1}, {2, 1}, {3, 1}, {4, 1}, {4, 2}, {4, 3}, {4, 4},
        {3, 4}, {2, 4}, {1, 4}, {1, 3}, {1, 2}, {5, 4}, {5, 5}, {5, 6}
    };
    const ItemKind items[] = {ItemKind::IronOre, ItemKind::Gear, ItemKind::CopperPlate};
    std::size_t placed = 0;
    for (std::size_t i = 0; i < loop.size(); ++i) {
        std::optional<ItemKind> item;
        if (i % 2 == 0) {
            item = items[i % 3];
            ++placed;
        }
        PlaceBelt(grid, loop[i], item);
    }

    std::size_t fedTotal = 0;
    for (int tick = 0; tick < 40; ++tick) {
        const std::size_t before = grid.itemsOnBelts();
        const sim::BeltRoutingResult result = sim::routeBelts(grid);
        fedTotal += result.fedToMachines;
        EXPECT_EQ(grid.itemsOnBelts() + result.fedToMachines, before);
        EXPECT_LE(grid.machineAt(Cell2i{6, 6})->inputBuffer.size(), sim::Machine::kMaxBuffer);
    }
    EXPECT_EQ(grid.itemsOnBelts() + fedTotal, placed);
    EXPECT_EQ(grid.machineAt(Cell2i{6, 6})->inputBuffer.size(), fedTotal);
}
