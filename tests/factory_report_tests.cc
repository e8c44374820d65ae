#include <gtest/gtest.h>

#include <string>

#include "sim/factory_report.h"
#include "sim/factory_state.h"
#include "sim/placement.h"

namespace {

using tinyfactory::core::Cell2i;

} // namespace

TEST(SimFactoryReportTest, ClassifiesIdleWorkingAndBlocked) {
    using namespace tinyfactory::sim;

    Machine smelter(MachineKind::Smelter);
    EXPECT_EQ(classifyMachine(smelter), MachineStatus::Idle);

    smelter.progress = 3;
    EXPECT_EQ(classifyMachine(smelter), MachineStatus::Working);

    while (smelter.outputBuffer.push(ItemKind::IronPlate)) {
    }
    EXPECT_EQ(classifyMachine(smelter), MachineStatus::Blocked);
    EXPECT_STREQ(machineStatusName(MachineStatus::Blocked), "blocked");

    Machine exporter(MachineKind::Exporter);
    exporter.progress = 2;
    EXPECT_EQ(classifyMachine(exporter), MachineStatus::Working);
}

TEST(SimFactoryReportTest, FullMinerWithoutBeltIsOutputBlocked) {
    using namespace tinyfactory;

    sim::FactoryGrid grid(10, 10);
    ASSERT_TRUE(grid.placeMachine(Cell2i{2, 2}, sim::MachineKind::Miner));
    sim::Machine* miner = grid.machineAt(Cell2i{2, 2});
    EXPECT_FALSE(sim::isOutputBlocked(grid, Cell2i{2, 2}));

    while (miner->outputBuffer.push(sim::ItemKind::IronOre)) {
    }
    EXPECT_TRUE(sim::isOutputBlocked(grid, Cell2i{2, 2}));

    ASSERT_TRUE(grid.placeBelt(Cell2i{4, 3}));
    EXPECT_FALSE(sim::isOutputBlocked(grid, Cell2i{2, 2}));
    EXPECT_FALSE(sim::isOutputBlocked(grid, Cell2i{7, 7}));
}

TEST(SimFactoryReportTest, KindStatsAggregatePerMachineKind) {
    using namespace tinyfactory;

    sim::FactoryState state(sim::FactoryConfig{.startingMoney = 200});
    state.setTool(sim::PlacementTool::Miner);
    state.setCursor(Cell2i{0, 0});
    ASSERT_TRUE(sim::place(state));
    state.setCursor(Cell2i{0, 4});
    ASSERT_TRUE(sim::place(state));
    state.setTool(sim::PlacementTool::Smelter);
    state.setCursor(Cell2i{8, 8});
    ASSERT_TRUE(sim::place(state));

    state.tick(10);
    const sim::FactoryKindStats stats = sim::collectKindStats(state.grid());

    const sim::KindStats& miners = stats[sim::machineIndex(sim::MachineKind::Miner)];
    EXPECT_EQ(miners.count, 2u);
    EXPECT_EQ(miners.totalProduced, 2u);
    EXPECT_DOUBLE_EQ(miners.averageUtilization, 1.0);
    EXPECT_EQ(miners.idle, 2u);

    const sim::KindStats& smelters = stats[sim::machineIndex(sim::MachineKind::Smelter)];
    EXPECT_EQ(smelters.count, 1u);
    EXPECT_EQ(smelters.totalProduced, 0u);
    EXPECT_DOUBLE_EQ(smelters.averageUtilization, 0.0);

    EXPECT_EQ(stats[sim::machineIndex(sim::MachineKind::Exporter)].count, 0u);
}

TEST(SimFactoryReportTest, IncomeRateIsMoneyPerSimulatedSecond) {
    using namespace tinyfactory::sim;

    Economy economy{};
    EXPECT_DOUBLE_EQ(incomeRatePerSecond(economy, 100, 10), 0.0);

    economy.recordExport(20, 10);
    EXPECT_DOUBLE_EQ(incomeRatePerSecond(economy, 0, 10), 0.0);
    EXPECT_DOUBLE_EQ(incomeRatePerSecond(economy, 20, 10), 10.0);
    EXPECT_DOUBLE_EQ(incomeRatePerSecond(economy, 400, 10), 0.5);
}

TEST(SimFactoryReportTest, SummaryOfFreshSession) {
    using namespace tinyfactory;

    const sim::FactoryState state;
    EXPECT_EQ(sim::summarizeFactory(state),
              "tick=0 money=$50 exported=0 earned=$0 income=$0.00/s machines=0 belts=0 inTransit=0");
}

TEST(SimFactoryReportTest, SummaryReflectsExports) {
    using namespace tinyfactory;

    sim::FactoryState state;
    state.setTool(sim::PlacementTool::Exporter);
    ASSERT_TRUE(sim::place(state));
    ASSERT_TRUE(state.grid().machineAt(Cell2i{0, 0})->inputBuffer.push(sim::ItemKind::Gear));
    state.tick(10);

    EXPECT_EQ(sim::summarizeFactory(state),
              "tick=10 money=$55 exported=1 earned=$20 income=$20.0/s machines=1 belts=0 inTransit=0");
}
