#include <gtest/gtest.h>

#include <cstdlib>

#include "core/grid2.h"

namespace {

using tinyfactory::core::Cell2i;
using tinyfactory::core::Direction;

void ExpectCell(const Cell2i& cell, int x, int y) {
    EXPECT_EQ(cell.x, x);
    EXPECT_EQ(cell.y, y);
}

} // namespace

TEST(CoreGridTest, OppositeDirectionIsInvolution) {
    using namespace tinyfactory;

    for (const core::Direction dir : core::kAllDirections) {
        EXPECT_NE(core::oppositeDirection(dir), dir);
        EXPECT_EQ(core::oppositeDirection(core::oppositeDirection(dir)), dir);
    }
}

TEST(CoreGridTest, DeltasAreUnitAxisAligned) {
    using namespace tinyfactory;

    for (const core::Direction dir : core::kAllDirections) {
        const Cell2i delta = core::directionDelta(dir);
        EXPECT_EQ(std::abs(delta.x) + std::abs(delta.y), 1);
        const Cell2i back = core::directionDelta(core::oppositeDirection(dir));
        ExpectCell(delta + back, 0, 0);
    }

    ExpectCell(core::directionDelta(Direction::Right), 1, 0);
    ExpectCell(core::directionDelta(Direction::Down), 0, 1);
}

TEST(CoreGridTest, RotateClockwiseCyclesRightDownLeftUp) {
    using namespace tinyfactory;

    EXPECT_EQ(core::rotateClockwise(Direction::Right), Direction::Down);
    EXPECT_EQ(core::rotateClockwise(Direction::Down), Direction::Left);
    EXPECT_EQ(core::rotateClockwise(Direction::Left), Direction::Up);
    EXPECT_EQ(core::rotateClockwise(Direction::Up), Direction::Right);
}

TEST(CoreGridTest, DirectionArrowsMatchGlyphs) {
    using namespace tinyfactory;

    EXPECT_EQ(core::directionArrow(Direction::Up), '^');
    EXPECT_EQ(core::directionArrow(Direction::Down), 'v');
    EXPECT_EQ(core::directionArrow(Direction::Left), '<');
    EXPECT_EQ(core::directionArrow(Direction::Right), '>');
}

TEST(CoreGridTest, DirectionTowardNeighborInvertsDelta) {
    using namespace tinyfactory;

    const Cell2i origin{5, 5};
    for (const core::Direction dir : core::kAllDirections) {
        EXPECT_EQ(core::directionToward(origin, core::neighborCell(origin, dir)), dir);
    }
}
