/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GridIndexTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "world/GridIndex.hpp"
#include <sstream>
#include <unordered_set>

using namespace VoxelNav;

struct QuietLogFixture {
    QuietLogFixture() { VOXELNAV_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogFixture() { VOXELNAV_DISABLE_BENCHMARK_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogFixture);

BOOST_AUTO_TEST_SUITE(CoordinateConversionTests)

BOOST_AUTO_TEST_CASE(TestCellToWorldRoundTrip)
{
    for (int cx = -25; cx <= 25; ++cx) {
        for (int cz = -25; cz <= 25; ++cz) {
            const CellCoord back = GridIndex::worldToCell(GridIndex::cellToWorld(cx, cz));
            BOOST_CHECK_EQUAL(back, (CellCoord{cx, cz}));
        }
    }
}

BOOST_AUTO_TEST_CASE(TestWorldToCellRoundsToNearest)
{
    BOOST_CHECK_EQUAL(GridIndex::worldToCell(4.6f, 6.6f), (CellCoord{5, 7}));
    BOOST_CHECK_EQUAL(GridIndex::worldToCell(5.4f, 7.4f), (CellCoord{5, 7}));
    BOOST_CHECK_EQUAL(GridIndex::worldToCell(-0.4f, 0.4f), (CellCoord{0, 0}));
    BOOST_CHECK_EQUAL(GridIndex::worldToCell(-0.6f, -1.4f), (CellCoord{-1, -1}));
}

BOOST_AUTO_TEST_CASE(TestWorldToCellHalvesRoundUp)
{
    // Cell boundaries belong to the cell on the positive side
    BOOST_CHECK_EQUAL(GridIndex::worldToCell(4.5f, 6.5f), (CellCoord{5, 7}));
    BOOST_CHECK_EQUAL(GridIndex::worldToCell(-0.5f, -2.5f), (CellCoord{0, -2}));
}

BOOST_AUTO_TEST_CASE(TestCellToWorldIsIdentity)
{
    const Vector2D center = GridIndex::cellToWorld(CellCoord{-3, 8});
    BOOST_CHECK_CLOSE(center.getX(), -3.0f, 0.001f);
    BOOST_CHECK_CLOSE(center.getZ(), 8.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BlockedSetTests)

BOOST_AUTO_TEST_CASE(TestSetBlockedThenWalkable)
{
    GridIndex grid;
    BOOST_CHECK(!grid.isBlocked(2, 3));

    grid.setBlocked(2, 3);
    BOOST_CHECK(grid.isBlocked(2, 3));
    BOOST_CHECK(!grid.isBlocked(3, 2));

    grid.setWalkable(2, 3);
    BOOST_CHECK(!grid.isBlocked(2, 3));
    BOOST_CHECK_EQUAL(grid.getBlockedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestOperationsAreIdempotent)
{
    GridIndex grid;
    grid.setBlocked(1, 1);
    grid.setBlocked(1, 1);
    BOOST_CHECK(grid.isBlocked(1, 1));
    BOOST_CHECK_EQUAL(grid.getBlockedCount(), 1u);

    grid.setWalkable(1, 1);
    grid.setWalkable(1, 1);
    BOOST_CHECK(!grid.isBlocked(1, 1));

    // Unmarking a cell that was never blocked is a no-op
    grid.setWalkable(-9, 4);
    BOOST_CHECK_EQUAL(grid.getBlockedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestNegativeAndLargeCoordinates)
{
    GridIndex grid;
    grid.setBlocked(CellCoord{-100000, 250000});
    BOOST_CHECK(grid.isBlocked(-100000, 250000));
    BOOST_CHECK(!grid.isBlocked(250000, -100000));
}

BOOST_AUTO_TEST_CASE(TestClear)
{
    GridIndex grid;
    for (int i = 0; i < 10; ++i) {
        grid.setBlocked(i, -i);
    }
    BOOST_CHECK_EQUAL(grid.getBlockedCount(), 10u);

    grid.clear();
    BOOST_CHECK_EQUAL(grid.getBlockedCount(), 0u);
    BOOST_CHECK(!grid.isBlocked(5, -5));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CellCoordTests)

BOOST_AUTO_TEST_CASE(TestDistances)
{
    const CellCoord a{0, 0};
    const CellCoord b{3, -4};
    BOOST_CHECK_EQUAL(manhattanDistance(a, b), 7);
    BOOST_CHECK_CLOSE(cellDistance(a, b), 5.0f, 0.001f);
    BOOST_CHECK_SMALL(cellDistance(b, b), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestHashDistinguishesSwappedAxes)
{
    std::unordered_set<CellCoord, CellCoordHash> cells;
    cells.insert(CellCoord{1, 2});
    cells.insert(CellCoord{2, 1});
    cells.insert(CellCoord{1, 2});
    BOOST_CHECK_EQUAL(cells.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestStreamOutput)
{
    std::ostringstream os;
    os << CellCoord{-1, 7};
    BOOST_CHECK_EQUAL(os.str(), "(-1,7)");
}

BOOST_AUTO_TEST_SUITE_END()
