#include "core/Grid.h"
#include "core/Material.h"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace SandSim;

class GridTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::warn); }

    // Update until nothing moves, bounded so a bug cannot hang the suite.
    static uint32_t settle(Grid& grid, uint32_t maxTicks = 1000)
    {
        for (uint32_t tick = 1; tick <= maxTicks; ++tick) {
            grid.update();
            const auto& stats = grid.getLastUpdateStats();
            if (stats.moved == 0 && stats.contested == 0) {
                return tick;
            }
        }
        return maxTicks;
    }
};

TEST_F(GridTest, NewGridIsEmpty)
{
    Grid grid(4, 3);
    EXPECT_EQ(grid.getWidth(), 4u);
    EXPECT_EQ(grid.getHeight(), 3u);
    EXPECT_EQ(grid.countOccupied(), 0u);
    EXPECT_EQ(grid.getTimestep(), 0u);
}

TEST_F(GridTest, EmptyGridStaysEmptyAfterUpdate)
{
    Grid grid(5, 5);
    grid.update();

    EXPECT_EQ(grid.countOccupied(), 0u);
    EXPECT_EQ(grid.getTimestep(), 1u);
    EXPECT_EQ(grid.getLastUpdateStats().occupied, 0u);
}

TEST_F(GridTest, ZeroDimensionsAreRejected)
{
    EXPECT_THROW(Grid(0, 5), std::invalid_argument);
    EXPECT_THROW(Grid(5, 0), std::invalid_argument);
}

TEST_F(GridTest, SetThenGetReturnsPlacedMaterial)
{
    Grid grid(3, 3);
    grid.set({ 1, 2 }, Material::sand());
    grid.set(0, 0, Material::wall());

    ASSERT_TRUE(grid.get(1, 2).has_value());
    EXPECT_EQ(grid.get({ 1, 2 })->type, MaterialType::SAND);
    EXPECT_EQ(grid.get(0, 0)->type, MaterialType::WALL);
    EXPECT_FALSE(grid.get(2, 2).has_value());

    // Overwrite discards the previous occupant.
    grid.set(1, 2, Material::wall());
    EXPECT_EQ(grid.get(1, 2)->type, MaterialType::WALL);

    grid.set(1, 2, std::nullopt);
    EXPECT_TRUE(grid.isEmpty({ 1, 2 }));
}

TEST_F(GridTest, OutOfRangeAccessThrows)
{
    Grid grid(3, 3);
    EXPECT_THROW(grid.get(-1, 0), std::out_of_range);
    EXPECT_THROW(grid.get(0, 3), std::out_of_range);
    EXPECT_THROW(grid.set({ 3, 0 }, Material::sand()), std::out_of_range);
    EXPECT_THROW(grid.isEmpty({ 0, -1 }), std::out_of_range);

    EXPECT_FALSE(grid.isInBounds(3, 0));
    EXPECT_TRUE(grid.isInBounds(2, 2));
}

TEST_F(GridTest, SandFallsOneCellPerTick)
{
    Grid grid(3, 3);
    grid.set(1, 0, Material::sand());

    grid.update();

    EXPECT_TRUE(grid.isEmpty({ 1, 0 }));
    ASSERT_TRUE(grid.get(1, 1).has_value());
    EXPECT_EQ(grid.get(1, 1)->type, MaterialType::SAND);
    EXPECT_EQ(grid.getLastUpdateStats().moved, 1u);
}

TEST_F(GridTest, SandOnBottomRowStays)
{
    Grid grid(3, 3);
    grid.set(1, 2, Material::sand());

    grid.update();

    EXPECT_TRUE(grid.get(1, 2).has_value());
    EXPECT_EQ(grid.countOccupied(), 1u);
    EXPECT_EQ(grid.getLastUpdateStats().moved, 0u);
}

TEST_F(GridTest, BlockedSandSlidesDownLeftFirst)
{
    Grid grid(3, 2);
    grid.set(1, 0, Material::sand());
    grid.set(1, 1, Material::wall());

    grid.update();

    EXPECT_TRUE(grid.isEmpty({ 1, 0 }));
    ASSERT_TRUE(grid.get(0, 1).has_value());
    EXPECT_EQ(grid.get(0, 1)->type, MaterialType::SAND);
    EXPECT_TRUE(grid.isEmpty({ 2, 1 }));
}

TEST_F(GridTest, BlockedSandSlidesDownRightWhenLeftIsTaken)
{
    Grid grid(3, 2);
    grid.set(1, 0, Material::sand());
    grid.set(0, 1, Material::wall());
    grid.set(1, 1, Material::wall());

    grid.update();

    EXPECT_TRUE(grid.isEmpty({ 1, 0 }));
    ASSERT_TRUE(grid.get(2, 1).has_value());
    EXPECT_EQ(grid.get(2, 1)->type, MaterialType::SAND);
}

TEST_F(GridTest, FullyBlockedSandStays)
{
    Grid grid(3, 2);
    grid.set(1, 0, Material::sand());
    for (int x = 0; x < 3; ++x) {
        grid.set(x, 1, Material::wall());
    }

    grid.update();

    ASSERT_TRUE(grid.get(1, 0).has_value());
    EXPECT_EQ(grid.get(1, 0)->type, MaterialType::SAND);
    EXPECT_EQ(grid.countOccupied(), 4u);
}

TEST_F(GridTest, SandAtGridEdgeDoesNotLeaveTheGrid)
{
    Grid grid(2, 2);
    grid.set(0, 0, Material::sand());
    grid.set(0, 1, Material::wall());
    grid.set(1, 1, Material::wall());

    grid.update();

    // Down-left is outside the grid and down-right is a wall.
    EXPECT_TRUE(grid.get(0, 0).has_value());
}

TEST_F(GridTest, WallNeverMoves)
{
    Grid grid(3, 3);
    grid.set(1, 0, Material::wall());

    grid.update();
    grid.update();

    EXPECT_EQ(grid.get(1, 0)->type, MaterialType::WALL);
    EXPECT_EQ(grid.countOccupied(), 1u);
}

TEST_F(GridTest, ContestedCellGoesToFirstClaimantInScanOrder)
{
    // Two grains both slide diagonally into (1,1).
    Grid grid(3, 3);
    grid.set(0, 0, Material::sand());
    grid.set(2, 0, Material::sand());
    grid.set(0, 1, Material::wall());
    grid.set(2, 1, Material::wall());

    grid.update();

    const auto& stats = grid.getLastUpdateStats();
    EXPECT_EQ(stats.occupied, 4u);
    EXPECT_EQ(stats.moved, 1u);
    EXPECT_EQ(stats.contested, 1u);
    EXPECT_EQ(stats.rejected, 0u);

    EXPECT_TRUE(grid.isEmpty({ 0, 0 })) << "Earlier grain should have moved";
    EXPECT_TRUE(grid.get(1, 1).has_value());
    EXPECT_TRUE(grid.get(2, 0).has_value()) << "Later grain should stay in place";
    EXPECT_EQ(grid.countOccupied(), 4u);

    grid.update();

    // Winner keeps falling; the loser's diagonal is now blocked by the pre-tick state.
    EXPECT_TRUE(grid.get(1, 2).has_value());
    EXPECT_TRUE(grid.get(2, 0).has_value());
    EXPECT_EQ(grid.countOccupied(), 4u);
}

TEST_F(GridTest, PouringAtOneColumnBuildsAPileAndConservesGrains)
{
    Grid grid(9, 12);
    const uint32_t grains = 12;

    for (uint32_t i = 0; i < grains; ++i) {
        grid.set(4, 0, Material::sand());
        grid.update();
        grid.update();
        EXPECT_EQ(grid.countOccupied(), i + 1);
    }
    settle(grid);

    EXPECT_EQ(grid.countOccupied(), grains);

    // Pile rests on the floor under the pour point and is taller there than at its edges.
    EXPECT_TRUE(grid.get(4, 11).has_value());
    int centreHeight = 0;
    int edgeHeight = 0;
    for (int y = 0; y < 12; ++y) {
        centreHeight += grid.get(4, y).has_value() ? 1 : 0;
        edgeHeight += grid.get(0, y).has_value() ? 1 : 0;
    }
    EXPECT_GT(centreHeight, edgeHeight);
}

TEST_F(GridTest, SettledGridIsAFixedPoint)
{
    Grid grid(7, 5);
    for (int x = 1; x < 6; ++x) {
        grid.set(x, 0, Material::sand());
        grid.set(x, 1, Material::sand());
    }
    grid.set(3, 3, Material::wall());

    settle(grid);
    const Grid settled = grid;

    grid.update();

    EXPECT_EQ(grid, settled);
    EXPECT_EQ(grid.getLastUpdateStats().moved, 0u);
}

TEST_F(GridTest, ClearEmptiesEveryCellAndKeepsTimestep)
{
    Grid grid(3, 3);
    grid.set(0, 0, Material::sand());
    grid.update();

    grid.clear();

    EXPECT_EQ(grid.countOccupied(), 0u);
    EXPECT_EQ(grid.getTimestep(), 1u);
}

TEST_F(GridTest, UpdateRecordsGridUpdateTimer)
{
    Grid grid(3, 3);
    grid.update();
    grid.update();

    EXPECT_TRUE(grid.getTimers().hasTimer("grid_update"));
    EXPECT_EQ(grid.getTimers().getCallCount("grid_update"), 2u);
}

TEST_F(GridTest, ToJsonListsOccupiedCells)
{
    Grid grid(4, 2);
    grid.set(3, 1, Material::sand());
    grid.set(0, 1, Material::wall());

    nlohmann::json j = grid.toJson();

    EXPECT_EQ(j["width"], 4);
    EXPECT_EQ(j["height"], 2);
    EXPECT_EQ(j["timestep"], 0);
    ASSERT_EQ(j["cells"].size(), 2u);
    EXPECT_EQ(j["cells"][0]["x"], 0);
    EXPECT_EQ(j["cells"][0]["material"], "WALL");
    EXPECT_EQ(j["cells"][1]["x"], 3);
    EXPECT_EQ(j["cells"][1]["material"], "SAND");
}
