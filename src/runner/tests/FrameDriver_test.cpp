#include "core/Grid.h"
#include "core/Material.h"
#include "runner/FrameDriver.h"
#include "runner/InputMapper.h"
#include "runner/RenderTarget.h"
#include "runner/scenarios/Scenario.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace SandSim;

namespace {

// Records every call in order.
class RecordingRenderTarget : public RenderTarget {
public:
    void clear() override
    {
        calls.push_back("clear");
        fills.clear();
    }

    void fillCell(const Vector2i& cell, const Color& /*color*/) override
    {
        calls.push_back("fill");
        fills.push_back(cell);
    }

    void present() override { calls.push_back("present"); }

    std::vector<std::string> calls;
    std::vector<Vector2i> fills;
};

// Drops one grain at (0,0) for a fixed number of frames.
class DripScenario : public Scenario {
public:
    explicit DripScenario(uint32_t frames) : frames_(frames) {}

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(Grid& grid) override { setupCalls_ = grid.getWidth(); }

    void tick(const Grid& /*grid*/, uint32_t frame, FrameDriver& driver) override
    {
        if (!isFinished(frame)) {
            driver.queuePlacement(PlacementCommand{ { 0, 0 }, MaterialType::SAND });
        }
    }

    bool isFinished(uint32_t frame) const override { return frame >= frames_; }

    uint32_t setupCalls_ = 0;

private:
    ScenarioMetadata metadata_{ "Drip", "test drip", "test" };
    uint32_t frames_;
};

} // namespace

TEST(FrameDriverTest, AppliesPlacementsBeforeUpdating)
{
    Grid grid(3, 3);
    RecordingRenderTarget target;
    FrameDriver driver(grid, &target);

    driver.queuePlacement(PlacementCommand{ { 1, 0 }, MaterialType::SAND });
    EXPECT_EQ(driver.pendingPlacementCount(), 1u);

    driver.runFrame();

    // Placed at (1,0) then updated once within the same frame.
    EXPECT_EQ(driver.pendingPlacementCount(), 0u);
    EXPECT_TRUE(grid.isEmpty({ 1, 0 }));
    EXPECT_TRUE(grid.get(1, 1).has_value());
    EXPECT_EQ(grid.getTimestep(), 1u);
    EXPECT_EQ(driver.getFrameCount(), 1u);
}

TEST(FrameDriverTest, RendersEveryOccupiedCellBetweenClearAndPresent)
{
    Grid grid(4, 4);
    grid.set(0, 3, Material::wall());
    grid.set(3, 3, Material::sand());
    RecordingRenderTarget target;
    FrameDriver driver(grid, &target);

    driver.runFrame();

    const std::vector<std::string> expected = { "clear", "fill", "fill", "present" };
    EXPECT_EQ(target.calls, expected);
    ASSERT_EQ(target.fills.size(), 2u);
    EXPECT_EQ(target.fills[0], (Vector2i{ 0, 3 }));
    EXPECT_EQ(target.fills[1], (Vector2i{ 3, 3 }));
}

TEST(FrameDriverTest, EraseCommandEmptiesCell)
{
    Grid grid(2, 2);
    grid.set(0, 1, Material::wall());
    FrameDriver driver(grid, nullptr);

    driver.queuePlacement(PlacementCommand{ { 0, 1 }, std::nullopt });
    driver.runFrame();

    EXPECT_EQ(grid.countOccupied(), 0u);
}

TEST(FrameDriverTest, OutOfRangePlacementIsDropped)
{
    Grid grid(2, 2);
    FrameDriver driver(grid, nullptr);

    driver.queuePlacement(PlacementCommand{ { 5, 5 }, MaterialType::SAND });
    driver.queuePlacement(PlacementCommand{ { 1, 1 }, MaterialType::SAND });
    driver.runFrame();

    EXPECT_EQ(grid.countOccupied(), 1u);
    EXPECT_TRUE(grid.get(1, 1).has_value());
}

TEST(FrameDriverTest, RunStopsOnceScenarioFinishesAndGridSettles)
{
    Grid grid(5, 6);
    FrameDriver driver(grid, nullptr);
    auto scenario = std::make_unique<DripScenario>(3);
    DripScenario* drip = scenario.get();
    driver.setScenario(std::move(scenario));
    EXPECT_EQ(drip->setupCalls_, 5u);

    const uint32_t frames = driver.run(100, std::chrono::milliseconds(0));

    EXPECT_LT(frames, 100u);
    EXPECT_GE(frames, 3u);
    EXPECT_EQ(grid.countOccupied(), 3u);
    EXPECT_TRUE(driver.isSettled());
    EXPECT_TRUE(driver.getTimers().hasTimer("frame_total"));
    EXPECT_FALSE(driver.getTimers().hasTimer("frame_render")) << "Headless runs render nothing";
}

TEST(FrameDriverTest, RunHonoursFrameLimit)
{
    Grid grid(3, 3);
    FrameDriver driver(grid, nullptr);
    driver.setScenario(std::make_unique<DripScenario>(1000));

    EXPECT_EQ(driver.run(4, std::chrono::milliseconds(0)), 4u);
    EXPECT_EQ(driver.getFrameCount(), 4u);
}

TEST(FrameDriverTest, RequestStopEndsRun)
{
    Grid grid(3, 3);
    FrameDriver driver(grid, nullptr);
    driver.setScenario(std::make_unique<DripScenario>(1000));

    driver.requestStop();

    EXPECT_EQ(driver.run(0, std::chrono::milliseconds(0)), 0u);
    EXPECT_TRUE(driver.isStopRequested());
}

TEST(FrameDriverTest, RenderTimerIsRecordedWithATarget)
{
    Grid grid(2, 2);
    RecordingRenderTarget target;
    FrameDriver driver(grid, &target);

    driver.runFrame();
    driver.runFrame();

    EXPECT_EQ(driver.getTimers().getCallCount("frame_render"), 2u);
    EXPECT_EQ(driver.getTimers().getCallCount("frame_total"), 2u);
}

TEST(FrameDriverTest, PointerInputIsMappedWithTheCellSize)
{
    Grid grid(8, 4);
    FrameDriver driver(grid, nullptr, InputMapper(4, 8, 4));
    EXPECT_EQ(driver.getInputMapper().getSurfaceWidth(), 32);

    // Pixel (9, 2) is cell (2, 0) at four pixels per cell.
    driver.queuePointer(9, 2, MaterialType::SAND);
    driver.runFrame();

    EXPECT_EQ(grid.countOccupied(), 1u);
    EXPECT_TRUE(grid.get(2, 1).has_value());

    // Erase at a pixel over the resting cell (2, 3).
    driver.runFrame();
    driver.runFrame();
    ASSERT_TRUE(grid.get(2, 3).has_value());
    driver.queuePointer(9, 13, std::nullopt);
    driver.runFrame();
    EXPECT_EQ(grid.countOccupied(), 0u);
}

TEST(FrameDriverTest, DefaultMapperUsesOnePixelPerCell)
{
    Grid grid(8, 4);
    FrameDriver driver(grid, nullptr);

    driver.queuePointer(9, 2, MaterialType::WALL);
    driver.runFrame();

    // Clamped to the last column at one pixel per cell.
    EXPECT_EQ(driver.getInputMapper().getCellSize(), 1u);
    ASSERT_TRUE(grid.get(7, 2).has_value());
    EXPECT_EQ(grid.get(7, 2)->type, MaterialType::WALL);
}
