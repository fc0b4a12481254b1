#include "core/Grid.h"
#include "core/LoggingChannels.h"
#include "core/Material.h"
#include "runner/FrameDriver.h"
#include "runner/scenarios/Scenario.h"

#include <algorithm>

namespace SandSim {

/**
 * Sandbox scenario - a wall ledge with one sand block resting above it and
 * another dropping onto the open floor.
 */
class SandboxScenario : public Scenario {
public:
    SandboxScenario()
    {
        metadata_.name = "Sandbox";
        metadata_.description = "Two sand blocks, one over a wall ledge";
        metadata_.category = "sandbox";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(Grid& grid) override
    {
        const int width = static_cast<int>(grid.getWidth());
        const int height = static_cast<int>(grid.getHeight());

        // Ledge across the second quarter of the grid, two thirds of the way down.
        const int ledgeY = (height * 2) / 3;
        for (int x = width / 4; x < width / 2; ++x) {
            grid.set(x, ledgeY, Material::wall());
        }

        const int blockSize = std::max(1, std::min(width, height) / 6);
        fillBlock(grid, width / 4 + 1, 1, blockSize);
        fillBlock(grid, (width * 3) / 4 - blockSize / 2, 1, blockSize);

        LoggingChannels::scenario()->info(
            "SandboxScenario::setup - ledge at row {}, {} occupied cells",
            ledgeY,
            grid.countOccupied());
    }

    void tick(const Grid& /*grid*/, uint32_t /*frame*/, FrameDriver& /*driver*/) override {}

    bool isFinished(uint32_t /*frame*/) const override { return true; }

private:
    static void fillBlock(Grid& grid, int left, int top, int size)
    {
        for (int y = top; y < top + size; ++y) {
            for (int x = left; x < left + size; ++x) {
                if (grid.isInBounds(x, y) && grid.isEmpty(Vector2i{ x, y })) {
                    grid.set(x, y, Material::sand());
                }
            }
        }
    }

    ScenarioMetadata metadata_;
};

} // namespace SandSim
