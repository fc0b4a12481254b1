#include "core/Grid.h"
#include "core/LoggingChannels.h"
#include "core/Material.h"
#include "runner/FrameDriver.h"
#include "runner/scenarios/Scenario.h"

#include <cstdlib>

namespace SandSim {

/**
 * Hourglass scenario - a V-shaped wall funnel with a one-cell neck, filled
 * with sand that drains onto the floor below.
 */
class HourglassScenario : public Scenario {
public:
    HourglassScenario()
    {
        metadata_.name = "Hourglass";
        metadata_.description = "Sand drains through a wall funnel and piles on the floor";
        metadata_.category = "demo";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(Grid& grid) override
    {
        const int width = static_cast<int>(grid.getWidth());
        const int height = static_cast<int>(grid.getHeight());
        const int cx = width / 2;
        const int neck = height / 2;

        // Funnel walls are two cells thick so grains cannot slip through diagonally.
        uint32_t walls = 0;
        for (int d = 0; d <= neck; ++d) {
            const int y = neck - d;
            for (int offset : { 1 + d, 2 + d }) {
                for (int x : { cx - offset, cx + offset }) {
                    if (grid.isInBounds(x, y)) {
                        grid.set(x, y, Material::wall());
                        ++walls;
                    }
                }
            }
        }

        // Fill the upper half of the funnel.
        uint32_t grains = 0;
        for (int y = 0; y < neck / 2; ++y) {
            const int halfWidth = neck - y;
            for (int x = 0; x < width; ++x) {
                if (std::abs(x - cx) <= halfWidth && grid.isEmpty(Vector2i{ x, y })) {
                    grid.set(x, y, Material::sand());
                    ++grains;
                }
            }
        }

        LoggingChannels::scenario()->info(
            "HourglassScenario::setup - {} wall cells, {} grains, neck at ({}, {})",
            walls,
            grains,
            cx,
            neck);
    }

    void tick(const Grid& /*grid*/, uint32_t /*frame*/, FrameDriver& /*driver*/) override {}

    bool isFinished(uint32_t /*frame*/) const override { return true; }

private:
    ScenarioMetadata metadata_;
};

} // namespace SandSim
