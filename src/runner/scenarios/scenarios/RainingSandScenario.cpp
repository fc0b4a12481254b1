#include "core/Grid.h"
#include "core/LoggingChannels.h"
#include "core/MaterialType.h"
#include "runner/FrameDriver.h"
#include "runner/scenarios/Scenario.h"

#include <random>

namespace SandSim {

/**
 * Raining Sand scenario - grains appear at random columns along the top row
 * for a fixed number of frames, then settle.
 */
class RainingSandScenario : public Scenario {
public:
    RainingSandScenario(uint32_t rainFrames = 150, double dropChance = 0.6)
        : rain_frames_(rainFrames), drop_chance_(dropChance)
    {
        metadata_.name = "Raining Sand";
        metadata_.description = "Sand falls at random columns, then the pile settles";
        metadata_.category = "demo";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(Grid& grid) override
    {
        LoggingChannels::scenario()->info(
            "RainingSandScenario::setup - {} frames of rain over {} columns",
            rain_frames_,
            grid.getWidth());
    }

    void tick(const Grid& grid, uint32_t frame, FrameDriver& driver) override
    {
        if (isFinished(frame) || drop_dist_(rng_) >= drop_chance_) {
            return;
        }

        const InputMapper& mapper = driver.getInputMapper();
        std::uniform_int_distribution<int> x_dist(0, mapper.getSurfaceWidth() - 1);
        const int pointerX = x_dist(rng_);

        // Only drop into open sky.
        if (grid.isEmpty(mapper.pixelToCell(pointerX, 0))) {
            driver.queuePointer(pointerX, 0, MaterialType::SAND);
        }
    }

    bool isFinished(uint32_t frame) const override { return frame >= rain_frames_; }

private:
    ScenarioMetadata metadata_;
    uint32_t rain_frames_;
    double drop_chance_;

    // Fixed seed keeps runs reproducible.
    std::mt19937 rng_{ 42 };
    std::uniform_real_distribution<double> drop_dist_{ 0.0, 1.0 };
};

} // namespace SandSim
