#include "core/Grid.h"
#include "core/LoggingChannels.h"
#include "core/MaterialType.h"
#include "runner/FrameDriver.h"
#include "runner/scenarios/Scenario.h"

namespace SandSim {

/**
 * Sand Pour scenario - one grain per frame from a spout at the top centre,
 * like holding the mouse button over the same spot.
 *
 * Pouring stops once the pile backs up into the spout cell, or after
 * pourFrames frames when that is non-zero.
 */
class SandPourScenario : public Scenario {
public:
    explicit SandPourScenario(uint32_t pourFrames = 0) : pour_frames_(pourFrames)
    {
        metadata_.name = "Sand Pour";
        metadata_.description = "Stream of sand from the top centre until the pile reaches it";
        metadata_.category = "demo";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(Grid& grid) override
    {
        spout_blocked_ = false;
        LoggingChannels::scenario()->info(
            "SandPourScenario::setup - pouring at column {}", grid.getWidth() / 2);
    }

    void tick(const Grid& grid, uint32_t frame, FrameDriver& driver) override
    {
        if (isFinished(frame)) {
            return;
        }

        // Pointer held over the middle of the top row, in pixels.
        const InputMapper& mapper = driver.getInputMapper();
        const int pointerX = mapper.getSurfaceWidth() / 2;
        const int pointerY = static_cast<int>(mapper.getCellSize()) / 2;

        const Vector2i spout = mapper.pixelToCell(pointerX, pointerY);
        if (!grid.isEmpty(spout)) {
            spout_blocked_ = true;
            LoggingChannels::scenario()->info(
                "SandPourScenario: pile reached the spout at {} after {} frames",
                spout.toString(),
                frame);
            return;
        }

        driver.queuePointer(pointerX, pointerY, MaterialType::SAND);
    }

    bool isFinished(uint32_t frame) const override
    {
        return spout_blocked_ || (pour_frames_ > 0 && frame >= pour_frames_);
    }

private:
    ScenarioMetadata metadata_;
    uint32_t pour_frames_;
    bool spout_blocked_ = false;
};

} // namespace SandSim
