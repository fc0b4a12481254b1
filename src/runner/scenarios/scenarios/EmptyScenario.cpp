#include "core/Grid.h"
#include "core/LoggingChannels.h"
#include "runner/FrameDriver.h"
#include "runner/scenarios/Scenario.h"

namespace SandSim {

/**
 * Empty scenario - blank grid, placements only come from outside.
 */
class EmptyScenario : public Scenario {
public:
    EmptyScenario()
    {
        metadata_.name = "Empty";
        metadata_.description = "Blank grid with no scripted input";
        metadata_.category = "sandbox";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(Grid& grid) override
    {
        LoggingChannels::scenario()->info(
            "EmptyScenario::setup - {}x{} grid left empty", grid.getWidth(), grid.getHeight());
    }

    void tick(const Grid& /*grid*/, uint32_t /*frame*/, FrameDriver& /*driver*/) override {}

    bool isFinished(uint32_t /*frame*/) const override { return true; }

private:
    ScenarioMetadata metadata_;
};

} // namespace SandSim
