#pragma once

#include <cstdint>
#include <string>

namespace SandSim {

class FrameDriver;
class Grid;

/**
 * Metadata for a scenario.
 */
struct ScenarioMetadata {
    std::string name;        // Display name
    std::string description; // Help text
    std::string category;    // Organization category (demo, sandbox, test)
};

/**
 * Base interface for scenarios.
 *
 * A scenario builds the starting grid and then acts as a scripted input
 * device, queueing placements on the FrameDriver each frame the way a user
 * holding the mouse button would.
 *
 * Scenarios are instanced (not singletons) so each keeps independent state.
 */
class Scenario {
public:
    virtual ~Scenario() = default;

    virtual const ScenarioMetadata& getMetadata() const = 0;

    // Place the starting materials. The grid is empty when this is called.
    virtual void setup(Grid& grid) = 0;

    // Queue this frame's placements on the driver.
    virtual void tick(const Grid& grid, uint32_t frame, FrameDriver& driver) = 0;

    // True once the scenario will queue no further placements.
    virtual bool isFinished(uint32_t frame) const = 0;
};

} // namespace SandSim
