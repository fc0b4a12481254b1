#pragma once

#include "InputMapper.h"
#include "PlacementCommand.h"
#include "core/Timers.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace SandSim {

class Grid;
class RenderTarget;
class Scenario;

/**
 * Runs the per-frame cycle over a Grid:
 *   1. scenario tick (queues scripted placements)
 *   2. apply queued placements in arrival order
 *   3. one Grid::update()
 *   4. clear the render target
 *   5. fillCell() for every occupied cell, then present()
 *
 * The render target is optional; without one the driver runs headless.
 * Neither the grid nor the render target is owned. Pointer input is mapped to
 * cells by the driver's InputMapper.
 */
class FrameDriver {
public:
    // One pixel per cell.
    FrameDriver(Grid& grid, RenderTarget* target);
    FrameDriver(Grid& grid, RenderTarget* target, InputMapper inputMapper);
    ~FrameDriver();

    FrameDriver(const FrameDriver&) = delete;
    FrameDriver& operator=(const FrameDriver&) = delete;

    // Takes ownership and runs the scenario's setup() on the grid.
    void setScenario(std::unique_ptr<Scenario> scenario);
    Scenario* getScenario() const { return scenario_.get(); }

    // Queue a placement for the start of the next frame.
    void queuePlacement(const PlacementCommand& command);
    size_t pendingPlacementCount() const { return pending_.size(); }

    // Queue a placement at a pointer position in pixels. Empty material erases.
    void queuePointer(int pixelX, int pixelY, std::optional<MaterialType> material);

    const InputMapper& getInputMapper() const { return input_mapper_; }

    void runFrame();

    /**
     * Run frames until one of:
     * - maxFrames frames have run (0 means no limit),
     * - the grid has settled and the scenario has finished,
     * - requestStop() was called.
     * Sleeps frameDelay between frames. Returns the number of frames run.
     */
    uint32_t run(uint32_t maxFrames, std::chrono::milliseconds frameDelay);

    // Safe to call from a signal handler.
    void requestStop() { stop_requested_ = true; }
    bool isStopRequested() const { return stop_requested_; }

    // Last tick moved nothing and lost no contests.
    bool isSettled() const;

    uint32_t getFrameCount() const { return frame_count_; }

    Timers& getTimers() { return timers_; }
    const Timers& getTimers() const { return timers_; }

private:
    void applyPlacements();
    void render();

    Grid& grid_;
    RenderTarget* target_;
    InputMapper input_mapper_;
    std::unique_ptr<Scenario> scenario_;
    std::vector<PlacementCommand> pending_;
    uint32_t frame_count_ = 0;
    std::atomic<bool> stop_requested_{ false };
    Timers timers_;
};

} // namespace SandSim
