#include "FrameDriver.h"
#include "RenderTarget.h"
#include "core/Grid.h"
#include "core/LoggingChannels.h"
#include "core/Material.h"
#include "core/ScopeTimer.h"
#include "scenarios/Scenario.h"

#include <thread>

namespace SandSim {

FrameDriver::FrameDriver(Grid& grid, RenderTarget* target)
    : FrameDriver(grid, target, InputMapper(1, grid.getWidth(), grid.getHeight()))
{}

FrameDriver::FrameDriver(Grid& grid, RenderTarget* target, InputMapper inputMapper)
    : grid_(grid), target_(target), input_mapper_(inputMapper)
{
    LoggingChannels::driver()->debug(
        "FrameDriver created for {}x{} grid, {}px cells ({})",
        grid_.getWidth(),
        grid_.getHeight(),
        input_mapper_.getCellSize(),
        target_ ? "rendering" : "headless");
}

FrameDriver::~FrameDriver() = default;

void FrameDriver::setScenario(std::unique_ptr<Scenario> scenario)
{
    scenario_ = std::move(scenario);
    if (!scenario_) {
        return;
    }

    LoggingChannels::driver()->info("Setting up scenario '{}'", scenario_->getMetadata().name);
    scenario_->setup(grid_);
}

void FrameDriver::queuePlacement(const PlacementCommand& command)
{
    pending_.push_back(command);
}

void FrameDriver::queuePointer(int pixelX, int pixelY, std::optional<MaterialType> material)
{
    if (material) {
        queuePlacement(input_mapper_.place(pixelX, pixelY, *material));
    }
    else {
        queuePlacement(input_mapper_.erase(pixelX, pixelY));
    }
}

void FrameDriver::runFrame()
{
    ScopeTimer frameTimer(timers_, "frame_total");

    if (scenario_) {
        scenario_->tick(grid_, frame_count_, *this);
    }

    applyPlacements();

    grid_.update();

    if (target_) {
        ScopeTimer renderTimer(timers_, "frame_render");
        render();
    }

    ++frame_count_;

    const auto& stats = grid_.getLastUpdateStats();
    LoggingChannels::driver()->trace(
        "Frame {}: {} particles, {} moved, {} contested",
        frame_count_,
        stats.occupied,
        stats.moved,
        stats.contested);
}

uint32_t FrameDriver::run(uint32_t maxFrames, std::chrono::milliseconds frameDelay)
{
    uint32_t framesRun = 0;

    while (!stop_requested_) {
        if (maxFrames > 0 && framesRun >= maxFrames) {
            LoggingChannels::driver()->info("Reached frame limit ({})", maxFrames);
            break;
        }

        runFrame();
        ++framesRun;

        const bool scenarioDone = !scenario_ || scenario_->isFinished(frame_count_);
        if (scenarioDone && isSettled() && pending_.empty()) {
            LoggingChannels::driver()->info("Grid settled after {} frames", framesRun);
            break;
        }

        if (frameDelay.count() > 0) {
            std::this_thread::sleep_for(frameDelay);
        }
    }

    if (stop_requested_) {
        LoggingChannels::driver()->info("Stop requested after {} frames", framesRun);
    }

    return framesRun;
}

bool FrameDriver::isSettled() const
{
    const auto& stats = grid_.getLastUpdateStats();
    return stats.moved == 0 && stats.contested == 0;
}

void FrameDriver::applyPlacements()
{
    for (const auto& command : pending_) {
        if (!grid_.isInBounds(command.position)) {
            LoggingChannels::input()->warn(
                "Dropping placement at out-of-range cell {}", command.position.toString());
            continue;
        }

        if (command.material) {
            grid_.set(command.position, Material{ *command.material });
        }
        else {
            grid_.set(command.position, std::nullopt);
        }
    }

    pending_.clear();
}

void FrameDriver::render()
{
    target_->clear();
    for (const auto& entry : grid_.drawEnumeration()) {
        target_->fillCell(entry.position, entry.color);
    }
    target_->present();
}

} // namespace SandSim
