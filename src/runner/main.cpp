#include "FrameDriver.h"
#include "InputMapper.h"
#include "TerminalRenderTarget.h"
#include "core/CrashDumpHandler.h"
#include "core/Grid.h"
#include "core/GridDiagramGenerator.h"
#include "core/LoggingChannels.h"
#include "core/SimulationSettings.h"
#include "scenarios/ScenarioRegistry.h"

#include <args.hxx>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

using namespace SandSim;

// Global pointer for signal handler.
static FrameDriver* g_driver = nullptr;

void signalHandler(int /*signum*/)
{
    if (g_driver) {
        g_driver->requestStop();
    }
}

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Sand Sim", "Falling-sand cellular automaton rendered to the terminal.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<uint32_t> widthArg(parser, "width", "Grid width in cells", { "width" });
    args::ValueFlag<uint32_t> heightArg(parser, "height", "Grid height in cells", { "height" });
    args::ValueFlag<uint32_t> cellSizeArg(
        parser,
        "cell-size",
        "Pointer pixels per cell edge, also terminal columns per rendered cell",
        { "cell-size" });
    args::ValueFlag<int> stepsArg(
        parser,
        "steps",
        "Number of frames to run (default from settings, <= 0 runs until settled)",
        { 's', "steps" });
    args::ValueFlag<std::string> scenarioArg(
        parser, "scenario", "Scenario to run (see --list-scenarios)", { "scenario" });
    args::ValueFlag<std::string> settingsArg(
        parser, "settings", "Path to simulation settings JSON file", { "settings" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., grid:trace,driver:debug,*:off)",
        { 'C', "channels" });
    args::ValueFlag<uint32_t> frameDelayArg(
        parser, "frame-delay-ms", "Sleep between frames in milliseconds", { "frame-delay-ms" });
    args::Flag noColor(parser, "no-color", "Plain ASCII frames", { "no-color" });
    args::Flag noRender(parser, "no-render", "Run headless", { "no-render" });
    args::Flag printStats(
        parser, "print-stats", "Print timer statistics on exit", { "print-stats" });
    args::Flag dumpJson(parser, "dump-json", "Print the final grid as JSON", { "dump-json" });
    args::Flag listScenarios(
        parser, "list-scenarios", "List available scenarios and exit", { "list-scenarios" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Initialize logging from config file (supports .local override).
    LoggingChannels::initializeFromConfig(args::get(logConfig));

    // Apply command line channel overrides if provided.
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        spdlog::info("Applied channel overrides: {}", args::get(logChannels));
    }

    ScenarioRegistry registry = ScenarioRegistry::createDefault();

    if (listScenarios) {
        for (const auto& id : registry.getScenarioIds()) {
            const ScenarioMetadata* metadata = registry.getMetadata(id);
            std::cout << id << " - " << metadata->name << ": " << metadata->description
                      << std::endl;
        }
        return 0;
    }

    SimulationSettings settings = getDefaultSimulationSettings();
    if (settingsArg) {
        auto loaded = loadSimulationSettings(args::get(settingsArg));
        if (loaded.isError()) {
            spdlog::error("Failed to load settings: {}", loaded.errorValue());
            return 1;
        }
        settings = loaded.value();
    }

    // Command line flags override the settings file.
    if (widthArg) settings.grid_width = args::get(widthArg);
    if (heightArg) settings.grid_height = args::get(heightArg);
    if (cellSizeArg) settings.cell_size = args::get(cellSizeArg);
    if (stepsArg) settings.max_steps = args::get(stepsArg);
    if (scenarioArg) settings.scenario_id = args::get(scenarioArg);
    if (frameDelayArg) settings.frame_delay_ms = args::get(frameDelayArg);
    if (noColor) settings.color_output = false;
    if (noRender) settings.render_enabled = false;

    const std::string problem = validateSimulationSettings(settings);
    if (!problem.empty()) {
        spdlog::error("Invalid settings: {}", problem);
        return 1;
    }

    auto scenario = registry.createScenario(settings.scenario_id);
    if (!scenario) {
        spdlog::error("Unknown scenario '{}' (try --list-scenarios)", settings.scenario_id);
        return 1;
    }

    spdlog::info("Starting Sand Sim");
    spdlog::info(
        "Grid: {}x{}, scenario: {}", settings.grid_width, settings.grid_height, settings.scenario_id);

    Grid grid(settings.grid_width, settings.grid_height);
    CrashDumpHandler::install(&grid);

    std::unique_ptr<TerminalRenderTarget> target;
    if (settings.render_enabled) {
        TerminalRenderTarget::Options options;
        options.color = settings.color_output;
        options.cell_size = settings.cell_size;
        target = std::make_unique<TerminalRenderTarget>(
            std::cout, settings.grid_width, settings.grid_height, options);
    }

    InputMapper inputMapper(settings.cell_size, settings.grid_width, settings.grid_height);
    FrameDriver driver(grid, target.get(), inputMapper);
    g_driver = &driver;

    // Set up signal handler for graceful shutdown.
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    driver.setScenario(std::move(scenario));

    const uint32_t maxFrames =
        settings.max_steps > 0 ? static_cast<uint32_t>(settings.max_steps) : 0;
    const auto delay =
        settings.render_enabled ? std::chrono::milliseconds(settings.frame_delay_ms)
                                : std::chrono::milliseconds(0);
    const uint32_t frames = driver.run(maxFrames, delay);

    g_driver = nullptr;

    std::cout << "\nFinal grid after " << frames << " frames (" << grid.countOccupied()
              << " particles):\n"
              << GridDiagramGenerator::generateAsciiDiagram(grid);

    if (dumpJson) {
        std::cout << grid.toJson().dump(2) << std::endl;
    }

    if (printStats) {
        std::cout << "\n=== Grid Timer Statistics ===" << std::endl;
        grid.getTimers().dumpTimerStats();
        std::cout << "\n=== Frame Timer Statistics ===" << std::endl;
        driver.getTimers().dumpTimerStats();
    }

    CrashDumpHandler::uninstall();
    spdlog::info("Sand Sim shut down cleanly");

    return 0;
}
