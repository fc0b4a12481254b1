#include "SimulationSettings.h"
#include "LoggingChannels.h"

#include <fstream>

namespace SandSim {

SimulationSettings getDefaultSimulationSettings()
{
    return SimulationSettings{ .grid_width = 60,
                               .grid_height = 30,
                               .cell_size = 2,
                               .max_steps = 200,
                               .frame_delay_ms = 30,
                               .color_output = true,
                               .render_enabled = true,
                               .scenario_id = "sand_pour" };
}

std::string validateSimulationSettings(const SimulationSettings& settings)
{
    if (settings.grid_width == 0 || settings.grid_height == 0) {
        return "grid_width and grid_height must be positive";
    }
    if (settings.cell_size == 0) {
        return "cell_size must be positive";
    }
    if (settings.scenario_id.empty()) {
        return "scenario_id must not be empty";
    }
    return "";
}

Result<SimulationSettings, std::string> loadSimulationSettings(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<SimulationSettings, std::string>::error(
            "Cannot open settings file: " + path);
    }

    SimulationSettings settings;
    try {
        nlohmann::json doc = nlohmann::json::parse(file);
        if (!doc.is_object()) {
            return Result<SimulationSettings, std::string>::error(
                "Settings file must contain a JSON object: " + path);
        }
        settings = doc.get<SimulationSettings>();
    }
    catch (const nlohmann::json::exception& e) {
        return Result<SimulationSettings, std::string>::error(
            "Invalid settings file " + path + ": " + e.what());
    }

    std::string problem = validateSimulationSettings(settings);
    if (!problem.empty()) {
        return Result<SimulationSettings, std::string>::error(
            "Invalid settings in " + path + ": " + problem);
    }

    LoggingChannels::driver()->info("Loaded simulation settings from {}", path);
    return Result<SimulationSettings, std::string>::okay(settings);
}

} // namespace SandSim
