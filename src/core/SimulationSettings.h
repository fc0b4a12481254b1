#pragma once

#include "ReflectSerializer.h"
#include "Result.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace SandSim {

/**
 * @brief Runner configuration.
 *
 * Loaded from an optional JSON file, then overridden by command line flags.
 * Automatically serializable via ReflectSerializer.
 *
 * Use getDefaultSimulationSettings() for default values.
 */
struct SimulationSettings {
    uint32_t grid_width;
    uint32_t grid_height;
    uint32_t cell_size;      // Pointer pixels per cell edge; terminal columns per cell.
    int max_steps;           // Frames to run; <= 0 runs until the scenario settles.
    uint32_t frame_delay_ms; // Sleep between rendered frames.
    bool color_output;       // ANSI 24-bit color in the terminal renderer.
    bool render_enabled;
    std::string scenario_id;
};

SimulationSettings getDefaultSimulationSettings();

/**
 * @brief Read settings from a JSON file on top of the defaults.
 * Missing keys keep their default. Fails on unreadable files, bad JSON,
 * type mismatches, and values that fail validateSimulationSettings().
 */
Result<SimulationSettings, std::string> loadSimulationSettings(const std::string& path);

/**
 * @brief Empty string when valid, otherwise a description of the first problem.
 */
std::string validateSimulationSettings(const SimulationSettings& settings);

inline void to_json(nlohmann::json& j, const SimulationSettings& settings)
{
    j = ReflectSerializer::to_json(settings);
}

inline void from_json(const nlohmann::json& j, SimulationSettings& settings)
{
    settings = ReflectSerializer::from_json<SimulationSettings>(j, getDefaultSimulationSettings());
}

} // namespace SandSim
