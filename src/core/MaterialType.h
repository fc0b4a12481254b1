#pragma once

#include "Color.h"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace SandSim {

/**
 * \file
 * Material kinds for the falling-sand grid.
 * A cell holds at most one material; an empty cell holds none.
 */

enum class MaterialType : uint8_t {
    SAND = 0, // Granular solid, falls and piles.
    WALL      // Immobile obstacle.
};

constexpr size_t MATERIAL_TYPE_COUNT = 2;

/**
 * Per-kind constants. Movement rules live in Material.cpp.
 */
struct MaterialProperties {
    Color color; // Render color.
    char ascii;  // Character for plain text diagrams.
};

/**
 * Get material properties for a given material type.
 */
const MaterialProperties& getMaterialProperties(MaterialType type);

Color getMaterialColor(MaterialType type);

/**
 * Get a human-readable name for a material type ("SAND", "WALL").
 */
const char* getMaterialName(MaterialType type);

/**
 * Case-insensitive reverse lookup of getMaterialName().
 */
std::optional<MaterialType> materialTypeFromName(const std::string& name);

/**
 * JSON serialization support for MaterialType (ADL convention for nlohmann::json).
 */
void to_json(nlohmann::json& j, MaterialType type);
void from_json(const nlohmann::json& j, MaterialType& type);

} // namespace SandSim
