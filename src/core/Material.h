#pragma once

#include "Color.h"
#include "MaterialType.h"
#include "Vector2.h"

#include <nlohmann/json.hpp>

namespace SandSim {

class Grid;

/**
 * \file
 * Material is the value stored in an occupied grid cell.
 *
 * It is a closed tagged variant over MaterialType: copying a Material is
 * cloning it, so a cell never aliases another cell's occupant. Behavior is
 * looked up per type in a table of movement rules.
 */
struct Material {
    MaterialType type = MaterialType::SAND;

    static Material sand() { return Material{ MaterialType::SAND }; }
    static Material wall() { return Material{ MaterialType::WALL }; }

    /**
     * Decide where this particle goes next tick.
     *
     * Reads only from the pre-tick grid. Returns current (stay) or an in-bounds
     * neighbour of current.
     */
    Vector2i nextPosition(const Grid& grid, const Vector2i& current) const;

    Color color() const;

    const char* name() const;

    // Independent instance with identical behavior and color.
    Material clone() const { return *this; }

    bool operator==(const Material& other) const { return type == other.type; }
    bool operator!=(const Material& other) const { return !(*this == other); }
};

inline void to_json(nlohmann::json& j, const Material& material)
{
    j = material.type;
}

inline void from_json(const nlohmann::json& j, Material& material)
{
    material.type = j.get<MaterialType>();
}

} // namespace SandSim
