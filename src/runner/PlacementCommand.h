#pragma once

#include "core/MaterialType.h"
#include "core/Vector2.h"

#include <optional>

namespace SandSim {

/**
 * "Place material M at cell (x, y)" as handed from input to the grid.
 * An empty material erases the cell.
 */
struct PlacementCommand {
    Vector2i position;
    std::optional<MaterialType> material;
};

} // namespace SandSim
