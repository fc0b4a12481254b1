#pragma once

#include "PlacementCommand.h"
#include "core/MaterialType.h"
#include "core/Vector2.h"

#include <cstdint>

namespace SandSim {

/**
 * Converts pointer pixel coordinates into grid coordinates.
 *
 * Pixels map to cells by integer division by the cell size. Results are
 * clamped into the grid, so a pointer dragged past the window edge paints the
 * nearest edge cell and the grid never sees an out-of-range position.
 */
class InputMapper {
public:
    InputMapper(uint32_t cellSize, uint32_t gridWidth, uint32_t gridHeight);

    Vector2i pixelToCell(int pixelX, int pixelY) const;

    // Top-left pixel of a cell's screen rectangle.
    Vector2i cellToPixel(const Vector2i& cell) const;

    PlacementCommand place(int pixelX, int pixelY, MaterialType material) const;
    PlacementCommand erase(int pixelX, int pixelY) const;

    uint32_t getCellSize() const { return cell_size_; }

    // Pixel extent of the whole grid.
    int getSurfaceWidth() const { return static_cast<int>(grid_width_ * cell_size_); }
    int getSurfaceHeight() const { return static_cast<int>(grid_height_ * cell_size_); }

private:
    uint32_t cell_size_;
    uint32_t grid_width_;
    uint32_t grid_height_;
};

} // namespace SandSim
