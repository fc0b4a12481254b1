#include "InputMapper.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <stdexcept>

namespace SandSim {

namespace {

// Floor division, so pixel -1 maps to cell -1 before clamping.
int floorDiv(int value, int divisor)
{
    int quotient = value / divisor;
    if ((value % divisor != 0) && (value < 0)) {
        --quotient;
    }
    return quotient;
}

} // namespace

InputMapper::InputMapper(uint32_t cellSize, uint32_t gridWidth, uint32_t gridHeight)
    : cell_size_(cellSize), grid_width_(gridWidth), grid_height_(gridHeight)
{
    if (cellSize == 0 || gridWidth == 0 || gridHeight == 0) {
        throw std::invalid_argument("InputMapper: cell size and grid dimensions must be positive");
    }
}

Vector2i InputMapper::pixelToCell(int pixelX, int pixelY) const
{
    const int size = static_cast<int>(cell_size_);
    const int rawX = floorDiv(pixelX, size);
    const int rawY = floorDiv(pixelY, size);

    const Vector2i cell{ std::clamp(rawX, 0, static_cast<int>(grid_width_) - 1),
                         std::clamp(rawY, 0, static_cast<int>(grid_height_) - 1) };

    if (cell.x != rawX || cell.y != rawY) {
        LoggingChannels::input()->debug(
            "Pixel ({}, {}) outside grid, clamped to cell {}", pixelX, pixelY, cell.toString());
    }
    return cell;
}

Vector2i InputMapper::cellToPixel(const Vector2i& cell) const
{
    return cell * static_cast<int>(cell_size_);
}

PlacementCommand InputMapper::place(int pixelX, int pixelY, MaterialType material) const
{
    return PlacementCommand{ pixelToCell(pixelX, pixelY), material };
}

PlacementCommand InputMapper::erase(int pixelX, int pixelY) const
{
    return PlacementCommand{ pixelToCell(pixelX, pixelY), std::nullopt };
}

} // namespace SandSim
