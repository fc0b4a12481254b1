#include "Grid.h"
#include "LoggingChannels.h"
#include "SandSimAssert.h"
#include "ScopeTimer.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace SandSim {

Grid::Grid(uint32_t width, uint32_t height) : width_(width), height_(height)
{
    if (width == 0 || height == 0) {
        LoggingChannels::grid()->error("Grid: Rejecting degenerate size {}x{}", width, height);
        throw std::invalid_argument(
            "Grid dimensions must be positive, got " + std::to_string(width) + "x"
            + std::to_string(height));
    }

    const size_t cellCount = static_cast<size_t>(width) * height;
    cells_.assign(cellCount, std::nullopt);
    next_cells_.assign(cellCount, std::nullopt);

    LoggingChannels::grid()->debug("Grid: Created {}x{} ({} cells)", width, height, cellCount);
}

bool Grid::isInBounds(const Vector2i& pos) const
{
    return isInBounds(pos.x, pos.y);
}

bool Grid::isInBounds(int x, int y) const
{
    return x >= 0 && y >= 0 && static_cast<uint32_t>(x) < width_
        && static_cast<uint32_t>(y) < height_;
}

size_t Grid::indexOf(const Vector2i& pos, const char* operation) const
{
    if (!isInBounds(pos)) {
        LoggingChannels::grid()->error(
            "Grid::{}: Position {} outside {}x{} grid", operation, pos.toString(), width_, height_);
        throw std::out_of_range(
            std::string("Grid::") + operation + ": position " + pos.toString()
            + " is out of bounds");
    }
    return static_cast<size_t>(pos.y) * width_ + static_cast<size_t>(pos.x);
}

Grid::CellContents Grid::get(const Vector2i& pos) const
{
    return cells_[indexOf(pos, "get")];
}

Grid::CellContents Grid::get(int x, int y) const
{
    return get(Vector2i{ x, y });
}

void Grid::set(const Vector2i& pos, CellContents material)
{
    cells_[indexOf(pos, "set")] = material;
}

void Grid::set(int x, int y, CellContents material)
{
    set(Vector2i{ x, y }, material);
}

bool Grid::isEmpty(const Vector2i& pos) const
{
    return !cells_[indexOf(pos, "isEmpty")].has_value();
}

void Grid::clear()
{
    std::fill(cells_.begin(), cells_.end(), std::nullopt);
}

bool Grid::isValidDestination(const Vector2i& source, const Vector2i& destination) const
{
    if (destination == source) {
        return true;
    }

    // A move must go to an in-bounds neighbour that was empty before the tick.
    return isInBounds(destination) && source.chebyshevDistance(destination) == 1
        && !cells_[static_cast<size_t>(destination.y) * width_ + destination.x].has_value();
}

void Grid::update()
{
    ScopeTimer timer(timers_, "grid_update");

    std::fill(next_cells_.begin(), next_cells_.end(), std::nullopt);
    UpdateStats stats;

    for (size_t idx = 0; idx < cells_.size(); ++idx) {
        const CellContents& cell = cells_[idx];
        if (!cell.has_value()) {
            continue;
        }

        ++stats.occupied;

        const Vector2i source{ static_cast<int>(idx % width_), static_cast<int>(idx / width_) };
        Vector2i destination = cell->nextPosition(*this, source);

        const bool validDestination = isValidDestination(source, destination);
        SANDSIM_VERIFY(validDestination, "Material proposed a move outside its neighbourhood");
        if (!validDestination) {
            ++stats.rejected;
            LoggingChannels::material()->error(
                "{} at {} proposed invalid destination {}, keeping it in place",
                cell->name(),
                source.toString(),
                destination.toString());
            destination = source;
        }

        const size_t destinationIdx =
            static_cast<size_t>(destination.y) * width_ + static_cast<size_t>(destination.x);

        // First claimant in scan order keeps the cell. The source cell was
        // occupied before the tick, so nobody else can have claimed it.
        if (destination != source && next_cells_[destinationIdx].has_value()) {
            ++stats.contested;
            LoggingChannels::grid()->trace(
                "{} at {} lost {} to an earlier claimant",
                cell->name(),
                source.toString(),
                destination.toString());
            next_cells_[idx] = cell->clone();
            continue;
        }

        if (destination != source) {
            ++stats.moved;
        }
        next_cells_[destinationIdx] = cell->clone();
    }

    cells_.swap(next_cells_);
    SANDSIM_DEBUG_ASSERT(countOccupied() == stats.occupied, "Tick changed the particle count");
    ++timestep_;
    last_update_stats_ = stats;

    LoggingChannels::grid()->trace(
        "Grid: Tick {} complete ({} particles, {} moved, {} contested)",
        timestep_,
        stats.occupied,
        stats.moved,
        stats.contested);
}

size_t Grid::countOccupied() const
{
    return static_cast<size_t>(std::count_if(
        cells_.begin(), cells_.end(), [](const CellContents& cell) { return cell.has_value(); }));
}

nlohmann::json Grid::toJson() const
{
    nlohmann::json occupied = nlohmann::json::array();
    for (size_t idx = 0; idx < cells_.size(); ++idx) {
        if (cells_[idx].has_value()) {
            occupied.push_back(
                { { "x", idx % width_ }, { "y", idx / width_ }, { "material", *cells_[idx] } });
        }
    }

    return { { "width", width_ },
             { "height", height_ },
             { "timestep", timestep_ },
             { "cells", occupied } };
}

bool Grid::operator==(const Grid& other) const
{
    return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
}

// =================================================================
// DRAW ENUMERATION
// =================================================================

Grid::DrawRange::Iterator::Iterator(const Grid* grid, size_t index) : grid_(grid), index_(index)
{
    skipToOccupied();
}

void Grid::DrawRange::Iterator::skipToOccupied()
{
    const auto& cells = grid_->cells_;
    while (index_ < cells.size() && !cells[index_].has_value()) {
        ++index_;
    }

    if (index_ < cells.size()) {
        entry_.position = { static_cast<int>(index_ % grid_->width_),
                            static_cast<int>(index_ / grid_->width_) };
        entry_.color = cells[index_]->color();
    }
}

Grid::DrawRange::Iterator& Grid::DrawRange::Iterator::operator++()
{
    ++index_;
    skipToOccupied();
    return *this;
}

Grid::DrawRange::Iterator Grid::DrawRange::Iterator::operator++(int)
{
    Iterator previous = *this;
    ++(*this);
    return previous;
}

Grid::DrawRange::Iterator Grid::DrawRange::begin() const
{
    return Iterator(grid_, 0);
}

Grid::DrawRange::Iterator Grid::DrawRange::end() const
{
    return Iterator(grid_, grid_->cells_.size());
}

} // namespace SandSim
