#pragma once

#include "Color.h"
#include "Material.h"
#include "Timers.h"
#include "Vector2.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace SandSim {

/**
 * Grid: the falling-sand world.
 *
 * Design:
 * - Dense row-major storage of optional materials: cells[y * width + x].
 * - Dimensions are fixed at construction.
 * - update() reads every decision from the frozen pre-tick cells and writes
 *   into a private successor buffer, then swaps the two buffers.
 * - Same-destination conflicts go to the first claimant in row-major scan
 *   order; later claimants stay where they were. Particle count is conserved.
 *
 * Usage:
 *   Grid grid(80, 60);
 *   grid.set({ 40, 0 }, Material::sand());
 *   grid.update();
 *   for (const auto& entry : grid.drawEnumeration()) { ... }
 */
class Grid {
public:
    using CellContents = std::optional<Material>;

    // One occupied cell as seen by a renderer.
    struct DrawEntry {
        Vector2i position;
        Color color;
    };

    // Outcome counters for the most recent update().
    struct UpdateStats {
        uint32_t occupied = 0;  // Particles processed.
        uint32_t moved = 0;     // Particles that changed cell.
        uint32_t contested = 0; // Particles that lost a destination to an earlier claimant.
        uint32_t rejected = 0;  // Decisions that broke the movement contract.
    };

    /**
     * Lazy view over the occupied cells of a grid, in row-major order.
     * Each begin() rescans the live cells, so the range is restartable.
     */
    class DrawRange {
    public:
        class Iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = DrawEntry;
            using difference_type = std::ptrdiff_t;
            using pointer = const DrawEntry*;
            using reference = const DrawEntry&;

            Iterator() = default;
            Iterator(const Grid* grid, size_t index);

            reference operator*() const { return entry_; }
            pointer operator->() const { return &entry_; }

            Iterator& operator++();
            Iterator operator++(int);

            bool operator==(const Iterator& other) const { return index_ == other.index_; }
            bool operator!=(const Iterator& other) const { return index_ != other.index_; }

        private:
            void skipToOccupied();

            const Grid* grid_ = nullptr;
            size_t index_ = 0;
            DrawEntry entry_ = {};
        };

        explicit DrawRange(const Grid& grid) : grid_(&grid) {}

        Iterator begin() const;
        Iterator end() const;

    private:
        const Grid* grid_;
    };

    Grid(uint32_t width, uint32_t height);

    // =================================================================
    // CELL ACCESS
    // =================================================================

    bool isInBounds(const Vector2i& pos) const;
    bool isInBounds(int x, int y) const;

    // Throws std::out_of_range outside [0,width) x [0,height).
    CellContents get(const Vector2i& pos) const;
    CellContents get(int x, int y) const;

    void set(const Vector2i& pos, CellContents material);
    void set(int x, int y, CellContents material);

    // True when the in-bounds cell holds no material.
    bool isEmpty(const Vector2i& pos) const;

    // Empty every cell. Dimensions and timestep are kept.
    void clear();

    // =================================================================
    // SIMULATION
    // =================================================================

    // Advance the simulation by exactly one tick.
    void update();

    uint32_t getTimestep() const { return timestep_; }
    const UpdateStats& getLastUpdateStats() const { return last_update_stats_; }

    // =================================================================
    // RENDERING AND DIAGNOSTICS
    // =================================================================

    DrawRange drawEnumeration() const { return DrawRange(*this); }

    size_t countOccupied() const;

    nlohmann::json toJson() const;

    uint32_t getWidth() const { return width_; }
    uint32_t getHeight() const { return height_; }

    Timers& getTimers() { return timers_; }
    const Timers& getTimers() const { return timers_; }

    // Compares dimensions and cell contents only.
    bool operator==(const Grid& other) const;
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    size_t indexOf(const Vector2i& pos, const char* operation) const;
    bool isValidDestination(const Vector2i& source, const Vector2i& destination) const;

    uint32_t width_;
    uint32_t height_;
    uint32_t timestep_ = 0;
    std::vector<CellContents> cells_;
    std::vector<CellContents> next_cells_; // Successor buffer, only meaningful inside update().
    UpdateStats last_update_stats_;
    Timers timers_;
};

} // namespace SandSim
