#pragma once

#include "RenderTarget.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace SandSim {

/**
 * Renders frames to a text stream.
 *
 * Each grid cell becomes a block cell_size columns wide and cell_size / 2
 * rows high (at least one row), since terminal glyphs are about twice as tall
 * as they are wide. With color enabled the block is spaces on an ANSI 24-bit
 * background. Without color it repeats the ASCII character of the material
 * whose color matches, '*' for an unknown color, and '.' when empty.
 */
class TerminalRenderTarget : public RenderTarget {
public:
    struct Options {
        bool color = true;
        bool home_cursor = true; // Redraw in place instead of scrolling.
        uint32_t cell_size = 1;  // Terminal columns per grid cell.
    };

    TerminalRenderTarget(std::ostream& out, uint32_t width, uint32_t height, Options options);

    void clear() override;
    void fillCell(const Vector2i& cell, const Color& color) override;
    void present() override;

    uint32_t getPresentedFrames() const { return presented_frames_; }

private:
    void writeColorRow(uint32_t y);
    void writePlainRow(uint32_t y);

    std::ostream& out_;
    uint32_t width_;
    uint32_t height_;
    Options options_;
    uint32_t rows_per_cell_;
    std::vector<std::optional<Color>> framebuffer_;
    uint32_t presented_frames_ = 0;
};

} // namespace SandSim
