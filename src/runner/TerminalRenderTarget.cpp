#include "TerminalRenderTarget.h"
#include "core/LoggingChannels.h"
#include "core/MaterialType.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace SandSim {

namespace {

char asciiForColor(const Color& color)
{
    for (size_t i = 0; i < MATERIAL_TYPE_COUNT; ++i) {
        const auto& props = getMaterialProperties(static_cast<MaterialType>(i));
        if (props.color == color) {
            return props.ascii;
        }
    }
    return '*';
}

} // namespace

TerminalRenderTarget::TerminalRenderTarget(
    std::ostream& out, uint32_t width, uint32_t height, Options options)
    : out_(out),
      width_(width),
      height_(height),
      options_(options),
      rows_per_cell_(std::max<uint32_t>(1, options.cell_size / 2)),
      framebuffer_(static_cast<size_t>(width) * height)
{
    if (options_.cell_size == 0) {
        throw std::invalid_argument("TerminalRenderTarget: cell size must be positive");
    }
}

void TerminalRenderTarget::clear()
{
    std::fill(framebuffer_.begin(), framebuffer_.end(), std::nullopt);
}

void TerminalRenderTarget::fillCell(const Vector2i& cell, const Color& color)
{
    if (cell.x < 0 || cell.y < 0 || static_cast<uint32_t>(cell.x) >= width_
        || static_cast<uint32_t>(cell.y) >= height_) {
        LoggingChannels::render()->warn("Ignoring fill outside framebuffer at {}", cell.toString());
        return;
    }
    framebuffer_[static_cast<size_t>(cell.y) * width_ + cell.x] = color;
}

void TerminalRenderTarget::present()
{
    if (options_.home_cursor) {
        out_ << "\x1b[H";
    }

    for (uint32_t y = 0; y < height_; ++y) {
        for (uint32_t repeat = 0; repeat < rows_per_cell_; ++repeat) {
            if (options_.color) {
                writeColorRow(y);
            }
            else {
                writePlainRow(y);
            }
        }
    }

    out_.flush();
    ++presented_frames_;
}

void TerminalRenderTarget::writeColorRow(uint32_t y)
{
    const std::string block(options_.cell_size, ' ');
    for (uint32_t x = 0; x < width_; ++x) {
        const auto& cell = framebuffer_[static_cast<size_t>(y) * width_ + x];
        if (cell) {
            out_ << "\x1b[48;2;" << static_cast<int>(cell->r) << ";" << static_cast<int>(cell->g)
                 << ";" << static_cast<int>(cell->b) << "m" << block;
        }
        else {
            out_ << "\x1b[0m" << block;
        }
    }
    out_ << "\x1b[0m\n";
}

void TerminalRenderTarget::writePlainRow(uint32_t y)
{
    for (uint32_t x = 0; x < width_; ++x) {
        const auto& cell = framebuffer_[static_cast<size_t>(y) * width_ + x];
        out_ << std::string(options_.cell_size, cell ? asciiForColor(*cell) : '.');
    }
    out_ << "\n";
}

} // namespace SandSim
