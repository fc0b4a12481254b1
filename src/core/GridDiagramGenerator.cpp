#include "GridDiagramGenerator.h"
#include "Grid.h"
#include "MaterialType.h"

#include <sstream>

namespace SandSim {

std::string GridDiagramGenerator::generateAsciiDiagram(const Grid& grid)
{
    std::ostringstream diagram;

    for (uint32_t y = 0; y < grid.getHeight(); ++y) {
        for (uint32_t x = 0; x < grid.getWidth(); ++x) {
            const auto cell = grid.get(static_cast<int>(x), static_cast<int>(y));
            diagram << (cell ? getMaterialProperties(cell->type).ascii : '.');
        }
        diagram << "\n";
    }

    return diagram.str();
}

std::string GridDiagramGenerator::generateEmojiDiagram(const Grid& grid)
{
    std::ostringstream diagram;

    const uint32_t width = grid.getWidth();
    const uint32_t height = grid.getHeight();

    diagram << "┏";
    for (uint32_t x = 0; x < width; ++x) {
        diagram << "━━";
    }
    diagram << "┓\n";

    for (uint32_t y = 0; y < height; ++y) {
        diagram << "┃";

        for (uint32_t x = 0; x < width; ++x) {
            const auto cell = grid.get(static_cast<int>(x), static_cast<int>(y));
            if (!cell) {
                diagram << "⬜";
                continue;
            }

            switch (cell->type) {
                case MaterialType::SAND:
                    diagram << "🟨";
                    break;
                case MaterialType::WALL:
                    diagram << "🧱";
                    break;
                default:
                    diagram << "❓";
                    break;
            }
        }

        diagram << "┃\n";
    }

    diagram << "┗";
    for (uint32_t x = 0; x < width; ++x) {
        diagram << "━━";
    }
    diagram << "┛\n";

    return diagram.str();
}

} // namespace SandSim
