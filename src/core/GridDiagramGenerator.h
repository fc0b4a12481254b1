#ifndef SANDSIM_GRID_DIAGRAM_GENERATOR_H
#define SANDSIM_GRID_DIAGRAM_GENERATOR_H

#include <string>

namespace SandSim {

class Grid;

class GridDiagramGenerator {
public:
    // One character per cell, '.' for empty, rows separated by '\n'.
    static std::string generateAsciiDiagram(const Grid& grid);

    // Emoji cells inside a box border.
    static std::string generateEmojiDiagram(const Grid& grid);
};

} // namespace SandSim

#endif // SANDSIM_GRID_DIAGRAM_GENERATOR_H
