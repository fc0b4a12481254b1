#include "Material.h"
#include "Grid.h"

#include <array>
#include <cassert>

namespace SandSim {

namespace {

using MovementRule = Vector2i (*)(const Grid& grid, const Vector2i& current);

// Sand checks below, then below-left, then below-right.
const std::array<Vector2i, 3> SAND_CANDIDATE_OFFSETS = { { { 0, 1 }, { -1, 1 }, { 1, 1 } } };

Vector2i sandNextPosition(const Grid& grid, const Vector2i& current)
{
    for (const auto& offset : SAND_CANDIDATE_OFFSETS) {
        const Vector2i candidate = current + offset;
        if (grid.isInBounds(candidate) && grid.isEmpty(candidate)) {
            return candidate;
        }
    }
    return current;
}

Vector2i staticNextPosition(const Grid& /*grid*/, const Vector2i& current)
{
    return current;
}

// Indexed by MaterialType.
const std::array<MovementRule, MATERIAL_TYPE_COUNT> MOVEMENT_RULES = {
    { sandNextPosition, staticNextPosition }
};

} // namespace

Vector2i Material::nextPosition(const Grid& grid, const Vector2i& current) const
{
    const auto index = static_cast<size_t>(type);
    assert(index < MOVEMENT_RULES.size());
    return MOVEMENT_RULES[index](grid, current);
}

Color Material::color() const
{
    return getMaterialColor(type);
}

const char* Material::name() const
{
    return getMaterialName(type);
}

} // namespace SandSim
