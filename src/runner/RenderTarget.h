#pragma once

#include "core/Color.h"
#include "core/Vector2.h"

namespace SandSim {

/**
 * Render collaborator driven once per frame by FrameDriver:
 * clear(), fillCell() for every occupied cell, then present().
 *
 * Implementations map a grid coordinate to a screen rectangle of their cell
 * size.
 */
class RenderTarget {
public:
    virtual ~RenderTarget() = default;

    virtual void clear() = 0;
    virtual void fillCell(const Vector2i& cell, const Color& color) = 0;
    virtual void present() = 0;
};

} // namespace SandSim
