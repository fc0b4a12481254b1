#include "Color.h"

#include <cstdio>

namespace SandSim {

std::string Color::toHexString() const
{
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", r, g, b);
    return std::string(buffer);
}

} // namespace SandSim
