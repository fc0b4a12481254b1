#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace SandSim {

/**
 * 8-bit RGB color handed to render targets.
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& other) const
    {
        return r == other.r && g == other.g && b == other.b;
    }

    bool operator!=(const Color& other) const { return !(*this == other); }

    // "#rrggbb".
    std::string toHexString() const;
};

inline void to_json(nlohmann::json& j, const Color& color)
{
    j = color.toHexString();
}

} // namespace SandSim
