#include "MaterialType.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cctype>
#include <stdexcept>

namespace SandSim {

// Material property database, indexed by MaterialType.
static const std::array<MaterialProperties, MATERIAL_TYPE_COUNT> MATERIAL_PROPERTIES = {
    { // ========== SAND ==========
      { .color = { 198, 178, 128 }, .ascii = '#' },

      // ========== WALL ==========
      { .color = { 110, 110, 120 }, .ascii = '=' } }
};

// Material name lookup table.
static const std::array<const char*, MATERIAL_TYPE_COUNT> MATERIAL_NAMES = { { "SAND", "WALL" } };

const MaterialProperties& getMaterialProperties(MaterialType type)
{
    const auto index = static_cast<size_t>(type);
    assert(index < MATERIAL_PROPERTIES.size());
    return MATERIAL_PROPERTIES[index];
}

Color getMaterialColor(MaterialType type)
{
    return getMaterialProperties(type).color;
}

const char* getMaterialName(MaterialType type)
{
    const auto index = static_cast<size_t>(type);
    assert(index < MATERIAL_NAMES.size());
    return MATERIAL_NAMES[index];
}

std::optional<MaterialType> materialTypeFromName(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    for (size_t i = 0; i < MATERIAL_NAMES.size(); ++i) {
        if (upper == MATERIAL_NAMES[i]) {
            return static_cast<MaterialType>(i);
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, MaterialType type)
{
    j = getMaterialName(type);
}

void from_json(const nlohmann::json& j, MaterialType& type)
{
    if (!j.is_string()) {
        throw std::runtime_error("MaterialType::from_json: JSON value must be a string");
    }

    std::string name = j.get<std::string>();
    auto parsed = materialTypeFromName(name);
    if (!parsed) {
        throw std::runtime_error("MaterialType::from_json: Unknown material type '" + name + "'");
    }
    type = *parsed;
}

} // namespace SandSim
