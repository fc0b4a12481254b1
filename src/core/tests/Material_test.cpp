#include "core/Grid.h"
#include "core/Material.h"
#include "core/MaterialType.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace SandSim;

TEST(MaterialTest, SandPrefersStraightDown)
{
    Grid grid(3, 3);
    EXPECT_EQ(Material::sand().nextPosition(grid, { 1, 0 }), (Vector2i{ 1, 1 }));
}

TEST(MaterialTest, SandDecisionReadsTheGridWithoutChangingIt)
{
    Grid grid(3, 3);
    grid.set(1, 0, Material::sand());
    const Grid before = grid;

    const Vector2i next = grid.get(1, 0)->nextPosition(grid, { 1, 0 });

    EXPECT_EQ(next, (Vector2i{ 1, 1 }));
    EXPECT_EQ(grid, before);
}

TEST(MaterialTest, SandTreatsOffGridCandidatesAsBlocked)
{
    Grid grid(1, 2);
    grid.set(0, 1, Material::wall());

    EXPECT_EQ(Material::sand().nextPosition(grid, { 0, 0 }), (Vector2i{ 0, 0 }));
    EXPECT_EQ(Material::sand().nextPosition(grid, { 0, 1 }), (Vector2i{ 0, 1 }));
}

TEST(MaterialTest, WallAlwaysStays)
{
    Grid grid(3, 3);
    EXPECT_EQ(Material::wall().nextPosition(grid, { 1, 0 }), (Vector2i{ 1, 0 }));
}

TEST(MaterialTest, ColorsAreConstantPerType)
{
    EXPECT_EQ(Material::sand().color(), (Color{ 198, 178, 128 }));
    EXPECT_EQ(Material::wall().color(), (Color{ 110, 110, 120 }));
    EXPECT_EQ(Material::sand().color().toHexString(), "#c6b280");
}

TEST(MaterialTest, CloneIsEqualAndIndependent)
{
    Material original = Material::sand();
    Material copy = original.clone();
    EXPECT_EQ(copy, original);

    copy.type = MaterialType::WALL;
    EXPECT_EQ(original.type, MaterialType::SAND);
}

TEST(MaterialTypeTest, NamesRoundTripCaseInsensitively)
{
    EXPECT_STREQ(getMaterialName(MaterialType::SAND), "SAND");
    EXPECT_STREQ(getMaterialName(MaterialType::WALL), "WALL");

    EXPECT_EQ(materialTypeFromName("sand"), MaterialType::SAND);
    EXPECT_EQ(materialTypeFromName("Wall"), MaterialType::WALL);
    EXPECT_FALSE(materialTypeFromName("lava").has_value());
}

TEST(MaterialTypeTest, JsonUsesMaterialNames)
{
    nlohmann::json j = MaterialType::WALL;
    EXPECT_EQ(j, "WALL");
    EXPECT_EQ(nlohmann::json("sand").get<MaterialType>(), MaterialType::SAND);
    EXPECT_THROW(nlohmann::json("lava").get<MaterialType>(), std::runtime_error);
}
