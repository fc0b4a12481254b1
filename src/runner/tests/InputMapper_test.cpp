#include "runner/InputMapper.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace SandSim;

TEST(InputMapperTest, DividesByCellSize)
{
    InputMapper mapper(4, 10, 8);

    EXPECT_EQ(mapper.pixelToCell(0, 0), (Vector2i{ 0, 0 }));
    EXPECT_EQ(mapper.pixelToCell(3, 3), (Vector2i{ 0, 0 }));
    EXPECT_EQ(mapper.pixelToCell(4, 7), (Vector2i{ 1, 1 }));
    EXPECT_EQ(mapper.pixelToCell(39, 31), (Vector2i{ 9, 7 }));
}

TEST(InputMapperTest, ClampsPixelsOutsideTheGrid)
{
    InputMapper mapper(4, 10, 8);

    EXPECT_EQ(mapper.pixelToCell(-1, -1), (Vector2i{ 0, 0 }));
    EXPECT_EQ(mapper.pixelToCell(40, 32), (Vector2i{ 9, 7 }));
    EXPECT_EQ(mapper.pixelToCell(1000, 5), (Vector2i{ 9, 1 }));
}

TEST(InputMapperTest, CellToPixelIsTopLeftCorner)
{
    InputMapper mapper(5, 10, 10);
    EXPECT_EQ(mapper.cellToPixel({ 2, 3 }), (Vector2i{ 10, 15 }));
    EXPECT_EQ(mapper.pixelToCell(10, 15), (Vector2i{ 2, 3 }));
}

TEST(InputMapperTest, PlaceAndEraseProduceCommands)
{
    InputMapper mapper(2, 6, 6);

    PlacementCommand place = mapper.place(5, 9, MaterialType::WALL);
    EXPECT_EQ(place.position, (Vector2i{ 2, 4 }));
    ASSERT_TRUE(place.material.has_value());
    EXPECT_EQ(*place.material, MaterialType::WALL);

    PlacementCommand erase = mapper.erase(0, 0);
    EXPECT_EQ(erase.position, (Vector2i{ 0, 0 }));
    EXPECT_FALSE(erase.material.has_value());
}

TEST(InputMapperTest, RejectsZeroSizes)
{
    EXPECT_THROW(InputMapper(0, 10, 10), std::invalid_argument);
    EXPECT_THROW(InputMapper(4, 0, 10), std::invalid_argument);
}
