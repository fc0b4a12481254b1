#include "core/Vector2.h"
#include <gtest/gtest.h>

using namespace SandSim;

TEST(Vector2iTest, Arithmetic)
{
    Vector2i a{ 3, -2 };
    Vector2i b{ 1, 4 };

    EXPECT_EQ(a + b, (Vector2i{ 4, 2 }));
    EXPECT_EQ(a * 2, (Vector2i{ 6, -4 }));
    EXPECT_NE(a, b);
}

TEST(Vector2iTest, ChebyshevDistanceCountsKingMoves)
{
    Vector2i origin{ 5, 5 };
    EXPECT_EQ(origin.chebyshevDistance({ 5, 5 }), 0);
    EXPECT_EQ(origin.chebyshevDistance({ 4, 6 }), 1);
    EXPECT_EQ(origin.chebyshevDistance({ 6, 6 }), 1);
    EXPECT_EQ(origin.chebyshevDistance({ 5, 7 }), 2);
}

TEST(Vector2iTest, ToString)
{
    EXPECT_EQ((Vector2i{ 7, -1 }).toString(), "(7, -1)");
}
