#include "../fixtures/util.hpp"

#include <tessera/tile/tile_range.hpp>

#include <sstream>

using namespace tessera;

TEST(TileRange, Contains) {
    const TileRange range(1, 3, 1, 3);
    EXPECT_FALSE(range.contains(TileCoordinate(0, 0, 0)));
    EXPECT_FALSE(range.contains(TileCoordinate(0, 0, 1)));
    EXPECT_TRUE(range.contains(TileCoordinate(0, 1, 1)));
    EXPECT_TRUE(range.contains(TileCoordinate(0, 2, 2)));
    EXPECT_TRUE(range.contains(TileCoordinate(0, 3, 3)));
    EXPECT_FALSE(range.contains(TileCoordinate(0, 3, 4)));
    EXPECT_FALSE(range.contains(TileCoordinate(0, 4, 4)));
    EXPECT_TRUE(range.containsXY(1, 3));
    EXPECT_FALSE(range.containsXY(0, 3));
}

TEST(TileRange, ContainsTileRange) {
    const TileRange range(1, 3, 1, 3);
    EXPECT_TRUE(range.containsTileRange(TileRange(1, 3, 1, 3)));
    EXPECT_TRUE(range.containsTileRange(TileRange(2, 2, 2, 2)));
    EXPECT_FALSE(range.containsTileRange(TileRange(0, 2, 1, 3)));
    EXPECT_FALSE(range.containsTileRange(TileRange(1, 3, 2, 4)));
}

TEST(TileRange, Intersects) {
    const TileRange range(1, 3, 1, 3);
    EXPECT_TRUE(range.intersects(TileRange(0, 1, 0, 1)));
    EXPECT_TRUE(range.intersects(TileRange(3, 5, 3, 5)));
    EXPECT_TRUE(range.intersects(TileRange(2, 2, 0, 5)));
    EXPECT_FALSE(range.intersects(TileRange(4, 5, 0, 5)));
    EXPECT_FALSE(range.intersects(TileRange(0, 5, 4, 5)));
    EXPECT_FALSE(range.intersects(TileRange(-2, 0, 1, 3)));
}

TEST(TileRange, Extend) {
    TileRange range(1, 1, 1, 1);
    range.extend(TileRange(3, 4, -2, 0));
    EXPECT_EQ(TileRange(1, 4, -2, 1), range);
}

TEST(TileRange, Size) {
    const TileRange single(0, 0, 1, 1);
    EXPECT_EQ(1, single.getWidth());
    EXPECT_EQ(1, single.getHeight());

    const TileRange range(0, 3, 1, 2);
    EXPECT_EQ(4, range.getWidth());
    EXPECT_EQ(2, range.getHeight());
    EXPECT_EQ((Size {{ 4, 2 }}), range.getSize());
}

TEST(TileRange, CreateOrUpdate) {
    TileRange range(1, 2, 3, 4);
    TileRange& result = createOrUpdate(5, 6, 7, 8, range);
    EXPECT_EQ(&range, &result);
    EXPECT_EQ(TileRange(5, 6, 7, 8), range);
    EXPECT_NE(TileRange(5, 6, 7, 9), range);
}

TEST(TileRange, Stream) {
    std::ostringstream os;
    os << TileRange(0, 1, 2, 3);
    EXPECT_EQ("[0..1, 2..3]", os.str());
}
