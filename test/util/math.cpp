#include "../fixtures/util.hpp"

#include <tessera/util/extent.hpp>
#include <tessera/util/math.hpp>

#include <cmath>

using namespace tessera;

TEST(Math, Clamp) {
    EXPECT_EQ(0, util::clamp(-3, 0, 10));
    EXPECT_EQ(10, util::clamp(12, 0, 10));
    EXPECT_EQ(5, util::clamp(5, 0, 10));
}

TEST(Math, Modulo) {
    EXPECT_DOUBLE_EQ(1, util::modulo(7, 3));
    EXPECT_DOUBLE_EQ(2, util::modulo(-1, 3));
    EXPECT_DOUBLE_EQ(-1, util::modulo(2, -3));
    EXPECT_DOUBLE_EQ(0, util::modulo(-6, 3));
}

TEST(Math, FloorDiv) {
    EXPECT_EQ(2, util::floorDiv(5, 2));
    EXPECT_EQ(-3, util::floorDiv(-5, 2));
    EXPECT_EQ(-1, util::floorDiv(-1, 2));
    EXPECT_EQ(-2, util::floorDiv(-4, 2));
}

TEST(Math, RoundingToDecimals) {
    EXPECT_DOUBLE_EQ(3, util::roundHalfUp(2.5));
    EXPECT_DOUBLE_EQ(-2, util::roundHalfUp(-2.5));
    EXPECT_DOUBLE_EQ(1.23, util::toFixed(1.2345, 2));

    EXPECT_DOUBLE_EQ(3, util::floor(2.9999999999, 5));
    EXPECT_DOUBLE_EQ(2, util::floor(2.99, 5));
    EXPECT_DOUBLE_EQ(3, util::ceil(3.0000000001, 5));
    EXPECT_DOUBLE_EQ(4, util::ceil(3.01, 5));
    EXPECT_DOUBLE_EQ(3, util::round(2.9999999, 5));
}

TEST(Math, LinearFindNearest) {
    const std::vector<double> arr { 8, 4, 2, 1 };

    EXPECT_EQ(0u, util::linearFindNearest(arr, 10, 0));
    EXPECT_EQ(3u, util::linearFindNearest(arr, 0.5, 0));
    EXPECT_EQ(1u, util::linearFindNearest(arr, 4, 0));

    EXPECT_EQ(2u, util::linearFindNearest(arr, 2.9, 0));
    EXPECT_EQ(1u, util::linearFindNearest(arr, 3.1, 0));
    EXPECT_EQ(1u, util::linearFindNearest(arr, 3, 1));
    EXPECT_EQ(2u, util::linearFindNearest(arr, 3, -1));
    EXPECT_EQ(1u, util::linearFindNearest(arr, 4, 1));
    EXPECT_EQ(1u, util::linearFindNearest(arr, 4, -1));

    EXPECT_EQ(0u, util::linearFindNearest({}, 3, 0));
}

TEST(Math, LinearFindNearestWithFunction) {
    const std::vector<double> arr { 8, 4, 2, 1 };
    const util::NearestDirectionFunction preferLow = [](double, double, double) { return -1; };
    const util::NearestDirectionFunction undecided = [](double, double, double) { return 0; };

    EXPECT_EQ(2u, util::linearFindNearest(arr, 3.9, preferLow));
    EXPECT_EQ(1u, util::linearFindNearest(arr, 3.9, undecided));
    EXPECT_EQ(1u, util::linearFindNearest(arr, 4, preferLow));
}

TEST(Math, IsSorted) {
    const auto descending = [](double a, double b) { return b - a; };
    EXPECT_TRUE(util::isSorted({ 8, 4, 2 }, descending, true));
    EXPECT_FALSE(util::isSorted({ 8, 4, 4 }, descending, true));
    EXPECT_TRUE(util::isSorted({ 8, 4, 4 }, descending, false));
    EXPECT_FALSE(util::isSorted({ 4, 8 }, descending, false));
    EXPECT_TRUE(util::isSorted({}, descending, true));
}

TEST(Extent, Empty) {
    Extent empty = extent::createEmpty();
    EXPECT_TRUE(extent::isEmpty(empty));

    extent::extendCoordinate(empty, Coordinate {{ 2, 3 }});
    EXPECT_FALSE(extent::isEmpty(empty));
    EXPECT_TRUE(test::extentNear(Extent {{ 2, 3, 2, 3 }}, empty));

    extent::extendCoordinate(empty, Coordinate {{ -1, 5 }});
    EXPECT_TRUE(test::extentNear(Extent {{ -1, 3, 2, 5 }}, empty));
}

TEST(Extent, Measurements) {
    const Extent area {{ -10, 0, 30, 20 }};
    EXPECT_DOUBLE_EQ(40, extent::getWidth(area));
    EXPECT_DOUBLE_EQ(20, extent::getHeight(area));
    EXPECT_EQ((Coordinate {{ 10, 10 }}), extent::getCenter(area));
    EXPECT_EQ((Coordinate {{ -10, 20 }}), extent::getTopLeft(area));
    EXPECT_EQ((Coordinate {{ -10, 0 }}), extent::getCorner(area, Corner::BottomLeft));
    EXPECT_EQ((Coordinate {{ 30, 0 }}), extent::getCorner(area, Corner::BottomRight));
    EXPECT_EQ((Coordinate {{ 30, 20 }}), extent::getCorner(area, Corner::TopRight));
}

TEST(Extent, Containment) {
    const Extent area {{ 0, 0, 10, 10 }};
    EXPECT_TRUE(extent::containsXY(area, 0, 10));
    EXPECT_TRUE(extent::containsCoordinate(area, Coordinate {{ 5, 5 }}));
    EXPECT_FALSE(extent::containsXY(area, 10.5, 5));
}

TEST(Extent, Intersection) {
    const Extent a {{ 0, 0, 10, 10 }};
    EXPECT_TRUE(extent::intersects(a, Extent {{ 10, 10, 20, 20 }}));
    EXPECT_FALSE(extent::intersects(a, Extent {{ 11, 0, 20, 10 }}));

    EXPECT_TRUE(test::extentNear(Extent {{ 5, 2, 10, 10 }},
                                 extent::getIntersection(a, Extent {{ 5, 2, 20, 20 }})));
    EXPECT_TRUE(extent::isEmpty(extent::getIntersection(a, Extent {{ 11, 11, 20, 20 }})));
}

TEST(Extent, Buffer) {
    const Extent a {{ 0, 0, 10, 10 }};
    EXPECT_TRUE(test::extentNear(Extent {{ -1, -1, 11, 11 }}, extent::buffer(a, 1)));
    EXPECT_TRUE(test::extentNear(Extent {{ 2, 2, 8, 8 }}, extent::buffer(a, -2)));
}
