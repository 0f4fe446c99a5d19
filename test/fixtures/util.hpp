#ifndef TESSERA_TEST_UTIL
#define TESSERA_TEST_UTIL

#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_grid.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/util/geo.hpp>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#define SCOPED_TEST(name) \
    static class name { \
        bool completed = false; \
    public: \
        void finish() { EXPECT_FALSE(completed) << #name " was already completed."; completed = true; } \
        ~name() { if (!completed) std::cerr << "Scoped test " #name " did not complete." << std::endl; } \
    } name;

namespace tessera {
namespace test {

// Image tile that records its load requests instead of fetching anything.
Tile& createImageTile(TileStore&,
                      const TileCoordinate&,
                      TileState state = TileState::Idle,
                      const std::string& src = "",
                      double transition = 0);

// Vector source tile keyed by `url`.
Tile& createVectorTile(TileStore&,
                       const TileCoordinate&,
                       const std::string& url,
                       TileState state = TileState::Idle);

// 256 unit tiles over [0, 0, 256 * 2^maxZoom, ...] with a factor 2 pyramid.
std::shared_ptr<const TileGrid> createPowerOfTwoGrid(int32_t maxZoom);

// Records every load request, in order.
struct LoadRecorder {
    std::vector<std::string> urls;
    TileLoadFunction function();
};

::testing::AssertionResult extentNear(const Extent& expected, const Extent& actual, double tolerance = 1e-6);

} // namespace test
} // namespace tessera

#endif
