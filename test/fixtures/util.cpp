#include "util.hpp"

#include <tessera/tile/image_tile.hpp>
#include <tessera/tile/vector_tile.hpp>

#include <cmath>

namespace tessera {
namespace test {

Tile& createImageTile(TileStore& store,
                      const TileCoordinate& coord,
                      TileState state,
                      const std::string& src,
                      double transition) {
    TileOptions options;
    options.transition = transition;
    return image_tile::create(store, coord, state, src, nullptr, options);
}

Tile& createVectorTile(TileStore& store,
                       const TileCoordinate& coord,
                       const std::string& url,
                       TileState state) {
    return vector_tile::create(store, coord, state, url, nullptr, TileOptions());
}

std::shared_ptr<const TileGrid> createPowerOfTwoGrid(int32_t maxZoom) {
    TileGrid::Options options;
    const double size = 256 * std::pow(2.0, maxZoom);
    options.extent = Extent {{ 0, 0, size, size }};
    for (int32_t z = 0; z <= maxZoom; ++z) {
        options.resolutions.push_back(std::pow(2.0, maxZoom - z));
    }
    return std::make_shared<const TileGrid>(std::move(options));
}

TileLoadFunction LoadRecorder::function() {
    return [this](Tile&, const std::string& url) {
        urls.push_back(url);
    };
}

::testing::AssertionResult extentNear(const Extent& expected, const Extent& actual, double tolerance) {
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (std::abs(expected[i] - actual[i]) > tolerance) {
            return ::testing::AssertionFailure()
                << "[" << actual[0] << ", " << actual[1] << ", " << actual[2] << ", " << actual[3]
                << "] differs from [" << expected[0] << ", " << expected[1] << ", " << expected[2]
                << ", " << expected[3] << "] at " << i;
        }
    }
    return ::testing::AssertionSuccess();
}

} // namespace test
} // namespace tessera
