#ifndef TESSERA_TILE_TILE_LOADER
#define TESSERA_TILE_TILE_LOADER

#include <tessera/tile/feature.hpp>
#include <tessera/tile/types.hpp>
#include <tessera/util/image.hpp>

#include <boost/optional.hpp>

#include <functional>
#include <string>

namespace tessera {

namespace util {
class RunLoop;
}

namespace tile_loader {

// Fetchers may call back on any thread, exactly once. None reports a failed
// fetch.
using ImageCallback = std::function<void(boost::optional<util::Image>)>;
using ImageFetcher = std::function<void(const std::string& url, ImageCallback)>;

using FeaturesCallback = std::function<void(boost::optional<Features>)>;
using FeaturesFetcher = std::function<void(const std::string& url, FeaturesCallback)>;

// Load functions that hand fetch results back to `loop`, where they complete
// the tile. Results for tiles that were freed or are no longer Loading are
// dropped. The loop and the tile stores must outlive pending fetches.
TileLoadFunction imageLoadFunction(util::RunLoop& loop, ImageFetcher);
TileLoadFunction vectorLoadFunction(util::RunLoop& loop, FeaturesFetcher);

} // namespace tile_loader
} // namespace tessera

#endif
