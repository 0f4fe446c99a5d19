#ifndef TESSERA_TILE_VECTOR_TILE
#define TESSERA_TILE_VECTOR_TILE

#include <tessera/geo/projection.hpp>
#include <tessera/tile/feature.hpp>
#include <tessera/tile/tile_coord.hpp>
#include <tessera/tile/types.hpp>
#include <tessera/util/geo.hpp>

#include <functional>
#include <string>

namespace tessera {

class TileStore;
struct TileOptions;

// Called with the tile's extent, resolution and projection for loaders that
// need more than the url.
using FeatureLoader = std::function<void(const Extent&, double resolution, const Projection&)>;

// Payload of a source tile holding decoded features.
struct VectorTileData {
    std::string url;
    TileLoadFunction loadFunction;
    FeatureLoader loader;
    Features features;
    Extent extent {{ 0, 0, 0, 0 }};
    double resolution = 0;
    Projection projection = Projection::EPSG3857();
};

namespace vector_tile {

// Creates a source tile keyed by its `url`.
Tile& create(TileStore&,
             const TileCoordinate&,
             TileState,
             const std::string& url,
             TileLoadFunction,
             const TileOptions&);

VectorTileData& data(Tile&);
const Features& getFeatures(const Tile&);

// Only acts on Idle tiles: Loading, then the load function with the url,
// then the feature loader if one is set.
void load(Tile&);

void onLoad(Tile&, Features, const Projection& dataProjection);
void onError(Tile&);
void setFeatures(Tile&, Features);
void setLoader(Tile&, FeatureLoader);

void release(Tile&);

} // namespace vector_tile
} // namespace tessera

#endif
