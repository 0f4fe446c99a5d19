#ifndef TESSERA_TILE_TILE_GRID_FACTORY
#define TESSERA_TILE_TILE_GRID_FACTORY

#include <tessera/tile/tile_grid.hpp>
#include <tessera/util/constants.hpp>

#include <boost/optional.hpp>

#include <memory>
#include <vector>

namespace tessera {

class Projection;

namespace tile_grid {

// A standard XYZ tiling scheme: origin at the top-left corner of the extent,
// zoom factor 2.
struct XYZOptions {
    // Defaults to the EPSG:3857 extent.
    boost::optional<Extent> extent;
    // Resolution at level zero. Defaults to one tile covering the extent.
    boost::optional<double> maxResolution;
    int32_t maxZoom = util::DEFAULT_MAX_ZOOM;
    int32_t minZoom = 0;
    Size tileSize = {{ util::DEFAULT_TILE_SIZE, util::DEFAULT_TILE_SIZE }};
};

std::shared_ptr<const TileGrid> createXYZ(const XYZOptions& = XYZOptions());

std::shared_ptr<const TileGrid> createForExtent(const Extent&,
                                                int32_t maxZoom = util::DEFAULT_MAX_ZOOM,
                                                Size tileSize = {{ util::DEFAULT_TILE_SIZE, util::DEFAULT_TILE_SIZE }},
                                                Corner = Corner::TopLeft);

std::shared_ptr<const TileGrid> createForProjection(const Projection&,
                                                    int32_t maxZoom = util::DEFAULT_MAX_ZOOM,
                                                    Size tileSize = {{ util::DEFAULT_TILE_SIZE, util::DEFAULT_TILE_SIZE }},
                                                    Corner = Corner::TopLeft);

// The projection's extent, or a global extent of +-180 degrees converted to
// projection units. Throws util::MisuseException for projections whose
// units have no ground distance.
Extent extentFromProjection(const Projection&);

// Resolutions for `maxZoom + 1` levels halving from `maxResolution`, or from
// the resolution at which one tile fits the extent.
std::vector<double> resolutionsFromExtent(const Extent&,
                                          int32_t maxZoom = util::DEFAULT_MAX_ZOOM,
                                          Size tileSize = {{ util::DEFAULT_TILE_SIZE, util::DEFAULT_TILE_SIZE }},
                                          boost::optional<double> maxResolution = boost::none);

// Shifts a tile that lies outside the projection extent back into the
// world it repeats.
TileCoordinate wrapX(const TileGrid&, const TileCoordinate&, const Projection&);

} // namespace tile_grid
} // namespace tessera

#endif
