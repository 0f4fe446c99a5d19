#include <tessera/tile/tile_grid.hpp>
#include <tessera/util/constants.hpp>
#include <tessera/util/exception.hpp>
#include <tessera/util/extent.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace tessera;

TileGrid::TileGrid(Options options)
    : minZoom(options.minZoom),
      maxZoom(static_cast<int32_t>(options.resolutions.size()) - 1),
      resolutions(std::move(options.resolutions)),
      origin(std::move(options.origin)),
      origins(std::move(options.origins)),
      tileSizes(std::move(options.tileSizes)),
      extent(std::move(options.extent)) {
    if (resolutions.empty()) {
        throw util::TileGridException("`resolutions` must not be empty");
    }

    const bool sorted = util::isSorted(resolutions, [](double a, double b) { return b - a; }, true);
    if (!sorted) {
        throw util::TileGridException("`resolutions` must be sorted in descending order");
    }

    // A uniform zoom factor enables the integer shortcuts for parent and
    // child lookups. Per zoom origins may shift levels against each other.
    if (!origins) {
        for (std::size_t i = 0; i + 1 < resolutions.size(); ++i) {
            const double factor = resolutions[i] / resolutions[i + 1];
            if (!zoomFactor) {
                zoomFactor = factor;
            } else if (factor != *zoomFactor) {
                zoomFactor = boost::none;
                break;
            }
        }
    }

    if (origins && origins->size() != resolutions.size()) {
        throw util::TileGridException("Number of `origins` and `resolutions` must be equal");
    }

    if (extent && !origin && !origins) {
        origin = extent::getTopLeft(*extent);
    }

    if (bool(origin) == bool(origins)) {
        throw util::TileGridException("Either `origin` or `origins` must be configured, never both");
    }

    if (tileSizes && tileSizes->size() != resolutions.size()) {
        throw util::TileGridException("Number of `tileSizes` and `resolutions` must be equal");
    }

    if (options.tileSize) {
        tileSize = options.tileSize;
    } else if (!tileSizes) {
        tileSize = Size {{ util::DEFAULT_TILE_SIZE, util::DEFAULT_TILE_SIZE }};
    }

    if (bool(tileSize) == bool(tileSizes)) {
        throw util::TileGridException("Either `tileSize` or `tileSizes` must be configured, never both");
    }

    if (options.sizes) {
        fullTileRanges = std::vector<boost::optional<TileRange>>();
        fullTileRanges->reserve(options.sizes->size());
        for (std::size_t z = 0; z < options.sizes->size(); ++z) {
            const Size& size = (*options.sizes)[z];
            TileRange range(std::min(0, size[0]), std::max(size[0] - 1, -1),
                            std::min(0, size[1]), std::max(size[1] - 1, -1));
            if (extent && static_cast<int32_t>(z) <= maxZoom) {
                const TileRange restricted = getTileRangeForExtentAndZ(*extent, static_cast<int32_t>(z));
                range.minX = std::max(restricted.minX, range.minX);
                range.maxX = std::min(restricted.maxX, range.maxX);
                range.minY = std::max(restricted.minY, range.minY);
                range.maxY = std::min(restricted.maxY, range.maxY);
            }
            fullTileRanges->emplace_back(range);
        }
    } else if (extent) {
        calculateTileRanges(*extent);
    }
}

void TileGrid::forEachTileCoord(const Extent& area, int32_t z, const TileCoordCallback& callback) const {
    const TileRange range = getTileRangeForExtentAndZ(area, z);
    for (int32_t x = range.minX; x <= range.maxX; ++x) {
        for (int32_t y = range.minY; y <= range.maxY; ++y) {
            callback(TileCoordinate(z, x, y));
        }
    }
}

bool TileGrid::forEachTileCoordParentTileRange(const TileCoordinate& coord,
                                               const TileRangeCallback& callback) const {
    const bool halving = zoomFactor && *zoomFactor == 2;
    const Extent coordExtent = halving ? Extent() : getTileCoordExtent(coord);

    int32_t x = coord.x;
    int32_t y = coord.y;
    TileRange range;
    for (int32_t z = coord.z - 1; z >= minZoom; --z) {
        if (halving) {
            x = util::floorDiv(x, 2);
            y = util::floorDiv(y, 2);
            createOrUpdate(x, x, y, y, range);
        } else {
            getTileRangeForExtentAndZ(coordExtent, z, range);
        }
        if (callback(z, range)) {
            return true;
        }
    }
    return false;
}

const Coordinate& TileGrid::getOrigin(int32_t z) const {
    if (origin) {
        return *origin;
    }
    return origins->at(z);
}

double TileGrid::getResolution(int32_t z) const {
    return resolutions.at(z);
}

Size TileGrid::getTileSize(int32_t z) const {
    if (tileSize) {
        return *tileSize;
    }
    return tileSizes->at(z);
}

boost::optional<TileRange> TileGrid::getTileCoordChildTileRange(const TileCoordinate& coord) const {
    if (coord.z >= maxZoom) {
        return boost::none;
    }
    if (zoomFactor && *zoomFactor == 2) {
        const int32_t minX = coord.x * 2;
        const int32_t minY = coord.y * 2;
        return TileRange(minX, minX + 1, minY, minY + 1);
    }
    return getTileRangeForExtentAndZ(getTileCoordExtent(coord), coord.z + 1);
}

boost::optional<TileRange> TileGrid::getTileRangeForTileCoordAndZ(const TileCoordinate& coord, int32_t z) const {
    if (z > maxZoom || z < minZoom) {
        return boost::none;
    }

    if (z == coord.z) {
        return TileRange(coord.x, coord.x, coord.y, coord.y);
    }

    if (zoomFactor) {
        const double factor = std::pow(*zoomFactor, z - coord.z);
        const auto minX = static_cast<int32_t>(std::floor(coord.x * factor));
        const auto minY = static_cast<int32_t>(std::floor(coord.y * factor));
        if (z < coord.z) {
            return TileRange(minX, minX, minY, minY);
        }
        const auto maxX = static_cast<int32_t>(std::floor(factor * (coord.x + 1))) - 1;
        const auto maxY = static_cast<int32_t>(std::floor(factor * (coord.y + 1))) - 1;
        return TileRange(minX, maxX, minY, maxY);
    }

    return getTileRangeForExtentAndZ(getTileCoordExtent(coord), z);
}

TileRange TileGrid::getTileRangeForExtentAndZ(const Extent& area, int32_t z) const {
    TileRange range;
    return getTileRangeForExtentAndZ(area, z, range);
}

TileRange& TileGrid::getTileRangeForExtentAndZ(const Extent& area, int32_t z, TileRange& dest) const {
    const TileCoordinate min = getTileCoordForXYAndZ(area[0], area[3], z, false);
    const TileCoordinate max = getTileCoordForXYAndZ(area[2], area[1], z, true);
    return createOrUpdate(min.x, max.x, min.y, max.y, dest);
}

Coordinate TileGrid::getTileCoordCenter(const TileCoordinate& coord) const {
    const Coordinate& o = getOrigin(coord.z);
    const double resolution = getResolution(coord.z);
    const Size size = getTileSize(coord.z);
    return {{
        o[0] + (coord.x + 0.5) * size[0] * resolution,
        o[1] - (coord.y + 0.5) * size[1] * resolution,
    }};
}

Extent TileGrid::getTileCoordExtent(const TileCoordinate& coord) const {
    const Coordinate& o = getOrigin(coord.z);
    const double resolution = getResolution(coord.z);
    const Size size = getTileSize(coord.z);
    const double minX = o[0] + double(coord.x) * size[0] * resolution;
    const double minY = o[1] - (double(coord.y) + 1) * size[1] * resolution;
    return {{ minX, minY, minX + size[0] * resolution, minY + size[1] * resolution }};
}

double TileGrid::getTileCoordResolution(const TileCoordinate& coord) const {
    return resolutions.at(coord.z);
}

TileCoordinate TileGrid::getTileCoordForCoordAndResolution(const Coordinate& coordinate, double resolution) const {
    return getTileCoordForXYAndResolution(coordinate[0], coordinate[1], resolution, false);
}

TileCoordinate TileGrid::getTileCoordForCoordAndZ(const Coordinate& coordinate, int32_t z) const {
    return getTileCoordForXYAndZ(coordinate[0], coordinate[1], z, false);
}

boost::optional<TileRange> TileGrid::getFullTileRange(int32_t z) const {
    if (!fullTileRanges) {
        if (extent) {
            return getTileRangeForExtentAndZ(*extent, z);
        }
        return boost::none;
    }
    if (z < 0 || static_cast<std::size_t>(z) >= fullTileRanges->size()) {
        return boost::none;
    }
    return (*fullTileRanges)[z];
}

int32_t TileGrid::getZForResolution(double resolution, int direction) const {
    const auto z = static_cast<int32_t>(util::linearFindNearest(resolutions, resolution, direction));
    return util::clamp(z, minZoom, maxZoom);
}

int32_t TileGrid::getZForResolution(double resolution, const util::NearestDirectionFunction& direction) const {
    const auto z = static_cast<int32_t>(util::linearFindNearest(resolutions, resolution, direction));
    return util::clamp(z, minZoom, maxZoom);
}

namespace {

// Deep zoom levels of large grids have more columns than an int32_t holds.
int32_t toTileIndex(double value) {
    return static_cast<int32_t>(util::clamp<double>(value,
                                                    std::numeric_limits<int32_t>::min(),
                                                    std::numeric_limits<int32_t>::max()));
}

// Edge intersections go to the higher index, or to the lower one with the
// reversed policy so an extent ending on a boundary does not pull in the
// next column.
int32_t snap(double value, bool reverseIntersectionPolicy) {
    if (reverseIntersectionPolicy) {
        return toTileIndex(util::ceil(value, util::DECIMALS) - 1);
    }
    return toTileIndex(util::floor(value, util::DECIMALS));
}

}

TileCoordinate TileGrid::getTileCoordForXYAndZ(double x, double y, int32_t z,
                                               bool reverseIntersectionPolicy) const {
    const Coordinate& o = getOrigin(z);
    const double resolution = getResolution(z);
    const Size size = getTileSize(z);

    const double tileX = (x - o[0]) / resolution / size[0];
    const double tileY = (o[1] - y) / resolution / size[1];

    return TileCoordinate(z, snap(tileX, reverseIntersectionPolicy), snap(tileY, reverseIntersectionPolicy));
}

TileCoordinate TileGrid::getTileCoordForXYAndResolution(double x, double y, double resolution,
                                                        bool reverseIntersectionPolicy) const {
    const int32_t z = getZForResolution(resolution);
    const double scale = resolution / getResolution(z);
    const Coordinate& o = getOrigin(z);
    const Size size = getTileSize(z);

    const double tileX = (scale * (x - o[0])) / resolution / size[0];
    const double tileY = (scale * (o[1] - y)) / resolution / size[1];

    return TileCoordinate(z, snap(tileX, reverseIntersectionPolicy), snap(tileY, reverseIntersectionPolicy));
}

void TileGrid::calculateTileRanges(const Extent& area) {
    fullTileRanges = std::vector<boost::optional<TileRange>>(resolutions.size());
    for (int32_t z = minZoom; z <= maxZoom; ++z) {
        (*fullTileRanges)[z] = getTileRangeForExtentAndZ(area, z);
    }
}
