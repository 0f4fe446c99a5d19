#include <tessera/tile/tile_grid_factory.hpp>
#include <tessera/geo/projection.hpp>
#include <tessera/util/exception.hpp>
#include <tessera/util/extent.hpp>

#include <algorithm>
#include <cmath>

using namespace tessera;

std::shared_ptr<const TileGrid> tile_grid::createXYZ(const XYZOptions& xyz) {
    const Extent area = xyz.extent ? *xyz.extent : *Projection::EPSG3857().getExtent();

    TileGrid::Options options;
    options.extent = area;
    options.minZoom = xyz.minZoom;
    options.tileSize = xyz.tileSize;
    options.resolutions = resolutionsFromExtent(area, xyz.maxZoom, xyz.tileSize, xyz.maxResolution);
    return std::make_shared<const TileGrid>(std::move(options));
}

std::shared_ptr<const TileGrid> tile_grid::createForExtent(const Extent& area,
                                                           int32_t maxZoom,
                                                           Size tileSize,
                                                           Corner corner) {
    TileGrid::Options options;
    options.extent = area;
    options.origin = extent::getCorner(area, corner);
    options.resolutions = resolutionsFromExtent(area, maxZoom, tileSize);
    options.tileSize = tileSize;
    return std::make_shared<const TileGrid>(std::move(options));
}

std::shared_ptr<const TileGrid> tile_grid::createForProjection(const Projection& projection,
                                                               int32_t maxZoom,
                                                               Size tileSize,
                                                               Corner corner) {
    return createForExtent(extentFromProjection(projection), maxZoom, tileSize, corner);
}

Extent tile_grid::extentFromProjection(const Projection& projection) {
    const auto mpu = projection.getMetersPerUnit();
    if (!mpu) {
        throw util::MisuseException("Unknown units for projection " + projection.getCode());
    }
    if (projection.getExtent()) {
        return *projection.getExtent();
    }
    const double half = (180 * *metersPerUnit(Units::Degrees)) / *mpu;
    return {{ -half, -half, half, half }};
}

std::vector<double> tile_grid::resolutionsFromExtent(const Extent& area,
                                                     int32_t maxZoom,
                                                     Size tileSize,
                                                     boost::optional<double> maxResolution) {
    const double resolution = (maxResolution && *maxResolution > 0)
        ? *maxResolution
        : std::max(extent::getWidth(area) / tileSize[0], extent::getHeight(area) / tileSize[1]);

    std::vector<double> resolutions;
    resolutions.reserve(maxZoom + 1);
    for (int32_t z = 0; z <= maxZoom; ++z) {
        resolutions.push_back(resolution / std::pow(2, z));
    }
    return resolutions;
}

TileCoordinate tile_grid::wrapX(const TileGrid& grid, const TileCoordinate& coord, const Projection& projection) {
    Coordinate center = grid.getTileCoordCenter(coord);
    const Extent projectionExtent = extentFromProjection(projection);
    if (!extent::containsCoordinate(projectionExtent, center)) {
        const double worldWidth = extent::getWidth(projectionExtent);
        const double worldsAway = std::ceil((projectionExtent[0] - center[0]) / worldWidth);
        center[0] += worldWidth * worldsAway;
        return grid.getTileCoordForCoordAndZ(center, coord.z);
    }
    return coord;
}
