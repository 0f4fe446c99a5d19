#ifndef TESSERA_TILE_TILE_GRID
#define TESSERA_TILE_TILE_GRID

#include <tessera/tile/tile_coord.hpp>
#include <tessera/tile/tile_range.hpp>
#include <tessera/util/geo.hpp>
#include <tessera/util/math.hpp>

#include <boost/optional.hpp>

#include <functional>
#include <vector>

namespace tessera {

// Maps map coordinates to tile coordinates for a pyramid of resolutions.
// The array index of each resolution is its zoom level.
class TileGrid {
public:
    struct Options {
        // No tiles outside this extent are requested. When neither `origin`
        // nor `origins` is set, the top-left corner becomes the origin.
        boost::optional<Extent> extent;
        int32_t minZoom = 0;
        boost::optional<Coordinate> origin;
        // One origin per resolution.
        boost::optional<std::vector<Coordinate>> origins;
        // Must be sorted in strictly descending order.
        std::vector<double> resolutions;
        // Number of tile columns and rows per zoom level.
        boost::optional<std::vector<Size>> sizes;
        // Defaults to 256x256 unless `tileSizes` is given.
        boost::optional<Size> tileSize;
        boost::optional<std::vector<Size>> tileSizes;
    };

    using TileCoordCallback = std::function<void(const TileCoordinate&)>;
    using TileRangeCallback = std::function<bool(int32_t z, const TileRange&)>;

    // Throws util::TileGridException when the options are inconsistent.
    explicit TileGrid(Options);

    void forEachTileCoord(const Extent&, int32_t z, const TileCoordCallback&) const;

    // Calls `callback` with the range covering `coord` at every lower zoom
    // level, from z - 1 down to the minimum zoom. Returns true as soon as
    // the callback does.
    bool forEachTileCoordParentTileRange(const TileCoordinate& coord,
                                         const TileRangeCallback& callback) const;

    const boost::optional<Extent>& getExtent() const { return extent; }
    int32_t getMaxZoom() const { return maxZoom; }
    int32_t getMinZoom() const { return minZoom; }
    const Coordinate& getOrigin(int32_t z) const;
    double getResolution(int32_t z) const;
    const std::vector<double>& getResolutions() const { return resolutions; }
    Size getTileSize(int32_t z) const;
    const boost::optional<double>& getZoomFactor() const { return zoomFactor; }

    boost::optional<TileRange> getTileCoordChildTileRange(const TileCoordinate&) const;
    boost::optional<TileRange> getTileRangeForTileCoordAndZ(const TileCoordinate&, int32_t z) const;

    TileRange getTileRangeForExtentAndZ(const Extent&, int32_t z) const;
    TileRange& getTileRangeForExtentAndZ(const Extent&, int32_t z, TileRange& dest) const;

    Coordinate getTileCoordCenter(const TileCoordinate&) const;
    Extent getTileCoordExtent(const TileCoordinate&) const;
    double getTileCoordResolution(const TileCoordinate&) const;

    // Coordinates on a tile boundary are assigned to the higher tile index.
    TileCoordinate getTileCoordForCoordAndResolution(const Coordinate&, double resolution) const;
    TileCoordinate getTileCoordForCoordAndZ(const Coordinate&, int32_t z) const;

    boost::optional<TileRange> getFullTileRange(int32_t z) const;

    // 0 picks the nearest resolution, 1 the nearest coarser one (lower z)
    // and -1 the nearest finer one (higher z).
    int32_t getZForResolution(double resolution, int direction = 0) const;
    int32_t getZForResolution(double resolution, const util::NearestDirectionFunction&) const;

private:
    TileCoordinate getTileCoordForXYAndZ(double x, double y, int32_t z,
                                         bool reverseIntersectionPolicy) const;
    TileCoordinate getTileCoordForXYAndResolution(double x, double y, double resolution,
                                                  bool reverseIntersectionPolicy) const;
    void calculateTileRanges(const Extent&);

    int32_t minZoom;
    int32_t maxZoom;
    std::vector<double> resolutions;
    boost::optional<double> zoomFactor;
    boost::optional<Coordinate> origin;
    boost::optional<std::vector<Coordinate>> origins;
    boost::optional<Size> tileSize;
    boost::optional<std::vector<Size>> tileSizes;
    boost::optional<Extent> extent;
    boost::optional<std::vector<boost::optional<TileRange>>> fullTileRanges;
};

}

#endif
