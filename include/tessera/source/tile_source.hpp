#ifndef TESSERA_SOURCE_TILE_SOURCE
#define TESSERA_SOURCE_TILE_SOURCE

#include <tessera/geo/projection.hpp>
#include <tessera/source/tile_url_function.hpp>
#include <tessera/tile/canvas_pool.hpp>
#include <tessera/tile/feature.hpp>
#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_cache.hpp>
#include <tessera/tile/tile_grid.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/util/noncopyable.hpp>

#include <boost/optional.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tessera {

enum class SourceKind : uint8_t {
    // One image tile per grid cell.
    Image,
    // Render tiles aggregating the vector source tiles they cover.
    Vector,
};

// Hands out the tiles of one layer's data, keeps them cached and reports
// their loads. Owns every tile it creates.
class TileSource : public Tile::Observer, private util::noncopyable {
public:
    class Observer {
    public:
        virtual ~Observer() = default;

        virtual void onTileLoadStart(Tile&) {}
        virtual void onTileLoadEnd(Tile&) {}
        virtual void onTileLoadError(Tile&) {}

        // The source's key or url scheme changed; tiles need to be requested
        // again.
        virtual void onSourceChanged() {}
    };

    struct Options {
        SourceKind kind = SourceKind::Image;

        // Defaults to a grid for the projection (image sources) or to an XYZ
        // grid of 512 pixel tiles up to zoom 22 (vector sources).
        std::shared_ptr<const TileGrid> tileGrid;
        Projection projection = Projection::EPSG3857();

        // 0 leaves the cache unbounded until updateCacheSize() is called.
        std::size_t cacheSize = 0;
        double transition = util::DEFAULT_TRANSITION;
        bool interpolate = true;
        std::string key;

        // Defaults to false for image sources and to true for vector sources.
        boost::optional<bool> wrapX;

        // Direction handed to TileGrid::getZForResolution() when picking the
        // source zoom for a render tile. Defaults to 0 for image sources and
        // to 1 for vector sources.
        boost::optional<int> zDirection;

        boost::optional<std::string> url;
        std::vector<std::string> urls;
        TileUrlFunction tileUrlFunction;
        TileLoadFunction tileLoadFunction;

        // Canvases for render tiles. A private pool is created if unset.
        std::shared_ptr<CanvasPool> canvasPool;
    };

    explicit TileSource(Options);
    ~TileSource() override;

    SourceKind getKind() const { return kind; }

    void setObserver(Observer*);

    // Returns the cached tile for the cell, or a new one. A cached tile whose
    // key is stale is replaced by a new tile that keeps the old one as its
    // interim tile.
    Tile& getTile(int32_t z, int32_t x, int32_t y, double pixelRatio, const Projection&);

    // The coordinate to request for `coord` after wrapping around the world,
    // or none outside the grid's extent and zoom range.
    boost::optional<TileCoordinate> getTileCoordForTileUrlFunction(const TileCoordinate&,
                                                                   const Projection&);

    // Promotes the cached tile for the cell, if any.
    void useTile(int32_t z, int32_t x, int32_t y);

    void updateCacheSize(std::size_t tileCount);
    bool canExpireCache() const;

    // Frees least recently used tiles not in `usedKeys` (values of
    // Tile::getKey()). Vector sources also keep the source tiles of used
    // render tiles.
    void expireCache(const std::unordered_set<std::string>& usedKeys);

    // Calls `callback` for every Loaded tile of the range at z; a callback
    // returning false marks its tile as not covered. Returns whether the
    // whole range was covered.
    bool forEachLoadedTile(int32_t z, const TileRange&, const std::function<bool(Tile&)>& callback);

    void clear();
    void refresh();

    std::string getKey() const;
    void setKey(const std::string&);

    const std::vector<std::string>& getUrls() const { return urls; }
    void setUrl(const std::string&);
    void setUrls(std::vector<std::string>);

    // Keeps only the cached tiles of the newest zoom level.
    void setTileUrlFunction(TileUrlFunction, boost::optional<std::string> key = boost::none);
    const TileUrlFunction& getTileUrlFunction() const { return tileUrlFunction; }

    // Clears the cache.
    void setTileLoadFunction(TileLoadFunction);
    const TileLoadFunction& getTileLoadFunction() const { return tileLoadFunction; }

    const std::shared_ptr<const TileGrid>& getTileGrid() const { return tileGrid; }

    // Vector sources render onto a grid that shares the source grid's origins
    // and tile sizes but extends down to the maximum zoom level.
    std::shared_ptr<const TileGrid> getTileGridForProjection(const Projection&);

    // Source tiles of a render tile, loading them on the first call.
    const std::vector<TileUID>& getSourceTiles(double pixelRatio, const Projection&, Tile& renderTile);

    // Features of the loaded source tiles at the newest zoom level that
    // intersect `extent`.
    Features getFeaturesInExtent(const Extent&);

    const Projection& getProjection() const { return projection; }
    bool getWrapX() const { return wrapX; }
    TileStore& getStore() { return store; }
    TileCache& getTileCache() { return tileCache; }
    TileCache& getSourceTileCache() { return sourceTileCache; }

    // Tile::Observer
    void onTileChanged(Tile&) override;

private:
    Tile& getImageTile(int32_t z, int32_t x, int32_t y, double pixelRatio, const Projection&);
    Tile& getRenderTile(int32_t z, int32_t x, int32_t y, double pixelRatio, const Projection&);
    Tile& createImageTile(const TileCoordinate&, double pixelRatio, const Projection&);

    void updateRenderTiles(Tile& sourceTile);
    void checkProjection(const Projection&) const;
    void pruneTracking();
    void changed();

    const SourceKind kind;
    const Projection projection;
    std::shared_ptr<const TileGrid> tileGrid;
    std::map<std::string, std::shared_ptr<const TileGrid>> tileGridsForProjection;

    TileOptions tileOptions;
    std::string key;
    bool wrapX;
    int zDirection;

    std::vector<std::string> urls;
    TileUrlFunction tileUrlFunction;
    // Set when no url function was given, so urls generate one.
    bool generateTileUrlFunction;
    TileLoadFunction tileLoadFunction;
    std::shared_ptr<CanvasPool> canvasPool;

    Observer* observer = nullptr;

    // Declared ahead of the caches that refer to it.
    TileStore store;
    TileCache tileCache;
    // Vector sources only: source tiles keyed by url.
    TileCache sourceTileCache;

    // Tiles whose Loading was reported and whose outcome was not yet.
    std::unordered_set<TileUID> tileLoadingKeys;

    // Render tiles waiting on each source tile.
    std::unordered_map<TileUID, std::vector<TileUID>> waitingRenderTiles;
};

}

#endif
