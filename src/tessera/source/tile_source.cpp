#include <tessera/source/tile_source.hpp>
#include <tessera/tile/tile_grid_factory.hpp>
#include <tessera/platform/log.hpp>
#include <tessera/util/exception.hpp>
#include <tessera/util/extent.hpp>
#include <tessera/util/std.hpp>

#include <algorithm>

using namespace tessera;

namespace {

const int32_t VectorMaxZoom = 22;
const int32_t VectorTileSize = 512;

std::shared_ptr<const TileGrid> defaultTileGrid(SourceKind kind, const Projection& projection) {
    if (kind == SourceKind::Vector) {
        tile_grid::XYZOptions options;
        options.extent = tile_grid::extentFromProjection(projection);
        options.maxZoom = VectorMaxZoom;
        options.tileSize = Size {{ VectorTileSize, VectorTileSize }};
        return tile_grid::createXYZ(options);
    }
    return tile_grid::createForProjection(projection);
}

}

TileSource::TileSource(Options options)
    : kind(options.kind),
      projection(options.projection),
      tileGrid(options.tileGrid ? options.tileGrid : defaultTileGrid(options.kind, options.projection)),
      key(options.key),
      wrapX(options.wrapX ? *options.wrapX : options.kind == SourceKind::Vector),
      zDirection(options.zDirection ? *options.zDirection : (options.kind == SourceKind::Vector ? 1 : 0)),
      tileUrlFunction(options.tileUrlFunction ? options.tileUrlFunction : &tile_url_function::nullTileUrlFunction),
      generateTileUrlFunction(!options.tileUrlFunction),
      tileLoadFunction(std::move(options.tileLoadFunction)),
      canvasPool(options.canvasPool ? options.canvasPool : std::make_shared<CanvasPool>()),
      tileCache(store, options.cacheSize),
      sourceTileCache(store, options.cacheSize) {
    tileOptions.transition = options.transition;
    tileOptions.interpolate = options.interpolate;

    if (!options.urls.empty()) {
        setUrls(std::move(options.urls));
    } else if (options.url) {
        setUrl(*options.url);
    }
}

TileSource::~TileSource() = default;

void TileSource::setObserver(Observer* observer_) {
    observer = observer_;
}

Tile& TileSource::getTile(int32_t z, int32_t x, int32_t y, double pixelRatio, const Projection& proj) {
    checkProjection(proj);
    if (kind == SourceKind::Vector) {
        return getRenderTile(z, x, y, pixelRatio, proj);
    }
    return getImageTile(z, x, y, pixelRatio, proj);
}

boost::optional<TileCoordinate> TileSource::getTileCoordForTileUrlFunction(const TileCoordinate& coord,
                                                                           const Projection& proj) {
    const auto grid = getTileGridForProjection(proj);
    TileCoordinate result = coord;
    if (wrapX && proj.isGlobal()) {
        result = tile_grid::wrapX(*grid, coord, proj);
    }
    if (!tile_coord::withinExtentAndZ(result, *grid)) {
        return boost::none;
    }
    return result;
}

Tile& TileSource::createImageTile(const TileCoordinate& coord, double pixelRatio, const Projection& proj) {
    const auto urlTileCoord = getTileCoordForTileUrlFunction(coord, proj);
    boost::optional<std::string> url;
    if (urlTileCoord) {
        url = tileUrlFunction(*urlTileCoord, pixelRatio, proj);
    }

    Tile& tile = image_tile::create(store, coord, url ? TileState::Idle : TileState::Empty,
                                    url ? *url : std::string(), tileLoadFunction, tileOptions);
    tile.setSourceKey(getKey());
    tile.addObserver(this);
    return tile;
}

Tile& TileSource::getImageTile(int32_t z, int32_t x, int32_t y, double pixelRatio, const Projection& proj) {
    const std::string coordKey = tile_coord::getKeyZXY(z, x, y);
    const std::string currentKey = getKey();

    if (!tileCache.containsKey(coordKey)) {
        Tile& tile = createImageTile(TileCoordinate(z, x, y), pixelRatio, proj);
        tileCache.set(coordKey, tile);
        return tile;
    }

    Tile& cached = tileCache.get(coordKey);
    if (cached.getSourceKey() == currentKey) {
        return cached;
    }

    Tile& tile = createImageTile(TileCoordinate(z, x, y), pixelRatio, proj);
    if (cached.getState() == TileState::Idle) {
        // A stale tile that never started loading has nothing to show.
        tile.setInterimTile(store.find(cached.getInterimUID()));
        store.destroy(cached.getUID());
    } else {
        tile.setInterimTile(&cached);
    }
    tile.refreshInterimChain();
    tileCache.replace(coordKey, tile);
    return tile;
}

Tile& TileSource::getRenderTile(int32_t z, int32_t x, int32_t y, double pixelRatio, const Projection& proj) {
    const std::string coordKey = tile_coord::getKeyZXY(z, x, y);
    const std::string currentKey = getKey();

    Tile* cached = nullptr;
    if (tileCache.containsKey(coordKey)) {
        cached = &tileCache.get(coordKey);
        if (cached->getSourceKey() == currentKey) {
            return *cached;
        }
    }

    const TileCoordinate coord(z, x, y);
    auto urlTileCoord = getTileCoordForTileUrlFunction(coord, proj);
    const auto& sourceExtent = tileGrid->getExtent();
    const auto grid = getTileGridForProjection(proj);
    const double resolution = grid->getResolution(z);

    if (urlTileCoord && sourceExtent) {
        // One pixel smaller, so that tiles covering less than half a pixel
        // of render space are not loaded.
        const Extent tileExtent = extent::buffer(grid->getTileCoordExtent(*urlTileCoord), -resolution);
        if (!extent::intersects(*sourceExtent, tileExtent)) {
            urlTileCoord = boost::none;
        }
    }

    bool empty = true;
    if (urlTileCoord) {
        const int32_t sourceZ = tileGrid->getZForResolution(resolution, 1);
        const Extent tileExtent = extent::buffer(grid->getTileCoordExtent(*urlTileCoord), -resolution);
        tileGrid->forEachTileCoord(tileExtent, sourceZ, [&](const TileCoordinate& sourceTileCoord) {
            empty = empty && !tileUrlFunction(sourceTileCoord, pixelRatio, proj);
        });
    }

    const Projection tileProjection = proj;
    Tile& tile = render_tile::create(
        store, coord, empty ? TileState::Empty : TileState::Idle, urlTileCoord,
        [this, pixelRatio, tileProjection](Tile& renderTile) {
            getSourceTiles(pixelRatio, tileProjection, renderTile);
        },
        canvasPool);
    tile.setSourceKey(currentKey);

    if (cached) {
        tile.setInterimTile(cached);
        tile.refreshInterimChain();
        tileCache.replace(coordKey, tile);
    } else {
        tileCache.set(coordKey, tile);
    }
    return tile;
}

const std::vector<TileUID>& TileSource::getSourceTiles(double pixelRatio, const Projection& proj, Tile& tile) {
    RenderTileData& renderData = render_tile::data(tile);
    if (tile.getState() != TileState::Idle || !renderData.wrappedTileCoord) {
        return renderData.sourceTiles;
    }

    tile.setState(TileState::Loading);

    const TileCoordinate urlTileCoord = *renderData.wrappedTileCoord;
    const auto grid = getTileGridForProjection(proj);
    const double resolution = grid->getResolution(urlTileCoord.z);
    Extent tileExtent = extent::buffer(grid->getTileCoordExtent(urlTileCoord), -resolution);
    if (tileGrid->getExtent()) {
        tileExtent = extent::getIntersection(tileExtent, *tileGrid->getExtent());
    }
    const int32_t sourceZ = tileGrid->getZForResolution(resolution, zDirection);
    const TileUID renderUID = tile.getUID();

    // Every source tile is counted before the first load starts.
    std::vector<TileUID> idleSourceTiles;

    auto addSourceTile = [&](const TileCoordinate& sourceTileCoord) {
        const auto url = tileUrlFunction(sourceTileCoord, pixelRatio, proj);
        if (!url) {
            // Nothing to load for this part of the tile.
            return;
        }

        Tile* sourceTile;
        if (sourceTileCache.containsKey(*url)) {
            sourceTile = &sourceTileCache.get(*url);
        } else {
            sourceTile = &vector_tile::create(store, sourceTileCoord, TileState::Idle, *url,
                                              tileLoadFunction, tileOptions);
            sourceTile->addObserver(this);
            sourceTileCache.set(*url, *sourceTile);
        }
        renderData.sourceTiles.push_back(sourceTile->getUID());

        const TileState sourceTileState = sourceTile->getState();
        if (sourceTileState < TileState::Loaded) {
            waitingRenderTiles[sourceTile->getUID()].push_back(renderUID);
            ++renderData.loadingSourceTiles;
        }

        if (sourceTileState == TileState::Idle) {
            VectorTileData& sourceData = vector_tile::data(*sourceTile);
            sourceData.extent = tileGrid->getTileCoordExtent(sourceTileCoord);
            sourceData.projection = proj;
            sourceData.resolution = tileGrid->getResolution(sourceTileCoord.z);
            idleSourceTiles.push_back(sourceTile->getUID());
        }
    };
    if (!extent::isEmpty(tileExtent)) {
        tileGrid->forEachTileCoord(tileExtent, sourceZ, addSourceTile);
    }

    if (renderData.loadingSourceTiles == 0) {
        const bool failed = std::any_of(renderData.sourceTiles.begin(), renderData.sourceTiles.end(),
                                        [this](TileUID uid) {
            const Tile* sourceTile = store.find(uid);
            return sourceTile && sourceTile->getState() == TileState::Error;
        });
        tile.setState(failed ? TileState::Error : TileState::Loaded);
    }

    for (TileUID uid : idleSourceTiles) {
        if (Tile* sourceTile = store.find(uid)) {
            sourceTile->load();
        }
    }

    return renderData.sourceTiles;
}

void TileSource::updateRenderTiles(Tile& sourceTile) {
    const TileState state = sourceTile.getState();
    if (state != TileState::Loaded && state != TileState::Error) {
        return;
    }

    auto it = waitingRenderTiles.find(sourceTile.getUID());
    if (it == waitingRenderTiles.end()) {
        return;
    }

    const std::string sourceTileKey = sourceTile.getKey();
    const std::vector<TileUID> renderUIDs = it->second;
    std::vector<TileUID> stillWaiting;

    for (TileUID renderUID : renderUIDs) {
        Tile* renderTile = store.find(renderUID);
        if (!renderTile) {
            continue;
        }

        RenderTileData& renderData = render_tile::data(*renderTile);
        if (renderData.errorTileKeys.count(sourceTileKey)) {
            if (state == TileState::Loaded) {
                renderData.errorTileKeys.erase(sourceTileKey);
            }
        } else {
            --renderData.loadingSourceTiles;
        }

        if (state == TileState::Error) {
            // Keep listening: a reloaded source tile may still succeed.
            renderData.errorTileKeys.insert(sourceTileKey);
            stillWaiting.push_back(renderUID);
        }

        if (renderData.loadingSourceTiles == 0) {
            // All or nothing: one failed source tile fails the render tile.
            renderTile->setState(renderData.errorTileKeys.empty() ? TileState::Loaded : TileState::Error);
        }
    }

    // The map may have changed while render tiles were notified.
    it = waitingRenderTiles.find(sourceTile.getUID());
    if (it == waitingRenderTiles.end()) {
        return;
    }
    if (stillWaiting.empty()) {
        waitingRenderTiles.erase(it);
    } else {
        it->second = std::move(stillWaiting);
    }
}

void TileSource::onTileChanged(Tile& tile) {
    const TileState state = tile.getState();

    if (state == TileState::Loading) {
        tileLoadingKeys.insert(tile.getUID());
        Log::Debug(Event::TileLoad, "loading %s", tile.getKey().c_str());
        if (observer) {
            observer->onTileLoadStart(tile);
        }
    } else if (tileLoadingKeys.erase(tile.getUID())) {
        if (state == TileState::Error) {
            Log::Warning(Event::TileLoad, "failed to load %s", tile.getKey().c_str());
            if (observer) {
                observer->onTileLoadError(tile);
            }
        } else if (state == TileState::Loaded) {
            Log::Debug(Event::TileLoad, "loaded %s", tile.getKey().c_str());
            if (observer) {
                observer->onTileLoadEnd(tile);
            }
        }
    }

    if (tile.getKind() == TileKind::Vector) {
        updateRenderTiles(tile);
    }
}

void TileSource::useTile(int32_t z, int32_t x, int32_t y) {
    const std::string coordKey = tile_coord::getKeyZXY(z, x, y);
    if (tileCache.containsKey(coordKey)) {
        tileCache.get(coordKey);
    }
}

void TileSource::updateCacheSize(std::size_t tileCount) {
    if (kind == SourceKind::Vector) {
        // Render tiles and the source tiles behind them.
        tileCache.updateCacheSize(tileCount * 2);
        sourceTileCache.setSize(tileCache.getHighWaterMark());
    } else {
        tileCache.updateCacheSize(tileCount);
    }
}

bool TileSource::canExpireCache() const {
    return tileCache.canExpireCache() ||
           (kind == SourceKind::Vector && sourceTileCache.canExpireCache());
}

void TileSource::expireCache(const std::unordered_set<std::string>& usedKeys) {
    if (kind == SourceKind::Vector) {
        std::unordered_set<std::string> usedSourceTiles;
        for (const auto& usedKey : usedKeys) {
            const Tile* renderTile = tileCache.peek(tile_coord::getCacheKeyForTileKey(usedKey));
            if (!renderTile) {
                continue;
            }
            for (TileUID uid : render_tile::getSourceTiles(*renderTile)) {
                if (const Tile* sourceTile = store.find(uid)) {
                    usedSourceTiles.insert(sourceTile->getKey());
                }
            }
        }
        tileCache.expireCache(usedKeys);
        sourceTileCache.expireCache(usedSourceTiles);
    } else {
        tileCache.expireCache(usedKeys);
    }
    pruneTracking();
}

bool TileSource::forEachLoadedTile(int32_t z, const TileRange& range, const std::function<bool(Tile&)>& callback) {
    bool covered = true;
    for (int32_t x = range.minX; x <= range.maxX; ++x) {
        for (int32_t y = range.minY; y <= range.maxY; ++y) {
            const std::string coordKey = tile_coord::getKeyZXY(z, x, y);
            bool loaded = false;
            if (tileCache.containsKey(coordKey)) {
                Tile& tile = tileCache.get(coordKey);
                loaded = tile.getState() == TileState::Loaded;
                if (loaded) {
                    loaded = callback(tile);
                }
            }
            if (!loaded) {
                covered = false;
            }
        }
    }
    return covered;
}

void TileSource::clear() {
    tileCache.clear();
    sourceTileCache.clear();
    pruneTracking();
}

void TileSource::refresh() {
    clear();
    changed();
}

std::string TileSource::getKey() const {
    if (kind == SourceKind::Image && !tileOptions.interpolate) {
        return key + ":disable-interpolation";
    }
    return key;
}

void TileSource::setKey(const std::string& key_) {
    if (key != key_) {
        key = key_;
        changed();
    }
}

void TileSource::setUrl(const std::string& url) {
    setUrls(tile_url_function::expandUrl(url));
}

void TileSource::setUrls(std::vector<std::string> urls_) {
    urls = std::move(urls_);

    std::string joined;
    for (const auto& url : urls) {
        if (!joined.empty()) {
            joined += "\n";
        }
        joined += url;
    }

    if (generateTileUrlFunction) {
        setTileUrlFunction(tile_url_function::createFromTemplates(urls, tileGrid), joined);
    } else {
        setKey(joined);
    }
}

void TileSource::setTileUrlFunction(TileUrlFunction function, boost::optional<std::string> key_) {
    tileUrlFunction = function ? std::move(function) : &tile_url_function::nullTileUrlFunction;
    tileCache.pruneExceptNewestZ();
    pruneTracking();
    if (key_) {
        setKey(*key_);
    } else {
        changed();
    }
}

void TileSource::setTileLoadFunction(TileLoadFunction function) {
    tileCache.clear();
    pruneTracking();
    tileLoadFunction = std::move(function);
    changed();
}

std::shared_ptr<const TileGrid> TileSource::getTileGridForProjection(const Projection& proj) {
    if (kind == SourceKind::Image) {
        if (proj == projection) {
            return tileGrid;
        }
        auto it = tileGridsForProjection.find(proj.getCode());
        if (it == tileGridsForProjection.end()) {
            it = tileGridsForProjection.emplace(proj.getCode(), tile_grid::createForProjection(proj)).first;
        }
        return it->second;
    }

    auto it = tileGridsForProjection.find(proj.getCode());
    if (it != tileGridsForProjection.end()) {
        return it->second;
    }

    // Matching the source grid's tile sizes makes 1:1 relationships between
    // source and render tiles more likely.
    TileGrid::Options options;
    options.extent = tileGrid->getExtent();
    options.resolutions = tileGrid->getResolutions();
    options.origins = std::vector<Coordinate>();
    options.tileSizes = std::vector<Size>();
    for (std::size_t z = 0; z < options.resolutions.size(); ++z) {
        options.origins->push_back(tileGrid->getOrigin(static_cast<int32_t>(z)));
        options.tileSizes->push_back(tileGrid->getTileSize(static_cast<int32_t>(z)));
    }
    for (std::size_t z = options.resolutions.size(); z <= std::size_t(util::DEFAULT_MAX_ZOOM); ++z) {
        options.resolutions.push_back(options.resolutions[z - 1] / 2);
        options.origins->push_back(options.origins->at(z - 1));
        options.tileSizes->push_back(options.tileSizes->at(z - 1));
    }

    auto grid = std::make_shared<const TileGrid>(std::move(options));
    tileGridsForProjection.emplace(proj.getCode(), grid);
    return grid;
}

Features TileSource::getFeaturesInExtent(const Extent& area) {
    Features features;
    if (kind != SourceKind::Vector || tileCache.getCount() == 0) {
        return features;
    }

    const int32_t z = tile_coord::fromKey(tileCache.peekFirstKey()).z;
    tileCache.forEach([&](Tile& tile) {
        if (tile.getTileCoord().z != z || tile.getState() != TileState::Loaded) {
            return;
        }
        for (TileUID uid : render_tile::getSourceTiles(tile)) {
            const Tile* sourceTile = store.find(uid);
            if (!sourceTile || !extent::intersects(area, tileGrid->getTileCoordExtent(sourceTile->getTileCoord()))) {
                continue;
            }
            for (const auto& feature : vector_tile::getFeatures(*sourceTile)) {
                if (extent::intersects(area, feature->getExtent())) {
                    features.push_back(feature);
                }
            }
        }
    });
    return features;
}

void TileSource::checkProjection(const Projection& proj) const {
    if (proj != projection) {
        throw util::MisuseException("Tiles can only be requested in the source projection " +
                                    projection.getCode() + ", not in " + proj.getCode());
    }
}

void TileSource::pruneTracking() {
    util::erase_if(tileLoadingKeys, [this](TileUID uid) { return !store.find(uid); });
    util::erase_if(waitingRenderTiles, [this](const std::pair<const TileUID, std::vector<TileUID>>& entry) {
        return !store.find(entry.first);
    });
}

void TileSource::changed() {
    Log::Debug(Event::General, "source changed, key \"%s\"", getKey().c_str());
    if (observer) {
        observer->onSourceChanged();
    }
}
