#include <tessera/tile/vector_tile.hpp>
#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/platform/log.hpp>

using namespace tessera;

Tile& vector_tile::create(TileStore& store,
                          const TileCoordinate& coord,
                          TileState state,
                          const std::string& url,
                          TileLoadFunction loadFunction,
                          const TileOptions& options) {
    VectorTileData payload;
    payload.url = url;
    payload.loadFunction = std::move(loadFunction);
    Tile& tile = store.create(coord, state, std::move(payload), options);
    tile.setSourceKey(url);
    return tile;
}

VectorTileData& vector_tile::data(Tile& tile) {
    return tile.getPayload<VectorTileData>();
}

const Features& vector_tile::getFeatures(const Tile& tile) {
    return tile.getPayload<VectorTileData>().features;
}

void vector_tile::load(Tile& tile) {
    if (tile.getState() != TileState::Idle) {
        return;
    }

    tile.setState(TileState::Loading);

    VectorTileData& payload = data(tile);
    if (!payload.loadFunction) {
        Log::Warning(Event::TileLoad, "no load function for vector tile %s", payload.url.c_str());
        onError(tile);
        return;
    }

    const TileLoadFunction loadFunction = payload.loadFunction;
    loadFunction(tile, payload.url);

    // The load function may have installed a feature loader.
    if (payload.loader) {
        const FeatureLoader loader = payload.loader;
        loader(payload.extent, payload.resolution, payload.projection);
    }
}

void vector_tile::onLoad(Tile& tile, Features features, const Projection&) {
    setFeatures(tile, std::move(features));
}

void vector_tile::onError(Tile& tile) {
    tile.setState(TileState::Error);
}

void vector_tile::setFeatures(Tile& tile, Features features) {
    data(tile).features = std::move(features);
    tile.setState(TileState::Loaded);
}

void vector_tile::setLoader(Tile& tile, FeatureLoader loader) {
    data(tile).loader = std::move(loader);
}

void vector_tile::release(Tile& tile) {
    VectorTileData& payload = data(tile);
    payload.features.clear();
    payload.loader = nullptr;
}
