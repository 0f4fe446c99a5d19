#include <tessera/tile/render_tile.hpp>
#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_store.hpp>

using namespace tessera;

Tile& render_tile::create(TileStore& store,
                          const TileCoordinate& coord,
                          TileState state,
                          boost::optional<TileCoordinate> wrappedTileCoord,
                          SourceTileResolver getSourceTiles,
                          std::shared_ptr<CanvasPool> canvasPool) {
    RenderTileData payload;
    payload.wrappedTileCoord = std::move(wrappedTileCoord);
    payload.getSourceTiles = std::move(getSourceTiles);
    payload.canvasPool = std::move(canvasPool);

    TileOptions options;
    options.transition = 0;
    return store.create(coord, state, std::move(payload), options);
}

RenderTileData& render_tile::data(Tile& tile) {
    return tile.getPayload<RenderTileData>();
}

const RenderTileData& render_tile::data(const Tile& tile) {
    return tile.getPayload<RenderTileData>();
}

Canvas& render_tile::getContext(Tile& tile, const std::string& layer) {
    RenderTileData& payload = data(tile);
    auto it = payload.canvases.find(layer);
    if (it == payload.canvases.end()) {
        std::shared_ptr<Canvas> canvas = payload.canvasPool
            ? payload.canvasPool->acquire(1, 1)
            : std::make_shared<Canvas>(1, 1);
        it = payload.canvases.emplace(layer, std::move(canvas)).first;
    }
    return *it->second;
}

bool render_tile::hasContext(const Tile& tile, const std::string& layer) {
    return data(tile).canvases.count(layer) > 0;
}

const Canvas* render_tile::getImage(const Tile& tile, const std::string& layer) {
    const RenderTileData& payload = data(tile);
    auto it = payload.canvases.find(layer);
    return it == payload.canvases.end() ? nullptr : it->second.get();
}

ReplayState& render_tile::getReplayState(Tile& tile, const std::string& layer) {
    return data(tile).replayStates[layer];
}

const std::vector<TileUID>& render_tile::getSourceTiles(const Tile& tile) {
    return data(tile).sourceTiles;
}

void render_tile::load(Tile& tile) {
    RenderTileData& payload = data(tile);
    if (payload.getSourceTiles) {
        const SourceTileResolver resolver = payload.getSourceTiles;
        resolver(tile);
    }
}

void render_tile::release(Tile& tile) {
    RenderTileData& payload = data(tile);
    for (auto& entry : payload.canvases) {
        if (payload.canvasPool) {
            payload.canvasPool->recycle(std::move(entry.second));
        }
    }
    payload.canvases.clear();
}
