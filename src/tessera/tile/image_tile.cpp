#include <tessera/tile/image_tile.hpp>
#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/platform/log.hpp>

using namespace tessera;

Tile& image_tile::create(TileStore& store,
                         const TileCoordinate& coord,
                         TileState state,
                         const std::string& src,
                         TileLoadFunction loadFunction,
                         const TileOptions& options) {
    ImageTileData payload;
    payload.src = src;
    payload.loadFunction = std::move(loadFunction);
    Tile& tile = store.create(coord, state, std::move(payload), options);
    tile.setSourceKey(src);
    return tile;
}

ImageTileData& image_tile::data(Tile& tile) {
    return tile.getPayload<ImageTileData>();
}

const util::Image& image_tile::getImage(const Tile& tile) {
    return tile.getPayload<ImageTileData>().image;
}

void image_tile::load(Tile& tile) {
    ImageTileData& payload = data(tile);

    if (tile.getState() == TileState::Error) {
        payload.image = util::Image();
        tile.setState(TileState::Idle);
    }

    if (tile.getState() == TileState::Idle) {
        tile.setState(TileState::Loading);
        if (!payload.loadFunction) {
            Log::Warning(Event::TileLoad, "no load function for image tile %s", payload.src.c_str());
            onError(tile);
            return;
        }
        // Copied, as the function may replace itself on the tile.
        const TileLoadFunction loadFunction = payload.loadFunction;
        loadFunction(tile, payload.src);
    }
}

void image_tile::setImage(Tile& tile, util::Image image) {
    const bool empty = image.empty();
    data(tile).image = std::move(image);
    tile.setState(empty ? TileState::Empty : TileState::Loaded);
}

void image_tile::onError(Tile& tile) {
    data(tile).image = util::blankImage();
    tile.setState(TileState::Error);
}

void image_tile::release(Tile& tile) {
    data(tile).image = util::Image();
}
