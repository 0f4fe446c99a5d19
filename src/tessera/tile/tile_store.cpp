#include <tessera/tile/tile_store.hpp>
#include <tessera/util/std.hpp>

using namespace tessera;

TileStore::~TileStore() = default;

Tile& TileStore::create(const TileCoordinate& coord, TileState state, Tile::Payload payload, const TileOptions& options) {
    const TileUID uid = nextUID++;
    auto tile = util::make_unique<Tile>(*this, uid, coord, state, std::move(payload), options);
    Tile& result = *tile;
    tiles.emplace(uid, std::move(tile));
    return result;
}

Tile* TileStore::find(TileUID uid) const {
    auto it = tiles.find(uid);
    return it == tiles.end() ? nullptr : it->second.get();
}

void TileStore::destroy(TileUID uid) {
    auto it = tiles.find(uid);
    if (it == tiles.end()) {
        return;
    }
    // Take the record out first so that observers notified during release
    // can no longer reach it.
    std::unique_ptr<Tile> tile = std::move(it->second);
    tiles.erase(it);
    tile->release();
}

void TileStore::destroyChain(TileUID uid) {
    while (uid != NoTile) {
        Tile* tile = find(uid);
        if (!tile) {
            return;
        }
        const TileUID next = tile->getInterimUID();
        destroy(uid);
        uid = next;
    }
}
