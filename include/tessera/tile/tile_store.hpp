#ifndef TESSERA_TILE_TILE_STORE
#define TESSERA_TILE_TILE_STORE

#include <tessera/tile/tile.hpp>
#include <tessera/util/noncopyable.hpp>

#include <memory>
#include <unordered_map>

namespace tessera {

// Owns the tile records of a source and hands out their uids.
class TileStore : private util::noncopyable {
public:
    TileStore() = default;
    ~TileStore();

    Tile& create(const TileCoordinate&, TileState, Tile::Payload, const TileOptions&);

    // Null once the tile was freed.
    Tile* find(TileUID) const;

    // Releases and frees a single tile. Unknown uids are ignored.
    void destroy(TileUID);

    // Releases and frees a tile together with its interim chain.
    void destroyChain(TileUID);

    std::size_t size() const { return tiles.size(); }

private:
    TileUID nextUID = 1;
    std::unordered_map<TileUID, std::unique_ptr<Tile>> tiles;
};

}

#endif
