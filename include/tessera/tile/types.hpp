#ifndef TESSERA_TILE_TYPES
#define TESSERA_TILE_TYPES

#include <cstdint>
#include <functional>
#include <string>

namespace tessera {

class Tile;

// Identifies a tile record within its TileStore. Uids grow monotonically,
// so a newer tile always has a larger uid than an older one.
using TileUID = uint64_t;

// 0 never names a tile.
constexpr TileUID NoTile = 0;

// Ordering matters: a tile only ever moves forward through these states,
// except out of Error.
enum class TileState : uint8_t {
    Idle = 0,
    Loading = 1,
    Loaded = 2,
    Error = 3,
    Empty = 4,
};

const char* TileStateName(TileState);

// Must list the kinds in the order of the alternatives of Tile::Payload.
enum class TileKind : uint8_t {
    Image = 0,
    Vector = 1,
    RenderAggregate = 2,
};

// Supplied by the source. Starts the load of `url` into `tile`; the result
// is reported later through the kind's completion functions. Loaders that
// finish asynchronously must re-resolve the tile by uid through its store,
// as the tile may have been freed in the meantime.
using TileLoadFunction = std::function<void(Tile& tile, const std::string& url)>;

}

#endif
