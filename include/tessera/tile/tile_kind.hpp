#ifndef TESSERA_TILE_TILE_KIND
#define TESSERA_TILE_TILE_KIND

#include <tessera/tile/types.hpp>

namespace tessera {

// What a tile does on load and release, per kind.
struct TileBehavior {
    const char* name;
    void (*load)(Tile&);
    void (*release)(Tile&);
};

const TileBehavior& tileBehavior(TileKind);

}

#endif
