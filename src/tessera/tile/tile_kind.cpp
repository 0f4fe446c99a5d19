#include <tessera/tile/tile_kind.hpp>
#include <tessera/tile/image_tile.hpp>
#include <tessera/tile/vector_tile.hpp>
#include <tessera/tile/render_tile.hpp>

namespace tessera {

namespace {

const TileBehavior behaviors[] = {
    { "image", &image_tile::load, &image_tile::release },
    { "vector", &vector_tile::load, &vector_tile::release },
    { "render", &render_tile::load, &render_tile::release },
};

}

const TileBehavior& tileBehavior(TileKind kind) {
    return behaviors[static_cast<std::size_t>(kind)];
}

}
