#ifndef TESSERA_TILE_IMAGE_TILE
#define TESSERA_TILE_IMAGE_TILE

#include <tessera/tile/tile_coord.hpp>
#include <tessera/tile/types.hpp>
#include <tessera/util/image.hpp>

#include <string>

namespace tessera {

class TileStore;
struct TileOptions;

// Payload of a raster tile.
struct ImageTileData {
    std::string src;
    TileLoadFunction loadFunction;
    util::Image image;
};

namespace image_tile {

// Creates an image tile keyed by its `src`.
Tile& create(TileStore&,
             const TileCoordinate&,
             TileState,
             const std::string& src,
             TileLoadFunction,
             const TileOptions&);

ImageTileData& data(Tile&);
const util::Image& getImage(const Tile&);

// Error resets to Idle so a failed tile can be retried. Idle tiles switch
// to Loading and hand their src to the load function. Other states are
// left alone.
void load(Tile&);

// Loaded, or Empty when the image has no pixels.
void setImage(Tile&, util::Image);

// Error, with a blank 1x1 image in place of the data.
void onError(Tile&);

void release(Tile&);

} // namespace image_tile
} // namespace tessera

#endif
