#ifndef TESSERA_TILE_RENDER_TILE
#define TESSERA_TILE_RENDER_TILE

#include <tessera/tile/canvas_pool.hpp>
#include <tessera/tile/tile_coord.hpp>
#include <tessera/tile/types.hpp>

#include <boost/optional.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tessera {

class TileStore;

// Per layer bookkeeping of what was last drawn into a render tile.
struct ReplayState {
    bool dirty = false;
    double renderedResolution = std::numeric_limits<double>::quiet_NaN();
    int64_t renderedRevision = -1;
    double renderedTileResolution = std::numeric_limits<double>::quiet_NaN();
    int64_t renderedTileRevision = -1;
    int32_t renderedTileZ = -1;
};

// Collects the source tiles a render tile is drawn from, starting their
// loads as needed.
using SourceTileResolver = std::function<void(Tile&)>;

// Payload of a rendered vector tile, which aggregates one or more source
// tiles and owns the canvases its layers are drawn into.
struct RenderTileData {
    // Coordinate used to address the source, after wrapping. None for tiles
    // outside the source extent.
    boost::optional<TileCoordinate> wrappedTileCoord;
    std::vector<TileUID> sourceTiles;
    int32_t loadingSourceTiles = 0;
    std::set<std::string> errorTileKeys;
    std::map<std::string, std::shared_ptr<Canvas>> canvases;
    std::map<std::string, ReplayState> replayStates;
    std::shared_ptr<CanvasPool> canvasPool;
    SourceTileResolver getSourceTiles;
};

namespace render_tile {

// Render tiles never fade in.
Tile& create(TileStore&,
             const TileCoordinate&,
             TileState,
             boost::optional<TileCoordinate> wrappedTileCoord,
             SourceTileResolver,
             std::shared_ptr<CanvasPool>);

RenderTileData& data(Tile&);
const RenderTileData& data(const Tile&);

// The canvas for `layer`, acquired from the pool on first use.
Canvas& getContext(Tile&, const std::string& layer);
bool hasContext(const Tile&, const std::string& layer);

// Null when nothing was drawn for `layer` yet.
const Canvas* getImage(const Tile&, const std::string& layer);

ReplayState& getReplayState(Tile&, const std::string& layer);

const std::vector<TileUID>& getSourceTiles(const Tile&);

void load(Tile&);

// Returns every canvas to the pool.
void release(Tile&);

} // namespace render_tile
} // namespace tessera

#endif
