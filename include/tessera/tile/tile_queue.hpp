#ifndef TESSERA_TILE_TILE_QUEUE
#define TESSERA_TILE_TILE_QUEUE

#include <tessera/tile/tile.hpp>
#include <tessera/util/geo.hpp>
#include <tessera/util/noncopyable.hpp>
#include <tessera/util/priority_queue.hpp>

#include <functional>
#include <set>
#include <string>
#include <utility>
#include <unordered_map>
#include <unordered_set>

namespace tessera {

class TileStore;

struct TileQueueEntry {
    TileStore* store;
    TileUID uid;
    // Tile::getKey() at the time the tile was queued.
    std::string tileKey;
    std::string sourceKey;
    Coordinate center;
    double resolution;
};

// Tiles waiting to be loaded, lowest priority value first. The queue observes
// every tile it queued until the tile is Loaded or Empty, so it can count the
// loads it started. The stores of queued tiles must outlive the queue, or the
// queue must be cleared first.
class TileQueue : public Tile::Observer, private util::noncopyable {
public:
    // Returning util::PriorityQueue<TileQueueEntry>::DROP keeps a tile out.
    using PriorityFunction = std::function<double(const Tile&,
                                                  const std::string& sourceKey,
                                                  const Coordinate& center,
                                                  double resolution)>;
    using TileChangeCallback = std::function<void()>;

    TileQueue(PriorityFunction, TileChangeCallback);
    ~TileQueue() override;

    bool enqueue(Tile&, const std::string& sourceKey, const Coordinate& center, double resolution);

    // Throws util::MisuseException when empty. The tile may have been freed
    // since it was queued.
    TileQueueEntry dequeue();

    // Recomputes every priority; freed tiles are dropped as well.
    void reprioritize();

    bool isKeyQueued(const std::string& tileKey) const { return queue.isKeyQueued(tileKey); }
    std::size_t getCount() const { return queue.getCount(); }

    // Tiles whose load was started here and that did not settle yet. Freed
    // tiles no longer count.
    std::size_t getTilesLoading();

    // Tiles this queue still listens to, freed tiles excluded.
    std::size_t getTilesObserved();

    // Starts loading queued Idle tiles, highest priority first, until
    // `maxTotalLoading` loads are running or `maxNewLoads` were started.
    void loadMoreTiles(std::size_t maxTotalLoading, std::size_t maxNewLoads);

    // Detaches from every tile and forgets the running loads.
    void clear();

    // Tile::Observer
    void onTileChanged(Tile&) override;

private:
    struct TileRef {
        TileStore* store;
        TileUID uid;
    };

    double priorityOf(const TileQueueEntry&) const;

    // Forgets freed tiles.
    void pruneFreedTiles();

    PriorityFunction priorityFunction;
    TileChangeCallback tileChangeCallback;
    util::PriorityQueue<TileQueueEntry> queue;

    // Tiles this queue observes.
    std::set<std::pair<TileStore*, TileUID>> observed;

    // Loads started here, by tile key.
    std::unordered_map<std::string, TileRef> tilesLoading;
};

namespace tile_queue {

// Tile keys wanted for the current frame, by source key.
using WantedTiles = std::unordered_map<std::string, std::unordered_set<std::string>>;

// Prefers finer zoom levels, then tiles closer to `viewCenter`. Tiles that
// are not wanted are dropped.
double getTilePriority(const WantedTiles&,
                       const Coordinate& viewCenter,
                       const Tile&,
                       const std::string& sourceKey,
                       const Coordinate& tileCenter,
                       double tileResolution);

} // namespace tile_queue

}

#endif
