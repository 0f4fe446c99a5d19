#include <tessera/tile/tile_queue.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/platform/log.hpp>
#include <tessera/util/std.hpp>

#include <cmath>

using namespace tessera;

namespace {

using Queue = util::PriorityQueue<TileQueueEntry>;

Tile* resolve(TileStore* store, TileUID uid) {
    return store ? store->find(uid) : nullptr;
}

}

TileQueue::TileQueue(PriorityFunction priorityFunction_, TileChangeCallback tileChangeCallback_)
    : priorityFunction(std::move(priorityFunction_)),
      tileChangeCallback(std::move(tileChangeCallback_)),
      queue([this](const TileQueueEntry& entry) { return priorityOf(entry); },
            [](const TileQueueEntry& entry) { return entry.tileKey; }) {
}

TileQueue::~TileQueue() {
    clear();
}

bool TileQueue::enqueue(Tile& tile, const std::string& sourceKey, const Coordinate& center, double resolution) {
    TileQueueEntry entry { &tile.getStore(), tile.getUID(), tile.getKey(), sourceKey, center, resolution };
    if (!queue.enqueue(std::move(entry))) {
        return false;
    }
    tile.addObserver(this);
    observed.emplace(&tile.getStore(), tile.getUID());
    return true;
}

TileQueueEntry TileQueue::dequeue() {
    return queue.dequeue();
}

void TileQueue::reprioritize() {
    queue.reprioritize();
}

double TileQueue::priorityOf(const TileQueueEntry& entry) const {
    const Tile* tile = resolve(entry.store, entry.uid);
    if (!tile) {
        return Queue::DROP;
    }
    return priorityFunction(*tile, entry.sourceKey, entry.center, entry.resolution);
}

std::size_t TileQueue::getTilesLoading() {
    pruneFreedTiles();
    return tilesLoading.size();
}

std::size_t TileQueue::getTilesObserved() {
    pruneFreedTiles();
    return observed.size();
}

void TileQueue::pruneFreedTiles() {
    // Freed tiles are released without a final notification.
    util::erase_if(tilesLoading, [](const std::pair<const std::string, TileRef>& entry) {
        return !resolve(entry.second.store, entry.second.uid);
    });
    util::erase_if(observed, [](const std::pair<TileStore*, TileUID>& ref) {
        return !resolve(ref.first, ref.second);
    });
}

void TileQueue::loadMoreTiles(std::size_t maxTotalLoading, std::size_t maxNewLoads) {
    pruneFreedTiles();

    std::size_t newLoads = 0;
    while (tilesLoading.size() < maxTotalLoading && newLoads < maxNewLoads && queue.getCount() > 0) {
        const TileQueueEntry entry = queue.dequeue();
        Tile* tile = resolve(entry.store, entry.uid);
        if (!tile) {
            observed.erase(std::make_pair(entry.store, entry.uid));
            continue;
        }
        if (tile->getState() == TileState::Idle && !tilesLoading.count(entry.tileKey)) {
            tilesLoading.emplace(entry.tileKey, TileRef { entry.store, entry.uid });
            ++newLoads;
            tile->load();
        }
    }

    if (newLoads) {
        Log::Debug(Event::TileLoad, "started %zu tile loads, %zu running", newLoads, tilesLoading.size());
    }
}

void TileQueue::clear() {
    queue.clear();
    for (const auto& ref : observed) {
        if (Tile* tile = resolve(ref.first, ref.second)) {
            tile->removeObserver(this);
        }
    }
    observed.clear();
    tilesLoading.clear();
}

void TileQueue::onTileChanged(Tile& tile) {
    const TileState state = tile.getState();
    if (state != TileState::Loaded && state != TileState::Error && state != TileState::Empty) {
        return;
    }

    // Errored tiles may be loaded again, so keep watching them.
    if (state != TileState::Error) {
        tile.removeObserver(this);
        observed.erase(std::make_pair(&tile.getStore(), tile.getUID()));
    }

    auto it = tilesLoading.find(tile.getKey());
    if (it != tilesLoading.end() && it->second.store == &tile.getStore() && it->second.uid == tile.getUID()) {
        tilesLoading.erase(it);
    }

    if (tileChangeCallback) {
        tileChangeCallback();
    }
}

double tile_queue::getTilePriority(const WantedTiles& wantedTiles,
                                   const Coordinate& viewCenter,
                                   const Tile& tile,
                                   const std::string& sourceKey,
                                   const Coordinate& tileCenter,
                                   double tileResolution) {
    auto source = wantedTiles.find(sourceKey);
    if (source == wantedTiles.end() || !source->second.count(tile.getKey())) {
        return Queue::DROP;
    }

    // Finer zoom levels first, then by distance to the view center in
    // pixels. The factor keeps zoom levels apart for tiles up to
    // 65536 * ln(2) pixels away.
    const double deltaX = tileCenter[0] - viewCenter[0];
    const double deltaY = tileCenter[1] - viewCenter[1];
    return 65536 * std::log(tileResolution) + std::sqrt(deltaX * deltaX + deltaY * deltaY) / tileResolution;
}
