#include <tessera/tile/tile_cache.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/platform/log.hpp>

#include <vector>

using namespace tessera;

TileCache::TileCache(TileStore& store_, std::size_t highWaterMark)
    : store(store_), cache(highWaterMark) {
}

Tile& TileCache::resolve(TileUID uid) const {
    Tile* tile = store.find(uid);
    if (!tile) {
        throw util::MisuseException("cached tile " + std::to_string(uid) + " was freed behind the cache's back");
    }
    return *tile;
}

Tile& TileCache::get(const std::string& key) {
    return resolve(cache.get(key));
}

Tile* TileCache::peek(const std::string& key) {
    const TileUID* uid = cache.peek(key);
    return uid ? store.find(*uid) : nullptr;
}

Tile& TileCache::peekLast() {
    return resolve(cache.peekLast());
}

const std::string& TileCache::peekFirstKey() const {
    return cache.peekFirstKey();
}

const std::string& TileCache::peekLastKey() const {
    return cache.peekLastKey();
}

void TileCache::set(const std::string& key, Tile& tile) {
    cache.set(key, tile.getUID());
}

void TileCache::replace(const std::string& key, Tile& tile) {
    cache.replace(key, tile.getUID());
}

TileUID TileCache::remove(const std::string& key) {
    return cache.remove(key);
}

bool TileCache::containsKey(const std::string& key) const {
    return cache.containsKey(key);
}

std::size_t TileCache::getCount() const {
    return cache.getCount();
}

void TileCache::forEach(const std::function<void(Tile&)>& fn) {
    cache.forEach([&](TileUID& uid, const std::string&) {
        fn(resolve(uid));
    });
}

std::size_t TileCache::getHighWaterMark() const {
    return cache.getSize();
}

void TileCache::setSize(std::size_t size) {
    cache.setSize(size);
}

void TileCache::updateCacheSize(std::size_t tileCount) {
    if (tileCount > cache.getSize()) {
        cache.setSize(tileCount);
    }
}

bool TileCache::canExpireCache() const {
    return cache.canExpireCache();
}

void TileCache::expireCache(const std::unordered_set<std::string>& usedKeys) {
    std::size_t expired = 0;
    while (cache.canExpireCache()) {
        if (usedKeys.count(peekLast().getKey())) {
            break;
        }
        store.destroyChain(cache.pop());
        ++expired;
    }
    if (expired) {
        Log::Debug(Event::TileCache, "expired %zu tiles, %zu left", expired, cache.getCount());
    }
}

void TileCache::pruneExceptNewestZ() {
    if (cache.getCount() == 0) {
        return;
    }
    const int32_t z = tile_coord::fromKey(cache.peekFirstKey()).z;

    std::vector<std::string> stale;
    cache.forEach([&](TileUID& uid, const std::string& key) {
        if (resolve(uid).getTileCoord().z != z) {
            stale.push_back(key);
        }
    });
    for (const auto& key : stale) {
        store.destroyChain(cache.remove(key));
    }
}

void TileCache::clear() {
    while (cache.getCount() > 0) {
        store.destroyChain(cache.pop());
    }
}
