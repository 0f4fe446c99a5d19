#ifndef TESSERA_TILE_TILE_CACHE
#define TESSERA_TILE_TILE_CACHE

#include <tessera/tile/types.hpp>
#include <tessera/util/lru_cache.hpp>
#include <tessera/util/noncopyable.hpp>

#include <functional>
#include <string>
#include <unordered_set>

namespace tessera {

class TileStore;

// LRU of tiles keyed by "z/x/y" (or by url for source tiles). The tiles stay
// in the store; tiles dropped from the cache are released and freed along
// with their interim chains.
class TileCache : private util::noncopyable {
public:
    explicit TileCache(TileStore&, std::size_t highWaterMark = util::DEFAULT_CACHE_SIZE);

    // Promotes the entry. Throws util::MisuseException for unknown keys.
    Tile& get(const std::string& key);

    // Null for unknown keys. Does not promote.
    Tile* peek(const std::string& key);
    Tile& peekLast();
    const std::string& peekFirstKey() const;
    const std::string& peekLastKey() const;

    void set(const std::string& key, Tile&);

    // Swaps in a newer tile for `key`. The old tile is expected to live on in
    // the new one's interim chain and is not freed.
    void replace(const std::string& key, Tile&);

    // Takes the entry out of the cache without freeing the tile.
    TileUID remove(const std::string& key);

    bool containsKey(const std::string& key) const;
    std::size_t getCount() const;

    // Oldest first.
    void forEach(const std::function<void(Tile&)>&);

    std::size_t getHighWaterMark() const;
    void setSize(std::size_t);

    // Grows the high water mark to `tileCount`; never shrinks it.
    void updateCacheSize(std::size_t tileCount);

    bool canExpireCache() const;

    // Frees least recently used tiles while over the high water mark,
    // stopping at the first one whose getKey() is in `usedKeys`.
    void expireCache(const std::unordered_set<std::string>& usedKeys);

    // Frees every tile whose zoom level differs from the newest entry's.
    void pruneExceptNewestZ();

    void clear();

private:
    Tile& resolve(TileUID) const;

    TileStore& store;
    util::LRUCache<TileUID> cache;
};

}

#endif
