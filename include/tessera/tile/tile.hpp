#ifndef TESSERA_TILE_TILE
#define TESSERA_TILE_TILE

#include <tessera/tile/image_tile.hpp>
#include <tessera/tile/render_tile.hpp>
#include <tessera/tile/tile_coord.hpp>
#include <tessera/tile/types.hpp>
#include <tessera/tile/vector_tile.hpp>
#include <tessera/util/constants.hpp>
#include <tessera/util/noncopyable.hpp>

#include <boost/variant.hpp>

#include <future>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tessera {

class TileStore;

struct TileOptions {
    // Fade-in duration in milliseconds; 0 disables fading.
    double transition = util::DEFAULT_TRANSITION;
    bool interpolate = false;
};

// One addressable tile of a source. Records live in a TileStore, which hands
// out their uids; everything else refers to a tile by uid and re-resolves it
// through the store, so a freed tile is simply not found anymore.
class Tile : private util::noncopyable {
public:
    class Observer {
    public:
        virtual ~Observer() = default;

        // Called after every state change.
        virtual void onTileChanged(Tile&) = 0;
    };

    // Alternatives are listed in TileKind order.
    using Payload = boost::variant<ImageTileData, VectorTileData, RenderTileData>;

    Tile(TileStore&, TileUID, const TileCoordinate&, TileState, Payload, const TileOptions&);
    ~Tile();

    TileUID getUID() const { return uid; }
    TileKind getKind() const { return static_cast<TileKind>(payload.which()); }
    const TileCoordinate& getTileCoord() const { return coord; }
    TileState getState() const { return state; }
    TileStore& getStore() const { return store; }

    // The source defined part of the key, used to detect stale cache entries.
    const std::string& getSourceKey() const { return sourceKey; }
    void setSourceKey(const std::string& key) { sourceKey = key; }

    // "<source key>/<z>,<x>,<y>"
    std::string getKey() const;

    bool getInterpolate() const { return interpolate; }

    // Throws util::TileLoadSequenceException when `state` lies behind the
    // current state, unless the tile is in Error. Notifies observers.
    void setState(TileState state);

    void load();

    // Frees the kind's resources, turns Error into Empty and detaches every
    // observer. Called right before the store frees the record.
    void release();

    TileUID getInterimUID() const { return interimUID; }

    // Links an older tile for the same cell, or clears the link for null.
    // Throws util::TileInterimChainException unless `tile` is older than
    // this tile and lives in the same store.
    void setInterimTile(const Tile* tile);

    // This tile once it is Loaded. Otherwise the newest Loaded tile of the
    // interim chain, or this tile. Showing an interim tile disables this
    // tile's fade-in.
    Tile& getInterimTile();

    // Drops everything behind the first Loaded tile of the chain and splices
    // out Idle tiles. Dropped tiles are released and freed.
    void refreshInterimChain();

    double getAlpha(const std::string& rendererId, double time);
    bool inTransition(const std::string& rendererId) const;
    void endTransition(const std::string& rendererId);

    // Resolves with the state once the tile is Loaded, Error or Empty. Repeated
    // calls return the same future. A tile freed before it got there breaks
    // the promise.
    std::shared_future<TileState> ready();

    void addObserver(Observer*);
    void removeObserver(Observer*);
    bool hasObserver(Observer*) const;

    template <typename T>
    T& getPayload() { return boost::get<T>(payload); }

    template <typename T>
    const T& getPayload() const { return boost::get<T>(payload); }

private:
    void changed();
    void resolveReady();

    TileStore& store;
    const TileUID uid;
    const TileCoordinate coord;
    TileState state;
    std::string sourceKey;
    TileUID interimUID = NoTile;

    double transition;
    const bool interpolate;
    std::unordered_map<std::string, double> transitionStarts;

    Payload payload;

    std::vector<Observer*> observers;

    std::unique_ptr<std::promise<TileState>> readyPromise;
    std::shared_future<TileState> readyFuture;
    bool readyResolved = false;
};

}

#endif
