#include "../fixtures/util.hpp"

#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/util/easing.hpp>
#include <tessera/util/exception.hpp>

#include <chrono>
#include <future>
#include <vector>

using namespace tessera;

namespace {

class StateRecorder : public Tile::Observer {
public:
    void onTileChanged(Tile& tile) override {
        states.push_back(tile.getState());
    }

    std::vector<TileState> states;
};

bool isReady(const std::shared_future<TileState>& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

TEST(Tile, Key) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate(3, 2, -1), TileState::Idle, "source");
    EXPECT_EQ("source", tile.getSourceKey());
    EXPECT_EQ("source/3,2,-1", tile.getKey());

    tile.setSourceKey("other");
    EXPECT_EQ("other/3,2,-1", tile.getKey());
}

TEST(Tile, Kind) {
    TileStore store;
    EXPECT_EQ(TileKind::Image, test::createImageTile(store, TileCoordinate()).getKind());
    EXPECT_EQ(TileKind::Vector, test::createVectorTile(store, TileCoordinate(), "url").getKind());
}

TEST(Tile, SetStateNotifies) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate());
    StateRecorder recorder;
    tile.addObserver(&recorder);
    tile.addObserver(&recorder);

    tile.setState(TileState::Loading);
    tile.setState(TileState::Loading);
    tile.setState(TileState::Loaded);

    const std::vector<TileState> expected = { TileState::Loading, TileState::Loading, TileState::Loaded };
    EXPECT_EQ(expected, recorder.states);

    tile.removeObserver(&recorder);
    EXPECT_FALSE(tile.hasObserver(&recorder));
    tile.setState(TileState::Empty);
    EXPECT_EQ(3u, recorder.states.size());
}

TEST(Tile, SetStateSequenceViolation) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate(), TileState::Loaded);

    EXPECT_THROW(tile.setState(TileState::Loading), util::TileLoadSequenceException);
    EXPECT_THROW(tile.setState(TileState::Idle), util::TileLoadSequenceException);
    EXPECT_EQ(TileState::Loaded, tile.getState());

    tile.setState(TileState::Loaded);
    tile.setState(TileState::Empty);
    EXPECT_THROW(tile.setState(TileState::Error), util::TileLoadSequenceException);
}

TEST(Tile, ErrorCanStartOver) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate(), TileState::Error);
    tile.setState(TileState::Idle);
    EXPECT_EQ(TileState::Idle, tile.getState());
}

TEST(Tile, ObserverMayDetachDuringNotification) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate());

    class Detaching : public Tile::Observer {
    public:
        explicit Detaching(Tile::Observer* other_) : other(other_) {}
        void onTileChanged(Tile& tile) override {
            ++calls;
            tile.removeObserver(this);
            tile.removeObserver(other);
        }
        Tile::Observer* other;
        int calls = 0;
    };

    StateRecorder recorder;
    Detaching detaching(&recorder);
    tile.addObserver(&detaching);
    tile.addObserver(&recorder);

    tile.setState(TileState::Loading);
    tile.setState(TileState::Loaded);
    EXPECT_EQ(1, detaching.calls);
    EXPECT_TRUE(recorder.states.empty());
}

TEST(Tile, Alpha) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate(), TileState::Loaded, "", 250);

    EXPECT_TRUE(tile.inTransition("a"));
    const double first = tile.getAlpha("a", 1000);
    EXPECT_DOUBLE_EQ(util::easeIn((1000.0 / 60) / 250), first);
    EXPECT_TRUE(tile.inTransition("a"));

    EXPECT_DOUBLE_EQ(util::easeIn((100 + 1000.0 / 60) / 250), tile.getAlpha("a", 1100));
    EXPECT_EQ(1, tile.getAlpha("a", 1250));

    // Each renderer has its own start time.
    EXPECT_DOUBLE_EQ(first, tile.getAlpha("b", 5000));

    tile.endTransition("a");
    EXPECT_FALSE(tile.inTransition("a"));
    EXPECT_EQ(1, tile.getAlpha("a", 1001));
    EXPECT_TRUE(tile.inTransition("b"));
}

TEST(Tile, AlphaWithoutTransition) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate(), TileState::Loaded, "", 0);
    EXPECT_EQ(1, tile.getAlpha("a", 0));
    EXPECT_FALSE(tile.inTransition("a"));
}

TEST(Tile, InterimTileMustBeOlder) {
    TileStore store;
    Tile& older = test::createImageTile(store, TileCoordinate());
    Tile& newer = test::createImageTile(store, TileCoordinate());

    EXPECT_THROW(older.setInterimTile(&newer), util::TileInterimChainException);
    EXPECT_THROW(newer.setInterimTile(&newer), util::TileInterimChainException);
    EXPECT_EQ(NoTile, older.getInterimUID());

    newer.setInterimTile(&older);
    EXPECT_EQ(older.getUID(), newer.getInterimUID());
    newer.setInterimTile(nullptr);
    EXPECT_EQ(NoTile, newer.getInterimUID());
}

TEST(Tile, InterimTileFromAnotherStore) {
    TileStore store;
    TileStore other;
    Tile& foreign = test::createImageTile(other, TileCoordinate());
    test::createImageTile(store, TileCoordinate());
    Tile& tile = test::createImageTile(store, TileCoordinate());
    EXPECT_THROW(tile.setInterimTile(&foreign), util::TileInterimChainException);
}

TEST(Tile, GetInterimTile) {
    TileStore store;
    Tile& loaded = test::createImageTile(store, TileCoordinate(), TileState::Loaded);
    Tile& loading = test::createImageTile(store, TileCoordinate(), TileState::Loading);
    Tile& head = test::createImageTile(store, TileCoordinate(), TileState::Idle, "", 250);

    EXPECT_EQ(&head, &head.getInterimTile());
    EXPECT_TRUE(head.inTransition("a"));

    head.setInterimTile(&loading);
    EXPECT_EQ(&head, &head.getInterimTile());

    loading.setInterimTile(&loaded);
    EXPECT_EQ(&loaded, &head.getInterimTile());

    // The interim tile is already on screen, so the head no longer fades in.
    EXPECT_FALSE(head.inTransition("a"));
    EXPECT_EQ(1, head.getAlpha("a", 0));
}

TEST(Tile, LoadedTileIsItsOwnInterimTile) {
    TileStore store;
    Tile& older = test::createImageTile(store, TileCoordinate(), TileState::Loaded);
    Tile& head = test::createImageTile(store, TileCoordinate(), TileState::Loading, "", 250);
    head.setInterimTile(&older);

    head.setState(TileState::Loaded);
    EXPECT_EQ(&head, &head.getInterimTile());
    EXPECT_TRUE(head.inTransition("a"));
}

TEST(Tile, RefreshInterimChain) {
    TileStore store;
    Tile& oldest = test::createImageTile(store, TileCoordinate(), TileState::Loaded);
    Tile& loaded = test::createImageTile(store, TileCoordinate(), TileState::Loaded);
    Tile& loading = test::createImageTile(store, TileCoordinate(), TileState::Loading);
    Tile& idle = test::createImageTile(store, TileCoordinate(), TileState::Idle);
    Tile& head = test::createImageTile(store, TileCoordinate(), TileState::Idle);

    loaded.setInterimTile(&oldest);
    loading.setInterimTile(&loaded);
    idle.setInterimTile(&loading);
    head.setInterimTile(&idle);

    const TileUID oldestUID = oldest.getUID();
    const TileUID idleUID = idle.getUID();

    head.refreshInterimChain();

    EXPECT_EQ(loading.getUID(), head.getInterimUID());
    EXPECT_EQ(loaded.getUID(), loading.getInterimUID());
    EXPECT_EQ(NoTile, loaded.getInterimUID());
    EXPECT_EQ(nullptr, store.find(oldestUID));
    EXPECT_EQ(nullptr, store.find(idleUID));
    EXPECT_EQ(3u, store.size());
}

TEST(Tile, RefreshInterimChainKeepsErrors) {
    TileStore store;
    Tile& failed = test::createImageTile(store, TileCoordinate(), TileState::Error);
    Tile& idle = test::createImageTile(store, TileCoordinate(), TileState::Idle);
    Tile& head = test::createImageTile(store, TileCoordinate(), TileState::Idle);

    idle.setInterimTile(&failed);
    head.setInterimTile(&idle);
    head.refreshInterimChain();

    EXPECT_EQ(failed.getUID(), head.getInterimUID());
    EXPECT_EQ(2u, store.size());
}

TEST(Tile, Ready) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate());

    auto future = tile.ready();
    EXPECT_FALSE(isReady(future));
    tile.setState(TileState::Loading);
    EXPECT_FALSE(isReady(future));
    tile.setState(TileState::Loaded);
    ASSERT_TRUE(isReady(future));
    EXPECT_EQ(TileState::Loaded, future.get());

    // Later calls hand out the same, settled future.
    EXPECT_EQ(TileState::Loaded, tile.ready().get());
}

TEST(Tile, ReadyWhenAlreadySettled) {
    TileStore store;
    EXPECT_EQ(TileState::Empty, test::createImageTile(store, TileCoordinate(), TileState::Empty).ready().get());
    EXPECT_EQ(TileState::Error, test::createImageTile(store, TileCoordinate(), TileState::Error).ready().get());
}

TEST(Tile, ReadyBrokenWhenFreed) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate());
    auto future = tile.ready();
    store.destroy(tile.getUID());
    EXPECT_THROW(future.get(), std::future_error);
}

TEST(Tile, Release) {
    TileStore store;
    Tile& tile = test::createImageTile(store, TileCoordinate(), TileState::Error);
    StateRecorder recorder;
    tile.addObserver(&recorder);

    tile.release();

    EXPECT_EQ(TileState::Empty, tile.getState());
    EXPECT_EQ(std::vector<TileState> { TileState::Empty }, recorder.states);
    EXPECT_FALSE(tile.hasObserver(&recorder));
}

TEST(TileStore, CreateFindDestroy) {
    TileStore store;
    Tile& first = test::createImageTile(store, TileCoordinate());
    Tile& second = test::createImageTile(store, TileCoordinate());

    EXPECT_NE(NoTile, first.getUID());
    EXPECT_LT(first.getUID(), second.getUID());
    EXPECT_EQ(&first, store.find(first.getUID()));
    EXPECT_EQ(nullptr, store.find(NoTile));

    const TileUID uid = first.getUID();
    store.destroy(uid);
    EXPECT_EQ(nullptr, store.find(uid));
    EXPECT_EQ(1u, store.size());

    // Unknown uids are ignored.
    store.destroy(uid);
    EXPECT_EQ(1u, store.size());
}

TEST(TileStore, DestroyChain) {
    TileStore store;
    Tile& a = test::createImageTile(store, TileCoordinate(), TileState::Loaded);
    Tile& b = test::createImageTile(store, TileCoordinate(), TileState::Loading);
    Tile& c = test::createImageTile(store, TileCoordinate());
    Tile& unrelated = test::createImageTile(store, TileCoordinate());
    b.setInterimTile(&a);
    c.setInterimTile(&b);

    store.destroyChain(c.getUID());
    EXPECT_EQ(1u, store.size());
    EXPECT_EQ(&unrelated, store.find(unrelated.getUID()));
}
