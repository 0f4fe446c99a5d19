#include <tessera/tile/tile_loader.hpp>
#include <tessera/tile/image_tile.hpp>
#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/tile/vector_tile.hpp>
#include <tessera/platform/log.hpp>
#include <tessera/util/run_loop.hpp>

using namespace tessera;

namespace {

// The tile the result is meant for, or null when the result is stale.
Tile* pendingTile(TileStore& store, TileUID uid, const std::string& url) {
    Tile* tile = store.find(uid);
    if (!tile || tile->getState() != TileState::Loading) {
        Log::Debug(Event::TileLoad, "dropping result for %s", url.c_str());
        return nullptr;
    }
    return tile;
}

}

TileLoadFunction tile_loader::imageLoadFunction(util::RunLoop& loop, ImageFetcher fetch) {
    return [&loop, fetch](Tile& tile, const std::string& url) {
        TileStore& store = tile.getStore();
        const TileUID uid = tile.getUID();
        fetch(url, [&loop, &store, uid, url](boost::optional<util::Image> image) {
            loop.invoke([&store, uid, url, image] {
                Tile* target = pendingTile(store, uid, url);
                if (!target) {
                    return;
                }
                if (image) {
                    image_tile::setImage(*target, *image);
                } else {
                    image_tile::onError(*target);
                }
            });
        });
    };
}

TileLoadFunction tile_loader::vectorLoadFunction(util::RunLoop& loop, FeaturesFetcher fetch) {
    return [&loop, fetch](Tile& tile, const std::string& url) {
        TileStore& store = tile.getStore();
        const TileUID uid = tile.getUID();
        fetch(url, [&loop, &store, uid, url](boost::optional<Features> features) {
            loop.invoke([&store, uid, url, features] {
                Tile* target = pendingTile(store, uid, url);
                if (!target) {
                    return;
                }
                if (features) {
                    vector_tile::setFeatures(*target, *features);
                } else {
                    vector_tile::onError(*target);
                }
            });
        });
    };
}
