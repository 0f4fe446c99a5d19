#include <tessera/tile/tile.hpp>
#include <tessera/tile/tile_kind.hpp>
#include <tessera/tile/tile_store.hpp>
#include <tessera/util/easing.hpp>
#include <tessera/util/exception.hpp>
#include <tessera/util/std.hpp>

#include <algorithm>
#include <sstream>

using namespace tessera;

namespace {

bool isSettled(TileState state) {
    return state == TileState::Loaded || state == TileState::Error || state == TileState::Empty;
}

// Marks a transition that has ended.
constexpr double TransitionDone = -1;

}

const char* tessera::TileStateName(TileState state) {
    switch (state) {
    case TileState::Idle:    return "idle";
    case TileState::Loading: return "loading";
    case TileState::Loaded:  return "loaded";
    case TileState::Error:   return "error";
    case TileState::Empty:   return "empty";
    }
    return "unknown";
}

Tile::Tile(TileStore& store_,
           TileUID uid_,
           const TileCoordinate& coord_,
           TileState state_,
           Payload payload_,
           const TileOptions& options)
    : store(store_),
      uid(uid_),
      coord(coord_),
      state(state_),
      transition(options.transition),
      interpolate(options.interpolate),
      payload(std::move(payload_)) {
}

Tile::~Tile() = default;

std::string Tile::getKey() const {
    std::ostringstream key;
    key << sourceKey << "/" << coord.z << "," << coord.x << "," << coord.y;
    return key.str();
}

void Tile::setState(TileState state_) {
    if (state != TileState::Error && state > state_) {
        throw util::TileLoadSequenceException("Tile load sequence violation");
    }
    state = state_;
    changed();
}

void Tile::load() {
    tileBehavior(getKind()).load(*this);
}

void Tile::release() {
    tileBehavior(getKind()).release(*this);

    // Lets observers that keep watching errored tiles let go of this one.
    if (state == TileState::Error) {
        setState(TileState::Empty);
    }

    observers.clear();
}

void Tile::setInterimTile(const Tile* tile) {
    if (!tile) {
        interimUID = NoTile;
        return;
    }
    if (&tile->store != &store) {
        throw util::TileInterimChainException("interim tile belongs to another store");
    }
    if (tile->uid >= uid) {
        throw util::TileInterimChainException("interim tile " + std::to_string(tile->uid) +
                                              " is not older than tile " + std::to_string(uid));
    }
    interimUID = tile->uid;
}

Tile& Tile::getInterimTile() {
    if (state == TileState::Loaded) {
        return *this;
    }

    // The chain is sorted newest first, so the first Loaded tile is the
    // freshest content available; everything behind it is older.
    for (Tile* tile = store.find(interimUID); tile; tile = store.find(tile->interimUID)) {
        if (tile->state == TileState::Loaded) {
            // The interim tile is on screen already, so this one must not
            // fade in once it loads.
            transition = 0;
            return *tile;
        }
    }
    return *this;
}

void Tile::refreshInterimChain() {
    Tile* prev = this;
    Tile* tile = store.find(interimUID);
    while (tile) {
        if (tile->state == TileState::Loaded) {
            // Older requests behind a loaded tile are of no interest anymore.
            const TileUID rest = tile->interimUID;
            tile->interimUID = NoTile;
            store.destroyChain(rest);
            break;
        }
        if (tile->state == TileState::Idle) {
            // Never started, so there is nothing to keep it for.
            prev->interimUID = tile->interimUID;
            store.destroy(tile->uid);
        } else {
            prev = tile;
        }
        tile = store.find(prev->interimUID);
    }
}

double Tile::getAlpha(const std::string& rendererId, double time) {
    if (!transition) {
        return 1;
    }

    double start;
    auto it = transitionStarts.find(rendererId);
    if (it == transitionStarts.end()) {
        start = time;
        transitionStarts.emplace(rendererId, start);
    } else if (it->second == TransitionDone) {
        return 1;
    } else {
        start = it->second;
    }

    // Offset by one frame so the first frame is not drawn fully transparent.
    const double delta = time - start + 1000.0 / 60;
    if (delta >= transition) {
        return 1;
    }
    return util::easeIn(delta / transition);
}

bool Tile::inTransition(const std::string& rendererId) const {
    if (!transition) {
        return false;
    }
    auto it = transitionStarts.find(rendererId);
    return it == transitionStarts.end() || it->second != TransitionDone;
}

void Tile::endTransition(const std::string& rendererId) {
    if (transition) {
        transitionStarts[rendererId] = TransitionDone;
    }
}

std::shared_future<TileState> Tile::ready() {
    if (!readyPromise) {
        readyPromise = util::make_unique<std::promise<TileState>>();
        readyFuture = readyPromise->get_future().share();
        resolveReady();
    }
    return readyFuture;
}

void Tile::addObserver(Observer* observer) {
    if (!hasObserver(observer)) {
        observers.push_back(observer);
    }
}

void Tile::removeObserver(Observer* observer) {
    observers.erase(std::remove(observers.begin(), observers.end(), observer), observers.end());
}

bool Tile::hasObserver(Observer* observer) const {
    return std::find(observers.begin(), observers.end(), observer) != observers.end();
}

void Tile::changed() {
    resolveReady();

    // Observers may detach themselves, or others, while being notified.
    const std::vector<Observer*> current = observers;
    for (Observer* observer : current) {
        if (hasObserver(observer)) {
            observer->onTileChanged(*this);
        }
    }
}

void Tile::resolveReady() {
    if (readyPromise && !readyResolved && isSettled(state)) {
        readyResolved = true;
        readyPromise->set_value(state);
    }
}
