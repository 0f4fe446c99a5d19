#ifndef TESSERA_TILE_CANVAS_POOL
#define TESSERA_TILE_CANVAS_POOL

#include <tessera/util/noncopyable.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace tessera {

// An RGBA drawing surface a renderer draws a tile layer into.
class Canvas {
public:
    Canvas(int32_t width, int32_t height);

    void resize(int32_t width, int32_t height);

    int32_t width;
    int32_t height;
    std::vector<uint8_t> data;
};

// Keeps released canvases for reuse by later render tiles. A reused canvas
// keeps whatever pixels it had; callers overwrite it before reading.
class CanvasPool : private util::noncopyable {
public:
    CanvasPool() = default;

    // Takes a pooled canvas if there is one, otherwise allocates.
    std::shared_ptr<Canvas> acquire(int32_t width, int32_t height);

    // Shrinks the canvas to 1x1 and keeps it for the next acquire().
    void recycle(std::shared_ptr<Canvas>);

    std::size_t size() const { return canvases.size(); }

private:
    std::vector<std::shared_ptr<Canvas>> canvases;
};

}

#endif
