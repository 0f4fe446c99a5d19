#include <tessera/tile/canvas_pool.hpp>

using namespace tessera;

Canvas::Canvas(int32_t width_, int32_t height_)
    : width(width_), height(height_), data(std::size_t(width_) * height_ * 4) {
}

void Canvas::resize(int32_t width_, int32_t height_) {
    width = width_;
    height = height_;
    data.resize(std::size_t(width) * height * 4);
}

std::shared_ptr<Canvas> CanvasPool::acquire(int32_t width, int32_t height) {
    if (canvases.empty()) {
        return std::make_shared<Canvas>(width, height);
    }
    std::shared_ptr<Canvas> canvas = std::move(canvases.back());
    canvases.pop_back();
    canvas->resize(width, height);
    return canvas;
}

void CanvasPool::recycle(std::shared_ptr<Canvas> canvas) {
    if (!canvas) {
        return;
    }
    canvas->resize(1, 1);
    canvases.push_back(std::move(canvas));
}
