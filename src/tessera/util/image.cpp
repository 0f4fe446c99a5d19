#include <tessera/util/image.hpp>
#include <tessera/util/exception.hpp>

#include <string>

namespace tessera {
namespace util {

Image::Image(int32_t width_, int32_t height_)
    : width(width_), height(height_), data(std::size_t(width_) * height_ * 4, 0) {
}

Image::Image(int32_t width_, int32_t height_, std::vector<uint8_t> data_)
    : width(width_), height(height_), data(std::move(data_)) {
    if (data.size() != std::size_t(width) * height * 4) {
        throw MisuseException("image data does not match " + std::to_string(width) + "x" +
                              std::to_string(height) + " RGBA pixels");
    }
}

Image blankImage() {
    return Image(1, 1);
}

}
}
