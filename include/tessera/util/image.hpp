#ifndef TESSERA_UTIL_IMAGE
#define TESSERA_UTIL_IMAGE

#include <cstdint>
#include <vector>

namespace tessera {
namespace util {

// Decoded RGBA pixels.
class Image {
public:
    Image() = default;
    Image(int32_t width, int32_t height);
    Image(int32_t width, int32_t height, std::vector<uint8_t> data);

    bool empty() const { return width == 0 || height == 0; }

    int32_t width = 0;
    int32_t height = 0;
    std::vector<uint8_t> data;
};

// A fully transparent 1x1 image.
Image blankImage();

}
}

#endif
