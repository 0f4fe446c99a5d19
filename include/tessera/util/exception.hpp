#ifndef TESSERA_UTIL_EXCEPTION
#define TESSERA_UTIL_EXCEPTION

#include <stdexcept>
#include <string>

namespace tessera {
namespace util {

struct Exception : std::runtime_error {
    inline Exception(const char *msg) : std::runtime_error(msg) {}
    inline Exception(const std::string &msg) : std::runtime_error(msg) {}
};

// Raised when an API is called in a way its contract forbids, e.g. reading a
// key that is not in a cache.
struct MisuseException : Exception {
    inline MisuseException(const char *msg) : Exception(msg) {}
    inline MisuseException(const std::string &msg) : Exception(msg) {}
};

struct TileGridException : Exception {
    inline TileGridException(const char *msg) : Exception(msg) {}
    inline TileGridException(const std::string &msg) : Exception(msg) {}
};

struct TileLoadSequenceException : Exception {
    inline TileLoadSequenceException(const char *msg) : Exception(msg) {}
    inline TileLoadSequenceException(const std::string &msg) : Exception(msg) {}
};

struct TileInterimChainException : Exception {
    inline TileInterimChainException(const char *msg) : Exception(msg) {}
    inline TileInterimChainException(const std::string &msg) : Exception(msg) {}
};

struct TileKeyException : Exception {
    inline TileKeyException(const char *msg) : Exception(msg) {}
    inline TileKeyException(const std::string &msg) : Exception(msg) {}
};

}
}

#endif
