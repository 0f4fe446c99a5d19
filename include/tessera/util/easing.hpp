#ifndef TESSERA_UTIL_EASING
#define TESSERA_UTIL_EASING

namespace tessera {
namespace util {

// Start slow and speed up.
inline double easeIn(double t) {
    return t * t * t;
}

}
}

#endif
