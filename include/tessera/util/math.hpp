#ifndef TESSERA_UTIL_MATH
#define TESSERA_UTIL_MATH

#include <cstdint>
#include <functional>
#include <vector>

namespace tessera {
namespace util {

template <typename T>
T clamp(T value, T min, T max) {
    return value < min ? min : (value > max ? max : value);
}

// Result carries the sign of the divisor.
double modulo(double a, double b);

// Integer division that rounds toward negative infinity.
int32_t floorDiv(int32_t a, int32_t b);

// Rounds half-way cases toward positive infinity.
double roundHalfUp(double n);

double toFixed(double n, int decimals);

// Snap to an integer after discarding everything beyond `decimals` digits,
// so that 2.9999999999 floors to 3 rather than 2.
double round(double n, int decimals);
double floor(double n, int decimals);
double ceil(double n, int decimals);

// Decides between two neighbouring values of a descending array:
// positive picks `high`, negative picks `low`, zero falls back to nearest.
using NearestDirectionFunction = std::function<double(double value, double high, double low)>;

// Index of the element of a descending array that is nearest to `target`.
// A positive direction prefers the higher value, a negative direction the
// lower one.
std::size_t linearFindNearest(const std::vector<double>& arr, double target, int direction);
std::size_t linearFindNearest(const std::vector<double>& arr, double target,
                              const NearestDirectionFunction& direction);

// True if every element compares strictly before its successor
// (or, when `strictly` is false, not after it).
bool isSorted(const std::vector<double>& arr,
              const std::function<double(double, double)>& compare,
              bool strictly);

} // namespace util
} // namespace tessera

#endif
