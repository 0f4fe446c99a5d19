#include <tessera/util/math.hpp>

#include <cmath>

namespace tessera {
namespace util {

double modulo(double a, double b) {
    const double r = std::fmod(a, b);
    return r * b < 0 ? r + b : r;
}

int32_t floorDiv(int32_t a, int32_t b) {
    int32_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

double roundHalfUp(double n) {
    return std::floor(n + 0.5);
}

double toFixed(double n, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return roundHalfUp(n * factor) / factor;
}

double round(double n, int decimals) {
    return roundHalfUp(toFixed(n, decimals));
}

double floor(double n, int decimals) {
    return std::floor(toFixed(n, decimals));
}

double ceil(double n, int decimals) {
    return std::ceil(toFixed(n, decimals));
}

std::size_t linearFindNearest(const std::vector<double>& arr, double target, int direction) {
    if (arr.empty() || arr[0] <= target) {
        return 0;
    }

    const std::size_t n = arr.size();
    if (target <= arr[n - 1]) {
        return n - 1;
    }

    if (direction > 0) {
        for (std::size_t i = 1; i < n; ++i) {
            if (arr[i] < target) {
                return i - 1;
            }
        }
    } else if (direction < 0) {
        for (std::size_t i = 1; i < n; ++i) {
            if (arr[i] <= target) {
                return i;
            }
        }
    } else {
        for (std::size_t i = 1; i < n; ++i) {
            if (arr[i] == target) {
                return i;
            }
            if (arr[i] < target) {
                if (arr[i - 1] - target < target - arr[i]) {
                    return i - 1;
                }
                return i;
            }
        }
    }
    return n - 1;
}

std::size_t linearFindNearest(const std::vector<double>& arr, double target,
                              const NearestDirectionFunction& direction) {
    if (arr.empty() || arr[0] <= target) {
        return 0;
    }

    const std::size_t n = arr.size();
    if (target <= arr[n - 1]) {
        return n - 1;
    }

    for (std::size_t i = 1; i < n; ++i) {
        const double candidate = arr[i];
        if (candidate == target) {
            return i;
        }
        if (candidate < target) {
            const double decision = direction(target, arr[i - 1], candidate);
            if (decision > 0) {
                return i - 1;
            } else if (decision < 0) {
                return i;
            } else if (arr[i - 1] - target < target - arr[i]) {
                return i - 1;
            }
            return i;
        }
    }
    return n - 1;
}

bool isSorted(const std::vector<double>& arr,
              const std::function<double(double, double)>& compare,
              bool strictly) {
    for (std::size_t i = 1; i < arr.size(); ++i) {
        const double res = compare(arr[i - 1], arr[i]);
        if (res > 0 || (strictly && res == 0)) {
            return false;
        }
    }
    return true;
}

} // namespace util
} // namespace tessera
