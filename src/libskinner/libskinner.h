///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef _libskinner_h_
#define _libskinner_h_

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <vector>

#define SKINNER_APP_NAME "Skinner"
#define SKINNER_VERSION  "1.0.0"

using coord_t  = int64_t;
using coordf_t = double;

//FIXME This epsilon value is used for many non-related purposes:
// for a threshold of a squared Euclidean distance, for a threshold of a cross product etc.
static constexpr double EPSILON = 1e-4;
// Scaling factor for a conversion from coord_t to coordf_t: 1e-6,
// a fixed point representation with 1nm resolution.
static constexpr double SCALING_FACTOR = 0.000001;

#define scale_(val) ((val) / SCALING_FACTOR)
#define SCALED_EPSILON scale_(EPSILON)

namespace Skinner {

template<typename T, typename Q>
inline T unscale(Q v) { return T(v) * T(SCALING_FACTOR); }

template <typename T>
inline void append(std::vector<T> &dest, const std::vector<T> &src)
{
    if (dest.empty())
        dest = src;
    else
        dest.insert(dest.end(), src.begin(), src.end());
}

template <typename T>
inline void append(std::vector<T> &dest, std::vector<T> &&src)
{
    if (dest.empty())
        dest = std::move(src);
    else {
        dest.insert(dest.end(),
            std::make_move_iterator(src.begin()),
            std::make_move_iterator(src.end()));
        // Release memory of the source now.
        src.clear();
        src.shrink_to_fit();
    }
}

template <typename T>
inline void sort_remove_duplicates(std::vector<T> &vec)
{
    std::sort(vec.begin(), vec.end());
    vec.erase(std::unique(vec.begin(), vec.end()), vec.end());
}

template <typename T>
constexpr inline T clamp(const T low, const T high, const T value)
{
    return std::max(low, std::min(high, value));
}

} // namespace Skinner

#endif // _libskinner_h_
