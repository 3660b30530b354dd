#include <algorithm>
#include <cmath>

#ifndef _UTIL_MATH_HH_
#define _UTIL_MATH_HH_

/////////////////////
// log(1 + exp(x)) //
/////////////////////

template <typename T>
inline T
_softplus(const T x)
{
    const T cutoff = static_cast<T>(10.);
    if (x > cutoff) {
        return x + std::log1p(std::exp(-x));
    }
    return std::log1p(std::exp(x));
}

///////////////////////////////////////
// 1 / (1 + exp(-x)), clamped at cap //
///////////////////////////////////////

template <typename T>
struct clamped_sigmoid_op_t {
    explicit clamped_sigmoid_op_t(const T _cap)
        : cap(_cap)
    {
    }
    const T operator()(const T &x) const
    {
        if (std::isnan(x))
            return x;
        const T z = std::max(-cap, std::min(cap, x));
        return one / (one + std::exp(-z));
    }
    const T cap;
    static constexpr T one = 1.0;
};

template <typename T>
struct softplus_op_t {
    const T operator()(const T &x) const { return _softplus(x); }
};

#endif
