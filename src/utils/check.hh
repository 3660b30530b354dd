#include <string>

#include "boltz_error.hh"

#ifndef UTIL_CHECK_HH_
#define UTIL_CHECK_HH_

////////////////////////////////////////////////////////////////
// value wrappers that refuse illegal hyper-parameters at the
// point of construction
//
// e.g.,
//   struct learning_rate_t : public check_positive_t<Scalar> {
//     explicit learning_rate_t(const Scalar v)
//         : check_positive_t<Scalar>(v, "learning rate") {}
//   };

template <typename T>
struct check_positive_t {
    explicit check_positive_t(const T v, const std::string name = "value")
        : val(v)
    {
        BOLTZ_CHECK_CONFIG(v > static_cast<T>(0),
                           name << " must be positive: " << v);
    }
    const T val;
};

template <typename T>
struct check_nonneg_t {
    explicit check_nonneg_t(const T v, const std::string name = "value")
        : val(v)
    {
        BOLTZ_CHECK_CONFIG(v >= static_cast<T>(0),
                           name << " must be non-negative: " << v);
    }
    const T val;
};

// [0, 1)
template <typename T>
struct check_unit_interval_t {
    explicit check_unit_interval_t(const T v, const std::string name = "value")
        : val(v)
    {
        BOLTZ_CHECK_CONFIG(v >= static_cast<T>(0) && v < static_cast<T>(1),
                           name << " must lie in [0, 1): " << v);
    }
    const T val;
};

#endif
