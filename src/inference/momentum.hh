#include <eigen3/Eigen/Dense>

#ifndef MOMENTUM_HH_
#define MOMENTUM_HH_

////////////////////////////////
// heavy-ball velocity        //
//   V <- mu * V + G          //
////////////////////////////////

template <typename T, typename Scalar>
struct momentum_t {
    explicit momentum_t(const Scalar _mu,
                        const typename T::Index r,
                        const typename T::Index c)
        : mu(_mu)
        , V(T::Zero(r, c))
    {
    }

    const Scalar mu;
    T V; // velocity
};

template <typename T, typename Scalar, typename Derived>
const T &
update_momentum(momentum_t<T, Scalar> &mom,
                const Eigen::MatrixBase<Derived> &g)
{
    mom.V = mom.mu * mom.V + g.derived();
    return mom.V;
}

#endif
