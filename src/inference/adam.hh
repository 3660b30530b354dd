#include <cmath>
#include <eigen3/Eigen/Dense>

#ifndef ADAM_HH_
#define ADAM_HH_

////////////////////////////////////////////////////////////////
// Adaptive moment estimation (Kingma & Ba, 2014)
//
//   M <- b1 * M + (1 - b1) * G
//   V <- b2 * V + (1 - b2) * G^2
//   step = [M / (1 - b1^t)] / [sqrt(V / (1 - b2^t)) + eps]
//
// The caller decides the direction and the learning rate.
////////////////////////////////////////////////////////////////

template <typename T, typename Scalar>
struct adam_t {
    explicit adam_t(const Scalar _b1,
                    const Scalar _b2,
                    const typename T::Index r,
                    const typename T::Index c,
                    const Scalar _eps = 1e-8)
        : beta1(_b1)
        , beta2(_b2)
        , eps(_eps)
        , t(0)
        , M(T::Zero(r, c))
        , V(T::Zero(r, c))
    {
    }

    const Scalar beta1;
    const Scalar beta2;
    const Scalar eps;

    Scalar t; // number of updates so far
    T M;      // first moment
    T V;      // second moment
};

template <typename T, typename Scalar, typename Derived>
T
update_adam(adam_t<T, Scalar> &adam, const Eigen::MatrixBase<Derived> &_g)
{
    const Derived &g = _g.derived();
    const Scalar one = 1.0;

    adam.t += one;
    adam.M = adam.beta1 * adam.M + (one - adam.beta1) * g;
    adam.V = adam.beta2 * adam.V + (one - adam.beta2) * g.cwiseProduct(g);

    const Scalar c1 = one - std::pow(adam.beta1, adam.t);
    const Scalar c2 = one - std::pow(adam.beta2, adam.t);
    const Scalar eps = adam.eps;

    return (adam.M / c1).binaryExpr(adam.V / c2,
                                    [eps](const Scalar &m, const Scalar &v) {
                                        return m / (std::sqrt(v) + eps);
                                    });
}

#endif
