#include <eigen3/Eigen/Dense>
#include <random>

#ifndef SAMPLER_HH_
#define SAMPLER_HH_

///////////////////////////////////////////////////////////////
// Element-wise random draws over dense matrices.            //
//                                                           //
// The generator is always handed in by the caller, and the  //
// elements are visited in storage order, so the same seed   //
// reproduces the same draws.                                //
///////////////////////////////////////////////////////////////

// x[i,j] ~ Bernoulli(p[i,j])
template <typename Scalar>
struct bernoulli_sampler_t {
    using Mat = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

    template <typename Derived, typename RNG>
    Mat operator()(const Eigen::MatrixBase<Derived> &_prob, RNG &rng) const
    {
        Mat ret = _prob.derived();
        std::uniform_real_distribution<Scalar> runif(0.0, 1.0);
        Scalar *x = ret.data();
        for (std::ptrdiff_t j = 0; j < ret.size(); ++j) {
            x[j] = (runif(rng) < x[j]) ? one : zero;
        }
        return ret;
    }

    static constexpr Scalar one = 1.0;
    static constexpr Scalar zero = 0.0;
};

// x[i,j] ~ N(mu[i,j], sd[j]^2)
template <typename Scalar>
struct gaussian_sampler_t {
    using Mat = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

    template <typename Derived, typename Derived2, typename RNG>
    Mat operator()(const Eigen::MatrixBase<Derived> &_mu,
                   const Eigen::MatrixBase<Derived2> &_sd, // 1 x cols
                   RNG &rng) const
    {
        const Derived &mu = _mu.derived();
        const Derived2 &sd = _sd.derived();
        Mat eps(mu.rows(), mu.cols());
        std::normal_distribution<Scalar> rnorm(0.0, 1.0);
        Scalar *e = eps.data();
        for (std::ptrdiff_t j = 0; j < eps.size(); ++j) {
            e[j] = rnorm(rng);
        }
        return mu + eps * sd.asDiagonal();
    }
};

#endif
