#include <algorithm>
#include <cmath>

#include "boltz.hh"
#include "boltz_model.hh"
#include "boltz_tap.hh"

#ifndef BOLTZ_METRIC_HH_
#define BOLTZ_METRIC_HH_

namespace boltz {

////////////////////////////////////////////////////////////////
// Minibatch accumulators for monitoring
//
//   reset()     start over
//   update(..)  add one minibatch
//   value()     current estimate (NaN before any update)
////////////////////////////////////////////////////////////////

/// sqrt( sum_i |v_i - recon_i|^2 / n )
struct reconstruction_error_t {

    reconstruction_error_t() { reset(); }

    void reset()
    {
        sse = 0;
        norm = 0;
    }

    void update(const Mat &minibatch, const Mat &reconstructions)
    {
        BOLTZ_CHECK_SHAPE(minibatch.rows() == reconstructions.rows() &&
                              minibatch.cols() == reconstructions.cols(),
                          "reconstructions do not match the minibatch");
        sse += (minibatch - reconstructions).squaredNorm();
        norm += static_cast<Scalar>(minibatch.rows());
    }

    void update(const rbm_t &model, const Mat &minibatch)
    {
        update(minibatch, reconstruct(model, minibatch));
    }

    Scalar value() const
    {
        if (norm > 0)
            return std::sqrt(sse / norm);
        return NAN;
    }

private:
    Scalar sse;
    Scalar norm;
};

/// Szekely's energy distance between two samples, using at most
/// `downsample` rows of each
///   2 E|X - Y| - E|X - X'| - E|Y - Y'|
inline Scalar
sample_energy_distance(const Mat &xx, const Mat &yy, const Index downsample)
{
    BOLTZ_CHECK_SHAPE(xx.cols() == yy.cols(),
                      "samples have " << xx.cols() << " and " << yy.cols()
                                      << " columns");

    const Index nx = std::min(xx.rows(), downsample);
    const Index ny = std::min(yy.rows(), downsample);
    BOLTZ_CHECK_SHAPE(nx > 0 && ny > 0, "empty sample");

    auto mean_dist = [](const Mat &a,
                        const Index na,
                        const Mat &b,
                        const Index nb,
                        const bool same) -> Scalar {
        Scalar tot = 0;
        Scalar npair = 0;
        for (Index i = 0; i < na; ++i) {
            for (Index j = 0; j < nb; ++j) {
                if (same && i == j)
                    continue;
                tot += (a.row(i) - b.row(j)).norm();
                npair += 1;
            }
        }
        return npair > 0 ? tot / npair : 0;
    };

    const Scalar dxy = mean_dist(xx, nx, yy, ny, false);
    const Scalar dxx = mean_dist(xx, nx, xx, nx, true);
    const Scalar dyy = mean_dist(yy, ny, yy, ny, true);
    return 2.0 * dxy - dxx - dyy;
}

/// data minibatch vs. fantasy particles
struct energy_distance_t {

    explicit energy_distance_t(const Index _downsample = 100)
        : downsample(check_positive_t<Index>(_downsample, "downsample").val)
    {
        reset();
    }

    void reset()
    {
        tot = 0;
        norm = 0;
    }

    void update(const Mat &minibatch, const Mat &samples)
    {
        tot += sample_energy_distance(minibatch, samples, downsample);
        norm += 1;
    }

    Scalar value() const
    {
        if (norm > 0)
            return tot / norm;
        return NAN;
    }

    const Index downsample;

private:
    Scalar tot;
    Scalar norm;
};

/// mean F(data) - mean F(random); a trained model puts the data
/// at lower free energy, so this should become negative
struct energy_gap_t {

    energy_gap_t() { reset(); }

    void reset()
    {
        gap = 0;
        norm = 0;
    }

    void update(const rbm_t &model, const Mat &minibatch, const Mat &random)
    {
        gap += marginal_free_energy(model, minibatch).mean();
        gap -= marginal_free_energy(model, random).mean();
        norm += 1;
    }

    Scalar value() const
    {
        if (norm > 0)
            return gap / norm;
        return NAN;
    }

private:
    Scalar gap;
    Scalar norm;
};

/// (mean F(data) - mean F(random)) / sqrt(mean F(random)^2)
struct energy_zscore_t {

    energy_zscore_t() { reset(); }

    void reset()
    {
        data_mean = 0;
        random_mean = 0;
        random_mean_square = 0;
    }

    void update(const rbm_t &model, const Mat &minibatch, const Mat &random)
    {
        const Mat f_rand = marginal_free_energy(model, random);
        data_mean += marginal_free_energy(model, minibatch).mean();
        random_mean += f_rand.mean();
        random_mean_square += f_rand.cwiseProduct(f_rand).mean();
    }

    Scalar value() const
    {
        if (random_mean_square > 0)
            return (data_mean - random_mean) / std::sqrt(random_mean_square);
        return NAN;
    }

private:
    Scalar data_mean;
    Scalar random_mean;
    Scalar random_mean_square;
};

/// TAP estimate of Var[E] = d^2 log Z / d beta^2, averaged over
/// the models seen.  Bernoulli units on both layers.
struct heat_capacity_t {

    static tap_options_t default_options()
    {
        tap_options_t ret;
        ret.tolerance = 1e-10;
        ret.max_iters = 500;
        return ret;
    }

    explicit heat_capacity_t(const tap_options_t &_options = default_options())
        : options(_options)
    {
        validate_options(options);
        reset();
    }

    void reset()
    {
        tot = 0;
        norm = 0;
    }

    void update(const rbm_t &model)
    {
        tot += tap_heat_capacity(model, options);
        norm += 1;
    }

    Scalar value() const
    {
        if (norm > 0)
            return static_cast<Scalar>(tot / norm);
        return NAN;
    }

    const tap_options_t options;

private:
    double tot;
    double norm;
};

} // namespace boltz

#endif
