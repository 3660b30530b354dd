#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "boltz.hh"
#include "boltz_gradient.hh"
#include "boltz_model.hh"
#include "boltz_options.hh"

#ifndef BOLTZ_TAP_HH_
#define BOLTZ_TAP_HH_

////////////////////////////////////////////////////////////////
// TAP (Thouless-Anderson-Palmer) free energy of a Bernoulli RBM
//
// For magnetizations m = (mv, mh) in (0,1), with q = m - m^2,
//
//   Gamma(m) = sum m log m + (1 - m) log(1 - m)      (v and h)
//            - a'mv - b'mh - mv' W mh
//            - 1/2 qv' (W o W) qh                     (2nd order)
//
// and -log Z ~ min_m Gamma(m).  Gradient descent from a seed
// finds the minimizer; the step size is halved whenever the
// potential would go up.
//
// Since log p(v) = -F(v) + min_m Gamma(m), the log-likelihood
// gradient is the data statistics plus dGamma/dtheta at the
// minimizer:
//
//   dGamma/da = -mv,  dGamma/db = -mh,
//   dGamma/dW = -mv mh' - W o (qv qh')                (2nd order)
//
// so the negative phase is deterministic given the seed.
////////////////////////////////////////////////////////////////

namespace boltz {

// potentials are accumulated in double precision
using DMat = Eigen::MatrixXd;
using DVec = Eigen::VectorXd;

// magnetizations stay within [TAP_EPS, 1 - TAP_EPS]
constexpr double TAP_EPS = 1e-6;

// the search gives up once the step size falls below this
constexpr double TAP_MIN_LR = 1e-10;

struct magnetization_t {
    DVec v; // #visible, P(v_i = 1)
    DVec h; // #hidden
};

inline bool
is_bernoulli_rbm(const rbm_t &model)
{
    return unit_type(model.visible) == BERNOULLI &&
        unit_type(model.hidden) == BERNOULLI;
}

inline void
check_tap_model(const rbm_t &model)
{
    BOLTZ_CHECK_CONFIG(is_bernoulli_rbm(model),
                       "TAP needs Bernoulli units on both layers, not "
                           << unit_name(unit_type(model.visible)) << " x "
                           << unit_name(unit_type(model.hidden)));
}

/// parameters of the energy scaled by the inverse temperature beta
struct tap_problem_t {

    explicit tap_problem_t(const rbm_t &model,
                           const int _terms,
                           const double beta = 1.0)
        : terms(_terms)
    {
        check_tap_model(model);
        a = beta * layer_bias(model.visible).col(0).cast<double>();
        b = beta * layer_bias(model.hidden).col(0).cast<double>();
        W = beta * model.weight.cast<double>();
        W2 = W.cwiseProduct(W);
    }

    Index num_visible() const { return a.size(); }
    Index num_hidden() const { return b.size(); }

    DVec a;
    DVec b;
    DMat W;
    DMat W2;
    const int terms;
};

inline DVec
clip_magnetization(const DVec &m)
{
    return m.cwiseMax(TAP_EPS).cwiseMin(1.0 - TAP_EPS);
}

// sum m log m + (1 - m) log(1 - m)
inline double
negative_entropy(const DVec &m)
{
    const DVec mc = DVec::Ones(m.size()) - m;
    return (m.array() * m.array().log()).sum() +
        (mc.array() * mc.array().log()).sum();
}

inline DVec
variance_of(const DVec &m)
{
    return (m.array() - m.array().square()).matrix();
}

inline double
gibbs_potential(const tap_problem_t &prob, const magnetization_t &m)
{
    double ret = negative_entropy(m.v) + negative_entropy(m.h);
    ret -= prob.a.dot(m.v) + prob.b.dot(m.h) + m.v.dot(prob.W * m.h);
    if (prob.terms >= 2) {
        ret -= 0.5 * variance_of(m.v).dot(prob.W2 * variance_of(m.h));
    }
    return ret;
}

inline void
gibbs_potential_gradient(const tap_problem_t &prob,
                         const magnetization_t &m,
                         DVec &grad_v,
                         DVec &grad_h)
{
    const DVec one_v = DVec::Ones(m.v.size());
    const DVec one_h = DVec::Ones(m.h.size());

    grad_v = (m.v.array() / (one_v - m.v).array()).log().matrix() - prob.a -
        prob.W * m.h;
    grad_h = (m.h.array() / (one_h - m.h).array()).log().matrix() - prob.b -
        prob.W.transpose() * m.v;

    if (prob.terms >= 2) {
        const DVec qv = variance_of(m.v);
        const DVec qh = variance_of(m.h);
        grad_v.array() -=
            (0.5 - m.v.array()) * (prob.W2 * qh).array();
        grad_h.array() -=
            (0.5 - m.h.array()) * (prob.W2.transpose() * qv).array();
    }
}

/// m_i ~ Uniform(0.005, 0.995)
template <typename RNG>
magnetization_t
random_magnetization(const Index num_visible, const Index num_hidden, RNG &rng)
{
    std::uniform_real_distribution<double> runif(0.0, 1.0);
    magnetization_t m;
    m.v.resize(num_visible);
    m.h.resize(num_hidden);
    for (Index j = 0; j < num_visible; ++j)
        m.v(j) = 0.99 * runif(rng) + 0.005;
    for (Index j = 0; j < num_hidden; ++j)
        m.h(j) = 0.99 * runif(rng) + 0.005;
    return m;
}

/// sigmoid of the biases, the minimizer without coupling
inline magnetization_t
naive_magnetization(const tap_problem_t &prob)
{
    auto sigm = [](const double x) { return 1.0 / (1.0 + std::exp(-x)); };
    magnetization_t m;
    m.v = clip_magnetization(prob.a.unaryExpr(sigm));
    m.h = clip_magnetization(prob.b.unaryExpr(sigm));
    return m;
}

////////////////////////////////////////////////////////////////
// Damped gradient descent on Gamma, starting from m (which is
// overwritten by the minimizer).  Returns Gamma at the minimizer.
inline double
minimize_gibbs_potential(const tap_problem_t &prob,
                         magnetization_t &m,
                         const tap_options_t &options)
{
    BOLTZ_CHECK_SHAPE(m.v.size() == prob.num_visible() &&
                          m.h.size() == prob.num_hidden(),
                      "magnetization does not match the model");

    m.v = clip_magnetization(m.v);
    m.h = clip_magnetization(m.h);

    double lr = options.learning_rate;
    double gam = gibbs_potential(prob, m);
    DVec grad_v, grad_h;
    magnetization_t next;

    for (Index iter = 0; iter < options.max_iters; ++iter) {
        gibbs_potential_gradient(prob, m, grad_v, grad_h);
        next.v = clip_magnetization(m.v - lr * grad_v);
        next.h = clip_magnetization(m.h - lr * grad_h);
        const double next_gam = gibbs_potential(prob, next);

        if (next_gam > gam) {
            lr *= 0.5;
            if (lr < TAP_MIN_LR)
                break;
            continue;
        }

        const bool converged = (gam - next_gam) < options.tolerance;
        std::swap(m, next);
        gam = next_gam;
        if (converged)
            break;
    }

    return gam;
}

/// -log Z ~ min Gamma, searched from the naive mean field
inline double
tap_free_energy(const rbm_t &model,
                const tap_options_t &options,
                magnetization_t *argmin = nullptr)
{
    const tap_problem_t prob(model, options.terms);
    magnetization_t m = naive_magnetization(prob);
    const double ret = minimize_gibbs_potential(prob, m, options);
    if (argmin)
        *argmin = m;
    return ret;
}

////////////////////////////////////////////////////////////////
// Heat capacity d^2 log Z / d beta^2 = Var[E] at beta = 1
//
// log Z(beta) is the TAP estimate for the model with all of its
// parameters scaled by beta; the second derivative is a central
// difference with step `delta`.  Each side starts from the
// minimizer at beta = 1.
inline double
tap_heat_capacity(const rbm_t &model,
                  const tap_options_t &options,
                  const double delta = 0.05)
{
    check_positive_t<double>(delta, "temperature step");

    magnetization_t m0;
    const double f0 = tap_free_energy(model, options, &m0);

    magnetization_t m_hi = m0, m_lo = m0;
    const double f_hi =
        minimize_gibbs_potential(tap_problem_t(model,
                                               options.terms,
                                               1.0 + delta),
                                 m_hi,
                                 options);
    const double f_lo =
        minimize_gibbs_potential(tap_problem_t(model,
                                               options.terms,
                                               1.0 - delta),
                                 m_lo,
                                 options);

    // log Z = -F
    return -(f_hi - 2.0 * f0 + f_lo) / (delta * delta);
}

/// negative phase statistics at the magnetization m
inline phase_stat_t
tap_phase_statistics(const tap_problem_t &prob, const magnetization_t &m)
{
    phase_stat_t stat;
    stat.visible = m.v.transpose().cast<Scalar>();
    stat.hidden = m.h.transpose().cast<Scalar>();
    stat.visible_mean = m.v.cast<Scalar>();
    stat.hidden_mean = m.h.cast<Scalar>();

    DMat outer = m.v * m.h.transpose();
    if (prob.terms >= 2) {
        outer += prob.W.cwiseProduct(variance_of(m.v) *
                                     variance_of(m.h).transpose());
    }
    stat.outer = outer.cast<Scalar>();

    stat.visible_log_var = Mat::Zero(0, 1);
    stat.hidden_log_var = Mat::Zero(0, 1);
    return stat;
}

////////////////////////////////////////////////////////////////
// Negative phase by minimizing the TAP free energy
//
// Without persistent seeds every call starts from a fresh random
// magnetization.  With k seeds, all k are descended from where
// the previous call left them and the lowest one is used.
////////////////////////////////////////////////////////////////

struct tap_estimator_t {

    explicit tap_estimator_t(const tap_options_t &_options)
        : options(_options)
    {
        validate_options(options);
    }

    template <typename RNG>
    phase_stat_t negative_phase(const rbm_t &model, RNG &rng)
    {
        const tap_problem_t prob(model, options.terms);
        const Index nv = prob.num_visible(), nh = prob.num_hidden();

        magnetization_t m;
        double gam;

        if (options.num_seeds < 1) {
            m = random_magnetization(nv, nh, rng);
            gam = minimize_gibbs_potential(prob, m, options);
        } else {
            if (seeds.empty()) {
                for (Index s = 0; s < options.num_seeds; ++s)
                    seeds.emplace_back(random_magnetization(nv, nh, rng));
            }
            gam = std::numeric_limits<double>::infinity();
            for (magnetization_t &seed : seeds) {
                const double g = minimize_gibbs_potential(prob, seed, options);
                if (g < gam || !std::isfinite(g)) {
                    gam = g;
                    m = seed;
                }
                if (!std::isfinite(g))
                    break;
            }
        }

        BOLTZ_THROW_IF(!std::isfinite(gam),
                       numerical_divergence_t,
                       "non-finite TAP free energy");
        last_free_energy = gam;
        return tap_phase_statistics(prob, m);
    }

    bool has_seeds() const { return !seeds.empty(); }

    /// #seeds x #visible
    Mat seed_visible() const
    {
        Mat ret(static_cast<Index>(seeds.size()),
                seeds.empty() ? 0 : seeds.front().v.size());
        for (std::size_t s = 0; s < seeds.size(); ++s)
            ret.row(s) = seeds.at(s).v.transpose().cast<Scalar>();
        return ret;
    }

    /// #seeds x #hidden
    Mat seed_hidden() const
    {
        Mat ret(static_cast<Index>(seeds.size()),
                seeds.empty() ? 0 : seeds.front().h.size());
        for (std::size_t s = 0; s < seeds.size(); ++s)
            ret.row(s) = seeds.at(s).h.transpose().cast<Scalar>();
        return ret;
    }

    void set_seeds(const Mat &visible, const Mat &hidden)
    {
        BOLTZ_CHECK_CONFIG(visible.rows() == options.num_seeds,
                           "expected " << options.num_seeds
                                       << " TAP seeds, found "
                                       << visible.rows());
        BOLTZ_CHECK_SHAPE(hidden.rows() == visible.rows(),
                          "TAP seeds: " << visible.rows() << " visible vs. "
                                        << hidden.rows() << " hidden");
        BOLTZ_CHECK_FINITE(visible, "TAP seeds");
        BOLTZ_CHECK_FINITE(hidden, "TAP seeds");

        std::vector<magnetization_t> next(visible.rows());
        for (Index s = 0; s < visible.rows(); ++s) {
            next[s].v = clip_magnetization(
                visible.row(s).transpose().cast<double>());
            next[s].h = clip_magnetization(
                hidden.row(s).transpose().cast<double>());
        }
        seeds.swap(next);
    }

    void reset() { seeds.clear(); }

    const tap_options_t options;
    double last_free_energy = NAN;

private:
    std::vector<magnetization_t> seeds;
};

/// data statistics minus the TAP negative phase
template <typename RNG>
estimate_t
estimate_tap_with_stats(const rbm_t &model,
                        const Mat &data_batch,
                        tap_estimator_t &estimator,
                        RNG &rng)
{
    estimate_t ret;
    ret.positive = positive_phase_statistics(model, data_batch);
    ret.negative = estimator.negative_phase(model, rng);
    ret.grad = contrastive_gradient(model, ret.positive, ret.negative);
    return ret;
}

template <typename RNG>
gradient_t
estimate_tap_gradient(const rbm_t &model,
                      const Mat &data_batch,
                      tap_estimator_t &estimator,
                      RNG &rng)
{
    return estimate_tap_with_stats(model, data_batch, estimator, rng).grad;
}

} // namespace boltz

#endif
