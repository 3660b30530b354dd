#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "boltz_gradient.hh"

using namespace boltz;

namespace {

double
mean_neg_free_energy(const rbm_t &model, const Mat &v)
{
    return -marginal_free_energy(model, v).cast<double>().mean();
}

gradient_t
as_gradient(const phase_stat_t &stat)
{
    gradient_t ret;
    ret.visible_bias = stat.visible_mean;
    ret.hidden_bias = stat.hidden_mean;
    ret.visible_log_var = stat.visible_log_var;
    ret.hidden_log_var = stat.hidden_log_var;
    ret.weight = stat.outer;
    return ret;
}

// central differences of the mean of -F(v) against the clamped
// statistics, which should be its exact derivative
void
check_free_energy_derivative(const rbm_t &model, const Mat &v)
{
    const gradient_t analytic =
        as_gradient(positive_phase_statistics(model, v));

    std::vector<const Mat *> tensors;
    std::vector<std::string> names;
    for_each_param(analytic, [&](const std::string &name, const Mat &g) {
        tensors.emplace_back(&g);
        names.emplace_back(name);
    });

    const Scalar eps = 1e-2;

    auto perturbed = [&](const std::size_t k,
                         const Index i,
                         const Index j,
                         const Scalar delta) {
        rbm_t m = model;
        std::size_t idx = 0;
        for_each_param(m, [&](const std::string &, Mat &theta) {
            if (idx++ == k)
                theta(i, j) += delta;
        });
        return mean_neg_free_energy(m, v);
    };

    for (std::size_t k = 0; k < tensors.size(); ++k) {
        const Mat &g = *tensors.at(k);
        for (Index i = 0; i < g.rows(); ++i) {
            for (Index j = 0; j < g.cols(); ++j) {
                const double numeric =
                    (perturbed(k, i, j, eps) - perturbed(k, i, j, -eps)) /
                    (2.0 * eps);
                EXPECT_NEAR(g(i, j), numeric, 2e-3)
                    << names.at(k) << "(" << i << ", " << j << ")";
            }
        }
    }
}

} // namespace

TEST(Gradient, PositivePhaseIsFreeEnergyDerivativeBernoulli)
{
    RNG rng(1);
    model_options_t options;
    options.num_visible = 4;
    options.num_hidden = 3;
    options.weight_sd = 0.5;
    rbm_t model = make_model(options, rng);
    layer_bias(model.visible) << 0.2, -0.1, 0.3, 0.0;
    layer_bias(model.hidden) << -0.3, 0.1, 0.4;

    const Mat v = random_state(model.visible, 7, rng);
    check_free_energy_derivative(model, v);
}

TEST(Gradient, PositivePhaseIsFreeEnergyDerivativeGaussian)
{
    RNG rng(2);
    model_options_t options;
    options.num_visible = 3;
    options.num_hidden = 2;
    options.visible_type = GAUSSIAN;
    options.visible_var = 1.5;
    options.learn_var = true;
    options.weight_sd = 0.3;
    rbm_t model = make_model(options, rng);
    layer_bias(model.visible) << 0.5, -0.5, 0.1;

    const Mat v = random_state(model.visible, 6, rng);
    check_free_energy_derivative(model, v);
}

TEST(Gradient, PositivePhaseIsFreeEnergyDerivativeHopfield)
{
    RNG rng(3);
    model_options_t options;
    options.num_visible = 3;
    options.num_hidden = 2;
    options.hidden_type = GAUSSIAN;
    options.hidden_var = 0.5;
    options.learn_var = true;
    options.weight_sd = 0.3;
    rbm_t model = make_model(options, rng);

    const Mat v = random_state(model.visible, 5, rng);
    check_free_energy_derivative(model, v);
}

TEST(Gradient, MatchesExactLikelihoodGradient)
{
    rbm_t model = make_rbm(2, 2);
    layer_bias(model.visible) << 0.3, -0.2;
    layer_bias(model.hidden) << 0.1, -0.4;
    model.weight << 0.5, -0.3, //
        0.2, 0.6;

    Mat data(4, 2);
    data << 1, 0, //
        1, 1,     //
        0, 0,     //
        1, 0;

    // exact model expectation over the four visible states
    Mat states(4, 2);
    states << 0, 0, //
        0, 1,       //
        1, 0,       //
        1, 1;
    const Mat free_energy = marginal_free_energy(model, states);
    const Vec weight = (-free_energy.col(0)).array().exp().matrix();
    const Scalar Z = weight.sum();

    gradient_t model_side = zero_gradient(model);
    for (Index r = 0; r < states.rows(); ++r) {
        const phase_stat_t st = phase_statistics(model, states.row(r));
        const Scalar p = weight(r) / Z;
        model_side.visible_bias += p * st.visible_mean;
        model_side.hidden_bias += p * st.hidden_mean;
        model_side.weight += p * st.outer;
    }
    const gradient_t data_side =
        as_gradient(positive_phase_statistics(model, data));
    const gradient_t exact = grad_mapzip(
        [](const Scalar &a, const Scalar &b) { return a - b; },
        data_side,
        model_side);

    // many independent chains started at the data
    const Index nrep = 5000;
    Mat replicated(data.rows() * nrep, 2);
    for (Index r = 0; r < nrep; ++r)
        replicated.middleRows(r * data.rows(), data.rows()) = data;

    RNG rng(17);
    gibbs_sampler_t sampler(train_options_t::CD);
    const gradient_t est =
        estimate_gradient(model, replicated, sampler, 50, rng);

    const Scalar tol = 0.02;
    for (Index j = 0; j < 2; ++j) {
        EXPECT_NEAR(est.visible_bias(j), exact.visible_bias(j), tol);
        EXPECT_NEAR(est.hidden_bias(j), exact.hidden_bias(j), tol);
        for (Index k = 0; k < 2; ++k)
            EXPECT_NEAR(est.weight(j, k), exact.weight(j, k), tol);
    }
}

TEST(Gradient, ZeroStepContrastiveDivergenceIsZero)
{
    RNG rng(4);
    model_options_t options;
    options.num_visible = 5;
    options.num_hidden = 3;
    options.weight_sd = 0.5;
    const rbm_t model = make_model(options, rng);
    const Mat data = random_state(model.visible, 10, rng);

    gibbs_sampler_t sampler;
    const gradient_t grad = estimate_gradient(model, data, sampler, 0, rng);
    EXPECT_EQ(grad_magnitude(grad), 0.0);
}

TEST(Gradient, ShapesFollowTheModel)
{
    RNG rng(5);
    const rbm_t fixed = make_gaussian_rbm(4, 3, 1.0, false);
    const rbm_t learned = make_gaussian_rbm(4, 3, 1.0, true);
    const Mat data = Mat::Ones(6, 4);
    gibbs_sampler_t sampler;

    const gradient_t g0 = estimate_gradient(fixed, data, sampler, 1, rng);
    EXPECT_EQ(g0.visible_bias.rows(), 4);
    EXPECT_EQ(g0.hidden_bias.rows(), 3);
    EXPECT_EQ(g0.weight.rows(), 4);
    EXPECT_EQ(g0.weight.cols(), 3);
    EXPECT_EQ(g0.visible_log_var.rows(), 4);
    EXPECT_EQ(g0.visible_log_var.squaredNorm(), 0.0);
    EXPECT_EQ(g0.hidden_log_var.size(), 0);

    const gradient_t g1 = estimate_gradient(learned, data, sampler, 1, rng);
    EXPECT_EQ(g1.visible_log_var.rows(), 4);
    EXPECT_GT(g1.visible_log_var.squaredNorm(), 0.0);
}

TEST(Gradient, NonFiniteDataDiverges)
{
    RNG rng(6);
    const rbm_t model = make_rbm(3, 2);
    Mat data = Mat::Ones(4, 3);
    data(2, 1) = NAN;

    gibbs_sampler_t sampler;
    EXPECT_THROW(estimate_gradient(model, data, sampler, 1, rng),
                 numerical_divergence_t);
}

TEST(Gradient, ArithmeticAndMagnitude)
{
    gradient_t g;
    g.visible_bias = Mat::Constant(2, 1, 2.0);
    g.hidden_bias = Mat::Constant(3, 1, 2.0);
    g.visible_log_var = Mat::Zero(0, 1);
    g.hidden_log_var = Mat::Zero(0, 1);
    g.weight = Mat::Constant(2, 3, 2.0);

    EXPECT_FLOAT_EQ(grad_magnitude(g), 2.0);

    const gradient_t half =
        grad_apply([](const Scalar &x) { return x / 2; }, g);
    EXPECT_FLOAT_EQ(grad_magnitude(half), 1.0);

    const gradient_t sum = grad_mapzip(
        [](const Scalar &a, const Scalar &b) { return a + b; }, g, half);
    EXPECT_FLOAT_EQ(sum.weight(1, 2), 3.0);
    EXPECT_TRUE(grad_is_finite(sum));

    g.weight(0, 0) = INFINITY;
    EXPECT_FALSE(grad_is_finite(g));
}
