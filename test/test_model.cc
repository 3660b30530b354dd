#include <cmath>

#include <gtest/gtest.h>

#include "boltz_model.hh"

using namespace boltz;

namespace {

rbm_t
small_rbm()
{
    rbm_t model = make_rbm(3, 2);
    layer_bias(model.visible) << 0.1, -0.2, 0.3;
    layer_bias(model.hidden) << -0.5, 0.25;
    model.weight << 0.5, -1.0, //
        0.2, 0.4,              //
        -0.3, 0.8;
    return model;
}

// all 2^n binary rows
Mat
binary_states(const Index n)
{
    const Index m = Index(1) << n;
    Mat ret(m, n);
    for (Index r = 0; r < m; ++r)
        for (Index j = 0; j < n; ++j)
            ret(r, j) = static_cast<Scalar>((r >> j) & 1);
    return ret;
}

} // namespace

TEST(Model, WeightShapeIsValidated)
{
    EXPECT_THROW(rbm_t(bernoulli_layer_t(3), bernoulli_layer_t(2), Mat(2, 3)),
                 shape_mismatch_t);
    EXPECT_NO_THROW(
        rbm_t(bernoulli_layer_t(3), bernoulli_layer_t(2), Mat::Zero(3, 2)));
}

TEST(Model, VariantConstructors)
{
    const rbm_t rbm = make_rbm(4, 3);
    const rbm_t grbm = make_gaussian_rbm(4, 3, 2.0);
    const rbm_t hop = make_hopfield(4, 3);

    EXPECT_EQ(unit_type(rbm.visible), BERNOULLI);
    EXPECT_EQ(unit_type(rbm.hidden), BERNOULLI);
    EXPECT_EQ(unit_type(grbm.visible), GAUSSIAN);
    EXPECT_EQ(unit_type(grbm.hidden), BERNOULLI);
    EXPECT_EQ(unit_type(hop.visible), BERNOULLI);
    EXPECT_EQ(unit_type(hop.hidden), GAUSSIAN);
    EXPECT_EQ(grbm.num_visible(), 4);
    EXPECT_EQ(grbm.num_hidden(), 3);
}

TEST(Model, MakeModelFromOptions)
{
    RNG rng(1);
    model_options_t options;
    options.num_visible = 5;
    options.num_hidden = 4;
    options.set_visible_type("gaussian");
    options.weight_sd = 0.1;

    const rbm_t model = make_model(options, rng);
    EXPECT_EQ(model.weight.rows(), 5);
    EXPECT_EQ(model.weight.cols(), 4);
    EXPECT_GT(model.weight.squaredNorm(), 0.0);
    EXPECT_EQ(unit_type(model.visible), GAUSSIAN);

    options.num_hidden = 0;
    EXPECT_THROW(make_model(options, rng), invalid_configuration_t);
}

TEST(Model, BatchColumnsAreValidated)
{
    const rbm_t model = small_rbm();
    EXPECT_THROW(visible_to_hidden(model, Mat::Zero(4, 2)), shape_mismatch_t);
    EXPECT_THROW(hidden_to_visible(model, Mat::Zero(4, 3)), shape_mismatch_t);
    EXPECT_THROW(energy(model, Mat::Zero(2, 3), Mat::Zero(3, 2)),
                 shape_mismatch_t);
}

TEST(Model, ConditionalMeans)
{
    const rbm_t model = small_rbm();
    Mat v(1, 3);
    v << 1, 0, 1;

    // field = bias + v W = (-0.5 + 0.5 - 0.3, 0.25 - 1.0 + 0.8)
    const Mat h = visible_to_hidden(model, v);
    EXPECT_NEAR(h(0, 0), 1.0 / (1.0 + std::exp(0.3)), 1e-6);
    EXPECT_NEAR(h(0, 1), 1.0 / (1.0 + std::exp(-0.05)), 1e-6);

    Mat hh(1, 2);
    hh << 0, 1;
    // field = bias + h W' = (0.1 - 1.0, -0.2 + 0.4, 0.3 + 0.8)
    const Mat vv = hidden_to_visible(model, hh);
    EXPECT_NEAR(vv(0, 0), 1.0 / (1.0 + std::exp(0.9)), 1e-6);
    EXPECT_NEAR(vv(0, 1), 1.0 / (1.0 + std::exp(-0.2)), 1e-6);
    EXPECT_NEAR(vv(0, 2), 1.0 / (1.0 + std::exp(-1.1)), 1e-6);
}

TEST(Model, EnergyOfBernoulliPair)
{
    const rbm_t model = small_rbm();
    Mat v(1, 3), h(1, 2);
    v << 1, 1, 0;
    h << 1, 1;

    // -(0.1 - 0.2) - (-0.5 + 0.25) - (0.5 - 1.0 + 0.2 + 0.4)
    const Scalar expected = 0.1 + 0.25 - 0.1;
    EXPECT_NEAR(energy(model, v, h)(0, 0), expected, 1e-6);
}

TEST(Model, EnergyOfGaussianVisible)
{
    rbm_t model = make_gaussian_rbm(2, 1, 2.0);
    layer_bias(model.visible) << 1, 0;
    model.weight << 1, -1;

    Mat v(1, 2), h(1, 1);
    v << 3, 2;
    h << 1;

    // (3-1)^2/4 + 2^2/4 - (3/2 * 1 - 2/2 * 1)
    EXPECT_NEAR(energy(model, v, h)(0, 0), 1.0 + 1.0 - 0.5, 1e-5);
}

TEST(Model, FreeEnergyMarginalizesHidden)
{
    const rbm_t model = small_rbm();
    const Mat v = binary_states(3);
    const Mat h = binary_states(2);
    const Mat free_energy = marginal_free_energy(model, v);

    for (Index r = 0; r < v.rows(); ++r) {
        double z = 0;
        for (Index s = 0; s < h.rows(); ++s) {
            z += std::exp(-energy(model, v.row(r), h.row(s))(0, 0));
        }
        EXPECT_NEAR(free_energy(r, 0), -std::log(z), 1e-5);
    }
}

TEST(Model, ReconstructionGoesThroughMeans)
{
    const rbm_t model = small_rbm();
    const Mat v = binary_states(3);
    const Mat expected = hidden_to_visible(model, visible_to_hidden(model, v));
    EXPECT_TRUE(reconstruct(model, v).isApprox(expected));
}

TEST(Model, PositivePhaseStatistics)
{
    const rbm_t model = small_rbm();
    Mat v(2, 3);
    v << 1, 0, 1, //
        0, 1, 1;

    const phase_stat_t stat = positive_phase_statistics(model, v);
    const Mat h = visible_to_hidden(model, v);

    EXPECT_TRUE(stat.hidden.isApprox(h));
    EXPECT_TRUE(stat.visible_mean.isApprox(v.colwise().mean().transpose()));
    EXPECT_TRUE(stat.hidden_mean.isApprox(h.colwise().mean().transpose()));
    EXPECT_TRUE(stat.outer.isApprox(v.transpose() * h / 2.0));
    EXPECT_EQ(stat.visible_log_var.size(), 0);
}

TEST(Model, NonFiniteDataIsDetected)
{
    const rbm_t model = small_rbm();
    Mat v = Mat::Zero(2, 3);
    v(1, 2) = NAN;
    EXPECT_THROW(positive_phase_statistics(model, v), numerical_divergence_t);
}

TEST(Model, ModelIsNotModified)
{
    const rbm_t model = small_rbm();
    const Mat w0 = model.weight;
    const Mat b0 = layer_bias(model.visible);
    const Mat v = binary_states(3);

    energy(model, v, visible_to_hidden(model, v));
    marginal_free_energy(model, v);
    positive_phase_statistics(model, v);

    EXPECT_TRUE(model.weight == w0);
    EXPECT_TRUE(layer_bias(model.visible) == b0);
}
