#include <cmath>

#include <gtest/gtest.h>

#include "boltz_optimizer.hh"

using namespace boltz;

namespace {

gradient_t
constant_gradient(const rbm_t &model, const Scalar value)
{
    gradient_t g = zero_gradient(model);
    g.visible_bias.setConstant(value);
    g.hidden_bias.setConstant(value);
    g.visible_log_var.setConstant(value);
    g.hidden_log_var.setConstant(value);
    g.weight.setConstant(value);
    return g;
}

} // namespace

TEST(Optimizer, PlainGradientAscent)
{
    rbm_t model = make_rbm(3, 2);
    optimizer_options_t options;
    options.learning_rate = 0.1;
    optimizer_t optim(options);

    optim.step(model, constant_gradient(model, 1.0));
    EXPECT_TRUE(model.weight.isApprox(Mat::Constant(3, 2, 0.1)));
    EXPECT_TRUE(layer_bias(model.visible).isApprox(Mat::Constant(3, 1, 0.1)));
    EXPECT_TRUE(layer_bias(model.hidden).isApprox(Mat::Constant(2, 1, 0.1)));
    EXPECT_EQ(optim.num_steps(), 1);
}

TEST(Optimizer, MomentumAccumulatesVelocity)
{
    rbm_t model = make_rbm(2, 2);
    optimizer_options_t options;
    options.learning_rate = 1.0;
    options.momentum = 0.5;
    optimizer_t optim(options);

    const gradient_t g = constant_gradient(model, 1.0);
    optim.step(model, g); // v = 1,   W = 1
    optim.step(model, g); // v = 1.5, W = 2.5
    optim.step(model, g); // v = 1.75, W = 4.25

    EXPECT_NEAR(model.weight(0, 0), 4.25, 1e-5);
    EXPECT_NEAR(optim.state.momentum.at("weight").V(1, 1), 1.75, 1e-5);
}

TEST(Optimizer, AdamFirstStepIsSignedLearningRate)
{
    rbm_t model = make_rbm(2, 3);
    optimizer_options_t options;
    options.set_method("ADAM");
    options.learning_rate = 0.01;
    optimizer_t optim(options);

    gradient_t g = zero_gradient(model);
    g.weight << 3.0, -0.5, 10.0, //
        -2.0, 0.25, 1.0;

    // bias-corrected moments make the first step lr * g / |g|
    optim.step(model, g);
    for (Index i = 0; i < 2; ++i)
        for (Index j = 0; j < 3; ++j)
            EXPECT_NEAR(model.weight(i, j),
                        0.01 * (g.weight(i, j) > 0 ? 1.0 : -1.0),
                        1e-5);

    EXPECT_EQ(optim.state.adam.at("weight").t, 1.0);
}

TEST(Optimizer, AdamMatchesReferenceRecursion)
{
    rbm_t model = make_rbm(1, 1);
    optimizer_options_t options;
    options.set_method("ADAM");
    options.learning_rate = 0.1;
    options.beta1 = 0.8;
    options.beta2 = 0.9;
    optimizer_t optim(options);

    const double grads[] = { 1.0, -2.0, 0.5 };
    double m = 0, v = 0, theta = 0;
    for (int t = 1; t <= 3; ++t) {
        const double g = grads[t - 1];
        m = 0.8 * m + 0.2 * g;
        v = 0.9 * v + 0.1 * g * g;
        const double mhat = m / (1 - std::pow(0.8, t));
        const double vhat = v / (1 - std::pow(0.9, t));
        theta += 0.1 * mhat / (std::sqrt(vhat) + 1e-8);

        optim.step(model, constant_gradient(model, g));
    }

    EXPECT_NEAR(model.weight(0, 0), theta, 1e-5);
}

TEST(Optimizer, LearningRateSchedules)
{
    optimizer_options_t options;
    options.learning_rate = 0.5;

    options.schedule = optimizer_options_t::CONSTANT;
    EXPECT_FLOAT_EQ(optimizer_t(options).learning_rate(10), 0.5);

    options.set_schedule("EXPONENTIAL");
    options.decay = 0.9;
    EXPECT_FLOAT_EQ(optimizer_t(options).learning_rate(0), 0.5);
    EXPECT_NEAR(optimizer_t(options).learning_rate(3), 0.5 * 0.729, 1e-6);

    options.set_schedule("POWER_LAW");
    options.decay = 0.1;
    EXPECT_NEAR(optimizer_t(options).learning_rate(10), 0.25, 1e-6);
}

TEST(Optimizer, ScheduleAppliesPerStep)
{
    rbm_t model = make_rbm(1, 1);
    optimizer_options_t options;
    options.learning_rate = 1.0;
    options.set_schedule("EXPONENTIAL");
    options.decay = 0.5;
    optimizer_t optim(options);

    const gradient_t g = constant_gradient(model, 1.0);
    optim.step(model, g); // + 1
    optim.step(model, g); // + 0.5
    optim.step(model, g); // + 0.25
    EXPECT_NEAR(model.weight(0, 0), 1.75, 1e-6);
}

TEST(Optimizer, WeightDecayOnlyTouchesWeights)
{
    rbm_t model = make_rbm(2, 2);
    model.weight.setConstant(2.0);
    layer_bias(model.visible).setConstant(2.0);

    optimizer_options_t options;
    options.learning_rate = 0.1;
    options.weight_decay = 0.5;
    optimizer_t optim(options);

    optim.step(model, zero_gradient(model));

    // W <- W + lr * (0 - 0.5 W)
    EXPECT_NEAR(model.weight(0, 0), 2.0 - 0.1 * 0.5 * 2.0, 1e-6);
    EXPECT_NEAR(layer_bias(model.visible)(0, 0), 2.0, 1e-6);
}

TEST(Optimizer, FixedVarianceIsNotMoved)
{
    rbm_t fixed = make_gaussian_rbm(2, 2, 1.0, false);
    rbm_t learned = make_gaussian_rbm(2, 2, 1.0, true);

    optimizer_options_t options;
    options.learning_rate = 0.1;

    optimizer_t(options).step(fixed, constant_gradient(fixed, 1.0));
    optimizer_t(options).step(learned, constant_gradient(learned, 1.0));

    EXPECT_NEAR((*layer_log_var(fixed.visible))(0, 0), 0.0, 1e-7);
    EXPECT_NEAR((*layer_log_var(learned.visible))(0, 0), 0.1, 1e-6);
}

TEST(Optimizer, NonFiniteGradientLeavesModelUntouched)
{
    rbm_t model = make_rbm(2, 2);
    model.weight.setConstant(0.3);
    optimizer_options_t options;
    options.momentum = 0.5;
    optimizer_t optim(options);

    optim.step(model, constant_gradient(model, 1.0));
    const Mat w1 = model.weight;
    const Mat b1 = layer_bias(model.hidden);
    const Mat v1 = optim.state.momentum.at("weight").V;

    gradient_t bad = constant_gradient(model, 1.0);
    bad.hidden_bias(1, 0) = NAN;
    EXPECT_THROW(optim.step(model, bad), numerical_divergence_t);

    EXPECT_TRUE(model.weight == w1);
    EXPECT_TRUE(layer_bias(model.hidden) == b1);
    EXPECT_TRUE(optim.state.momentum.at("weight").V == v1);
    EXPECT_EQ(optim.num_steps(), 1);
}

TEST(Optimizer, OverflowingUpdateLeavesModelUntouched)
{
    rbm_t model = make_rbm(2, 2);
    optimizer_options_t options;
    options.learning_rate = 1e30;
    optimizer_t optim(options);

    // finite gradient, but lr * g overflows in the weight only
    gradient_t g = zero_gradient(model);
    g.visible_bias.setConstant(1.0);
    g.weight.setConstant(1e30);

    const Mat b0 = layer_bias(model.visible);
    EXPECT_THROW(optim.step(model, g), numerical_divergence_t);
    EXPECT_TRUE(layer_bias(model.visible) == b0);
    EXPECT_TRUE(optim.state.momentum.empty());
}

TEST(Optimizer, GradientShapeIsChecked)
{
    rbm_t model = make_rbm(3, 2);
    optimizer_t optim{ optimizer_options_t() };
    gradient_t g = zero_gradient(model);
    g.weight = Mat::Zero(2, 3);
    EXPECT_THROW(optim.step(model, g), shape_mismatch_t);
}

TEST(Optimizer, IllegalOptionsAreRefused)
{
    optimizer_options_t options;

    options.learning_rate = 0;
    EXPECT_THROW(optimizer_t{ options }, invalid_configuration_t);
    options.learning_rate = -1;
    EXPECT_THROW(optimizer_t{ options }, invalid_configuration_t);
    options.learning_rate = 0.1;

    options.momentum = 1.0;
    EXPECT_THROW(optimizer_t{ options }, invalid_configuration_t);
    options.momentum = 0.0;

    options.beta1 = 1.0;
    EXPECT_THROW(optimizer_t{ options }, invalid_configuration_t);
    options.beta1 = 0.9;

    options.beta2 = -0.1;
    EXPECT_THROW(optimizer_t{ options }, invalid_configuration_t);
    options.beta2 = 0.999;

    options.epsilon = 0;
    EXPECT_THROW(optimizer_t{ options }, invalid_configuration_t);
    options.epsilon = 1e-8;

    EXPECT_THROW(options.set_method("RMSPROP"), invalid_configuration_t);
    EXPECT_NO_THROW(optimizer_t{ options });
}
