#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "boltz.hh"
#include "boltz_gradient.hh"
#include "boltz_model.hh"
#include "boltz_options.hh"
#include "inference/adam.hh"
#include "inference/momentum.hh"

#ifndef BOLTZ_OPTIMIZER_HH_
#define BOLTZ_OPTIMIZER_HH_

namespace boltz {

////////////////////////////////////////////////////////////////
// Stateful gradient ascent on the parameters
//
//   SGD : V <- mu V + g,               theta <- theta + lr(t) V
//   ADAM: M, V moments of g,           theta <- theta + lr(t) M^/(sqrt V^ + eps)
//
// with g[weight] <- g[weight] - lambda * W before either rule.
//
// An update is first computed for every tensor; nothing is
// committed unless all of them are finite.
////////////////////////////////////////////////////////////////

struct optimizer_state_t {
    using adam_buffer_t = adam_t<Mat, Scalar>;
    using momentum_buffer_t = momentum_t<Mat, Scalar>;

    optimizer_state_t()
        : step(0)
    {
    }

    Index step; // number of committed updates
    std::map<std::string, adam_buffer_t> adam;
    std::map<std::string, momentum_buffer_t> momentum;
};

/// lr(t) for t = number of updates already taken
inline Scalar
scheduled_learning_rate(const optimizer_options_t &options, const Index t)
{
    const Scalar tt = static_cast<Scalar>(t);
    switch (options.schedule) {
    case optimizer_options_t::EXPONENTIAL:
        return options.learning_rate * std::pow(options.decay, tt);
    case optimizer_options_t::POWER_LAW:
        return options.learning_rate / (1.0 + options.decay * tt);
    case optimizer_options_t::CONSTANT:
        break;
    }
    return options.learning_rate;
}

struct optimizer_t {

    explicit optimizer_t(const optimizer_options_t &_options)
        : options(_options)
    {
        validate_options(options);
    }

    Scalar learning_rate(const Index t) const
    {
        return scheduled_learning_rate(options, t);
    }

    Index num_steps() const { return state.step; }

    void step(rbm_t &model, const gradient_t &grad)
    {
        check_gradient_shape(model, grad);
        BOLTZ_THROW_IF(!grad_is_finite(grad),
                       numerical_divergence_t,
                       "non-finite gradient at optimizer step " << state.step);

        std::vector<const Mat *> grad_tensors;
        for_each_param(grad, [&](const std::string &, const Mat &g) {
            grad_tensors.emplace_back(&g);
        });

        const Scalar lr = learning_rate(state.step);

        // work on copies; the state is swapped in only on success
        auto adam = state.adam;
        auto momentum = state.momentum;
        std::vector<Mat> next;
        std::vector<bool> touched;

        std::size_t k = 0;
        for_each_param(model, [&](const std::string &name, Mat &theta) {
            const Mat &g0 = *grad_tensors.at(k++);
            if (theta.size() == 0 || !is_learned(model, name)) {
                next.emplace_back(Mat());
                touched.emplace_back(false);
                return;
            }

            Mat g = g0;
            if (name == "weight" && options.weight_decay > 0) {
                g -= options.weight_decay * theta;
            }

            Mat delta;
            switch (options.method) {
            case optimizer_options_t::ADAM:
                delta = update_adam(adam_buffer(adam, name, theta), g);
                break;
            case optimizer_options_t::SGD:
                delta = update_momentum(momentum_buffer(momentum, name, theta),
                                        g);
                break;
            }

            Mat updated = theta + lr * delta;
            BOLTZ_THROW_IF(!updated.allFinite(),
                           numerical_divergence_t,
                           "non-finite update of " << name
                                                   << " at optimizer step "
                                                   << state.step);
            next.emplace_back(std::move(updated));
            touched.emplace_back(true);
        });

        k = 0;
        for_each_param(model, [&](const std::string &, Mat &theta) {
            if (touched.at(k))
                theta.swap(next.at(k));
            ++k;
        });

        state.adam.swap(adam);
        state.momentum.swap(momentum);
        ++state.step;
    }

    /// forget buffers and step count
    void reset() { state = optimizer_state_t(); }

    const optimizer_options_t options;
    optimizer_state_t state;

private:
    static bool is_learned(const rbm_t &model, const std::string &name)
    {
        if (name == "visible_log_var")
            return learns_variance(model.visible);
        if (name == "hidden_log_var")
            return learns_variance(model.hidden);
        return true;
    }

    static void check_gradient_shape(rbm_t &model, const gradient_t &grad)
    {
        std::vector<const Mat *> grad_tensors;
        for_each_param(grad, [&](const std::string &, const Mat &g) {
            grad_tensors.emplace_back(&g);
        });

        std::size_t k = 0;
        for_each_param(model, [&](const std::string &name, Mat &theta) {
            const Mat &g = *grad_tensors.at(k++);
            BOLTZ_CHECK_SHAPE(g.rows() == theta.rows() &&
                                  g.cols() == theta.cols(),
                              "gradient of " << name << " is " << g.rows()
                                             << " x " << g.cols()
                                             << ", parameter is "
                                             << theta.rows() << " x "
                                             << theta.cols());
        });
    }

    optimizer_state_t::adam_buffer_t &
    adam_buffer(std::map<std::string, optimizer_state_t::adam_buffer_t> &adam,
                const std::string &name,
                const Mat &theta) const
    {
        auto it = adam.find(name);
        if (it == adam.end()) {
            it = adam.emplace(name,
                              optimizer_state_t::adam_buffer_t(options.beta1,
                                                               options.beta2,
                                                               theta.rows(),
                                                               theta.cols(),
                                                               options.epsilon))
                     .first;
        }
        return it->second;
    }

    optimizer_state_t::momentum_buffer_t &momentum_buffer(
        std::map<std::string, optimizer_state_t::momentum_buffer_t> &momentum,
        const std::string &name,
        const Mat &theta) const
    {
        auto it = momentum.find(name);
        if (it == momentum.end()) {
            it = momentum
                     .emplace(name,
                              optimizer_state_t::momentum_buffer_t(
                                  options.momentum, theta.rows(), theta.cols()))
                     .first;
        }
        return it->second;
    }
};

} // namespace boltz

#endif
