#include <cmath>
#include <string>
#include <vector>

#include "boltz.hh"
#include "boltz_model.hh"
#include "boltz_sampler.hh"

#ifndef BOLTZ_GRADIENT_HH_
#define BOLTZ_GRADIENT_HH_

namespace boltz {

////////////////////////////////////////////////////////////////
// Contrastive gradient
//
//   grad[theta] = < -dE/dtheta >_data - < -dE/dtheta >_model
//
// averaged over the batch.  This is the ascent direction of the
// log-likelihood, i.e., descent on the energy of the data.
////////////////////////////////////////////////////////////////

struct gradient_t {
    Mat visible_bias;    // #visible x 1
    Mat hidden_bias;     // #hidden x 1
    Mat visible_log_var; // #visible x 1 for Gaussian units, else 0 x 1
    Mat hidden_log_var;  // #hidden x 1 for Gaussian units, else 0 x 1
    Mat weight;          // #visible x #hidden
};

inline const std::vector<std::string> &
param_names()
{
    static const std::vector<std::string> names{ "visible_bias",
                                                 "hidden_bias",
                                                 "visible_log_var",
                                                 "hidden_log_var",
                                                 "weight" };
    return names;
}

/// f(name, tensor) for each tensor of the gradient
template <typename Func>
void
for_each_param(gradient_t &grad, Func &&f)
{
    const std::vector<std::string> &names = param_names();
    f(names[0], grad.visible_bias);
    f(names[1], grad.hidden_bias);
    f(names[2], grad.visible_log_var);
    f(names[3], grad.hidden_log_var);
    f(names[4], grad.weight);
}

template <typename Func>
void
for_each_param(const gradient_t &grad, Func &&f)
{
    const std::vector<std::string> &names = param_names();
    f(names[0], grad.visible_bias);
    f(names[1], grad.hidden_bias);
    f(names[2], grad.visible_log_var);
    f(names[3], grad.hidden_log_var);
    f(names[4], grad.weight);
}

/// the model's own tensors, in the same order as the gradient
template <typename Func>
void
for_each_param(rbm_t &model, Func &&f)
{
    Mat vis_empty = Mat::Zero(0, 1);
    Mat hid_empty = Mat::Zero(0, 1);
    const std::vector<std::string> &names = param_names();
    Mat *vis_log_var = layer_log_var(model.visible);
    Mat *hid_log_var = layer_log_var(model.hidden);

    f(names[0], layer_bias(model.visible));
    f(names[1], layer_bias(model.hidden));
    f(names[2], vis_log_var ? *vis_log_var : vis_empty);
    f(names[3], hid_log_var ? *hid_log_var : hid_empty);
    f(names[4], model.weight);
}

/// zero gradient shaped like the model
inline gradient_t
zero_gradient(const rbm_t &model)
{
    const Mat *vis_log_var = layer_log_var(model.visible);
    const Mat *hid_log_var = layer_log_var(model.hidden);

    gradient_t grad;
    grad.visible_bias = Mat::Zero(model.num_visible(), 1);
    grad.hidden_bias = Mat::Zero(model.num_hidden(), 1);
    grad.visible_log_var = Mat::Zero(vis_log_var ? vis_log_var->rows() : 0, 1);
    grad.hidden_log_var = Mat::Zero(hid_log_var ? hid_log_var->rows() : 0, 1);
    grad.weight = Mat::Zero(model.num_visible(), model.num_hidden());
    return grad;
}

///////////////////////////////////
// entrywise gradient arithmetic //
///////////////////////////////////

template <typename Func>
gradient_t
grad_apply(Func &&f, const gradient_t &grad)
{
    gradient_t ret;
    ret.visible_bias = grad.visible_bias.unaryExpr(f);
    ret.hidden_bias = grad.hidden_bias.unaryExpr(f);
    ret.visible_log_var = grad.visible_log_var.unaryExpr(f);
    ret.hidden_log_var = grad.hidden_log_var.unaryExpr(f);
    ret.weight = grad.weight.unaryExpr(f);
    return ret;
}

template <typename Func>
gradient_t
grad_mapzip(Func &&f, const gradient_t &lhs, const gradient_t &rhs)
{
    gradient_t ret;
    ret.visible_bias = lhs.visible_bias.binaryExpr(rhs.visible_bias, f);
    ret.hidden_bias = lhs.hidden_bias.binaryExpr(rhs.hidden_bias, f);
    ret.visible_log_var =
        lhs.visible_log_var.binaryExpr(rhs.visible_log_var, f);
    ret.hidden_log_var = lhs.hidden_log_var.binaryExpr(rhs.hidden_log_var, f);
    ret.weight = lhs.weight.binaryExpr(rhs.weight, f);
    return ret;
}

/// root of the mean-square over tensors, each tensor averaged first
inline Scalar
grad_magnitude(const gradient_t &grad)
{
    Scalar tot = 0;
    Index ntensor = 0;
    for_each_param(grad, [&](const std::string &, const Mat &g) {
        if (g.size() > 0) {
            tot += g.squaredNorm() / static_cast<Scalar>(g.size());
            ++ntensor;
        }
    });
    if (ntensor < 1)
        return 0;
    return std::sqrt(tot / static_cast<Scalar>(ntensor));
}

inline bool
grad_is_finite(const gradient_t &grad)
{
    bool ret = true;
    for_each_param(grad, [&ret](const std::string &, const Mat &g) {
        ret = ret && g.allFinite();
    });
    return ret;
}

////////////////////////////////////////////////////////////////
// positive - negative
inline gradient_t
contrastive_gradient(const rbm_t &model,
                     const phase_stat_t &pos,
                     const phase_stat_t &neg)
{
    gradient_t grad = zero_gradient(model);

    grad.visible_bias = pos.visible_mean - neg.visible_mean;
    grad.hidden_bias = pos.hidden_mean - neg.hidden_mean;
    grad.weight = pos.outer - neg.outer;

    if (learns_variance(model.visible))
        grad.visible_log_var = pos.visible_log_var - neg.visible_log_var;

    if (learns_variance(model.hidden))
        grad.hidden_log_var = pos.hidden_log_var - neg.hidden_log_var;

    BOLTZ_THROW_IF(!grad_is_finite(grad),
                   numerical_divergence_t,
                   "non-finite gradient");
    return grad;
}

struct estimate_t {
    gradient_t grad;
    phase_stat_t positive;
    phase_stat_t negative;
};

/// both phases and their difference; the trainer also reads the
/// phase statistics for monitoring
template <typename RNG>
estimate_t
estimate_with_stats(const rbm_t &model,
                    const Mat &data_batch,
                    gibbs_sampler_t &sampler,
                    const Index steps,
                    RNG &rng)
{
    estimate_t ret;
    ret.positive = positive_phase_statistics(model, data_batch);
    const gibbs_state_t fantasy =
        sampler.negative_phase(model, data_batch, steps, rng);
    ret.negative = phase_statistics(model, fantasy.visible);
    ret.grad = contrastive_gradient(model, ret.positive, ret.negative);
    return ret;
}

template <typename RNG>
gradient_t
estimate_gradient(const rbm_t &model,
                  const Mat &data_batch,
                  gibbs_sampler_t &sampler,
                  const Index steps,
                  RNG &rng)
{
    return estimate_with_stats(model, data_batch, sampler, steps, rng).grad;
}

} // namespace boltz

#endif
