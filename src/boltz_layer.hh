#include <cmath>
#include <string>
#include <variant>

#include "boltz.hh"
#include "inference/sampler.hh"

#ifndef BOLTZ_LAYER_HH_
#define BOLTZ_LAYER_HH_

////////////////////////////////////////////////////////////////
// Unit types of the bipartite energy
//
//   E(v, h) = E_vis(v) + E_hid(h) - rescale(v) * W * rescale(h)
//
//   Bernoulli: E(x) = - bias' x,                rescale(x) = x
//   Gaussian : E(x) = sum (x - bias)^2 / 2 var, rescale(x) = x / var
//
// A batch state is always (#batch x #units); a bias is (#units x 1).
////////////////////////////////////////////////////////////////

namespace boltz {

typedef enum { BERNOULLI, GAUSSIAN } unit_type_t;

// largest |logit| fed into exp() by Bernoulli units
constexpr Scalar MAX_LOGIT = 30.0;

struct bernoulli_layer_t {
    explicit bernoulli_layer_t(const Index n)
        : bias(Mat::Zero(check_positive_t<Index>(n, "layer size").val, 1))
    {
    }

    Index size() const { return bias.rows(); }

    Mat bias; // n x 1
};

struct gaussian_layer_t {
    explicit gaussian_layer_t(const Index n,
                              const Scalar var = 1.0,
                              const bool _learn_var = false)
        : bias(Mat::Zero(check_positive_t<Index>(n, "layer size").val, 1))
        , log_var(Mat::Constant(
              n, 1, std::log(check_positive_t<Scalar>(var, "variance").val)))
        , learn_var(_learn_var)
    {
    }

    Index size() const { return bias.rows(); }

    Vec var() const { return log_var.col(0).array().exp().matrix(); }
    Vec sd() const { return (log_var.col(0) * 0.5).array().exp().matrix(); }
    Vec var_inv() const
    {
        return (-log_var.col(0)).array().exp().matrix();
    }

    Mat bias;       // n x 1
    Mat log_var;    // n x 1, variance = exp(log_var) > 0
    bool learn_var; // whether the optimizer moves log_var
};

using layer_t = std::variant<bernoulli_layer_t, gaussian_layer_t>;

///////////////////////////////
// per unit type definitions //
///////////////////////////////

inline unit_type_t
unit_type(const bernoulli_layer_t &)
{
    return BERNOULLI;
}

inline unit_type_t
unit_type(const gaussian_layer_t &)
{
    return GAUSSIAN;
}

/// E[x | field], where field already contains the bias
inline Mat
activate(const bernoulli_layer_t &, const Mat &field)
{
    return field.unaryExpr(clamped_sigmoid_op_t<Scalar>(MAX_LOGIT));
}

inline Mat
activate(const gaussian_layer_t &, const Mat &field)
{
    return field;
}

template <typename RNG>
Mat
sample(const bernoulli_layer_t &, const Mat &mean, RNG &rng)
{
    bernoulli_sampler_t<Scalar> rbern;
    return rbern(mean, rng);
}

template <typename RNG>
Mat
sample(const gaussian_layer_t &layer, const Mat &mean, RNG &rng)
{
    gaussian_sampler_t<Scalar> rnorm;
    return rnorm(mean, layer.sd().transpose(), rng);
}

/// #batch x 1 bias contribution to the energy
inline Mat
energy_term(const bernoulli_layer_t &layer, const Mat &state)
{
    return -(state * layer.bias);
}

inline Mat
energy_term(const gaussian_layer_t &layer, const Mat &state)
{
    const Mat delta = state.rowwise() - layer.bias.col(0).transpose();
    const Vec half_prec = layer.var_inv() * 0.5;
    return (delta.cwiseProduct(delta) * half_prec.asDiagonal()).rowwise().sum();
}

inline Mat
rescale(const bernoulli_layer_t &, const Mat &state)
{
    return state;
}

inline Mat
rescale(const gaussian_layer_t &layer, const Mat &state)
{
    return state * layer.var_inv().asDiagonal();
}

/// log sum_x exp(-E(x) + x' coupling / var) for each row, with
/// field = bias + coupling; this is what a hidden layer contributes
/// to the marginal free energy once it is summed out
inline Mat
log_partition(const bernoulli_layer_t &, const Mat &field)
{
    return field.unaryExpr(softplus_op_t<Scalar>()).rowwise().sum();
}

inline Mat
log_partition(const gaussian_layer_t &layer, const Mat &field)
{
    const Vec var = layer.var();
    const Scalar two_pi = 2.0 * EIGEN_PI;
    const RowVec b2 =
        layer.bias.col(0).cwiseProduct(layer.bias.col(0)).transpose();
    const Vec half_prec = layer.var_inv() * 0.5;
    const Scalar norm = 0.5 * (var * two_pi).array().log().sum();

    Mat quad = field.cwiseProduct(field);
    quad.rowwise() -= b2;
    Mat ret = (quad * half_prec.asDiagonal()).rowwise().sum();
    ret.array() += norm;
    return ret;
}

/// states drawn without regard to the coupling
template <typename RNG>
Mat
random_state(const bernoulli_layer_t &layer, const Index nrow, RNG &rng)
{
    return sample(layer, Mat::Constant(nrow, layer.size(), 0.5), rng);
}

template <typename RNG>
Mat
random_state(const gaussian_layer_t &layer, const Index nrow, RNG &rng)
{
    Mat mean(nrow, layer.size());
    mean.rowwise() = layer.bias.col(0).transpose();
    return sample(layer, mean, rng);
}

/// batch average of -dE/d(bias)
inline Mat
bias_statistic(const bernoulli_layer_t &, const Mat &state)
{
    return state.colwise().mean().transpose();
}

inline Mat
bias_statistic(const gaussian_layer_t &layer, const Mat &state)
{
    const Mat delta = state.rowwise() - layer.bias.col(0).transpose();
    return (delta * layer.var_inv().asDiagonal()).colwise().mean().transpose();
}

/// batch average of -dE/d(log_var)
///   (x - bias)^2 / (2 var) - x * coupling / var
/// where coupling = field - bias is the weighted input from the other layer
inline Mat
log_var_statistic(const bernoulli_layer_t &, const Mat &, const Mat &)
{
    return Mat::Zero(0, 1);
}

inline Mat
log_var_statistic(const gaussian_layer_t &layer,
                  const Mat &state,
                  const Mat &coupling)
{
    const Mat delta = state.rowwise() - layer.bias.col(0).transpose();
    const Mat stat = delta.cwiseProduct(delta) * 0.5 -
        state.cwiseProduct(coupling);
    return (stat * layer.var_inv().asDiagonal()).colwise().mean().transpose();
}

////////////////////////////////////////
// dispatch over the closed unit set //
////////////////////////////////////////

inline Index
layer_size(const layer_t &layer)
{
    return std::visit([](const auto &ly) { return ly.size(); }, layer);
}

inline unit_type_t
unit_type(const layer_t &layer)
{
    return std::visit([](const auto &ly) { return unit_type(ly); }, layer);
}

inline std::string
unit_name(const unit_type_t type)
{
    switch (type) {
    case BERNOULLI:
        return "bernoulli";
    case GAUSSIAN:
        return "gaussian";
    }
    return "unknown";
}

inline unit_type_t
parse_unit_type(const std::string &name)
{
    if (name == "bernoulli")
        return BERNOULLI;
    if (name == "gaussian")
        return GAUSSIAN;
    throw invalid_configuration_t("unknown unit type: " + name);
}

inline layer_t
make_layer(const unit_type_t type,
           const Index n,
           const Scalar var = 1.0,
           const bool learn_var = false)
{
    switch (type) {
    case BERNOULLI:
        return bernoulli_layer_t(n);
    case GAUSSIAN:
        return gaussian_layer_t(n, var, learn_var);
    }
    throw invalid_configuration_t("unknown unit type");
}

inline const Mat &
layer_bias(const layer_t &layer)
{
    return std::visit([](const auto &ly) -> const Mat & { return ly.bias; },
                      layer);
}

inline Mat &
layer_bias(layer_t &layer)
{
    return std::visit([](auto &ly) -> Mat & { return ly.bias; }, layer);
}

/// nullptr for Bernoulli units
inline Mat *
layer_log_var(layer_t &layer)
{
    if (auto *g = std::get_if<gaussian_layer_t>(&layer))
        return &g->log_var;
    return nullptr;
}

inline const Mat *
layer_log_var(const layer_t &layer)
{
    if (const auto *g = std::get_if<gaussian_layer_t>(&layer))
        return &g->log_var;
    return nullptr;
}

inline bool
learns_variance(const layer_t &layer)
{
    if (const auto *g = std::get_if<gaussian_layer_t>(&layer))
        return g->learn_var;
    return false;
}

inline Mat
activate(const layer_t &layer, const Mat &field)
{
    return std::visit([&](const auto &ly) { return activate(ly, field); },
                      layer);
}

template <typename RNG>
Mat
sample(const layer_t &layer, const Mat &mean, RNG &rng)
{
    return std::visit([&](const auto &ly) { return sample(ly, mean, rng); },
                      layer);
}

inline Mat
energy_term(const layer_t &layer, const Mat &state)
{
    return std::visit([&](const auto &ly) { return energy_term(ly, state); },
                      layer);
}

inline Mat
rescale(const layer_t &layer, const Mat &state)
{
    return std::visit([&](const auto &ly) { return rescale(ly, state); },
                      layer);
}

inline Mat
log_partition(const layer_t &layer, const Mat &field)
{
    return std::visit([&](const auto &ly) { return log_partition(ly, field); },
                      layer);
}

template <typename RNG>
Mat
random_state(const layer_t &layer, const Index nrow, RNG &rng)
{
    return std::visit(
        [&](const auto &ly) { return random_state(ly, nrow, rng); }, layer);
}

inline Mat
bias_statistic(const layer_t &layer, const Mat &state)
{
    return std::visit(
        [&](const auto &ly) { return bias_statistic(ly, state); }, layer);
}

inline Mat
log_var_statistic(const layer_t &layer, const Mat &state, const Mat &coupling)
{
    return std::visit(
        [&](const auto &ly) {
            return log_var_statistic(ly, state, coupling);
        },
        layer);
}

} // namespace boltz

#endif
