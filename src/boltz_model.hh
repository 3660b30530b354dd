#include "boltz.hh"
#include "boltz_layer.hh"
#include "boltz_options.hh"

#ifndef BOLTZ_MODEL_HH_
#define BOLTZ_MODEL_HH_

namespace boltz {

////////////////////////////////////////////////////////////////
// Two-layer bipartite energy model
//
//   E(v, h) = E_vis(v) + E_hid(h) - rescale(v) * W * rescale(h)
//
//   Bernoulli - Bernoulli : standard RBM
//   Gaussian  - Bernoulli : Gaussian RBM
//   Bernoulli - Gaussian  : Hopfield
//
// Functions of this header never modify the parameters.
////////////////////////////////////////////////////////////////

struct rbm_t {

    explicit rbm_t(const layer_t &vis, const layer_t &hid)
        : visible(vis)
        , hidden(hid)
        , weight(Mat::Zero(layer_size(vis), layer_size(hid)))
    {
    }

    explicit rbm_t(const layer_t &vis, const layer_t &hid, const Mat &w)
        : visible(vis)
        , hidden(hid)
        , weight(w)
    {
        BOLTZ_CHECK_SHAPE(weight.rows() == layer_size(visible) &&
                              weight.cols() == layer_size(hidden),
                          "weight " << weight.rows() << " x " << weight.cols()
                                    << " vs. layers " << layer_size(visible)
                                    << " x " << layer_size(hidden));
    }

    Index num_visible() const { return weight.rows(); }
    Index num_hidden() const { return weight.cols(); }

    layer_t visible;
    layer_t hidden;
    Mat weight; // #visible x #hidden
};

inline rbm_t
make_rbm(const Index num_visible, const Index num_hidden)
{
    return rbm_t(bernoulli_layer_t(num_visible),
                 bernoulli_layer_t(num_hidden));
}

inline rbm_t
make_gaussian_rbm(const Index num_visible,
                  const Index num_hidden,
                  const Scalar var = 1.0,
                  const bool learn_var = false)
{
    return rbm_t(gaussian_layer_t(num_visible, var, learn_var),
                 bernoulli_layer_t(num_hidden));
}

inline rbm_t
make_hopfield(const Index num_visible,
              const Index num_hidden,
              const Scalar var = 1.0,
              const bool learn_var = false)
{
    return rbm_t(bernoulli_layer_t(num_visible),
                 gaussian_layer_t(num_hidden, var, learn_var));
}

template <typename RNG>
rbm_t
make_model(const model_options_t &options, RNG &rng)
{
    validate_options(options);

    rbm_t model(make_layer(options.visible_type,
                           options.num_visible,
                           options.visible_var,
                           options.learn_var),
                make_layer(options.hidden_type,
                           options.num_hidden,
                           options.hidden_var,
                           options.learn_var));

    if (options.weight_sd > 0) {
        gaussian_sampler_t<Scalar> rnorm;
        const Vec sd = Vec::Constant(options.num_hidden, options.weight_sd);
        model.weight = rnorm(model.weight, sd.transpose(), rng);
    }
    return model;
}

inline void
check_batch(const layer_t &layer, const Mat &state, const char *what)
{
    BOLTZ_CHECK_SHAPE(state.cols() == layer_size(layer),
                      what << " batch has " << state.cols()
                           << " columns, layer has " << layer_size(layer)
                           << " units");
}

/// bias + rescale(v) * W
inline Mat
hidden_field(const rbm_t &model, const Mat &visible_state)
{
    check_batch(model.visible, visible_state, "visible");
    Mat field = rescale(model.visible, visible_state) * model.weight;
    field.rowwise() += layer_bias(model.hidden).col(0).transpose();
    return field;
}

/// bias + rescale(h) * W'
inline Mat
visible_field(const rbm_t &model, const Mat &hidden_state)
{
    check_batch(model.hidden, hidden_state, "hidden");
    Mat field = rescale(model.hidden, hidden_state) * model.weight.transpose();
    field.rowwise() += layer_bias(model.visible).col(0).transpose();
    return field;
}

inline Mat
visible_to_hidden(const rbm_t &model, const Mat &visible_state)
{
    const Mat field = hidden_field(model, visible_state);
    BOLTZ_CHECK_FINITE(field, "hidden field");
    return activate(model.hidden, field);
}

inline Mat
hidden_to_visible(const rbm_t &model, const Mat &hidden_state)
{
    const Mat field = visible_field(model, hidden_state);
    BOLTZ_CHECK_FINITE(field, "visible field");
    return activate(model.visible, field);
}

/// mean-field reconstruction v -> E[h|v] -> E[v|h]
inline Mat
reconstruct(const rbm_t &model, const Mat &visible_state)
{
    return hidden_to_visible(model, visible_to_hidden(model, visible_state));
}

/// E(v, h) for each row
inline Mat
energy(const rbm_t &model, const Mat &visible_state, const Mat &hidden_state)
{
    check_batch(model.visible, visible_state, "visible");
    check_batch(model.hidden, hidden_state, "hidden");
    BOLTZ_CHECK_SHAPE(visible_state.rows() == hidden_state.rows(),
                      "visible and hidden batch sizes differ: "
                          << visible_state.rows() << " vs. "
                          << hidden_state.rows());

    const Mat coupling = (rescale(model.visible, visible_state) * model.weight)
                             .cwiseProduct(rescale(model.hidden, hidden_state))
                             .rowwise()
                             .sum();

    return energy_term(model.visible, visible_state) +
        energy_term(model.hidden, hidden_state) - coupling;
}

/// F(v) = -log sum_h exp(-E(v, h)) for each row
inline Mat
marginal_free_energy(const rbm_t &model, const Mat &visible_state)
{
    const Mat field = hidden_field(model, visible_state);
    return energy_term(model.visible, visible_state) -
        log_partition(model.hidden, field);
}

////////////////////////////////////////////////////////////////
// Sufficient statistics of one phase
//
// The hidden side is E[h|v] in both phases, never a sample, so
// every statistic is the expectation of -dE/dtheta given v.
////////////////////////////////////////////////////////////////

struct phase_stat_t {
    Mat visible;         // batch x #visible, the clamped state
    Mat hidden;          // batch x #hidden, E[h|v]
    Mat visible_mean;    // #visible x 1, batch average of -dE/dbias
    Mat hidden_mean;     // #hidden x 1
    Mat outer;           // #visible x #hidden, rescale(v)' rescale(h) / n
    Mat visible_log_var; // -dE/dlog_var (0 x 1 unless Gaussian)
    Mat hidden_log_var;
};

inline phase_stat_t
phase_statistics(const rbm_t &model, const Mat &visible_state)
{
    BOLTZ_CHECK_SHAPE(visible_state.rows() > 0, "empty batch");

    phase_stat_t stat;
    stat.visible = visible_state;
    stat.hidden = visible_to_hidden(model, visible_state);

    const Scalar n = static_cast<Scalar>(visible_state.rows());
    const Mat v_scaled = rescale(model.visible, stat.visible);
    const Mat h_scaled = rescale(model.hidden, stat.hidden);

    stat.visible_mean = bias_statistic(model.visible, stat.visible);
    stat.hidden_mean = bias_statistic(model.hidden, stat.hidden);
    stat.outer = v_scaled.transpose() * h_scaled / n;

    stat.visible_log_var = log_var_statistic(model.visible,
                                             stat.visible,
                                             h_scaled *
                                                 model.weight.transpose());
    stat.hidden_log_var =
        log_var_statistic(model.hidden, stat.hidden, v_scaled * model.weight);

    // E[(h - b)^2] = (E[h] - b)^2 + var, so the expected statistic of
    // Gaussian hidden units has 1/2 on top of the plug-in value
    if (stat.hidden_log_var.size() > 0)
        stat.hidden_log_var.array() += 0.5;

    return stat;
}

/// positive phase: the data clamped on the visible layer
inline phase_stat_t
positive_phase_statistics(const rbm_t &model, const Mat &visible_batch)
{
    BOLTZ_CHECK_FINITE(visible_batch, "data batch");
    return phase_statistics(model, visible_batch);
}

} // namespace boltz

#endif
