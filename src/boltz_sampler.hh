#include "boltz.hh"
#include "boltz_model.hh"
#include "boltz_options.hh"

#ifndef BOLTZ_SAMPLER_HH_
#define BOLTZ_SAMPLER_HH_

namespace boltz {

struct gibbs_state_t {
    Mat visible; // batch x #visible
    Mat hidden;  // batch x #hidden
};

/// h ~ p(h | v)
template <typename RNG>
Mat
sample_hidden(const rbm_t &model, const Mat &visible_state, RNG &rng)
{
    Mat ret = sample(model.hidden, visible_to_hidden(model, visible_state), rng);
    BOLTZ_CHECK_FINITE(ret, "hidden sample");
    return ret;
}

/// v ~ p(v | h)
template <typename RNG>
Mat
sample_visible(const rbm_t &model, const Mat &hidden_state, RNG &rng)
{
    Mat ret = sample(model.visible, hidden_to_visible(model, hidden_state), rng);
    BOLTZ_CHECK_FINITE(ret, "visible sample");
    return ret;
}

////////////////////////////////////////////////////////////////
// Block Gibbs sampling between the two layers
//
//   h[0] ~ p(h | seed)
//   for t = 1 .. k:  v[t] ~ p(v | h[t-1]),  h[t] ~ p(h | v[t])
//
// Every row is an independent chain.  k = 0 returns the seed
// visible state untouched.
//
// CD : each negative phase restarts from the data batch
// PCD: the last visible state is kept between calls; the chain
//      is seeded by the first batch after construction or reset()
////////////////////////////////////////////////////////////////

struct gibbs_sampler_t {
    using method_t = train_options_t::sampler_method_t;

    explicit gibbs_sampler_t(const method_t _method = train_options_t::CD)
        : method(_method)
    {
    }

    template <typename RNG>
    gibbs_state_t
    run(const rbm_t &model, const Mat &seed, const Index steps, RNG &rng) const
    {
        BOLTZ_CHECK_CONFIG(steps >= 0, "negative number of Gibbs steps");
        BOLTZ_CHECK_FINITE(seed, "chain seed");

        gibbs_state_t state;
        state.visible = seed;
        state.hidden = sample_hidden(model, state.visible, rng);

        for (Index t = 0; t < steps; ++t) {
            state.visible = sample_visible(model, state.hidden, rng);
            state.hidden = sample_hidden(model, state.visible, rng);
        }
        return state;
    }

    /// fantasy particles for the negative phase of one minibatch
    template <typename RNG>
    gibbs_state_t negative_phase(const rbm_t &model,
                                 const Mat &data_batch,
                                 const Index steps,
                                 RNG &rng)
    {
        if (method == train_options_t::CD) {
            return run(model, data_batch, steps, rng);
        }

        if (!has_chain()) {
            chain = data_batch;
        }

        BOLTZ_CHECK_SHAPE(chain.rows() == data_batch.rows() &&
                              chain.cols() == data_batch.cols(),
                          "persistent chain is " << chain.rows() << " x "
                                                 << chain.cols()
                                                 << ", batch is "
                                                 << data_batch.rows() << " x "
                                                 << data_batch.cols());

        gibbs_state_t state = run(model, chain, steps, rng);
        chain = state.visible;
        return state;
    }

    bool has_chain() const { return chain.size() > 0; }

    const Mat &persistent_chain() const { return chain; }

    void set_persistent_chain(const Mat &_chain) { chain = _chain; }

    /// forget the persistent chain before an independent session
    void reset() { chain.resize(0, 0); }

    const method_t method;

private:
    Mat chain;
};

} // namespace boltz

#endif
