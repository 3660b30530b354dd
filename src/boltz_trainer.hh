#include <algorithm>
#include <atomic>
#include <numeric>
#include <string>
#include <vector>

#include "boltz.hh"
#include "boltz_gradient.hh"
#include "boltz_metric.hh"
#include "boltz_model.hh"
#include "boltz_optimizer.hh"
#include "boltz_options.hh"
#include "boltz_sampler.hh"
#include "boltz_tap.hh"
#include "utils/progress.hh"

#ifndef BOLTZ_TRAINER_HH_
#define BOLTZ_TRAINER_HH_

namespace boltz {

////////////////////////////////////////////////////////////////
// Rows of a dense matrix visited in a (re)shuffled order
//
// Only full minibatches are produced; the left-over rows of one
// epoch land in other batches after the next shuffle.  A data set
// smaller than one batch is a single batch.
////////////////////////////////////////////////////////////////

struct dense_data_t {

    explicit dense_data_t(const Mat &_data)
        : data(_data)
        , order(_data.rows())
    {
        std::iota(order.begin(), order.end(), 0);
    }

    Index rows() const { return data.rows(); }
    Index cols() const { return data.cols(); }

    template <typename RNG>
    void shuffle(RNG &rng)
    {
        std::shuffle(order.begin(), order.end(), rng);
    }

    Index effective_batch_size(const Index batch_size) const
    {
        return std::min(batch_size, rows());
    }

    Index num_batches(const Index batch_size) const
    {
        const Index bs = effective_batch_size(batch_size);
        return bs > 0 ? rows() / bs : 0;
    }

    Mat take_batch(const Index b, const Index batch_size) const
    {
        const Index bs = effective_batch_size(batch_size);
        Mat ret(bs, cols());
        for (Index i = 0; i < bs; ++i) {
            ret.row(i) = data.row(order.at(b * bs + i));
        }
        return ret;
    }

private:
    const Mat &data;
    std::vector<Index> order;
};

struct epoch_report_t {
    Index epoch;
    Index num_batches;
    Scalar mean_energy;     // E(v, E[h|v]) averaged over the data seen
    Scalar recon_error;     // mean squared reconstruction error per entry
    Scalar grad_norm;       // average RMS magnitude of the gradients
    Scalar recon_rmse;      // reconstruction_error_t
    Scalar energy_distance; // NaN unless metric samples are requested
    Scalar energy_gap;
    Scalar energy_zscore;
    Scalar heat_capacity; // Bernoulli units only
};

struct training_report_t {

    training_report_t()
        : steps(0)
        , diverged(false)
        , cancelled(false)
        , diverged_step(-1)
        , message("")
    {
    }

    std::vector<epoch_report_t> epochs;
    Index steps;         // committed optimizer steps
    bool diverged;       // stopped by a numerical divergence
    bool cancelled;      // stopped by the cancellation flag
    Index diverged_step; // optimizer step that failed, -1 otherwise
    std::string message;
};

////////////////////////////////////////////////////////////////
// Everything that carries over from one minibatch to the next:
// optimizer buffers, the persistent chain or TAP seeds and the
// generator.  Restoring these from a checkpoint resumes a run.
////////////////////////////////////////////////////////////////

struct training_session_t {

    explicit training_session_t(const train_options_t &_train_options,
                                const optimizer_options_t &_optimizer_options)
        : train_options(_train_options)
        , optimizer(_optimizer_options)
        , sampler(_train_options.sampler)
        , tap(_train_options.tap)
        , rng(_train_options.rand_seed)
    {
        validate_options(train_options);
    }

    const train_options_t train_options;
    optimizer_t optimizer;
    gibbs_sampler_t sampler;
    tap_estimator_t tap;
    RNG rng;
};

/// epoch-wise accumulation of the monitoring quantities
struct epoch_monitor_t {

    explicit epoch_monitor_t(const Index _epoch, const Index metric_samples)
        : epoch(_epoch)
        , nbatch(0)
        , energy_tot(0)
        , sq_err_tot(0)
        , nentry(0)
        , grad_tot(0)
        , use_metrics(metric_samples > 0)
        , dist(metric_samples > 0 ? metric_samples : 1)
    {
    }

    void update(const rbm_t &model, const estimate_t &est)
    {
        const phase_stat_t &pos = est.positive;
        energy_tot += energy(model, pos.visible, pos.hidden).mean();

        const Mat recon = hidden_to_visible(model, pos.hidden);
        sq_err_tot += (pos.visible - recon).squaredNorm();
        nentry += static_cast<Scalar>(pos.visible.size());
        rmse.update(pos.visible, recon);

        grad_tot += grad_magnitude(est.grad);
        ++nbatch;
    }

    void update_metrics(const rbm_t &model,
                        const estimate_t &est,
                        const Mat &random)
    {
        if (!use_metrics)
            return;
        dist.update(est.positive.visible, est.negative.visible);
        gap.update(model, est.positive.visible, random);
        zscore.update(model, est.positive.visible, random);
    }

    /// once per epoch, on the parameters at its end
    void update_heat_capacity(const rbm_t &model)
    {
        if (use_metrics && is_bernoulli_rbm(model))
            heat.update(model);
    }

    epoch_report_t report() const
    {
        const Scalar nb = static_cast<Scalar>(nbatch);
        epoch_report_t ret;
        ret.epoch = epoch;
        ret.num_batches = nbatch;
        ret.mean_energy = nbatch > 0 ? energy_tot / nb : NAN;
        ret.recon_error = nentry > 0 ? sq_err_tot / nentry : NAN;
        ret.grad_norm = nbatch > 0 ? grad_tot / nb : NAN;
        ret.recon_rmse = rmse.value();
        ret.energy_distance = use_metrics ? dist.value() : NAN;
        ret.energy_gap = use_metrics ? gap.value() : NAN;
        ret.energy_zscore = use_metrics ? zscore.value() : NAN;
        ret.heat_capacity = heat.value();
        return ret;
    }

    const Index epoch;
    Index nbatch;

private:
    Scalar energy_tot;
    Scalar sq_err_tot;
    Scalar nentry;
    Scalar grad_tot;
    const bool use_metrics;
    reconstruction_error_t rmse;
    energy_distance_t dist;
    energy_gap_t gap;
    energy_zscore_t zscore;
    heat_capacity_t heat;
};

inline void
log_epoch(const epoch_report_t &rep)
{
    TLOG("Epoch " << (rep.epoch + 1) << " [" << rep.num_batches
                  << " batches] energy: " << rep.mean_energy
                  << ", recon: " << rep.recon_error
                  << ", |grad|: " << rep.grad_norm);
}

////////////////////////////////////////////////////////////////
// Minibatch stochastic gradient training within a session
//
// For every minibatch:
//   (1) positive and negative phase -> gradient
//   (2) monitoring on the parameters the gradient saw
//   (3) optimizer step
//
// The negative phase comes from the Gibbs sampler or from the
// TAP free energy.  The cancellation flag is polled between
// minibatches.  On numerical divergence the model keeps the
// last committed parameters; RAISE rethrows with the failing
// step, REPORT returns what was done so far.  Either way
// `report` holds the epochs up to the failure.
////////////////////////////////////////////////////////////////

inline void
fit_session(training_session_t &session,
            rbm_t &model,
            const Mat &data,
            const std::atomic_bool *cancel,
            training_report_t &report)
{
    const train_options_t &options = session.train_options;

    BOLTZ_CHECK_SHAPE(data.cols() == model.num_visible(),
                      "data has " << data.cols() << " columns, model has "
                                  << model.num_visible() << " visible units");
    BOLTZ_CHECK_SHAPE(data.rows() > 0, "no data");

    const bool use_tap = (options.estimator == train_options_t::TAP);
    if (use_tap)
        check_tap_model(model);

    dense_data_t source(data);
    const Index batch_size = source.effective_batch_size(options.batch_size);
    const Index nbatch = source.num_batches(options.batch_size);

    report = training_report_t();

    for (Index epoch = 0; epoch < options.epochs; ++epoch) {

        if (options.shuffle)
            source.shuffle(session.rng);

        epoch_monitor_t monitor(epoch, options.metric_samples);
        progress_bar_t<Index> prog(nbatch, 1);

        for (Index b = 0; b < nbatch; ++b) {

            if (cancel && cancel->load()) {
                report.cancelled = true;
                break;
            }

            const Mat batch = source.take_batch(b, batch_size);

            try {
                const estimate_t est = use_tap
                    ? estimate_tap_with_stats(model,
                                              batch,
                                              session.tap,
                                              session.rng)
                    : estimate_with_stats(model,
                                          batch,
                                          session.sampler,
                                          options.sampler_steps,
                                          session.rng);

                monitor.update(model, est);

                if (options.metric_samples > 0) {
                    const Mat random_batch = random_state(model.visible,
                                                    options.metric_samples,
                                                    session.rng);
                    monitor.update_metrics(model, est, random_batch);
                }

                session.optimizer.step(model, est.grad);

            } catch (numerical_divergence_t &e) {
                e.step = session.optimizer.num_steps();
                report.diverged = true;
                report.diverged_step = e.step;
                report.message = e.what();
                report.steps = session.optimizer.num_steps();

                if (monitor.nbatch > 0)
                    report.epochs.emplace_back(monitor.report());

                if (options.on_divergence == train_options_t::RAISE)
                    throw;

                WLOG("Stopped at step " << e.step << ": " << e.what());
                return;
            }

            if (options.verbose) {
                prog.update();
                prog(std::cerr);
            }
        }

        if (monitor.nbatch > 0) {
            monitor.update_heat_capacity(model);
            report.epochs.emplace_back(monitor.report());
            log_epoch(report.epochs.back());
        }

        if (report.cancelled) {
            TLOG("Cancelled after " << session.optimizer.num_steps()
                                    << " steps");
            break;
        }
    }

    report.steps = session.optimizer.num_steps();
}

inline training_report_t
fit_session(training_session_t &session,
            rbm_t &model,
            const Mat &data,
            const std::atomic_bool *cancel = nullptr)
{
    training_report_t report;
    fit_session(session, model, data, cancel, report);
    return report;
}

inline training_report_t
fit(rbm_t &model,
    const Mat &data,
    const train_options_t &train_options,
    const optimizer_options_t &optimizer_options,
    const std::atomic_bool *cancel = nullptr)
{
    training_session_t session(train_options, optimizer_options);
    return fit_session(session, model, data, cancel);
}

} // namespace boltz

#endif
