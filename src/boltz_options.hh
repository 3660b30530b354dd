#include <string>
#include <vector>

#include "boltz.hh"
#include "boltz_layer.hh"

#ifndef BOLTZ_OPTIONS_HH_
#define BOLTZ_OPTIONS_HH_

namespace boltz {

////////////////////////////////////////////////////////////////
// Every recognized option is listed here with its default.
// validate_*() refuses illegal values before anything is built.
////////////////////////////////////////////////////////////////

inline int
lookup_name(const std::vector<std::string> &names,
            const std::string &name,
            const std::string &what)
{
    for (std::size_t j = 0; j < names.size(); ++j) {
        if (names.at(j) == name)
            return static_cast<int>(j);
    }
    throw invalid_configuration_t("unknown " + what + ": " + name);
}

struct model_options_t {
    using Str = std::string;

    model_options_t()
    {
        num_visible = 0;
        num_hidden = 0;
        visible_type = BERNOULLI;
        hidden_type = BERNOULLI;
        visible_var = 1.0;
        hidden_var = 1.0;
        learn_var = false;
        weight_sd = 0.01;
    }

    Index num_visible;
    Index num_hidden;
    unit_type_t visible_type;
    unit_type_t hidden_type;
    Scalar visible_var; // only for Gaussian units
    Scalar hidden_var;  // only for Gaussian units
    bool learn_var;
    Scalar weight_sd; // initial W ~ N(0, weight_sd^2); 0 gives zeros

    void set_visible_type(const Str _type)
    {
        visible_type = parse_unit_type(_type);
    }

    void set_hidden_type(const Str _type)
    {
        hidden_type = parse_unit_type(_type);
    }
};

inline void
validate_options(const model_options_t &options)
{
    BOLTZ_CHECK_CONFIG(options.num_visible > 0,
                       "number of visible units must be positive");
    BOLTZ_CHECK_CONFIG(options.num_hidden > 0,
                       "number of hidden units must be positive");
    BOLTZ_CHECK_CONFIG(options.visible_var > 0,
                       "visible variance must be positive: "
                           << options.visible_var);
    BOLTZ_CHECK_CONFIG(options.hidden_var > 0,
                       "hidden variance must be positive: "
                           << options.hidden_var);
    check_nonneg_t<Scalar>(options.weight_sd, "initial weight sd");
}

struct optimizer_options_t {
    using Str = std::string;

    typedef enum { SGD, ADAM } method_t;
    typedef enum { CONSTANT, EXPONENTIAL, POWER_LAW } schedule_t;

    const std::vector<Str> METHOD_NAMES;
    const std::vector<Str> SCHEDULE_NAMES;

    optimizer_options_t()
        : METHOD_NAMES{ "SGD", "ADAM" }
        , SCHEDULE_NAMES{ "CONSTANT", "EXPONENTIAL", "POWER_LAW" }
    {
        method = SGD;
        learning_rate = 1e-2;
        schedule = CONSTANT;
        decay = 1.0;
        momentum = 0.0;
        beta1 = 0.9;
        beta2 = 0.999;
        epsilon = 1e-8;
        weight_decay = 0.0;
    }

    method_t method;
    Scalar learning_rate;
    schedule_t schedule;
    Scalar decay; // EXPONENTIAL: lr * decay^t, POWER_LAW: lr / (1 + decay t)
    Scalar momentum;
    Scalar beta1;
    Scalar beta2;
    Scalar epsilon;
    Scalar weight_decay; // L2 penalty on the weight matrix

    void set_method(const Str _method)
    {
        method = static_cast<method_t>(
            lookup_name(METHOD_NAMES, _method, "optimizer"));
    }

    void set_schedule(const Str _schedule)
    {
        schedule = static_cast<schedule_t>(
            lookup_name(SCHEDULE_NAMES, _schedule, "schedule"));
    }
};

inline void
validate_options(const optimizer_options_t &options)
{
    check_positive_t<Scalar>(options.learning_rate, "learning rate");
    check_unit_interval_t<Scalar>(options.momentum, "momentum");
    check_unit_interval_t<Scalar>(options.beta1, "beta1");
    check_unit_interval_t<Scalar>(options.beta2, "beta2");
    check_positive_t<Scalar>(options.epsilon, "epsilon");
    check_nonneg_t<Scalar>(options.weight_decay, "weight decay");

    switch (options.schedule) {
    case optimizer_options_t::EXPONENTIAL:
        BOLTZ_CHECK_CONFIG(options.decay > 0 && options.decay <= 1,
                           "exponential decay must lie in (0, 1]: "
                               << options.decay);
        break;
    case optimizer_options_t::POWER_LAW:
        check_nonneg_t<Scalar>(options.decay, "power-law decay");
        break;
    case optimizer_options_t::CONSTANT:
        break;
    }
}

/// magnetization search of the TAP free energy
struct tap_options_t {

    tap_options_t()
    {
        terms = 2;
        learning_rate = 0.1;
        tolerance = 1e-7;
        max_iters = 100;
        num_seeds = 0;
    }

    int terms;            // 1: naive mean field, 2: with the Onsager term
    double learning_rate; // halved whenever a step goes uphill
    double tolerance;     // stop once the decrease falls below this
    Index max_iters;
    Index num_seeds; // persistent magnetizations; 0 draws a fresh one
};

inline void
validate_options(const tap_options_t &options)
{
    BOLTZ_CHECK_CONFIG(options.terms == 1 || options.terms == 2,
                       "TAP expansion supports 1 or 2 terms: "
                           << options.terms);
    check_positive_t<double>(options.learning_rate, "TAP learning rate");
    check_nonneg_t<double>(options.tolerance, "TAP tolerance");
    check_positive_t<Index>(options.max_iters, "TAP iterations");
    check_nonneg_t<Index>(options.num_seeds, "TAP seeds");
}

struct train_options_t {
    using Str = std::string;

    typedef enum { CD, PCD } sampler_method_t;
    typedef enum { GIBBS, TAP } estimator_t;
    typedef enum { RAISE, REPORT } divergence_policy_t;

    const std::vector<Str> SAMPLER_NAMES;
    const std::vector<Str> ESTIMATOR_NAMES;
    const std::vector<Str> POLICY_NAMES;

    train_options_t()
        : SAMPLER_NAMES{ "CD", "PCD" }
        , ESTIMATOR_NAMES{ "GIBBS", "TAP" }
        , POLICY_NAMES{ "RAISE", "REPORT" }
    {
        epochs = 10;
        batch_size = 100;
        sampler_steps = 1;
        sampler = CD;
        estimator = GIBBS;
        on_divergence = RAISE;
        shuffle = true;
        rand_seed = 1;
        verbose = false;
        metric_samples = 0;
    }

    Index epochs;
    Index batch_size;
    Index sampler_steps;
    sampler_method_t sampler;
    estimator_t estimator; // negative phase: Gibbs chains or TAP
    tap_options_t tap;
    divergence_policy_t on_divergence;
    bool shuffle;
    unsigned int rand_seed;
    bool verbose;
    Index metric_samples; // > 0 turns on energy gap/distance/z-score

    void set_sampler(const Str _method)
    {
        sampler = static_cast<sampler_method_t>(
            lookup_name(SAMPLER_NAMES, _method, "sampler"));
    }

    void set_estimator(const Str _estimator)
    {
        estimator = static_cast<estimator_t>(
            lookup_name(ESTIMATOR_NAMES, _estimator, "estimator"));
    }

    void set_divergence_policy(const Str _policy)
    {
        on_divergence = static_cast<divergence_policy_t>(
            lookup_name(POLICY_NAMES, _policy, "divergence policy"));
    }
};

inline void
validate_options(const train_options_t &options)
{
    check_nonneg_t<Index>(options.epochs, "number of epochs");
    check_positive_t<Index>(options.batch_size, "batch size");
    check_nonneg_t<Index>(options.sampler_steps, "number of sampler steps");
    check_nonneg_t<Index>(options.metric_samples, "metric samples");
    validate_options(options.tap);
}

} // namespace boltz

#endif
