#include <getopt.h>

#include <atomic>
#include <csignal>
#include <string>

#include <boost/lexical_cast.hpp>

#include "boltz.hh"
#include "boltz_io.hh"
#include "boltz_model.hh"
#include "boltz_options.hh"
#include "boltz_trainer.hh"
#include "utils/io.hh"

#ifndef BOLTZ_TRAIN_HH_
#define BOLTZ_TRAIN_HH_

struct train_cli_options_t {
    using Str = std::string;

    train_cli_options_t()
    {
        data_file = "";
        out = "output";
        resume_file = "";
    }

    Str data_file;
    Str out;
    Str resume_file;

    boltz::model_options_t model;
    boltz::train_options_t train;
    boltz::optimizer_options_t optim;

    /// rbm, grbm or hopfield
    void set_model_preset(const Str _preset)
    {
        if (_preset == "rbm") {
            model.visible_type = boltz::BERNOULLI;
            model.hidden_type = boltz::BERNOULLI;
        } else if (_preset == "grbm") {
            model.visible_type = boltz::GAUSSIAN;
            model.hidden_type = boltz::BERNOULLI;
        } else if (_preset == "hopfield") {
            model.visible_type = boltz::BERNOULLI;
            model.hidden_type = boltz::GAUSSIAN;
        } else {
            throw boltz::invalid_configuration_t("unknown model: " + _preset);
        }
    }
};

int
parse_train_options(const int argc,
                    const char *argv[],
                    train_cli_options_t &options)
{
    const char *_usage =
        "\n"
        "[Arguments]\n"
        "--data (-d)           : data file, one sample per line (.gz ok)\n"
        "--out (-o)            : output file header\n"
        "\n"
        "[Model]\n"
        "--model (-m)          : rbm, grbm or hopfield (default: rbm)\n"
        "--visible (-V)        : visible units, bernoulli or gaussian\n"
        "--hidden (-H)         : hidden units, bernoulli or gaussian\n"
        "--num_hidden (-n)     : number of hidden units\n"
        "--var (-s)            : initial variance of Gaussian units (1)\n"
        "--learn_var (-L)      : learn the variance of Gaussian units\n"
        "--weight_sd (-W)      : initial weights ~ N(0, sd^2) (0.01)\n"
        "--resume (-R)         : start from this checkpoint\n"
        "\n"
        "[Sampler]\n"
        "--sampler (-S)        : CD or PCD (default: CD)\n"
        "--steps (-k)          : Gibbs steps per minibatch (1)\n"
        "--estimator (-E)      : GIBBS or TAP negative phase (GIBBS)\n"
        "--tap_terms (-T)      : TAP expansion, 1 or 2 terms (2)\n"
        "--tap_iters (-I)      : TAP descent steps per minibatch (100)\n"
        "--tap_seeds (-P)      : persistent TAP magnetizations (0)\n"
        "\n"
        "[Training]\n"
        "--epochs (-e)         : number of passes over the data (10)\n"
        "--batch_size (-b)     : minibatch size (100)\n"
        "--no_shuffle (-N)     : keep the data order\n"
        "--rand_seed (-r)      : random seed (1)\n"
        "--metric_samples (-M) : random samples for the energy metrics (0)\n"
        "--on_divergence (-D)  : RAISE or REPORT (default: RAISE)\n"
        "--verbose (-v)        : show progress\n"
        "\n"
        "[Optimizer]\n"
        "--optimizer (-O)      : SGD or ADAM (default: SGD)\n"
        "--learning_rate (-l)  : initial learning rate (0.01)\n"
        "--schedule (-c)       : CONSTANT, EXPONENTIAL or POWER_LAW\n"
        "--decay (-y)          : decay of the learning-rate schedule (1)\n"
        "--momentum (-u)       : SGD momentum in [0, 1) (0)\n"
        "--beta1 (-1)          : ADAM first moment decay (0.9)\n"
        "--beta2 (-2)          : ADAM second moment decay (0.999)\n"
        "--weight_decay (-w)   : L2 penalty on the weights (0)\n"
        "\n"
        "[Output]\n"
        "${out}.model.gz       : checkpoint (model, optimizer, chain, rng)\n"
        "${out}.report.gz      : per-epoch report, tab-separated\n"
        "\n";

    const char *const short_opts =
        "d:o:m:V:H:n:s:LW:R:S:k:E:T:I:P:e:b:Nr:M:D:vO:l:c:y:u:1:2:w:h";

    const option long_opts[] =
        { { "data", required_argument, nullptr, 'd' },           //
          { "out", required_argument, nullptr, 'o' },            //
          { "model", required_argument, nullptr, 'm' },          //
          { "visible", required_argument, nullptr, 'V' },        //
          { "hidden", required_argument, nullptr, 'H' },         //
          { "num_hidden", required_argument, nullptr, 'n' },     //
          { "var", required_argument, nullptr, 's' },            //
          { "learn_var", no_argument, nullptr, 'L' },            //
          { "weight_sd", required_argument, nullptr, 'W' },      //
          { "resume", required_argument, nullptr, 'R' },         //
          { "sampler", required_argument, nullptr, 'S' },        //
          { "steps", required_argument, nullptr, 'k' },          //
          { "estimator", required_argument, nullptr, 'E' },      //
          { "tap_terms", required_argument, nullptr, 'T' },      //
          { "tap_iters", required_argument, nullptr, 'I' },      //
          { "tap_seeds", required_argument, nullptr, 'P' },      //
          { "epochs", required_argument, nullptr, 'e' },         //
          { "batch_size", required_argument, nullptr, 'b' },     //
          { "no_shuffle", no_argument, nullptr, 'N' },           //
          { "rand_seed", required_argument, nullptr, 'r' },      //
          { "metric_samples", required_argument, nullptr, 'M' }, //
          { "on_divergence", required_argument, nullptr, 'D' },  //
          { "verbose", no_argument, nullptr, 'v' },              //
          { "optimizer", required_argument, nullptr, 'O' },      //
          { "learning_rate", required_argument, nullptr, 'l' },  //
          { "schedule", required_argument, nullptr, 'c' },       //
          { "decay", required_argument, nullptr, 'y' },          //
          { "momentum", required_argument, nullptr, 'u' },       //
          { "beta1", required_argument, nullptr, '1' },          //
          { "beta2", required_argument, nullptr, '2' },          //
          { "weight_decay", required_argument, nullptr, 'w' },   //
          { "help", no_argument, nullptr, 'h' },                 //
          { nullptr, no_argument, nullptr, 0 } };

    using boltz::Index;
    using boltz::Scalar;

    optind = 1;

    try {
        while (true) {
            const auto opt = getopt_long(argc,                      //
                                         const_cast<char **>(argv), //
                                         short_opts,                //
                                         long_opts,                 //
                                         nullptr);

            if (-1 == opt)
                break;

            switch (opt) {
            case 'd':
                options.data_file = std::string(optarg);
                break;
            case 'o':
                options.out = std::string(optarg);
                break;
            case 'm':
                options.set_model_preset(std::string(optarg));
                break;
            case 'V':
                options.model.set_visible_type(std::string(optarg));
                break;
            case 'H':
                options.model.set_hidden_type(std::string(optarg));
                break;
            case 'n':
                options.model.num_hidden = boost::lexical_cast<Index>(optarg);
                break;
            case 's':
                options.model.visible_var = boost::lexical_cast<Scalar>(optarg);
                options.model.hidden_var = options.model.visible_var;
                break;
            case 'L':
                options.model.learn_var = true;
                break;
            case 'W':
                options.model.weight_sd = boost::lexical_cast<Scalar>(optarg);
                break;
            case 'R':
                options.resume_file = std::string(optarg);
                break;
            case 'S':
                options.train.set_sampler(std::string(optarg));
                break;
            case 'k':
                options.train.sampler_steps = boost::lexical_cast<Index>(optarg);
                break;
            case 'E':
                options.train.set_estimator(std::string(optarg));
                break;
            case 'T':
                options.train.tap.terms = boost::lexical_cast<int>(optarg);
                break;
            case 'I':
                options.train.tap.max_iters =
                    boost::lexical_cast<Index>(optarg);
                break;
            case 'P':
                options.train.tap.num_seeds =
                    boost::lexical_cast<Index>(optarg);
                break;
            case 'e':
                options.train.epochs = boost::lexical_cast<Index>(optarg);
                break;
            case 'b':
                options.train.batch_size = boost::lexical_cast<Index>(optarg);
                break;
            case 'N':
                options.train.shuffle = false;
                break;
            case 'r':
                options.train.rand_seed =
                    boost::lexical_cast<unsigned int>(optarg);
                break;
            case 'M':
                options.train.metric_samples =
                    boost::lexical_cast<Index>(optarg);
                break;
            case 'D':
                options.train.set_divergence_policy(std::string(optarg));
                break;
            case 'v': // -v or --verbose
                options.train.verbose = true;
                break;
            case 'O':
                options.optim.set_method(std::string(optarg));
                break;
            case 'l':
                options.optim.learning_rate =
                    boost::lexical_cast<Scalar>(optarg);
                break;
            case 'c':
                options.optim.set_schedule(std::string(optarg));
                break;
            case 'y':
                options.optim.decay = boost::lexical_cast<Scalar>(optarg);
                break;
            case 'u':
                options.optim.momentum = boost::lexical_cast<Scalar>(optarg);
                break;
            case '1':
                options.optim.beta1 = boost::lexical_cast<Scalar>(optarg);
                break;
            case '2':
                options.optim.beta2 = boost::lexical_cast<Scalar>(optarg);
                break;
            case 'w':
                options.optim.weight_decay =
                    boost::lexical_cast<Scalar>(optarg);
                break;
            case 'h': // -h or --help
            case '?': // Unrecognized option
                std::cerr << _usage << std::endl;
                return EXIT_FAILURE;
            default: //
                ;
            }
        }
    } catch (const boost::bad_lexical_cast &) {
        ELOG("Not a number: " << optarg);
        return EXIT_FAILURE;
    } catch (const boltz::error_t &e) {
        ELOG(e.what());
        return EXIT_FAILURE;
    }

    ERR_RET(options.data_file.size() == 0, "missing data file");
    ERR_RET(!file_exists(options.data_file),
            "no such file: " << options.data_file);
    ERR_RET(options.resume_file.size() == 0 && options.model.num_hidden < 1,
            "need a positive number of hidden units");

    return EXIT_SUCCESS;
}

////////////////////////////////////////////////////////////////
// Tab-separated per-epoch report
inline int
write_training_report(const std::string filename,
                      const boltz::training_report_t &report)
{
    return write_stream_file(filename, [&report](std::ostream &ofs) {
        ofs << "epoch\tbatches\tenergy\trecon_mse\tgrad_norm\trecon_rmse"
            << "\tenergy_distance\tenergy_gap\tenergy_zscore"
            << "\theat_capacity\n";
        for (const boltz::epoch_report_t &r : report.epochs) {
            ofs << (r.epoch + 1) << "\t" << r.num_batches << "\t"
                << r.mean_energy << "\t" << r.recon_error << "\t"
                << r.grad_norm << "\t" << r.recon_rmse << "\t"
                << r.energy_distance << "\t" << r.energy_gap << "\t"
                << r.energy_zscore << "\t" << r.heat_capacity << "\n";
        }
        return ofs.good() ? EXIT_SUCCESS : EXIT_FAILURE;
    });
}

/// ${out}.model.gz and ${out}.report.gz
inline int
write_training_outputs(const std::string out,
                       const boltz::rbm_t &model,
                       const boltz::training_session_t &session,
                       const boltz::training_report_t &report)
{
    const std::string model_file = out + ".model.gz";
    const std::string report_file = out + ".report.gz";

    CHK_ERR_RET(boltz::write_checkpoint(model_file, model, session),
                "Failed to write " << model_file);
    CHK_ERR_RET(write_training_report(report_file, report),
                "Failed to write " << report_file);

    TLOG("Wrote " << model_file << " after " << report.steps << " steps");
    return EXIT_SUCCESS;
}

// set by SIGINT; training stops after the current minibatch
static std::atomic_bool train_interrupted(false);

static void
handle_interrupt(int)
{
    train_interrupted.store(true);
}

int
run_train(const train_cli_options_t &options)
{
    using namespace boltz;

    Mat X;
    CHK_ERR_RET(read_data_file(options.data_file, X),
                "Failed to read " << options.data_file);
    TLOG("Read " << X.rows() << " x " << X.cols() << " data");

    training_session_t session(options.train, options.optim);
    std::shared_ptr<rbm_t> model;

    if (options.resume_file.size() > 0) {
        checkpoint_t ckpt;
        CHK_ERR_RET(read_checkpoint(options.resume_file, ckpt),
                    "Failed to read " << options.resume_file);
        model = ckpt.model;
        restore_session(ckpt, *model, session);
        TLOG("Resuming from step " << ckpt.step);
    } else {
        model_options_t mopt = options.model;
        mopt.num_visible = X.cols();
        model = std::make_shared<rbm_t>(make_model(mopt, session.rng));
    }

    TLOG("Model: " << unit_name(unit_type(model->visible)) << " ("
                   << model->num_visible() << ") x "
                   << unit_name(unit_type(model->hidden)) << " ("
                   << model->num_hidden() << ")");

    std::signal(SIGINT, handle_interrupt);

    // under RAISE the divergence escapes fit_session, but the model,
    // session and report are still those of the last committed step
    training_report_t report;
    try {
        fit_session(session, *model, X, &train_interrupted, report);
    } catch (const numerical_divergence_t &e) {
        ELOG("Diverged at step " << e.step << ": " << e.what());
        CHK_ERR_RET(write_training_outputs(options.out,
                                           *model,
                                           session,
                                           report),
                    "Failed to save the diverged run");
        return EXIT_FAILURE;
    }

    return write_training_outputs(options.out, *model, session, report);
}

#endif
