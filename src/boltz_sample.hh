#include <getopt.h>

#include <string>

#include <boost/lexical_cast.hpp>

#include "boltz.hh"
#include "boltz_io.hh"
#include "boltz_model.hh"
#include "boltz_sampler.hh"
#include "utils/io.hh"

#ifndef BOLTZ_SAMPLE_HH_
#define BOLTZ_SAMPLE_HH_

struct sample_options_t {
    using Str = std::string;

    sample_options_t()
    {
        model_file = "";
        init_file = "";
        out = "samples.txt.gz";
        num_samples = 100;
        steps = 100;
        rand_seed = 1;
        write_mean = false;
        write_hidden = false;
    }

    Str model_file;
    Str init_file;
    Str out;

    boltz::Index num_samples;
    boltz::Index steps;
    unsigned int rand_seed;
    bool write_mean;
    bool write_hidden;
};

int
parse_sample_options(const int argc,
                     const char *argv[],
                     sample_options_t &options)
{
    const char *_usage =
        "\n"
        "[Arguments]\n"
        "--model (-m)       : checkpoint written by boltz_train\n"
        "--out (-o)         : output file (.gz ok)\n"
        "\n"
        "[Options]\n"
        "--init (-i)        : initial visible states, one per line\n"
        "--num_samples (-n) : number of chains without --init (100)\n"
        "--steps (-k)       : Gibbs steps (100)\n"
        "--rand_seed (-r)   : random seed (1)\n"
        "--mean (-M)        : write E[v|h] of the last step, not a sample\n"
        "--hidden (-H)      : write the hidden states instead\n"
        "\n";

    const char *const short_opts = "m:o:i:n:k:r:MHh";

    const option long_opts[] =
        { { "model", required_argument, nullptr, 'm' },       //
          { "out", required_argument, nullptr, 'o' },         //
          { "init", required_argument, nullptr, 'i' },        //
          { "num_samples", required_argument, nullptr, 'n' }, //
          { "steps", required_argument, nullptr, 'k' },       //
          { "rand_seed", required_argument, nullptr, 'r' },   //
          { "mean", no_argument, nullptr, 'M' },              //
          { "hidden", no_argument, nullptr, 'H' },            //
          { "help", no_argument, nullptr, 'h' },              //
          { nullptr, no_argument, nullptr, 0 } };

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
            case 'm':
                options.model_file = std::string(optarg);
                break;
            case 'o':
                options.out = std::string(optarg);
                break;
            case 'i':
                options.init_file = std::string(optarg);
                break;
            case 'n':
                options.num_samples =
                    boost::lexical_cast<boltz::Index>(optarg);
                break;
            case 'k':
                options.steps = boost::lexical_cast<boltz::Index>(optarg);
                break;
            case 'r':
                options.rand_seed = boost::lexical_cast<unsigned int>(optarg);
                break;
            case 'M':
                options.write_mean = true;
                break;
            case 'H':
                options.write_hidden = true;
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
    }

    ERR_RET(!file_exists(options.model_file),
            "no such file: " << options.model_file);
    ERR_RET(options.init_file.size() > 0 && !file_exists(options.init_file),
            "no such file: " << options.init_file);
    ERR_RET(options.num_samples < 1, "need at least one sample");
    ERR_RET(options.steps < 0, "negative number of steps");

    return EXIT_SUCCESS;
}

int
run_sample(const sample_options_t &options)
{
    using namespace boltz;

    checkpoint_t ckpt;
    CHK_ERR_RET(read_checkpoint(options.model_file, ckpt),
                "Failed to read " << options.model_file);
    const rbm_t &model = *ckpt.model;

    RNG rng(options.rand_seed);

    Mat init;
    if (options.init_file.size() > 0) {
        CHK_ERR_RET(read_data_file(options.init_file, init),
                    "Failed to read " << options.init_file);
    } else {
        init = random_state(model.visible, options.num_samples, rng);
    }

    TLOG("Running " << init.rows() << " chains for " << options.steps
                    << " steps");

    gibbs_sampler_t sampler;
    const gibbs_state_t state = sampler.run(model, init, options.steps, rng);

    if (options.write_hidden) {
        CHK_ERR_RET(write_data_file(options.out, state.hidden),
                    "Failed to write " << options.out);
    } else if (options.write_mean) {
        CHK_ERR_RET(write_data_file(options.out,
                                    hidden_to_visible(model, state.hidden)),
                    "Failed to write " << options.out);
    } else {
        CHK_ERR_RET(write_data_file(options.out, state.visible),
                    "Failed to write " << options.out);
    }

    TLOG("Wrote " << options.out);
    return EXIT_SUCCESS;
}

#endif
