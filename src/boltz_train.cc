#include "boltz_train.hh"

int
main(const int argc, const char *argv[])
{
    train_cli_options_t options;
    CHECK(parse_train_options(argc, argv, options));

    TLOG("Start training...");
    try {
        CHECK(run_train(options));
    } catch (const boltz::error_t &e) {
        ELOG(e.what());
        return EXIT_FAILURE;
    }
    TLOG("Done");

    return EXIT_SUCCESS;
}
