#include "boltz_sample.hh"

int
main(const int argc, const char *argv[])
{
    sample_options_t options;
    CHECK(parse_sample_options(argc, argv, options));

    try {
        CHECK(run_sample(options));
    } catch (const boltz::error_t &e) {
        ELOG(e.what());
        return EXIT_FAILURE;
    }
    TLOG("Done");

    return EXIT_SUCCESS;
}
