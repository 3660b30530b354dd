#include <fstream>
#include <string>

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>

#include "boltz_train.hh"

using namespace boltz;
namespace fs = boost::filesystem;

class TrainToolTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir = fs::temp_directory_path() / fs::unique_path("boltz-%%%%-%%%%");
        fs::create_directories(dir);
    }

    void TearDown() override
    {
        boost::system::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string path(const std::string &name) const
    {
        return (dir / name).string();
    }

    // bars in six columns; the second minibatch of two carries a NaN
    train_cli_options_t broken_run(const std::string &out) const
    {
        {
            std::ofstream ofs(path("data.txt").c_str());
            ofs << "1 1 1 0 0 0\n"
                << "0 0 0 1 1 1\n"
                << "1 1 1 0 0 0\n"
                << "NA 0 0 1 1 1\n";
        }

        train_cli_options_t options;
        options.data_file = path("data.txt");
        options.out = path(out);
        options.model.num_hidden = 3;
        options.model.weight_sd = 0.1;
        options.train.epochs = 2;
        options.train.batch_size = 2;
        options.train.shuffle = false;
        return options;
    }

    Index count_lines(const std::string &file) const
    {
        Index ret = 0;
        const int rc = read_stream_file(file, [&ret](std::istream &ifs) {
            std::string line;
            while (std::getline(ifs, line))
                ++ret;
            return EXIT_SUCCESS;
        });
        return rc == EXIT_SUCCESS ? ret : -1;
    }

    fs::path dir;
};

TEST_F(TrainToolTest, DivergedRunStillWritesItsOutputs)
{
    const train_cli_options_t options = broken_run("raise");
    ASSERT_EQ(options.train.on_divergence, train_options_t::RAISE);

    EXPECT_EQ(run_train(options), EXIT_FAILURE);

    ASSERT_TRUE(file_exists(path("raise.model.gz")));
    ASSERT_TRUE(file_exists(path("raise.report.gz")));

    checkpoint_t ckpt;
    ASSERT_EQ(read_checkpoint(path("raise.model.gz"), ckpt), EXIT_SUCCESS);
    EXPECT_EQ(ckpt.step, 1);
    EXPECT_TRUE(ckpt.model->weight.allFinite());
    EXPECT_FALSE(ckpt.rng_state.empty());

    // header and the epoch cut short
    EXPECT_EQ(count_lines(path("raise.report.gz")), 2);

    // the checkpoint resumes like any other
    training_session_t session(options.train, options.optim);
    restore_session(ckpt, *ckpt.model, session);
    EXPECT_EQ(session.optimizer.num_steps(), 1);
}

TEST_F(TrainToolTest, ReportedDivergenceIsNotAFailure)
{
    train_cli_options_t options = broken_run("report");
    options.train.set_divergence_policy("REPORT");

    EXPECT_EQ(run_train(options), EXIT_SUCCESS);

    checkpoint_t ckpt;
    ASSERT_EQ(read_checkpoint(path("report.model.gz"), ckpt), EXIT_SUCCESS);
    EXPECT_EQ(ckpt.step, 1);
    EXPECT_EQ(count_lines(path("report.report.gz")), 2);
}

TEST_F(TrainToolTest, CleanRunWritesEveryEpoch)
{
    train_cli_options_t options = broken_run("clean");
    {
        std::ofstream ofs(path("data.txt").c_str());
        ofs << "1 1 1 0 0 0\n0 0 0 1 1 1\n1 1 1 0 0 0\n0 0 0 1 1 1\n";
    }

    EXPECT_EQ(run_train(options), EXIT_SUCCESS);
    EXPECT_EQ(count_lines(path("clean.report.gz")), 3);

    checkpoint_t ckpt;
    ASSERT_EQ(read_checkpoint(path("clean.model.gz"), ckpt), EXIT_SUCCESS);
    EXPECT_EQ(ckpt.step, 4);
}
