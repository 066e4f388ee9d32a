#include <gtest/gtest.h>

#include <csignal>
#include <initializer_list>
#include <string>
#include <vector>
#include <fmt/core.h>

#include "cli/app/app.hpp"
#include "infra/interrupt.hpp"
#include "test_support.hpp"

using dirshift::testing::ScriptedPrompter;
using dirshift::testing::TempDir;
using dirshift::testing::write_file;

namespace fs = std::filesystem;

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        dirshift::infra::reset_interrupted();
        write_file(tmp / "src/one.txt", 11);
        write_file(tmp / "src/sub/two.txt", 22);
    }
    void TearDown() override {
        dirshift::infra::reset_interrupted();
    }

    auto run(std::initializer_list<std::string> tokens) -> int {
        std::vector<std::string> owned{"dirshift"};
        owned.insert(owned.end(), tokens.begin(), tokens.end());
        std::vector<const char*> argv;
        for (const auto& token : owned) argv.push_back(token.c_str());
        return dirshift::cli::run(static_cast<int>(argv.size()), argv.data(), prompter,
                                  dirshift::testing::local_copy_runner);
    }

    auto write_config(std::string_view body) -> std::string {
        const auto path = tmp / "transfers.yaml";
        write_file(path, body);
        return path.string();
    }

    TempDir tmp;
    ScriptedPrompter prompter;
};

TEST_F(AppTest, FailedValidationStillExitsZero)
{
    write_file(tmp / "dst/one.txt", 11);
    const auto config = write_config(fmt::format("transfers:\n  - source: {}\n    destination: {}\n",
                                                 (tmp / "src").string(), (tmp / "dst").string()));

    EXPECT_EQ(run({"-v", "-f", config}), 0);
    EXPECT_TRUE(prompter.questions.empty());
    EXPECT_FALSE(fs::exists(tmp / "dst/sub/two.txt"));
}

TEST_F(AppTest, TransferOnlyCopiesAndExitsZero)
{
    const auto config = write_config(fmt::format("transfers:\n  - source: {}\n    destination: {}\n",
                                                 (tmp / "src").string(), (tmp / "out/dst").string()));

    EXPECT_EQ(run({"-t", "-f", config}), 0);
    EXPECT_TRUE(fs::exists(tmp / "out/dst/sub/two.txt"));
}

TEST_F(AppTest, MissingConfigFileExitsOne)
{
    EXPECT_EQ(run({"-f", (tmp / "absent.yaml").string()}), 1);
}

TEST_F(AppTest, EmptyJobListExitsOne)
{
    const auto config = write_config("transfers: []\n");
    EXPECT_EQ(run({"-f", config}), 1);
}

TEST_F(AppTest, UnknownFlagExitsTwo)
{
    EXPECT_EQ(run({"--no-such-flag"}), 2);
}

TEST_F(AppTest, LogFileIsNotCreatedOnConfigError)
{
    const auto log = tmp / "run.log";
    EXPECT_EQ(run({"--log-file", log.string(), "-f", (tmp / "absent.yaml").string()}), 1);
    EXPECT_FALSE(fs::exists(log));
}

TEST_F(AppTest, LogFileIsWrittenOnceJobsResolve)
{
    const auto log = tmp / "run.log";
    const auto config = write_config(fmt::format("transfers:\n  - source: {}\n    destination: {}\n",
                                                 (tmp / "src").string(), (tmp / "dst").string()));

    EXPECT_EQ(run({"-b", "--log-file", log.string(), "-f", config}), 0);
    EXPECT_TRUE(fs::exists(log));
}

TEST_F(AppTest, InterruptBeforeFirstJobExitsWithSignalStatus)
{
    const auto config = write_config(fmt::format("transfers:\n  - source: {}\n    destination: {}\n",
                                                 (tmp / "src").string(), (tmp / "dst").string()));
    dirshift::infra::reset_interrupted(SIGINT);

    EXPECT_EQ(run({"-t", "-f", config}), 130);
    EXPECT_FALSE(fs::exists(tmp / "dst"));
}
