#include <gtest/gtest.h>

#include <initializer_list>
#include <vector>

#include "cli/args_parser/args_parser.hpp"

using dirshift::args_parser::CLIArgs;
using dirshift::args_parser::kDefaultConfigFile;
using dirshift::args_parser::parse_args;
using dirshift::core::Operation;
using dirshift::infra::ErrorCode;

namespace {

auto parse(std::initializer_list<const char*> tokens) -> dirshift::infra::Result<CLIArgs> {
    std::vector<const char*> argv{"dirshift"};
    argv.insert(argv.end(), tokens.begin(), tokens.end());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ArgsParserTest, NoArgumentsMeansDefaults)
{
    auto args = parse({});
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->operations.empty());
    EXPECT_EQ(args->config_file, kDefaultConfigFile);
    EXPECT_FALSE(args->checksum);
    EXPECT_FALSE(args->rsync_binary.has_value());
    EXPECT_FALSE(args->help);
}

TEST(ArgsParserTest, CombinedShortFlags)
{
    auto args = parse({"-tc"});
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->operations.contains(Operation::Transfer));
    EXPECT_TRUE(args->operations.contains(Operation::Cleanup));
    EXPECT_FALSE(args->operations.contains(Operation::Validate));
}

TEST(ArgsParserTest, SeparateFlagsMatchCombined)
{
    auto combined = parse({"-tv"});
    auto separate = parse({"-t", "-v"});
    ASSERT_TRUE(combined.has_value());
    ASSERT_TRUE(separate.has_value());
    EXPECT_EQ(combined->operations, separate->operations);
}

TEST(ArgsParserTest, ModeOptionTakesLetters)
{
    auto args = parse({"--mode", "vc"});
    ASSERT_TRUE(args.has_value());
    EXPECT_FALSE(args->operations.contains(Operation::Transfer));
    EXPECT_TRUE(args->operations.contains(Operation::Validate));
    EXPECT_TRUE(args->operations.contains(Operation::Cleanup));
}

TEST(ArgsParserTest, BothMeansTransferAndValidate)
{
    auto args = parse({"-b"});
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->operations.contains(Operation::Transfer));
    EXPECT_TRUE(args->operations.contains(Operation::Validate));
    EXPECT_FALSE(args->operations.contains(Operation::Cleanup));
}

TEST(ArgsParserTest, UnknownFlagIsUsageError)
{
    auto args = parse({"--bogus"});
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error().code, ErrorCode::UsageError);
    EXPECT_EQ(args.error().to_exit_code(), 2);
    EXPECT_NE(args.error().message.find("--config"), std::string::npos); // usage text attached
}

TEST(ArgsParserTest, UnknownModeLetterIsUsageError)
{
    auto args = parse({"-m", "tx"});
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error().code, ErrorCode::UsageError);
}

TEST(ArgsParserTest, ConfigAndRunOptions)
{
    auto args = parse({"-f", "moves.csv", "--checksum", "--rsync", "/opt/bin/rsync",
                       "--exclude", "*.tmp", "--exclude", "cache", "--log-file", "run.log", "-q"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->config_file, "moves.csv");
    EXPECT_TRUE(args->checksum);
    EXPECT_EQ(args->rsync_binary.value_or(""), "/opt/bin/rsync");
    EXPECT_EQ(args->exclude_patterns, (std::vector<std::string>{"*.tmp", "cache"}));
    EXPECT_EQ(args->log_file.value_or(""), "run.log");
    EXPECT_TRUE(args->quiet);
}

TEST(ArgsParserTest, HelpIsNotAnError)
{
    auto args = parse({"--help"});
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->help);
}

TEST(ArgsParserTest, VersionFlag)
{
    auto args = parse({"--version"});
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->version);
}
