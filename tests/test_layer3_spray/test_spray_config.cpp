/**
 * @file test_spray_config.cpp
 * @brief Tests for command line parsing.
 */
#include "lgs_spray.hpp"
#include "test_patterns.h"

#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace logspray::spray;
using namespace ::testing;

namespace
{
CommandLine parse(std::vector<const char *> args)
{
    args.insert(args.begin(), "logspray");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

std::string parse_error(std::vector<const char *> args)
{
    try
    {
        parse(std::move(args));
    }
    catch (const std::invalid_argument &e)
    {
        return e.what();
    }
    return {};
}
} // namespace

class SprayConfigTest : public logspray::tests::PureApiTest
{
};

TEST_F(SprayConfigTest, ParsesWorkerCountAndLines)
{
    const auto cmd = parse({"4", "250"});
    EXPECT_EQ(cmd.action, CommandAction::Run);
    EXPECT_EQ(cmd.config.worker_count, 4);
    EXPECT_EQ(cmd.config.lines_per_worker, 250);
    EXPECT_EQ(cmd.config.line_length, kDefaultLineLength);
    EXPECT_TRUE(cmd.config.executable_path.empty());
}

TEST_F(SprayConfigTest, AcceptsZeroes)
{
    const auto cmd = parse({"0", "0"});
    EXPECT_EQ(cmd.config.worker_count, 0);
    EXPECT_EQ(cmd.config.lines_per_worker, 0);
}

TEST_F(SprayConfigTest, RejectsMissingArguments)
{
    EXPECT_THAT(parse_error({}), HasSubstr("expected 2 arguments"));
    EXPECT_THAT(parse_error({"3"}), HasSubstr("got 1"));
}

TEST_F(SprayConfigTest, RejectsExtraArguments)
{
    EXPECT_THAT(parse_error({"1", "2", "3"}), HasSubstr("got 3"));
}

TEST_F(SprayConfigTest, RejectsNegativeValues)
{
    EXPECT_THAT(parse_error({"-1", "5"}), HasSubstr("worker_count must not be negative"));
    EXPECT_THAT(parse_error({"2", "-5"}), HasSubstr("lines_per_worker must not be negative"));
}

TEST_F(SprayConfigTest, RejectsNonNumericValues)
{
    EXPECT_THAT(parse_error({"two", "5"}), HasSubstr("worker_count must be an integer"));
    EXPECT_THAT(parse_error({"2", "5x"}), HasSubstr("lines_per_worker must be an integer"));
    EXPECT_THAT(parse_error({"2", ""}), HasSubstr("must be an integer"));
    EXPECT_THAT(parse_error({"2.5", "1"}), HasSubstr("must be an integer"));
}

TEST_F(SprayConfigTest, RejectsOutOfRangeValues)
{
    EXPECT_THAT(parse_error({"99999999999999999999", "1"}), HasSubstr("out of range"));
}

TEST_F(SprayConfigTest, HelpWinsOverPositionals)
{
    EXPECT_EQ(parse({"--help"}).action, CommandAction::ShowHelp);
    EXPECT_EQ(parse({"-h"}).action, CommandAction::ShowHelp);
    EXPECT_EQ(parse({"1", "--help"}).action, CommandAction::ShowHelp);
    EXPECT_EQ(parse({"bogus", "-h", "x", "y"}).action, CommandAction::ShowHelp);
}

TEST_F(SprayConfigTest, VersionFlag)
{
    EXPECT_EQ(parse({"--version"}).action, CommandAction::ShowVersion);
}

TEST_F(SprayConfigTest, ParseNonNegativeInt)
{
    EXPECT_EQ(parse_non_negative_int("0", "n"), 0);
    EXPECT_EQ(parse_non_negative_int("2147483647", "n"), 2147483647);
    EXPECT_THROW(parse_non_negative_int(" 1", "n"), std::invalid_argument);
    EXPECT_THROW(parse_non_negative_int("+1", "n"), std::invalid_argument);
}

TEST_F(SprayConfigTest, UsageNamesProgramAndArguments)
{
    const auto text = usage_text("logspray");
    EXPECT_THAT(text, HasSubstr("Usage: logspray <worker_count> <lines_per_worker>"));
    EXPECT_THAT(text, HasSubstr("--help"));
    EXPECT_THAT(text, HasSubstr("100-character"));
}
