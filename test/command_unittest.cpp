#include "commands/command.hpp"

#include <CLI/CLI.hpp>

#include <sstream>
#include <string>
#include <variant>

#include <gtest/gtest.h>

namespace fan_control
{
namespace
{

Command parse(const std::string& commandLine, CliOptions& options)
{
    CLI::App app{"test"};
    addCommandOptions(app, options);
    app.parse(commandLine);
    return selectCommand(app, options);
}

Command parse(const std::string& commandLine)
{
    CliOptions options;
    return parse(commandLine, options);
}

std::string invalidMessage(const Command& command)
{
    EXPECT_TRUE(std::holds_alternative<InvalidCommand>(command));
    if (auto invalid = std::get_if<InvalidCommand>(&command))
    {
        return invalid->message;
    }
    return {};
}

TEST(SelectCommandTest, NoArgumentsShowsUsage)
{
    EXPECT_TRUE(std::holds_alternative<UsageCommand>(parse("")));
}

TEST(SelectCommandTest, UnknownCommandIsReported)
{
    auto command = parse("spin");

    ASSERT_TRUE(std::holds_alternative<UnknownCommand>(command));
    EXPECT_EQ("spin", std::get<UnknownCommand>(command).name);
}

TEST(SelectCommandTest, StatusTextAndJson)
{
    auto text = parse("status");
    ASSERT_TRUE(std::holds_alternative<StatusCommand>(text));
    EXPECT_FALSE(std::get<StatusCommand>(text).json);

    auto json = parse("status --json");
    ASSERT_TRUE(std::holds_alternative<StatusCommand>(json));
    EXPECT_TRUE(std::get<StatusCommand>(json).json);
}

TEST(SelectCommandTest, GlobalOptionsBeforeCommand)
{
    CliOptions options;
    auto command = parse("-d testrun", options);

    EXPECT_TRUE(std::holds_alternative<TestRunCommand>(command));
    EXPECT_TRUE(options.debug);
}

TEST(SelectCommandTest, ConfigPathIsCheckedWhenLoaded)
{
    // A missing file is reported by the configuration loader, not here.
    CliOptions options;
    auto command = parse("-c /nonexistent/config.json status", options);

    EXPECT_TRUE(std::holds_alternative<StatusCommand>(command));
    EXPECT_EQ("/nonexistent/config.json", options.configPath);
}

TEST(SelectCommandTest, CommandNameAsArgumentIsNotACommand)
{
    EXPECT_EQ("Error: Fan ID must be between 01 and 06",
              invalidMessage(parse("get status")));
    EXPECT_EQ("Error: Speed must be an integer between 0 and 100",
              invalidMessage(parse("set 1 status")));
    EXPECT_EQ("Error: Fan ID must be between 01 and 06, or 'all'",
              invalidMessage(parse("set testrun 50")));
}

TEST(SelectCommandTest, GetAcceptsIdsOneToSix)
{
    auto padded = parse("get 01");
    ASSERT_TRUE(std::holds_alternative<GetCommand>(padded));
    EXPECT_EQ(1, std::get<GetCommand>(padded).fan);

    auto bare = parse("get 6");
    ASSERT_TRUE(std::holds_alternative<GetCommand>(bare));
    EXPECT_EQ(6, std::get<GetCommand>(bare).fan);
}

TEST(SelectCommandTest, GetAllPointsToStatus)
{
    const std::string expected =
        "Error: To view all fans, use the 'status' command.";

    EXPECT_EQ(expected, invalidMessage(parse("get all")));
    EXPECT_EQ(expected, invalidMessage(parse("get ALL")));
    EXPECT_EQ(expected, invalidMessage(parse("get 0")));
    EXPECT_EQ(expected, invalidMessage(parse("get 00")));
}

TEST(SelectCommandTest, GetRejectsOutOfRangeIds)
{
    const std::string expected = "Error: Fan ID must be between 01 and 06";

    EXPECT_EQ(expected, invalidMessage(parse("get 07")));
    EXPECT_EQ(expected, invalidMessage(parse("get fan1")));
    EXPECT_EQ(expected, invalidMessage(parse("get 000")));
}

TEST(SelectCommandTest, GetWithoutIdIsMissingArguments)
{
    EXPECT_EQ("Error: Missing arguments. Example: rd450x-fan-control get 01",
              invalidMessage(parse("get")));
}

TEST(SelectCommandTest, SetPadsSingleDigitIds)
{
    auto bare = parse("set 1 45");
    auto padded = parse("set 01 45");

    ASSERT_TRUE(std::holds_alternative<SetCommand>(bare));
    ASSERT_TRUE(std::holds_alternative<SetCommand>(padded));
    EXPECT_EQ("01", std::get<SetCommand>(bare).fanId);
    EXPECT_EQ("01", std::get<SetCommand>(padded).fanId);
    EXPECT_EQ(45, std::get<SetCommand>(bare).speed);
    EXPECT_FALSE(std::get<SetCommand>(bare).isBroadcast());
}

TEST(SelectCommandTest, SetAllBroadcasts)
{
    for (const auto& id : {"all", "All", "0", "00"})
    {
        auto command = parse(std::string("set ") + id + " 40");

        ASSERT_TRUE(std::holds_alternative<SetCommand>(command)) << id;
        EXPECT_EQ("00", std::get<SetCommand>(command).fanId);
        EXPECT_TRUE(std::get<SetCommand>(command).isBroadcast());
    }
}

TEST(SelectCommandTest, SetRejectsSpeedOutOfRange)
{
    const std::string expected =
        "Error: Speed must be an integer between 0 and 100";

    EXPECT_EQ(expected, invalidMessage(parse("set all 150")));
    EXPECT_EQ(expected, invalidMessage(parse("set 02 fast")));
    EXPECT_EQ(expected, invalidMessage(parse("set 02 50.5")));
}

TEST(SelectCommandTest, SetSpeedBoundsAreInclusive)
{
    auto low = parse("set 3 0");
    auto high = parse("set 3 100");

    ASSERT_TRUE(std::holds_alternative<SetCommand>(low));
    ASSERT_TRUE(std::holds_alternative<SetCommand>(high));
    EXPECT_EQ(0, std::get<SetCommand>(low).speed);
    EXPECT_EQ(100, std::get<SetCommand>(high).speed);
}

TEST(SelectCommandTest, SetRejectsUnknownFanIds)
{
    const std::string expected =
        "Error: Fan ID must be between 01 and 06, or 'all'";

    EXPECT_EQ(expected, invalidMessage(parse("set 07 50")));
    EXPECT_EQ(expected, invalidMessage(parse("set cpu 50")));
}

TEST(SelectCommandTest, SetWithoutSpeedIsMissingArguments)
{
    EXPECT_EQ(
        "Error: Missing arguments. Example: rd450x-fan-control set all 50",
        invalidMessage(parse("set all")));
}

TEST(PrintUsageTest, ListsEveryCommand)
{
    std::ostringstream out;
    printUsage(out);

    EXPECT_EQ("Usage:\n"
              "  rd450x-fan-control status [--json]\n"
              "  rd450x-fan-control get <id>\n"
              "  rd450x-fan-control set <id|all> <speed>\n"
              "  rd450x-fan-control testrun\n",
              out.str());
}

} // namespace
} // namespace fan_control
