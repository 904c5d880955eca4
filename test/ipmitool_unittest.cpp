#include "conf.hpp"
#include "errors/exception.hpp"
#include "ipmi/ipmitool.hpp"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace fan_control
{
namespace
{

using ::testing::HasSubstr;

conf::ToolConfig shellTool(const std::string& script)
{
    // sh -c <script> sh <command...>: the command lands in $1 onward.
    conf::ToolConfig config;
    config.tool = "/bin/sh";
    config.interfaceArgs = {"-c", script, "sh"};
    return config;
}

TEST(IpmiToolTest, RawPrefixesOemGroup)
{
    conf::ToolConfig config;
    config.tool = "echo";

    IpmiTool tool(config);
    EXPECT_EQ("raw 0x2e 0x30 00 01 0x2d\n",
              tool.raw({"0x30", "00", "01", "0x2d"}));
}

TEST(IpmiToolTest, InterfaceArgumentsPrecedeCommand)
{
    conf::ToolConfig config;
    config.tool = "echo";
    config.oemNetFn = "0x30";
    config.interfaceArgs = {"lanplus", "bmc.example"};

    IpmiTool tool(config);
    EXPECT_EQ("lanplus bmc.example sensor list\n", tool.sensorList());
    EXPECT_EQ("lanplus bmc.example raw 0x30 0x31\n", tool.raw({"0x31"}));
}

TEST(IpmiToolTest, RawCapturesStderr)
{
    IpmiTool tool(shellTool("echo out; echo err >&2"));

    EXPECT_EQ("out\nerr\n", tool.raw({"0x31"}));
}

TEST(IpmiToolTest, SensorListCapturesStdoutOnly)
{
    IpmiTool tool(shellTool("echo 'Fan1 | 100 | RPM'; echo noise >&2"));

    EXPECT_EQ("Fan1 | 100 | RPM\n", tool.sensorList());
}

TEST(IpmiToolTest, ArgumentsAreNotReinterpreted)
{
    IpmiTool tool(shellTool("printf '%s\\n' \"$3\""));

    EXPECT_EQ("$(id); *\n", tool.raw({"$(id); *"}));
}

TEST(IpmiToolTest, RawFailureCarriesOutput)
{
    IpmiTool tool(shellTool("echo 'Unable to send RAW command'; exit 3"));

    try
    {
        tool.raw({"0x31"});
        FAIL() << "expected IpmiToolException";
    }
    catch (const IpmiToolException& e)
    {
        EXPECT_EQ(std::string("exit status 3: Unable to send RAW command\n"),
                  e.what());
    }
}

TEST(IpmiToolTest, SensorListFailureCarriesStatus)
{
    IpmiTool tool(shellTool("echo partial; exit 1"));

    try
    {
        tool.sensorList();
        FAIL() << "expected IpmiToolException";
    }
    catch (const IpmiToolException& e)
    {
        EXPECT_EQ(std::string("exit status 1"), e.what());
    }
}

TEST(IpmiToolTest, MissingToolFails)
{
    conf::ToolConfig config;
    config.tool = "/nonexistent/ipmitool";

    IpmiTool tool(config);
    EXPECT_THROW(tool.sensorList(), IpmiToolException);
}

TEST(JoinCommandLineTest, SpaceSeparated)
{
    EXPECT_EQ("ipmitool raw 0x2e 0x31",
              joinCommandLine({"ipmitool", "raw", "0x2e", "0x31"}));
    EXPECT_EQ("", joinCommandLine({}));
}

} // namespace
} // namespace fan_control
