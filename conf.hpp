#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace fan_control
{
namespace conf
{

/*
 * One fan of the platform. The index is the position of the fan's PWM byte
 * in the OEM read response, and the id is what the OEM write expects.
 */
struct FanInfo
{
    int index;
    std::string_view id;
    std::string_view name;
};

constexpr std::array<FanInfo, 6> fans = {{
    {1, "01", "System Fan1"},
    {2, "02", "System Fan2"},
    {3, "03", "System Fan3"},
    {4, "04", "System Fan4"},
    {5, "05", "CPU Fan1"},
    {6, "06", "CPU Fan2"},
}};

/* Id the OEM write command uses to address every fan at once. */
constexpr std::string_view broadcastFanId = "00";

/*
 * How to reach the management controller.
 */
struct ToolConfig
{
    /* Name looked up on PATH, or a path to the binary. */
    std::string tool = "ipmitool";
    /* OEM group byte for the raw PWM commands. */
    std::string oemNetFn = "0x2e";
    /* Placed before the subcommand, e.g. -I lanplus -H <host>. */
    std::vector<std::string> interfaceArgs;
};

} // namespace conf
} // namespace fan_control
