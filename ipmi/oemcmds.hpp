#pragma once

#include "interfaces.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fan_control
{
namespace oem
{

/* Sub-commands of the OEM group. */
constexpr auto readPwmCmd = "0x31";
constexpr auto writePwmCmd = "0x30";
/* Fixed selector byte preceding the fan id in a write. */
constexpr auto writePwmSelector = "00";

} // namespace oem

/*
 * Read every fan's PWM register. The response is a header byte followed by
 * one hex byte per fan, in fan table order.
 *
 * @warning Throws IpmiToolException if the read fails.
 */
std::vector<std::string> readPwmRegisters(IpmiToolInterface& tool);

/*
 * Set the duty cycle of one fan, or of all fans with the broadcast id.
 *
 * @param[in] fanId - two digit fan id, "00" for all fans.
 * @param[in] percent - duty cycle in [0, 100].
 *
 * @warning Throws IpmiToolException if the write fails.
 */
void writePwm(IpmiToolInterface& tool, std::string_view fanId, int percent);

/*
 * Encode a percentage as the hex byte the write command expects, e.g. 0x2d.
 */
std::string percentToHex(int percent);

} // namespace fan_control
