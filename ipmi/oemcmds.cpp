// SPDX-License-Identifier: Apache-2.0

#include "ipmi/oemcmds.hpp"

#include "util.hpp"

#include <phosphor-logging/log.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace fan_control
{

using namespace phosphor::logging;

std::vector<std::string> readPwmRegisters(IpmiToolInterface& tool)
{
    return splitFields(tool.raw({oem::readPwmCmd}));
}

std::string percentToHex(int percent)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << percent;
    return oss.str();
}

void writePwm(IpmiToolInterface& tool, std::string_view fanId, int percent)
{
    std::string id(fanId);

    tool.raw({oem::writePwmCmd, oem::writePwmSelector, id,
              percentToHex(percent)});

    log<level::INFO>("Fan PWM updated", entry("FAN=%s", id.c_str()),
                     entry("PERCENT=%d", percent));
}

} // namespace fan_control
