#pragma once

#include "commands/command.hpp"
#include "interfaces.hpp"

#include <ostream>

namespace fan_control
{

/*
 * Run one command against the controller and report to out.
 *
 * @return the process exit status.
 *
 * @warning Throws IpmiToolException when a get or set cannot reach the
 * controller; the caller ends the process with a failure status.
 */
int runCommand(const Command& command, IpmiToolInterface& tool,
               std::ostream& out);

} // namespace fan_control
