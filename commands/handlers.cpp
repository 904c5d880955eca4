// SPDX-License-Identifier: Apache-2.0

#include "commands/handlers.hpp"

#include "commands/command.hpp"
#include "conf.hpp"
#include "errors/exception.hpp"
#include "ipmi/oemcmds.hpp"
#include "sensors/decode.hpp"
#include "sensors/report.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fan_control
{

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

int runStatus(const StatusCommand& command, IpmiToolInterface& tool,
              std::ostream& out)
{
    StatusReport report;
    try
    {
        report = collectStatus(tool);
    }
    catch (const IpmiToolException& e)
    {
        out << "Error fetching sensor data: " << e.what() << "\n";
        return 0;
    }

    if (command.json)
    {
        /* Sensor names come straight from the BMC and may not be UTF-8. */
        out << statusToJson(report).dump(
                   2, ' ', false,
                   nlohmann::ordered_json::error_handler_t::replace)
            << "\n";
    }
    else
    {
        printStatusTable(out, report);
    }
    return 0;
}

int runGet(const GetCommand& command, IpmiToolInterface& tool,
           std::ostream& out)
{
    auto tokens = readPwmRegisters(tool);
    if (tokens.size() <= static_cast<size_t>(command.fan))
    {
        out << "Error: Unexpected IPMI response format or missing data\n";
        return 0;
    }

    char label[8];
    std::snprintf(label, sizeof(label), "%02d", command.fan);
    out << "Fan " << label << " PWM: " << hexToPercent(tokens[command.fan])
        << "\n";
    return 0;
}

int runSet(const SetCommand& command, IpmiToolInterface& tool,
           std::ostream& out)
{
    writePwm(tool, command.fanId, command.speed);

    if (command.isBroadcast())
    {
        out << "All fans successfully set to " << command.speed << "%\n";
    }
    else
    {
        out << "Fan " << command.fanId << " successfully set to "
            << command.speed << "%\n";
    }
    return 0;
}

/*
 * Save what the fans run at, drive them through set/get/status and put the
 * saved speeds back. Fans without a readable PWM are left alone.
 */
int runTestRun(IpmiToolInterface& tool, std::ostream& out)
{
    out << "--- STARTING AUTOMATED TEST SEQUENCE ---\n";

    out << "[STEP 0] Saving current fan speeds...\n";
    auto original = readPwms(tool);

    std::vector<std::pair<std::string, std::string>> saved;
    for (const auto& fan : conf::fans)
    {
        auto it = original.find(std::string(fan.name));
        if (it == original.end() || it->second.empty() ||
            it->second.back() != '%')
        {
            continue;
        }

        auto speed = it->second.substr(0, it->second.size() - 1);
        out << "    ID " << fan.id << " (" << fan.name << ") backed up at "
            << speed << "%\n";
        saved.emplace_back(fan.id, speed);
    }

    out << "\n[STEP 1] Testing 'set all' command (setting to 40%)...\n";
    runCommand(makeSetCommand("all", "40"), tool, out);

    out << "\n[STEP 2] Testing 'get' command for Fan 01...\n";
    runCommand(makeGetCommand("01"), tool, out);

    out << "\n[STEP 3] Displaying full status dashboard...\n";
    runCommand(StatusCommand{false}, tool, out);

    out << "\n[STEP 4] Restoring original fan speeds...\n";
    for (const auto& [id, speed] : saved)
    {
        runCommand(makeSetCommand(id, speed), tool, out);
    }

    out << "\n--- TEST SEQUENCE COMPLETE ---\n";
    return 0;
}

} // namespace

int runCommand(const Command& command, IpmiToolInterface& tool,
               std::ostream& out)
{
    return std::visit(
        overloaded{
            [&](const StatusCommand& c) { return runStatus(c, tool, out); },
            [&](const GetCommand& c) { return runGet(c, tool, out); },
            [&](const SetCommand& c) { return runSet(c, tool, out); },
            [&](const TestRunCommand&) { return runTestRun(tool, out); },
            [&](const UsageCommand&) {
                printUsage(out);
                return 0;
            },
            [&](const UnknownCommand& c) {
                out << "Error: Unknown command '" << c.name << "'\n";
                return 0;
            },
            [&](const InvalidCommand& c) {
                out << c.message << "\n";
                return 0;
            },
        },
        command);
}

} // namespace fan_control
