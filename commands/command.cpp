// SPDX-License-Identifier: Apache-2.0

#include "commands/command.hpp"

#include "conf.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <ostream>
#include <string>

namespace fan_control
{

bool SetCommand::isBroadcast() const
{
    return fanId == conf::broadcastFanId;
}

/* "all", "0" and "00" all mean every fan. */
static bool isAllFans(const std::string& id)
{
    return toLower(id) == "all" || id == "0" || id == "00";
}

static std::string formatFanId(int fan)
{
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02d", fan);
    return buffer;
}

void addCommandOptions(CLI::App& app, CliOptions& options)
{
    app.add_option("-c,--conf", options.configPath,
                   "Optional parameter to specify configuration at run-time");
    app.add_flag("-d,--debug", options.debug,
                 "Trace every ipmitool command line to stderr");

    /* Unrecognized commands are reported by selectCommand(). */
    app.allow_extras();
    /* Once a command is chosen, a later command name is just an argument. */
    app.require_subcommand(0, 1);

    options.status =
        app.add_subcommand("status", "Show fan speeds, temperatures, airflow");
    options.status->add_flag("--json", options.json,
                             "Print the report as JSON");
    options.status->allow_extras();

    options.get = app.add_subcommand("get", "Show the PWM of one fan");
    options.get->add_option("id", options.getId, "Fan id, 01 to 06");
    options.get->allow_extras();

    options.set = app.add_subcommand("set", "Set the PWM of one or all fans");
    options.set->add_option("id", options.setId, "Fan id 01 to 06, or all");
    options.set->add_option("speed", options.setSpeed, "Percent, 0 to 100");
    options.set->allow_extras();

    options.testrun = app.add_subcommand(
        "testrun", "Exercise set, get and status, then restore the fans");
    options.testrun->allow_extras();
}

Command makeGetCommand(const std::string& id)
{
    if (isAllFans(id))
    {
        return InvalidCommand{
            "Error: To view all fans, use the 'status' command."};
    }

    auto fan = parseDecimal(id);
    if (!fan || *fan < 1 || *fan > static_cast<int>(conf::fans.size()))
    {
        return InvalidCommand{"Error: Fan ID must be between 01 and 06"};
    }

    return GetCommand{*fan};
}

Command makeSetCommand(const std::string& id, const std::string& speed)
{
    auto percent = parseDecimal(speed);
    if (!percent || *percent < 0 || *percent > 100)
    {
        return InvalidCommand{
            "Error: Speed must be an integer between 0 and 100"};
    }

    if (isAllFans(id))
    {
        return SetCommand{std::string(conf::broadcastFanId), *percent};
    }

    /* Same bounds as get; the controller is never sent an unknown id. */
    auto fan = parseDecimal(id);
    if (!fan || *fan < 1 || *fan > static_cast<int>(conf::fans.size()))
    {
        return InvalidCommand{
            "Error: Fan ID must be between 01 and 06, or 'all'"};
    }

    return SetCommand{formatFanId(*fan), *percent};
}

Command selectCommand(const CLI::App& app, const CliOptions& options)
{
    if (options.status->parsed())
    {
        return StatusCommand{options.json};
    }

    if (options.get->parsed())
    {
        if (options.getId.empty())
        {
            return InvalidCommand{std::string("Error: Missing arguments. "
                                              "Example: ") +
                                  programName + " get 01"};
        }
        return makeGetCommand(options.getId);
    }

    if (options.set->parsed())
    {
        if (options.setId.empty() || options.setSpeed.empty())
        {
            return InvalidCommand{std::string("Error: Missing arguments. "
                                              "Example: ") +
                                  programName + " set all 50"};
        }
        return makeSetCommand(options.setId, options.setSpeed);
    }

    if (options.testrun->parsed())
    {
        return TestRunCommand{};
    }

    auto extras = app.remaining();
    if (!extras.empty())
    {
        return UnknownCommand{extras.front()};
    }

    return UsageCommand{};
}

void printUsage(std::ostream& out)
{
    out << "Usage:\n";
    out << "  " << programName << " status [--json]\n";
    out << "  " << programName << " get <id>\n";
    out << "  " << programName << " set <id|all> <speed>\n";
    out << "  " << programName << " testrun\n";
}

} // namespace fan_control
