#pragma once

#include <CLI/CLI.hpp>

#include <ostream>
#include <string>
#include <variant>

namespace fan_control
{

constexpr auto programName = "rd450x-fan-control";

struct StatusCommand
{
    bool json = false;
};

struct GetCommand
{
    /* 1..6, also the token position in the PWM read response. */
    int fan;
};

struct SetCommand
{
    /* Two digit id, "00" addresses every fan. */
    std::string fanId;
    /* 0..100 */
    int speed;

    bool isBroadcast() const;
};

struct TestRunCommand
{};

struct UsageCommand
{};

struct UnknownCommand
{
    std::string name;
};

/* Arguments that failed validation; the message tells the user why. */
struct InvalidCommand
{
    std::string message;
};

using Command = std::variant<StatusCommand, GetCommand, SetCommand,
                             TestRunCommand, UsageCommand, UnknownCommand,
                             InvalidCommand>;

/*
 * Raw values collected from the command line, filled in by CLI11.
 */
struct CliOptions
{
    std::string configPath;
    bool debug = false;

    CLI::App* status = nullptr;
    CLI::App* get = nullptr;
    CLI::App* set = nullptr;
    CLI::App* testrun = nullptr;

    bool json = false;
    std::string getId;
    std::string setId;
    std::string setSpeed;
};

/*
 * Register the global options and the subcommands on the application.
 */
void addCommandOptions(CLI::App& app, CliOptions& options);

/*
 * After a successful parse, pick the one command to run and validate its
 * arguments.
 */
Command selectCommand(const CLI::App& app, const CliOptions& options);

Command makeGetCommand(const std::string& id);

Command makeSetCommand(const std::string& id, const std::string& speed);

void printUsage(std::ostream& out);

} // namespace fan_control
