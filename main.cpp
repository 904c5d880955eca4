/**
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "build/buildjson.hpp"
#include "commands/command.hpp"
#include "commands/handlers.hpp"
#include "conf.hpp"
#include "errors/exception.hpp"
#include "ipmi/ipmitool.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
    fan_control::CliOptions options;

    CLI::App app{"RD450X fan control over ipmitool"};
    fan_control::addCommandOptions(app, options);

    CLI11_PARSE(app, argc, argv);

    static constexpr auto debugEnablePath =
        "/etc/rd450x-fan-control/debugging";

    // If this file exists, enable debug mode at runtime
    debugEnabled = options.debug || std::filesystem::exists(debugEnablePath);

    const std::filesystem::path path =
        (!options.configPath.empty())
            ? std::filesystem::path(options.configPath)
            : fan_control::searchConfigurationPath();

    fan_control::conf::ToolConfig config;
    if (!path.empty())
    {
        try
        {
            config = fan_control::buildToolConfigFromJson(
                fan_control::parseValidateJson(path));
        }
        catch (const fan_control::ConfigurationException& e)
        {
            std::cerr << "Failed to load " << path << ": " << e.what()
                      << "\n";
            return EXIT_FAILURE;
        }

        if (debugEnabled)
        {
            std::cerr << "Using configuration " << path << "\n";
        }
    }

    if (!fan_control::findExecutable(config.tool))
    {
        std::cout << "Error: '" << config.tool
                  << "' not found in PATH. Install it via: apt install "
                     "ipmitool\n";
        return EXIT_FAILURE;
    }

    fan_control::IpmiTool tool(config);

    try
    {
        return fan_control::runCommand(
            fan_control::selectCommand(app, options), tool, std::cout);
    }
    catch (const fan_control::IpmiToolException& e)
    {
        std::cout << "IPMI Error: " << e.what() << "\n";
    }

    return EXIT_FAILURE;
}
